#pragma once
#include <cstdint>
#include <string>

// Metadata snapshot of one entry, as listed by a peer or found by a local walk.
struct FileRecord {
    std::string path;       // relative, '/'-separated
    uint64_t size = 0;
    int64_t modTime = 0;    // unix seconds
    bool isDir = false;
    uint32_t mode = 0;      // permission bits
    std::string hash;       // whole-file MD5, empty for directories or when hashing failed
    uint64_t blockSize = 0; // only set in file responses
    uint64_t numBlocks = 0;
};
