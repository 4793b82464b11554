#pragma once
#include <string>
#include <cstdint>

struct BlockInfo {
    uint64_t index;     // 0-based position, offset = index * blockSize
    std::string hash;   // MD5 of the block bytes
    uint64_t size;      // BLOCK_SIZE except possibly for the last block

    BlockInfo(uint64_t i, const std::string& h, uint64_t s)
        : index(i), hash(h), size(s) {}
};
