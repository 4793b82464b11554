#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "../common/block_info.hpp"
#include "../common/config.hpp"
#include "../common/result.hpp"

// Offset-based chunking: block i covers [i*blockSize, min((i+1)*blockSize, size)).
// An insertion that is not block aligned shifts every following block.
class BlockDiff {
public:
    static Result<std::vector<BlockInfo>> blocksOf(const std::string& path, uint64_t blockSize = Config::BLOCK_SIZE);

    // indices present in src that are missing from dst or hash differently;
    // blocks only dst has are ignored
    static std::set<uint64_t> differingBlocks(const std::vector<BlockInfo>& srcBlocks,
                                              const std::vector<BlockInfo>& dstBlocks);

    static uint64_t blockCount(uint64_t fileSize, uint64_t blockSize = Config::BLOCK_SIZE);
    // (offset, length) of a block, clipped to the file size
    static std::pair<uint64_t, uint64_t> blockRange(uint64_t index, uint64_t fileSize,
                                                    uint64_t blockSize = Config::BLOCK_SIZE);
};
