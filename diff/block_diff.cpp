#include "block_diff.hpp"
#include "../common/hash_utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <unordered_map>

Result<std::vector<BlockInfo>> BlockDiff::blocksOf(const std::string& path, uint64_t blockSize) {
    if (blockSize == 0) {
        return Result<std::vector<BlockInfo>>::Error(ErrorCode::ConfigError, "block size must be positive");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::vector<BlockInfo>>::Error(ErrorCode::IOError,
            "failed to open file: " + path + ": " + std::strerror(errno));
    }

    std::vector<BlockInfo> blocks;
    std::vector<char> buffer(blockSize);
    uint64_t index = 0;

    while (file.read(buffer.data(), static_cast<std::streamsize>(blockSize)) || file.gcount() > 0) {
        size_t bytesRead = static_cast<size_t>(file.gcount());
        blocks.emplace_back(index, HashUtils::computeStrongHash(buffer.data(), bytesRead), bytesRead);
        ++index;
    }
    if (file.bad()) {
        return Result<std::vector<BlockInfo>>::Error(ErrorCode::IOError, "failed to read file: " + path);
    }

    return Result<std::vector<BlockInfo>>::Ok(std::move(blocks));
}

std::set<uint64_t> BlockDiff::differingBlocks(const std::vector<BlockInfo>& srcBlocks,
                                              const std::vector<BlockInfo>& dstBlocks) {
    std::unordered_map<uint64_t, const std::string*> dstHashes;
    for (const BlockInfo& block : dstBlocks) {
        dstHashes[block.index] = &block.hash;
    }

    std::set<uint64_t> differing;
    for (const BlockInfo& block : srcBlocks) {
        auto it = dstHashes.find(block.index);
        if (it == dstHashes.end() || *it->second != block.hash) {
            differing.insert(block.index);
        }
    }
    return differing;
}

uint64_t BlockDiff::blockCount(uint64_t fileSize, uint64_t blockSize) {
    return (fileSize + blockSize - 1) / blockSize;
}

std::pair<uint64_t, uint64_t> BlockDiff::blockRange(uint64_t index, uint64_t fileSize, uint64_t blockSize) {
    uint64_t offset = index * blockSize;
    if (offset >= fileSize) return {offset, 0};
    uint64_t length = std::min(blockSize, fileSize - offset);
    return {offset, length};
}
