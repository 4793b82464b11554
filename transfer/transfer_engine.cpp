#include "transfer_engine.hpp"
#include "../common/hash_utils.hpp"
#include "../common/log.hpp"
#include "../common/thread_pool.hpp"
#include "../diff/block_diff.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <future>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const char* TAG = "Transfer";

// closes on scope exit
struct FdGuard {
    int fd;
    ~FdGuard() { if (fd >= 0) ::close(fd); }
};

bool pwriteAll(int fd, const char* data, size_t length, uint64_t offset) {
    while (length > 0) {
        ssize_t written = pwrite(fd, data, length, static_cast<off_t>(offset));
        if (written < 0 && errno == EINTR) continue;
        if (written <= 0) return false;
        data += written;
        length -= static_cast<size_t>(written);
        offset += static_cast<uint64_t>(written);
    }
    return true;
}

Result<void> copyBytes(int srcFd, int dstFd, uint64_t offset, uint64_t size, bool flushEachWrite) {
    std::vector<char> buffer(Config::IO_BUFFER_SIZE);
    uint64_t remaining = size;
    uint64_t position = offset;

    while (remaining > 0) {
        size_t toRead = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining));
        ssize_t n = pread(srcFd, buffer.data(), toRead, static_cast<off_t>(position));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Error(ErrorCode::IOError,
                std::string("failed to read source file: ") + std::strerror(errno));
        }
        if (n == 0) {
            return Result<void>::Error(ErrorCode::IOError,
                "source file ended at offset " + std::to_string(position) + " before the expected size");
        }

        if (!pwriteAll(dstFd, buffer.data(), static_cast<size_t>(n), position)) {
            return Result<void>::Error(ErrorCode::IOError,
                std::string("failed to write destination file: ") + std::strerror(errno));
        }
        if (flushEachWrite && fdatasync(dstFd) != 0) {
            return Result<void>::Error(ErrorCode::IOError,
                std::string("failed to sync destination file: ") + std::strerror(errno));
        }

        remaining -= static_cast<uint64_t>(n);
        position += static_cast<uint64_t>(n);
    }
    return Result<void>::Ok();
}

}

const char* strategyName(TransferStrategy strategy) {
    switch (strategy) {
        case TransferStrategy::Sequential: return "sequential";
        case TransferStrategy::Parallel: return "parallel";
        case TransferStrategy::Delta: return "delta";
    }
    return "unknown";
}

TransferEngine::TransferEngine(size_t workers) : workers_(workers == 0 ? 1 : workers) {}

TransferStrategy TransferEngine::chooseStrategy(uint64_t sourceSize, bool destinationExists) {
    if (sourceSize <= Config::MIN_PARALLEL_SIZE) return TransferStrategy::Sequential;
    if (destinationExists) return TransferStrategy::Delta;
    return TransferStrategy::Parallel;
}

Result<void> TransferEngine::copyRange(int srcFd, int dstFd, uint64_t offset, uint64_t size) {
    return copyBytes(srcFd, dstFd, offset, size, true);
}

Result<void> TransferEngine::runAll(std::vector<std::function<Result<void>()>> tasks, size_t workers) {
    if (tasks.empty()) return Result<void>::Ok();

    std::vector<std::future<Result<void>>> futures;
    futures.reserve(tasks.size());
    {
        ThreadPool pool(std::min(workers, tasks.size()));
        for (auto& task : tasks) {
            futures.emplace_back(pool.submit(std::move(task)));
        }
        // pool destructor joins after the queue drains
    }

    Result<void> first = Result<void>::Ok();
    for (auto& future : futures) {
        Result<void> result = future.get();
        if (!result.success && first.success) {
            first = result;
        }
    }
    return first;
}

Result<void> TransferEngine::finalize(TempFile& temp, const std::string& expectedHash, const std::string& destination) {
    Result<std::string> actual = HashUtils::computeFileHash(temp.fd());
    if (!actual.success) {
        temp.discard();
        return Result<void>::From(actual, "failed to hash temporary file");
    }

    if (!expectedHash.empty() && actual.data != expectedHash) {
        temp.discard();
        return Result<void>::Error(ErrorCode::ContentMismatch,
            "file content mismatch: expected MD5 " + expectedHash + ", got " + actual.data);
    }

    Result<void> published = temp.publishTo(destination);
    if (!published.success) {
        return Result<void>::From(published, "failed to publish " + destination);
    }
    return Result<void>::Ok();
}

Result<void> TransferEngine::copy(const std::string& source, const std::string& destination) {
    Result<std::string> srcHash = HashUtils::computeFileHash(source);
    if (!srcHash.success) {
        return Result<void>::From(srcHash, "failed to hash source file");
    }
    return copy(source, destination, srcHash.data);
}

Result<void> TransferEngine::copy(const std::string& source, const std::string& destination, const std::string& expectedHash) {
    FdGuard src{open(source.c_str(), O_RDONLY | O_CLOEXEC)};
    if (src.fd < 0) {
        return Result<void>::Error(ErrorCode::IOError,
            "failed to open source file " + source + ": " + std::strerror(errno));
    }
    struct stat st{};
    if (fstat(src.fd, &st) != 0) {
        return Result<void>::Error(ErrorCode::IOError,
            "failed to stat source file " + source + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return Result<void>::Error(ErrorCode::IOError, "source is not a regular file: " + source);
    }
    uint64_t size = static_cast<uint64_t>(st.st_size);
    uint32_t mode = static_cast<uint32_t>(st.st_mode & 07777);

    std::error_code ec;
    bool destinationExists = fs::is_regular_file(destination, ec);

    Result<std::unique_ptr<TempFile>> created = TempFile::createBeside(destination, mode);
    if (!created.success) return Result<void>::From(created);
    TempFile& temp = *created.data;

    TransferStrategy strategy = chooseStrategy(size, destinationExists);
    logInfo(TAG, "Copying " + source + " -> " + destination + " (" + std::to_string(size) +
                 " bytes, " + strategyName(strategy) + ")");

    Result<void> copied = Result<void>::Ok();
    switch (strategy) {
        case TransferStrategy::Sequential:
            copied = copyRange(src.fd, temp.fd(), 0, size);
            break;
        case TransferStrategy::Parallel: {
            Result<void> sized = temp.truncate(size);
            copied = sized.success ? copyParallel(src.fd, temp.fd(), size) : sized;
            break;
        }
        case TransferStrategy::Delta:
            copied = copyDelta(source, destination, src.fd, temp, size);
            break;
    }
    if (!copied.success) {
        logError(TAG, "Copy of " + source + " failed: " + copied.message);
        return copied;
    }

    Result<void> moded = temp.setMode(mode);
    if (!moded.success) return moded;

    Result<void> finalized = finalize(temp, expectedHash, destination);
    if (finalized.success) {
        logInfo(TAG, "Copy completed: " + source + " -> " + destination);
    } else {
        logError(TAG, "Copy of " + source + " failed: " + finalized.message);
    }
    return finalized;
}

Result<void> TransferEngine::resume(const std::string& source, const std::string& partialPath, const std::string& destination) {
    Result<std::string> srcHash = HashUtils::computeFileHash(source);
    if (!srcHash.success) {
        return Result<void>::From(srcHash, "failed to hash source file");
    }

    FdGuard src{open(source.c_str(), O_RDONLY | O_CLOEXEC)};
    if (src.fd < 0) {
        return Result<void>::Error(ErrorCode::IOError,
            "failed to open source file " + source + ": " + std::strerror(errno));
    }
    struct stat st{};
    if (fstat(src.fd, &st) != 0) {
        return Result<void>::Error(ErrorCode::IOError,
            "failed to stat source file " + source + ": " + std::strerror(errno));
    }
    uint64_t size = static_cast<uint64_t>(st.st_size);

    Result<std::unique_ptr<TempFile>> adopted = TempFile::adopt(partialPath);
    if (!adopted.success) return Result<void>::From(adopted);
    TempFile& temp = *adopted.data;

    Result<uint64_t> partialSize = temp.size();
    if (!partialSize.success) return Result<void>::From(partialSize);

    uint64_t offset = partialSize.data;
    if (offset > size) {
        // longer than the source, cannot be a prefix of it
        Result<void> cleared = temp.truncate(0);
        if (!cleared.success) return cleared;
        offset = 0;
    }

    logInfo(TAG, "Resuming " + source + " at offset " + std::to_string(offset) + " of " + std::to_string(size));
    Result<void> copied = copyRange(src.fd, temp.fd(), offset, size - offset);
    if (!copied.success) return copied;

    Result<void> moded = temp.setMode(static_cast<uint32_t>(st.st_mode & 07777));
    if (!moded.success) return moded;

    return finalize(temp, srcHash.data, destination);
}

Result<void> TransferEngine::copyParallel(int srcFd, int dstFd, uint64_t size) {
    uint64_t numBlocks = BlockDiff::blockCount(size);
    std::vector<uint64_t> indices;
    indices.reserve(numBlocks);
    for (uint64_t i = 0; i < numBlocks; ++i) indices.push_back(i);

    logInfo(TAG, "Starting parallel transfer with " + std::to_string(numBlocks) + " blocks");
    return copyBlocks(srcFd, dstFd, indices, size);
}

Result<void> TransferEngine::copyBlocks(int srcFd, int dstFd, const std::vector<uint64_t>& indices, uint64_t size) {
    std::vector<std::function<Result<void>()>> tasks;
    tasks.reserve(indices.size());
    for (uint64_t index : indices) {
        tasks.emplace_back([srcFd, dstFd, index, size]() {
            auto range = BlockDiff::blockRange(index, size);
            Result<void> result = copyRange(srcFd, dstFd, range.first, range.second);
            if (!result.success) {
                return Result<void>::From(result, "failed to copy block " + std::to_string(index));
            }
            return result;
        });
    }
    return runAll(std::move(tasks), workers_);
}

// The temp file starts as a copy of the current destination so that blocks
// which do not differ already hold the right bytes.
Result<void> TransferEngine::copyDelta(const std::string& source, const std::string& destination,
                                       int srcFd, TempFile& temp, uint64_t size) {
    Result<std::vector<BlockInfo>> dstBlocks = BlockDiff::blocksOf(destination);
    if (!dstBlocks.success) {
        logInfo(TAG, "Failed to calculate destination blocks (" + dstBlocks.message + "), using parallel transfer instead");
        Result<void> sized = temp.truncate(size);
        if (!sized.success) return sized;
        return copyParallel(srcFd, temp.fd(), size);
    }

    Result<std::vector<BlockInfo>> srcBlocks = BlockDiff::blocksOf(source);
    if (!srcBlocks.success) {
        return Result<void>::From(srcBlocks, "failed to calculate source blocks");
    }

    FdGuard dst{open(destination.c_str(), O_RDONLY | O_CLOEXEC)};
    if (dst.fd < 0) {
        return Result<void>::Error(ErrorCode::IOError,
            "failed to open destination " + destination + ": " + std::strerror(errno));
    }
    struct stat st{};
    if (fstat(dst.fd, &st) != 0) {
        return Result<void>::Error(ErrorCode::IOError,
            "failed to stat destination " + destination + ": " + std::strerror(errno));
    }
    uint64_t seedSize = std::min<uint64_t>(static_cast<uint64_t>(st.st_size), size);
    Result<void> seeded = copyBytes(dst.fd, temp.fd(), 0, seedSize, false);
    if (!seeded.success) {
        return Result<void>::From(seeded, "failed to seed temporary file");
    }
    Result<void> sized = temp.truncate(size);
    if (!sized.success) return sized;
    Result<void> synced = temp.sync();
    if (!synced.success) return synced;

    std::set<uint64_t> differing = BlockDiff::differingBlocks(srcBlocks.data, dstBlocks.data);
    logInfo(TAG, "Found " + std::to_string(differing.size()) + " different blocks out of " +
                 std::to_string(srcBlocks.data.size()) + " total blocks");
    if (differing.empty()) {
        return Result<void>::Ok();
    }

    std::vector<uint64_t> indices(differing.begin(), differing.end());
    return copyBlocks(srcFd, temp.fd(), indices, size);
}
