#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/result.hpp"
#include "temp_file.hpp"

enum class TransferStrategy { Sequential, Parallel, Delta };

const char* strategyName(TransferStrategy strategy);

// Copies one file into a temp file beside the destination, verifies the
// whole-file MD5 and publishes it atomically. The destination is only ever
// touched by the final rename.
class TransferEngine {
public:
    explicit TransferEngine(size_t workers = Config::TRANSFER_WORKERS);

    Result<void> copy(const std::string& source, const std::string& destination);
    // expectedHash is the hash advertised for source; the copy fails with
    // ContentMismatch if the written bytes hash differently
    Result<void> copy(const std::string& source, const std::string& destination, const std::string& expectedHash);
    // extends a partial temp file left by an interrupted copy, then verifies and publishes it
    Result<void> resume(const std::string& source, const std::string& partialPath, const std::string& destination);

    static TransferStrategy chooseStrategy(uint64_t sourceSize, bool destinationExists);

    // Runs every task to completion on up to `workers` threads and returns the
    // first failure in task order. Used for per-block work.
    static Result<void> runAll(std::vector<std::function<Result<void>()>> tasks, size_t workers);

    // Hashes temp, compares with expectedHash and publishes on match. An empty
    // expectedHash skips the comparison.
    static Result<void> finalize(TempFile& temp, const std::string& expectedHash, const std::string& destination);

    // pread/pwrite loop over [offset, offset+size), flushing after every write
    static Result<void> copyRange(int srcFd, int dstFd, uint64_t offset, uint64_t size);

private:
    Result<void> copyParallel(int srcFd, int dstFd, uint64_t size);
    Result<void> copyDelta(const std::string& source, const std::string& destination,
                           int srcFd, TempFile& temp, uint64_t size);
    Result<void> copyBlocks(int srcFd, int dstFd, const std::vector<uint64_t>& indices, uint64_t size);

    size_t workers_;
};
