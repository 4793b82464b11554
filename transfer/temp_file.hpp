#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "../common/result.hpp"

// Exclusively owned, not yet published file beside its destination. Removed on
// destruction unless publishTo() succeeded.
class TempFile {
public:
    static Result<std::unique_ptr<TempFile>> createBeside(const std::string& destination, uint32_t mode);
    // takes over an existing partial file, e.g. one left by an interrupted copy
    static Result<std::unique_ptr<TempFile>> adopt(const std::string& path);

    ~TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    int fd() const { return fd_; }
    const std::string& path() const { return path_; }

    Result<uint64_t> size() const;
    Result<void> truncate(uint64_t size);
    Result<void> sync();
    Result<void> setMode(uint32_t mode);

    Result<void> publishTo(const std::string& destination);
    void discard();

private:
    TempFile(std::string path, int fd);

    std::string path_;
    int fd_;
    bool published_ = false;
};
