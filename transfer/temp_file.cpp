#include "temp_file.hpp"
#include "atomic_publish.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

TempFile::TempFile(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

TempFile::~TempFile() {
    discard();
}

Result<std::unique_ptr<TempFile>> TempFile::createBeside(const std::string& destination, uint32_t mode) {
    std::string prefix = fs::path(destination).filename().string();
    // the owner needs read access for verification regardless of the source mode
    mode_t createMode = static_cast<mode_t>(mode & 07777) | S_IRUSR | S_IWUSR;

    for (int attempt = 0; attempt < 8; ++attempt) {
        Result<std::string> name = AtomicPublish::makeTempName(destination, prefix);
        if (!name.success) return Result<std::unique_ptr<TempFile>>::From(name);

        int fd = open(name.data.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, createMode);
        if (fd >= 0) {
            return Result<std::unique_ptr<TempFile>>::Ok(std::unique_ptr<TempFile>(new TempFile(name.data, fd)));
        }
        if (errno != EEXIST) {
            return Result<std::unique_ptr<TempFile>>::Error(ErrorCode::IOError,
                "failed to create temporary file " + name.data + ": " + std::strerror(errno));
        }
    }
    return Result<std::unique_ptr<TempFile>>::Error(ErrorCode::IOError,
        "failed to find an unused temporary name beside " + destination);
}

Result<std::unique_ptr<TempFile>> TempFile::adopt(const std::string& path) {
    int fd = open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        return Result<std::unique_ptr<TempFile>>::Error(ErrorCode::IOError,
            "failed to open partial file " + path + ": " + std::strerror(errno));
    }
    return Result<std::unique_ptr<TempFile>>::Ok(std::unique_ptr<TempFile>(new TempFile(path, fd)));
}

Result<uint64_t> TempFile::size() const {
    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        return Result<uint64_t>::Error(ErrorCode::IOError, "failed to stat " + path_ + ": " + std::strerror(errno));
    }
    return Result<uint64_t>::Ok(static_cast<uint64_t>(st.st_size));
}

Result<void> TempFile::truncate(uint64_t size) {
    if (ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return Result<void>::Error(ErrorCode::IOError, "failed to resize " + path_ + ": " + std::strerror(errno));
    }
    return Result<void>::Ok();
}

Result<void> TempFile::sync() {
    if (fdatasync(fd_) != 0) {
        return Result<void>::Error(ErrorCode::IOError, "failed to sync " + path_ + ": " + std::strerror(errno));
    }
    return Result<void>::Ok();
}

Result<void> TempFile::setMode(uint32_t mode) {
    if (fchmod(fd_, static_cast<mode_t>(mode & 07777)) != 0) {
        return Result<void>::Error(ErrorCode::IOError, "failed to set mode on " + path_ + ": " + std::strerror(errno));
    }
    return Result<void>::Ok();
}

Result<void> TempFile::publishTo(const std::string& destination) {
    if (fd_ >= 0) {
        if (fsync(fd_) != 0) {
            return Result<void>::Error(ErrorCode::IOError, "failed to sync " + path_ + ": " + std::strerror(errno));
        }
        ::close(fd_);
        fd_ = -1;
    }
    Result<void> published = AtomicPublish::publish(path_, destination);
    if (published.success) {
        published_ = true;
    }
    return published;
}

void TempFile::discard() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!published_ && !path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}
