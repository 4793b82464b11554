#include "peer_client.hpp"
#include "../common/data_transfer.hpp"
#include "../common/file_utils.hpp"
#include "../common/hash_utils.hpp"
#include "../common/log.hpp"
#include "../diff/block_diff.hpp"
#include "../transfer/temp_file.hpp"
#include "../transfer/transfer_engine.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <functional>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const char* TAG = "Client";

bool writeAt(int fd, const char* data, size_t length, uint64_t offset) {
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

// Copies exactly size bytes from the connection to fd at offset, forcing the
// data to disk every FLUSH_INTERVAL bytes and once more at the end.
Result<void> receiveInto(DataTransfer& pipe, int fd, uint64_t offset, uint64_t size) {
    std::vector<char> buffer(Config::IO_BUFFER_SIZE);
    uint64_t received = 0;
    uint64_t sinceFlush = 0;

    while (received < size) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), size - received));
        ssize_t n = pipe.receiveSome(buffer.data(), want);
        if (n < 0) {
            return Result<void>::Error(ErrorCode::IOError,
                std::string("failed to read file data: ") + std::strerror(errno));
        }
        if (n == 0) {
            return Result<void>::Error(ErrorCode::IOError,
                "connection closed after " + std::to_string(received) + " of " + std::to_string(size) + " bytes");
        }
        if (!writeAt(fd, buffer.data(), static_cast<size_t>(n), offset + received)) {
            return Result<void>::Error(ErrorCode::IOError,
                std::string("failed to write file data: ") + std::strerror(errno));
        }
        received += static_cast<uint64_t>(n);
        sinceFlush += static_cast<uint64_t>(n);

        if (sinceFlush >= Config::FLUSH_INTERVAL) {
            if (fdatasync(fd) != 0) {
                return Result<void>::Error(ErrorCode::IOError,
                    std::string("failed to flush file data: ") + std::strerror(errno));
            }
            sinceFlush = 0;
        }
    }

    if (fdatasync(fd) != 0) {
        return Result<void>::Error(ErrorCode::IOError,
            std::string("failed to flush file data: ") + std::strerror(errno));
    }
    return Result<void>::Ok();
}

bool matchesLocal(const std::string& localPath, const FileRecord& listed) {
    if (listed.isDir || listed.hash.empty()) return false;
    struct stat st{};
    if (::stat(localPath.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
    if (static_cast<uint64_t>(st.st_size) != listed.size) return false;
    Result<std::string> hash = HashUtils::computeFileHash(localPath);
    return hash.success && hash.data == listed.hash;
}

}

PeerClient::PeerClient(const std::string& host, int port, size_t workers)
    : host_(host), port_(port == 0 ? Config::DEFAULT_PORT : port), workers_(workers == 0 ? 1 : workers) {}

Result<std::vector<FileRecord>> PeerClient::listFiles(const std::string& remotePath) {
    Result<int> socketFD = DataTransfer::connectTo(host_, port_);
    if (!socketFD.success) return Result<std::vector<FileRecord>>::From(socketFD);
    DataTransfer pipe(socketFD.data);

    Result<void> sent = pipe.sendRequest(Request::list(remotePath));
    if (!sent.success) return Result<std::vector<FileRecord>>::From(sent);

    Result<Response> response = pipe.receiveResponse();
    if (!response.success) return Result<std::vector<FileRecord>>::From(response);
    if (!response.data.ok()) {
        return Result<std::vector<FileRecord>>::Error(ErrorCode::ProtocolError,
            "server error: " + response.data.message);
    }

    std::vector<FileRecord> files;
    if (response.data.files) {
        files = std::move(*response.data.files);
    }
    return Result<std::vector<FileRecord>>::Ok(std::move(files));
}

Result<std::unique_ptr<DataTransfer>> PeerClient::openRequest(const std::string& remotePath,
                                                              std::optional<uint64_t> blockIndex) {
    Result<int> socketFD = DataTransfer::connectTo(host_, port_);
    if (!socketFD.success) return Result<std::unique_ptr<DataTransfer>>::From(socketFD);
    std::unique_ptr<DataTransfer> pipe(new DataTransfer(socketFD.data));

    Request request = blockIndex ? Request::block(remotePath, *blockIndex, Config::BLOCK_SIZE)
                                 : Request::file(remotePath);
    Result<void> sent = pipe->sendRequest(request);
    if (!sent.success) return Result<std::unique_ptr<DataTransfer>>::From(sent);
    return Result<std::unique_ptr<DataTransfer>>::Ok(std::move(pipe));
}

Result<FileRecord> PeerClient::receiveFileHeader(DataTransfer& pipe) {
    Result<Response> response = pipe.receiveResponse();
    if (!response.success) return Result<FileRecord>::From(response);
    if (!response.data.ok()) {
        return Result<FileRecord>::Error(ErrorCode::ProtocolError, "server error: " + response.data.message);
    }
    if (!response.data.file) {
        return Result<FileRecord>::Error(ErrorCode::ProtocolError, "file response without file info");
    }

    Result<void> sentinel = pipe.receiveSentinel();
    if (!sentinel.success) return Result<FileRecord>::From(sentinel);
    return Result<FileRecord>::Ok(*response.data.file);
}

Result<void> PeerClient::downloadFile(const std::string& remotePath, const std::string& localPath,
                                      const std::optional<FileRecord>& listed, bool skipIfCurrent) {
    if (listed && skipIfCurrent && matchesLocal(localPath, *listed)) {
        logInfo(TAG, "File " + localPath + " is already up to date");
        return Result<void>::Ok();
    }

    Result<void> parent = FileUtils::ensureParentDirectory(localPath);
    if (!parent.success) return parent;

    if (listed && !listed->isDir && listed->size > Config::MIN_PARALLEL_SIZE) {
        return downloadParallel(remotePath, localPath, *listed);
    }
    return downloadSequential(remotePath, localPath);
}

Result<void> PeerClient::downloadSequential(const std::string& remotePath, const std::string& localPath) {
    Result<std::unique_ptr<DataTransfer>> pipe = openRequest(remotePath, std::nullopt);
    if (!pipe.success) return Result<void>::From(pipe);

    Result<FileRecord> header = receiveFileHeader(*pipe.data);
    if (!header.success) return Result<void>::From(header);
    const FileRecord& record = header.data;

    Result<std::unique_ptr<TempFile>> created = TempFile::createBeside(localPath, record.mode);
    if (!created.success) return Result<void>::From(created);
    TempFile& temp = *created.data;

    logInfo(TAG, "Downloading " + remotePath + " (" + std::to_string(record.size) + " bytes)");
    Result<void> received = receiveInto(*pipe.data, temp.fd(), 0, record.size);
    if (!received.success) return Result<void>::From(received, "download of " + remotePath + " failed");
    pipe.data->close();

    if (record.mode != 0) {
        Result<void> moded = temp.setMode(record.mode);
        if (!moded.success) return moded;
    }

    Result<void> finalized = TransferEngine::finalize(temp, record.hash, localPath);
    if (finalized.success) {
        logInfo(TAG, "Downloaded " + remotePath + " -> " + localPath);
    }
    return finalized;
}

// Fetches one block on its own connection and writes it into fd at the
// block's offset. Returns the whole-file hash the server advertised.
Result<std::string> PeerClient::fetchBlock(const std::string& remotePath, uint64_t index, uint64_t fileSize, int fd) {
    Result<std::unique_ptr<DataTransfer>> pipe = openRequest(remotePath, index);
    if (!pipe.success) return Result<std::string>::From(pipe);

    Result<FileRecord> header = receiveFileHeader(*pipe.data);
    if (!header.success) return Result<std::string>::From(header);
    if (header.data.size != fileSize) {
        return Result<std::string>::Error(ErrorCode::ContentMismatch,
            "source file size changed during transfer: " + std::to_string(fileSize) + " -> " +
            std::to_string(header.data.size));
    }

    auto range = BlockDiff::blockRange(index, fileSize);
    Result<void> received = receiveInto(*pipe.data, fd, range.first, range.second);
    if (!received.success) return Result<std::string>::From(received);
    return Result<std::string>::Ok(header.data.hash);
}

Result<void> PeerClient::downloadParallel(const std::string& remotePath, const std::string& localPath,
                                          const FileRecord& listed) {
    Result<std::unique_ptr<TempFile>> created = TempFile::createBeside(localPath, listed.mode);
    if (!created.success) return Result<void>::From(created);
    TempFile& temp = *created.data;

    Result<void> sized = temp.truncate(listed.size);
    if (!sized.success) return sized;

    uint64_t numBlocks = BlockDiff::blockCount(listed.size);
    logInfo(TAG, "Downloading " + remotePath + " in " + std::to_string(numBlocks) + " blocks");

    std::vector<std::string> hashes(numBlocks);
    std::vector<std::function<Result<void>()>> tasks;
    tasks.reserve(numBlocks);
    int fd = temp.fd();
    for (uint64_t index = 0; index < numBlocks; ++index) {
        tasks.emplace_back([this, &remotePath, &hashes, index, fd, &listed]() {
            Result<std::string> hash = fetchBlock(remotePath, index, listed.size, fd);
            if (!hash.success) {
                return Result<void>::From(hash, "failed to fetch block " + std::to_string(index));
            }
            hashes[index] = hash.data;
            return Result<void>::Ok();
        });
    }

    Result<void> fetched = TransferEngine::runAll(std::move(tasks), workers_);
    if (!fetched.success) return fetched;

    const std::string& expected = hashes.front();
    for (uint64_t index = 1; index < numBlocks; ++index) {
        if (hashes[index] != expected) {
            return Result<void>::Error(ErrorCode::ContentMismatch,
                "source file " + remotePath + " changed during transfer");
        }
    }

    if (listed.mode != 0) {
        Result<void> moded = temp.setMode(listed.mode);
        if (!moded.success) return moded;
    }

    Result<void> finalized = TransferEngine::finalize(temp, expected, localPath);
    if (finalized.success) {
        logInfo(TAG, "Downloaded " + remotePath + " -> " + localPath);
    }
    return finalized;
}
