#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/file_record.hpp"
#include "../common/result.hpp"

class DataTransfer;

// Client side of the wire protocol. Every call opens its own connection, so
// one PeerClient can be shared by several threads.
class PeerClient {
public:
    // port 0 means Config::DEFAULT_PORT
    PeerClient(const std::string& host, int port, size_t workers = Config::TRANSFER_WORKERS);

    Result<std::vector<FileRecord>> listFiles(const std::string& remotePath);

    // Fetches remotePath into localPath through a temp file, verifying the
    // advertised MD5 before the atomic publish. With a listed record files
    // larger than MIN_PARALLEL_SIZE are fetched block by block in parallel, and
    // unless skipIfCurrent is false the download is skipped when localPath
    // already matches the record's size and hash.
    Result<void> downloadFile(const std::string& remotePath, const std::string& localPath,
                              const std::optional<FileRecord>& listed = std::nullopt,
                              bool skipIfCurrent = true);

    const std::string& host() const { return host_; }
    int port() const { return port_; }

private:
    Result<std::unique_ptr<DataTransfer>> openRequest(const std::string& remotePath, std::optional<uint64_t> blockIndex);
    Result<FileRecord> receiveFileHeader(DataTransfer& pipe);

    Result<void> downloadSequential(const std::string& remotePath, const std::string& localPath);
    Result<void> downloadParallel(const std::string& remotePath, const std::string& localPath, const FileRecord& listed);
    Result<std::string> fetchBlock(const std::string& remotePath, uint64_t index, uint64_t fileSize, int fd);

    std::string host_;
    int port_;
    size_t workers_;
};
