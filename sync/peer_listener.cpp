#include "peer_listener.hpp"
#include "../common/config.hpp"
#include "../common/data_transfer.hpp"
#include "../common/file_utils.hpp"
#include "../common/hash_utils.hpp"
#include "../common/log.hpp"
#include "../diff/block_diff.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <arpa/inet.h>
#include <vector>

namespace {

const char* TAG = "Listener";

// errors after which accept() is simply tried again
bool isTransientAcceptError(int err) {
    switch (err) {
        case EINTR:
        case ECONNABORTED:
        case EAGAIN:
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
        case EPROTO:
        case EPERM:
            return true;
        default:
            return false;
    }
}

}

PeerListener::PeerListener(const std::string& rootDir, int port)
    : rootDir_(rootDir), port_(port), serverSocket_(-1),
      stopping_(false), running_(false), status_(Result<void>::Ok()), activeClients_(0) {}

PeerListener::~PeerListener() {
    stop();
}

Result<void> PeerListener::start() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_) {
        return Result<void>::Error(ErrorCode::ConfigError, "listener already running");
    }

    Result<void> setup = setupSocket();
    if (!setup.success) return setup;

    stopping_ = false;
    status_ = Result<void>::Ok();
    running_ = true;
    acceptThread_ = std::thread([this]() { acceptConnections(); });
    return Result<void>::Ok();
}

Result<void> PeerListener::setupSocket() {
    serverSocket_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (serverSocket_ < 0) {
        return Result<void>::Error(ErrorCode::IOError, std::string("socket creation failed: ") + std::strerror(errno));
    }

    int opt = 1;
    if (setsockopt(serverSocket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::string error = std::string("set socket options failed: ") + std::strerror(errno);
        ::close(serverSocket_);
        serverSocket_ = -1;
        return Result<void>::Error(ErrorCode::IOError, error);
    }

    sockaddr_in serverAddr{};
    serverAddr.sin_family = AF_INET;
    serverAddr.sin_addr.s_addr = INADDR_ANY;
    serverAddr.sin_port = htons(static_cast<uint16_t>(port_));

    if (bind(serverSocket_, (sockaddr*)&serverAddr, sizeof(serverAddr)) < 0) {
        std::string error = "bind to port " + std::to_string(port_) + " failed: " + std::strerror(errno);
        ::close(serverSocket_);
        serverSocket_ = -1;
        return Result<void>::Error(ErrorCode::IOError, error);
    }

    if (listen(serverSocket_, Config::LISTEN_BACKLOG) < 0) {
        std::string error = std::string("listen failed: ") + std::strerror(errno);
        ::close(serverSocket_);
        serverSocket_ = -1;
        return Result<void>::Error(ErrorCode::IOError, error);
    }

    sockaddr_in boundAddr{};
    socklen_t boundLen = sizeof(boundAddr);
    if (getsockname(serverSocket_, (sockaddr*)&boundAddr, &boundLen) == 0) {
        port_ = ntohs(boundAddr.sin_port);
    }

    logInfo(TAG, "Listening on port " + std::to_string(port_) +
                 (rootDir_.empty() ? std::string(" (absolute paths)") : " serving " + rootDir_));
    return Result<void>::Ok();
}

void PeerListener::stop() {
    std::thread acceptThread;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_ || stopping_) return;
        stopping_ = true;
        // wakes the blocked accept()
        ::shutdown(serverSocket_, SHUT_RDWR);
        acceptThread = std::move(acceptThread_);
    }

    if (acceptThread.joinable()) acceptThread.join();

    std::unique_lock<std::mutex> lock(mtx_);
    // idle or stalled clients would otherwise keep their threads blocked in recv/send
    for (int clientSocket : clientSockets_) {
        ::shutdown(clientSocket, SHUT_RDWR);
    }
    cv_.wait(lock, [this]() { return activeClients_ == 0; });

    ::close(serverSocket_);
    serverSocket_ = -1;
    running_ = false;
    logInfo(TAG, "Stopped listening on port " + std::to_string(port_));
}

bool PeerListener::running() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return running_;
}

int PeerListener::port() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return port_;
}

Result<void> PeerListener::status() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return status_;
}

void PeerListener::acceptConnections() {
    while (true) {
        sockaddr_in clientAddr{};
        socklen_t addrLen = sizeof(clientAddr);
        int clientSocket = accept4(serverSocket_, (sockaddr*)&clientAddr, &addrLen, SOCK_CLOEXEC);
        if (clientSocket < 0) {
            int err = errno;
            if (stopping_) {
                return;
            }
            if (isTransientAcceptError(err)) {
                logError(TAG, std::string("Accept failed, retrying: ") + std::strerror(err));
                if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }
            logError(TAG, std::string("Accept failed: ") + std::strerror(err));
            std::lock_guard<std::mutex> lock(mtx_);
            status_ = Result<void>::Error(ErrorCode::IOError, std::string("accept failed: ") + std::strerror(err));
            return;
        }

        char clientIP[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &clientAddr.sin_addr, clientIP, INET_ADDRSTRLEN);
        logInfo(TAG, std::string("Connection accepted from ") + clientIP);

        {
            std::lock_guard<std::mutex> lock(mtx_);
            activeClients_++;
            clientSockets_.insert(clientSocket);
        }

        try {
            std::thread([this, clientSocket]() {
                this->serveClient(clientSocket);
            }).detach();
        } catch (const std::system_error& e) {
            logError(TAG, std::string("Dropping connection: ") + e.what());
            std::lock_guard<std::mutex> lock(mtx_);
            clientSockets_.erase(clientSocket);
            ::close(clientSocket);
            activeClients_--;
            cv_.notify_all();
        }
    }
}

// Runs on the connection's own thread. Nothing of this listener is touched
// once the lock is released, stop() may destroy it right after.
void PeerListener::serveClient(int clientSocket) {
    DataTransfer pipe(clientSocket);
    handleClient(pipe);

    std::lock_guard<std::mutex> lock(mtx_);
    // closed under the lock so stop() never shuts down a reused descriptor
    clientSockets_.erase(clientSocket);
    pipe.close();
    activeClients_--;
    cv_.notify_all();
}

// one request per connection
void PeerListener::handleClient(DataTransfer& pipe) {
    Result<Request> request = pipe.receiveRequest();
    if (!request.success) {
        logError(TAG, "Error decoding request: " + request.message);
        sendError(pipe, request.message);
        return;
    }

    if (request.data.type == Protocol::TYPE_LIST) {
        handleListRequest(pipe, request.data);
    } else if (request.data.type == Protocol::TYPE_FILE) {
        handleFileRequest(pipe, request.data);
    } else {
        logError(TAG, "Unknown request type: " + request.data.type);
        sendError(pipe, "unknown request type: " + request.data.type);
    }
}

void PeerListener::handleListRequest(DataTransfer& pipe, const Request& request) {
    Result<std::string> fullPath = FileUtils::resolveUnderRoot(rootDir_, request.path);
    if (!fullPath.success) {
        sendError(pipe, fullPath.message);
        return;
    }

    Result<std::vector<FileRecord>> files = FileUtils::walkTree(fullPath.data);
    if (!files.success) {
        sendError(pipe, "failed to walk directory: " + files.message);
        return;
    }

    size_t count = files.data.size();
    Result<void> sent = pipe.sendResponse(Response::listing(std::move(files.data)));
    if (!sent.success) {
        logError(TAG, "Failed to send listing: " + sent.message);
        return;
    }
    logInfo(TAG, "Listed " + std::to_string(count) + " entries under " + fullPath.data);
}

void PeerListener::handleFileRequest(DataTransfer& pipe, const Request& request) {
    Result<std::string> fullPath = FileUtils::resolveUnderRoot(rootDir_, request.path);
    if (!fullPath.success) {
        sendError(pipe, fullPath.message);
        return;
    }

    // O_NONBLOCK so that a FIFO under the root cannot hang the open
    int fd = open(fullPath.data.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
    if (fd < 0) {
        sendError(pipe, "failed to open file: " + std::string(std::strerror(errno)));
        return;
    }
    struct FdCloser {
        int fd;
        ~FdCloser() { ::close(fd); }
    } closer{fd};

    struct stat st{};
    if (fstat(fd, &st) != 0) {
        sendError(pipe, "failed to stat file: " + std::string(std::strerror(errno)));
        return;
    }
    if (S_ISDIR(st.st_mode)) {
        sendError(pipe, "path is a directory");
        return;
    }
    if (!S_ISREG(st.st_mode)) {
        sendError(pipe, "not a regular file");
        return;
    }

    uint64_t fileSize = static_cast<uint64_t>(st.st_size);
    uint64_t transferOffset = request.offset;
    uint64_t transferSize = 0;
    if (request.blockIndex) {
        uint64_t blockSize = request.blockSize > 0 ? request.blockSize : Config::BLOCK_SIZE;
        auto range = BlockDiff::blockRange(*request.blockIndex, fileSize, blockSize);
        if (range.second == 0 && !(fileSize == 0 && *request.blockIndex == 0)) {
            sendError(pipe, "block index out of range: " + std::to_string(*request.blockIndex));
            return;
        }
        transferOffset = range.first;
        transferSize = range.second;
    } else {
        if (transferOffset > fileSize) {
            sendError(pipe, "offset beyond end of file: " + std::to_string(transferOffset));
            return;
        }
        transferSize = fileSize - transferOffset;
    }

    FileRecord record;
    record.path = request.path;
    record.size = fileSize;
    record.modTime = static_cast<int64_t>(st.st_mtime);
    record.isDir = false;
    record.mode = static_cast<uint32_t>(st.st_mode & 07777);
    record.blockSize = Config::BLOCK_SIZE;
    record.numBlocks = BlockDiff::blockCount(fileSize);

    Result<std::string> hash = HashUtils::computeFileHash(fd);
    if (hash.success) {
        record.hash = hash.data;
    } else {
        logError(TAG, "Failed to calculate MD5 for " + fullPath.data + ": " + hash.message);
    }

    Result<void> sent = pipe.sendResponse(Response::fileInfo(record));
    if (sent.success) sent = pipe.sendSentinel();
    if (!sent.success) {
        logError(TAG, "Failed to send file header: " + sent.message);
        return;
    }

    std::vector<char> buffer(Config::IO_BUFFER_SIZE);
    uint64_t remaining = transferSize;
    uint64_t position = transferOffset;
    while (remaining > 0) {
        size_t toRead = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining));
        ssize_t n = pread(fd, buffer.data(), toRead, static_cast<off_t>(position));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            logError(TAG, "Failed to read " + fullPath.data + " at offset " + std::to_string(position));
            return;
        }
        if (!pipe.sendAll(buffer.data(), static_cast<size_t>(n))) {
            logError(TAG, "Failed to write to connection: " + std::string(std::strerror(errno)));
            return;
        }
        remaining -= static_cast<uint64_t>(n);
        position += static_cast<uint64_t>(n);
    }

    if (request.blockIndex) {
        logInfo(TAG, "Block transfer completed: " + request.path + " (block " +
                     std::to_string(*request.blockIndex) + ", " + std::to_string(transferSize) + " bytes)");
    } else {
        logInfo(TAG, "File transfer completed: " + request.path + " (" + std::to_string(transferSize) + " bytes)");
    }
}

void PeerListener::sendError(DataTransfer& pipe, const std::string& message) {
    Result<void> sent = pipe.sendResponse(Response::error(message));
    if (!sent.success) {
        logError(TAG, "Failed to send error response: " + sent.message);
    }
}
