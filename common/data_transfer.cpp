#include "data_transfer.hpp"
#include "config.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>

DataTransfer::DataTransfer(int socketFD) : socketFD_(socketFD) {}

DataTransfer::~DataTransfer() {
    close();
}

void DataTransfer::close() {
    if (socketFD_ >= 0) {
        ::close(socketFD_);
        socketFD_ = -1;
    }
}

Result<int> DataTransfer::connectTo(const std::string& host, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &addresses);
    if (rc != 0) {
        return Result<int>::Error(ErrorCode::IOError,
            "failed to resolve " + host + ": " + gai_strerror(rc));
    }

    std::string lastError = "no address";
    int socketFD = -1;
    for (addrinfo* ai = addresses; ai != nullptr; ai = ai->ai_next) {
        socketFD = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (socketFD < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        if (::connect(socketFD, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        lastError = std::strerror(errno);
        ::close(socketFD);
        socketFD = -1;
    }
    freeaddrinfo(addresses);

    if (socketFD < 0) {
        return Result<int>::Error(ErrorCode::IOError,
            "failed to connect to " + host + ":" + service + ": " + lastError);
    }
    return Result<int>::Ok(socketFD);
}

bool DataTransfer::sendAll(const void* buffer, size_t length) {
    const char* data = static_cast<const char*>(buffer);
    while (length > 0) {
        ssize_t sent = send(socketFD_, data, length, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) continue;
        if (sent <= 0) return false;
        data += sent;
        length -= sent;
    }
    return true;
}

bool DataTransfer::fill() {
    if (pendingPos_ == pending_.size()) {
        pending_.clear();
        pendingPos_ = 0;
    }
    char buffer[Config::IO_BUFFER_SIZE];
    ssize_t received;
    do {
        received = recv(socketFD_, buffer, sizeof(buffer), 0);
    } while (received < 0 && errno == EINTR);
    if (received <= 0) return false;
    pending_.insert(pending_.end(), buffer, buffer + received);
    return true;
}

ssize_t DataTransfer::receiveSome(void* buffer, size_t length) {
    if (pendingPos_ < pending_.size()) {
        size_t n = std::min(length, pending_.size() - pendingPos_);
        std::memcpy(buffer, pending_.data() + pendingPos_, n);
        pendingPos_ += n;
        return static_cast<ssize_t>(n);
    }
    ssize_t received;
    do {
        received = recv(socketFD_, buffer, length, 0);
    } while (received < 0 && errno == EINTR);
    return received;
}

Result<std::string> DataTransfer::receiveLine() {
    size_t searchFrom = 0;  // relative to pendingPos_
    while (true) {
        auto begin = pending_.begin() + static_cast<std::ptrdiff_t>(pendingPos_);
        auto newline = std::find(begin + static_cast<std::ptrdiff_t>(searchFrom), pending_.end(), '\n');
        if (newline != pending_.end()) {
            std::string line(begin, newline);
            pendingPos_ = static_cast<size_t>(newline - pending_.begin()) + 1;
            return Result<std::string>::Ok(std::move(line));
        }
        searchFrom = pending_.size() - pendingPos_;
        if (searchFrom > Config::MAX_MESSAGE_SIZE) {
            return Result<std::string>::Error(ErrorCode::ProtocolError, "message exceeds size limit");
        }
        if (!fill()) {
            return Result<std::string>::Error(ErrorCode::ProtocolError,
                "connection closed before end of message");
        }
    }
}

Result<void> DataTransfer::sendRequest(const Request& request) {
    std::string message = encodeMessage(toJson(request));
    if (!sendAll(message.data(), message.size())) {
        return Result<void>::Error(ErrorCode::IOError, std::string("failed to send request: ") + std::strerror(errno));
    }
    return Result<void>::Ok();
}

Result<Request> DataTransfer::receiveRequest() {
    Result<std::string> line = receiveLine();
    if (!line.success) return Result<Request>::From(line, "failed to read request");
    Result<Json::Value> json = decodeMessage(line.data);
    if (!json.success) return Result<Request>::From(json, "failed to decode request");
    return requestFromJson(json.data);
}

Result<void> DataTransfer::sendResponse(const Response& response) {
    std::string message = encodeMessage(toJson(response));
    if (!sendAll(message.data(), message.size())) {
        return Result<void>::Error(ErrorCode::IOError, std::string("failed to send response: ") + std::strerror(errno));
    }
    return Result<void>::Ok();
}

Result<Response> DataTransfer::receiveResponse() {
    Result<std::string> line = receiveLine();
    if (!line.success) return Result<Response>::From(line, "failed to read response");
    Result<Json::Value> json = decodeMessage(line.data);
    if (!json.success) return Result<Response>::From(json, "failed to decode response");
    return responseFromJson(json.data);
}

Result<void> DataTransfer::sendSentinel() {
    const char sentinel = Protocol::SENTINEL;
    if (!sendAll(&sentinel, 1)) {
        return Result<void>::Error(ErrorCode::IOError, "failed to send sentinel");
    }
    return Result<void>::Ok();
}

Result<void> DataTransfer::receiveSentinel() {
    char sentinel = 0;
    ssize_t n = receiveSome(&sentinel, 1);
    if (n != 1 || sentinel != Protocol::SENTINEL) {
        return Result<void>::Error(ErrorCode::ProtocolError, "missing newline sentinel after file header");
    }
    return Result<void>::Ok();
}
