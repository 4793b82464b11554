#pragma once
#include <string>
#include <vector>
#include <sys/types.h>
#include "protocol.hpp"
#include "result.hpp"

// One TCP connection carrying a single request and its response. Owns the
// socket and closes it on destruction. Bytes read past the end of a JSON line
// are kept and handed out first by receiveSome().
class DataTransfer {
public:
    explicit DataTransfer(int socketFD);
    ~DataTransfer();

    DataTransfer(const DataTransfer&) = delete;
    DataTransfer& operator=(const DataTransfer&) = delete;

    static Result<int> connectTo(const std::string& host, int port);

    Result<void> sendRequest(const Request& request);
    Result<Request> receiveRequest();
    Result<void> sendResponse(const Response& response);
    Result<Response> receiveResponse();

    Result<void> sendSentinel();
    Result<void> receiveSentinel();

    bool sendAll(const void* buffer, size_t length);
    // up to length bytes; 0 on orderly close, -1 on error
    ssize_t receiveSome(void* buffer, size_t length);

    int socket() const { return socketFD_; }
    void close();

private:
    Result<std::string> receiveLine();
    bool fill();

    int socketFD_;
    std::vector<char> pending_;
    size_t pendingPos_ = 0;
};
