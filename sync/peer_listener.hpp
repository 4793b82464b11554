// Serves tree listings and file bytes under a root directory to PeerClients.

#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include "../common/protocol.hpp"
#include "../common/result.hpp"

class DataTransfer;

class PeerListener {
public:
    // An empty rootDir serves request paths as given. Port 0 picks a free port.
    PeerListener(const std::string& rootDir, int port);
    ~PeerListener();

    PeerListener(const PeerListener&) = delete;
    PeerListener& operator=(const PeerListener&) = delete;

    // Binds and listens on the calling thread, then accepts in the background.
    Result<void> start();
    // Closes the socket, ends the accept loop, cuts open client connections
    // and waits for their threads to finish.
    void stop();

    bool running() const;
    int port() const;
    const std::string& rootDir() const { return rootDir_; }
    // failure that ended the accept loop, if any
    Result<void> status() const;

private:
    Result<void> setupSocket();
    void acceptConnections();
    void serveClient(int clientSocket);
    void handleClient(DataTransfer& pipe);
    void handleListRequest(DataTransfer& pipe, const Request& request);
    void handleFileRequest(DataTransfer& pipe, const Request& request);
    void sendError(DataTransfer& pipe, const std::string& message);

    std::string rootDir_;
    int port_;
    int serverSocket_;
    std::atomic<bool> stopping_;
    bool running_;
    mutable std::mutex mtx_;
    std::thread acceptThread_;
    Result<void> status_;

    // one detached thread per accepted connection
    int activeClients_;
    std::set<int> clientSockets_;
    std::condition_variable cv_;
};
