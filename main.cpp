#include "sync/peer_sync.hpp"
#include "sync/remote_address.hpp"
#include "common/config.hpp"
#include "common/log.hpp"
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <pthread.h>

namespace {

void printUsage() {
    std::cerr << "Usage:\n"
              << "  peersync listen [port] [root]\n"
              << "  peersync sync <localPath> <host[:port]:path>\n";
}

int runListen(int argc, char** argv) {
    int port = Config::DEFAULT_PORT;
    if (argc > 2) {
        char* end = nullptr;
        long value = std::strtol(argv[2], &end, 10);
        if (*end != '\0' || value < 0 || value > 65535) {
            logError("Main", std::string("Invalid port: ") + argv[2]);
            return 1;
        }
        if (value != 0) port = static_cast<int>(value);
    }
    std::string root = argc > 3 ? argv[3] : "";

    // block the signals before any thread starts so only sigwait sees them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    Result<ListenerHandle> listener = startListener(root, port);
    if (!listener.success) {
        logError("Main", "Failed to start listener: " + listener.message);
        return 1;
    }

    int received = 0;
    sigwait(&signals, &received);
    logInfo("Main", "Shutting down");
    stopListener(listener.data);

    Result<void> status = listenerStatus(listener.data);
    if (!status.success) {
        logError("Main", "Listener failed: " + status.message);
        return 1;
    }
    return 0;
}

int runSync(int argc, char** argv) {
    if (argc != 4) {
        printUsage();
        return 1;
    }
    std::string localPath = argv[2];

    std::error_code ec;
    if (!std::filesystem::exists(localPath, ec)) {
        logError("Main", "Local path does not exist: " + localPath);
        return 1;
    }

    Result<RemoteAddress> remote = parseRemoteAddress(argv[3]);
    if (!remote.success) {
        logError("Main", remote.message);
        return 1;
    }

    Result<SyncStats> stats = syncOnce(localPath, remote.data.host, remote.data.path, remote.data.port);
    if (!stats.success) {
        logError("Main", std::string("Sync failed (") + errorCodeName(stats.code) + "): " + stats.message);
        return 1;
    }
    return 0;
}

}

int main(int argc, char** argv) {

    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string mode = argv[1];
    if (mode == "listen") {
        return runListen(argc, argv);
    } else if (mode == "sync") {
        return runSync(argc, argv);
    }

    printUsage();
    return 1;
}
