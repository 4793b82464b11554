#include "peer_sync.hpp"

Result<ListenerHandle> startListener(const std::string& rootDir, int port) {
    if (port < 0 || port > 65535) {
        return Result<ListenerHandle>::Error(ErrorCode::ConfigError, "invalid port: " + std::to_string(port));
    }
    ListenerHandle listener = std::make_shared<PeerListener>(rootDir, port);
    Result<void> started = listener->start();
    if (!started.success) return Result<ListenerHandle>::From(started);
    return Result<ListenerHandle>::Ok(listener);
}

void stopListener(const ListenerHandle& handle) {
    if (handle) handle->stop();
}

Result<void> listenerStatus(const ListenerHandle& handle) {
    if (!handle) {
        return Result<void>::Error(ErrorCode::ConfigError, "no listener");
    }
    return handle->status();
}

Result<SyncStats> syncOnce(const std::string& localPath, const std::string& remoteHost,
                           const std::string& remotePath, int remotePort) {
    if (localPath.empty() || remoteHost.empty()) {
        return Result<SyncStats>::Error(ErrorCode::ConfigError, "local path and remote host are required");
    }
    SyncEngine engine(localPath, remoteHost, remotePath, remotePort);
    return engine.syncOnce();
}
