// Entry points for embedding peersync in another program.

#pragma once
#include <memory>
#include <string>
#include "peer_listener.hpp"
#include "sync_engine.hpp"
#include "../common/result.hpp"

using ListenerHandle = std::shared_ptr<PeerListener>;

// Starts serving rootDir on port (0 picks a free port). Bind and listen
// failures are returned here; later accept failures go to listenerStatus().
Result<ListenerHandle> startListener(const std::string& rootDir, int port);
void stopListener(const ListenerHandle& handle);
Result<void> listenerStatus(const ListenerHandle& handle);

// One pull of remoteHost:remotePort:remotePath into localPath. Port 0 means
// the default port.
Result<SyncStats> syncOnce(const std::string& localPath, const std::string& remoteHost,
                           const std::string& remotePath, int remotePort);
