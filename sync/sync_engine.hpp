#pragma once
#include <cstddef>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include "peer_client.hpp"
#include "../common/file_record.hpp"
#include "../common/result.hpp"

struct SyncStats {
    size_t downloaded = 0;
    size_t skipped = 0;
    size_t deleted = 0;
    size_t directoriesCreated = 0;
    size_t failedDeletions = 0;
};

// Makes a local tree a mirror of a remote peer's subtree in one pass: remote
// entries are created or refreshed first, then local-only entries are removed.
class SyncEngine {
public:
    SyncEngine(const std::string& localPath, const std::string& remoteHost,
               const std::string& remotePath, int remotePort);

    Result<SyncStats> syncOnce();

    // same kind, same size and, when both sides know it, same MD5.
    // modTime and mode are not compared.
    static bool sameContent(const FileRecord& local, const FileRecord& remote);

private:
    // (full path, advertised mode) of every mirrored directory, in listing order
    using DirectoryModes = std::vector<std::pair<std::string, uint32_t>>;

    Result<void> syncDirectory(const FileRecord& remote, SyncStats& stats, DirectoryModes& modes);
    Result<void> syncFile(const FileRecord& remote, const FileRecord* local, SyncStats& stats);
    void removeExtraneous(const std::vector<FileRecord>& localFiles,
                          const std::unordered_set<std::string>& remotePaths, SyncStats& stats);
    // children before parents, so a read-only mode never blocks the next chmod
    Result<void> applyDirectoryModes(const DirectoryModes& modes);

    std::string localPath_;
    std::string remotePath_;
    PeerClient client_;
};
