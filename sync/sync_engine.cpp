#include "sync_engine.hpp"
#include "../common/file_utils.hpp"
#include "../common/log.hpp"
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {

const char* TAG = "Sync";

}

SyncEngine::SyncEngine(const std::string& localPath, const std::string& remoteHost,
                       const std::string& remotePath, int remotePort)
    : localPath_(localPath), remotePath_(remotePath), client_(remoteHost, remotePort) {}

bool SyncEngine::sameContent(const FileRecord& local, const FileRecord& remote) {
    if (local.isDir != remote.isDir) return false;
    if (local.size != remote.size) return false;
    if (!local.hash.empty() && !remote.hash.empty() && local.hash != remote.hash) return false;
    return true;
}

Result<SyncStats> SyncEngine::syncOnce() {
    std::error_code ec;
    fs::create_directories(localPath_, ec);
    if (ec) {
        return Result<SyncStats>::Error(ErrorCode::IOError,
            "failed to create local directory " + localPath_ + ": " + ec.message());
    }

    logInfo(TAG, "Syncing " + client_.host() + ":" + std::to_string(client_.port()) + ":" + remotePath_ +
                 " -> " + localPath_);

    Result<std::vector<FileRecord>> remoteFiles = client_.listFiles(remotePath_);
    if (!remoteFiles.success) {
        return Result<SyncStats>::From(remoteFiles, "failed to list remote files");
    }

    Result<std::vector<FileRecord>> localFiles = FileUtils::walkTree(localPath_);
    if (!localFiles.success) {
        return Result<SyncStats>::From(localFiles, "failed to list local files");
    }

    std::unordered_map<std::string, const FileRecord*> localByPath;
    for (const FileRecord& record : localFiles.data) {
        localByPath[record.path] = &record;
    }

    SyncStats stats;
    DirectoryModes modes;
    std::unordered_set<std::string> remotePaths;
    for (const FileRecord& remote : remoteFiles.data) {
        remotePaths.insert(remote.path);

        Result<void> synced = Result<void>::Ok();
        if (remote.isDir) {
            synced = syncDirectory(remote, stats, modes);
        } else {
            auto found = localByPath.find(remote.path);
            synced = syncFile(remote, found == localByPath.end() ? nullptr : found->second, stats);
        }
        if (!synced.success) {
            logError(TAG, "Sync aborted at " + remote.path + ": " + synced.message);
            Result<void> restored = applyDirectoryModes(modes);
            if (!restored.success) {
                logError(TAG, restored.message);
            }
            return Result<SyncStats>::From(synced, remote.path);
        }
    }

    removeExtraneous(localFiles.data, remotePaths, stats);

    Result<void> moded = applyDirectoryModes(modes);
    if (!moded.success) {
        return Result<SyncStats>::From(moded);
    }

    logInfo(TAG, "Sync completed: " + std::to_string(stats.downloaded) + " downloaded, " +
                 std::to_string(stats.skipped) + " unchanged, " + std::to_string(stats.deleted) + " deleted, " +
                 std::to_string(stats.directoriesCreated) + " directories created");

    if (stats.failedDeletions > 0) {
        // the counters are kept so callers can see what the run did manage
        return Result<SyncStats>{false, ErrorCode::IOError,
            "failed to delete " + std::to_string(stats.failedDeletions) + " local entries", stats};
    }
    return Result<SyncStats>::Ok(stats);
}

// The advertised mode is only applied after the pass; until then the owner can
// always write, so read-only directories can still be filled and pruned.
Result<void> SyncEngine::syncDirectory(const FileRecord& remote, SyncStats& stats, DirectoryModes& modes) {
    Result<std::string> fullPath = FileUtils::resolveUnderRoot(localPath_, remote.path);
    if (!fullPath.success) return Result<void>::From(fullPath);

    std::error_code ec;
    fs::file_status status = fs::symlink_status(fullPath.data, ec);
    if (fs::exists(status) && !fs::is_directory(status)) {
        fs::remove_all(fullPath.data, ec);
        if (ec) {
            return Result<void>::Error(ErrorCode::IOError,
                "failed to remove " + fullPath.data + ": " + ec.message());
        }
        status = fs::file_status(fs::file_type::not_found);
    }

    if (!fs::exists(status)) {
        fs::create_directories(fullPath.data, ec);
        if (ec) {
            return Result<void>::Error(ErrorCode::IOError,
                "failed to create directory " + fullPath.data + ": " + ec.message());
        }
        stats.directoriesCreated++;
        logInfo(TAG, "Created directory " + fullPath.data);
    }

    if (remote.mode != 0) {
        fs::permissions(fullPath.data, static_cast<fs::perms>((remote.mode & 07777) | 0700),
                        fs::perm_options::replace, ec);
        if (ec) {
            return Result<void>::Error(ErrorCode::IOError,
                "failed to set permissions on " + fullPath.data + ": " + ec.message());
        }
        modes.emplace_back(fullPath.data, remote.mode);
    }
    return Result<void>::Ok();
}

Result<void> SyncEngine::applyDirectoryModes(const DirectoryModes& modes) {
    for (auto it = modes.rbegin(); it != modes.rend(); ++it) {
        std::error_code ec;
        fs::permissions(it->first, static_cast<fs::perms>(it->second & 07777), fs::perm_options::replace, ec);
        if (ec) {
            return Result<void>::Error(ErrorCode::IOError,
                "failed to set permissions on " + it->first + ": " + ec.message());
        }
    }
    return Result<void>::Ok();
}

Result<void> SyncEngine::syncFile(const FileRecord& remote, const FileRecord* local, SyncStats& stats) {
    Result<std::string> fullPath = FileUtils::resolveUnderRoot(localPath_, remote.path);
    if (!fullPath.success) return Result<void>::From(fullPath);

    if (local != nullptr && sameContent(*local, remote)) {
        stats.skipped++;
        return Result<void>::Ok();
    }

    std::string remoteFile = FileUtils::joinPath(remotePath_, remote.path);
    // sameContent already compared against the local hash
    Result<void> downloaded = client_.downloadFile(remoteFile, fullPath.data, remote, false);
    if (!downloaded.success) return downloaded;
    stats.downloaded++;
    return Result<void>::Ok();
}

// Entries are visited parent first, so children of an already removed
// directory show up as missing and are skipped.
void SyncEngine::removeExtraneous(const std::vector<FileRecord>& localFiles,
                                  const std::unordered_set<std::string>& remotePaths, SyncStats& stats) {
    for (const FileRecord& local : localFiles) {
        if (remotePaths.count(local.path) > 0) continue;

        std::string fullPath = FileUtils::joinPath(localPath_, local.path);
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(fullPath, ec))) continue;

        fs::remove_all(fullPath, ec);
        if (ec) {
            stats.failedDeletions++;
            logError(TAG, "Failed to delete " + fullPath + ": " + ec.message());
            continue;
        }
        stats.deleted++;
        logInfo(TAG, "Deleted " + fullPath);
    }
}
