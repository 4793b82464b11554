#include "file_utils.hpp"
#include "hash_utils.hpp"
#include "log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

// "a/b/" -> "a/b", so that element-wise comparisons see no empty filename
fs::path normalized(const fs::path& p) {
    fs::path result = p.lexically_normal();
    if (!result.has_filename() && result.has_relative_path()) {
        result = result.parent_path();
    }
    return result;
}

}

Result<FileRecord> FileUtils::statEntry(const std::string& fullPath, const std::string& relPath) {
    struct stat st{};
    if (::stat(fullPath.c_str(), &st) != 0) {
        return Result<FileRecord>::Error(ErrorCode::IOError,
            "failed to stat " + fullPath + ": " + std::strerror(errno));
    }

    FileRecord record;
    record.path = relPath;
    record.isDir = S_ISDIR(st.st_mode);
    record.size = record.isDir ? 0 : static_cast<uint64_t>(st.st_size);
    record.modTime = static_cast<int64_t>(st.st_mtime);
    record.mode = static_cast<uint32_t>(st.st_mode & 07777);
    return Result<FileRecord>::Ok(record);
}

Result<std::vector<FileRecord>> FileUtils::walkTree(const std::string& root) {
    std::error_code ec;
    fs::path rootPath(root);
    if (!fs::is_directory(rootPath, ec)) {
        return Result<std::vector<FileRecord>>::Error(ErrorCode::IOError, "not a directory: " + root);
    }

    std::vector<FileRecord> records;
    fs::recursive_directory_iterator it(rootPath, ec);
    if (ec) {
        return Result<std::vector<FileRecord>>::Error(ErrorCode::IOError,
            "failed to walk " + root + ": " + ec.message());
    }

    const fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        fs::file_status status = entry.symlink_status(ec);
        if (ec) {
            return Result<std::vector<FileRecord>>::Error(ErrorCode::IOError,
                "failed to stat " + entry.path().string() + ": " + ec.message());
        }
        if (!fs::is_regular_file(status) && !fs::is_directory(status)) {
            continue;
        }

        std::string relPath = entry.path().lexically_relative(rootPath).generic_string();
        Result<FileRecord> stat = statEntry(entry.path().string(), relPath);
        if (!stat.success) {
            return Result<std::vector<FileRecord>>::From(stat);
        }

        FileRecord record = stat.data;
        if (!record.isDir) {
            Result<std::string> hash = HashUtils::computeFileHash(entry.path().string());
            if (hash.success) {
                record.hash = hash.data;
            } else {
                logError("Walk", "Failed to hash " + entry.path().string() + ": " + hash.message);
            }
        }
        records.push_back(std::move(record));
    }
    if (ec) {
        return Result<std::vector<FileRecord>>::Error(ErrorCode::IOError,
            "failed to walk " + root + ": " + ec.message());
    }

    std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) {
        return a.path < b.path;
    });
    return Result<std::vector<FileRecord>>::Ok(std::move(records));
}

Result<std::string> FileUtils::resolveUnderRoot(const std::string& root, const std::string& path) {
    if (root.empty()) {
        return Result<std::string>::Ok(path);
    }

    fs::path base = normalized(root);
    fs::path relative = fs::path(path).relative_path();
    fs::path full = normalized(base / relative);

    fs::path check = full.lexically_relative(base);
    if (check.empty() || *check.begin() == "..") {
        return Result<std::string>::Error(ErrorCode::ProtocolError, "path escapes root directory: " + path);
    }
    return Result<std::string>::Ok(full.string());
}

Result<void> FileUtils::ensureParentDirectory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return Result<void>::Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return Result<void>::Error(ErrorCode::IOError,
            "failed to create directory " + parent.string() + ": " + ec.message());
    }
    return Result<void>::Ok();
}

std::string FileUtils::joinPath(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty() || relative == ".") return base;
    return (fs::path(base) / fs::path(relative).relative_path()).generic_string();
}
