#pragma once
#include <string>
#include <vector>
#include "file_record.hpp"
#include "result.hpp"

class FileUtils {
public:
    // Recursively lists everything below root (root itself excluded), sorted by
    // path so parents come before their children. Regular files are hashed;
    // symlinks and special files are skipped.
    static Result<std::vector<FileRecord>> walkTree(const std::string& root);

    // stat() of a single entry, without hashing
    static Result<FileRecord> statEntry(const std::string& fullPath, const std::string& relPath);

    // Joins a request path onto root. An empty root returns the path unchanged;
    // otherwise the result must stay inside root.
    static Result<std::string> resolveUnderRoot(const std::string& root, const std::string& path);

    static Result<void> ensureParentDirectory(const std::string& path);

    static std::string joinPath(const std::string& base, const std::string& relative);
};
