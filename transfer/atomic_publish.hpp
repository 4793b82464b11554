#pragma once
#include <string>
#include "../common/result.hpp"

// Replacing a file so that its final name never shows a partial write.
class AtomicPublish {
public:
    // "<dir of path>/<prefix>-<16 base32 chars>.tmp", 80 random bits
    static Result<std::string> makeTempName(const std::string& path, const std::string& prefix);

    // rename(temp, final). If that fails because of what sits at final, the
    // old entry is first moved aside under a fresh temp name, the new file is
    // renamed in, and the displaced entry is deleted. A crash in between leaves
    // the old content under that recognizable temp name.
    static Result<void> publish(const std::string& tempPath, const std::string& finalPath);
};
