#include "atomic_publish.hpp"
#include "../common/log.hpp"
#include <openssl/rand.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

// RFC 4648 base32, lowercased, without padding
std::string encodeBase32(const unsigned char* data, size_t len) {
    static const char* alphabet = "abcdefghijklmnopqrstuvwxyz234567";
    std::string out;
    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            out += alphabet[(buffer >> (bits - 5)) & 0x1F];
            bits -= 5;
        }
    }
    if (bits > 0) {
        out += alphabet[(buffer << (5 - bits)) & 0x1F];
    }
    return out;
}

}

Result<std::string> AtomicPublish::makeTempName(const std::string& path, const std::string& prefix) {
    fs::path original = fs::path(path).lexically_normal();
    if (path.empty() || !original.has_filename()) {
        return Result<std::string>::Error(ErrorCode::IOError, "invalid file name for temp file: " + path);
    }

    unsigned char rnd[10];
    if (RAND_bytes(rnd, sizeof(rnd)) != 1) {
        return Result<std::string>::Error(ErrorCode::IOError, "failed to generate random temp name");
    }

    std::string name = prefix + "-" + encodeBase32(rnd, sizeof(rnd)) + ".tmp";
    return Result<std::string>::Ok((original.parent_path() / name).string());
}

Result<void> AtomicPublish::publish(const std::string& tempPath, const std::string& finalPath) {
    if (std::rename(tempPath.c_str(), finalPath.c_str()) == 0) {
        return Result<void>::Ok();
    }
    int renameErrno = errno;
    std::string firstError = "failed to rename " + tempPath + " to " + finalPath + ": " + std::strerror(renameErrno);

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(finalPath, ec))) {
        return Result<void>::Error(ErrorCode::IOError, firstError);
    }

    std::string prefix = fs::path(finalPath).filename().string();
    std::string displaced;
    while (true) {
        Result<std::string> name = makeTempName(finalPath, prefix);
        if (!name.success) return Result<void>::From(name);
        if (!fs::exists(fs::symlink_status(name.data, ec))) {
            displaced = name.data;
            break;
        }
    }

    if (std::rename(finalPath.c_str(), displaced.c_str()) != 0) {
        return Result<void>::Error(ErrorCode::IOError,
            "failed to move " + finalPath + " aside: " + std::strerror(errno));
    }

    if (std::rename(tempPath.c_str(), finalPath.c_str()) != 0) {
        int secondErrno = errno;
        if (std::rename(displaced.c_str(), finalPath.c_str()) != 0) {
            logError("Publish", "Could not restore " + finalPath + ", original kept as " + displaced);
        }
        return Result<void>::Error(ErrorCode::IOError,
            "failed to rename " + tempPath + " to " + finalPath + ": " + std::strerror(secondErrno));
    }

    fs::remove_all(displaced, ec);
    if (ec) {
        logError("Publish", "Failed to delete displaced " + displaced + ": " + ec.message());
    }
    return Result<void>::Ok();
}
