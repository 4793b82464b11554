#include "hash_utils.hpp"
#include "config.hpp"
#include <openssl/evp.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <unistd.h>
#include <vector>

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

}

std::string HashUtils::toHex(const unsigned char* digest, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result += hex[(digest[i] >> 4) & 0xF];
        result += hex[digest[i] & 0xF];
    }
    return result;
}

std::string HashUtils::computeStrongHash(const char* data, size_t len) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    EVP_Digest(data, len, digest, &digestLen, EVP_md5(), nullptr);
    return toHex(digest, digestLen);
}

Result<std::string> HashUtils::computeFileHash(int fd) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Result<std::string>::Error(ErrorCode::IOError, "failed to initialise MD5 context");
    }

    std::vector<char> buffer(Config::IO_BUFFER_SIZE);
    off_t offset = 0;
    while (true) {
        ssize_t n = pread(fd, buffer.data(), buffer.size(), offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<std::string>::Error(ErrorCode::IOError,
                std::string("failed to read file: ") + std::strerror(errno));
        }
        if (n == 0) break;
        EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n));
        offset += n;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    EVP_DigestFinal_ex(ctx.get(), digest, &digestLen);
    return Result<std::string>::Ok(toHex(digest, digestLen));
}

Result<std::string> HashUtils::computeFileHash(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result<std::string>::Error(ErrorCode::IOError,
            "failed to open " + path + ": " + std::strerror(errno));
    }
    Result<std::string> result = computeFileHash(fd);
    ::close(fd);
    return result;
}
