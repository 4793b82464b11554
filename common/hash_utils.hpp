#pragma once
#include <cstdint>
#include <string>
#include "result.hpp"

// MD5 digests as lowercase hex, the format peers advertise on the wire.
class HashUtils {
public:
    static std::string computeStrongHash(const char* data, size_t len);

    // whole-file digest, read in IO_BUFFER_SIZE pieces
    static Result<std::string> computeFileHash(const std::string& path);
    static Result<std::string> computeFileHash(int fd);

    static std::string toHex(const unsigned char* digest, size_t len);
};
