#include "remote_address.hpp"
#include "../common/config.hpp"
#include <cstdlib>
#include <sstream>
#include <vector>

namespace {

int parsePort(const std::string& text) {
    if (text.empty()) return Config::DEFAULT_PORT;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || value <= 0 || value > 65535) return Config::DEFAULT_PORT;
    return static_cast<int>(value);
}

}

Result<RemoteAddress> parseRemoteAddress(const std::string& address) {
    std::vector<std::string> parts;
    std::stringstream stream(address);
    std::string part;
    while (std::getline(stream, part, ':')) {
        parts.push_back(part);
    }
    // getline drops a trailing empty field
    if (!address.empty() && address.back() == ':') {
        parts.push_back("");
    }

    RemoteAddress remote;
    if (parts.size() == 2) {
        remote.host = parts[0];
        remote.port = Config::DEFAULT_PORT;
        remote.path = parts[1];
    } else if (parts.size() == 3) {
        remote.host = parts[0];
        remote.port = parsePort(parts[1]);
        remote.path = parts[2];
    } else {
        return Result<RemoteAddress>::Error(ErrorCode::ConfigError,
            "invalid remote address format, expected host[:port]:path: " + address);
    }

    if (remote.host.empty() || remote.path.empty()) {
        return Result<RemoteAddress>::Error(ErrorCode::ConfigError,
            "remote host and path must not be empty: " + address);
    }
    return Result<RemoteAddress>::Ok(remote);
}
