#pragma once
#include <string>
#include "../common/result.hpp"

struct RemoteAddress {
    std::string host;
    int port = 0;
    std::string path;
};

// "host:path" or "host:port:path". An unparsable port falls back to
// Config::DEFAULT_PORT; a wrong number of parts or an empty host or path is a
// ConfigError.
Result<RemoteAddress> parseRemoteAddress(const std::string& address);
