// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

namespace Config {
    inline constexpr uint64_t BLOCK_SIZE = 1024 * 1024;         // 1 MiB blocks for diff and parallel transfer
    inline constexpr uint64_t MIN_PARALLEL_SIZE = 1024 * 1024;  // files up to this size are copied sequentially
    inline constexpr size_t IO_BUFFER_SIZE = 64 * 1024;         // read/write buffer for files and sockets
    inline constexpr uint64_t FLUSH_INTERVAL = 1024 * 1024;     // force-flush while streaming from a socket
    inline constexpr int DEFAULT_PORT = 8730;
    inline constexpr size_t TRANSFER_WORKERS = 8;
    inline constexpr size_t MAX_MESSAGE_SIZE = 64 * 1024 * 1024;  // one JSON line
    inline constexpr int LISTEN_BACKLOG = 64;
}
