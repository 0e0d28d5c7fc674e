#pragma once

#include <string>
#include <cstdint>

namespace lx {

struct ServerConfig {
    uint16_t port = 5000;
    uint16_t fast_port = 0;          // 0 = port + 1
    std::string bind_address = "0.0.0.0";
    std::string shared_dir;          // empty = ~/Downloads or cwd
    std::string home_dir;            // empty = $HOME
};

struct StreamingConfig {
    int chunk_size_mb = 8;
    int send_buffer_mb = 16;
    int recv_buffer_kb = 1024;
    int pause_poll_ms = 200;
    int max_header_bytes = 65536;
    int listen_backlog = 64;
};

struct TransfersConfig {
    int retained_completed = 20;
};

struct ControlConfig {
    bool enabled = true;
    uint16_t port = 0;               // 0 = server port + 2
    int push_interval_ms = 1000;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    StreamingConfig streaming;
    TransfersConfig transfers;
    ControlConfig control;
    LoggingConfig logging;
};

// Load configuration from YAML file, with environment variable overrides.
// When `required` is false a missing file yields the defaults.
AppConfig load_config(const std::string& path, bool required = true);

// Fill in derived values (ports, directories) and validate ranges.
// Throws std::runtime_error on invalid values.
void finalize_config(AppConfig& cfg);

// ~/Downloads if it exists, otherwise the current directory; always absolute.
std::string default_shared_dir(const std::string& home);

std::string user_home_dir();

} // namespace lx
