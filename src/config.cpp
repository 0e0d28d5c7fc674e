#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <pwd.h>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace lx {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + val);
    }
}

static uint16_t to_port(int value, const char* what) {
    if (value < 0 || value > 65535) {
        throw std::runtime_error(std::string("Invalid ") + what + ": " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

static void check_range(int value, int min, int max, const char* what) {
    if (value < min || value > max) {
        throw std::runtime_error(std::string(what) + " must be between " + std::to_string(min)
                                 + " and " + std::to_string(max) + ", got " + std::to_string(value));
    }
}

AppConfig load_config(const std::string& path, bool required) {
    AppConfig cfg;
    YAML::Node root;

    if (!required && !fs::exists(path)) {
        root = YAML::Node(YAML::NodeType::Map);
    } else {
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to load config: " + std::string(e.what()));
        }
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.port = s["port"].as<uint16_t>(cfg.server.port);
            cfg.server.fast_port = s["fast_port"].as<uint16_t>(cfg.server.fast_port);
            cfg.server.bind_address = s["bind_address"].as<std::string>(cfg.server.bind_address);
            cfg.server.shared_dir = s["shared_dir"].as<std::string>("");
            cfg.server.home_dir = s["home_dir"].as<std::string>("");
        }

        // Streaming
        if (auto st = root["streaming"]) {
            cfg.streaming.chunk_size_mb = st["chunk_size_mb"].as<int>(cfg.streaming.chunk_size_mb);
            cfg.streaming.send_buffer_mb = st["send_buffer_mb"].as<int>(cfg.streaming.send_buffer_mb);
            cfg.streaming.recv_buffer_kb = st["recv_buffer_kb"].as<int>(cfg.streaming.recv_buffer_kb);
            cfg.streaming.pause_poll_ms = st["pause_poll_ms"].as<int>(cfg.streaming.pause_poll_ms);
            cfg.streaming.max_header_bytes = st["max_header_bytes"].as<int>(cfg.streaming.max_header_bytes);
            cfg.streaming.listen_backlog = st["listen_backlog"].as<int>(cfg.streaming.listen_backlog);
        }

        // Transfers
        if (auto t = root["transfers"]) {
            cfg.transfers.retained_completed =
                t["retained_completed"].as<int>(cfg.transfers.retained_completed);
        }

        // Control channel
        if (auto c = root["control"]) {
            cfg.control.enabled = c["enabled"].as<bool>(cfg.control.enabled);
            cfg.control.port = c["port"].as<uint16_t>(cfg.control.port);
            cfg.control.push_interval_ms = c["push_interval_ms"].as<int>(cfg.control.push_interval_ms);
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config value in " + path + ": " + std::string(e.what()));
    }

    // Environment variable overrides (systemd / launcher scripts)
    cfg.server.port = to_port(env_int_or("LANXFER_PORT", cfg.server.port), "LANXFER_PORT");
    cfg.server.fast_port = to_port(env_int_or("LANXFER_FAST_PORT", cfg.server.fast_port), "LANXFER_FAST_PORT");
    cfg.server.shared_dir = env_or("LANXFER_SHARED_DIR", cfg.server.shared_dir);
    cfg.control.port = to_port(env_int_or("LANXFER_CONTROL_PORT", cfg.control.port), "LANXFER_CONTROL_PORT");
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);

    return cfg;
}

std::string user_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return home;

    if (const passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir) return pw->pw_dir;
    }
    return fs::current_path().string();
}

std::string default_shared_dir(const std::string& home) {
    fs::path downloads = fs::path(home) / "Downloads";
    std::error_code ec;
    if (fs::is_directory(downloads, ec)) {
        return fs::absolute(downloads).lexically_normal().string();
    }
    return fs::current_path().string();
}

void finalize_config(AppConfig& cfg) {
    if (cfg.server.home_dir.empty()) {
        cfg.server.home_dir = user_home_dir();
    }

    if (cfg.server.shared_dir.empty()) {
        cfg.server.shared_dir = default_shared_dir(cfg.server.home_dir);
    } else {
        // Always absolute so the containment check compares like with like
        cfg.server.shared_dir = fs::absolute(cfg.server.shared_dir).lexically_normal().string();
    }

    if (cfg.server.fast_port == 0 && cfg.server.port != 0) {
        if (cfg.server.port == 65535) {
            throw std::runtime_error("server.port leaves no room for fast_port");
        }
        cfg.server.fast_port = static_cast<uint16_t>(cfg.server.port + 1);
    }
    if (cfg.control.port == 0 && cfg.server.port != 0) {
        if (cfg.server.port < 65534) {
            cfg.control.port = static_cast<uint16_t>(cfg.server.port + 2);
        } else if (cfg.control.enabled) {
            throw std::runtime_error("server.port leaves no room for control.port");
        }
    }

    // Upper bounds keep the byte conversions (MB/KB -> int) in range
    check_range(cfg.streaming.chunk_size_mb, 1, 1024, "streaming.chunk_size_mb");
    check_range(cfg.streaming.send_buffer_mb, 8, 1024, "streaming.send_buffer_mb");
    check_range(cfg.streaming.recv_buffer_kb, 1, 1024 * 1024, "streaming.recv_buffer_kb");
    check_range(cfg.streaming.pause_poll_ms, 1, 60000, "streaming.pause_poll_ms");
    check_range(cfg.streaming.max_header_bytes, 1024, 16 * 1024 * 1024, "streaming.max_header_bytes");
    check_range(cfg.streaming.listen_backlog, 1, 65535, "streaming.listen_backlog");
    check_range(cfg.transfers.retained_completed, 1, 100000, "transfers.retained_completed");
    check_range(cfg.control.push_interval_ms, 1, 3600000, "control.push_interval_ms");
    check_range(cfg.logging.max_file_size_mb, 1, 1024, "logging.max_file_size_mb");
    check_range(cfg.logging.max_files, 1, 1000, "logging.max_files");
}

} // namespace lx
