#include "config.hpp"
#include "control_api.hpp"
#include "control_server.hpp"
#include "logger.hpp"
#include "shared_roots.hpp"
#include "transfer_registry.hpp"
#include "transfer_server.hpp"

#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

// Address other devices on the LAN reach us at. Connecting a UDP socket sends
// nothing; it only makes the kernel pick the outbound interface.
static std::string local_lan_address() {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return "127.0.0.1";

    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    std::string result = "127.0.0.1";
    if (connect(fd, (sockaddr*)&remote, sizeof(remote)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        char ip[INET_ADDRSTRLEN] = {0};
        if (getsockname(fd, (sockaddr*)&local, &len) == 0
            && inet_ntop(AF_INET, &local.sin_addr, ip, sizeof(ip))) {
            result = ip;
        }
    }
    close(fd);
    return result;
}

static void print_banner(const lx::AppConfig& cfg, const std::string& lan_ip) {
    std::cout << R"(
  ┌─────────────────────────────────────────────┐
  │       LANXFER v)" LANXFER_VERSION R"(                        │
  │       Wi-Fi file transfer for nearby phones │
  └─────────────────────────────────────────────┘
)" << std::endl;

    spdlog::info("Configuration:");
    spdlog::info("  LAN address     : {}", lan_ip);
    spdlog::info("  Web port        : {}", cfg.server.port);
    spdlog::info("  Fast transfer   : http://{}:{}", lan_ip, cfg.server.fast_port);
    spdlog::info("  Control channel : {}",
                 cfg.control.enabled ? "ws://" + lan_ip + ":" + std::to_string(cfg.control.port)
                                     : std::string("(disabled)"));
    spdlog::info("  Shared dir      : {}", cfg.server.shared_dir);
    spdlog::info("  Home dir        : {}", cfg.server.home_dir);
    spdlog::info("  Chunk size      : {} MB", cfg.streaming.chunk_size_mb);
    spdlog::info("  Send buffer     : {} MB", cfg.streaming.send_buffer_mb);
    spdlog::info("  Kept transfers  : {}", cfg.transfers.retained_completed);
}

static void print_usage() {
    std::cout << "Usage: lanxfer [options]\n"
              << "Options:\n"
              << "  -c, --config <path>     Config file (default: config.yaml)\n"
              << "  -p, --port <port>       Web port; fast transfer uses port + 1\n"
              << "  -d, --directory <path>  Directory to share\n"
              << "  -h, --help              Show this help\n"
              << "\nEnvironment variables:\n"
              << "  LANXFER_PORT            Web port\n"
              << "  LANXFER_FAST_PORT       Fast transfer port\n"
              << "  LANXFER_SHARED_DIR      Directory to share\n"
              << "  LANXFER_CONTROL_PORT    Control WebSocket port\n"
              << "  LOG_LEVEL               Log level (trace/debug/info/warn/error)\n";
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path = "config.yaml";
    bool config_given = false;
    std::string port_arg;
    std::string directory_arg;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
            config_given = true;
        } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            port_arg = argv[++i];
        } else if ((arg == "--directory" || arg == "-d") && i + 1 < argc) {
            directory_arg = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    lx::AppConfig config;
    try {
        config = lx::load_config(config_path, config_given);
        if (!port_arg.empty()) {
            int port = std::stoi(port_arg);
            if (port < 1 || port > 65534) {
                throw std::runtime_error("Invalid port: " + port_arg);
            }
            config.server.port = static_cast<uint16_t>(port);
            config.server.fast_port = 0;
            config.control.port = 0;
        }
        if (!directory_arg.empty()) {
            config.server.shared_dir = directory_arg;
        }
        lx::finalize_config(config);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    lx::init_logger(config.logging);
    print_banner(config, local_lan_address());

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ─── Create components ────────────────────────────────────────────────────
    lx::SharedRoots roots(config.server.shared_dir, config.server.home_dir);
    lx::TransferRegistry registry(static_cast<size_t>(config.transfers.retained_completed));
    lx::TransferServer transfer_server(lx::make_server_options(config), roots, registry);
    lx::ControlApi control_api(registry, roots, config.server.fast_port);
    lx::ControlServer control_server(config, control_api);

    // ─── Start everything ─────────────────────────────────────────────────────
    if (!transfer_server.start()) {
        spdlog::critical("Failed to start transfer server on port {}", config.server.fast_port);
        return 1;
    }

    if (config.control.enabled && !control_server.start()) {
        spdlog::warn("Failed to start control server on port {}; transfer control unavailable",
                     config.control.port);
    }

    spdlog::info("All systems operational");

    // ─── Main loop ────────────────────────────────────────────────────────────
    auto last_stats_time = std::chrono::steady_clock::now();
    constexpr auto stats_interval = std::chrono::seconds(10);

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        // Periodic stats logging
        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_time >= stats_interval) {
            last_stats_time = now;

            auto stats = registry.get_stats();
            spdlog::info("──── Health Check ────");
            spdlog::info("  Transfers  : {} active | {} paused | {} finished | In flight: {:.1f} MB",
                         stats.active, stats.paused, stats.done,
                         stats.bytes_in_flight / (1024.0 * 1024.0));
            spdlog::info("  Sockets    : {} open connections | {} control clients",
                         transfer_server.connection_count(), control_server.client_count());
            spdlog::info("──────────────────────");
        }
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    control_server.stop();
    transfer_server.stop();
    spdlog::info("Shutdown complete. Goodbye!");

    return 0;
}
