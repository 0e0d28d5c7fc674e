#pragma once

#include "config.hpp"
#include "file_streamer.hpp"
#include "http_request.hpp"
#include "shared_roots.hpp"
#include "transfer_registry.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace lx {

struct TransferServerOptions {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 5001;                    // 0 = pick an ephemeral port
    int send_buffer_bytes = 16 * 1024 * 1024;
    int recv_buffer_bytes = 1024 * 1024;
    int listen_backlog = 64;
    size_t max_header_bytes = 65536;
    StreamOptions stream;
};

// Throws std::runtime_error if a buffer size does not fit in an int
TransferServerOptions make_server_options(const AppConfig& config);

// Raw-socket HTTP file server: one detached worker thread per connection,
// zero-copy streaming, Range support, and registry-tracked transfers.
class TransferServer {
public:
    TransferServer(const TransferServerOptions& options,
                   SharedRoots& roots,
                   TransferRegistry& registry);
    ~TransferServer();

    // Non-copyable
    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Port actually bound (differs from options when 0 was requested)
    uint16_t port() const { return bound_port_; }

    size_t connection_count() const;

private:
    void server_thread();
    void handle_client(int client_fd, const std::string& client_ip);
    void serve_file(int fd, const HttpRequest& req, const std::string& path,
                    const std::string& client_ip);
    void send_preflight(int fd);
    void send_error(int fd, int status, const std::string& status_text);
    bool apply_socket_tuning(int fd) const;

    void track_connection(int fd);
    void untrack_connection(int fd);

    TransferServerOptions options_;
    SharedRoots& roots_;
    TransferRegistry& registry_;

    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex connections_mutex_;
    std::condition_variable connections_drained_;
    std::unordered_set<int> connections_;
};

} // namespace lx
