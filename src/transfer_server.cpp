#include "transfer_server.hpp"
#include "byte_range.hpp"
#include "mime_types.hpp"
#include "path_guard.hpp"
#include "scoped_fd.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace lx {

static const char* kCorsAllowMethods = "GET, HEAD, OPTIONS";

// setsockopt takes buffer sizes as int
static int scaled_to_int(int value, int64_t unit, const char* what) {
    int64_t bytes = static_cast<int64_t>(value) * unit;
    if (bytes < 0 || bytes > std::numeric_limits<int>::max()) {
        throw std::runtime_error(std::string(what) + " out of range: " + std::to_string(value));
    }
    return static_cast<int>(bytes);
}

TransferServerOptions make_server_options(const AppConfig& config) {
    TransferServerOptions options;
    options.bind_address = config.server.bind_address;
    options.port = config.server.fast_port;
    options.send_buffer_bytes = scaled_to_int(config.streaming.send_buffer_mb, 1024 * 1024,
                                              "streaming.send_buffer_mb");
    options.recv_buffer_bytes = scaled_to_int(config.streaming.recv_buffer_kb, 1024,
                                              "streaming.recv_buffer_kb");
    options.listen_backlog = config.streaming.listen_backlog;
    options.max_header_bytes = static_cast<size_t>(config.streaming.max_header_bytes);
    options.stream.chunk_size = static_cast<size_t>(config.streaming.chunk_size_mb) * 1024 * 1024;
    options.stream.pause_poll = std::chrono::milliseconds(config.streaming.pause_poll_ms);
    return options;
}

// Writes the whole buffer; false once the peer is gone
static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

TransferServer::TransferServer(const TransferServerOptions& options,
                               SharedRoots& roots,
                               TransferRegistry& registry)
    : options_(options)
    , roots_(roots)
    , registry_(registry)
{
}

TransferServer::~TransferServer() {
    stop();
}

bool TransferServer::apply_socket_tuning(int fd) const {
    bool ok = true;
    int one = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
        spdlog::warn("Transfer server: TCP_NODELAY failed: {}", std::strerror(errno));
        ok = false;
    }
    int sndbuf = options_.send_buffer_bytes;
    if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &sndbuf, sizeof(sndbuf)) < 0) {
        spdlog::warn("Transfer server: SO_SNDBUF failed: {}", std::strerror(errno));
        ok = false;
    }
    int rcvbuf = options_.recv_buffer_bytes;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) < 0) {
        spdlog::warn("Transfer server: SO_RCVBUF failed: {}", std::strerror(errno));
        ok = false;
    }
    return ok;
}

bool TransferServer::start() {
    if (running_.load()) {
        spdlog::warn("Transfer server already running");
        return true;
    }

    // Broken pipes are reported through errno, not a process-killing signal
    std::signal(SIGPIPE, SIG_IGN);

    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Transfer server: Failed to create socket");
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    apply_socket_tuning(server_fd_);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    if (inet_pton(AF_INET, options_.bind_address.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("Transfer server: Invalid bind address {}", options_.bind_address);
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("Transfer server: Failed to bind to port {}: {}",
                      options_.port, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, options_.listen_backlog) < 0) {
        spdlog::error("Transfer server: Failed to listen");
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, (sockaddr*)&bound, &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = options_.port;
    }

    running_.store(true);
    thread_ = std::thread(&TransferServer::server_thread, this);
    spdlog::info("Transfer server listening on http://{}:{} (chunk: {} MB, sndbuf: {} MB)",
                 options_.bind_address, bound_port_,
                 options_.stream.chunk_size / (1024 * 1024),
                 options_.send_buffer_bytes / (1024 * 1024));
    return true;
}

void TransferServer::stop() {
    bool was_running = running_.exchange(false);
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
    if (!was_running) {
        return;
    }

    // Unblock workers stuck in recv/send and wake any paused streamers
    std::unique_lock<std::mutex> lock(connections_mutex_);
    for (int fd : connections_) {
        shutdown(fd, SHUT_RDWR);
    }
    registry_.cancel_all();
    connections_drained_.wait(lock, [this] { return connections_.empty(); });
    spdlog::info("Transfer server stopped");
}

size_t TransferServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void TransferServer::track_connection(int fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.insert(fd);
}

// Closing under the lock keeps stop() from shutting down a reused descriptor
void TransferServer::untrack_connection(int fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(fd);
    close(fd);
    connections_drained_.notify_all();
}

void TransferServer::server_thread() {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, (sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_.load()) {
                spdlog::debug("Transfer server: Accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        int one = 1;
        setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip(ip);

        // Registered before the worker exists so stop() always sees it
        track_connection(client_fd);

        // One thread per connection; no cap (a handful of LAN peers)
        try {
            std::thread([this, client_fd, client_ip]() {
                try {
                    handle_client(client_fd, client_ip);
                } catch (const std::exception& e) {
                    spdlog::error("Transfer server: Connection from {} failed: {}",
                                  client_ip, e.what());
                }
                untrack_connection(client_fd);
            }).detach();
        } catch (const std::system_error& e) {
            spdlog::error("Transfer server: Cannot spawn worker for {}: {}", client_ip, e.what());
            untrack_connection(client_fd);
        }
    }
}

void TransferServer::handle_client(int client_fd, const std::string& client_ip) {
    ReadResult read = read_header_block(client_fd, options_.max_header_bytes);
    if (read.status != ReadStatus::Complete) {
        if (read.status == ReadStatus::TooLarge) {
            spdlog::warn("Transfer server: Oversized header block from {}, dropping", client_ip);
        }
        return;
    }

    auto parsed = parse_request(read.header_block);
    if (!parsed) {
        spdlog::debug("Transfer server: Malformed request line from {}", client_ip);
        return;
    }
    const HttpRequest& req = *parsed;
    spdlog::debug("{} {} from {}", req.method, req.target, client_ip);

    // CORS preflight
    if (req.method == "OPTIONS") {
        send_preflight(client_fd);
        return;
    }

    if (req.method != "GET" && req.method != "HEAD") {
        send_error(client_fd, 405, "Method Not Allowed");
        return;
    }

    if (!req.target_valid) {
        send_error(client_fd, 404, "Not Found");
        return;
    }

    Resolution resolved = resolve_request_path(req.path, req.query_path, roots_.snapshot());
    if (resolved.access == Access::Forbidden) {
        send_error(client_fd, 403, "Forbidden");
        return;
    }
    if (resolved.access == Access::NotFound) {
        send_error(client_fd, 404, "Not Found");
        return;
    }

    serve_file(client_fd, req, resolved.path, client_ip);
}

void TransferServer::serve_file(int fd, const HttpRequest& req, const std::string& path,
                                const std::string& client_ip) {
    ScopedFd file(open(path.c_str(), O_RDONLY | O_CLOEXEC));
    struct stat st{};
    if (!file.valid() || fstat(file.get(), &st) != 0 || !S_ISREG(st.st_mode)) {
        send_error(fd, 404, "Not Found");
        return;
    }

    const uint64_t file_size = static_cast<uint64_t>(st.st_size);
    const std::string name = fs::path(path).filename().string();
    ByteRange range = negotiate_range(file_size, req.header("Range"));

    std::ostringstream oss;
    oss << "HTTP/1.1 " << (range.partial ? "206 Partial Content" : "200 OK") << "\r\n"
        << "Content-Type: " << guess_mime_type(path) << "\r\n"
        << "Content-Length: " << range.length << "\r\n"
        << "Content-Disposition: attachment; filename=\"" << ascii_safe_filename(name) << "\"\r\n"
        << "Accept-Ranges: bytes\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Access-Control-Allow-Methods: " << kCorsAllowMethods << "\r\n"
        << "Access-Control-Expose-Headers: Content-Length, Content-Range\r\n"
        << "Cache-Control: no-cache\r\n"
        << "Connection: close\r\n";
    if (range.partial) {
        oss << "Content-Range: " << content_range(range, file_size) << "\r\n";
    }
    oss << "\r\n";

    if (!send_all(fd, oss.str())) {
        spdlog::debug("Transfer server: {} went away before headers were sent", client_ip);
        return;
    }
    if (req.method == "HEAD") {
        return;
    }

    std::string id = registry_.start(name, file_size, client_ip);
    spdlog::info("Transfer {} started: {} ({} bytes from offset {}) -> {}",
                 id, name, range.length, range.start, client_ip);

    StreamResult result = stream_file_range(fd, file.get(), range.start, range.length,
                                            registry_, id, options_.stream);

    if (result.outcome == StreamOutcome::Completed) {
        spdlog::info("Transfer {} complete: {} bytes{}", id, result.bytes_sent,
                     result.used_fallback ? " (buffered)" : "");
    } else if (result.outcome == StreamOutcome::ConnectionLost) {
        spdlog::debug("Transfer {} aborted by peer after {} bytes", id, result.bytes_sent);
    } else {
        spdlog::info("Transfer {} ended early ({}) after {} bytes",
                     id, to_string(result.outcome), result.bytes_sent);
    }
}

void TransferServer::send_preflight(int fd) {
    std::ostringstream oss;
    oss << "HTTP/1.1 204 No Content\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Access-Control-Allow-Methods: " << kCorsAllowMethods << "\r\n"
        << "Access-Control-Allow-Headers: Range\r\n"
        << "Connection: close\r\n"
        << "\r\n";
    send_all(fd, oss.str());
}

void TransferServer::send_error(int fd, int status, const std::string& status_text) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << status_text << "\r\n"
        << "Content-Type: text/plain\r\n"
        << "Content-Length: " << status_text.size() << "\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << status_text;

    if (!send_all(fd, oss.str())) {
        spdlog::debug("Transfer server: Could not deliver {} response", status);
    }
}

} // namespace lx
