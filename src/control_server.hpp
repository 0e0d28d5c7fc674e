#pragma once

#include "config.hpp"
#include "control_api.hpp"
#include <rtc/rtc.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace lx {

// WebSocket endpoint for the transfer-control surface. Each text message is a
// JSON request answered by ControlApi; subscribed clients also receive a
// periodic "transfers" snapshot.
class ControlServer {
public:
    ControlServer(const AppConfig& config, ControlApi& api);
    ~ControlServer();

    // Non-copyable
    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_.load(); }
    size_t client_count() const;

    // Port actually bound (differs from the config when 0 was requested)
    uint16_t port() const;

private:
    void on_client_connected(std::shared_ptr<rtc::WebSocket> ws);
    void on_client_message(const std::string& client_id,
                           std::shared_ptr<rtc::WebSocket> ws,
                           const std::string& message);
    void on_client_disconnected(const std::string& client_id);

    void push_loop();
    void send_json(const std::shared_ptr<rtc::WebSocket>& ws, const nlohmann::json& msg);

    AppConfig config_;
    ControlApi& api_;
    std::shared_ptr<rtc::WebSocketServer> ws_server_;

    struct ClientSession {
        std::shared_ptr<rtc::WebSocket> ws;
        bool subscribed = false;
    };

    mutable std::mutex clients_mutex_;
    std::unordered_map<std::string, ClientSession> clients_; // client_id → session
    uint64_t next_client_ = 0;

    std::atomic<bool> running_{false};
    std::thread push_thread_;
};

} // namespace lx
