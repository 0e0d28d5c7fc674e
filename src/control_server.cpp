#include "control_server.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <vector>

using json = nlohmann::json;

namespace lx {

ControlServer::ControlServer(const AppConfig& config, ControlApi& api)
    : config_(config)
    , api_(api)
{
}

ControlServer::~ControlServer() {
    stop();
}

bool ControlServer::start() {
    try {
        rtc::WebSocketServer::Configuration ws_config;
        ws_config.port = config_.control.port;
        ws_config.enableTls = false;
        ws_config.bindAddress = config_.server.bind_address;

        ws_server_ = std::make_shared<rtc::WebSocketServer>(ws_config);

        ws_server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
            on_client_connected(ws);
        });

        running_.store(true);
        push_thread_ = std::thread(&ControlServer::push_loop, this);
        spdlog::info("Control server listening on ws://{}:{}",
                     config_.server.bind_address, ws_server_->port());
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to start control server: {}", e.what());
        ws_server_.reset();
        return false;
    }
}

void ControlServer::stop() {
    bool was_running = running_.exchange(false);
    if (push_thread_.joinable()) {
        push_thread_.join();
    }

    std::vector<std::shared_ptr<rtc::WebSocket>> sockets;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto& [id, session] : clients_) {
            if (session.ws) {
                sockets.push_back(session.ws);
            }
        }
        clients_.clear();
    }
    for (auto& ws : sockets) {
        ws->close();
    }

    if (ws_server_) {
        ws_server_->stop();
        ws_server_.reset();
    }

    if (was_running) {
        spdlog::info("Control server stopped");
    }
}

uint16_t ControlServer::port() const {
    return ws_server_ ? ws_server_->port() : 0;
}

size_t ControlServer::client_count() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

void ControlServer::on_client_connected(std::shared_ptr<rtc::WebSocket> ws) {
    std::string client_id;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        client_id = "ctl-" + std::to_string(++next_client_);
        clients_[client_id] = ClientSession{ws, false};
    }
    spdlog::info("Control client connected: {}", client_id);

    auto ws_weak = std::weak_ptr<rtc::WebSocket>(ws);

    ws->onMessage([this, client_id, ws_weak](auto data) {
        auto ws_shared = ws_weak.lock();
        if (ws_shared && std::holds_alternative<std::string>(data)) {
            on_client_message(client_id, ws_shared, std::get<std::string>(data));
        }
    });

    ws->onClosed([this, client_id]() {
        on_client_disconnected(client_id);
    });

    ws->onError([this, client_id](std::string error) {
        spdlog::warn("[{}] WebSocket error: {}", client_id, error);
        on_client_disconnected(client_id);
    });
}

void ControlServer::on_client_message(const std::string& client_id,
                                      std::shared_ptr<rtc::WebSocket> ws,
                                      const std::string& message) {
    json reply = api_.handle_text(message);

    if (reply.value("action", "") == "subscribe" && reply.value("ok", false)) {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(client_id);
        if (it != clients_.end()) {
            it->second.subscribed = true;
        }
        spdlog::debug("[{}] Subscribed to transfer updates", client_id);
    }

    send_json(ws, reply);
}

void ControlServer::on_client_disconnected(const std::string& client_id) {
    size_t erased;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        erased = clients_.erase(client_id);
    }
    if (erased) {
        spdlog::info("Control client disconnected: {}", client_id);
    }
}

void ControlServer::push_loop() {
    const auto interval = std::chrono::milliseconds(config_.control.push_interval_ms);

    while (running_.load()) {
        std::vector<std::shared_ptr<rtc::WebSocket>> targets;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            for (auto& [id, session] : clients_) {
                if (session.subscribed && session.ws && session.ws->isOpen()) {
                    targets.push_back(session.ws);
                }
            }
        }

        if (!targets.empty()) {
            json snapshot = api_.transfers_message();
            for (auto& ws : targets) {
                send_json(ws, snapshot);
            }
        }

        // Sleep in short slices so stop() is not held up
        auto deadline = std::chrono::steady_clock::now() + interval;
        while (running_.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

void ControlServer::send_json(const std::shared_ptr<rtc::WebSocket>& ws, const json& msg) {
    try {
        ws->send(msg.dump());
    } catch (const std::exception& e) {
        spdlog::warn("Failed to send to control client: {}", e.what());
    }
}

} // namespace lx
