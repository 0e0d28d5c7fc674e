#include "control_server.hpp"
#include "shared_roots.hpp"
#include "transfer_registry.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

// WebSocket client that records every JSON message it receives
class ControlClient {
public:
    explicit ControlClient(uint16_t port)
        : ws_(std::make_shared<rtc::WebSocket>())
    {
        ws_->onOpen([this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
            cv_.notify_all();
        });
        ws_->onMessage([this](auto data) {
            if (!std::holds_alternative<std::string>(data)) return;
            json msg = json::parse(std::get<std::string>(data), nullptr, false);
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(std::move(msg));
            cv_.notify_all();
        });
        ws_->open("ws://127.0.0.1:" + std::to_string(port) + "/");
    }

    ~ControlClient() {
        ws_->resetCallbacks();
        ws_->close();
    }

    bool wait_open(std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return open_; });
    }

    void send(const json& msg) { ws_->send(msg.dump()); }

    // First received message satisfying `match`, waiting up to `timeout`
    std::optional<json> wait_for(const std::function<bool(const json&)>& match,
                                 std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lock(mutex_);
        std::optional<json> found;
        cv_.wait_for(lock, timeout, [&] {
            for (const auto& msg : received_) {
                if (match(msg)) {
                    found = msg;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    size_t count_of(const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& msg : received_) {
            if (msg.is_object() && msg.value("type", "") == type) ++n;
        }
        return n;
    }

private:
    std::shared_ptr<rtc::WebSocket> ws_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    std::vector<json> received_;
};

static bool has_type(const json& msg, const std::string& type) {
    return msg.is_object() && msg.value("type", "") == type;
}

class ControlServerTest : public ::testing::Test {
protected:
    ControlServerTest()
        : roots_(dir_.path(), dir_.path())
        , api_(registry_, roots_, 5001)
    {
        config_.server.bind_address = "127.0.0.1";
        config_.control.port = 0;
        config_.control.push_interval_ms = 50;
    }

    void SetUp() override {
        server_ = std::make_unique<lx::ControlServer>(config_, api_);
        ASSERT_TRUE(server_->start());
        port_ = server_->port();
        ASSERT_NE(port_, 0);
    }

    void TearDown() override {
        server_->stop();
    }

    template <typename Pred>
    static bool wait_until(Pred pred, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }

    lx::test::TempDir dir_;
    lx::TransferRegistry registry_;
    lx::SharedRoots roots_;
    lx::ControlApi api_;
    lx::AppConfig config_;
    std::unique_ptr<lx::ControlServer> server_;
    uint16_t port_ = 0;
};

TEST_F(ControlServerTest, AnswersRequestsOverWebSocket) {
    std::string id = registry_.start("movie.mkv", 1000, "10.0.0.7");

    ControlClient client(port_);
    ASSERT_TRUE(client.wait_open());

    client.send({{"type", "ping"}});
    EXPECT_TRUE(client.wait_for([](const json& m) { return has_type(m, "pong"); }));

    client.send({{"type", "pause"}, {"id", id}});
    auto reply = client.wait_for([](const json& m) {
        return has_type(m, "result") && m.value("action", "") == "pause";
    });
    ASSERT_TRUE(reply);
    EXPECT_EQ((*reply)["id"], id);
    EXPECT_TRUE(registry_.is_paused(id));
}

TEST_F(ControlServerTest, InvalidJsonGetsErrorReply) {
    ControlClient client(port_);
    ASSERT_TRUE(client.wait_open());

    client.send(json("not an object"));
    EXPECT_TRUE(client.wait_for([](const json& m) { return has_type(m, "error"); }));
}

TEST_F(ControlServerTest, OnlySubscribedClientsReceivePushes) {
    std::string id = registry_.start("photo.jpg", 2048, "10.0.0.8");

    ControlClient subscriber(port_);
    ControlClient bystander(port_);
    ASSERT_TRUE(subscriber.wait_open());
    ASSERT_TRUE(bystander.wait_open());

    subscriber.send({{"type", "subscribe"}});
    bystander.send({{"type", "ping"}});

    auto ack = subscriber.wait_for([](const json& m) {
        return has_type(m, "result") && m.value("action", "") == "subscribe";
    });
    ASSERT_TRUE(ack);

    auto push = subscriber.wait_for([&](const json& m) {
        return has_type(m, "transfers") && m["transfers"].size() == 1
            && m["transfers"][0].value("id", "") == id;
    });
    ASSERT_TRUE(push);
    EXPECT_EQ((*push)["transfers"][0]["status"], "active");

    // Pushes keep flowing and pick up registry changes
    registry_.update(id, 1024);
    EXPECT_TRUE(subscriber.wait_for([](const json& m) {
        return has_type(m, "transfers") && m["transfers"].size() == 1
            && m["transfers"][0].value("sent", 0) == 1024;
    }));

    ASSERT_TRUE(bystander.wait_for([](const json& m) { return has_type(m, "pong"); }));
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(bystander.count_of("transfers"), 0u);
}

TEST_F(ControlServerTest, TracksClientsUntilTheyDisconnect) {
    auto first = std::make_unique<ControlClient>(port_);
    ControlClient second(port_);
    ASSERT_TRUE(first->wait_open());
    ASSERT_TRUE(second.wait_open());
    EXPECT_TRUE(wait_until([this] { return server_->client_count() == 2; }));

    first.reset();
    EXPECT_TRUE(wait_until([this] { return server_->client_count() == 1; }));
}

TEST_F(ControlServerTest, StopIsIdempotent) {
    server_->stop();
    EXPECT_FALSE(server_->is_running());
    EXPECT_EQ(server_->port(), 0);
    server_->stop();
}
