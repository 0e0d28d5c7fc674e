#include "control_api.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using json = nlohmann::json;
using lx::ControlApi;
using lx::TransferStatus;

class ControlApiTest : public ::testing::Test {
protected:
    ControlApiTest()
        : share_(dir_.mkdir("share"))
        , roots_(share_, dir_.path())
        , api_(registry_, roots_, 5001)
    {
    }

    lx::test::TempDir dir_;
    std::string share_;
    lx::TransferRegistry registry_;
    lx::SharedRoots roots_;
    ControlApi api_;
};

TEST_F(ControlApiTest, ListReportsRecordsNewestFirst) {
    std::string first = registry_.start("a.bin", 100, "10.0.0.2");
    std::string second = registry_.start("b.bin", 200, "10.0.0.3");
    registry_.update(second, 50);

    json reply = api_.handle({{"type", "list"}});
    EXPECT_EQ(reply["type"], "transfers");
    ASSERT_EQ(reply["transfers"].size(), 2u);

    const json& newest = reply["transfers"][0];
    EXPECT_EQ(newest["id"], second);
    EXPECT_EQ(newest["name"], "b.bin");
    EXPECT_EQ(newest["size"], 200);
    EXPECT_EQ(newest["sent"], 50);
    EXPECT_EQ(newest["status"], "active");
    EXPECT_EQ(newest["client_ip"], "10.0.0.3");
    EXPECT_TRUE(newest["started"].is_number());
    EXPECT_GT(newest["started"].get<double>(), 0.0);

    EXPECT_EQ(reply["transfers"][1]["id"], first);
}

TEST_F(ControlApiTest, PauseResumeCancelRoundTrip) {
    std::string id = registry_.start("a.bin", 100, "ip");

    json paused = api_.handle({{"type", "pause"}, {"id", id}});
    EXPECT_EQ(paused["type"], "result");
    EXPECT_EQ(paused["action"], "pause");
    EXPECT_EQ(paused["id"], id);
    EXPECT_EQ(paused["ok"], true);
    EXPECT_TRUE(registry_.is_paused(id));
    EXPECT_EQ(api_.transfers_message()["transfers"][0]["status"], "paused");

    json resumed = api_.handle({{"type", "resume"}, {"id", id}});
    EXPECT_EQ(resumed["type"], "result");
    EXPECT_FALSE(registry_.is_paused(id));

    json cancelled = api_.handle({{"type", "cancel"}, {"id", id}});
    EXPECT_EQ(cancelled["type"], "result");
    EXPECT_EQ(registry_.find(id)->status, TransferStatus::Done);
}

TEST_F(ControlApiTest, WrongStateOrUnknownIdIsNotFound) {
    std::string id = registry_.start("a.bin", 100, "ip");

    json resume = api_.handle({{"type", "resume"}, {"id", id}});
    EXPECT_EQ(resume["type"], "error");
    EXPECT_EQ(resume["action"], "resume");
    EXPECT_EQ(resume["id"], id);
    EXPECT_EQ(resume["message"], "not found");

    json unknown = api_.handle({{"type", "cancel"}, {"id", "deadbeef"}});
    EXPECT_EQ(unknown["type"], "error");
    EXPECT_EQ(unknown["message"], "not found");

    registry_.complete(id);
    EXPECT_EQ(api_.handle({{"type", "pause"}, {"id", id}})["type"], "error");
}

TEST_F(ControlApiTest, ActionWithoutIdIsRejected) {
    EXPECT_EQ(api_.handle({{"type", "pause"}})["type"], "error");
    EXPECT_EQ(api_.handle({{"type", "pause"}, {"id", 42}})["type"], "error");
}

TEST_F(ControlApiTest, SetDirectoryReassignsSharedRoot) {
    std::string other = dir_.mkdir("other");

    json reply = api_.handle({{"type", "set_directory"}, {"directory", other}});
    EXPECT_EQ(reply["type"], "result");
    EXPECT_EQ(reply["ok"], true);
    EXPECT_EQ(reply["directory"], other);
    EXPECT_EQ(roots_.shared_dir(), other);
}

TEST_F(ControlApiTest, SetDirectoryRejectsMissingDirectory) {
    json reply = api_.handle({{"type", "set_directory"}, {"directory", dir_.path() + "/missing"}});
    EXPECT_EQ(reply["type"], "error");
    EXPECT_EQ(reply["message"], "Directory does not exist");
    EXPECT_EQ(roots_.shared_dir(), share_);

    EXPECT_EQ(api_.handle({{"type", "set_directory"}})["type"], "error");

    std::string file = dir_.write("plain.txt", "x");
    EXPECT_EQ(api_.handle({{"type", "set_directory"}, {"directory", file}})["type"], "error");
}

TEST_F(ControlApiTest, InfoDescribesServer) {
    json reply = api_.handle({{"type", "info"}});
    EXPECT_EQ(reply["type"], "info");
    EXPECT_EQ(reply["fast_port"], 5001);
    EXPECT_EQ(reply["directory"], share_);
    EXPECT_EQ(reply["home"], dir_.path());
}

TEST_F(ControlApiTest, PingAndSubscribe) {
    EXPECT_EQ(api_.handle({{"type", "ping"}})["type"], "pong");

    json sub = api_.handle({{"type", "subscribe"}});
    EXPECT_EQ(sub["type"], "result");
    EXPECT_EQ(sub["action"], "subscribe");
    EXPECT_EQ(sub["ok"], true);
}

TEST_F(ControlApiTest, MalformedMessagesGetErrorReplies) {
    EXPECT_EQ(api_.handle_text("{not json")["message"], "invalid JSON");
    EXPECT_EQ(api_.handle_text("[1, 2]")["type"], "error");
    EXPECT_EQ(api_.handle({{"type", 7}})["type"], "error");

    json unknown = api_.handle_text(R"({"type":"reboot"})");
    EXPECT_EQ(unknown["type"], "error");
    EXPECT_EQ(unknown["message"], "unknown message type: reboot");
}

TEST_F(ControlApiTest, HandleTextDispatches) {
    std::string id = registry_.start("a.bin", 100, "ip");
    json reply = api_.handle_text(R"({"type":"pause","id":")" + id + R"("})");
    EXPECT_EQ(reply["type"], "result");
    EXPECT_TRUE(registry_.is_paused(id));
}
