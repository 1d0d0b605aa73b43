/**
 * @file test_control_plane.cpp
 * @brief Control commands and events over a real ipc:// endpoint
 */

#include "daemon/control/control_plane.h"

#include <atomic>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>
#include <zmq.hpp>

using daemon_control::ControlPlane;
using daemon_control::ControlPlaneDependencies;
using scrobble::AppFilterAction;

namespace {

std::string makeIpcEndpoint() {
    static std::atomic<int> counter{0};
    std::ostringstream oss;
    oss << "ipc:///tmp/np_scrobbler_control_test_" << ::getpid() << "_" << counter++
        << ".sock";
    return oss.str();
}

std::string readMessage(zmq::socket_t& socket) {
    zmq::message_t reply;
    auto result = socket.recv(reply, zmq::recv_flags::none);
    if (!result) {
        return {};
    }
    return std::string(static_cast<char*>(reply.data()), reply.size());
}

}  // namespace

TEST(ParseDecision, AcceptsAllowAndIgnore) {
    AppFilterAction action = AppFilterAction::AskUser;
    EXPECT_TRUE(daemon_control::parseDecision("allow", action));
    EXPECT_EQ(action, AppFilterAction::Allow);
    EXPECT_TRUE(daemon_control::parseDecision("IGNORE", action));
    EXPECT_EQ(action, AppFilterAction::Ignore);
    EXPECT_FALSE(daemon_control::parseDecision("ask_user", action));
    EXPECT_FALSE(daemon_control::parseDecision("", action));
}

class ControlPlaneTest : public ::testing::Test {
   protected:
    void SetUp() override {
        scrobble::AppFilterConfig config;
        config.promptForNewApps = true;
        filter = std::make_unique<scrobble::SharedAppFilter>(config);

        ControlPlaneDependencies deps;
        deps.status = &status;
        deps.recordAppDecision = [this](const std::string& appId, AppFilterAction decision,
                                        std::string& error) {
            filter->recordDecision(appId, decision);
            persistCalls++;
            if (failPersist) {
                error = "disk full";
                return false;
            }
            return true;
        };

        endpoint = makeIpcEndpoint();
        control = std::make_unique<ControlPlane>(endpoint, deps, 100);
        ASSERT_TRUE(control->start());
    }

    void TearDown() override {
        control->stop();
    }

    std::string send(const std::string& message) {
        zmq::socket_t req(ctx, zmq::socket_type::req);
        req.set(zmq::sockopt::rcvtimeo, 2000);
        req.set(zmq::sockopt::linger, 0);
        req.connect(endpoint);
        req.send(zmq::buffer(message), zmq::send_flags::none);
        return readMessage(req);
    }

    nlohmann::json sendJson(const nlohmann::json& message) {
        auto reply = send(message.dump());
        return reply.empty() ? nlohmann::json() : nlohmann::json::parse(reply);
    }

    zmq::context_t ctx{1};
    daemon_metrics::StatusTracker status;
    std::unique_ptr<scrobble::SharedAppFilter> filter;
    std::unique_ptr<ControlPlane> control;
    std::string endpoint;
    std::atomic<int> persistCalls{0};
    std::atomic<bool> failPersist{false};
};

TEST_F(ControlPlaneTest, Ping) {
    EXPECT_EQ(send("PING"), "PONG");
    auto reply = sendJson({{"cmd", "PING"}});
    EXPECT_EQ(reply["status"], "ok");
    EXPECT_EQ(reply["data"], "PONG");
}

TEST_F(ControlPlaneTest, StatusIncludesTextLines) {
    status.setNowPlaying(scrobble::Track{"Song", "Band", std::nullopt, 200}, std::string("mpv"));

    auto reply = sendJson({{"cmd", "STATUS"}});
    ASSERT_EQ(reply["status"], "ok");
    EXPECT_EQ(reply["data"]["now_playing"], "Band - Song");
    EXPECT_EQ(reply["data"]["now_playing_text"], "Now Playing: Band - Song");
    EXPECT_EQ(reply["data"]["last_scrobbled_text"], "Last Scrobbled: -");
}

TEST_F(ControlPlaneTest, PendingApps) {
    status.addPendingApp("vlc");
    auto reply = sendJson({{"cmd", "PENDING_APPS"}});
    ASSERT_EQ(reply["status"], "ok");
    EXPECT_EQ(reply["data"], nlohmann::json::array({"vlc"}));
}

TEST_F(ControlPlaneTest, JsonDecisionUpdatesFilterAndPersists) {
    status.addPendingApp("vlc");
    ASSERT_EQ(filter->classify(std::string("vlc")), AppFilterAction::AskUser);

    auto reply = sendJson({{"cmd", "APP_DECISION"}, {"params", {{"app", "vlc"}, {"decision", "ignore"}}}});
    ASSERT_EQ(reply["status"], "ok") << reply.dump();
    EXPECT_EQ(reply["data"]["decision"], "ignore");

    EXPECT_EQ(filter->classify(std::string("vlc")), AppFilterAction::Ignore);
    EXPECT_TRUE(status.pendingApps().empty());
    EXPECT_EQ(persistCalls.load(), 1);
}

TEST_F(ControlPlaneTest, RawDecisionForm) {
    auto reply = send("APP_DECISION:org.example.player=Allow");
    EXPECT_EQ(reply.rfind("OK:", 0), 0u) << reply;
    EXPECT_EQ(filter->classify(std::string("org.example.player")), AppFilterAction::Allow);
}

TEST_F(ControlPlaneTest, InvalidDecisionIsRejected) {
    auto reply = sendJson({{"cmd", "APP_DECISION"}, {"params", {{"app", "vlc"}, {"decision", "maybe"}}}});
    EXPECT_EQ(reply["status"], "error");
    EXPECT_EQ(reply["error_code"], "IPC_INVALID_PARAMS");

    EXPECT_EQ(send("APP_DECISION:=allow").rfind("ERR:", 0), 0u);
    EXPECT_EQ(filter->classify(std::string("vlc")), AppFilterAction::AskUser);
    EXPECT_EQ(persistCalls.load(), 0);
}

TEST_F(ControlPlaneTest, PersistFailureStillAppliesDecision) {
    failPersist = true;
    auto reply = sendJson({{"cmd", "APP_DECISION"}, {"params", {{"app", "vlc"}, {"decision", "allow"}}}});
    EXPECT_EQ(reply["status"], "error");
    EXPECT_NE(reply["message"].get<std::string>().find("disk full"), std::string::npos);
    EXPECT_EQ(filter->classify(std::string("vlc")), AppFilterAction::Allow);
}

TEST_F(ControlPlaneTest, EventsArePublished) {
    zmq::socket_t sub(ctx, zmq::socket_type::sub);
    sub.set(zmq::sockopt::subscribe, "");
    sub.set(zmq::sockopt::rcvtimeo, 200);
    sub.connect(control->pubEndpoint());

    nlohmann::json event;
    for (int i = 0; i < 20 && event.is_null(); ++i) {
        control->publishAskUser("vlc");
        auto raw = readMessage(sub);
        if (!raw.empty()) {
            event = nlohmann::json::parse(raw);
        }
    }
    ASSERT_FALSE(event.is_null());
    EXPECT_EQ(event["type"], "ask_user");
    EXPECT_EQ(event["app"], "vlc");

    scrobble::ScrobbleEvent scrobbled{scrobble::Track{"Song", "Band", std::nullopt, 200},
                                      scrobble::Clock::time_point(std::chrono::seconds(1700000000)),
                                      std::string("mpv")};
    control->publishScrobble(scrobbled);
    // Late copies of the warm-up ask_user events may still be queued ahead of it
    nlohmann::json next;
    for (int i = 0; i < 25; ++i) {
        auto raw = readMessage(sub);
        ASSERT_FALSE(raw.empty());
        next = nlohmann::json::parse(raw);
        if (next["type"] != "ask_user") {
            break;
        }
    }
    EXPECT_EQ(next["type"], "scrobble");
    EXPECT_EQ(next["started_at"], 1700000000);
    EXPECT_EQ(next["track"]["duration"], 200);
    EXPECT_TRUE(next["track"]["album"].is_null());
}
