#include <gtest/gtest.h>

#include "bridge/reducer.hpp"
#include "bridge/surface_session.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

using nlohmann::json;
using webbridge::NavigationDecision;
using webbridge::SurfaceSession;

namespace {

const std::string kLocalOrigin = "file:///app/index.html";

class SurfaceSessionTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    SurfaceSession session{"main", make_test_config(), std::make_shared<FixedEnvironment>(), sink};

    bool post(const json& envelope, const std::string& origin = kLocalOrigin) {
        return session.receive_message(origin, envelope.dump());
    }
};

} // namespace

TEST_F(SurfaceSessionTest, GreetingRepliesToCallback) {
    ASSERT_TRUE(post({{"type", "greeting"}, {"callback", "cb"}, {"data", {{"text", "Hello"}}}}));
    session.flush();

    auto replies = sink->replies();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].callback, "cb");
    auto body = json::parse(replies[0].json);
    EXPECT_TRUE(body.at("success").get<bool>());
    EXPECT_EQ(body.at("data").at("text"), "Hello");
}

TEST_F(SurfaceSessionTest, TrustedRemoteOriginIsAccepted) {
    EXPECT_TRUE(post({{"type", "getAppVersion"}, {"callback", "cb"}}, "https://www.myservice.com/bridge"));
    session.flush();
    EXPECT_EQ(sink->replies().size(), 1u);
}

TEST_F(SurfaceSessionTest, UntrustedOriginIsDroppedSilently) {
    EXPECT_FALSE(post({{"type", "showToast"}, {"callback", "cb"}, {"data", {{"message", "x"}}}},
                      "https://evil.example.net/"));
    EXPECT_FALSE(session.receive_message(std::nullopt, R"({"type":"greeting","callback":"cb"})"));
    EXPECT_FALSE(post({{"type", "greeting"}, {"callback", "cb"}}, "https://notmyservice.com/"));
    session.flush();

    EXPECT_TRUE(sink->replies().empty());
    EXPECT_FALSE(session.state().pending_notification.has_value());
}

TEST_F(SurfaceSessionTest, UnknownTypeStillRepliesToCallback) {
    EXPECT_FALSE(post({{"type", "deleteEverything"}, {"callback", "cb"}}));
    session.flush();

    auto replies = sink->replies();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].callback, "cb");
    auto body = json::parse(replies[0].json);
    EXPECT_FALSE(body.at("success").get<bool>());
    EXPECT_EQ(body.at("message"), webbridge::messages::kCannotProcess);
    EXPECT_FALSE(body.contains("data"));
}

TEST_F(SurfaceSessionTest, MalformedBodyWithoutCallbackIsDropped) {
    EXPECT_FALSE(session.receive_message(kLocalOrigin, "{not json"));
    EXPECT_FALSE(session.receive_message(kLocalOrigin, "[1,2,3]"));
    session.flush();
    EXPECT_TRUE(sink->replies().empty());
}

TEST_F(SurfaceSessionTest, RepliesArriveInReceiveOrder) {
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(post({{"type", "greeting"}, {"callback", "cb"}, {"data", {{"text", std::to_string(i)}}}}));
    }
    session.flush();

    auto replies = sink->replies();
    ASSERT_EQ(replies.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(json::parse(replies[i].json).at("data").at("text"), std::to_string(i));
    }
}

TEST_F(SurfaceSessionTest, InvalidCallbackNameNeverReachesSink) {
    EXPECT_TRUE(post({{"type", "showToast"}, {"callback", "alert(1);x"}, {"data", {{"message", "hi"}}}}));
    session.flush();

    EXPECT_TRUE(sink->replies().empty());
    EXPECT_EQ(session.state().pending_notification.value_or(""), "hi");
}

TEST_F(SurfaceSessionTest, MissingCallbackAppliesStateWithoutReply) {
    EXPECT_TRUE(post({{"type", "openUrl"}, {"data", {{"url", "https://www.apple.com"}}}}));
    session.flush();

    EXPECT_TRUE(sink->replies().empty());
    EXPECT_EQ(session.state().pending_navigation_target.value_or(""), "https://www.apple.com");

    session.consume_navigation();
    EXPECT_FALSE(session.state().pending_navigation_target.has_value());
}

TEST_F(SurfaceSessionTest, BlockedNavigationRaisesPendingError) {
    session.on_progress(0.6);

    EXPECT_EQ(session.decide_navigation("https://evil.example.net/page"), NavigationDecision::cancel);

    auto state = session.state();
    EXPECT_EQ(state.pending_error.value_or(""), "Domain is not allowed: evil.example.net");
    EXPECT_DOUBLE_EQ(state.load_progress, 0.0);

    session.acknowledge_error();
    EXPECT_FALSE(session.state().pending_error.has_value());
}

TEST_F(SurfaceSessionTest, AllowedAndExternalNavigation) {
    EXPECT_EQ(session.decide_navigation("https://www.google.com/search"), NavigationDecision::allow);
    EXPECT_EQ(session.decide_navigation("file:///app/next.html"), NavigationDecision::allow);
    EXPECT_EQ(session.decide_navigation("tel:+15551234"), NavigationDecision::open_externally);
    EXPECT_EQ(session.decide_navigation("javascript:alert(1)"), NavigationDecision::cancel);
    EXPECT_FALSE(session.state().pending_error.has_value());
}

TEST_F(SurfaceSessionTest, HttpErrorStatusRaisesPendingError) {
    EXPECT_EQ(session.on_navigation_response(200), NavigationDecision::allow);
    EXPECT_FALSE(session.state().pending_error.has_value());

    EXPECT_EQ(session.on_navigation_response(404), NavigationDecision::cancel);
    EXPECT_EQ(session.state().pending_error.value_or(""), "HTTP 404 error occurred.");
}

TEST_F(SurfaceSessionTest, NavigationFailureRaisesPendingError) {
    session.on_navigation_failed("The network connection was lost.");
    EXPECT_EQ(session.state().pending_error.value_or(""), "The network connection was lost.");
}

TEST_F(SurfaceSessionTest, ChildSessionHasIndependentState) {
    auto child_sink = std::make_shared<RecordingSink>();
    auto child = session.open_child("popup", child_sink);

    ASSERT_TRUE(post({{"type", "showToast"}, {"callback", "cb"}, {"data", {{"message", "parent"}}}}));
    ASSERT_TRUE(child->receive_message(kLocalOrigin, R"({"type":"greeting","callback":"childCb","data":{"text":"hi"}})"));
    session.flush();
    child->flush();

    EXPECT_EQ(session.state().pending_notification.value_or(""), "parent");
    EXPECT_FALSE(child->state().pending_notification.has_value());

    ASSERT_EQ(sink->replies().size(), 1u);
    EXPECT_EQ(sink->replies()[0].callback, "cb");
    ASSERT_EQ(child_sink->replies().size(), 1u);
    EXPECT_EQ(child_sink->replies()[0].callback, "childCb");
}

TEST_F(SurfaceSessionTest, CloseDropsLaterReplies) {
    session.close();

    EXPECT_TRUE(post({{"type", "showToast"}, {"callback", "cb"}, {"data", {{"message", "late"}}}}));
    session.flush();

    EXPECT_TRUE(sink->replies().empty());
    EXPECT_EQ(session.state().pending_notification.value_or(""), "late");
}
