#include <gtest/gtest.h>

#include "bridge/reducer.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

using nlohmann::json;
using webbridge::Action;
using webbridge::BridgeMessageReceived;
using webbridge::Effect;
using webbridge::ErrorAcknowledged;
using webbridge::ErrorOccurred;
using webbridge::NavigationConsumed;
using webbridge::NotificationConsumed;
using webbridge::ProgressUpdated;
using webbridge::ProtocolState;
using webbridge::Reducer;

namespace {

class ReducerTest : public ::testing::Test {
protected:
    Reducer reducer{std::make_shared<FixedEnvironment>()};
    ProtocolState state;

    Effect receive(const json& envelope) {
        return reducer.reduce(state, BridgeMessageReceived{webbridge::decode_request(envelope)});
    }

    static json rendered(const Effect& effect) {
        return json::parse(effect.render());
    }
};

} // namespace

TEST_F(ReducerTest, ProgressIsLastWriterWinsAndClamped) {
    EXPECT_TRUE(reducer.reduce(state, ProgressUpdated{0.4}).is_none());
    EXPECT_DOUBLE_EQ(state.load_progress, 0.4);

    reducer.reduce(state, ProgressUpdated{0.7});
    EXPECT_DOUBLE_EQ(state.load_progress, 0.7);

    reducer.reduce(state, ProgressUpdated{1.5});
    EXPECT_DOUBLE_EQ(state.load_progress, 1.0);

    reducer.reduce(state, ProgressUpdated{-0.2});
    EXPECT_DOUBLE_EQ(state.load_progress, 0.0);
}

TEST_F(ReducerTest, ErrorResetsProgressAndSetsPendingError) {
    reducer.reduce(state, ProgressUpdated{0.8});

    auto effect = reducer.reduce(state, ErrorOccurred{"HTTP 500 error occurred."});

    EXPECT_TRUE(effect.is_none());
    EXPECT_DOUBLE_EQ(state.load_progress, 0.0);
    EXPECT_EQ(state.pending_error.value_or(""), "HTTP 500 error occurred.");
}

TEST_F(ReducerTest, ConsumptionActionsClearTheirFieldOnly) {
    state.pending_error = "boom";
    state.pending_navigation_target = "https://www.apple.com";
    state.pending_notification = "toast";

    reducer.reduce(state, ErrorAcknowledged{});
    EXPECT_FALSE(state.pending_error.has_value());
    EXPECT_TRUE(state.pending_navigation_target.has_value());
    EXPECT_TRUE(state.pending_notification.has_value());

    reducer.reduce(state, NavigationConsumed{});
    EXPECT_FALSE(state.pending_navigation_target.has_value());
    EXPECT_TRUE(state.pending_notification.has_value());

    reducer.reduce(state, NotificationConsumed{});
    EXPECT_FALSE(state.pending_notification.has_value());
}

TEST_F(ReducerTest, ConsumptionIsIdempotent) {
    const Action consumers[] = {ErrorAcknowledged{}, NavigationConsumed{}, NotificationConsumed{}};
    for (const auto& action : consumers) {
        ProtocolState once;
        once.load_progress = 0.3;
        EXPECT_TRUE(reducer.reduce(once, action).is_none());

        ProtocolState twice = once;
        reducer.reduce(twice, action);
        EXPECT_EQ(once, twice);
    }
}

TEST_F(ReducerTest, GreetingSuccessEchoesText) {
    auto effect = receive({{"type", "greeting"}, {"callback", "cb"}, {"data", {{"text", "Hello"}}}});

    EXPECT_EQ(effect.callback().value_or(""), "cb");
    auto reply = rendered(effect);
    EXPECT_TRUE(reply.at("success").get<bool>());
    EXPECT_FALSE(reply.at("message").get<std::string>().empty());
    EXPECT_EQ(reply.at("data"), (json{{"text", "Hello"}}));
    EXPECT_EQ(state, ProtocolState{});
}

TEST_F(ReducerTest, GreetingWithoutDataFails) {
    auto effect = receive({{"type", "greeting"}, {"callback", "cb"}});

    auto reply = rendered(effect);
    EXPECT_FALSE(reply.at("success").get<bool>());
    EXPECT_FALSE(reply.at("message").get<std::string>().empty());
    EXPECT_FALSE(reply.contains("data"));
}

TEST_F(ReducerTest, GetUserInfoReadsEnvironmentWhenRendered) {
    auto effect = receive({{"type", "getUserInfo"}, {"callback", "receiveUserInfo"}});

    auto reply = rendered(effect);
    EXPECT_TRUE(reply.at("success").get<bool>());
    EXPECT_EQ(reply.at("data"), (json{{"name", "Test User"}, {"device", "TestDevice"}, {"osVersion", "6.1.0"}}));
}

TEST_F(ReducerTest, GetAppVersionReplyCarriesVersionOsAndDevice) {
    auto effect = receive({{"type", "getAppVersion"}, {"callback", "cb"}});

    auto reply = rendered(effect);
    EXPECT_TRUE(reply.at("success").get<bool>());
    EXPECT_EQ(reply.at("data"), (json{{"appVersion", "1.2.3"}, {"osVersion", "6.1.0"}, {"device", "x86_64"}}));
}

TEST_F(ReducerTest, OpenUrlSetsTargetAndReplies) {
    auto effect = receive({{"type", "openUrl"}, {"callback", "cb"}, {"data", {{"url", "https://www.apple.com"}}}});

    EXPECT_EQ(state.pending_navigation_target.value_or(""), "https://www.apple.com");
    auto reply = rendered(effect);
    EXPECT_TRUE(reply.at("success").get<bool>());
    EXPECT_FALSE(reply.contains("data"));
}

TEST_F(ReducerTest, OpenUrlInvalidLeavesStateUntouched) {
    auto effect = receive({{"type", "openUrl"}, {"callback", "cb"}, {"data", {{"url", ""}}}});

    EXPECT_FALSE(state.pending_navigation_target.has_value());
    auto reply = rendered(effect);
    EXPECT_FALSE(reply.at("success").get<bool>());
    EXPECT_FALSE(reply.contains("data"));

    receive({{"type", "openUrl"}, {"callback", "cb"}, {"data", {{"url", "not a url"}}}});
    EXPECT_FALSE(state.pending_navigation_target.has_value());

    receive({{"type", "openUrl"}, {"callback", "cb"}});
    EXPECT_FALSE(state.pending_navigation_target.has_value());
}

TEST_F(ReducerTest, ShowToastSetsNotification) {
    auto effect = receive({{"type", "showToast"}, {"callback", "cb"}, {"data", {{"message", "Saved"}}}});

    EXPECT_EQ(state.pending_notification.value_or(""), "Saved");
    auto reply = rendered(effect);
    EXPECT_TRUE(reply.at("success").get<bool>());
    EXPECT_FALSE(reply.contains("data"));
}

TEST_F(ReducerTest, ShowToastWithoutMessageFails) {
    auto effect = receive({{"type", "showToast"}, {"callback", "cb"}, {"data", json::object()}});

    EXPECT_FALSE(state.pending_notification.has_value());
    EXPECT_FALSE(rendered(effect).at("success").get<bool>());
}

TEST_F(ReducerTest, MissingCallbackStillMutatesState) {
    auto effect = receive({{"type", "showToast"}, {"data", {{"message", "quiet"}}}});

    EXPECT_FALSE(effect.callback().has_value());
    EXPECT_EQ(state.pending_notification.value_or(""), "quiet");
}

TEST_F(ReducerTest, ReduceNeverTouchesEnvironmentOrSink) {
    struct CountingEnvironment final : webbridge::HostEnvironment {
        mutable int calls = 0;
        std::string user_name() const override { ++calls; return "n"; }
        std::string device_model() const override { ++calls; return "d"; }
        std::string os_version() const override { ++calls; return "o"; }
        std::string device_identifier() const override { ++calls; return "i"; }
        std::string app_version() const override { ++calls; return "a"; }
    };
    auto environment = std::make_shared<CountingEnvironment>();
    Reducer counting(environment);
    ProtocolState local;

    auto effect = counting.reduce(
        local, BridgeMessageReceived{webbridge::decode_request(json{{"type", "getAppVersion"}, {"callback", "cb"}})});
    EXPECT_EQ(environment->calls, 0);

    effect.render();
    EXPECT_EQ(environment->calls, 3);
}
