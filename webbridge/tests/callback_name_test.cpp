#include <gtest/gtest.h>

#include "bridge/callback_name.hpp"

#include <string>
#include <vector>

using webbridge::is_valid_callback_name;

TEST(CallbackName, AcceptsIdentifiersAndDottedPaths) {
    const std::vector<std::string> names = {
        "callback", "receiveUserInfo", "window.callback", "_private", "$handler", "handler2", "a.b.c$_9",
    };
    for (const auto& name : names) {
        EXPECT_TRUE(is_valid_callback_name(name)) << name;
    }
}

TEST(CallbackName, RejectsAnythingThatCouldLeaveTheCallExpression) {
    const std::vector<std::string> names = {
        "",
        "1callback",
        "alert();void",
        "alert(1)",
        "func name",
        "a\nb",
        "a{b}",
        "a=1",
        "a`b`",
        "a'b",
        "a\"b",
        "a;b",
        ".callback",
        "cb\t",
        "a[0]",
        "a-b",
        "caf\xc3\xa9",
    };
    for (const auto& name : names) {
        EXPECT_FALSE(is_valid_callback_name(name)) << name;
    }
}

TEST(CallbackName, RejectsEmbeddedNul) {
    const std::string name("cb\0alert", 8);
    EXPECT_FALSE(is_valid_callback_name(name));
}
