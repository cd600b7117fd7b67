/**
 * @file cancellation_test.cpp
 * @brief Cancellation source/token/registration semantics
 */

#include <gtest/gtest.h>

#include <atomic>

#include "messaging/cancellation.hpp"

namespace {

using namespace agora::messaging;

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.can_be_cancelled());
    EXPECT_FALSE(token.is_cancelled());

    bool called = false;
    auto registration = token.on_cancel([&]() { called = true; });
    EXPECT_FALSE(called);
}

TEST(CancellationTest, CancelRunsRegisteredCallbacksOnce) {
    CancellationSource source;
    auto token = source.token();
    std::atomic<int> calls{0};

    auto registration = token.on_cancel([&]() { calls++; });
    source.cancel();
    source.cancel();

    EXPECT_TRUE(token.is_cancelled());
    EXPECT_TRUE(source.is_cancelled());
    EXPECT_EQ(calls.load(), 1);
}

TEST(CancellationTest, ResetRegistrationIsNotCalled) {
    CancellationSource source;
    std::atomic<int> calls{0};

    {
        auto registration = source.token().on_cancel([&]() { calls++; });
    }
    source.cancel();

    EXPECT_EQ(calls.load(), 0);
}

TEST(CancellationTest, RegisteringAfterCancelDoesNotInvoke) {
    CancellationSource source;
    source.cancel();

    bool called = false;
    auto registration = source.token().on_cancel([&]() { called = true; });
    EXPECT_FALSE(called);
    EXPECT_TRUE(source.token().is_cancelled());
}

TEST(CancellationTest, WaitOptionsHelpers) {
    EXPECT_FALSE(WaitOptions::forever().deadline.has_value());

    auto before = std::chrono::steady_clock::now();
    auto options = WaitOptions::within(std::chrono::milliseconds(50));
    ASSERT_TRUE(options.deadline.has_value());
    EXPECT_GE(*options.deadline, before + std::chrono::milliseconds(50));

    CancellationSource source;
    auto with_cancel = options.with_cancel(source.token());
    EXPECT_EQ(with_cancel.deadline, options.deadline);
    EXPECT_TRUE(with_cancel.cancel.can_be_cancelled());
}

} // namespace
