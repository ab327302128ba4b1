/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <limits>
#include <set>
#include <string>

#include "gtest/gtest.h"

#include <muniverse/muniverse.h>

using namespace muniverse;

TEST(error_codes_test, codes_are_distinct_and_in_range)
{
    std::set<int> codes = {error::CONFIGURATION_ERROR(),
        error::PROVISIONING_ERROR(),
        error::DISCOVERY_ERROR(),
        error::PROTOCOL_CONNECT_ERROR(),
        error::NOT_FOUND(),
        error::SEQUENCE_ERROR(),
        error::UNSUPPORTED_EVENT(),
        error::EVALUATION_ERROR(),
        error::DEADLINE_EXCEEDED(),
        error::RUNTIME_COMMAND_ERROR(),
        error::TRANSPORT_ERROR(),
        error::INVALID_DATA()};
    EXPECT_EQ(codes.size(), 12u);
    EXPECT_EQ(codes.count(error::OK()), 0u);
    for (auto code : codes)
    {
        EXPECT_GE(code, error::MIN());
        EXPECT_LE(code, error::MAX());
        EXPECT_STRNE(error::to_string(code), "invalid error code");
    }
    EXPECT_STREQ(error::to_string(error::OK()), "ok");
    EXPECT_STREQ(error::to_string(error::SEQUENCE_ERROR()), "sequence error");
    EXPECT_STREQ(error::to_string(12345), "invalid error code");
}

TEST(error_codes_test, offset_can_be_moved)
{
    error::set_offset_val(1000);
    error::set_offset_val_is_negative(false);
    EXPECT_EQ(error::CONFIGURATION_ERROR(), 1001);
    EXPECT_EQ(error::MAX(), 1012);
    EXPECT_STREQ(error::to_string(1006), "sequence error");
    error::set_offset_val(0);
    error::set_offset_val_is_negative(true);
    EXPECT_EQ(error::CONFIGURATION_ERROR(), -1);
}

TEST(call_context_test, builds_a_readable_trail)
{
    call_context ctx(std::chrono::seconds(1));
    EXPECT_EQ(ctx.add_context("ignored", error::OK()), error::OK());
    EXPECT_TRUE(ctx.message().empty());

    EXPECT_EQ(ctx.fail(error::TRANSPORT_ERROR(), "websocket closed"), error::TRANSPORT_ERROR());
    ctx.add_context("navigate", error::TRANSPORT_ERROR());
    ctx.add_context("reset environment", error::TRANSPORT_ERROR());
    EXPECT_EQ(ctx.message(), "reset environment: navigate: websocket closed");

    ctx.fail(error::NOT_FOUND(), "");
    EXPECT_EQ(ctx.message(), "not found");
    ctx.clear();
    EXPECT_TRUE(ctx.message().empty());
}

TEST(call_context_test, child_shares_the_deadline_only)
{
    call_context ctx(std::chrono::seconds(30));
    ctx.fail(error::TRANSPORT_ERROR(), "broken");
    auto child = ctx.child();
    EXPECT_EQ(child.deadline(), ctx.deadline());
    EXPECT_TRUE(child.message().empty());
    EXPECT_FALSE(child.expired());
    EXPECT_GT(child.remaining(), std::chrono::seconds(20));
}

TEST(call_context_test, wait_stops_at_the_deadline)
{
    call_context ctx(std::chrono::milliseconds(20));
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(ctx.wait_for(std::chrono::seconds(5)), error::DEADLINE_EXCEEDED());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
    EXPECT_TRUE(ctx.expired());
    EXPECT_EQ(ctx.remaining(), std::chrono::milliseconds(0));
    EXPECT_EQ(ctx.check_deadline(), error::DEADLINE_EXCEEDED());
    EXPECT_EQ(ctx.message(), "context deadline exceeded");
}

TEST(call_context_test, short_wait_succeeds)
{
    call_context ctx(std::chrono::seconds(5));
    EXPECT_EQ(ctx.wait_for(std::chrono::milliseconds(1)), error::OK());
    EXPECT_EQ(ctx.check_deadline(), error::OK());
}

TEST(call_context_test, poll_timeout_is_clamped)
{
    call_context longest(std::chrono::hours(24 * 30));
    EXPECT_GT(longest.remaining().count(), std::numeric_limits<int>::max());
    EXPECT_EQ(longest.poll_timeout(), std::numeric_limits<int>::max());

    call_context shorter(std::chrono::seconds(5));
    EXPECT_GT(shorter.poll_timeout(), 0);
    EXPECT_LE(shorter.poll_timeout(), 5000);

    call_context spent(std::chrono::milliseconds(-1));
    EXPECT_EQ(spent.poll_timeout(), 0);
}

TEST(episode_state_test, names)
{
    EXPECT_STREQ(to_string(episode_state::uninitialized), "uninitialized");
    EXPECT_STREQ(to_string(episode_state::ready), "ready");
    EXPECT_STREQ(to_string(episode_state::terminated), "terminated");
    EXPECT_STREQ(to_string(episode_state::closed), "closed");
}
