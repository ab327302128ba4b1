/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <algorithm>
#include <limits>
#include <thread>

#include <muniverse/call_context.h>
#include <muniverse/internal/error_codes.h>

namespace muniverse
{
    call_context::call_context(std::chrono::milliseconds timeout)
        : deadline_(std::chrono::steady_clock::now() + timeout)
    {
    }

    call_context call_context::child() const
    {
        call_context ret(*this);
        ret.message_.clear();
        return ret;
    }

    bool call_context::expired() const
    {
        return std::chrono::steady_clock::now() >= deadline_;
    }

    std::chrono::milliseconds call_context::remaining() const
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    int call_context::poll_timeout() const
    {
        auto left = remaining().count();
        return static_cast<int>(std::min<decltype(left)>(left, std::numeric_limits<int>::max()));
    }

    int call_context::wait_for(std::chrono::milliseconds interval)
    {
        auto wake = std::chrono::steady_clock::now() + interval;
        if (wake >= deadline_)
        {
            std::this_thread::sleep_until(deadline_);
            return fail(error::DEADLINE_EXCEEDED(), "context deadline exceeded");
        }
        std::this_thread::sleep_until(wake);
        return error::OK();
    }

    int call_context::check_deadline()
    {
        if (expired())
            return fail(error::DEADLINE_EXCEEDED(), "context deadline exceeded");
        return error::OK();
    }

    int call_context::fail(int err, std::string message)
    {
        message_ = std::move(message);
        if (message_.empty())
            message_ = error::to_string(err);
        return err;
    }

    int call_context::add_context(const char* operation, int err)
    {
        if (err == error::OK())
            return err;
        if (message_.empty())
            message_ = error::to_string(err);
        message_ = std::string(operation) + ": " + message_;
        return err;
    }
}
