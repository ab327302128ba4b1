/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <string>

namespace muniverse
{
    // Deadline and error trail for one externally facing operation.
    //
    // Every public operation creates its own context, so each gets an independent deadline.
    // Layers underneath record the failure text with fail() and callers prefix their own
    // operation name with add_context(), the result reads like "reset environment: navigate: ...".
    class call_context
    {
        std::chrono::steady_clock::time_point deadline_;
        std::string message_;

    public:
        explicit call_context(std::chrono::milliseconds timeout);
        call_context(const call_context&) = default;
        call_context& operator=(const call_context&) = default;

        // a context sharing this deadline but with an empty error trail
        [[nodiscard]] call_context child() const;

        [[nodiscard]] std::chrono::steady_clock::time_point deadline() const { return deadline_; }
        [[nodiscard]] bool expired() const;
        [[nodiscard]] std::chrono::milliseconds remaining() const;
        // remaining() in whole milliseconds, clamped to what poll(2) accepts
        [[nodiscard]] int poll_timeout() const;

        // sleeps for interval, but wakes as soon as the deadline fires and then reports DEADLINE_EXCEEDED
        int wait_for(std::chrono::milliseconds interval);

        // fails with DEADLINE_EXCEEDED if the deadline has already passed
        int check_deadline();

        // replaces the trail with the message of a new underlying failure
        int fail(int err, std::string message);

        // prefixes "operation: " onto the trail of a failed call, OK passes through untouched
        int add_context(const char* operation, int err);

        [[nodiscard]] const std::string& message() const { return message_; }
        void clear() { message_.clear(); }
    };
}
