/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <string>

#include <muniverse/call_context.h>

namespace muniverse
{
    // A connection whose only job is to stay open.
    // The sandbox kills itself when it sees the connection drop, which reaps containers whose
    // controlling process died. Closing it is therefore a termination signal and has to be ordered
    // explicitly; the destructor closes it too but nothing should depend on that.
    class i_liveness_channel
    {
    public:
        virtual ~i_liveness_channel() = default;
        virtual int close() = 0;
        virtual bool is_open() const = 0;
    };

    class i_liveness_connector
    {
    public:
        virtual ~i_liveness_connector() = default;
        virtual int connect(call_context& ctx, const std::string& host, const std::string& port,
                            std::unique_ptr<i_liveness_channel>& channel)
            = 0;
    };

    class tcp_liveness_channel : public i_liveness_channel
    {
        int fd_;

    public:
        explicit tcp_liveness_channel(int fd);
        tcp_liveness_channel(const tcp_liveness_channel&) = delete;
        tcp_liveness_channel& operator=(const tcp_liveness_channel&) = delete;
        ~tcp_liveness_channel() override;

        int close() override;
        bool is_open() const override { return fd_ >= 0; }
    };

    // opens plain tcp connections, bounded by the call deadline
    class tcp_liveness_connector : public i_liveness_connector
    {
    public:
        int connect(call_context& ctx, const std::string& host, const std::string& port,
                    std::unique_ptr<i_liveness_channel>& channel) override;
    };
}
