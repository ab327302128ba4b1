/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fmt/format.h>

#include <muniverse/internal/error_codes.h>
#include <muniverse/internal/logger.h>
#include <muniverse/liveness_channel.h>

namespace muniverse
{
    tcp_liveness_channel::tcp_liveness_channel(int fd)
        : fd_(fd)
    {
    }

    tcp_liveness_channel::~tcp_liveness_channel()
    {
        if (fd_ >= 0)
        {
            MUNIVERSE_WARNING("liveness channel destroyed while still open");
            ::close(fd_);
        }
    }

    int tcp_liveness_channel::close()
    {
        if (fd_ < 0)
            return error::OK();
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0 && errno != EINTR)
            return error::TRANSPORT_ERROR();
        return error::OK();
    }

    namespace
    {
        // non-blocking connect so the deadline can interrupt it
        int connect_one(call_context& ctx, const addrinfo* info, int& out_fd, std::string& error_message)
        {
            int fd = ::socket(info->ai_family, info->ai_socktype | SOCK_CLOEXEC, info->ai_protocol);
            if (fd < 0)
            {
                error_message = std::string("socket: ") + std::strerror(errno);
                return error::TRANSPORT_ERROR();
            }
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            if (::connect(fd, info->ai_addr, info->ai_addrlen) != 0)
            {
                if (errno != EINPROGRESS)
                {
                    error_message = std::string("connect: ") + std::strerror(errno);
                    ::close(fd);
                    return error::TRANSPORT_ERROR();
                }
                pollfd pfd = {fd, POLLOUT, 0};
                int ready = 0;
                do
                {
                    ready = poll(&pfd, 1, ctx.poll_timeout());
                } while (ready < 0 && errno == EINTR);
                if (ready == 0)
                {
                    ::close(fd);
                    error_message = "connect: context deadline exceeded";
                    return error::DEADLINE_EXCEEDED();
                }
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (ready < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0)
                {
                    error_message = std::string("connect: ") + std::strerror(so_error ? so_error : errno);
                    ::close(fd);
                    return error::TRANSPORT_ERROR();
                }
            }
            fcntl(fd, F_SETFL, flags);
            out_fd = fd;
            return error::OK();
        }
    }

    int tcp_liveness_connector::connect(call_context& ctx, const std::string& host, const std::string& port,
                                        std::unique_ptr<i_liveness_channel>& channel)
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* results = nullptr;
        int gai = getaddrinfo(host.c_str(), port.c_str(), &hints, &results);
        if (gai != 0)
        {
            return ctx.fail(error::TRANSPORT_ERROR(), fmt::format("dial tcp {}:{}: {}", host, port, gai_strerror(gai)));
        }

        int err = error::TRANSPORT_ERROR();
        std::string error_message = "no addresses";
        for (auto* info = results; info; info = info->ai_next)
        {
            int fd = -1;
            err = connect_one(ctx, info, fd, error_message);
            if (err == error::OK())
            {
                channel = std::make_unique<tcp_liveness_channel>(fd);
                break;
            }
            if (err == error::DEADLINE_EXCEEDED())
                break;
        }
        freeaddrinfo(results);

        if (err != error::OK())
            return ctx.fail(err, fmt::format("dial tcp {}:{}: {}", host, port, error_message));
        return error::OK();
    }
}
