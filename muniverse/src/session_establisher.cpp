/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <muniverse/internal/error_codes.h>
#include <muniverse/internal/logger.h>
#include <muniverse/session_establisher.h>

namespace muniverse
{
    const devtools_endpoint* select_page_endpoint(const std::vector<devtools_endpoint>& endpoints)
    {
        for (const auto& endpoint : endpoints)
        {
            if (endpoint.type == "page" && !endpoint.websocket_url.empty())
                return &endpoint;
        }
        return nullptr;
    }

    session_establisher::session_establisher(
        std::shared_ptr<i_devtools_client> client, int attempts, std::chrono::milliseconds retry_interval)
        : client_(std::move(client))
        , attempts_(attempts)
        , retry_interval_(retry_interval)
    {
    }

    int session_establisher::attempt(call_context& ctx, const std::string& host, std::unique_ptr<i_devtools_session>& session)
    {
        std::vector<devtools_endpoint> endpoints;
        int err = client_->list_endpoints(ctx, host, endpoints);
        if (err != error::OK())
            return err;

        auto* endpoint = select_page_endpoint(endpoints);
        if (!endpoint)
            return ctx.fail(error::PROTOCOL_CONNECT_ERROR(), "no page endpoint");

        MUNIVERSE_INFO("attempting websocket connection {}", endpoint->websocket_url);
        return client_->connect(ctx, endpoint->websocket_url, session);
    }

    int session_establisher::establish(call_context& ctx, const std::string& host, std::unique_ptr<i_devtools_session>& session)
    {
        if (!client_)
            return ctx.fail(error::CONFIGURATION_ERROR(), "no devtools client");

        for (int i = 0; i < attempts_; i++)
        {
            int err = attempt(ctx, host, session);
            if (err == error::OK())
                return err;
            MUNIVERSE_DEBUG("devtools attempt {} on {} failed: {}", i + 1, host, ctx.message());
            if (i + 1 == attempts_)
                break;

            // keep the attempt's diagnosis if the deadline fires while waiting
            auto last = ctx.message();
            if (ctx.wait_for(retry_interval_) != error::OK())
                return ctx.fail(error::DEADLINE_EXCEEDED(), "context deadline exceeded after: " + last);
        }
        // the trail still holds the last attempt's own error
        return error::PROTOCOL_CONNECT_ERROR();
    }
}
