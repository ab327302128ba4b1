/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <muniverse/i_devtools.h>

namespace muniverse
{
    // Opens a control session to a freshly started (or externally supplied) browser.
    //
    // A sandboxed browser only answers endpoint listings once its own startup has finished and
    // that moment cannot be observed from outside, so the listing is simply retried.
    class session_establisher
    {
        std::shared_ptr<i_devtools_client> client_;
        int attempts_;
        std::chrono::milliseconds retry_interval_;

        int attempt(call_context& ctx, const std::string& host, std::unique_ptr<i_devtools_session>& session);

    public:
        session_establisher(std::shared_ptr<i_devtools_client> client, int attempts, std::chrono::milliseconds retry_interval);

        // On failure the trail in ctx describes the last underlying error, not a generic timeout,
        // unless the deadline itself fired during a wait.
        int establish(call_context& ctx, const std::string& host, std::unique_ptr<i_devtools_session>& session);
    };

    // the first interactive page with a socket address, or nullptr
    const devtools_endpoint* select_page_endpoint(const std::vector<devtools_endpoint>& endpoints);
}
