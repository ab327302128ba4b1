/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <muniverse/call_context.h>
#include <muniverse/events.h>

namespace muniverse
{
    // one control surface listed by a browser's remote debugging server
    struct devtools_endpoint
    {
        std::string id;
        std::string type; // "page", "background_page", "service_worker", ...
        std::string title;
        std::string url;
        std::string websocket_url;
    };

    enum class navigation_wait
    {
        load,  // returns once the page has fully loaded
        commit // returns as soon as the navigation is committed
    };

    enum class screenshot_format
    {
        png,
        jpeg
    };

    // An open remote debugging connection to a single page.
    class i_devtools_session
    {
    public:
        virtual ~i_devtools_session() = default;

        virtual int navigate(call_context& ctx, const std::string& url, navigation_wait wait) = 0;
        // evaluates script, awaits the promise it produces and stores the resolved value in result
        virtual int evaluate(call_context& ctx, const std::string& script, nlohmann::json& result) = 0;
        virtual int dispatch_mouse_event(call_context& ctx, const mouse_event& event) = 0;
        virtual int dispatch_key_event(call_context& ctx, const key_event& event) = 0;
        // quality is only used for jpeg
        virtual int screenshot(call_context& ctx, screenshot_format format, int quality, std::vector<uint8_t>& data) = 0;
        // copy of the console and network diagnostics gathered so far
        virtual std::vector<std::string> console_log() const = 0;
        virtual int close() = 0;
    };

    // Discovers and connects to control surfaces of a remote debugging server at host:port.
    class i_devtools_client
    {
    public:
        virtual ~i_devtools_client() = default;

        virtual int list_endpoints(call_context& ctx, const std::string& host, std::vector<devtools_endpoint>& endpoints)
            = 0;
        virtual int connect(call_context& ctx, const std::string& websocket_url, std::unique_ptr<i_devtools_session>& session)
            = 0;
    };
}
