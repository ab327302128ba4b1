/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <muniverse/env_options.h>
#include <muniverse/i_container_runtime.h>
#include <muniverse/i_devtools.h>
#include <muniverse/liveness_channel.h>
#include <muniverse/session_establisher.h>

namespace muniverse
{
    // "docker run" occasionally fails with this on some hosts, retrying is enough to get past it
    constexpr const char* TRANSIENT_DAEMON_ERROR = "Error response from daemon: device or resource busy.";

    // A running sandbox and the resources needed to reach and reap it.
    struct sandbox_handle
    {
        std::string container_id;
        std::string address;
        // internal port ("9222/tcp") -> host port
        std::map<std::string, std::string> ports;
        std::unique_ptr<i_liveness_channel> liveness;
    };

    struct provision_request
    {
        std::string image;
        std::string mount_path;
        int width = 0;
        int height = 0;
    };

    // The runtime client is not safe to call concurrently, so every instance in the process shares this lock
    std::shared_ptr<std::mutex> global_runtime_lock();

    // Starts sandboxes and finds out how to reach them.
    class sandbox_provisioner
    {
        std::shared_ptr<i_container_runtime> runtime_;
        std::shared_ptr<i_liveness_connector> liveness_connector_;
        std::shared_ptr<std::mutex> runtime_lock_;
        int run_attempts_;
        std::string port_range_;
        address_mode addressing_;
        std::chrono::milliseconds cleanup_timeout_;

        int run_with_retry(call_context& ctx, const provision_request& request, std::string& container_id);
        int discover_ports(call_context& ctx, const std::string& container_id, sandbox_handle& handle);
        int resolve_address(call_context& ctx, const container_record& record, std::string& address);
        void abandon(const std::string& container_id);

        // locked calls into the runtime
        int runtime_run(call_context& ctx, const run_request& request, std::string& container_id);
        int runtime_inspect(call_context& ctx, const std::string& container_id, container_inspection& inspection);

    public:
        sandbox_provisioner(std::shared_ptr<i_container_runtime> runtime,
            std::shared_ptr<i_liveness_connector> liveness_connector,
            std::shared_ptr<std::mutex> runtime_lock,
            const env_options& options);

        // Starts a sandbox, opens a control session to it through establisher, then opens the liveness
        // channel. Any failure after the container started kills it again and closes whatever was opened.
        int provision(call_context& ctx,
            const provision_request& request,
            session_establisher& establisher,
            sandbox_handle& handle,
            std::unique_ptr<i_devtools_session>& session);

        int terminate(call_context& ctx, const std::string& container_id);
    };
}
