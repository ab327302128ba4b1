/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <initializer_list>

#include <fmt/format.h>

#include <muniverse/internal/error_codes.h>
#include <muniverse/internal/logger.h>
#include <muniverse/sandbox_provisioner.h>

namespace muniverse
{
    std::shared_ptr<std::mutex> global_runtime_lock()
    {
        static auto lock = std::make_shared<std::mutex>();
        return lock;
    }

    sandbox_provisioner::sandbox_provisioner(std::shared_ptr<i_container_runtime> runtime,
        std::shared_ptr<i_liveness_connector> liveness_connector,
        std::shared_ptr<std::mutex> runtime_lock,
        const env_options& options)
        : runtime_(std::move(runtime))
        , liveness_connector_(std::move(liveness_connector))
        , runtime_lock_(runtime_lock ? std::move(runtime_lock) : global_runtime_lock())
        , run_attempts_(options.run_attempts)
        , port_range_(options.port_range)
        , addressing_(options.addressing)
        , cleanup_timeout_(options.call_timeout)
    {
    }

    int sandbox_provisioner::runtime_run(call_context& ctx, const run_request& request, std::string& container_id)
    {
        std::lock_guard<std::mutex> lock(*runtime_lock_);
        return runtime_->run(ctx, request, container_id);
    }

    int sandbox_provisioner::runtime_inspect(call_context& ctx, const std::string& container_id, container_inspection& inspection)
    {
        std::lock_guard<std::mutex> lock(*runtime_lock_);
        return runtime_->inspect(ctx, container_id, inspection);
    }

    int sandbox_provisioner::terminate(call_context& ctx, const std::string& container_id)
    {
        std::lock_guard<std::mutex> lock(*runtime_lock_);
        return runtime_->kill(ctx, container_id);
    }

    void sandbox_provisioner::abandon(const std::string& container_id)
    {
        call_context cleanup(cleanup_timeout_);
        if (terminate(cleanup, container_id) != error::OK())
        {
            MUNIVERSE_ERROR("unable to kill container {} after failed provisioning: {}", container_id, cleanup.message());
        }
    }

    int sandbox_provisioner::run_with_retry(call_context& ctx, const provision_request& request, std::string& container_id)
    {
        run_request run;
        run.image = request.image;
        run.mount_path = request.mount_path;
        run.width = request.width;
        run.height = request.height;
        run.published_ports = {DEVTOOLS_PORT, LIVENESS_PORT};
        run.port_range = port_range_;

        MUNIVERSE_INFO("Trying docker run...");
        int err = error::OK();
        for (int i = 0; i < run_attempts_; i++)
        {
            err = runtime_run(ctx, run, container_id);
            if (err == error::OK())
                return err;
            MUNIVERSE_WARNING("run failed {}", ctx.message());
            // only the known daemon quirk is worth another go
            if (ctx.message().find(TRANSIENT_DAEMON_ERROR) == std::string::npos)
                break;
        }
        return err;
    }

    int sandbox_provisioner::discover_ports(call_context& ctx, const std::string& container_id, sandbox_handle& handle)
    {
        container_inspection inspection;
        int err = runtime_inspect(ctx, container_id, inspection);
        if (err != error::OK())
            return err;

        if (inspection.records.size() != 1)
        {
            return ctx.fail(error::DISCOVERY_ERROR(),
                fmt::format("docker inspect: unexpected number of results ({})", inspection.records.size()));
        }
        const auto& record = inspection.records.front();

        std::map<std::string, std::string> ports;
        for (const auto& [internal_port, host_ports] : record.port_bindings)
        {
            if (host_ports.size() != 1)
            {
                return ctx.fail(error::DISCOVERY_ERROR(),
                    fmt::format("docker inspect: unexpected number of host ports for {} ({})", internal_port, host_ports.size()));
            }
            ports[internal_port] = host_ports.front();
        }
        for (const char* required : {DEVTOOLS_PORT, LIVENESS_PORT})
        {
            if (ports.find(required) == ports.end())
                return ctx.fail(error::DISCOVERY_ERROR(), fmt::format("docker inspect: port {} is not published", required));
        }

        err = resolve_address(ctx, record, handle.address);
        if (err != error::OK())
            return err;
        handle.ports = std::move(ports);
        return error::OK();
    }

    int sandbox_provisioner::resolve_address(call_context& ctx, const container_record& record, std::string& address)
    {
        if (addressing_ == address_mode::published_localhost)
        {
            address = "localhost";
            return error::OK();
        }
        for (const char* network : {"bridge", "nat"})
        {
            auto it = record.network_addresses.find(network);
            if (it == record.network_addresses.end())
                continue;
            if (it->second.empty() || it->second == "<no value>")
                continue;
            address = it->second;
            return error::OK();
        }
        return ctx.fail(error::DISCOVERY_ERROR(), "docker inspect: unable to find container IP address");
    }

    int sandbox_provisioner::provision(call_context& ctx,
        const provision_request& request,
        session_establisher& establisher,
        sandbox_handle& handle,
        std::unique_ptr<i_devtools_session>& session)
    {
        std::string container_id;
        int err = run_with_retry(ctx, request, container_id);
        if (err != error::OK())
        {
            if (err == error::CONFIGURATION_ERROR())
                return err;
            return ctx.fail(error::PROVISIONING_ERROR(), ctx.message());
        }

        MUNIVERSE_INFO("Getting ports and address...");
        sandbox_handle result;
        result.container_id = container_id;
        err = discover_ports(ctx, container_id, result);
        if (err != error::OK())
        {
            abandon(container_id);
            if (err == error::DEADLINE_EXCEEDED())
                return ctx.fail(error::PROVISIONING_ERROR(), ctx.message());
            return err;
        }
        MUNIVERSE_INFO("address is: {}", result.address);
        MUNIVERSE_INFO("ports are: {} -> {}, {} -> {}",
            DEVTOOLS_PORT,
            result.ports[DEVTOOLS_PORT],
            LIVENESS_PORT,
            result.ports[LIVENESS_PORT]);

        std::unique_ptr<i_devtools_session> new_session;
        err = establisher.establish(ctx, result.address + ":" + result.ports[DEVTOOLS_PORT], new_session);
        if (err != error::OK())
        {
            MUNIVERSE_ERROR("failed to connect to devtools: {}", ctx.message());
            abandon(container_id);
            if (err == error::DEADLINE_EXCEEDED())
                return ctx.fail(error::PROVISIONING_ERROR(), ctx.message());
            return ctx.add_context("connect to devtools", err);
        }
        MUNIVERSE_INFO("connected to devtools");

        err = liveness_connector_->connect(ctx, result.address, result.ports[LIVENESS_PORT], result.liveness);
        if (err != error::OK())
        {
            MUNIVERSE_ERROR("failed to connect to kill socket: {}", ctx.message());
            auto message = "connect to kill socket: " + ctx.message();
            if (new_session->close() != error::OK())
            {
                MUNIVERSE_ERROR("closing devtools session after kill socket failure also failed");
            }
            abandon(container_id);
            return ctx.fail(error::PROVISIONING_ERROR(), message);
        }

        MUNIVERSE_INFO("created environment!");
        handle = std::move(result);
        session = std::move(new_session);
        return error::OK();
    }
}
