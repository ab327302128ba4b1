/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <muniverse/docker_runtime.h>
#include <muniverse/internal/error_codes.h>
#include <muniverse/internal/logger.h>
#include <muniverse/internal/process_runner.h>

namespace muniverse
{
    namespace
    {
        std::string trim(const std::string& text)
        {
            const char* whitespace = " \t\r\n";
            auto begin = text.find_first_not_of(whitespace);
            if (begin == std::string::npos)
                return {};
            auto end = text.find_last_not_of(whitespace);
            return text.substr(begin, end - begin + 1);
        }

        std::string join(const std::vector<std::string>& args)
        {
            std::string ret;
            for (const auto& arg : args)
            {
                if (!ret.empty())
                    ret += ' ';
                ret += arg;
            }
            return ret;
        }
    }

    docker_runtime::docker_runtime(std::string client)
        : client_(std::move(client))
    {
    }

    int docker_runtime::command(call_context& ctx, const std::vector<std::string>& args, std::string& output)
    {
        process_result result;
        int err = run_process(ctx, client_, args, result);
        if (err != error::OK())
            return err;
        if (result.exit_code != 0)
        {
            auto message = fmt::format("{} {}: exit status {}", client_, join(args), result.exit_code);
            auto stderr_text = trim(result.stderr_text);
            if (!stderr_text.empty())
                message += ": " + stderr_text;
            return ctx.fail(error::RUNTIME_COMMAND_ERROR(), message);
        }
        output = std::move(result.stdout_text);
        return error::OK();
    }

    std::vector<std::string> make_run_arguments(const run_request& request)
    {
        std::vector<std::string> args = {"run"};
        for (const auto& port : request.published_ports)
        {
            args.push_back("-p");
            // docker wants the bare port number on the container side
            auto slash = port.find('/');
            args.push_back(request.port_range + ":" + (slash == std::string::npos ? port : port.substr(0, slash)));
        }
        args.push_back("--shm-size=200m");
        args.push_back("-d");   // detached
        args.push_back("--rm"); // the container deletes itself once killed
        args.push_back("-i");   // keeps stdin open for the liveness listener inside the image
        if (!request.mount_path.empty())
        {
            args.push_back("-v");
            args.push_back(request.mount_path + ":/downloaded_games");
        }
        args.push_back(request.image);
        args.push_back(fmt::format("--window-size={},{}", request.width, request.height));
        return args;
    }

    int docker_runtime::run(call_context& ctx, const run_request& request, std::string& container_id)
    {
        if (request.mount_path.find(':') != std::string::npos)
            return ctx.fail(error::CONFIGURATION_ERROR(), "path contains colons: " + request.mount_path);

        std::string output;
        int err = command(ctx, make_run_arguments(request), output);
        if (err != error::OK())
        {
            if (err == error::RUNTIME_COMMAND_ERROR())
                ctx.fail(err, ctx.message() + " (make sure docker is up-to-date)");
            return ctx.add_context("docker run", err);
        }
        container_id = trim(output);
        if (container_id.empty())
            return ctx.fail(error::RUNTIME_COMMAND_ERROR(), "docker run: no container id printed");
        return error::OK();
    }

    int docker_runtime::inspect(call_context& ctx, const std::string& container_id, container_inspection& inspection)
    {
        std::string output;
        int err = command(ctx, {"inspect", container_id}, output);
        if (err != error::OK())
            return ctx.add_context("docker inspect", err);

        std::string error_message;
        err = parse_inspection(output, inspection, error_message);
        if (err != error::OK())
            return ctx.fail(err, "docker inspect: " + error_message);
        return error::OK();
    }

    int docker_runtime::kill(call_context& ctx, const std::string& container_id)
    {
        std::string output;
        int err = command(ctx, {"kill", container_id}, output);
        return ctx.add_context("docker kill", err);
    }

    int parse_inspection(const std::string& raw_json, container_inspection& inspection, std::string& error_message)
    {
        auto j = nlohmann::json::parse(raw_json, nullptr, false);
        if (j.is_discarded() || !j.is_array())
        {
            error_message = "inspect output is not a json array";
            return error::DISCOVERY_ERROR();
        }

        container_inspection ret;
        try
        {
            for (const auto& item : j)
            {
                container_record record;
                if (!item.contains("NetworkSettings") || item.at("NetworkSettings").is_null())
                {
                    ret.records.push_back(std::move(record));
                    continue;
                }
                const auto& settings = item.at("NetworkSettings");
                if (settings.contains("Ports") && settings.at("Ports").is_object())
                {
                    for (const auto& [internal_port, bindings] : settings.at("Ports").items())
                    {
                        auto& host_ports = record.port_bindings[internal_port];
                        // an unpublished port is reported as null
                        if (!bindings.is_array())
                            continue;
                        for (const auto& binding : bindings)
                            host_ports.push_back(binding.value("HostPort", std::string()));
                    }
                }
                if (settings.contains("Networks") && settings.at("Networks").is_object())
                {
                    for (const auto& [network, info] : settings.at("Networks").items())
                    {
                        record.network_addresses[network] = info.is_object() ? info.value("IPAddress", std::string()) : "";
                    }
                }
                ret.records.push_back(std::move(record));
            }
        }
        catch (const nlohmann::json::exception& e)
        {
            error_message = e.what();
            return error::DISCOVERY_ERROR();
        }
        inspection = std::move(ret);
        return error::OK();
    }
}
