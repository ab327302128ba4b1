/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>

#include <muniverse/i_container_runtime.h>

namespace muniverse
{
    // i_container_runtime backed by the docker command line client
    class docker_runtime : public i_container_runtime
    {
        std::string client_;

        int command(call_context& ctx, const std::vector<std::string>& args, std::string& output);

    public:
        explicit docker_runtime(std::string client = "docker");
        docker_runtime(const docker_runtime&) = delete;
        docker_runtime& operator=(const docker_runtime&) = delete;
        ~docker_runtime() override = default;

        int run(call_context& ctx, const run_request& request, std::string& container_id) override;
        int inspect(call_context& ctx, const std::string& container_id, container_inspection& inspection) override;
        int kill(call_context& ctx, const std::string& container_id) override;
    };

    // the argument list for "docker run" without the client name
    std::vector<std::string> make_run_arguments(const run_request& request);

    // parses the json array printed by "docker inspect"
    int parse_inspection(const std::string& raw_json, container_inspection& inspection, std::string& error_message);
}
