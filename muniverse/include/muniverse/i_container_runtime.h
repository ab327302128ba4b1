/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <string>
#include <vector>

#include <muniverse/call_context.h>

namespace muniverse
{
    struct run_request
    {
        std::string image;
        // host directory mounted as the container's downloaded_games, empty for none
        std::string mount_path;
        int width = 0;
        int height = 0;
        // internal ports such as "9222/tcp", each published into port_range
        std::vector<std::string> published_ports;
        std::string port_range;
    };

    // one record of an inspection result
    struct container_record
    {
        // internal port -> every host port bound to it
        std::map<std::string, std::vector<std::string>> port_bindings;
        // network name -> reported ip address, possibly empty
        std::map<std::string, std::string> network_addresses;
    };

    struct container_inspection
    {
        std::vector<container_record> records;
    };

    // The run/inspect/kill capability of a container runtime client.
    // Implementations are not required to be thread safe; callers serialise access.
    class i_container_runtime
    {
    public:
        virtual ~i_container_runtime() = default;

        virtual int run(call_context& ctx, const run_request& request, std::string& container_id) = 0;
        virtual int inspect(call_context& ctx, const std::string& container_id, container_inspection& inspection) = 0;
        virtual int kill(call_context& ctx, const std::string& container_id) = 0;
    };
}
