/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace muniverse
{
    constexpr const char* DEFAULT_IMAGE = "unixpickle/muniverse:0.107.0";
    constexpr const char* DEFAULT_PORT_RANGE = "9000-9999";
    constexpr const char* DEVTOOLS_PORT = "9222/tcp";
    constexpr const char* LIVENESS_PORT = "1337/tcp";

    // how the host reaches ports published by the container
    enum class address_mode
    {
        // published ports are bound on the host, so localhost always works
        published_localhost,
        // the host cannot route to published ports, use the container's own network address
        container_network
    };

#ifdef _WIN32
    constexpr address_mode DEFAULT_ADDRESS_MODE = address_mode::container_network;
#else
    constexpr address_mode DEFAULT_ADDRESS_MODE = address_mode::published_localhost;
#endif

    // Construction-time options for an environment.
    //
    // By default the environment runs inside a container started from custom_image (or DEFAULT_IMAGE),
    // optionally with games_dir mounted as its downloaded_games folder.
    // Alternatively devtools_host names an already running browser and game_host the file server
    // that serves its games; no container is started then.
    struct env_options
    {
        std::string custom_image;
        std::string games_dir;
        std::string devtools_host;
        std::string game_host;

        // allow lossy whole-frame observations
        bool compression = false;
        // 0 to 100 inclusive
        int compression_quality = 80;

        std::chrono::milliseconds call_timeout = std::chrono::minutes(2);
        int connect_attempts = 20;
        std::chrono::milliseconds connect_retry_interval = std::chrono::seconds(1);
        int run_attempts = 3;
        std::string port_range = DEFAULT_PORT_RANGE;
        address_mode addressing = DEFAULT_ADDRESS_MODE;

        bool uses_container() const { return devtools_host.empty(); }
        const std::string& image() const;
    };

    int validate_options(const env_options& options, std::string& error_message);

    int options_from_json(const nlohmann::json& j, env_options& options, std::string& error_message);
}
