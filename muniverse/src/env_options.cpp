/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <muniverse/env_options.h>
#include <muniverse/internal/error_codes.h>

namespace muniverse
{
    const std::string& env_options::image() const
    {
        static const std::string default_image = DEFAULT_IMAGE;
        return custom_image.empty() ? default_image : custom_image;
    }

    int validate_options(const env_options& options, std::string& error_message)
    {
        if (!options.devtools_host.empty() && options.game_host.empty())
        {
            error_message = "must set game_host with devtools_host";
            return error::CONFIGURATION_ERROR();
        }
        if (options.devtools_host.empty() && !options.game_host.empty())
        {
            error_message = "game_host can only be used with devtools_host";
            return error::CONFIGURATION_ERROR();
        }
        if (!options.devtools_host.empty() && (!options.custom_image.empty() || !options.games_dir.empty()))
        {
            error_message = "cannot mix devtools_host with custom_image or games_dir";
            return error::CONFIGURATION_ERROR();
        }
        if (options.compression_quality < 0 || options.compression_quality > 100)
        {
            error_message = "compression_quality must be between 0 and 100";
            return error::CONFIGURATION_ERROR();
        }
        if (options.games_dir.find(':') != std::string::npos)
        {
            error_message = "path contains colons: " + options.games_dir;
            return error::CONFIGURATION_ERROR();
        }
        if (options.connect_attempts < 1 || options.run_attempts < 1)
        {
            error_message = "attempt counts must be positive";
            return error::CONFIGURATION_ERROR();
        }
        if (options.call_timeout <= std::chrono::milliseconds(0))
        {
            error_message = "call_timeout must be positive";
            return error::CONFIGURATION_ERROR();
        }
        if (options.call_timeout > std::chrono::hours(24))
        {
            error_message = "call_timeout must not exceed 24 hours";
            return error::CONFIGURATION_ERROR();
        }
        return error::OK();
    }

    int options_from_json(const nlohmann::json& j, env_options& options, std::string& error_message)
    {
        if (!j.is_object())
        {
            error_message = "options must be a json object";
            return error::INVALID_DATA();
        }
        try
        {
            env_options ret;
            ret.custom_image = j.value("custom_image", ret.custom_image);
            ret.games_dir = j.value("games_dir", ret.games_dir);
            ret.devtools_host = j.value("devtools_host", ret.devtools_host);
            ret.game_host = j.value("game_host", ret.game_host);
            ret.compression = j.value("compression", ret.compression);
            ret.compression_quality = j.value("compression_quality", ret.compression_quality);
            ret.call_timeout = std::chrono::milliseconds(j.value("call_timeout_ms", ret.call_timeout.count()));
            ret.connect_attempts = j.value("connect_attempts", ret.connect_attempts);
            ret.connect_retry_interval
                = std::chrono::milliseconds(j.value("connect_retry_interval_ms", ret.connect_retry_interval.count()));
            ret.run_attempts = j.value("run_attempts", ret.run_attempts);
            ret.port_range = j.value("port_range", ret.port_range);
            if (j.contains("address_mode"))
            {
                auto mode = j.at("address_mode").get<std::string>();
                if (mode == "published_localhost")
                    ret.addressing = address_mode::published_localhost;
                else if (mode == "container_network")
                    ret.addressing = address_mode::container_network;
                else
                {
                    error_message = "unknown address_mode: " + mode;
                    return error::CONFIGURATION_ERROR();
                }
            }

            int err = validate_options(ret, error_message);
            if (err != error::OK())
                return err;
            options = std::move(ret);
            return error::OK();
        }
        catch (const nlohmann::json::exception& e)
        {
            error_message = e.what();
            return error::INVALID_DATA();
        }
    }
}
