/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <cstdint>
#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <muniverse/internal/error_codes.h>
#include <muniverse/telemetry/console_telemetry_service.h>

namespace muniverse
{
    console_telemetry_service::console_telemetry_service() = default;

    console_telemetry_service::~console_telemetry_service()
    {
        if (logger_)
        {
            logger_->flush();
            // remove it from the registry so a later instance at the same address can register again
            spdlog::drop(logger_name_);
            logger_.reset();
        }
    }

    bool console_telemetry_service::create(std::shared_ptr<i_telemetry_service>& service)
    {
        auto console_service = std::make_shared<console_telemetry_service>();
        console_service->init_logger();
        service = console_service;
        return true;
    }

    void console_telemetry_service::init_logger() const
    {
        if (logger_)
            return;
        logger_name_ = "console_telemetry_" + std::to_string(reinterpret_cast<uintptr_t>(this));
        logger_ = spdlog::get(logger_name_);
        if (!logger_)
            logger_ = spdlog::stdout_color_mt(logger_name_);
        // the messages carry their own ANSI colouring
        logger_->set_pattern("%v");
        logger_->set_level(spdlog::level::trace);
    }

    std::string console_telemetry_service::get_environment_name(uint64_t env_id) const
    {
        std::shared_lock lock(environment_names_mutex_);
        auto it = environment_names_.find(env_id);
        if (it != environment_names_.end())
            return "[" + it->second + " = " + std::to_string(env_id) + "]";
        return "[" + std::to_string(env_id) + "]";
    }

    std::string console_telemetry_service::get_environment_color(uint64_t env_id) const
    {
        const char* colors[] = {
            "\033[91m", // Bright Red
            "\033[92m", // Bright Green
            "\033[93m", // Bright Yellow
            "\033[94m", // Bright Blue
            "\033[95m", // Bright Magenta
            "\033[96m", // Bright Cyan
            "\033[97m", // Bright White
            "\033[90m"  // Bright Black (Gray)
        };
        return colors[env_id % 8];
    }

    std::string console_telemetry_service::get_level_color(level_enum level) const
    {
        switch (level)
        {
        case warn:
            return "\033[93m";
        case err:
            return "\033[91m";
        case critical:
            return "\033[95m";
        default:
            return "";
        }
    }

    std::string console_telemetry_service::reset_color() const
    {
        return "\033[0m";
    }

    std::string console_telemetry_service::outcome(int err) const
    {
        if (err == error::OK())
            return "ok";
        return "\033[91mfailed (" + std::string(error::to_string(err)) + ")";
    }

    void console_telemetry_service::on_environment_creation(
        uint64_t env_id, const std::string& name, const std::string& container_id) const
    {
        {
            std::unique_lock lock(environment_names_mutex_);
            environment_names_[env_id] = name;
        }
        init_logger();
        logger_->info("{}{} environment_creation container={}{}",
            get_environment_color(env_id),
            get_environment_name(env_id),
            container_id.empty() ? "<external browser>" : container_id,
            reset_color());
    }

    void console_telemetry_service::on_environment_reset(uint64_t env_id, int err, double initial_score) const
    {
        init_logger();
        logger_->info("{}{} environment_reset {} score={}{}",
            get_environment_color(env_id),
            get_environment_name(env_id),
            outcome(err),
            initial_score,
            reset_color());
    }

    void console_telemetry_service::on_environment_step(
        uint64_t env_id, int err, double reward, bool done, size_t dispatched, size_t dropped) const
    {
        init_logger();
        logger_->info("{}{} environment_step {} reward={} done={} events={} dropped={}{}",
            get_environment_color(env_id),
            get_environment_name(env_id),
            outcome(err),
            reward,
            done,
            dispatched,
            dropped,
            reset_color());
    }

    void console_telemetry_service::on_environment_observe(
        uint64_t env_id, int err, observation_kind kind, size_t size) const
    {
        init_logger();
        logger_->info("{}{} environment_observe {} kind={} bytes={}{}",
            get_environment_color(env_id),
            get_environment_name(env_id),
            outcome(err),
            to_string(kind),
            size,
            reset_color());
    }

    void console_telemetry_service::on_environment_close(uint64_t env_id, int err) const
    {
        init_logger();
        logger_->info("{}{} environment_close {}{}",
            get_environment_color(env_id),
            get_environment_name(env_id),
            outcome(err),
            reset_color());

        std::unique_lock lock(environment_names_mutex_);
        environment_names_.erase(env_id);
    }

    void console_telemetry_service::message(level_enum level, const char* message) const
    {
        init_logger();
        auto color = get_level_color(level);
        switch (level)
        {
        case debug:
            logger_->debug("{}{}", message, reset_color());
            break;
        case trace:
            logger_->trace("{}{}", message, reset_color());
            break;
        case info:
            logger_->info("{}{}", message, reset_color());
            break;
        case warn:
            logger_->warn("{}{}{}", color, message, reset_color());
            break;
        case err:
            logger_->error("{}{}{}", color, message, reset_color());
            break;
        case critical:
            logger_->critical("{}{}{}", color, message, reset_color());
            break;
        default:
            break;
        }
    }
}
