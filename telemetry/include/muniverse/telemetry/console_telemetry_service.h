/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <muniverse/i_telemetry_service.h>

namespace spdlog
{
    class logger;
}

namespace muniverse
{
    // Writes environment lifecycle events to the console, one colour per environment.
    class console_telemetry_service : public i_telemetry_service
    {
        mutable std::unordered_map<uint64_t, std::string> environment_names_;
        mutable std::shared_mutex environment_names_mutex_;
        mutable std::shared_ptr<spdlog::logger> logger_;
        mutable std::string logger_name_;

        std::string get_environment_name(uint64_t env_id) const;
        std::string get_environment_color(uint64_t env_id) const;
        std::string get_level_color(level_enum level) const;
        std::string reset_color() const;
        std::string outcome(int err) const;
        void init_logger() const;

    public:
        static bool create(std::shared_ptr<i_telemetry_service>& service);

        console_telemetry_service();
        virtual ~console_telemetry_service();
        console_telemetry_service(const console_telemetry_service&) = delete;
        console_telemetry_service& operator=(const console_telemetry_service&) = delete;

        void on_environment_creation(uint64_t env_id, const std::string& name, const std::string& container_id) const override;
        void on_environment_reset(uint64_t env_id, int err, double initial_score) const override;
        void on_environment_step(
            uint64_t env_id, int err, double reward, bool done, size_t dispatched, size_t dropped) const override;
        void on_environment_observe(uint64_t env_id, int err, observation_kind kind, size_t size) const override;
        void on_environment_close(uint64_t env_id, int err) const override;

        void message(level_enum level, const char* message) const override;
    };
}
