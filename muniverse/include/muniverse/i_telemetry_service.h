/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <muniverse/observation.h>

// copied from spdlog
#define I_TELEMETRY_LEVEL_DEBUG 0
#define I_TELEMETRY_LEVEL_TRACE 1
#define I_TELEMETRY_LEVEL_INFO 2
#define I_TELEMETRY_LEVEL_WARN 3
#define I_TELEMETRY_LEVEL_ERROR 4
#define I_TELEMETRY_LEVEL_CRITICAL 5
#define I_TELEMETRY_LEVEL_OFF 6

namespace muniverse
{
    // Receives lifecycle notifications from environments, keyed by a process unique environment id.
    class i_telemetry_service
    {
    public:
        enum level_enum
        {
            debug = I_TELEMETRY_LEVEL_DEBUG,
            trace = I_TELEMETRY_LEVEL_TRACE,
            info = I_TELEMETRY_LEVEL_INFO,
            warn = I_TELEMETRY_LEVEL_WARN,
            err = I_TELEMETRY_LEVEL_ERROR,
            critical = I_TELEMETRY_LEVEL_CRITICAL,
            off = I_TELEMETRY_LEVEL_OFF,
            n_levels
        };
        virtual ~i_telemetry_service() = default;

        // container_id is empty when attached to an externally managed browser
        virtual void on_environment_creation(uint64_t env_id, const std::string& name, const std::string& container_id) const = 0;
        virtual void on_environment_reset(uint64_t env_id, int err, double initial_score) const = 0;
        virtual void on_environment_step(
            uint64_t env_id, int err, double reward, bool done, size_t dispatched, size_t dropped) const
            = 0;
        virtual void on_environment_observe(uint64_t env_id, int err, observation_kind kind, size_t size) const = 0;
        virtual void on_environment_close(uint64_t env_id, int err) const = 0;

        virtual void message(level_enum level, const char* message) const = 0;
    };

    // process wide service used by environments that were not handed one, may be null
    std::shared_ptr<i_telemetry_service> get_telemetry_service();
    void set_telemetry_service(std::shared_ptr<i_telemetry_service> service);
}
