/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <muniverse/internal/logger.h>

namespace muniverse
{
    namespace
    {
        std::mutex logger_mutex;
        std::shared_ptr<spdlog::logger> logger;
        spdlog::level::level_enum logger_level = spdlog::level::info;

        std::shared_ptr<spdlog::logger> get_logger()
        {
            std::lock_guard<std::mutex> lock(logger_mutex);
            if (!logger)
            {
                const std::string logger_name = "muniverse";
                logger = spdlog::get(logger_name);
                if (!logger)
                {
                    logger = spdlog::stdout_color_mt(logger_name);
                }
                logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
                logger->set_level(logger_level);
            }
            return logger;
        }

        spdlog::level::level_enum to_spdlog_level(int level)
        {
            // the macros put debug below trace, spdlog orders them the other way round
            switch (level)
            {
            case 0:
                return spdlog::level::debug;
            case 1:
                return spdlog::level::trace;
            case 2:
                return spdlog::level::info;
            case 3:
                return spdlog::level::warn;
            case 4:
                return spdlog::level::err;
            case 5:
                return spdlog::level::critical;
            default:
                return spdlog::level::off;
            }
        }
    }

    void set_log_level(int level)
    {
        auto sink = get_logger();
        std::lock_guard<std::mutex> lock(logger_mutex);
        logger_level = to_spdlog_level(level);
        sink->set_level(logger_level);
    }
}

extern "C"
{
    void muniverse_log(int level, const char* str, size_t sz)
    {
        auto logger = muniverse::get_logger();
        logger->log(muniverse::to_spdlog_level(level), "{}", std::string(str, sz));
    }
}
