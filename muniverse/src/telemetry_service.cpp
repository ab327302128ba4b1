/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <mutex>

#include <muniverse/i_telemetry_service.h>

namespace muniverse
{
    namespace
    {
        std::mutex telemetry_service_mutex;
        std::shared_ptr<i_telemetry_service> telemetry_service_;
    }

    std::shared_ptr<i_telemetry_service> get_telemetry_service()
    {
        std::lock_guard<std::mutex> lock(telemetry_service_mutex);
        return telemetry_service_;
    }

    void set_telemetry_service(std::shared_ptr<i_telemetry_service> service)
    {
        std::lock_guard<std::mutex> lock(telemetry_service_mutex);
        telemetry_service_ = std::move(service);
    }
}
