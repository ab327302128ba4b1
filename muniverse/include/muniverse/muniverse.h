/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <muniverse/internal/error_codes.h>
#include <muniverse/call_context.h>
#include <muniverse/events.h>
#include <muniverse/observation.h>
#include <muniverse/env_spec.h>
#include <muniverse/env_options.h>
#include <muniverse/i_container_runtime.h>
#include <muniverse/i_devtools.h>
#include <muniverse/i_telemetry_service.h>
#include <muniverse/docker_runtime.h>
#include <muniverse/liveness_channel.h>
#include <muniverse/environment.h>
