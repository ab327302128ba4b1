/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>

#include <muniverse/env_spec.h>
#include <muniverse/i_devtools.h>
#include <muniverse/observation.h>

namespace muniverse
{
    enum class capture_strategy
    {
        png_frame,
        png_canvas,
        jpeg_frame
    };

    // compression always wins over canvas capture, it trades fidelity for throughput
    capture_strategy select_capture_strategy(bool all_canvas, bool compression);

    // Script resolving to the base64 png of the first canvas, redrawn at width x height when its own size differs.
    std::string make_canvas_capture_script(int width, int height);

    // Produces one observation per call with a strategy fixed at construction.
    class observation_capturer
    {
        capture_strategy strategy_;
        int width_;
        int height_;
        int quality_;

        int capture_canvas(call_context& ctx, i_devtools_session& session, observation& obs) const;

    public:
        observation_capturer(const env_spec& spec, bool compression, int quality);

        capture_strategy strategy() const { return strategy_; }
        int capture(call_context& ctx, i_devtools_session& session, observation& obs) const;
    };
}
