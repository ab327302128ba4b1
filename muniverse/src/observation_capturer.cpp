/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <string_view>

#include <fmt/format.h>

#include <muniverse/internal/base64.h>
#include <muniverse/internal/error_codes.h>
#include <muniverse/observation_capturer.h>

namespace muniverse
{
    capture_strategy select_capture_strategy(bool all_canvas, bool compression)
    {
        if (compression)
            return capture_strategy::jpeg_frame;
        if (all_canvas)
            return capture_strategy::png_canvas;
        return capture_strategy::png_frame;
    }

    std::string make_canvas_capture_script(int width, int height)
    {
        return fmt::format(R"(
        Promise.resolve((function() {{
            var canvas = document.getElementsByTagName('canvas')[0];
            if (!canvas) {{
                return null;
            }}

            // Canvases are often scaled for high density displays or for the
            // largest supported window size.
            var desiredWidth = {0};
            var desiredHeight = {1};
            if (canvas.width !== desiredWidth || canvas.height !== desiredHeight) {{
                var dst = document.createElement('canvas');
                dst.width = desiredWidth;
                dst.height = desiredHeight;
                dst.getContext('2d').drawImage(canvas, 0, 0, desiredWidth, desiredHeight);
                canvas = dst;
            }}

            var prefixLen = 'data:image/png;base64,'.length;
            return canvas.toDataURL('image/png').slice(prefixLen);
        }})());
        )",
            width,
            height);
    }

    observation_capturer::observation_capturer(const env_spec& spec, bool compression, int quality)
        : strategy_(select_capture_strategy(spec.all_canvas, compression))
        , width_(spec.width)
        , height_(spec.height)
        , quality_(quality)
    {
    }

    int observation_capturer::capture_canvas(call_context& ctx, i_devtools_session& session, observation& obs) const
    {
        nlohmann::json result;
        int err = session.evaluate(ctx, make_canvas_capture_script(width_, height_), result);
        if (err != error::OK())
            return err;
        if (result.is_null())
            return ctx.fail(error::EVALUATION_ERROR(), "page has no canvas element");
        if (!result.is_string())
            return ctx.fail(error::EVALUATION_ERROR(), "canvas capture did not produce a string");

        std::string_view encoded = result.get_ref<const std::string&>();
        if (encoded.substr(0, 5) == "data:")
        {
            auto comma = encoded.find(',');
            encoded = comma == std::string_view::npos ? std::string_view() : encoded.substr(comma + 1);
        }

        std::vector<uint8_t> data;
        if (!decode_base64(encoded, data))
            return ctx.fail(error::INVALID_DATA(), "canvas capture is not valid base64");
        obs = observation(observation_kind::png_canvas, std::move(data));
        return error::OK();
    }

    int observation_capturer::capture(call_context& ctx, i_devtools_session& session, observation& obs) const
    {
        std::vector<uint8_t> data;
        int err = error::OK();
        switch (strategy_)
        {
        case capture_strategy::png_canvas:
            return capture_canvas(ctx, session, obs);
        case capture_strategy::png_frame:
            err = session.screenshot(ctx, screenshot_format::png, 0, data);
            if (err != error::OK())
                return err;
            obs = observation(observation_kind::png_frame, std::move(data));
            return error::OK();
        case capture_strategy::jpeg_frame:
            err = session.screenshot(ctx, screenshot_format::jpeg, quality_, data);
            if (err != error::OK())
                return err;
            obs = observation(observation_kind::jpeg_frame, std::move(data));
            return error::OK();
        }
        return ctx.fail(error::INVALID_DATA(), "unknown capture strategy");
    }
}
