/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <muniverse/observation.h>

namespace muniverse
{
    const char* to_string(observation_kind kind)
    {
        switch (kind)
        {
        case observation_kind::png_frame:
            return "png_frame";
        case observation_kind::png_canvas:
            return "png_canvas";
        case observation_kind::jpeg_frame:
            return "jpeg_frame";
        }
        return "png_frame";
    }

    const char* mime_type(observation_kind kind)
    {
        return kind == observation_kind::jpeg_frame ? "image/jpeg" : "image/png";
    }
}
