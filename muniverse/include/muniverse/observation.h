/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace muniverse
{
    // tells a decoder which codec produced the bytes
    enum class observation_kind
    {
        png_frame,  // lossless whole-frame screenshot
        png_canvas, // lossless capture of the first canvas, sized to the spec
        jpeg_frame  // lossy whole-frame screenshot
    };

    const char* to_string(observation_kind kind);
    const char* mime_type(observation_kind kind);

    class observation
    {
        observation_kind kind_ = observation_kind::png_frame;
        std::vector<uint8_t> data_;

    public:
        observation() = default;
        observation(observation_kind kind, std::vector<uint8_t> data)
            : kind_(kind)
            , data_(std::move(data))
        {
        }

        observation_kind kind() const { return kind_; }
        const std::vector<uint8_t>& data() const { return data_; }

        // hands the encoded bytes to the caller, leaving this observation empty
        std::vector<uint8_t> release_data() { return std::move(data_); }
    };
}
