/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace muniverse
{
    // standard alphabet with padding; returns false on any other character or a bad length
    bool decode_base64(std::string_view text, std::vector<uint8_t>& out);
}
