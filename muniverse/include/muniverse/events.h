/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace muniverse
{
    enum class mouse_event_type
    {
        pressed,
        released,
        moved
    };

    enum class mouse_button
    {
        none,
        left,
        middle,
        right
    };

    struct mouse_event
    {
        mouse_event_type type = mouse_event_type::moved;
        int x = 0;
        int y = 0;
        mouse_button button = mouse_button::none;
        int click_count = 0;
        int modifiers = 0;
    };

    enum class key_event_type
    {
        down,
        up,
        character
    };

    struct key_event
    {
        key_event_type type = key_event_type::down;
        // physical key, e.g. "ArrowLeft" or "KeyA"; this is what the whitelist is matched against
        std::string code;
        std::string key;
        std::string text;
        int windows_virtual_key_code = 0;
        int native_virtual_key_code = 0;
        int modifiers = 0;
    };

    // std::monostate stands for an event whose kind was never set; dispatching it is an error
    using input_event = std::variant<std::monostate, mouse_event, key_event>;

    const char* to_string(mouse_event_type type);
    const char* to_string(mouse_button button);
    const char* to_string(key_event_type type);

    // Builds an event from {"type": "mouse"|"key", ...}; an unknown type fails with UNSUPPORTED_EVENT
    int event_from_json(const nlohmann::json& j, input_event& event, std::string& error_message);

    // common key events for the arrow and space keys used by most games
    key_event make_key_event(key_event_type type, const std::string& code);
}
