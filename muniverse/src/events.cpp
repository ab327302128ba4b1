/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <initializer_list>
#include <unordered_map>
#include <utility>

#include <muniverse/events.h>
#include <muniverse/internal/error_codes.h>

namespace muniverse
{
    namespace
    {
        struct key_info
        {
            const char* key;
            int virtual_key_code;
        };

        const std::unordered_map<std::string, key_info>& known_keys()
        {
            static const std::unordered_map<std::string, key_info> keys = {
                {"ArrowLeft", {"ArrowLeft", 37}},
                {"ArrowUp", {"ArrowUp", 38}},
                {"ArrowRight", {"ArrowRight", 39}},
                {"ArrowDown", {"ArrowDown", 40}},
                {"Space", {" ", 32}},
                {"Enter", {"Enter", 13}},
                {"Escape", {"Escape", 27}},
            };
            return keys;
        }

        template<class Enum>
        bool parse_enum(const nlohmann::json& j, const char* field, std::initializer_list<std::pair<const char*, Enum>> names,
                        Enum& out, std::string& error_message)
        {
            if (!j.contains(field))
                return true;
            const auto& value = j.at(field);
            if (!value.is_string())
            {
                error_message = std::string("field '") + field + "' must be a string";
                return false;
            }
            auto text = value.get<std::string>();
            for (const auto& [name, e] : names)
            {
                if (text == name)
                {
                    out = e;
                    return true;
                }
            }
            error_message = std::string("unknown value '") + text + "' for field '" + field + "'";
            return false;
        }
    }

    const char* to_string(mouse_event_type type)
    {
        switch (type)
        {
        case mouse_event_type::pressed:
            return "mousePressed";
        case mouse_event_type::released:
            return "mouseReleased";
        case mouse_event_type::moved:
            return "mouseMoved";
        }
        return "mouseMoved";
    }

    const char* to_string(mouse_button button)
    {
        switch (button)
        {
        case mouse_button::none:
            return "none";
        case mouse_button::left:
            return "left";
        case mouse_button::middle:
            return "middle";
        case mouse_button::right:
            return "right";
        }
        return "none";
    }

    const char* to_string(key_event_type type)
    {
        switch (type)
        {
        case key_event_type::down:
            return "keyDown";
        case key_event_type::up:
            return "keyUp";
        case key_event_type::character:
            return "char";
        }
        return "keyDown";
    }

    key_event make_key_event(key_event_type type, const std::string& code)
    {
        key_event ret;
        ret.type = type;
        ret.code = code;
        auto it = known_keys().find(code);
        if (it != known_keys().end())
        {
            ret.key = it->second.key;
            ret.windows_virtual_key_code = it->second.virtual_key_code;
            ret.native_virtual_key_code = it->second.virtual_key_code;
        }
        return ret;
    }

    int event_from_json(const nlohmann::json& j, input_event& event, std::string& error_message)
    {
        if (!j.is_object() || !j.contains("type") || !j.at("type").is_string())
        {
            error_message = "event must be an object with a string 'type'";
            return error::INVALID_DATA();
        }

        try
        {
            auto kind = j.at("type").get<std::string>();
            if (kind == "mouse")
            {
                mouse_event ev;
                if (!parse_enum<mouse_event_type>(j,
                        "event",
                        {{"mousePressed", mouse_event_type::pressed},
                            {"mouseReleased", mouse_event_type::released},
                            {"mouseMoved", mouse_event_type::moved}},
                        ev.type,
                        error_message))
                    return error::INVALID_DATA();
                if (!parse_enum<mouse_button>(j,
                        "button",
                        {{"none", mouse_button::none},
                            {"left", mouse_button::left},
                            {"middle", mouse_button::middle},
                            {"right", mouse_button::right}},
                        ev.button,
                        error_message))
                    return error::INVALID_DATA();
                ev.x = j.value("x", 0);
                ev.y = j.value("y", 0);
                ev.click_count = j.value("click_count", 0);
                ev.modifiers = j.value("modifiers", 0);
                event = ev;
                return error::OK();
            }
            if (kind == "key")
            {
                if (!j.contains("code") || !j.at("code").is_string())
                {
                    error_message = "key event needs a string 'code'";
                    return error::INVALID_DATA();
                }
                key_event_type type = key_event_type::down;
                if (!parse_enum<key_event_type>(j,
                        "event",
                        {{"keyDown", key_event_type::down},
                            {"keyUp", key_event_type::up},
                            {"char", key_event_type::character}},
                        type,
                        error_message))
                    return error::INVALID_DATA();
                auto ev = make_key_event(type, j.at("code").get<std::string>());
                ev.key = j.value("key", ev.key);
                ev.text = j.value("text", ev.text);
                ev.modifiers = j.value("modifiers", 0);
                event = ev;
                return error::OK();
            }
            error_message = "unsupported event type: " + kind;
            return error::UNSUPPORTED_EVENT();
        }
        catch (const nlohmann::json::exception& e)
        {
            error_message = e.what();
            return error::INVALID_DATA();
        }
    }
}
