/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <array>
#include <utility>

#include <muniverse/internal/base64.h>

namespace muniverse
{
    namespace
    {
        constexpr std::array<int8_t, 256> make_table()
        {
            std::array<int8_t, 256> table{};
            for (auto& v : table)
                v = -1;
            const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
            for (int i = 0; i < 64; i++)
                table[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
            return table;
        }

        constexpr auto decode_table = make_table();
    }

    bool decode_base64(std::string_view text, std::vector<uint8_t>& out)
    {
        if (text.size() % 4 != 0)
            return false;

        std::vector<uint8_t> ret;
        ret.reserve(text.size() / 4 * 3);
        for (size_t i = 0; i < text.size(); i += 4)
        {
            uint32_t block = 0;
            int padding = 0;
            for (size_t j = 0; j < 4; j++)
            {
                char c = text[i + j];
                if (c == '=')
                {
                    // padding is only legal in the last two places of the final block
                    if (i + 4 != text.size() || j < 2)
                        return false;
                    padding++;
                    block <<= 6;
                    continue;
                }
                if (padding)
                    return false;
                auto value = decode_table[static_cast<uint8_t>(c)];
                if (value < 0)
                    return false;
                block = (block << 6) | static_cast<uint32_t>(value);
            }
            ret.push_back(static_cast<uint8_t>(block >> 16));
            if (padding < 2)
                ret.push_back(static_cast<uint8_t>(block >> 8));
            if (padding < 1)
                ret.push_back(static_cast<uint8_t>(block));
        }
        out = std::move(ret);
        return true;
    }
}
