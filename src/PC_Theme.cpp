// =====================================================================================
//
//       Filename:  PC_Theme.cpp
//
//    Description:  colors and theme defaults for chart drawing
//
//        Version:  1.0
//        Created:  2025-03-02 10:52 AM
//       Revision:  none
//       Compiler:  g++
//
//         Author:  David P. Riedel (dpr), driedel@cox.net
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================

/* This file is part of PC_RenderChart. */

/* PC_RenderChart is free software: you can redistribute it and/or modify */
/* it under the terms of the GNU General Public License as published by */
/* the Free Software Foundation, either version 3 of the License, or */
/* (at your option) any later version. */

/* PC_RenderChart is distributed in the hope that it will be useful, */
/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
/* GNU General Public License for more details. */

/* You should have received a copy of the GNU General Public License */
/* along with PC_RenderChart.  If not, see <http://www.gnu.org/licenses/>. */

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <map>

#include "PC_Errors.h"
#include "PC_Theme.h"
#include "utilities.h"

// NOLINTBEGIN
constexpr auto DARK_BACKGROUND = 0x1E222D;
constexpr auto DARK_GRID = 0x2B2B43;
constexpr auto LIGHT_GRID = 0xE1E3E6;
constexpr auto WHITE = 0xFFFFFF;
constexpr auto BLACK = 0x000000;
constexpr auto TEAL = 0x26A69A;
constexpr auto CORAL = 0xEF5350;
constexpr auto DARK_GRAY = 0x424242;
// NOLINTEND

PC_Theme PC_Theme::Make(PC_ThemeName name)
{
    if (name == PC_ThemeName::e_light)
    {
        return {.background_ = WHITE,
                .text_ = BLACK,
                .grid_ = LIGHT_GRID,
                .border_ = LIGHT_GRID,
                .watermark_ = BLACK,
                .bullish_ = TEAL,
                .bearish_ = CORAL,
                .wick_ = DARK_GRAY};
    }
    return {.background_ = DARK_BACKGROUND,
            .text_ = WHITE,
            .grid_ = DARK_GRID,
            .border_ = DARK_GRID,
            .watermark_ = WHITE,
            .bullish_ = TEAL,
            .bearish_ = CORAL,
            .wick_ = DARK_GRAY};
}  // -----  end of method PC_Theme::Make  -----

PC_ThemeName ParseThemeName(std::string_view name)
{
    if (EqualsIgnoreCase(name, "dark"))
    {
        return PC_ThemeName::e_dark;
    }
    if (EqualsIgnoreCase(name, "light"))
    {
        return PC_ThemeName::e_light;
    }
    throw PC_ConfigurationError(std::format("Invalid theme: '{}'. Must be 'dark' or 'light'.", name));
}

PC_Color ParseColor(std::string_view color)
{
    const auto text = trim(color);

    static const std::map<std::string, PC_Color, std::less<>> kNamedColors{
        {"black", BLACK},      {"white", WHITE},       {"red", 0xFF0000},    {"green", 0x008000},
        {"blue", 0x0000FF},    {"yellow", 0xFFFF00},   {"orange", 0xFFA500}, {"gray", 0x808080},
        {"grey", 0x808080},    {"purple", 0x800080},   {"cyan", 0x00FFFF},   {"magenta", 0xFF00FF},
        {"transparent", kTransparent}};

    if (text.empty() || text.front() != '#')
    {
        std::string lower{text};
        std::ranges::for_each(lower, [](char &c) { c = static_cast<char>(std::tolower(c)); });
        if (auto found = kNamedColors.find(lower); found != kNamedColors.end())
        {
            return found->second;
        }
        throw PC_ConfigurationError(std::format("Invalid color: '{}'.", color));
    }

    auto hex = text.substr(1);
    uint32_t value = 0;
    const auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
    if (ec != std::errc{} || ptr != hex.data() + hex.size())
    {
        throw PC_ConfigurationError(std::format("Invalid color: '{}'.", color));
    }

    switch (hex.size())
    {
        case 3:
        {
            // '#abc' is '#aabbcc'
            const uint32_t r = (value >> 8) & 0xF;
            const uint32_t g = (value >> 4) & 0xF;
            const uint32_t b = value & 0xF;
            return static_cast<PC_Color>((r * 0x11) << 16 | (g * 0x11) << 8 | (b * 0x11));
        }
        case 6:
            return static_cast<PC_Color>(value);
        case 8:
        {
            const uint32_t alpha = value & 0xFF;
            return static_cast<PC_Color>(((0xFF - alpha) << 24) | (value >> 8));
        }
        default:
            throw PC_ConfigurationError(std::format("Invalid color: '{}'.", color));
    }
}

PC_Color WithOpacity(PC_Color color, double opacity)
{
    const auto clamped = std::clamp(opacity, 0.0, 1.0);
    const auto transparency = static_cast<uint32_t>(std::lround((1.0 - clamped) * 0xFF));
    return static_cast<PC_Color>((transparency << 24) | static_cast<uint32_t>(OpaqueColor(color)));
}
