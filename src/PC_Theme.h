// =====================================================================================
//
//       Filename:  PC_Theme.h
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

#ifndef PC_THEME_INC_
#define PC_THEME_INC_

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

// colors are kept in ChartDirector's layout: 0xTTRRGGBB where TT is
// transparency (0 = opaque, 0xFF = invisible).

using PC_Color = int32_t;

// NOLINTBEGIN
constexpr PC_Color kTransparent = static_cast<PC_Color>(0xFF000000);
// NOLINTEND

enum class PC_ThemeName : int32_t
{
    e_dark,
    e_light
};

struct PC_Theme
{
    PC_Color background_;
    PC_Color text_;
    PC_Color grid_;
    PC_Color border_;
    PC_Color watermark_;
    PC_Color bullish_;
    PC_Color bearish_;
    PC_Color wick_;

    [[nodiscard]] static PC_Theme Make(PC_ThemeName name);
};

[[nodiscard]] PC_ThemeName ParseThemeName(std::string_view name);

// accepts '#rgb', '#rrggbb', '#rrggbbaa' (css order, aa is opacity) and a few names.
// throws PC_ConfigurationError for anything else.

[[nodiscard]] PC_Color ParseColor(std::string_view color);

// replace any existing transparency with the one matching 'opacity' (0..1)

[[nodiscard]] PC_Color WithOpacity(PC_Color color, double opacity);

[[nodiscard]] constexpr PC_Color OpaqueColor(PC_Color color)
{
    return color & 0x00FFFFFF;
}

template <>
struct std::formatter<PC_ThemeName> : std::formatter<std::string>
{
    // parse is inherited from formatter<string>.
    auto format(const PC_ThemeName &theme, std::format_context &ctx) const
    {
        std::string s;
        switch (theme)
        {
            using enum PC_ThemeName;
            case e_dark:
                std::format_to(std::back_inserter(s), "{}", "dark");
                break;

            case e_light:
                std::format_to(std::back_inserter(s), "{}", "light");
                break;
        };
        return formatter<std::string>::format(s, ctx);
    }
};

#endif // ----- #ifndef PC_THEME_INC_  -----
