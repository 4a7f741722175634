// =====================================================================================
//
//       Filename:  PC_RenderOptions.h
//
//    Description:  fully resolved options for drawing 1 chart
//
//        Version:  1.0
//        Created:  2025-03-05 02:10 PM
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

#ifndef PC_RENDEROPTIONS_INC_
#define PC_RENDEROPTIONS_INC_

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "PC_Candle.h"
#include "PC_Scaling.h"
#include "PC_Surface.h"
#include "PC_Theme.h"
#include "PC_Transforms.h"

// anything not given here falls back to the chart type then the theme.

struct PC_BarColors
{
    std::optional<PC_Color> bullish_;
    std::optional<PC_Color> bearish_;
    std::optional<PC_Color> wick_;
    std::optional<PC_Color> border_;
};

struct PC_HorizontalLevel
{
    double value_ = 0;
    PC_Color color_ = 0xFFFFFF;
    PC_LineStyle line_style_ = PC_LineStyle::e_solid;
    std::string label_;
};

enum class PC_WatermarkPosition : int32_t
{
    e_top,
    e_center,
    e_bottom,
    e_top_left,
    e_top_right,
    e_bottom_left,
    e_bottom_right
};

[[nodiscard]] PC_WatermarkPosition ParseWatermarkPosition(std::string_view position);

struct PC_Watermark
{
    std::string text_;
    PC_WatermarkPosition position_ = PC_WatermarkPosition::e_bottom_right;
    std::optional<PC_Color> color_;
    double font_size_ = 12;
    double opacity_ = 0.3;
};

struct PC_RenderOptions
{
    int32_t width_ = 1200;
    int32_t height_ = 800;
    PC_Margin margin_;

    PC_ThemeName theme_ = PC_ThemeName::e_dark;
    std::optional<PC_Color> background_color_;
    std::optional<PC_Color> text_color_;

    PC_ChartType chart_type_ = PC_ChartType::e_candlestick;
    PC_TransformParams transform_params_;
    PC_BarColors bar_colors_;

    std::vector<PC_HorizontalLevel> levels_;

    std::string title_;
    bool show_title_ = true;
    bool show_time_axis_ = true;
    bool show_grid_ = true;

    bool show_vwap_ = false;
    bool show_ema_ = false;
    bool show_sma_ = false;
    int32_t ema_period_ = 20;
    int32_t sma_period_ = 20;

    PC_ScaleConfig scale_;

    std::optional<PC_Watermark> watermark_;
};

// every color the drawing code needs, after applying precedence:
// custom color, then chart type default, then theme.

struct PC_ResolvedColors
{
    PC_Color background_;
    PC_Color text_;
    PC_Color grid_;
    PC_Color border_;
    PC_Color watermark_;
    PC_Color bullish_;
    PC_Color bearish_;
    PC_Color wick_;
    std::optional<PC_Color> bar_border_;
};

[[nodiscard]] PC_ResolvedColors ResolveColors(const PC_RenderOptions &options);

[[nodiscard]] PC_Dimensions MakeDimensions(const PC_RenderOptions &options);

template <>
struct std::formatter<PC_WatermarkPosition> : std::formatter<std::string>
{
    // parse is inherited from formatter<string>.
    auto format(const PC_WatermarkPosition &position, std::format_context &ctx) const
    {
        std::string s;
        switch (position)
        {
            using enum PC_WatermarkPosition;
            case e_top:
                std::format_to(std::back_inserter(s), "{}", "top");
                break;
            case e_center:
                std::format_to(std::back_inserter(s), "{}", "center");
                break;
            case e_bottom:
                std::format_to(std::back_inserter(s), "{}", "bottom");
                break;
            case e_top_left:
                std::format_to(std::back_inserter(s), "{}", "top-left");
                break;
            case e_top_right:
                std::format_to(std::back_inserter(s), "{}", "top-right");
                break;
            case e_bottom_left:
                std::format_to(std::back_inserter(s), "{}", "bottom-left");
                break;
            case e_bottom_right:
                std::format_to(std::back_inserter(s), "{}", "bottom-right");
                break;
        };
        return formatter<std::string>::format(s, ctx);
    }
};

#endif // ----- #ifndef PC_RENDEROPTIONS_INC_  -----
