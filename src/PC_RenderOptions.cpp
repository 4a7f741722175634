// =====================================================================================
//
//       Filename:  PC_RenderOptions.cpp
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

#include <map>

#include "PC_Errors.h"
#include "PC_RenderOptions.h"

// NOLINTBEGIN
// Heikin-Ashi charts get their own palette unless told otherwise
constexpr auto HA_GREEN = 0x4CAF50;
constexpr auto HA_RED = 0xF44336;
constexpr auto HA_GRAY = 0x666666;
// NOLINTEND

PC_WatermarkPosition ParseWatermarkPosition(std::string_view position)
{
    static const std::map<std::string_view, PC_WatermarkPosition> kPositions{
        {"top", PC_WatermarkPosition::e_top},
        {"center", PC_WatermarkPosition::e_center},
        {"bottom", PC_WatermarkPosition::e_bottom},
        {"top-left", PC_WatermarkPosition::e_top_left},
        {"top-right", PC_WatermarkPosition::e_top_right},
        {"bottom-left", PC_WatermarkPosition::e_bottom_left},
        {"bottom-right", PC_WatermarkPosition::e_bottom_right}};

    if (auto found = kPositions.find(position); found != kPositions.end())
    {
        return found->second;
    }
    throw PC_ConfigurationError(std::format(
        "Invalid watermark position: '{}'. Must be one of: top, center, bottom, top-left, top-right, bottom-left, "
        "bottom-right.",
        position));
}

PC_ResolvedColors ResolveColors(const PC_RenderOptions &options)
{
    const auto theme = PC_Theme::Make(options.theme_);

    PC_Color bullish = theme.bullish_;
    PC_Color bearish = theme.bearish_;
    PC_Color wick = theme.wick_;
    if (options.chart_type_ == PC_ChartType::e_heikin_ashi)
    {
        bullish = HA_GREEN;
        bearish = HA_RED;
        wick = HA_GRAY;
    }

    const auto &custom = options.bar_colors_;

    return {.background_ = options.background_color_.value_or(theme.background_),
            .text_ = options.text_color_.value_or(theme.text_),
            .grid_ = theme.grid_,
            .border_ = theme.border_,
            .watermark_ = theme.watermark_,
            .bullish_ = custom.bullish_.value_or(bullish),
            .bearish_ = custom.bearish_.value_or(bearish),
            .wick_ = custom.wick_.value_or(wick),
            .bar_border_ = custom.border_};
}

PC_Dimensions MakeDimensions(const PC_RenderOptions &options)
{
    return {.width_ = options.width_, .height_ = options.height_, .margin_ = options.margin_};
}
