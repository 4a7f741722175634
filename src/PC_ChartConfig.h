// =====================================================================================
//
//       Filename:  PC_ChartConfig.h
//
//    Description:  user level chart settings with defaults and validation
//
//        Version:  1.0
//        Created:  2025-03-11 08:15 AM
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

#ifndef PC_CHARTCONFIG_INC_
#define PC_CHARTCONFIG_INC_

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include "PC_RenderOptions.h"
#include "PC_Scaling.h"
#include "utilities.h"

// =====================================================================================
//        Class:  PC_ChartConfig
//  Description:  what the user asked for. Validate() before use, then
//                ToRenderOptions() for the drawing code.
// =====================================================================================
struct PC_ChartConfig
{
    std::string symbol_ = "BTC/USDT";
    std::string timeframe_ = "1h";
    std::string exchange_ = "binance";
    int32_t limit_ = 100;
    fs::path output_path_ = "chart.png";

    int32_t width_ = 1200;
    int32_t height_ = 800;
    std::string theme_ = "dark";
    std::string chart_type_ = "candlestick";

    PC_ScaleConfig scale_;

    PC_BarColors custom_bar_colors_;
    std::vector<PC_HorizontalLevel> levels_;
    std::optional<PC_Color> background_color_;
    std::optional<PC_Color> text_color_;

    // empty means 'SYMBOL TIMEFRAME'
    std::string title_;
    bool show_title_ = true;
    bool show_time_axis_ = true;
    bool show_grid_ = true;

    std::string watermark_;
    std::string watermark_position_ = "bottom-right";
    std::optional<PC_Color> watermark_color_;
    double watermark_size_ = 12;
    double watermark_opacity_ = 0.3;

    bool show_vwap_ = false;
    bool show_ema_ = false;
    bool show_sma_ = false;
    int32_t ema_period_ = 20;
    int32_t sma_period_ = 20;

    double renko_brick_pct_ = 0.02;
    int32_t line_break_count_ = 3;

    // throws PC_ConfigurationError for the first problem found
    void Validate() const;

    [[nodiscard]] PC_RenderOptions ToRenderOptions() const;

    // keys follow the command line option names in camelCase (outputPath, chartType...)
    [[nodiscard]] static PC_ChartConfig FromJSON(const Json::Value &new_data);
};

[[nodiscard]] bool IsValidTimeframe(std::string_view timeframe);

// 'bullish=#00ff88,bearish=#ff4444' -> bar colors. Throws PC_ConfigurationError.
[[nodiscard]] PC_BarColors ParseCustomColors(std::string_view color_list);

// '45000:#ff0000:solid:Resistance,40000:#00ff00:dotted:Support'. Style and label are optional.
// Throws PC_ConfigurationError.
[[nodiscard]] std::vector<PC_HorizontalLevel> ParseLevels(std::string_view level_list);

[[nodiscard]] PC_LineStyle ParseLineStyle(std::string_view line_style);

template <>
struct std::formatter<PC_ChartConfig> : std::formatter<std::string>
{
    // parse is inherited from formatter<string>.
    auto format(const PC_ChartConfig &config, std::format_context &ctx) const
    {
        std::string s;
        std::format_to(std::back_inserter(s), "ChartConfig({}, {}, {}x{}, {}, {})", config.symbol_, config.timeframe_,
                       config.width_, config.height_, config.chart_type_, config.output_path_.string());
        return formatter<std::string>::format(s, ctx);
    }
};

#endif // ----- #ifndef PC_CHARTCONFIG_INC_  -----
