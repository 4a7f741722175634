// =====================================================================================
//
//       Filename:  PC_ChartConfig.cpp
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

#include <algorithm>
#include <array>
#include <charconv>

#include <boost/regex.hpp>

#include "PC_ChartConfig.h"
#include "PC_Errors.h"
#include "PC_Surface.h"
#include "PC_Transforms.h"

// NOLINTBEGIN
constexpr int32_t kMinDimension = 100;
constexpr std::array<std::string_view, 8> kTimeframes{"1m", "5m", "15m", "30m", "1h", "4h", "1d", "1w"};
// NOLINTEND

bool IsValidTimeframe(std::string_view timeframe)
{
    return std::ranges::find(kTimeframes, timeframe) != kTimeframes.end();
}

PC_LineStyle ParseLineStyle(std::string_view line_style)
{
    if (line_style.empty() || line_style == "solid")
    {
        return PC_LineStyle::e_solid;
    }
    if (line_style == "dotted")
    {
        return PC_LineStyle::e_dotted;
    }
    if (line_style == "dashed")
    {
        return PC_LineStyle::e_dashed;
    }
    throw PC_ConfigurationError(
        std::format("Invalid line style: '{}'. Must be 'solid', 'dotted' or 'dashed'.", line_style));
}

PC_BarColors ParseCustomColors(std::string_view color_list)
{
    PC_BarColors colors;
    for (const auto &item : split_string<std::string_view>(color_list, ","))
    {
        const auto parts = split_string<std::string_view>(item, "=");
        if (parts.size() != 2 || trim(parts[0]).empty() || trim(parts[1]).empty())
        {
            throw PC_ConfigurationError(std::format(
                "Invalid custom colors format: '{}'. Use: type=color,type=color (e.g., bullish=#00ff88,bearish=#ff4444)",
                item));
        }
        const auto type = trim(parts[0]);
        const auto color = ParseColor(parts[1]);
        if (type == "bullish")
        {
            colors.bullish_ = color;
        }
        else if (type == "bearish")
        {
            colors.bearish_ = color;
        }
        else if (type == "wick")
        {
            colors.wick_ = color;
        }
        else if (type == "border")
        {
            colors.border_ = color;
        }
        else
        {
            throw PC_ConfigurationError(
                std::format("Unknown custom color: '{}'. Must be one of: bullish, bearish, wick, border.", type));
        }
    }
    return colors;
}

std::vector<PC_HorizontalLevel> ParseLevels(std::string_view level_list)
{
    // value:color[:style[:label]]

    static const boost::regex kLevel{R"***(^\s*(-?[0-9]*\.?[0-9]+)\s*:\s*([^:]+?)\s*(?::\s*([a-z]*)\s*(?::(.*))?)?$)***"};

    std::vector<PC_HorizontalLevel> levels;
    for (const auto &item : split_string<std::string>(level_list, ","))
    {
        boost::smatch m;
        if (!boost::regex_match(item, m, kLevel))
        {
            throw PC_ConfigurationError(std::format(
                "Invalid levels format: '{}'. Use: value:color:style:label,value:color:style:label (e.g., "
                "45000:#ff0000:solid:Resistance,40000:#00ff00:dotted:Support)",
                item));
        }
        const auto value_text = m[1].str();
        double value = 0;
        std::from_chars(value_text.data(), value_text.data() + value_text.size(), value);

        levels.push_back({.value_ = value,
                          .color_ = ParseColor(m[2].str()),
                          .line_style_ = ParseLineStyle(m[3].str()),
                          .label_ = std::string{trim(m[4].str())}});
    }
    return levels;
}

//--------------------------------------------------------------------------------------
//       Class:  PC_ChartConfig
//      Method:  PC_ChartConfig::Validate
// Description:  the same checks whether we came from the command line or a batch file
//--------------------------------------------------------------------------------------
void PC_ChartConfig::Validate() const
{
    if (symbol_.empty() || symbol_.find('/') == std::string::npos)
    {
        throw PC_ConfigurationError(
            std::format("Invalid symbol format: '{}'. Use format: BASE/QUOTE (e.g., BTC/USDT)", symbol_));
    }
    if (!IsValidTimeframe(timeframe_))
    {
        throw PC_ConfigurationError(std::format("Invalid timeframe: {}", timeframe_));
    }

    // these throw for us

    static_cast<void>(ParseChartType(chart_type_));
    static_cast<void>(ParseThemeName(theme_));
    static_cast<void>(ParseWatermarkPosition(watermark_position_));

    if (width_ < kMinDimension || height_ < kMinDimension)
    {
        throw PC_ConfigurationError(std::format("Chart dimensions must be at least {}x{} pixels. Got: {}x{}",
                                                kMinDimension, kMinDimension, width_, height_));
    }
    static_cast<void>(ImageFormatFromPath(output_path_));

    if (limit_ < 1)
    {
        throw PC_ConfigurationError(std::format("Limit must be at least 1. Got: {}", limit_));
    }
    if (ema_period_ < 1 || sma_period_ < 1)
    {
        throw PC_ConfigurationError(
            std::format("Indicator periods must be at least 1. Got EMA: {}, SMA: {}", ema_period_, sma_period_));
    }
    if (renko_brick_pct_ <= 0 || line_break_count_ < 1)
    {
        throw PC_ConfigurationError(std::format("Invalid transform parameters. Renko brick: {}, line break: {}",
                                                renko_brick_pct_, line_break_count_));
    }
    if (watermark_opacity_ < 0 || watermark_opacity_ > 1)
    {
        throw PC_ConfigurationError(
            std::format("Watermark opacity must be between 0 and 1. Got: {}", watermark_opacity_));
    }
}  // -----  end of method PC_ChartConfig::Validate  -----

PC_RenderOptions PC_ChartConfig::ToRenderOptions() const
{
    PC_RenderOptions options{.width_ = width_,
                             .height_ = height_,
                             .margin_ = {},
                             .theme_ = ParseThemeName(theme_),
                             .background_color_ = background_color_,
                             .text_color_ = text_color_,
                             .chart_type_ = ParseChartType(chart_type_),
                             .transform_params_ = {.renko_brick_pct_ = renko_brick_pct_,
                                                   .line_break_count_ = line_break_count_},
                             .bar_colors_ = custom_bar_colors_,
                             .levels_ = levels_,
                             .title_ = title_.empty() ? std::format("{} {}", symbol_, timeframe_) : title_,
                             .show_title_ = show_title_,
                             .show_time_axis_ = show_time_axis_,
                             .show_grid_ = show_grid_,
                             .show_vwap_ = show_vwap_,
                             .show_ema_ = show_ema_,
                             .show_sma_ = show_sma_,
                             .ema_period_ = ema_period_,
                             .sma_period_ = sma_period_,
                             .scale_ = scale_,
                             .watermark_ = {}};

    if (!watermark_.empty())
    {
        options.watermark_ = PC_Watermark{.text_ = watermark_,
                                          .position_ = ParseWatermarkPosition(watermark_position_),
                                          .color_ = watermark_color_,
                                          .font_size_ = watermark_size_,
                                          .opacity_ = watermark_opacity_};
    }
    return options;
}  // -----  end of method PC_ChartConfig::ToRenderOptions  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_ChartConfig
//      Method:  PC_ChartConfig::FromJSON
// Description:  missing keys keep their defaults
//--------------------------------------------------------------------------------------
PC_ChartConfig PC_ChartConfig::FromJSON(const Json::Value &new_data)
{
    if (!new_data.isObject())
    {
        throw PC_ConfigurationError("Chart configuration must be a JSON object.");
    }

    PC_ChartConfig config;

    auto get_string = [&new_data](const char *key, std::string &target)
    {
        if (new_data.isMember(key))
        {
            target = new_data[key].asString();
        }
    };
    auto get_int = [&new_data](const char *key, int32_t &target)
    {
        if (new_data.isMember(key))
        {
            target = new_data[key].asInt();
        }
    };
    auto get_double = [&new_data](const char *key, double &target)
    {
        if (new_data.isMember(key))
        {
            target = new_data[key].asDouble();
        }
    };
    auto get_bool = [&new_data](const char *key, bool &target)
    {
        if (new_data.isMember(key))
        {
            target = new_data[key].asBool();
        }
    };
    auto get_color = [&new_data](const char *key, std::optional<PC_Color> &target)
    {
        if (new_data.isMember(key))
        {
            target = ParseColor(new_data[key].asString());
        }
    };

    try
    {
        get_string("symbol", config.symbol_);
        get_string("timeframe", config.timeframe_);
        get_string("exchange", config.exchange_);
        get_int("limit", config.limit_);
        if (new_data.isMember("outputPath"))
        {
            config.output_path_ = new_data["outputPath"].asString();
        }
        get_int("width", config.width_);
        get_int("height", config.height_);
        get_string("theme", config.theme_);
        get_string("chartType", config.chart_type_);

        get_color("backgroundColor", config.background_color_);
        get_color("textColor", config.text_color_);

        if (new_data.isMember("customBarColors"))
        {
            const auto &colors = new_data["customBarColors"];
            std::string color_list;
            for (const auto &name : colors.getMemberNames())
            {
                color_list += std::format("{}{}={}", color_list.empty() ? "" : ",", name, colors[name].asString());
            }
            config.custom_bar_colors_ = ParseCustomColors(color_list);
        }

        if (new_data.isMember("horizontalLevels"))
        {
            for (const auto &level : new_data["horizontalLevels"])
            {
                config.levels_.push_back({.value_ = level["value"].asDouble(),
                                          .color_ = ParseColor(level.get("color", "#ffffff").asString()),
                                          .line_style_ = ParseLineStyle(level.get("lineStyle", "solid").asString()),
                                          .label_ = level.get("label", "").asString()});
            }
        }

        get_string("title", config.title_);
        get_bool("showTitle", config.show_title_);
        get_bool("showTimeAxis", config.show_time_axis_);
        get_bool("showGrid", config.show_grid_);

        get_bool("showVWAP", config.show_vwap_);
        get_bool("showEMA", config.show_ema_);
        get_int("emaPeriod", config.ema_period_);
        get_bool("showSMA", config.show_sma_);
        get_int("smaPeriod", config.sma_period_);

        get_double("renkoBrickPct", config.renko_brick_pct_);
        get_int("lineBreakCount", config.line_break_count_);

        if (new_data.isMember("scale"))
        {
            const auto &scale = new_data["scale"];
            auto optional_double = [&scale](const char *key, std::optional<double> &target)
            {
                if (scale.isMember(key))
                {
                    target = scale[key].asDouble();
                }
            };
            optional_double("x", config.scale_.x_);
            optional_double("y", config.scale_.y_);
            optional_double("minScale", config.scale_.min_scale_);
            optional_double("maxScale", config.scale_.max_scale_);
            config.scale_.auto_scale_ = scale.get("autoScale", false).asBool();
        }

        // either just the text or the full description

        if (new_data.isMember("watermark"))
        {
            const auto &watermark = new_data["watermark"];
            if (watermark.isString())
            {
                config.watermark_ = watermark.asString();
            }
            else
            {
                config.watermark_ = watermark.get("text", "").asString();
                config.watermark_position_ = watermark.get("position", config.watermark_position_).asString();
                if (watermark.isMember("color"))
                {
                    config.watermark_color_ = ParseColor(watermark["color"].asString());
                }
                config.watermark_size_ = watermark.get("fontSize", config.watermark_size_).asDouble();
                config.watermark_opacity_ = watermark.get("opacity", config.watermark_opacity_).asDouble();
            }
        }
    }
    catch (const Json::Exception &e)
    {
        throw PC_ConfigurationError(std::format("Invalid chart configuration: {}", e.what()));
    }
    return config;
}  // -----  end of method PC_ChartConfig::FromJSON  -----
