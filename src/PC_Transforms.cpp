// =====================================================================================
//
//       Filename:  PC_Transforms.cpp
//
//    Description:  turn a raw candle series into the series actually drawn
//
//        Version:  1.0
//        Created:  2025-03-04 09:05 AM
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
#include <cmath>
#include <map>
#include <ranges>

namespace rng = std::ranges;
namespace vws = std::ranges::views;

#include <boost/assert.hpp>

#include "PC_Errors.h"
#include "PC_Transforms.h"

PC_ChartType ParseChartType(std::string_view chart_type)
{
    static const std::map<std::string_view, PC_ChartType> kChartTypes{{"candlestick", PC_ChartType::e_candlestick},
                                                                      {"line", PC_ChartType::e_line},
                                                                      {"area", PC_ChartType::e_area},
                                                                      {"heikin-ashi", PC_ChartType::e_heikin_ashi},
                                                                      {"renko", PC_ChartType::e_renko},
                                                                      {"line-break", PC_ChartType::e_line_break}};

    if (auto found = kChartTypes.find(chart_type); found != kChartTypes.end())
    {
        return found->second;
    }
    throw PC_ConfigurationError(std::format(
        "Invalid chart type: '{}'. Must be one of: candlestick, line, area, heikin-ashi, renko, line-break.",
        chart_type));
}

PC_DrawnSeries TransformSeries(PC_ChartType chart_type, const PC_Series &series, const PC_TransformParams &params)
{
    PC_DrawnSeries result{.chart_type_ = chart_type};

    switch (chart_type)
    {
        using enum PC_ChartType;
        case e_candlestick:
        case e_line:
        case e_area:
            result.candles_ = series;
            break;

        case e_heikin_ashi:
            result.candles_ = HeikinAshi(series);
            break;

        case e_renko:
            result.bricks_ = Renko(series, params.renko_brick_pct_);
            break;

        case e_line_break:
            result.bricks_ = LineBreak(series, params.line_break_count_);
            break;
    }
    return result;
}

PC_Series HeikinAshi(const PC_Series &series)
{
    PC_Series ha;
    if (series.empty())
    {
        return ha;
    }
    ha.reserve(series.size());

    ha.push_back(series.front());

    for (const auto &candle : series | vws::drop(1))
    {
        const auto &prev = ha.back();

        const double ha_close = (candle.open_ + candle.high_ + candle.low_ + candle.close_) / 4;
        const double ha_open = (prev.open_ + prev.close_) / 2;

        ha.push_back(PC_Candle{.time_ = candle.time_,
                               .open_ = ha_open,
                               .high_ = std::max({candle.high_, ha_open, ha_close}),
                               .low_ = std::min({candle.low_, ha_open, ha_close}),
                               .close_ = ha_close,
                               .volume_ = candle.volume_});
    }
    return ha;
}

PC_BrickSeries Renko(const PC_Series &series, double brick_pct)
{
    BOOST_ASSERT_MSG(brick_pct > 0, std::format("\nRenko brick size must be > 0. Got: {}.", brick_pct).c_str());

    PC_BrickSeries bricks;
    if (series.empty())
    {
        return bricks;
    }

    double current_price = series.front().close_;

    for (const auto &candle : series | vws::drop(1))
    {
        if (current_price == 0)
        {
            // can't measure a percent move from 0. Restart from here.
            current_price = candle.close_;
            continue;
        }
        const double price_change = candle.close_ - current_price;
        const double price_change_pct = std::abs(price_change / current_price);
        if (price_change_pct < brick_pct)
        {
            continue;
        }

        const auto bricks_needed = static_cast<int64_t>(std::floor(price_change_pct / brick_pct));
        const int32_t direction = price_change > 0 ? 1 : -1;

        for (int64_t i = 0; i < bricks_needed; ++i)
        {
            const double new_price = current_price + direction * brick_pct * current_price;
            bricks.push_back(PC_Brick{.time_ = candle.time_,
                                      .open_ = current_price,
                                      .high_ = std::max(current_price, new_price),
                                      .low_ = std::min(current_price, new_price),
                                      .close_ = new_price,
                                      .direction_ = direction});
            current_price = new_price;
        }
    }
    return bricks;
}

PC_BrickSeries LineBreak(const PC_Series &series, int32_t line_count)
{
    BOOST_ASSERT_MSG(line_count > 0, std::format("\nLine break count must be > 0. Got: {}.", line_count).c_str());

    PC_BrickSeries lines;
    if (series.empty())
    {
        return lines;
    }

    auto add_line = [&lines](int64_t the_time, double from, double to)
    {
        lines.push_back(PC_Brick{.time_ = the_time,
                                 .open_ = from,
                                 .high_ = std::max(from, to),
                                 .low_ = std::min(from, to),
                                 .close_ = to,
                                 .direction_ = to > from ? 1 : -1});
    };

    const double first_close = series.front().close_;

    for (const auto &candle : series | vws::drop(1))
    {
        const double close = candle.close_;

        if (lines.empty())
        {
            // need some movement before we know which way the first line goes
            if (close != first_close)
            {
                add_line(candle.time_, first_close, close);
            }
            continue;
        }

        const auto &last = lines.back();
        const auto lookback = std::min(lines.size(), static_cast<size_t>(line_count));
        auto recent = lines | vws::drop(lines.size() - lookback);

        if (last.direction_ > 0)
        {
            if (close > last.high_)
            {
                add_line(candle.time_, last.high_, close);
            }
            else if (close < rng::min(recent | vws::transform(&PC_Brick::low_)))
            {
                add_line(candle.time_, last.low_, close);
            }
        }
        else
        {
            if (close < last.low_)
            {
                add_line(candle.time_, last.low_, close);
            }
            else if (close > rng::max(recent | vws::transform(&PC_Brick::high_)))
            {
                add_line(candle.time_, last.high_, close);
            }
        }
    }
    return lines;
}
