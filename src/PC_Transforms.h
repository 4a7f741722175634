// =====================================================================================
//
//       Filename:  PC_Transforms.h
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

#ifndef PC_TRANSFORMS_INC_
#define PC_TRANSFORMS_INC_

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

#include "PC_Candle.h"

enum class PC_ChartType : int32_t
{
    e_candlestick,
    e_line,
    e_area,
    e_heikin_ashi,
    e_renko,
    e_line_break
};

[[nodiscard]] PC_ChartType ParseChartType(std::string_view chart_type);

struct PC_TransformParams
{
    double renko_brick_pct_ = 0.02;
    int32_t line_break_count_ = 3;
};

// what the primary drawer consumes. Exactly one of the 2 lists is used,
// depending on the chart type.

struct PC_DrawnSeries
{
    PC_ChartType chart_type_ = PC_ChartType::e_candlestick;
    PC_Series candles_;
    PC_BrickSeries bricks_;

    [[nodiscard]] bool UsesBricks() const
    {
        return chart_type_ == PC_ChartType::e_renko || chart_type_ == PC_ChartType::e_line_break;
    }
    [[nodiscard]] size_t size() const { return UsesBricks() ? bricks_.size() : candles_.size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }
};

[[nodiscard]] PC_DrawnSeries TransformSeries(PC_ChartType chart_type, const PC_Series &series,
                                             const PC_TransformParams &params = {});

// each output candle depends on the previous output candle so this is
// strictly left to right.

[[nodiscard]] PC_Series HeikinAshi(const PC_Series &series);

// brick size is a fraction of the running reference price (0.02 == 2%).

[[nodiscard]] PC_BrickSeries Renko(const PC_Series &series, double brick_pct);

// close-only N line break. A new line in the current direction needs a close
// beyond the last line. A reversal needs a close beyond the extreme of the
// last 'line_count' lines.

[[nodiscard]] PC_BrickSeries LineBreak(const PC_Series &series, int32_t line_count);

template <>
struct std::formatter<PC_ChartType> : std::formatter<std::string>
{
    // parse is inherited from formatter<string>.
    auto format(const PC_ChartType &chart_type, std::format_context &ctx) const
    {
        std::string s;
        switch (chart_type)
        {
            using enum PC_ChartType;
            case e_candlestick:
                std::format_to(std::back_inserter(s), "{}", "candlestick");
                break;

            case e_line:
                std::format_to(std::back_inserter(s), "{}", "line");
                break;

            case e_area:
                std::format_to(std::back_inserter(s), "{}", "area");
                break;

            case e_heikin_ashi:
                std::format_to(std::back_inserter(s), "{}", "heikin-ashi");
                break;

            case e_renko:
                std::format_to(std::back_inserter(s), "{}", "renko");
                break;

            case e_line_break:
                std::format_to(std::back_inserter(s), "{}", "line-break");
                break;
        };
        return formatter<std::string>::format(s, ctx);
    }
};

#endif // ----- #ifndef PC_TRANSFORMS_INC_  -----
