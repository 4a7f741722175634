// =====================================================================================
//
//       Filename:  PC_PrimaryDrawer.cpp
//
//    Description:  draw the main price shape for each chart type
//
//        Version:  1.0
//        Created:  2025-03-06 08:40 AM
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
#include <format>
#include <stdexcept>

#include "PC_PrimaryDrawer.h"

// NOLINTBEGIN
constexpr double kCandleWidthFraction = 0.8;
constexpr double kBrickWidthFraction = 0.9;
constexpr double kMinBrickWidth = 10;
constexpr int32_t kLineWidth = 2;
constexpr int32_t kBrickOutlineWidth = 2;
constexpr double kAreaFillOpacity = 0.25;
// NOLINTEND

std::unique_ptr<PC_PrimaryDrawer> MakePrimaryDrawer(PC_ChartType chart_type)
{
    switch (chart_type)
    {
        using enum PC_ChartType;
        case e_candlestick:
        case e_heikin_ashi:
            return std::make_unique<PC_CandleDrawer>();

        case e_line:
            return std::make_unique<PC_LineDrawer>();

        case e_area:
            return std::make_unique<PC_AreaDrawer>();

        case e_renko:
        case e_line_break:
            return std::make_unique<PC_BrickDrawer>();
    }
    throw std::invalid_argument(std::format("No drawer for chart type: {}.", static_cast<int32_t>(chart_type)));
}

std::vector<PC_Point> ClosePoints(const PC_Series &series, const PC_DrawContext &context)
{
    std::vector<PC_Point> points;
    points.reserve(series.size());
    for (size_t i = 0; i < series.size(); ++i)
    {
        points.push_back({ToPixelX(i, series.size(), context.dimensions_, PC_XConvention::e_point),
                          ToPixelY(series[i].close_, context.price_range_, context.dimensions_)});
    }
    return points;
}

//--------------------------------------------------------------------------------------
//       Class:  PC_CandleDrawer
//      Method:  PC_CandleDrawer::Draw
// Description:  wick from high to low then the open/close body over it
//--------------------------------------------------------------------------------------
void PC_CandleDrawer::Draw(PC_Surface &surface, const PC_DrawnSeries &drawn, const PC_DrawContext &context) const
{
    const auto &candles = drawn.candles_;
    if (candles.empty())
    {
        return;
    }
    const auto &dims = context.dimensions_;
    const auto &range = context.price_range_;
    const auto &colors = context.colors_;

    const double candle_width = std::max(1.0, SlotWidth(candles.size(), dims) * kCandleWidthFraction);

    for (size_t i = 0; i < candles.size(); ++i)
    {
        const auto &candle = candles[i];
        const double x = ToPixelX(i, candles.size(), dims, PC_XConvention::e_bar);

        const double high_y = ToPixelY(candle.high_, range, dims);
        const double low_y = ToPixelY(candle.low_, range, dims);
        const double open_y = ToPixelY(candle.open_, range, dims);
        const double close_y = ToPixelY(candle.close_, range, dims);

        surface.DrawLine({x, high_y}, {x, low_y}, colors.wick_, 1, PC_LineStyle::e_solid);

        const double body_top = std::min(open_y, close_y);
        const double body_height = std::max(1.0, std::abs(close_y - open_y));
        const double body_left = x - candle_width / 2;

        surface.FillRect(body_left, body_top, candle_width, body_height,
                         candle.IsBullish() ? colors.bullish_ : colors.bearish_);
        if (colors.bar_border_)
        {
            surface.StrokeRect(body_left, body_top, candle_width, body_height, colors.bar_border_.value(), 1);
        }
    }
}  // -----  end of method PC_CandleDrawer::Draw  -----

void PC_LineDrawer::Draw(PC_Surface &surface, const PC_DrawnSeries &drawn, const PC_DrawContext &context) const
{
    if (drawn.candles_.empty())
    {
        return;
    }
    surface.DrawPolyline(ClosePoints(drawn.candles_, context), context.colors_.bullish_, kLineWidth,
                         PC_LineStyle::e_solid);
}  // -----  end of method PC_LineDrawer::Draw  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_AreaDrawer
//      Method:  PC_AreaDrawer::Draw
// Description:  the fill goes down first so the line stays on top of it
//--------------------------------------------------------------------------------------
void PC_AreaDrawer::Draw(PC_Surface &surface, const PC_DrawnSeries &drawn, const PC_DrawContext &context) const
{
    if (drawn.candles_.empty())
    {
        return;
    }
    const auto &dims = context.dimensions_;
    const auto line_points = ClosePoints(drawn.candles_, context);

    auto fill_points = line_points;
    fill_points.push_back({line_points.back().x_, dims.ChartBottom()});
    fill_points.push_back({line_points.front().x_, dims.ChartBottom()});

    const PC_Color line_color = context.colors_.bullish_;
    surface.FillPolygonVerticalGradient(fill_points, dims.margin_.top_, dims.ChartBottom(), line_color,
                                        WithOpacity(line_color, kAreaFillOpacity));
    surface.DrawPolyline(line_points, line_color, kLineWidth, PC_LineStyle::e_solid);
}  // -----  end of method PC_AreaDrawer::Draw  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_BrickDrawer
//      Method:  PC_BrickDrawer::Draw
// Description:  up bricks are filled. Down bricks are filled and outlined.
//--------------------------------------------------------------------------------------
void PC_BrickDrawer::Draw(PC_Surface &surface, const PC_DrawnSeries &drawn, const PC_DrawContext &context) const
{
    const auto &bricks = drawn.bricks_;
    if (bricks.empty())
    {
        return;
    }
    const auto &dims = context.dimensions_;
    const auto &range = context.price_range_;
    const auto &colors = context.colors_;

    const double brick_width = std::max(kMinBrickWidth, SlotWidth(bricks.size(), dims) * kBrickWidthFraction);

    for (size_t i = 0; i < bricks.size(); ++i)
    {
        const auto &brick = bricks[i];
        const double x = ToPixelX(i, bricks.size(), dims, PC_XConvention::e_bar) - brick_width / 2;
        const double top = ToPixelY(brick.high_, range, dims);
        const double height = std::max(1.0, ToPixelY(brick.low_, range, dims) - top);

        if (brick.direction_ > 0)
        {
            surface.FillRect(x, top, brick_width, height, colors.bullish_);
        }
        else
        {
            surface.FillRect(x, top, brick_width, height, colors.bearish_);
            surface.StrokeRect(x, top, brick_width, height, colors.bearish_, kBrickOutlineWidth);
        }
    }
}  // -----  end of method PC_BrickDrawer::Draw  -----
