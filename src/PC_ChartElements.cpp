// =====================================================================================
//
//       Filename:  PC_ChartElements.cpp
//
//    Description:  overlays, levels, grid, axes, title and watermark
//
//        Version:  1.0
//        Created:  2025-03-06 01:15 PM
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

#include "PC_ChartElements.h"
#include "PC_Scaling.h"
#include "utilities.h"

// NOLINTBEGIN
constexpr int32_t kOverlayLineWidth = 2;
constexpr double kOverlayLabelInset = 10;

constexpr int32_t kVerticalGridLines = 11;
constexpr int32_t kHorizontalGridLines = 6;

constexpr int32_t kPriceLabelIntervals = 5;
constexpr int32_t kTimeLabelTarget = 6;
constexpr double kTickLength = 5;
constexpr double kLabelGap = 10;
constexpr double kPriceLabelBaseline = 4;
constexpr double kTimeLabelBaseline = 20;

constexpr PC_Font kLabelFont{.size_ = 11, .bold_ = false};
constexpr PC_Font kOverlayLabelFont{.size_ = 12, .bold_ = false};
constexpr PC_Font kTitleFont{.size_ = 16, .bold_ = true};
constexpr double kTitleBaseline = 30;

constexpr double kWatermarkInset = 20;
// NOLINTEND

void DrawOverlay(PC_Surface &surface, const PC_IndicatorSeries &indicator, size_t first_index, size_t count,
                 PC_XConvention convention, const PC_DrawContext &context, const PC_OverlayStyle &style)
{
    if (indicator.empty())
    {
        return;
    }
    const auto &dims = context.dimensions_;

    std::vector<PC_Point> points;
    points.reserve(indicator.size());
    for (size_t j = 0; j < indicator.size(); ++j)
    {
        points.push_back({ToPixelX(first_index + j, count, dims, convention),
                          ToPixelY(indicator[j].value_, context.price_range_, dims)});
    }
    surface.DrawPolyline(points, style.color_, kOverlayLineWidth, style.line_style_);
    surface.DrawText(style.label_, {dims.margin_.left_ + kOverlayLabelInset, dims.margin_.top_ + style.label_offset_},
                     kOverlayLabelFont, style.color_, PC_TextAlign::e_left);
}

void DrawLevels(PC_Surface &surface, const std::vector<PC_HorizontalLevel> &levels, const PC_DrawContext &context)
{
    const auto &dims = context.dimensions_;
    for (const auto &level : levels)
    {
        const double y = ToPixelY(level.value_, context.price_range_, dims);
        surface.DrawLine({dims.margin_.left_, y}, {dims.width_ - dims.margin_.right_, y}, level.color_, 1,
                         level.line_style_);
        if (!level.label_.empty())
        {
            surface.DrawText(level.label_, {dims.margin_.left_ - kLabelGap, y - kTickLength}, kLabelFont,
                             level.color_, PC_TextAlign::e_right);
        }
    }
}

void DrawGrid(PC_Surface &surface, const PC_DrawContext &context)
{
    const auto &dims = context.dimensions_;
    const PC_Color color = context.colors_.grid_;

    for (int32_t i = 0; i < kVerticalGridLines; ++i)
    {
        const double x = dims.margin_.left_ + dims.ChartWidth() * i / (kVerticalGridLines - 1);
        surface.DrawLine({x, dims.margin_.top_}, {x, dims.ChartBottom()}, color, 1, PC_LineStyle::e_solid);
    }
    for (int32_t i = 0; i < kHorizontalGridLines; ++i)
    {
        const double y = dims.margin_.top_ + dims.ChartHeight() * i / (kHorizontalGridLines - 1);
        surface.DrawLine({dims.margin_.left_, y}, {dims.ChartRight(), y}, color, 1, PC_LineStyle::e_solid);
    }
}

void DrawAxes(PC_Surface &surface, const PC_Series &series, bool show_time_axis, const PC_DrawContext &context)
{
    const auto &dims = context.dimensions_;
    const auto &range = context.price_range_;
    const auto &colors = context.colors_;

    const double left = dims.margin_.left_;
    const double bottom = dims.ChartBottom();

    surface.DrawLine({left, dims.margin_.top_}, {left, bottom}, colors.border_, 1, PC_LineStyle::e_solid);
    surface.DrawLine({left, bottom}, {dims.ChartRight(), bottom}, colors.border_, 1, PC_LineStyle::e_solid);

    // price labels, bottom to top

    for (int32_t i = 0; i <= kPriceLabelIntervals; ++i)
    {
        const double price = range.min_ + range.range_ * i / kPriceLabelIntervals;
        const double y = ToPixelY(price, range, dims);
        surface.DrawLine({left - kTickLength, y}, {left, y}, colors.border_, 1, PC_LineStyle::e_solid);
        surface.DrawText(FormatPrice(price), {left - kLabelGap, y + kPriceLabelBaseline}, kLabelFont, colors.text_,
                         PC_TextAlign::e_right);
    }

    if (!show_time_axis || series.empty())
    {
        return;
    }

    const size_t count = series.size();
    const size_t step = std::max<size_t>(1, count / kTimeLabelTarget);
    for (size_t i = 0; i < count; i += step)
    {
        const double x = count < 2 ? left + dims.ChartWidth() / 2
                                   : left + static_cast<double>(i) / static_cast<double>(count - 1) * dims.ChartWidth();
        surface.DrawLine({x, bottom}, {x, bottom + kTickLength}, colors.border_, 1, PC_LineStyle::e_solid);
        surface.DrawText(FormatTimeLabel(series[i].time_), {x, bottom + kTimeLabelBaseline}, kLabelFont, colors.text_,
                         PC_TextAlign::e_center);
    }
}

void DrawTitle(PC_Surface &surface, const std::string &title, const PC_DrawContext &context)
{
    surface.DrawText(title, {context.dimensions_.width_ / 2.0, kTitleBaseline}, kTitleFont, context.colors_.text_,
                     PC_TextAlign::e_center);
}

PC_TextAnchor WatermarkAnchor(PC_WatermarkPosition position, const PC_Dimensions &dimensions, double font_size)
{
    const double width = dimensions.width_;
    const double height = dimensions.height_;

    // 'y' is a baseline so text at the top needs to come down by its own height

    const double top = kWatermarkInset + font_size;
    const double bottom = height - kWatermarkInset;
    const double left = kWatermarkInset;
    const double right = width - kWatermarkInset;

    switch (position)
    {
        using enum PC_WatermarkPosition;
        case e_top:
            return {{width / 2, top}, PC_TextAlign::e_center};

        case e_center:
            return {{width / 2, height / 2}, PC_TextAlign::e_center};

        case e_bottom:
            return {{width / 2, bottom}, PC_TextAlign::e_center};

        case e_top_left:
            return {{left, top}, PC_TextAlign::e_left};

        case e_top_right:
            return {{right, top}, PC_TextAlign::e_right};

        case e_bottom_left:
            return {{left, bottom}, PC_TextAlign::e_left};

        case e_bottom_right:
            return {{right, bottom}, PC_TextAlign::e_right};
    }
    return {{right, bottom}, PC_TextAlign::e_right};
}

void DrawWatermark(PC_Surface &surface, const PC_Watermark &watermark, const PC_DrawContext &context)
{
    const auto anchor = WatermarkAnchor(watermark.position_, context.dimensions_, watermark.font_size_);
    const PC_Color color = WithOpacity(watermark.color_.value_or(context.colors_.watermark_), watermark.opacity_);
    surface.DrawText(watermark.text_, anchor.at_, PC_Font{.size_ = watermark.font_size_, .bold_ = false}, color,
                     anchor.align_);
}
