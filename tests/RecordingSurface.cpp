// =====================================================================================
//
//       Filename:  RecordingSurface.cpp
//
//    Description:  PC_Surface that remembers what was drawn instead of drawing it
//
//        Version:  1.0
//        Created:  2025-03-13 10:00 AM
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
#include <format>
#include <iterator>
#include <ranges>

namespace rng = std::ranges;

#include "RecordingSurface.h"

PC_Color PC_RecordingSurface::GetPixel(int32_t x, int32_t y) const
{
    // last rect fill covering the point wins. Good enough for backgrounds.

    for (const auto &call : calls_ | std::views::reverse)
    {
        if (call.kind_ != Kind::e_fill_rect)
        {
            continue;
        }
        const auto &origin = call.points_[0];
        const auto &size = call.points_[1];
        if (x >= origin.x_ && x < origin.x_ + size.x_ && y >= origin.y_ && y < origin.y_ + size.y_)
        {
            return call.color_;
        }
    }
    return 0;
}

std::vector<char> PC_RecordingSurface::Encode(PC_ImageFormat format) const
{
    const auto summary = std::format("{} {} {}", static_cast<int32_t>(format), calls_.size(), width_ * height_);
    return {summary.begin(), summary.end()};
}

void PC_RecordingSurface::FillRect(double x, double y, double width, double height, PC_Color fill_color)
{
    calls_.push_back({.kind_ = Kind::e_fill_rect, .points_ = {{x, y}, {width, height}}, .color_ = fill_color});
}

void PC_RecordingSurface::StrokeRect(double x, double y, double width, double height, PC_Color line_color,
                                     int32_t line_width)
{
    calls_.push_back({.kind_ = Kind::e_stroke_rect,
                      .points_ = {{x, y}, {width, height}},
                      .color_ = line_color,
                      .line_width_ = line_width});
}

void PC_RecordingSurface::DrawLine(PC_Point from, PC_Point to, PC_Color line_color, int32_t line_width,
                                   PC_LineStyle line_style)
{
    calls_.push_back({.kind_ = Kind::e_line,
                      .points_ = {from, to},
                      .color_ = line_color,
                      .line_width_ = line_width,
                      .line_style_ = line_style});
}

void PC_RecordingSurface::DrawPolyline(const std::vector<PC_Point> &points, PC_Color line_color, int32_t line_width,
                                       PC_LineStyle line_style)
{
    calls_.push_back({.kind_ = Kind::e_polyline,
                      .points_ = points,
                      .color_ = line_color,
                      .line_width_ = line_width,
                      .line_style_ = line_style});
}

void PC_RecordingSurface::FillPolygon(const std::vector<PC_Point> &points, PC_Color fill_color)
{
    calls_.push_back({.kind_ = Kind::e_polygon, .points_ = points, .color_ = fill_color});
}

void PC_RecordingSurface::FillPolygonVerticalGradient(const std::vector<PC_Point> &points, double y_top,
                                                      double y_bottom, PC_Color top_color, PC_Color bottom_color)
{
    auto all_points = points;
    all_points.push_back({0, y_top});
    all_points.push_back({0, y_bottom});
    calls_.push_back({.kind_ = Kind::e_gradient_polygon,
                      .points_ = all_points,
                      .color_ = top_color,
                      .second_color_ = bottom_color});
}

void PC_RecordingSurface::DrawText(std::string_view text, PC_Point at, const PC_Font &font, PC_Color text_color,
                                   PC_TextAlign align)
{
    calls_.push_back({.kind_ = Kind::e_text,
                      .points_ = {at},
                      .color_ = text_color,
                      .text_ = std::string{text},
                      .font_ = font,
                      .align_ = align});
}

void PC_RecordingSurface::DrawSurface(const PC_Surface &source, int32_t x, int32_t y)
{
    calls_.push_back({.kind_ = Kind::e_surface,
                      .points_ = {{static_cast<double>(x), static_cast<double>(y)},
                                  {static_cast<double>(source.GetWidth()), static_cast<double>(source.GetHeight())}}});
}

std::vector<PC_RecordedCall> PC_RecordingSurface::CallsOfKind(Kind kind) const
{
    std::vector<PC_RecordedCall> result;
    rng::copy_if(calls_, std::back_inserter(result), [kind](const auto &call) { return call.kind_ == kind; });
    return result;
}

std::vector<std::string> PC_RecordingSurface::Texts() const
{
    std::vector<std::string> result;
    for (const auto &call : calls_)
    {
        if (call.kind_ == Kind::e_text)
        {
            result.push_back(call.text_);
        }
    }
    return result;
}
