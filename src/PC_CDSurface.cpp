// =====================================================================================
//
//       Filename:  PC_CDSurface.cpp
//
//    Description:  PC_Surface implemented with a ChartDirector DrawArea
//
//        Version:  1.0
//        Created:  2025-03-05 11:30 AM
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
#include <string>

#include <boost/assert.hpp>

#include "PC_CDSurface.h"

// NOLINTBEGIN
constexpr auto kJPEGQuality = 90;
constexpr const char *kRegularFont = "Arial";
constexpr const char *kBoldFont = "Arial Bold";
// NOLINTEND

static int ToPixel(double value)
{
    return static_cast<int>(std::lround(value));
}

//--------------------------------------------------------------------------------------
//       Class:  PC_CDSurface
//      Method:  PC_CDSurface
// Description:  constructor
//--------------------------------------------------------------------------------------
PC_CDSurface::PC_CDSurface(int32_t width, int32_t height, PC_Color background)
    : area_{std::make_unique<DrawArea>()}, width_{width}, height_{height}
{
    BOOST_ASSERT_MSG(width > 0 && height > 0,
                     std::format("\nSurface size must be positive. Got: {}x{}.", width, height).c_str());
    area_->setSize(width, height, background);
    area_->setAntiAlias(true, Chart::AntiAlias);
}  // -----  end of method PC_CDSurface::PC_CDSurface  (constructor)  -----

PC_Color PC_CDSurface::GetPixel(int32_t x, int32_t y) const
{
    return area_->getPixel(x, y);
}  // -----  end of method PC_CDSurface::GetPixel  -----

std::vector<char> PC_CDSurface::Encode(PC_ImageFormat format) const
{
    MemBlock image;
    switch (format)
    {
        using enum PC_ImageFormat;
        case e_png:
            image = area_->outPNG2();
            break;

        case e_jpeg:
            image = area_->outJPG2(kJPEGQuality);
            break;

        case e_svg:
            image = area_->outSVG2();
            break;
    }
    BOOST_ASSERT_MSG(image.data != nullptr && image.len > 0, "\nChartDirector failed to encode image.");

    return {image.data, image.data + image.len};
}  // -----  end of method PC_CDSurface::Encode  -----

void PC_CDSurface::FillRect(double x, double y, double width, double height, PC_Color fill_color)
{
    const int x1 = ToPixel(x);
    const int y1 = ToPixel(y);
    const int x2 = std::max(x1, ToPixel(x + width) - 1);
    const int y2 = std::max(y1, ToPixel(y + height) - 1);
    area_->rect(x1, y1, x2, y2, fill_color, fill_color);
}  // -----  end of method PC_CDSurface::FillRect  -----

void PC_CDSurface::StrokeRect(double x, double y, double width, double height, PC_Color line_color,
                              int32_t line_width)
{
    const PC_Point top_left{x, y};
    const PC_Point top_right{x + width, y};
    const PC_Point bottom_right{x + width, y + height};
    const PC_Point bottom_left{x, y + height};
    DrawPolyline({top_left, top_right, bottom_right, bottom_left, top_left}, line_color, line_width,
                 PC_LineStyle::e_solid);
}  // -----  end of method PC_CDSurface::StrokeRect  -----

int PC_CDSurface::StyledColor(PC_Color color, PC_LineStyle line_style) const
{
    switch (line_style)
    {
        using enum PC_LineStyle;
        case e_solid:
            return color;

        case e_dashed:
            return area_->dashLineColor(color, Chart::DashLine);

        case e_dotted:
            return area_->dashLineColor(color, Chart::DotLine);
    }
    return color;
}  // -----  end of method PC_CDSurface::StyledColor  -----

void PC_CDSurface::DrawLine(PC_Point from, PC_Point to, PC_Color line_color, int32_t line_width,
                            PC_LineStyle line_style)
{
    area_->line(from.x_, from.y_, to.x_, to.y_, StyledColor(line_color, line_style), line_width);
}  // -----  end of method PC_CDSurface::DrawLine  -----

void PC_CDSurface::DrawPolyline(const std::vector<PC_Point> &points, PC_Color line_color, int32_t line_width,
                                PC_LineStyle line_style)
{
    if (points.size() < 2)
    {
        return;
    }
    const int color = StyledColor(line_color, line_style);
    for (size_t i = 1; i < points.size(); ++i)
    {
        area_->line(points[i - 1].x_, points[i - 1].y_, points[i].x_, points[i].y_, color, line_width);
    }
}  // -----  end of method PC_CDSurface::DrawPolyline  -----

void PC_CDSurface::FillPolygonWith(const std::vector<PC_Point> &points, int fill_color)
{
    if (points.size() < 3)
    {
        return;
    }
    std::vector<double> x_values;
    std::vector<double> y_values;
    x_values.reserve(points.size());
    y_values.reserve(points.size());
    for (const auto &[x, y] : points)
    {
        x_values.push_back(x);
        y_values.push_back(y);
    }
    area_->polygon(DoubleArray(x_values.data(), static_cast<int>(x_values.size())),
                   DoubleArray(y_values.data(), static_cast<int>(y_values.size())), Chart::Transparent,
                   fill_color);
}  // -----  end of method PC_CDSurface::FillPolygonWith  -----

void PC_CDSurface::FillPolygon(const std::vector<PC_Point> &points, PC_Color fill_color)
{
    FillPolygonWith(points, fill_color);
}  // -----  end of method PC_CDSurface::FillPolygon  -----

void PC_CDSurface::FillPolygonVerticalGradient(const std::vector<PC_Point> &points, double y_top, double y_bottom,
                                               PC_Color top_color, PC_Color bottom_color)
{
    const int gradient =
        area_->linearGradientColor(0, ToPixel(y_top), 0, ToPixel(y_bottom), top_color, bottom_color);
    FillPolygonWith(points, gradient);
}  // -----  end of method PC_CDSurface::FillPolygonVerticalGradient  -----

void PC_CDSurface::DrawText(std::string_view text, PC_Point at, const PC_Font &font, PC_Color text_color,
                            PC_TextAlign align)
{
    if (text.empty())
    {
        return;
    }

    // our 'y' is a baseline so anchor on the bottom of the text box.

    int alignment = Chart::BottomLeft;
    if (align == PC_TextAlign::e_center)
    {
        alignment = Chart::Bottom;
    }
    else if (align == PC_TextAlign::e_right)
    {
        alignment = Chart::BottomRight;
    }

    const std::string the_text{text};
    area_->text2(the_text.c_str(), font.bold_ ? kBoldFont : kRegularFont, 0, font.size_, font.size_, 0, false,
                 ToPixel(at.x_), ToPixel(at.y_), text_color, alignment);
}  // -----  end of method PC_CDSurface::DrawText  -----

void PC_CDSurface::DrawSurface(const PC_Surface &source, int32_t x, int32_t y)
{
    // only know how to merge our own kind

    const auto &cd_source = dynamic_cast<const PC_CDSurface &>(source);
    area_->merge(cd_source.area_.get(), x, y, Chart::TopLeft, 0);
}  // -----  end of method PC_CDSurface::DrawSurface  -----
