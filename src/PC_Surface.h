// =====================================================================================
//
//       Filename:  PC_Surface.h
//
//    Description:  abstract raster surface the chart pipeline draws onto
//
//        Version:  1.0
//        Created:  2025-03-05 10:10 AM
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

#ifndef PC_SURFACE_INC_
#define PC_SURFACE_INC_

#include <cstdint>
#include <string_view>
#include <vector>

#include "PC_Theme.h"
#include "utilities.h"

enum class PC_LineStyle : int32_t
{
    e_solid,
    e_dashed,
    e_dotted
};

// horizontal alignment. 'y' is always the text baseline.

enum class PC_TextAlign : int32_t
{
    e_left,
    e_center,
    e_right
};

enum class PC_ImageFormat : int32_t
{
    e_png,
    e_jpeg,
    e_svg
};

struct PC_Point
{
    double x_ = 0;
    double y_ = 0;
};

struct PC_Font
{
    double size_ = 12;
    bool bold_ = false;
};

// =====================================================================================
//        Class:  PC_Surface
//  Description:  everything the drawing code needs from a raster. No file I/O here;
//                callers get encoded bytes and decide where they go.
// =====================================================================================
class PC_Surface
{
public:
    // ====================  LIFECYCLE     =======================================

    PC_Surface() = default;
    PC_Surface(const PC_Surface &rhs) = delete;
    PC_Surface(PC_Surface &&rhs) = delete;

    virtual ~PC_Surface() = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] virtual int32_t GetWidth() const = 0;
    [[nodiscard]] virtual int32_t GetHeight() const = 0;

    // 0xTTRRGGBB
    [[nodiscard]] virtual PC_Color GetPixel(int32_t x, int32_t y) const = 0;

    [[nodiscard]] virtual std::vector<char> Encode(PC_ImageFormat format) const = 0;

    // ====================  MUTATORS      =======================================

    virtual void FillRect(double x, double y, double width, double height, PC_Color fill_color) = 0;
    virtual void StrokeRect(double x, double y, double width, double height, PC_Color line_color,
                            int32_t line_width) = 0;
    virtual void DrawLine(PC_Point from, PC_Point to, PC_Color line_color, int32_t line_width,
                          PC_LineStyle line_style) = 0;
    virtual void DrawPolyline(const std::vector<PC_Point> &points, PC_Color line_color, int32_t line_width,
                              PC_LineStyle line_style) = 0;
    virtual void FillPolygon(const std::vector<PC_Point> &points, PC_Color fill_color) = 0;

    // fill changes linearly from 'top_color' at y_top to 'bottom_color' at y_bottom

    virtual void FillPolygonVerticalGradient(const std::vector<PC_Point> &points, double y_top, double y_bottom,
                                             PC_Color top_color, PC_Color bottom_color) = 0;

    virtual void DrawText(std::string_view text, PC_Point at, const PC_Font &font, PC_Color text_color,
                          PC_TextAlign align) = 0;

    // copy 'source' onto this surface with its top left corner at (x, y)

    virtual void DrawSurface(const PC_Surface &source, int32_t x, int32_t y) = 0;

    // ====================  OPERATORS     =======================================

    PC_Surface &operator=(const PC_Surface &rhs) = delete;
    PC_Surface &operator=(PC_Surface &&rhs) = delete;

};  // -----  end of class PC_Surface  -----

// choose an encoding from the output file name's extension

[[nodiscard]] PC_ImageFormat ImageFormatFromPath(const fs::path &output_path);

// encode and write. Creates the parent directory if needed.

void WriteImageFile(const PC_Surface &surface, const fs::path &output_path);

#endif // ----- #ifndef PC_SURFACE_INC_  -----
