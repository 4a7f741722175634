// =====================================================================================
//
//       Filename:  PC_CDSurface.h
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

#ifndef PC_CDSURFACE_INC_
#define PC_CDSURFACE_INC_

#include <memory>

#include <chartdir.h>

#include "PC_Surface.h"

// =====================================================================================
//        Class:  PC_CDSurface
//  Description:  raster backed by ChartDirector's DrawArea
// =====================================================================================
class PC_CDSurface : public PC_Surface
{
public:
    // ====================  LIFECYCLE     =======================================

    PC_CDSurface() = delete;
    PC_CDSurface(int32_t width, int32_t height, PC_Color background = 0xFFFFFF);

    ~PC_CDSurface() override = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] int32_t GetWidth() const override { return width_; }
    [[nodiscard]] int32_t GetHeight() const override { return height_; }
    [[nodiscard]] PC_Color GetPixel(int32_t x, int32_t y) const override;
    [[nodiscard]] std::vector<char> Encode(PC_ImageFormat format) const override;

    // ====================  MUTATORS      =======================================

    void FillRect(double x, double y, double width, double height, PC_Color fill_color) override;
    void StrokeRect(double x, double y, double width, double height, PC_Color line_color,
                    int32_t line_width) override;
    void DrawLine(PC_Point from, PC_Point to, PC_Color line_color, int32_t line_width,
                  PC_LineStyle line_style) override;
    void DrawPolyline(const std::vector<PC_Point> &points, PC_Color line_color, int32_t line_width,
                      PC_LineStyle line_style) override;
    void FillPolygon(const std::vector<PC_Point> &points, PC_Color fill_color) override;
    void FillPolygonVerticalGradient(const std::vector<PC_Point> &points, double y_top, double y_bottom,
                                     PC_Color top_color, PC_Color bottom_color) override;
    void DrawText(std::string_view text, PC_Point at, const PC_Font &font, PC_Color text_color,
                  PC_TextAlign align) override;
    void DrawSurface(const PC_Surface &source, int32_t x, int32_t y) override;

private:
    [[nodiscard]] int StyledColor(PC_Color color, PC_LineStyle line_style) const;
    void FillPolygonWith(const std::vector<PC_Point> &points, int fill_color);

    // ====================  DATA MEMBERS  =======================================

    std::unique_ptr<DrawArea> area_;

    int32_t width_;
    int32_t height_;

};  // -----  end of class PC_CDSurface  -----

#endif // ----- #ifndef PC_CDSURFACE_INC_  -----
