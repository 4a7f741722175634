// =====================================================================================
//
//       Filename:  PC_ChartElements.h
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

#ifndef PC_CHARTELEMENTS_INC_
#define PC_CHARTELEMENTS_INC_

#include <string>
#include <vector>

#include "PC_Candle.h"
#include "PC_PrimaryDrawer.h"
#include "PC_RenderOptions.h"
#include "PC_Surface.h"

// how to draw 1 indicator line and where its label goes

struct PC_OverlayStyle
{
    PC_Color color_;
    PC_LineStyle line_style_ = PC_LineStyle::e_solid;
    std::string label_;
    double label_offset_ = 15;  // below the top of the plot
};

// 'first_index' is the position in the original series of the first indicator
// point (SMA starts late). 'count' is the length of the original series.

void DrawOverlay(PC_Surface &surface, const PC_IndicatorSeries &indicator, size_t first_index, size_t count,
                 PC_XConvention convention, const PC_DrawContext &context, const PC_OverlayStyle &style);

void DrawLevels(PC_Surface &surface, const std::vector<PC_HorizontalLevel> &levels, const PC_DrawContext &context);

// 11 vertical and 6 horizontal lines across the plot area
void DrawGrid(PC_Surface &surface, const PC_DrawContext &context);

// axis lines and price labels are always drawn. Time labels come from the
// original (not transformed) series.
void DrawAxes(PC_Surface &surface, const PC_Series &series, bool show_time_axis, const PC_DrawContext &context);

void DrawTitle(PC_Surface &surface, const std::string &title, const PC_DrawContext &context);

void DrawWatermark(PC_Surface &surface, const PC_Watermark &watermark, const PC_DrawContext &context);

struct PC_TextAnchor
{
    PC_Point at_;
    PC_TextAlign align_;
};

[[nodiscard]] PC_TextAnchor WatermarkAnchor(PC_WatermarkPosition position, const PC_Dimensions &dimensions,
                                            double font_size);

#endif // ----- #ifndef PC_CHARTELEMENTS_INC_  -----
