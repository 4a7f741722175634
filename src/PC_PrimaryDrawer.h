// =====================================================================================
//
//       Filename:  PC_PrimaryDrawer.h
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

#ifndef PC_PRIMARYDRAWER_INC_
#define PC_PRIMARYDRAWER_INC_

#include <memory>

#include "PC_Candle.h"
#include "PC_RenderOptions.h"
#include "PC_Scaling.h"
#include "PC_Surface.h"
#include "PC_Transforms.h"

// everything a drawing routine needs to place things on the surface

struct PC_DrawContext
{
    PC_Dimensions dimensions_;
    PC_PriceRange price_range_;
    PC_ResolvedColors colors_;
};

// =====================================================================================
//        Class:  PC_PrimaryDrawer
//  Description:  1 implementation per chart type. Picked by MakePrimaryDrawer.
// =====================================================================================
class PC_PrimaryDrawer
{
public:
    // ====================  LIFECYCLE     =======================================

    PC_PrimaryDrawer() = default;
    PC_PrimaryDrawer(const PC_PrimaryDrawer &rhs) = delete;
    PC_PrimaryDrawer(PC_PrimaryDrawer &&rhs) = delete;

    virtual ~PC_PrimaryDrawer() = default;

    // ====================  ACCESSORS     =======================================

    // how this shape spreads its items across the plot. Overlays use the same.
    [[nodiscard]] virtual PC_XConvention XConvention() const = 0;

    // draws nothing for an empty series
    virtual void Draw(PC_Surface &surface, const PC_DrawnSeries &drawn, const PC_DrawContext &context) const = 0;

    // ====================  OPERATORS     =======================================

    PC_PrimaryDrawer &operator=(const PC_PrimaryDrawer &rhs) = delete;
    PC_PrimaryDrawer &operator=(PC_PrimaryDrawer &&rhs) = delete;

};  // -----  end of class PC_PrimaryDrawer  -----

// =====================================================================================
//        Class:  PC_CandleDrawer
//  Description:  wick plus body. Used for candlestick and Heikin-Ashi.
// =====================================================================================
class PC_CandleDrawer : public PC_PrimaryDrawer
{
public:
    [[nodiscard]] PC_XConvention XConvention() const override { return PC_XConvention::e_bar; }
    void Draw(PC_Surface &surface, const PC_DrawnSeries &drawn, const PC_DrawContext &context) const override;
};

class PC_LineDrawer : public PC_PrimaryDrawer
{
public:
    [[nodiscard]] PC_XConvention XConvention() const override { return PC_XConvention::e_point; }
    void Draw(PC_Surface &surface, const PC_DrawnSeries &drawn, const PC_DrawContext &context) const override;
};

// a line with a gradient fill down to the bottom of the plot
class PC_AreaDrawer : public PC_PrimaryDrawer
{
public:
    [[nodiscard]] PC_XConvention XConvention() const override { return PC_XConvention::e_point; }
    void Draw(PC_Surface &surface, const PC_DrawnSeries &drawn, const PC_DrawContext &context) const override;
};

// Renko and line-break blocks
class PC_BrickDrawer : public PC_PrimaryDrawer
{
public:
    [[nodiscard]] PC_XConvention XConvention() const override { return PC_XConvention::e_bar; }
    void Draw(PC_Surface &surface, const PC_DrawnSeries &drawn, const PC_DrawContext &context) const override;
};

[[nodiscard]] std::unique_ptr<PC_PrimaryDrawer> MakePrimaryDrawer(PC_ChartType chart_type);

// the close prices of a line/area chart as plot points
[[nodiscard]] std::vector<PC_Point> ClosePoints(const PC_Series &series, const PC_DrawContext &context);

#endif // ----- #ifndef PC_PRIMARYDRAWER_INC_  -----
