// =====================================================================================
//
//       Filename:  PC_Scaling.h
//
//    Description:  price range computation and price/time to pixel mapping
//
//        Version:  1.0
//        Created:  2025-03-03 08:45 AM
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

#ifndef PC_SCALING_INC_
#define PC_SCALING_INC_

#include <cstddef>
#include <optional>

#include "PC_Candle.h"

struct PC_ScaleConfig
{
    // NOTE: both multipliers rescale the price axis. 'x' is applied first,
    // then 'y' compounds on the result.

    std::optional<double> x_;
    std::optional<double> y_;
    std::optional<double> min_scale_;
    std::optional<double> max_scale_;
    bool auto_scale_ = false;
};

// bar style charts center each item in its own slot. Line style charts put
// the first and last points on the plot edges.

enum class PC_XConvention : int32_t
{
    e_bar,
    e_point
};

constexpr double kAutoScalePadding = 0.05;

[[nodiscard]] PC_PriceRange ComputeRange(const PC_Series &series, const PC_ScaleConfig &scale_config);
[[nodiscard]] PC_PriceRange ComputeRange(const PC_BrickSeries &bricks, const PC_ScaleConfig &scale_config);

// apply the scale policies to an already known [low, high] window.

[[nodiscard]] PC_PriceRange ApplyScalePolicy(double low, double high, const PC_ScaleConfig &scale_config);

[[nodiscard]] double ToPixelY(double price, const PC_PriceRange &price_range, const PC_Dimensions &dimensions);

[[nodiscard]] double ToPixelX(size_t index, size_t count, const PC_Dimensions &dimensions, PC_XConvention convention);

// width of 1 item's slot for bar style charts

[[nodiscard]] double SlotWidth(size_t count, const PC_Dimensions &dimensions);

#endif // ----- #ifndef PC_SCALING_INC_  -----
