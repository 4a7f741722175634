// =====================================================================================
//
//       Filename:  PC_Scaling.cpp
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

#include <algorithm>
#include <cmath>
#include <limits>

#include "PC_Scaling.h"

// a flat series (or clamps that cross) would give us a 0 or negative range.
// open it up around its midpoint instead.

constexpr double kMinimumRangeFraction = 0.01;
constexpr double kMinimumRange = 1e-6;

template <typename T>
static PC_PriceRange ComputeRangeFor(const std::vector<T> &items, const PC_ScaleConfig &scale_config)
{
    double low = std::numeric_limits<double>::max();
    double high = std::numeric_limits<double>::lowest();
    for (const auto &item : items)
    {
        low = std::min(low, item.low_);
        high = std::max(high, item.high_);
    }
    if (items.empty())
    {
        low = 0;
        high = 0;
    }
    return ApplyScalePolicy(low, high, scale_config);
}

PC_PriceRange ComputeRange(const PC_Series &series, const PC_ScaleConfig &scale_config)
{
    return ComputeRangeFor(series, scale_config);
}

PC_PriceRange ComputeRange(const PC_BrickSeries &bricks, const PC_ScaleConfig &scale_config)
{
    return ComputeRangeFor(bricks, scale_config);
}

PC_PriceRange ApplyScalePolicy(double low, double high, const PC_ScaleConfig &scale_config)
{
    double min_price = low;
    double max_price = high;

    if (scale_config.auto_scale_)
    {
        const double range = max_price - min_price;
        min_price -= range * kAutoScalePadding;
        max_price += range * kAutoScalePadding;
    }

    auto rescale = [&min_price, &max_price](double factor)
    {
        const double center = (min_price + max_price) / 2;
        const double new_range = (max_price - min_price) * factor;
        min_price = center - new_range / 2;
        max_price = center + new_range / 2;
    };

    if (scale_config.x_)
    {
        rescale(scale_config.x_.value());
    }
    if (scale_config.y_)
    {
        rescale(scale_config.y_.value());
    }

    // clamps can only shrink the window

    if (scale_config.min_scale_)
    {
        min_price = std::max(min_price, scale_config.min_scale_.value());
    }
    if (scale_config.max_scale_)
    {
        max_price = std::min(max_price, scale_config.max_scale_.value());
    }

    if (!(max_price - min_price > 0))
    {
        const double mid = (min_price + max_price) / 2;
        const double half_span = std::max(std::abs(mid) * kMinimumRangeFraction, kMinimumRange) / 2;
        min_price = mid - half_span;
        max_price = mid + half_span;
    }

    return {.min_ = min_price, .max_ = max_price, .range_ = max_price - min_price};
}

double ToPixelY(double price, const PC_PriceRange &price_range, const PC_Dimensions &dimensions)
{
    return dimensions.margin_.top_ + ((price_range.max_ - price) / price_range.range_) * dimensions.ChartHeight();
}

double SlotWidth(size_t count, const PC_Dimensions &dimensions)
{
    return count == 0 ? dimensions.ChartWidth() : dimensions.ChartWidth() / static_cast<double>(count);
}

double ToPixelX(size_t index, size_t count, const PC_Dimensions &dimensions, PC_XConvention convention)
{
    if (convention == PC_XConvention::e_bar)
    {
        const double spacing = SlotWidth(count, dimensions);
        return dimensions.margin_.left_ + static_cast<double>(index) * spacing + spacing / 2;
    }

    // a single point has nowhere to go but the middle

    if (count < 2)
    {
        return dimensions.margin_.left_ + dimensions.ChartWidth() / 2;
    }
    const double spacing = dimensions.ChartWidth() / static_cast<double>(count - 1);
    return dimensions.margin_.left_ + static_cast<double>(index) * spacing;
}
