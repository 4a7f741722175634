// =====================================================================================
//
//       Filename:  PC_Indicators.cpp
//
//    Description:  overlay indicators computed from the original candle series
//
//        Version:  1.0
//        Created:  2025-03-04 02:30 PM
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

#include <format>
#include <iterator>
#include <numeric>
#include <ranges>

namespace rng = std::ranges;
namespace vws = std::ranges::views;

#include <boost/assert.hpp>

#include "PC_Indicators.h"

PC_IndicatorSeries ComputeVWAP(const PC_Series &series)
{
    PC_IndicatorSeries vwap;
    vwap.reserve(series.size());

    double total_volume = 0;
    double total_volume_price = 0;

    for (const auto &candle : series)
    {
        const double volume = candle.volume_.value_or(0);
        const double typical_price = candle.TypicalPrice();
        total_volume += volume;
        total_volume_price += volume * typical_price;

        vwap.push_back({.time_ = candle.time_,
                        .value_ = total_volume > 0 ? total_volume_price / total_volume : typical_price});
    }
    return vwap;
}

PC_IndicatorSeries ComputeEMA(const PC_Series &series, int32_t period)
{
    BOOST_ASSERT_MSG(period > 0, std::format("\nEMA period must be > 0. Got: {}.", period).c_str());

    PC_IndicatorSeries ema;
    if (series.empty())
    {
        return ema;
    }
    ema.reserve(series.size());

    const double k = 2.0 / (period + 1);
    double previous = series.front().close_;
    ema.push_back({.time_ = series.front().time_, .value_ = previous});

    for (const auto &candle : series | vws::drop(1))
    {
        previous = (candle.close_ - previous) * k + previous;
        ema.push_back({.time_ = candle.time_, .value_ = previous});
    }
    return ema;
}

PC_IndicatorSeries ComputeSMA(const PC_Series &series, int32_t period)
{
    BOOST_ASSERT_MSG(period > 0, std::format("\nSMA period must be > 0. Got: {}.", period).c_str());

    PC_IndicatorSeries sma;
    const auto window = static_cast<size_t>(period);
    if (series.size() < window)
    {
        return sma;
    }
    sma.reserve(series.size() - window + 1);

    for (size_t i = window - 1; i < series.size(); ++i)
    {
        // sum each window fresh so long series don't accumulate drift
        auto closes = series | vws::drop(i + 1 - window) | vws::take(window) | vws::transform(&PC_Candle::close_);
        const double sum = std::accumulate(closes.begin(), closes.end(), 0.0);
        sma.push_back({.time_ = series[i].time_, .value_ = sum / period});
    }
    return sma;
}

std::vector<double> ComputeRSI(const std::vector<double> &closes, int32_t period)
{
    BOOST_ASSERT_MSG(period > 0, std::format("\nRSI period must be > 0. Got: {}.", period).c_str());

    std::vector<double> rsi_values;
    const auto window = static_cast<size_t>(period);
    if (closes.size() < window + 1)
    {
        return rsi_values;
    }

    for (size_t index = window; index < closes.size(); ++index)
    {
        double gains = 0;
        double losses = 0;
        for (size_t i = index - window + 1; i <= index; ++i)
        {
            const double change = closes[i] - closes[i - 1];
            if (change > 0)
            {
                gains += change;
            }
            else
            {
                losses -= change;
            }
        }
        const double avg_gain = gains / period;
        const double avg_loss = losses / period;
        if (avg_loss == 0)
        {
            rsi_values.push_back(100);
            continue;
        }
        const double rs = avg_gain / avg_loss;
        rsi_values.push_back(100 - 100 / (1 + rs));
    }
    return rsi_values;
}

std::vector<double> ExtractCloses(const PC_Series &series)
{
    std::vector<double> closes;
    closes.reserve(series.size());
    rng::transform(series, std::back_inserter(closes), &PC_Candle::close_);
    return closes;
}
