// =====================================================================================
//
//       Filename:  Indicators_test.cpp
//
//    Description:  tests for VWAP, EMA, SMA and RSI
//
//        Version:  1.0
//        Created:  2025-03-10 10:30 AM
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

#include <gtest/gtest.h>

#include <numeric>
#include <vector>

#include "PC_Indicators.h"

static PC_Series MakeCloses(const std::vector<double> &closes)
{
    PC_Series series;
    int64_t the_time = 1'700'000'000'000;
    for (auto close : closes)
    {
        series.push_back({.time_ = the_time, .open_ = close, .high_ = close, .low_ = close, .close_ = close});
        the_time += 60'000;
    }
    return series;
}

TEST(EMA, SeededFromFirstClose)
{
    // period 3 gives k = 0.5
    const auto ema = ComputeEMA(MakeCloses({10, 20}), 3);
    ASSERT_EQ(ema.size(), 2);
    EXPECT_DOUBLE_EQ(ema[0].value_, 10);
    EXPECT_DOUBLE_EQ(ema[1].value_, 15);

    EXPECT_TRUE(ComputeEMA({}, 20).empty());
}

TEST(EMA, ConstantSeriesStaysConstant)
{
    const auto ema = ComputeEMA(MakeCloses(std::vector<double>(30, 42.0)), 20);
    ASSERT_EQ(ema.size(), 30);
    for (const auto &point : ema)
    {
        EXPECT_DOUBLE_EQ(point.value_, 42);
    }
}

TEST(SMA, WindowAverages)
{
    const auto series = MakeCloses({1, 2, 3, 4, 5});
    const auto sma = ComputeSMA(series, 2);
    ASSERT_EQ(sma.size(), 4);
    EXPECT_DOUBLE_EQ(sma[0].value_, 1.5);
    EXPECT_DOUBLE_EQ(sma[1].value_, 2.5);
    EXPECT_DOUBLE_EQ(sma[3].value_, 4.5);

    // first point lines up with the end of the first window
    EXPECT_EQ(sma[0].time_, series[1].time_);
}

TEST(SMA, ShortSeriesIsEmpty)
{
    EXPECT_TRUE(ComputeSMA(MakeCloses({1, 2, 3}), 20).empty());

    const auto sma = ComputeSMA(MakeCloses(std::vector<double>(25, 7.0)), 20);
    ASSERT_EQ(sma.size(), 6);
    EXPECT_DOUBLE_EQ(sma.back().value_, 7);
}

TEST(VWAP, FallsBackToTypicalPriceWithoutVolume)
{
    const PC_Series series{{.time_ = 1000, .open_ = 9, .high_ = 12, .low_ = 9, .close_ = 9, .volume_ = 0},
                           {.time_ = 2000, .open_ = 10, .high_ = 13, .low_ = 10, .close_ = 10}};
    const auto vwap = ComputeVWAP(series);
    ASSERT_EQ(vwap.size(), 2);
    EXPECT_DOUBLE_EQ(vwap[0].value_, 10);
    EXPECT_DOUBLE_EQ(vwap[1].value_, 11);
}

TEST(VWAP, IsCumulative)
{
    // typical prices 10 and 20
    const PC_Series series{{.time_ = 1000, .open_ = 10, .high_ = 10, .low_ = 10, .close_ = 10, .volume_ = 1},
                           {.time_ = 2000, .open_ = 20, .high_ = 20, .low_ = 20, .close_ = 20, .volume_ = 3}};
    const auto vwap = ComputeVWAP(series);
    ASSERT_EQ(vwap.size(), 2);
    EXPECT_DOUBLE_EQ(vwap[0].value_, 10);
    EXPECT_DOUBLE_EQ(vwap[1].value_, 17.5);
}

TEST(RSI, AllGainsIs100)
{
    std::vector<double> closes(20);
    std::iota(closes.begin(), closes.end(), 1.0);
    const auto rsi = ComputeRSI(closes, 14);
    ASSERT_EQ(rsi.size(), 6);
    for (auto value : rsi)
    {
        EXPECT_DOUBLE_EQ(value, 100);
    }

    EXPECT_TRUE(ComputeRSI({1, 2, 3}, 14).empty());
}

TEST(RSI, BalancedMovesAre50)
{
    const auto rsi = ComputeRSI({10, 11, 10, 11, 10}, 4);
    ASSERT_EQ(rsi.size(), 1);
    EXPECT_DOUBLE_EQ(rsi[0], 50);
}

TEST(Indicators, NonPositivePeriodThrows)
{
    const auto series = MakeCloses({1, 2, 3});
    EXPECT_THROW(auto e = ComputeEMA(series, 0), std::invalid_argument);
    EXPECT_THROW(auto s = ComputeSMA(series, 0), std::invalid_argument);
    EXPECT_THROW(auto r = ComputeRSI(ExtractCloses(series), -1), std::invalid_argument);
}
