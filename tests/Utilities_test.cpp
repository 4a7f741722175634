// =====================================================================================
//
//       Filename:  Utilities_test.cpp
//
//    Description:  tests for the formatting, color and small helper functions
//
//        Version:  1.0
//        Created:  2025-03-10 09:12 AM
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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "PC_Candle.h"
#include "PC_Errors.h"
#include "PC_Surface.h"
#include "PC_Theme.h"
#include "utilities.h"

using namespace std::string_literals;
using namespace testing;

TEST(FormatPrice, PrecisionFollowsMagnitude)
{
    EXPECT_EQ(FormatPrice(1234.56), "1235");
    EXPECT_EQ(FormatPrice(123.456), "123.5");
    EXPECT_EQ(FormatPrice(12.5), "12.50");
    EXPECT_EQ(FormatPrice(0.5), "0.5000");
}

TEST(FormatTimeLabel, UsesUTC)
{
    EXPECT_EQ(FormatTimeLabel(0), "Jan 01 00:00");
    EXPECT_EQ(FormatTimeLabel(1700000000000), "Nov 14 22:13");
}

TEST(TimeframeToMs, KnownUnits)
{
    EXPECT_EQ(TimeframeToMs("1m"), 60'000);
    EXPECT_EQ(TimeframeToMs("15m"), 900'000);
    EXPECT_EQ(TimeframeToMs("4h"), 14'400'000);
    EXPECT_EQ(TimeframeToMs("1d"), 86'400'000);
    EXPECT_EQ(TimeframeToMs("1w"), 604'800'000);
}

TEST(TimeframeToMs, RejectsJunk)
{
    EXPECT_THROW(auto x = TimeframeToMs("1x"), std::invalid_argument);
    EXPECT_THROW(auto x = TimeframeToMs("h"), std::invalid_argument);
    EXPECT_THROW(auto x = TimeframeToMs("0h"), std::invalid_argument);
}

TEST(SplitString, KeepsEmptyFields)
{
    const auto fields = split_string<std::string>("a,b,,c", ",");
    EXPECT_THAT(fields, ElementsAre("a"s, "b"s, ""s, "c"s));

    EXPECT_TRUE(split_string<std::string_view>("", ",").empty());
}

TEST(Trim, StripsWhitespace)
{
    EXPECT_EQ(trim("  BTC/USDT \r\n"), "BTC/USDT");
    EXPECT_EQ(trim(" \t "), "");
}

TEST(PercentageChange, ZeroPreviousIsZero)
{
    EXPECT_DOUBLE_EQ(PercentageChange(110, 100), 10.0);
    EXPECT_DOUBLE_EQ(PercentageChange(90, 100), -10.0);
    EXPECT_DOUBLE_EQ(PercentageChange(5, 0), 0.0);
}

TEST(ParseColor, HexForms)
{
    EXPECT_EQ(ParseColor("#fff"), 0xFFFFFF);
    EXPECT_EQ(ParseColor("#26a69a"), 0x26A69A);
    EXPECT_EQ(ParseColor("#FF0000"), 0xFF0000);

    // css alpha 0x80 is transparency 0x7F
    EXPECT_EQ(ParseColor("#ff000080"), 0x7FFF0000);
    EXPECT_EQ(ParseColor("#ff0000ff"), 0xFF0000);
}

TEST(ParseColor, NamedColors)
{
    EXPECT_EQ(ParseColor("red"), 0xFF0000);
    EXPECT_EQ(ParseColor("White"), 0xFFFFFF);
    EXPECT_EQ(ParseColor("transparent"), kTransparent);
}

TEST(ParseColor, RejectsJunk)
{
    EXPECT_THROW(auto c = ParseColor("#12"), PC_ConfigurationError);
    EXPECT_THROW(auto c = ParseColor("#zzzzzz"), PC_ConfigurationError);
    EXPECT_THROW(auto c = ParseColor("mauve-ish"), PC_ConfigurationError);
    EXPECT_THROW(auto c = ParseColor(""), PC_ConfigurationError);
}

TEST(WithOpacity, ReplacesTransparency)
{
    EXPECT_EQ(WithOpacity(0x123456, 1.0), 0x123456);
    EXPECT_EQ(WithOpacity(0x123456, 0.0), static_cast<PC_Color>(0xFF123456));
    EXPECT_EQ(WithOpacity(0x40123456, 1.0), 0x123456);

    // out of range opacity is clamped
    EXPECT_EQ(WithOpacity(0x123456, 3.0), 0x123456);
    EXPECT_EQ(OpaqueColor(WithOpacity(0xABCDEF, 0.3)), 0xABCDEF);
}

TEST(Theme, DarkAndLight)
{
    const auto dark = PC_Theme::Make(PC_ThemeName::e_dark);
    EXPECT_EQ(dark.background_, 0x1E222D);
    EXPECT_EQ(dark.text_, 0xFFFFFF);
    EXPECT_EQ(dark.bullish_, 0x26A69A);
    EXPECT_EQ(dark.bearish_, 0xEF5350);

    const auto light = PC_Theme::Make(PC_ThemeName::e_light);
    EXPECT_EQ(light.background_, 0xFFFFFF);
    EXPECT_EQ(light.text_, 0x000000);
    EXPECT_EQ(light.bullish_, dark.bullish_);

    EXPECT_EQ(ParseThemeName("LIGHT"), PC_ThemeName::e_light);
    EXPECT_THROW(auto t = ParseThemeName("sepia"), PC_ConfigurationError);
}

TEST(ImageFormatFromPath, ExtensionsAreCaseInsensitive)
{
    EXPECT_EQ(ImageFormatFromPath("chart.png"), PC_ImageFormat::e_png);
    EXPECT_EQ(ImageFormatFromPath("/tmp/out/CHART.PNG"), PC_ImageFormat::e_png);
    EXPECT_EQ(ImageFormatFromPath("chart.jpg"), PC_ImageFormat::e_jpeg);
    EXPECT_EQ(ImageFormatFromPath("chart.jpeg"), PC_ImageFormat::e_jpeg);
    EXPECT_EQ(ImageFormatFromPath("chart.svg"), PC_ImageFormat::e_svg);

    EXPECT_THROW(auto f = ImageFormatFromPath("chart.gif"), PC_ConfigurationError);
    EXPECT_THROW(auto f = ImageFormatFromPath("chart"), PC_ConfigurationError);
}

TEST(SeriesHelpers, SortFilterAndValidate)
{
    const PC_Series series{{.time_ = 3000, .open_ = 10, .high_ = 12, .low_ = 9, .close_ = 11},
                           {.time_ = 1000, .open_ = 8, .high_ = 9, .low_ = 7, .close_ = 8.5, .volume_ = 0.0},
                           {.time_ = 2000, .open_ = 8.5, .high_ = 10.5, .low_ = 8, .close_ = 10, .volume_ = 4.0}};

    // out of order fails validation until sorted
    EXPECT_FALSE(ValidateSeries(series));
    const auto sorted = SortSeries(series);
    ASSERT_EQ(sorted.size(), 3);
    EXPECT_EQ(sorted[0].time_, 1000);
    EXPECT_EQ(sorted[2].time_, 3000);
    EXPECT_TRUE(ValidateSeries(sorted));
    EXPECT_TRUE(HasVolumeData(sorted));

    const auto middle = FilterSeriesByTime(sorted, 1500, 3000);
    ASSERT_EQ(middle.size(), 2);
    EXPECT_EQ(middle[0].time_, 2000);
    EXPECT_EQ(middle[1].time_, 3000);
    EXPECT_TRUE(FilterSeriesByTime(sorted, 4000, 5000).empty());

    // a zero volume doesn't count as volume data
    EXPECT_FALSE(HasVolumeData(FilterSeriesByTime(sorted, 0, 1000)));

    PC_Series bad{{.time_ = 1000, .open_ = 8, .high_ = 7, .low_ = 6, .close_ = 7.5}};
    EXPECT_FALSE(ValidateSeries(bad));
}
