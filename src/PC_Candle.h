// =====================================================================================
//
//       Filename:  PC_Candle.h
//
//    Description:  basic price data types: candles, bricks, indicator points, ranges and sizes
//
//        Version:  1.0
//        Created:  2025-03-02 11:20 AM
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

#ifndef PC_CANDLE_INC_
#define PC_CANDLE_INC_

#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

// one OHLCV sample. time is milliseconds since the epoch (UTC).

struct PC_Candle
{
    int64_t time_ = 0;
    double open_ = 0;
    double high_ = 0;
    double low_ = 0;
    double close_ = 0;
    std::optional<double> volume_;

    [[nodiscard]] bool IsBullish() const { return close_ >= open_; }
    [[nodiscard]] double TypicalPrice() const { return (high_ + low_ + close_) / 3; }

    [[nodiscard]] Json::Value ToJSON() const;
    [[nodiscard]] static PC_Candle FromJSON(const Json::Value &new_data);

    bool operator==(const PC_Candle &rhs) const = default;
};

using PC_Series = std::vector<PC_Candle>;

// synthetic block produced by Renko and line-break aggregation

struct PC_Brick
{
    int64_t time_ = 0;
    double open_ = 0;
    double high_ = 0;
    double low_ = 0;
    double close_ = 0;
    int32_t direction_ = 0;  // +1 up, -1 down

    bool operator==(const PC_Brick &rhs) const = default;
};

using PC_BrickSeries = std::vector<PC_Brick>;

struct PC_IndicatorPoint
{
    int64_t time_ = 0;
    double value_ = 0;
};

using PC_IndicatorSeries = std::vector<PC_IndicatorPoint>;

struct PC_PriceRange
{
    double min_ = 0;
    double max_ = 0;
    double range_ = 0;
};

struct PC_Margin
{
    double top_ = 60;
    double bottom_ = 40;
    double left_ = 60;
    double right_ = 40;

    bool operator==(const PC_Margin &rhs) const = default;
};

struct PC_Dimensions
{
    int32_t width_ = 0;
    int32_t height_ = 0;
    PC_Margin margin_;

    [[nodiscard]] double ChartWidth() const { return width_ - margin_.left_ - margin_.right_; }
    [[nodiscard]] double ChartHeight() const { return height_ - margin_.top_ - margin_.bottom_; }
    [[nodiscard]] double ChartBottom() const { return margin_.top_ + ChartHeight(); }
    [[nodiscard]] double ChartRight() const { return margin_.left_ + ChartWidth(); }
};

// series level checks and helpers

[[nodiscard]] bool ValidateSeries(const PC_Series &series);
[[nodiscard]] PC_Series SortSeries(const PC_Series &series);
[[nodiscard]] PC_Series FilterSeriesByTime(const PC_Series &series, int64_t begin_ms, int64_t end_ms);

// true if at least 1 candle carries a positive volume

[[nodiscard]] bool HasVolumeData(const PC_Series &series);

[[nodiscard]] Json::Value SeriesToJSON(const PC_Series &series);
[[nodiscard]] PC_Series SeriesFromJSON(const Json::Value &new_data);

// compact JSON array of candle objects. PC_FileDataSource can read it back.

void ConvertSeriesToJsonAndWriteToStream(const PC_Series &series, std::ostream &stream);

template <>
struct std::formatter<PC_Candle> : std::formatter<std::string>
{
    // parse is inherited from formatter<string>.
    auto format(const PC_Candle &candle, std::format_context &ctx) const
    {
        std::string s;
        const std::chrono::sys_time<std::chrono::milliseconds> the_time{std::chrono::milliseconds{candle.time_}};
        std::format_to(std::back_inserter(s), "time: {:%F %R}. open: {}. high: {}. low: {}. close: {}.", the_time,
                       candle.open_, candle.high_, candle.low_, candle.close_);
        if (candle.volume_)
        {
            std::format_to(std::back_inserter(s), " volume: {}.", candle.volume_.value());
        }
        return formatter<std::string>::format(s, ctx);
    }
};

template <>
struct std::formatter<PC_Brick> : std::formatter<std::string>
{
    // parse is inherited from formatter<string>.
    auto format(const PC_Brick &brick, std::format_context &ctx) const
    {
        std::string s;
        std::format_to(std::back_inserter(s), "brick {}: open: {}. close: {}.", brick.direction_ > 0 ? "up" : "down",
                       brick.open_, brick.close_);
        return formatter<std::string>::format(s, ctx);
    }
};

inline std::ostream &operator<<(std::ostream &os, const PC_Candle &candle)
{
    std::format_to(std::ostream_iterator<char>{os}, "{}", candle);

    return os;
}

#endif // ----- #ifndef PC_CANDLE_INC_  -----
