// =====================================================================================
//
//       Filename:  PC_Candle.cpp
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

#include <algorithm>
#include <charconv>
#include <memory>
#include <ranges>

namespace rng = std::ranges;

#include <boost/assert.hpp>

#include "PC_Candle.h"
#include "utilities.h"

// exchanges send prices both as JSON numbers and as quoted strings

static double AsDouble(const Json::Value &value)
{
    if (value.isNumeric())
    {
        return value.asDouble();
    }
    BOOST_ASSERT_MSG(value.isString(), "\nPrice field must be a number or a numeric string.");
    const std::string text = value.asString();
    double result = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    BOOST_ASSERT_MSG(ec == std::errc{} && ptr == text.data() + text.size(),
                     std::format("\nInvalid numeric value: '{}'.", text).c_str());
    return result;
}

static int64_t AsTime(const Json::Value &value)
{
    if (value.isIntegral())
    {
        return value.asInt64();
    }
    return static_cast<int64_t>(AsDouble(value));
}

Json::Value PC_Candle::ToJSON() const
{
    Json::Value result;
    result["timestamp"] = Json::Int64{time_};
    result["open"] = open_;
    result["high"] = high_;
    result["low"] = low_;
    result["close"] = close_;
    if (volume_)
    {
        result["volume"] = volume_.value();
    }
    return result;
}  // -----  end of method PC_Candle::ToJSON  -----

PC_Candle PC_Candle::FromJSON(const Json::Value &new_data)
{
    PC_Candle candle;

    // [time, open, high, low, close, volume?, ...]

    if (new_data.isArray())
    {
        BOOST_ASSERT_MSG(new_data.size() >= 5,
                         std::format("\nCandle array needs at least 5 fields. Got: {}.", new_data.size()).c_str());
        candle.time_ = AsTime(new_data[0]);
        candle.open_ = AsDouble(new_data[1]);
        candle.high_ = AsDouble(new_data[2]);
        candle.low_ = AsDouble(new_data[3]);
        candle.close_ = AsDouble(new_data[4]);
        if (new_data.size() > 5 && !new_data[5].isNull())
        {
            candle.volume_ = AsDouble(new_data[5]);
        }
        return candle;
    }

    BOOST_ASSERT_MSG(new_data.isObject(), "\nCandle must be a JSON array or object.");

    const auto &time_field = new_data.isMember("timestamp") ? new_data["timestamp"] : new_data["time"];
    BOOST_ASSERT_MSG(!time_field.isNull(), "\nCandle is missing 'timestamp' or 'time' field.");
    for (const auto *name : {"open", "high", "low", "close"})
    {
        BOOST_ASSERT_MSG(new_data.isMember(name), std::format("\nCandle is missing '{}' field.", name).c_str());
    }

    candle.time_ = AsTime(time_field);
    candle.open_ = AsDouble(new_data["open"]);
    candle.high_ = AsDouble(new_data["high"]);
    candle.low_ = AsDouble(new_data["low"]);
    candle.close_ = AsDouble(new_data["close"]);
    if (new_data.isMember("volume") && !new_data["volume"].isNull())
    {
        candle.volume_ = AsDouble(new_data["volume"]);
    }
    return candle;
}  // -----  end of method PC_Candle::FromJSON  -----

bool ValidateSeries(const PC_Series &series)
{
    if (series.empty())
    {
        return false;
    }
    const bool candles_ok = rng::all_of(series,
                                        [](const auto &candle)
                                        {
                                            return candle.high_ >= std::max(candle.open_, candle.close_) &&
                                                   candle.low_ <= std::min(candle.open_, candle.close_) &&
                                                   candle.time_ > 0;
                                        });
    if (!candles_ok)
    {
        return false;
    }
    return rng::adjacent_find(series, [](const auto &a, const auto &b) { return b.time_ <= a.time_; }) ==
           series.end();
}

PC_Series SortSeries(const PC_Series &series)
{
    PC_Series sorted{series};
    rng::stable_sort(sorted, {}, &PC_Candle::time_);
    return sorted;
}

PC_Series FilterSeriesByTime(const PC_Series &series, int64_t begin_ms, int64_t end_ms)
{
    PC_Series result;
    rng::copy_if(series, std::back_inserter(result),
                 [begin_ms, end_ms](const auto &candle) { return candle.time_ >= begin_ms && candle.time_ <= end_ms; });
    return result;
}

bool HasVolumeData(const PC_Series &series)
{
    return rng::any_of(series, [](const auto &candle) { return candle.volume_.has_value() && candle.volume_.value() > 0; });
}

Json::Value SeriesToJSON(const PC_Series &series)
{
    Json::Value result{Json::arrayValue};
    rng::for_each(series, [&result](const auto &candle) { result.append(candle.ToJSON()); });
    return result;
}

void ConvertSeriesToJsonAndWriteToStream(const PC_Series &series, std::ostream &stream)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";  // compact printing and string formatting
    std::unique_ptr<Json::StreamWriter> const writer(builder.newStreamWriter());
    writer->write(SeriesToJSON(series), &stream);
    stream << std::endl;  // add lf and flush
}

PC_Series SeriesFromJSON(const Json::Value &new_data)
{
    BOOST_ASSERT_MSG(new_data.isArray(), "\nPrice data must be a JSON array of candles.");

    PC_Series series;
    series.reserve(new_data.size());
    for (const auto &entry : new_data)
    {
        series.push_back(PC_Candle::FromJSON(entry));
    }
    return series;
}
