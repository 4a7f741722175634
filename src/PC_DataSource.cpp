// =====================================================================================
//
//       Filename:  PC_DataSource.cpp
//
//    Description:  where candles come from
//
//        Version:  1.0
//        Created:  2025-03-08 10:00 AM
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
#include <cctype>
#include <charconv>
#include <chrono>
#include <memory>
#include <ranges>
#include <sstream>

namespace rng = std::ranges;
namespace vws = std::ranges::views;

#include <boost/assert.hpp>

#include <spdlog/spdlog.h>

#include "PC_DataSource.h"
#include "PC_Errors.h"

using namespace std::string_literals;

static double FieldToDouble(std::string_view field)
{
    const auto text = trim(field);
    double result = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    BOOST_ASSERT_MSG(ec == std::errc{} && ptr == text.data() + text.size(),
                     std::format("\nInvalid numeric field: '{}'.", text).c_str());
    return result;
}

// either milliseconds since the epoch or 'YYYY-MM-DD HH:MM:SS' (UTC)

static int64_t FieldToTime(std::string_view field)
{
    const auto text = trim(field);
    int64_t millis = 0;
    if (const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), millis);
        ec == std::errc{} && ptr == text.data() + text.size())
    {
        return millis;
    }

    std::chrono::sys_time<std::chrono::milliseconds> the_time;
    std::istringstream time_stream{std::string{text}};
    const auto *time_format = text.find('T') != std::string_view::npos ? "%FT%T" : "%F %T";
    time_stream >> std::chrono::parse(time_format, the_time);
    BOOST_ASSERT_MSG(!time_stream.fail(), std::format("\nInvalid time field: '{}'.", text).c_str());
    return the_time.time_since_epoch().count();
}

std::string SymbolToPair(std::string_view symbol)
{
    std::string pair;
    rng::copy_if(symbol, std::back_inserter(pair), [](char c) { return c != '/'; });
    rng::for_each(pair, [](char &c) { c = static_cast<char>(std::toupper(c)); });
    return pair;
}

std::optional<int> FindColumnIndex(std::string_view header, std::string_view column_name, std::string_view delim)
{
    const auto fields = split_string<std::string_view>(header, delim);
    if (auto found_it = rng::find_if(fields, [&column_name](const auto &field_name)
                                     { return EqualsIgnoreCase(trim(field_name), column_name); });
        found_it != rng::end(fields))
    {
        return static_cast<int>(rng::distance(fields.begin(), found_it));
    }
    return {};
}

PC_Series KeepMostRecent(PC_Series series, int32_t limit)
{
    auto sorted = SortSeries(series);
    if (limit > 0 && sorted.size() > static_cast<size_t>(limit))
    {
        sorted.erase(sorted.begin(), sorted.end() - limit);
    }
    return sorted;
}

//--------------------------------------------------------------------------------------
//       Class:  PC_FileDataSource
//      Method:  PC_FileDataSource
// Description:  constructor
//--------------------------------------------------------------------------------------
PC_FileDataSource::PC_FileDataSource(fs::path data_directory) : data_directory_{std::move(data_directory)}
{
}  // -----  end of method PC_FileDataSource::PC_FileDataSource  (constructor)  -----

PC_Series PC_FileDataSource::FetchOHLCV(const std::string &symbol, const std::string &timeframe,
                                        int32_t limit) const
{
    const auto base_name = std::format("{}_{}", SymbolToPair(symbol), timeframe);

    try
    {
        for (const auto *extension : {".csv", ".json"})
        {
            const auto file_name = data_directory_ / (base_name + extension);
            if (!fs::exists(file_name))
            {
                continue;
            }
            spdlog::debug(std::format("Loading candles for: {} from: {}.", symbol, file_name.string()));

            const auto file_content = LoadDataFileForUse(file_name);
            auto series = file_name.extension() == ".csv" ? ParseCSV(file_content) : ParseJSON(file_content);
            return KeepMostRecent(std::move(series), limit);
        }
    }
    catch (const std::exception &e)
    {
        throw PC_DataFetchError(std::format("Unable to load data for: {} {}. {}", symbol, timeframe, e.what()));
    }
    throw PC_DataFetchError(std::format("No data file for: {} {} in: {}. Looked for: {}.csv and {}.json", symbol,
                                        timeframe, data_directory_.string(), base_name, base_name));
}  // -----  end of method PC_FileDataSource::FetchOHLCV  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_FileDataSource
//      Method:  PC_FileDataSource::ParseCSV
// Description:  first record is the header. Columns are found by name.
//--------------------------------------------------------------------------------------
PC_Series PC_FileDataSource::ParseCSV(std::string_view file_content)
{
    auto records = split_string<std::string_view>(file_content, "\n");
    std::erase_if(records, [](const auto &record) { return trim(record).empty(); });
    BOOST_ASSERT_MSG(!records.empty(), "\nCSV data is empty.");

    const auto header_record = trim(records.front());

    auto time_column = FindColumnIndex(header_record, "timestamp", ",");
    if (!time_column)
    {
        time_column = FindColumnIndex(header_record, "time", ",");
    }
    BOOST_ASSERT_MSG(time_column.has_value(),
                     std::format("\nCan't find 'timestamp' or 'time' field in header record: {}.", header_record)
                         .c_str());

    std::vector<int> price_columns;
    for (const auto *name : {"open", "high", "low", "close"})
    {
        const auto column = FindColumnIndex(header_record, name, ",");
        BOOST_ASSERT_MSG(column.has_value(),
                         std::format("\nCan't find '{}' field in header record: {}.", name, header_record).c_str());
        price_columns.push_back(column.value());
    }
    const auto volume_column = FindColumnIndex(header_record, "volume", ",");

    PC_Series series;
    series.reserve(records.size() - 1);

    for (const auto &record : records | vws::drop(1))
    {
        const auto fields = split_string<std::string_view>(trim(record), ",");
        const auto needed = std::max(time_column.value(), rng::max(price_columns));
        BOOST_ASSERT_MSG(static_cast<int>(fields.size()) > needed,
                         std::format("\nToo few fields in record: {}.", record).c_str());

        PC_Candle candle{.time_ = FieldToTime(fields[time_column.value()]),
                         .open_ = FieldToDouble(fields[price_columns[0]]),
                         .high_ = FieldToDouble(fields[price_columns[1]]),
                         .low_ = FieldToDouble(fields[price_columns[2]]),
                         .close_ = FieldToDouble(fields[price_columns[3]]),
                         .volume_ = {}};
        if (volume_column && volume_column.value() < static_cast<int>(fields.size()) &&
            !trim(fields[volume_column.value()]).empty())
        {
            candle.volume_ = FieldToDouble(fields[volume_column.value()]);
        }
        series.push_back(candle);
    }
    return series;
}  // -----  end of method PC_FileDataSource::ParseCSV  -----

PC_Series PC_FileDataSource::ParseJSON(std::string_view file_content)
{
    JSONCPP_STRING err;
    Json::Value candles;

    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(file_content.data(), file_content.data() + file_content.size(), &candles, &err))
    {
        throw std::runtime_error("Problem parsing candle JSON: "s + err);
    }
    return SeriesFromJSON(candles);
}  // -----  end of method PC_FileDataSource::ParseJSON  -----
