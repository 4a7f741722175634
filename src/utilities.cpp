// =====================================================================================
//
//       Filename:  utilities.cpp
//
//    Description:  common helpers for PC_RenderChart
//
//        Version:  1.0
//        Created:  2025-03-02 10:14 AM
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
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/assert.hpp>

#include "utilities.h"

using namespace std::string_literals;

std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string LoadDataFileForUse(const fs::path &file_name)
{
    BOOST_ASSERT_MSG(fs::exists(file_name), std::format("\nCan't find data file: {}.", file_name.string()).c_str());

    std::ifstream input_file{file_name, std::ios_base::in | std::ios_base::binary};
    BOOST_ASSERT_MSG(input_file.is_open(), std::format("\nUnable to open data file: {}.", file_name.string()).c_str());

    std::ostringstream file_content;
    file_content << input_file.rdbuf();
    return file_content.str();
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](unsigned char x, unsigned char y) { return tolower(x) == tolower(y); });
}

std::string FormatPrice(double price)
{
    if (price >= 1000)
    {
        return std::format("{:.0f}", price);
    }
    if (price >= 100)
    {
        return std::format("{:.1f}", price);
    }
    if (price >= 10)
    {
        return std::format("{:.2f}", price);
    }
    return std::format("{:.4f}", price);
}

std::string FormatTimeLabel(int64_t time_ms)
{
    const std::chrono::sys_time<std::chrono::milliseconds> the_time{std::chrono::milliseconds{time_ms}};
    return std::format("{:%b %d %H:%M}", std::chrono::floor<std::chrono::minutes>(the_time));
}

int64_t TimeframeToMs(std::string_view timeframe)
{
    BOOST_ASSERT_MSG(timeframe.size() >= 2, std::format("\nInvalid timeframe: '{}'.", timeframe).c_str());

    const auto digits = timeframe.substr(0, timeframe.size() - 1);
    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    BOOST_ASSERT_MSG(ec == std::errc{} && ptr == digits.data() + digits.size() && value > 0,
                     std::format("\nInvalid timeframe count: '{}'.", timeframe).c_str());

    constexpr int64_t kMinute = 60 * 1000;
    switch (timeframe.back())
    {
        case 'm':
            return value * kMinute;
        case 'h':
            return value * 60 * kMinute;
        case 'd':
            return value * 24 * 60 * kMinute;
        case 'w':
            return value * 7 * 24 * 60 * kMinute;
        default:
            throw std::invalid_argument(std::format("Unsupported timeframe unit: {}", timeframe.back()));
    }
}

double PercentageChange(double current, double previous)
{
    if (previous == 0)
    {
        return 0;
    }
    return ((current - previous) / previous) * 100;
}

// our BOOST_ASSERT_MSG handler. We turn failed checks into exceptions so the
// caller can decide whether to keep going.

void boost::assertion_failed_msg(char const *expr, char const *msg, char const *function, char const *file,
                                 long line)
{
    throw std::invalid_argument(std::format("\n*** Assertion failed *** test: {} in function: {} from file: {} at "
                                            "line: {}.\nassertion msg: {}",
                                            expr, function, file, line, msg));
}

// required when BOOST_ENABLE_ASSERT_HANDLER is defined even though we only use the _MSG form.

void boost::assertion_failed(char const *expr, char const *function, char const *file, long line)
{
    throw std::invalid_argument(std::format("\n*** Assertion failed *** test: {} in function: {} from file: {} at "
                                            "line: {}.",
                                            expr, function, file, line));
}
