// =====================================================================================
//
//       Filename:  utilities.h
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

#ifndef UTILITIES_INC_
#define UTILITIES_INC_

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// a simple wrapper to keep same-typed arguments (host, port, ...) from being swapped

template <typename T, typename Tag>
class UniqType
{
public:
    explicit UniqType(const T &value) : value_{value} {}
    explicit UniqType(T &&value) : value_{std::move(value)} {}

    [[nodiscard]] const T &get() const { return value_; }

private:
    T value_;
};

// function to split a string on a delimiter and return a vector of items.
// use concepts to restrict to strings and string_views.

template <typename T>
inline std::vector<T> split_string(std::string_view string_data, std::string_view delim)
    requires std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>
{
    std::vector<T> results;
    if (string_data.empty())
    {
        return results;
    }
    for (size_t it = 0; it != std::string_view::npos;)
    {
        auto pos = string_data.find(delim, it);
        if (pos != std::string_view::npos)
        {
            results.emplace_back(string_data.substr(it, pos - it));
            it = pos + delim.size();
        }
        else
        {
            results.emplace_back(string_data.substr(it));
            break;
        }
    }
    return results;
}

[[nodiscard]] std::string_view trim(std::string_view text);

[[nodiscard]] std::string LoadDataFileForUse(const fs::path &file_name);

[[nodiscard]] bool EqualsIgnoreCase(std::string_view a, std::string_view b);

// price labels use fewer decimals as magnitude grows

[[nodiscard]] std::string FormatPrice(double price);

// time axis labels. always UTC so output does not depend on where or when we run.

[[nodiscard]] std::string FormatTimeLabel(int64_t time_ms);

// '15m', '4h', '1d', '1w' ...

[[nodiscard]] int64_t TimeframeToMs(std::string_view timeframe);

[[nodiscard]] double PercentageChange(double current, double previous);

#endif // ----- #ifndef UTILITIES_INC_  -----
