// =====================================================================================
//
//       Filename:  PC_Errors.h
//
//    Description:  exception types used across PC_RenderChart
//
//        Version:  1.0
//        Created:  2025-03-02 10:40 AM
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

#ifndef PC_ERRORS_INC_
#define PC_ERRORS_INC_

#include <stdexcept>
#include <string>

// bad chart type, timeframe, dimensions, output extension...
// detected while building a configuration, never while drawing.

class PC_ConfigurationError : public std::invalid_argument
{
public:
    explicit PC_ConfigurationError(const std::string &what) : std::invalid_argument{what} {}
};

// comparison layouts we refuse to build rather than truncate

class PC_LayoutConstraintError : public std::invalid_argument
{
public:
    explicit PC_LayoutConstraintError(const std::string &what) : std::invalid_argument{what} {}
};

// anything that goes wrong getting candles: network, HTTP status, unparsable
// response, unknown symbol, missing file.

class PC_DataFetchError : public std::runtime_error
{
public:
    explicit PC_DataFetchError(const std::string &what) : std::runtime_error{what} {}
};

#endif // ----- #ifndef PC_ERRORS_INC_  -----
