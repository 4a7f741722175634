// =====================================================================================
//
//       Filename:  PC_DataSource.h
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

#ifndef PC_DATASOURCE_INC_
#define PC_DATASOURCE_INC_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "PC_Candle.h"
#include "utilities.h"

// =====================================================================================
//        Class:  PC_DataSource
//  Description:  provider of OHLCV candles. Every failure is reported as a
//                PC_DataFetchError.
// =====================================================================================
class PC_DataSource
{
public:
    // ====================  LIFECYCLE     =======================================

    PC_DataSource() = default;
    PC_DataSource(const PC_DataSource &rhs) = delete;
    PC_DataSource(PC_DataSource &&rhs) = delete;

    virtual ~PC_DataSource() = default;

    // ====================  ACCESSORS     =======================================

    // 'symbol' is 'BASE/QUOTE'. Returns at most 'limit' of the most recent candles,
    // oldest first.
    [[nodiscard]] virtual PC_Series FetchOHLCV(const std::string &symbol, const std::string &timeframe,
                                               int32_t limit) const = 0;

    // ====================  OPERATORS     =======================================

    PC_DataSource &operator=(const PC_DataSource &rhs) = delete;
    PC_DataSource &operator=(PC_DataSource &&rhs) = delete;

};  // -----  end of class PC_DataSource  -----

// =====================================================================================
//        Class:  PC_FileDataSource
//  Description:  reads <directory>/<BASEQUOTE>_<timeframe>.csv (or .json)
// =====================================================================================
class PC_FileDataSource : public PC_DataSource
{
public:
    // ====================  LIFECYCLE     =======================================

    PC_FileDataSource() = delete;
    explicit PC_FileDataSource(fs::path data_directory);

    ~PC_FileDataSource() override = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] PC_Series FetchOHLCV(const std::string &symbol, const std::string &timeframe,
                                       int32_t limit) const override;

    [[nodiscard]] static PC_Series ParseCSV(std::string_view file_content);
    [[nodiscard]] static PC_Series ParseJSON(std::string_view file_content);

private:
    // ====================  DATA MEMBERS  =======================================

    fs::path data_directory_;

};  // -----  end of class PC_FileDataSource  -----

// 'btc/usdt' -> 'BTCUSDT'
[[nodiscard]] std::string SymbolToPair(std::string_view symbol);

// case insensitive lookup of a column name in a delimited header record
[[nodiscard]] std::optional<int> FindColumnIndex(std::string_view header, std::string_view column_name,
                                                 std::string_view delim);

// sort by time and keep only the most recent 'limit' candles
[[nodiscard]] PC_Series KeepMostRecent(PC_Series series, int32_t limit);

#endif // ----- #ifndef PC_DATASOURCE_INC_  -----
