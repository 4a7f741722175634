// =====================================================================================
//
//       Filename:  PC_BinanceSource.h
//
//    Description:  candles from the Binance klines REST API
//
//        Version:  1.0
//        Created:  2025-03-08 02:45 PM
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

#ifndef PC_BINANCESOURCE_INC_
#define PC_BINANCESOURCE_INC_

#include <string>
#include <string_view>

#include "PC_DataSource.h"
#include "utilities.h"

// =====================================================================================
//        Class:  PC_BinanceSource
//  Description:  synchronous HTTPS GET of /api/v3/klines. No API key needed.
// =====================================================================================
class PC_BinanceSource : public PC_DataSource
{
public:
    using Host = UniqType<std::string, struct Host_Tag>;
    using Port = UniqType<std::string, struct Port_Tag>;

    // ====================  LIFECYCLE     =======================================

    PC_BinanceSource() = delete;
    PC_BinanceSource(const Host &host, const Port &port);

    ~PC_BinanceSource() override = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] PC_Series FetchOHLCV(const std::string &symbol, const std::string &timeframe,
                                       int32_t limit) const override;

    [[nodiscard]] static std::string MakeKlinesRequest(std::string_view symbol, std::string_view timeframe,
                                                       int32_t limit);

    // the response body is either an array of klines or an error object
    [[nodiscard]] static PC_Series ParseKlinesResponse(std::string_view response);

private:
    [[nodiscard]] std::string RequestData(const std::string &request_string) const;

    // ====================  DATA MEMBERS  =======================================

    std::string host_;
    std::string port_;
    int version_ = 11;

};  // -----  end of class PC_BinanceSource  -----

#endif // ----- #ifndef PC_BINANCESOURCE_INC_  -----
