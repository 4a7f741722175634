// =====================================================================================
//
//       Filename:  PC_BinanceSource.cpp
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

#include <memory>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include <spdlog/spdlog.h>

namespace beast = boost::beast;  // from <boost/beast.hpp>
namespace http = beast::http;    // from <boost/beast/http.hpp>
namespace net = boost::asio;     // from <boost/asio.hpp>
namespace ssl = boost::asio::ssl;  // from <boost/asio/ssl.hpp>
using tcp = boost::asio::ip::tcp;  // from <boost/asio/ip/tcp.hpp>

#include "PC_BinanceSource.h"
#include "PC_Errors.h"

using namespace std::string_literals;

//--------------------------------------------------------------------------------------
//       Class:  PC_BinanceSource
//      Method:  PC_BinanceSource
// Description:  constructor
//--------------------------------------------------------------------------------------
PC_BinanceSource::PC_BinanceSource(const Host &host, const Port &port) : host_{host.get()}, port_{port.get()}
{
}  // -----  end of method PC_BinanceSource::PC_BinanceSource  (constructor)  -----

std::string PC_BinanceSource::MakeKlinesRequest(std::string_view symbol, std::string_view timeframe, int32_t limit)
{
    return std::format("/api/v3/klines?symbol={}&interval={}&limit={}", SymbolToPair(symbol), timeframe, limit);
}  // -----  end of method PC_BinanceSource::MakeKlinesRequest  -----

PC_Series PC_BinanceSource::FetchOHLCV(const std::string &symbol, const std::string &timeframe, int32_t limit) const
{
    const auto request = MakeKlinesRequest(symbol, timeframe, limit);
    spdlog::debug(std::format("Requesting: https://{}{}", host_, request));

    try
    {
        return KeepMostRecent(ParseKlinesResponse(RequestData(request)), limit);
    }
    catch (const std::exception &e)
    {
        throw PC_DataFetchError(std::format("Failed to fetch data for {} {}: {}", symbol, timeframe, e.what()));
    }
}  // -----  end of method PC_BinanceSource::FetchOHLCV  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_BinanceSource
//      Method:  PC_BinanceSource::ParseKlinesResponse
// Description:  [[open_time, "open", "high", "low", "close", "volume", close_time, ...], ...]
//--------------------------------------------------------------------------------------
PC_Series PC_BinanceSource::ParseKlinesResponse(std::string_view response)
{
    JSONCPP_STRING err;
    Json::Value klines;

    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(response.data(), response.data() + response.size(), &klines, &err))
    {
        throw PC_DataFetchError("Problem parsing Binance response: "s + err);
    }

    if (klines.isObject() && klines.isMember("code"))
    {
        throw PC_DataFetchError(std::format("Binance error {}: {}", klines["code"].asInt(), klines["msg"].asString()));
    }
    if (!klines.isArray())
    {
        throw PC_DataFetchError("Unexpected Binance response. Expected an array of klines.");
    }
    return SeriesFromJSON(klines);
}  // -----  end of method PC_BinanceSource::ParseKlinesResponse  -----

std::string PC_BinanceSource::RequestData(const std::string &request_string) const
{
    net::io_context ioc;
    ssl::context ctx{ssl::context::tlsv12_client};
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    tcp::resolver resolver{ioc};

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str()))
    {
        throw beast::system_error{
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category())};
    }

    auto const results = resolver.resolve(host_, port_);
    beast::get_lowest_layer(stream).connect(results);
    stream.handshake(ssl::stream_base::client);

    http::request<http::string_body> req{http::verb::get, request_string, version_};
    req.set(http::field::host, host_);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    // the server may just drop the connection so a failed shutdown is expected

    beast::error_code ec;
    stream.shutdown(ec);
    if (ec && ec != net::ssl::error::stream_truncated && ec != net::error::eof)
    {
        spdlog::debug(std::format("TLS shutdown: {}", ec.message()));
    }

    if (res.result() != http::status::ok)
    {
        // Binance puts its {code, msg} error object in the body. Prefer that.

        try
        {
            static_cast<void>(ParseKlinesResponse(res.body()));
        }
        catch (const PC_DataFetchError &e)
        {
            throw PC_DataFetchError(std::format("HTTP {}. {}", res.result_int(), e.what()));
        }
        throw PC_DataFetchError(std::format("HTTP {}.", res.result_int()));
    }
    return res.body();
}  // -----  end of method PC_BinanceSource::RequestData  -----
