// =====================================================================================
//
//       Filename:  PC_RenderChartApp.cpp
//
//    Description:  application specific stuff
//
//        Version:  1.0
//        Created:  2025-03-12 09:00 AM
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
#include <chrono>
#include <format>
#include <fstream>
#include <iostream>
#include <map>
#include <ranges>

namespace rng = std::ranges;

#include <boost/assert.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "PC_BinanceSource.h"
#include "PC_ChartRenderer.h"
#include "PC_Errors.h"
#include "PC_RenderChartApp.h"

using namespace std::string_literals;

//--------------------------------------------------------------------------------------
//       Class:  PC_RenderChartApp
//      Method:  PC_RenderChartApp
// Description:  constructor
//--------------------------------------------------------------------------------------
PC_RenderChartApp::PC_RenderChartApp(int argc, char *argv[])
    : argc_{argc}, argv_{argv}
{
}  // -----  end of method PC_RenderChartApp::PC_RenderChartApp  (constructor)  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_RenderChartApp
//      Method:  PC_RenderChartApp
// Description:  constructor
//--------------------------------------------------------------------------------------
PC_RenderChartApp::PC_RenderChartApp(const std::vector<std::string> &tokens)
    : tokens_{tokens}
{
}  // -----  end of method PC_RenderChartApp::PC_RenderChartApp  (constructor)  -----

void PC_RenderChartApp::ConfigureLogging()
{
    // we need to set log level if specified and also log file.

    if (!log_file_path_name_.empty())
    {
        // if we are running inside our test harness, logging may already by
        // running so we don't want to clobber it.
        // different tests may use different names.

        auto logger_name = log_file_path_name_.filename().string();
        logger_ = spdlog::get(logger_name);
        if (!logger_)
        {
            fs::path log_dir = log_file_path_name_.parent_path();
            if (!log_dir.empty() && !fs::exists(log_dir))
            {
                fs::create_directories(log_dir);
            }

            logger_ = spdlog::basic_logger_mt<spdlog::async_factory>(logger_name, log_file_path_name_.string());
            spdlog::set_default_logger(logger_);
        }
    }

    // we are running before 'CheckArgs' so we need to do a little editiing
    // ourselves.

    const std::map<std::string, spdlog::level::level_enum> levels{{"none", spdlog::level::off},
                                                                  {"error", spdlog::level::err},
                                                                  {"information", spdlog::level::info},
                                                                  {"debug", spdlog::level::debug}};

    auto which_level = levels.find(logging_level_);
    BOOST_ASSERT_MSG(
        which_level != levels.end(),
        std::format("log-level: {} must be 1 of 'none', 'error', 'information', 'debug'.", logging_level_).c_str());

    spdlog::set_level(which_level->second);

}  // -----  end of method PC_RenderChartApp::ConfigureLogging  -----

bool PC_RenderChartApp::Startup()
{
    spdlog::info(std::format("\n\n*** Starting run {:%a, %b %d, %Y at %T} UTC ***\n",
                             std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())));
    bool result{true};
    try
    {
        SetupProgramOptions();
        ParseProgramOptions(tokens_);
        ConfigureLogging();
        result = CheckArgs();
    }
    catch (const std::exception &e)
    {
        spdlog::error(std::format("Problem in startup: {}\n", e.what()));
        //	we're outta here!

        result = false;
    }
    return result;
}  // -----  end of method PC_RenderChartApp::Startup  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_RenderChartApp
//      Method:  PC_RenderChartApp::ApplyChartOptions
// Description:  the options program_options can't fill in directly
//--------------------------------------------------------------------------------------
void PC_RenderChartApp::ApplyChartOptions()
{
    auto optional_double = [this](const char *name, std::optional<double> &target)
    {
        if (variablemap_.count(name) > 0)
        {
            target = variablemap_[name].as<double>();
        }
    };
    optional_double("scale-x", chart_config_.scale_.x_);
    optional_double("scale-y", chart_config_.scale_.y_);
    optional_double("min-scale", chart_config_.scale_.min_scale_);
    optional_double("max-scale", chart_config_.scale_.max_scale_);

    if (!custom_colors_i_.empty())
    {
        chart_config_.custom_bar_colors_ = ParseCustomColors(custom_colors_i_);
    }
    if (!levels_i_.empty())
    {
        chart_config_.levels_ = ParseLevels(levels_i_);
    }
    if (!background_color_i_.empty())
    {
        chart_config_.background_color_ = ParseColor(background_color_i_);
    }
    if (!text_color_i_.empty())
    {
        chart_config_.text_color_ = ParseColor(text_color_i_);
    }
    if (!watermark_color_i_.empty())
    {
        chart_config_.watermark_color_ = ParseColor(watermark_color_i_);
    }

    chart_config_.show_title_ = !hide_title_;
    chart_config_.show_time_axis_ = !hide_time_axis_;
    chart_config_.show_grid_ = !hide_grid_;

    // the periods have implicit values so their presence turns them on

    chart_config_.show_ema_ = variablemap_.count("ema") > 0;
    chart_config_.show_sma_ = variablemap_.count("sma") > 0;

    if (!output_path_i_.empty())
    {
        chart_config_.output_path_ = output_path_i_;
    }

    if (variablemap_.count("gap") > 0)
    {
        gap_ = variablemap_["gap"].as<int32_t>();
    }
}  // -----  end of method PC_RenderChartApp::ApplyChartOptions  -----

bool PC_RenderChartApp::CheckArgs()
{
    //	an easy check first

    const int modes_requested = static_cast<int>(fetch_only_) + static_cast<int>(!batch_file_.empty()) +
                                static_cast<int>(!compare_i_.empty());
    BOOST_ASSERT_MSG(modes_requested <= 1, "\nUse only 1 of: --fetch, --batch, --compare.");
    BOOST_ASSERT_MSG(save_to_.empty() || fetch_only_, "\n'save-to' can only be used with 'fetch'.");

    mode_ = !batch_file_.empty()  ? Mode::e_batch
            : !compare_i_.empty() ? Mode::e_compare
            : fetch_only_         ? Mode::e_fetch
                                  : Mode::e_single;

    ApplyChartOptions();

    BOOST_ASSERT_MSG(chart_config_.exchange_ == "binance" || chart_config_.exchange_ == "file",
                     std::format("\nExchange must be: 'binance' or 'file': {}", chart_config_.exchange_).c_str());
    if (chart_config_.exchange_ == "file")
    {
        BOOST_ASSERT_MSG(!data_directory_.empty(), "\nMust specify 'data-dir' when exchange is 'file'.");
        BOOST_ASSERT_MSG(fs::exists(data_directory_),
                         std::format("\nCan't find data directory: {}", data_directory_.string()).c_str());
    }

    switch (mode_)
    {
        using enum Mode;
        case e_single:
        case e_fetch:
            chart_config_.Validate();
            break;

        case e_batch:
            BOOST_ASSERT_MSG(fs::exists(batch_file_),
                             std::format("\nCan't find batch file: {}", batch_file_.string()).c_str());
            break;

        case e_compare:
        {
            comparison_config_.symbols_.clear();
            rng::for_each(split_string<std::string_view>(compare_i_, ","),
                          [this](const auto symbol)
                          {
                              if (!trim(symbol).empty())
                              {
                                  comparison_config_.symbols_.emplace_back(trim(symbol));
                              }
                          });
            BOOST_ASSERT_MSG(!comparison_config_.symbols_.empty(), "\nMust specify at least 1 symbol to compare.");

            comparison_config_.timeframes_.clear();
            rng::for_each(split_string<std::string_view>(timeframes_i_, ","),
                          [this](const auto timeframe)
                          {
                              if (!trim(timeframe).empty())
                              {
                                  comparison_config_.timeframes_.emplace_back(trim(timeframe));
                              }
                          });

            comparison_config_.layout_ = {.type_ = ParseLayoutType(layout_i_), .columns_ = columns_, .gap_ = gap_};
            if (comparison_config_.layout_.type_ == PC_LayoutType::e_grid)
            {
                CheckGridConstraints(comparison_config_.symbols_, columns_);
            }

            // comparisons have their own default size and output name

            if (variablemap_["width"].defaulted())
            {
                chart_config_.width_ = 1600;
            }
            if (output_path_i_.empty())
            {
                chart_config_.output_path_ = "comparison.png";
            }

            // every cell must be something we could draw on its own

            for (const auto &symbol : comparison_config_.symbols_)
            {
                auto cell_config = chart_config_;
                cell_config.symbol_ = symbol;
                cell_config.Validate();
            }
            for (const auto &timeframe : comparison_config_.timeframes_)
            {
                if (!IsValidTimeframe(timeframe))
                {
                    throw PC_ConfigurationError(std::format("Invalid timeframe: {}", timeframe));
                }
            }

            comparison_config_.timeframe_ = chart_config_.timeframe_;
            comparison_config_.limit_ = chart_config_.limit_;
            comparison_config_.width_ = chart_config_.width_;
            comparison_config_.height_ = chart_config_.height_;
            comparison_config_.cell_options_ = chart_config_.ToRenderOptions();
            comparison_config_.output_path_ = chart_config_.output_path_;
            break;
        }
    }

    spdlog::debug(std::format("Configuration: {}", chart_config_));

    return true;
}  // -----  end of method PC_RenderChartApp::CheckArgs  -----

// clang-format off

void PC_RenderChartApp::SetupProgramOptions ()
{
    newoptions_ = std::make_unique<po::options_description>();

	newoptions_->add_options()
		("help,h",											"produce help message")
		("symbol,s",			po::value<std::string>(&this->chart_config_.symbol_)->default_value("BTC/USDT"),	"trading pair to chart: BASE/QUOTE. Default is 'BTC/USDT'.")
		("timeframe,t",			po::value<std::string>(&this->chart_config_.timeframe_)->default_value("1h"),	"candle interval: 1m, 5m, 15m, 30m, 1h, 4h, 1d, 1w. Default is '1h'.")
		("exchange,e",			po::value<std::string>(&this->chart_config_.exchange_)->default_value("binance"),	"where data comes from: 'binance' or 'file'. Default is 'binance'.")
		("data-dir",			po::value<fs::path>(&this->data_directory_),	"directory containing <BASEQUOTE>_<timeframe>.csv or .json files when exchange is 'file'.")
		("limit",				po::value<int32_t>(&this->chart_config_.limit_)->default_value(100),	"number of candles to fetch. Default is 100.")
		("output,o",			po::value<std::string>(&this->output_path_i_),	"output image file. Extension selects the format: .png, .jpg, .jpeg or .svg. Default is 'chart.png'.")
		("width,w",				po::value<int32_t>(&this->chart_config_.width_)->default_value(1200),	"image width in pixels. Default is 1200 (1600 for comparisons).")
		("height",				po::value<int32_t>(&this->chart_config_.height_)->default_value(800),	"image height in pixels. Default is 800.")
		("theme",				po::value<std::string>(&this->chart_config_.theme_)->default_value("dark"),	"'dark' or 'light'. Default is 'dark'.")
		("chart-type",			po::value<std::string>(&this->chart_config_.chart_type_)->default_value("candlestick"),	"candlestick, line, area, heikin-ashi, renko or line-break. Default is 'candlestick'.")

		("scale-x",				po::value<double>(),	"multiplier applied to the price range.")
		("scale-y",				po::value<double>(),	"multiplier applied to the price range after 'scale-x'.")
		("auto-scale",			po::value<bool>(&this->chart_config_.scale_.auto_scale_)->default_value(false)->implicit_value(true),	"pad the price range by 5% on both ends.")
		("min-scale",			po::value<double>(),	"lowest price to show.")
		("max-scale",			po::value<double>(),	"highest price to show.")

		("custom-colors",		po::value<std::string>(&this->custom_colors_i_),	"bar colors: type=color,... where type is bullish, bearish, wick or border.")
		("levels",				po::value<std::string>(&this->levels_i_),	"horizontal levels: value:color:style:label,... where style is solid, dotted or dashed.")
		("background-color",	po::value<std::string>(&this->background_color_i_),	"override the theme background color.")
		("text-color",			po::value<std::string>(&this->text_color_i_),	"override the theme text color.")

		("title",				po::value<std::string>(&this->chart_config_.title_),	"chart title. Default is 'SYMBOL TIMEFRAME'.")
		("watermark",			po::value<std::string>(&this->chart_config_.watermark_),	"watermark text.")
		("watermark-position",	po::value<std::string>(&this->chart_config_.watermark_position_)->default_value("bottom-right"),	"top, center, bottom, top-left, top-right, bottom-left or bottom-right. Default is 'bottom-right'.")
		("watermark-color",		po::value<std::string>(&this->watermark_color_i_),	"watermark color. Default comes from the theme.")
		("watermark-size",		po::value<double>(&this->chart_config_.watermark_size_)->default_value(12),	"watermark font size. Default is 12.")
		("watermark-opacity",	po::value<double>(&this->chart_config_.watermark_opacity_)->default_value(0.3),	"watermark opacity from 0 to 1. Default is 0.3.")

		("hide-title",			po::value<bool>(&this->hide_title_)->default_value(false)->implicit_value(true),	"don't draw the title.")
		("hide-time-axis",		po::value<bool>(&this->hide_time_axis_)->default_value(false)->implicit_value(true),	"don't draw the time labels.")
		("hide-grid",			po::value<bool>(&this->hide_grid_)->default_value(false)->implicit_value(true),	"don't draw the grid.")

		("vwap",				po::value<bool>(&this->chart_config_.show_vwap_)->default_value(false)->implicit_value(true),	"draw VWAP when the data has volume.")
		("ema",					po::value<int32_t>(&this->chart_config_.ema_period_)->implicit_value(20),	"draw EMA. Use --ema=N for a period other than 20.")
		("sma",					po::value<int32_t>(&this->chart_config_.sma_period_)->implicit_value(20),	"draw SMA. Use --sma=N for a period other than 20.")
		("renko-brick-pct",		po::value<double>(&this->chart_config_.renko_brick_pct_)->default_value(0.02),	"Renko brick size as a fraction of price. Default is 0.02.")
		("line-break-count",	po::value<int32_t>(&this->chart_config_.line_break_count_)->default_value(3),	"lines to look back for a line-break reversal. Default is 3.")

		("fetch",				po::value<bool>(&this->fetch_only_)->default_value(false)->implicit_value(true),	"fetch and report candles without drawing anything.")
		("save-to",				po::value<fs::path>(&this->save_to_),	"with 'fetch', write the candles to this JSON file. Name it <BASEQUOTE>_<timeframe>.json to use it with 'exchange=file'.")
		("batch",				po::value<fs::path>(&this->batch_file_),	"JSON file containing an array of chart configurations to render.")
		("compare",				po::value<std::string>(&this->compare_i_),	"comma-delimited list of symbols to draw on 1 image.")
		("layout",				po::value<std::string>(&this->layout_i_)->default_value("side-by-side"),	"comparison layout: 'side-by-side' or 'grid'. Default is 'side-by-side'.")
		("columns",				po::value<int32_t>(&this->columns_)->default_value(2),	"grid columns. At most 2. Default is 2.")
		("gap",					po::value<int32_t>(),	"pixels between comparison charts. Default is 20 (15 for grid).")
		("timeframes",			po::value<std::string>(&this->timeframes_i_),	"comma-delimited timeframes to compare for the first symbol.")

        ("binance-host",        po::value<std::string>(&this->binance_host_)->default_value("api.binance.com"), "web site we download from. Default is 'api.binance.com'.")
        ("binance-port",        po::value<std::string>(&this->binance_port_)->default_value("443"), "Port number to use for web site. Default is '443'.")

		("log-path",            po::value<fs::path>(&log_file_path_name_),	"path name for log file.")
		("log-level,l",         po::value<std::string>(&logging_level_)->default_value("information"), "logging level. Must be 'none|error|information|debug'. Default is 'information'.")
		;

}		// -----  end of method PC_RenderChartApp::SetupProgramOptions  -----

// clang-format on

void PC_RenderChartApp::ParseProgramOptions(const std::vector<std::string> &tokens)
{
    if (tokens.empty())
    {
        auto options = po::parse_command_line(argc_, argv_, *newoptions_);
        po::store(options, variablemap_);
        if (this->argc_ == 1 || variablemap_.count("help") == 1)
        {
            std::cout << *newoptions_ << "\n";
            throw std::runtime_error("\nExiting after 'help'.");
        }
    }
    else
    {
        auto options = po::command_line_parser(tokens).options(*newoptions_).run();
        po::store(options, variablemap_);
        if (variablemap_.count("help") == 1)
        {
            std::cout << *newoptions_ << "\n";
            throw std::runtime_error("\nExiting after 'help'.");
        }
    }
    po::notify(variablemap_);
}  // -----  end of method PC_RenderChartApp::ParseProgramOptions  -----

PC_RenderChartApp::RunSummary PC_RenderChartApp::Run()
{
    switch (mode_)
    {
        using enum Mode;
        case e_single:
            return Run_Single();

        case e_compare:
            return Run_Compare();

        case e_batch:
            return Run_Batch();

        case e_fetch:
            return Run_Fetch();
    }
    return {};
}  // -----  end of method PC_RenderChartApp::Run  -----

std::unique_ptr<PC_DataSource> PC_RenderChartApp::MakeDataSource(const std::string &exchange) const
{
    if (exchange == "file")
    {
        return std::make_unique<PC_FileDataSource>(data_directory_);
    }
    if (exchange == "binance")
    {
        return std::make_unique<PC_BinanceSource>(PC_BinanceSource::Host{binance_host_},
                                                  PC_BinanceSource::Port{binance_port_});
    }
    throw PC_ConfigurationError(std::format("Unsupported exchange: '{}'. Must be 'binance' or 'file'.", exchange));
}  // -----  end of method PC_RenderChartApp::MakeDataSource  -----

PC_RenderChartApp::RunSummary PC_RenderChartApp::Run_Single()
{
    try
    {
        const auto data_source = MakeDataSource(chart_config_.exchange_);
        const auto series = data_source->FetchOHLCV(chart_config_.symbol_, chart_config_.timeframe_,
                                                    chart_config_.limit_);
        spdlog::info(std::format("Fetched {} candles for: {} {}.", series.size(), chart_config_.symbol_,
                                 chart_config_.timeframe_));

        const auto result = RenderChart(series, chart_config_.ToRenderOptions(), chart_config_.output_path_);
        return result.success_ ? RunSummary{.succeeded_ = 1, .failed_ = 0} : RunSummary{.succeeded_ = 0, .failed_ = 1};
    }
    catch (const std::exception &e)
    {
        spdlog::error(std::format("Unable to generate chart: {}. {}", chart_config_, e.what()));
    }
    return {.succeeded_ = 0, .failed_ = 1};
}  // -----  end of method PC_RenderChartApp::Run_Single  -----

PC_RenderChartApp::RunSummary PC_RenderChartApp::Run_Compare()
{
    try
    {
        const auto data_source = MakeDataSource(chart_config_.exchange_);
        const PC_ComparisonService service{*data_source, MakeCDSurface};
        const auto result = service.Generate(comparison_config_);
        spdlog::info(std::format("Comparison: {} cell(s) drawn, {} skipped.", result.cells_rendered_,
                                 result.cells_skipped_));
        if (result.success_)
        {
            return {.succeeded_ = 1, .failed_ = 0};
        }
        spdlog::error(std::format("Comparison failed: {}", result.error_));
    }
    catch (const std::exception &e)
    {
        spdlog::error(std::format("Comparison failed: {}", e.what()));
    }
    return {.succeeded_ = 0, .failed_ = 1};
}  // -----  end of method PC_RenderChartApp::Run_Compare  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_RenderChartApp
//      Method:  PC_RenderChartApp::Run_Batch
// Description:  each entry stands on its own. A bad one is reported and we
//               go on to the next.
//--------------------------------------------------------------------------------------
PC_RenderChartApp::RunSummary PC_RenderChartApp::Run_Batch()
{
    const auto file_content = LoadDataFileForUse(batch_file_);

    JSONCPP_STRING err;
    Json::Value batch;

    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(file_content.data(), file_content.data() + file_content.size(), &batch, &err))
    {
        throw PC_ConfigurationError("Problem parsing batch file: "s + err);
    }
    if (!batch.isArray())
    {
        throw PC_ConfigurationError("Batch file must contain an array of chart configurations.");
    }

    RunSummary summary;
    int32_t item_number = 0;
    for (const auto &item : batch)
    {
        ++item_number;
        try
        {
            const auto config = PC_ChartConfig::FromJSON(item);
            config.Validate();

            const auto data_source = MakeDataSource(config.exchange_);
            const auto series = data_source->FetchOHLCV(config.symbol_, config.timeframe_, config.limit_);
            const auto result = RenderChart(series, config.ToRenderOptions(), config.output_path_);
            if (result.success_)
            {
                ++summary.succeeded_;
                continue;
            }
            spdlog::error(std::format("Batch item {} failed: {}", item_number, result.error_));
        }
        catch (const std::exception &e)
        {
            spdlog::error(std::format("Batch item {} failed: {}", item_number, e.what()));
        }
        ++summary.failed_;
    }
    spdlog::info(
        std::format("Batch complete: {} succeeded, {} failed.", summary.succeeded_, summary.failed_));
    return summary;
}  // -----  end of method PC_RenderChartApp::Run_Batch  -----

PC_RenderChartApp::RunSummary PC_RenderChartApp::Run_Fetch()
{
    try
    {
        const auto data_source = MakeDataSource(chart_config_.exchange_);
        fetched_series_ = data_source->FetchOHLCV(chart_config_.symbol_, chart_config_.timeframe_,
                                                  chart_config_.limit_);

        spdlog::info(std::format("Fetched {} candles for: {} {}.", fetched_series_.size(), chart_config_.symbol_,
                                 chart_config_.timeframe_));
        if (!fetched_series_.empty())
        {
            spdlog::info(std::format("first: {}", fetched_series_.front()));
            spdlog::info(std::format("last: {}", fetched_series_.back()));
            spdlog::info(std::format("volume data: {}. valid: {}.", HasVolumeData(fetched_series_),
                                     ValidateSeries(fetched_series_)));
        }
        if (!save_to_.empty())
        {
            if (save_to_.has_parent_path() && !fs::exists(save_to_.parent_path()))
            {
                fs::create_directories(save_to_.parent_path());
            }
            std::ofstream out{save_to_, std::ios::out | std::ios::binary | std::ios::trunc};
            BOOST_ASSERT_MSG(out.is_open(), std::format("\nUnable to open file: {} for candle data.", save_to_.string()).c_str());
            ConvertSeriesToJsonAndWriteToStream(fetched_series_, out);
            out.close();
            spdlog::info(std::format("Saved {} candles to: {}.", fetched_series_.size(), save_to_.string()));
        }
        return {.succeeded_ = 1, .failed_ = 0};
    }
    catch (const std::exception &e)
    {
        spdlog::error(std::format("Unable to fetch data: {}", e.what()));
    }
    return {.succeeded_ = 0, .failed_ = 1};
}  // -----  end of method PC_RenderChartApp::Run_Fetch  -----

void PC_RenderChartApp::Shutdown()
{
    spdlog::info(std::format("\n\n*** End run {:%a, %b %d, %Y at %T} UTC ***\n",
                             std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())));
    if (logger_)
    {
        logger_->flush();
    }
}  // -----  end of method PC_RenderChartApp::Shutdown  -----
