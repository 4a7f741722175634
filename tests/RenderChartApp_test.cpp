// =====================================================================================
//
//       Filename:  RenderChartApp_test.cpp
//
//    Description:  drive the application the way the command line does, using
//                  candles from local files.
//
//        Version:  1.0
//        Created:  2025-03-12 11:15 AM
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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <fstream>
#include <string>
#include <vector>

#include "PC_RenderChartApp.h"

using namespace std::string_literals;
using namespace testing;

class RenderChartAppTest : public Test
{
protected:
    void SetUp() override
    {
        data_dir_ = fs::temp_directory_path() / "pc_render_chart_app_test";
        fs::remove_all(data_dir_);
        fs::create_directories(data_dir_);

        std::ofstream csv{data_dir_ / "BTCUSDT_1h.csv"};
        csv << "timestamp,open,high,low,close,volume\n";
        double price = 42000;
        for (int64_t i = 0; i < 50; ++i)
        {
            const double close = price + (i % 3 == 0 ? -150 : 200);
            csv << std::format("{},{},{},{},{},{}\n", 1'700'000'000'000 + i * 3'600'000, price,
                               std::max(price, close) + 50, std::min(price, close) - 50, close, 10 + i);
            price = close;
        }
    }

    void TearDown() override { fs::remove_all(data_dir_); }

    // every test reads from the local files and keeps quiet
    std::vector<std::string> Tokens(std::vector<std::string> extra) const
    {
        std::vector<std::string> tokens{"--exchange", "file", "--data-dir", data_dir_.string(), "--log-level", "none"};
        tokens.insert(tokens.end(), extra.begin(), extra.end());
        return tokens;
    }

    fs::path data_dir_;
};

TEST_F(RenderChartAppTest, SingleChartIsWritten)
{
    const auto output = data_dir_ / "single.png";
    PC_RenderChartApp app{Tokens({"--symbol", "BTC/USDT", "--timeframe", "1h", "--output", output.string(), "--vwap",
                                  "--levels", "42500:#ff0000:dashed:R1"})};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.GetMode(), PC_RenderChartApp::Mode::e_single);

    const auto summary = app.Run();
    app.Shutdown();
    EXPECT_EQ(summary.succeeded_, 1);
    EXPECT_EQ(summary.failed_, 0);
    ASSERT_TRUE(fs::exists(output));
    EXPECT_GT(fs::file_size(output), 0);
}

TEST_F(RenderChartAppTest, MissingDataIsCountedAsAFailure)
{
    PC_RenderChartApp app{Tokens({"--symbol", "DOGE/USDT", "--output", (data_dir_ / "doge.png").string()})};
    ASSERT_TRUE(app.Startup());
    const auto summary = app.Run();
    EXPECT_EQ(summary.succeeded_, 0);
    EXPECT_EQ(summary.failed_, 1);
    EXPECT_FALSE(fs::exists(data_dir_ / "doge.png"));
}

TEST_F(RenderChartAppTest, FetchOnlyDrawsNothing)
{
    PC_RenderChartApp app{Tokens({"--fetch", "--limit", "20", "--output", (data_dir_ / "unused.png").string()})};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.GetMode(), PC_RenderChartApp::Mode::e_fetch);

    const auto summary = app.Run();
    EXPECT_EQ(summary.succeeded_, 1);
    EXPECT_EQ(app.GetFetchedSeries().size(), 20);
    EXPECT_TRUE(ValidateSeries(app.GetFetchedSeries()));
    EXPECT_FALSE(fs::exists(data_dir_ / "unused.png"));
}

TEST_F(RenderChartAppTest, FetchedCandlesCanBeSavedAndReloaded)
{
    const auto saved = data_dir_ / "ETHUSDT_1h.json";
    PC_RenderChartApp app{Tokens({"--fetch", "--limit", "10", "--save-to", saved.string()})};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.Run().succeeded_, 1);
    ASSERT_TRUE(fs::exists(saved));

    // the saved file serves as data for another symbol
    const PC_FileDataSource source{data_dir_};
    const auto reloaded = source.FetchOHLCV("ETH/USDT", "1h", 100);
    ASSERT_EQ(reloaded.size(), 10);
    EXPECT_EQ(reloaded.front().time_, app.GetFetchedSeries().front().time_);
    EXPECT_DOUBLE_EQ(reloaded.back().close_, app.GetFetchedSeries().back().close_);
    ASSERT_TRUE(reloaded.back().volume_);
    EXPECT_DOUBLE_EQ(reloaded.back().volume_.value(), 59);

    PC_RenderChartApp not_fetching{Tokens({"--save-to", saved.string()})};
    EXPECT_FALSE(not_fetching.Startup());
}

TEST_F(RenderChartAppTest, BadArgumentsStopStartup)
{
    PC_RenderChartApp bad_type{Tokens({"--chart-type", "pie"})};
    EXPECT_FALSE(bad_type.Startup());

    PC_RenderChartApp bad_output{Tokens({"--output", "chart.tiff"})};
    EXPECT_FALSE(bad_output.Startup());

    PC_RenderChartApp bad_levels{Tokens({"--levels", "lots:#ff0000"})};
    EXPECT_FALSE(bad_levels.Startup());

    PC_RenderChartApp two_modes{Tokens({"--fetch", "--compare", "BTC/USDT,ETH/USDT"})};
    EXPECT_FALSE(two_modes.Startup());

    PC_RenderChartApp no_data_dir{std::vector<std::string>{"--exchange", "file", "--log-level", "none"}};
    EXPECT_FALSE(no_data_dir.Startup());

    PC_RenderChartApp bad_exchange{std::vector<std::string>{"--exchange", "kraken", "--log-level", "none"}};
    EXPECT_FALSE(bad_exchange.Startup());
}

TEST_F(RenderChartAppTest, IndicatorOptions)
{
    PC_RenderChartApp defaults{Tokens({})};
    ASSERT_TRUE(defaults.Startup());
    EXPECT_FALSE(defaults.GetChartConfig().show_ema_);
    EXPECT_FALSE(defaults.GetChartConfig().show_sma_);
    EXPECT_TRUE(defaults.GetChartConfig().show_grid_);

    PC_RenderChartApp plain{Tokens({"--ema", "--sma=50", "--hide-grid", "--hide-title"})};
    ASSERT_TRUE(plain.Startup());
    const auto &config = plain.GetChartConfig();
    EXPECT_TRUE(config.show_ema_);
    EXPECT_EQ(config.ema_period_, 20);
    EXPECT_TRUE(config.show_sma_);
    EXPECT_EQ(config.sma_period_, 50);
    EXPECT_FALSE(config.show_grid_);
    EXPECT_FALSE(config.show_title_);
    EXPECT_TRUE(config.show_time_axis_);
}

TEST_F(RenderChartAppTest, ScaleAndColorOptions)
{
    PC_RenderChartApp app{Tokens({"--scale-x", "1.5", "--min-scale", "41000", "--auto-scale", "--custom-colors",
                                  "bullish=#00ff88,wick=#888888", "--background-color", "#000000"})};
    ASSERT_TRUE(app.Startup());
    const auto &config = app.GetChartConfig();
    ASSERT_TRUE(config.scale_.x_);
    EXPECT_DOUBLE_EQ(config.scale_.x_.value(), 1.5);
    EXPECT_FALSE(config.scale_.y_);
    ASSERT_TRUE(config.scale_.min_scale_);
    EXPECT_DOUBLE_EQ(config.scale_.min_scale_.value(), 41000);
    EXPECT_TRUE(config.scale_.auto_scale_);
    EXPECT_EQ(config.custom_bar_colors_.bullish_.value_or(0), 0x00FF88);
    EXPECT_EQ(config.custom_bar_colors_.wick_.value_or(0), 0x888888);
    ASSERT_TRUE(config.background_color_);
    EXPECT_EQ(config.background_color_.value(), 0x000000);
}

TEST_F(RenderChartAppTest, CompareDefaults)
{
    PC_RenderChartApp app{Tokens({"--compare", "BTC/USDT, ETH/USDT"})};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.GetMode(), PC_RenderChartApp::Mode::e_compare);

    const auto &config = app.GetComparisonConfig();
    EXPECT_THAT(config.symbols_, ElementsAre("BTC/USDT"s, "ETH/USDT"s));
    EXPECT_EQ(config.width_, 1600);
    EXPECT_EQ(config.height_, 800);
    EXPECT_EQ(config.output_path_.string(), "comparison.png");
    EXPECT_EQ(config.layout_.type_, PC_LayoutType::e_side_by_side);
    EXPECT_EQ(config.layout_.EffectiveGap(), 20);
}

TEST_F(RenderChartAppTest, CompareGridLimits)
{
    PC_RenderChartApp too_many_columns{Tokens({"--compare", "BTC/USDT", "--layout", "grid", "--columns", "3"})};
    EXPECT_FALSE(too_many_columns.Startup());

    PC_RenderChartApp too_many_symbols{
        Tokens({"--compare", "BTC/USDT,ETH/USDT,SOL/USDT", "--layout", "grid"})};
    EXPECT_FALSE(too_many_symbols.Startup());

    PC_RenderChartApp bad_layout{Tokens({"--compare", "BTC/USDT", "--layout", "diagonal"})};
    EXPECT_FALSE(bad_layout.Startup());

    PC_RenderChartApp grid{Tokens({"--compare", "BTC/USDT,ETH/USDT", "--layout", "grid", "--gap", "30"})};
    ASSERT_TRUE(grid.Startup());
    EXPECT_EQ(grid.GetComparisonConfig().layout_.EffectiveGap(), 30);
}

TEST_F(RenderChartAppTest, CompareSkipsWhatItCantFetch)
{
    const auto output = data_dir_ / "compare.png";
    PC_RenderChartApp app{Tokens({"--compare", "BTC/USDT,ETH/USDT", "--output", output.string()})};
    ASSERT_TRUE(app.Startup());

    // there is no ETH file. The BTC chart still gets drawn.
    const auto summary = app.Run();
    EXPECT_EQ(summary.succeeded_, 1);
    EXPECT_TRUE(fs::exists(output));
}

TEST_F(RenderChartAppTest, BatchCountsEachItem)
{
    const auto batch_file = data_dir_ / "batch.json";
    {
        std::ofstream batch{batch_file};
        batch << std::format(R"([
            {{"symbol": "BTC/USDT", "timeframe": "1h", "exchange": "file", "chartType": "heikin-ashi",
              "outputPath": "{}"}},
            {{"symbol": "BTC/USDT", "timeframe": "1h", "exchange": "file", "chartType": "pie",
              "outputPath": "{}"}}
        ])",
                             (data_dir_ / "batch_1.png").string(), (data_dir_ / "batch_2.png").string());
    }

    PC_RenderChartApp app{Tokens({"--batch", batch_file.string()})};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.GetMode(), PC_RenderChartApp::Mode::e_batch);

    const auto summary = app.Run();
    EXPECT_EQ(summary.succeeded_, 1);
    EXPECT_EQ(summary.failed_, 1);
    EXPECT_TRUE(fs::exists(data_dir_ / "batch_1.png"));
    EXPECT_FALSE(fs::exists(data_dir_ / "batch_2.png"));
}
