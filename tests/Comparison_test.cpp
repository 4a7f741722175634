// =====================================================================================
//
//       Filename:  Comparison_test.cpp
//
//    Description:  tests for comparison layouts and cell assembly
//
//        Version:  1.0
//        Created:  2025-03-11 10:45 AM
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

#include <atomic>
#include <format>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "PC_Comparison.h"
#include "PC_Errors.h"
#include "RecordingSurface.h"

using namespace std::string_literals;
using namespace testing;

using Kind = PC_RecordedCall::Kind;

// =====================================================================================
//        Class:  InMemorySource
//  Description:  canned series by symbol. Anything else is a fetch failure.
// =====================================================================================
class InMemorySource : public PC_DataSource
{
public:
    explicit InMemorySource(std::map<std::string, PC_Series> data) : data_{std::move(data)} {}

    [[nodiscard]] PC_Series FetchOHLCV(const std::string &symbol, const std::string &timeframe,
                                       int32_t limit) const override
    {
        ++fetch_count_;
        auto found = data_.find(symbol);
        if (found == data_.end())
        {
            throw PC_DataFetchError(std::format("Failed to fetch data for {} {}: unknown symbol", symbol, timeframe));
        }
        return KeepMostRecent(found->second, limit);
    }

    mutable std::atomic<int> fetch_count_ = 0;

private:
    std::map<std::string, PC_Series> data_;
};

static PC_Series MakeSeries(double base, size_t count)
{
    PC_Series series;
    for (size_t i = 0; i < count; ++i)
    {
        const double open = base + static_cast<double>(i);
        series.push_back({.time_ = 1'700'000'000'000 + static_cast<int64_t>(i) * 3'600'000,
                          .open_ = open,
                          .high_ = open + 3,
                          .low_ = open - 1,
                          .close_ = open + 2,
                          .volume_ = 100});
    }
    return series;
}

static std::unique_ptr<PC_Surface> MakeRecordingSurface(int32_t width, int32_t height, PC_Color /* background */)
{
    return std::make_unique<PC_RecordingSurface>(width, height);
}

TEST(ComparisonLayout, SideBySideCells)
{
    const auto cells = ComputeCellRects(2, 1600, 800, {});
    ASSERT_EQ(cells.size(), 2);
    EXPECT_DOUBLE_EQ(cells[0].x_, 0);
    EXPECT_DOUBLE_EQ(cells[0].width_, 790);
    EXPECT_DOUBLE_EQ(cells[1].x_, 810);
    EXPECT_DOUBLE_EQ(cells[1].height_, 800);

    const auto one = ComputeCellRects(1, 1600, 800, {});
    ASSERT_EQ(one.size(), 1);
    EXPECT_DOUBLE_EQ(one[0].width_, 1600);

    const auto wide_gap = ComputeCellRects(2, 1600, 800, {.gap_ = 100});
    EXPECT_DOUBLE_EQ(wide_gap[0].width_, 750);

    EXPECT_TRUE(ComputeCellRects(0, 1600, 800, {}).empty());
}

TEST(ComparisonLayout, GridCells)
{
    const PC_ComparisonLayout two_columns{.type_ = PC_LayoutType::e_grid, .columns_ = 2};
    EXPECT_EQ(two_columns.EffectiveGap(), 15);

    const auto cells = ComputeCellRects(2, 1600, 800, two_columns);
    ASSERT_EQ(cells.size(), 2);
    EXPECT_DOUBLE_EQ(cells[0].width_, 792.5);
    EXPECT_DOUBLE_EQ(cells[0].height_, 800);
    EXPECT_DOUBLE_EQ(cells[1].x_, 807.5);
    EXPECT_DOUBLE_EQ(cells[1].y_, 0);

    const PC_ComparisonLayout one_column{.type_ = PC_LayoutType::e_grid, .columns_ = 1};
    const auto stacked = ComputeCellRects(2, 800, 800, one_column);
    ASSERT_EQ(stacked.size(), 2);
    EXPECT_DOUBLE_EQ(stacked[0].width_, 800);
    EXPECT_DOUBLE_EQ(stacked[0].height_, 392.5);
    EXPECT_DOUBLE_EQ(stacked[1].x_, 0);
    EXPECT_DOUBLE_EQ(stacked[1].y_, 407.5);
}

TEST(ComparisonLayout, GridLimits)
{
    EXPECT_NO_THROW(CheckGridConstraints({"BTC/USDT", "ETH/USDT"}, 2));

    try
    {
        CheckGridConstraints({"BTC/USDT", "ETH/USDT", "SOL/USDT"}, 2);
        FAIL() << "3 symbols in a grid should be refused";
    }
    catch (const PC_LayoutConstraintError &e)
    {
        EXPECT_STREQ(e.what(), "Grid layout supports maximum 2 symbols. Got 3 symbols: BTC/USDT, ETH/USDT, SOL/USDT");
    }

    try
    {
        CheckGridConstraints({"BTC/USDT"}, 3);
        FAIL() << "3 columns should be refused";
    }
    catch (const PC_LayoutConstraintError &e)
    {
        EXPECT_STREQ(e.what(), "Grid layout supports maximum 2 columns. Got 3 columns");
    }
}

TEST(ComparisonLayout, ParseLayoutType)
{
    EXPECT_EQ(ParseLayoutType("side-by-side"), PC_LayoutType::e_side_by_side);
    EXPECT_EQ(ParseLayoutType("grid"), PC_LayoutType::e_grid);
    EXPECT_THROW(auto l = ParseLayoutType("mosaic"), PC_ConfigurationError);
}

TEST(ComparisonLayout, MarginsShrinkWithTheCell)
{
    const auto margin = AdjustMargins(PC_Margin{}, 790, 800);
    EXPECT_DOUBLE_EQ(margin.top_, 59.25);
    EXPECT_DOUBLE_EQ(margin.bottom_, 39.5);
    EXPECT_DOUBLE_EQ(margin.left_, 59.25);
    EXPECT_DOUBLE_EQ(margin.right_, 39.5);

    const auto tiny = AdjustMargins(PC_Margin{}, 200, 150);
    EXPECT_DOUBLE_EQ(tiny.top_, 20);
    EXPECT_DOUBLE_EQ(tiny.bottom_, 15);
    EXPECT_DOUBLE_EQ(tiny.left_, 20);
    EXPECT_DOUBLE_EQ(tiny.right_, 15);
}

TEST(ComparisonTasks, SymbolsOrTimeframes)
{
    PC_ComparisonConfig config;
    config.symbols_ = {"BTC/USDT", "ETH/USDT"};
    config.timeframe_ = "4h";

    auto tasks = MakeComparisonTasks(config);
    ASSERT_EQ(tasks.size(), 2);
    EXPECT_EQ(tasks[1].symbol_, "ETH/USDT");
    EXPECT_EQ(tasks[1].timeframe_, "4h");

    // timeframe mode is capped by the number of symbols given
    config.timeframes_ = {"1h", "4h", "1d"};
    tasks = MakeComparisonTasks(config);
    ASSERT_EQ(tasks.size(), 2);
    EXPECT_EQ(tasks[0].symbol_, "BTC/USDT");
    EXPECT_EQ(tasks[1].symbol_, "BTC/USDT");
    EXPECT_EQ(tasks[0].timeframe_, "1h");
    EXPECT_EQ(tasks[1].timeframe_, "4h");
}

class ComparisonServiceTest : public Test
{
protected:
    ComparisonServiceTest()
        : source_{{{"BTC/USDT", MakeSeries(40000, 50)}, {"ETH/USDT", MakeSeries(2000, 50)}}},
          service_{source_, MakeRecordingSurface}
    {
        config_.width_ = 1600;
        config_.height_ = 800;
        config_.limit_ = 30;
        config_.output_path_ = "comparison.png";
    }

    InMemorySource source_;
    PC_ComparisonService service_;
    PC_ComparisonConfig config_;
};

TEST_F(ComparisonServiceTest, BothCellsArePlacedInOrder)
{
    config_.symbols_ = {"BTC/USDT", "ETH/USDT"};

    PC_RecordingSurface destination{1600, 800};
    const auto result = service_.Compose(config_, destination);
    EXPECT_TRUE(result.success_);
    EXPECT_EQ(result.cells_rendered_, 2);
    EXPECT_EQ(result.cells_skipped_, 0);
    EXPECT_EQ(source_.fetch_count_.load(), 2);

    const auto placed = destination.CallsOfKind(Kind::e_surface);
    ASSERT_EQ(placed.size(), 2);
    EXPECT_DOUBLE_EQ(placed[0].points_[0].x_, 0);
    EXPECT_DOUBLE_EQ(placed[0].points_[1].x_, 790);
    EXPECT_DOUBLE_EQ(placed[1].points_[0].x_, 810);
    EXPECT_DOUBLE_EQ(placed[1].points_[1].y_, 800);
}

TEST_F(ComparisonServiceTest, FailedFetchIsSkipped)
{
    config_.symbols_ = {"BTC/USDT", "NOPE/USDT"};

    PC_RecordingSurface destination{1600, 800};
    const auto result = service_.Compose(config_, destination);
    EXPECT_TRUE(result.success_);
    EXPECT_EQ(result.cells_rendered_, 1);
    EXPECT_EQ(result.cells_skipped_, 1);

    // the survivor gets the whole width
    const auto placed = destination.CallsOfKind(Kind::e_surface);
    ASSERT_EQ(placed.size(), 1);
    EXPECT_DOUBLE_EQ(placed[0].points_[0].x_, 0);
    EXPECT_DOUBLE_EQ(placed[0].points_[1].x_, 1600);
}

TEST_F(ComparisonServiceTest, NothingFetchedIsAFailure)
{
    config_.symbols_ = {"NOPE/USDT", "NADA/USDT"};

    PC_RecordingSurface destination{1600, 800};
    const auto result = service_.Compose(config_, destination);
    EXPECT_FALSE(result.success_);
    EXPECT_EQ(result.cells_rendered_, 0);
    EXPECT_EQ(result.cells_skipped_, 2);
    EXPECT_EQ(result.error_, "No charts could be generated for comparison.");
    EXPECT_TRUE(destination.CallsOfKind(Kind::e_surface).empty());
}

TEST_F(ComparisonServiceTest, OversizedGridIsRefusedBeforeFetching)
{
    config_.symbols_ = {"BTC/USDT", "ETH/USDT", "SOL/USDT"};
    config_.layout_ = {.type_ = PC_LayoutType::e_grid, .columns_ = 2};

    PC_RecordingSurface destination{1600, 800};
    EXPECT_THROW(auto r = service_.Compose(config_, destination), PC_LayoutConstraintError);
    EXPECT_EQ(source_.fetch_count_.load(), 0);
}

TEST_F(ComparisonServiceTest, TimeframeComparisonUsesFirstSymbol)
{
    config_.symbols_ = {"ETH/USDT", "BTC/USDT"};
    config_.timeframes_ = {"1h", "4h"};
    config_.layout_ = {.type_ = PC_LayoutType::e_grid, .columns_ = 1};

    PC_RecordingSurface destination{1600, 800};
    const auto result = service_.Compose(config_, destination);
    EXPECT_EQ(result.cells_rendered_, 2);

    const auto placed = destination.CallsOfKind(Kind::e_surface);
    ASSERT_EQ(placed.size(), 2);
    EXPECT_DOUBLE_EQ(placed[1].points_[0].y_, 408);
}

TEST_F(ComparisonServiceTest, GenerateWritesTheImage)
{
    config_.symbols_ = {"BTC/USDT", "ETH/USDT"};
    config_.output_path_ = fs::temp_directory_path() / "pc_comparison_test" / "compare.png";
    fs::remove(config_.output_path_);

    const auto result = service_.Generate(config_);
    ASSERT_TRUE(result.success_) << result.error_;
    EXPECT_EQ(result.output_path_.string(), config_.output_path_.string());
    EXPECT_TRUE(fs::exists(config_.output_path_));

    fs::remove_all(config_.output_path_.parent_path());

    config_.output_path_ = "compare.bmp";
    EXPECT_THROW(auto r = service_.Generate(config_), PC_ConfigurationError);
}
