// =====================================================================================
//
//       Filename:  PC_Comparison.cpp
//
//    Description:  several independently drawn charts on 1 image
//
//        Version:  1.0
//        Created:  2025-03-10 09:30 AM
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
#include <cmath>
#include <future>
#include <iterator>
#include <ranges>

namespace rng = std::ranges;
namespace vws = std::ranges::views;

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

#include "PC_CDSurface.h"
#include "PC_ChartRenderer.h"
#include "PC_Comparison.h"
#include "PC_Errors.h"

// NOLINTBEGIN
constexpr int32_t kMaxGridCharts = 2;
constexpr int32_t kMaxGridColumns = 2;
constexpr int32_t kSideBySideGap = 20;
constexpr int32_t kGridGap = 15;

constexpr double kReferenceWidth = 800;
constexpr double kReferenceHeight = 600;
constexpr double kMinTopLeftMargin = 20;
constexpr double kMinBottomRightMargin = 15;
// NOLINTEND

PC_LayoutType ParseLayoutType(std::string_view layout_type)
{
    if (layout_type == "side-by-side")
    {
        return PC_LayoutType::e_side_by_side;
    }
    if (layout_type == "grid")
    {
        return PC_LayoutType::e_grid;
    }
    throw PC_ConfigurationError(
        std::format("Invalid layout: '{}'. Must be 'side-by-side' or 'grid'.", layout_type));
}

int32_t PC_ComparisonLayout::EffectiveGap() const
{
    return gap_.value_or(type_ == PC_LayoutType::e_grid ? kGridGap : kSideBySideGap);
}  // -----  end of method PC_ComparisonLayout::EffectiveGap  -----

void CheckGridConstraints(const std::vector<std::string> &symbols, int32_t columns)
{
    if (symbols.size() > kMaxGridCharts)
    {
        throw PC_LayoutConstraintError(fmt::format("Grid layout supports maximum {} symbols. Got {} symbols: {}",
                                                   kMaxGridCharts, symbols.size(), fmt::join(symbols, ", ")));
    }
    if (columns > kMaxGridColumns)
    {
        throw PC_LayoutConstraintError(
            std::format("Grid layout supports maximum {} columns. Got {} columns", kMaxGridColumns, columns));
    }
}

std::vector<PC_CellRect> ComputeCellRects(size_t count, int32_t width, int32_t height,
                                          const PC_ComparisonLayout &layout)
{
    std::vector<PC_CellRect> cells;
    if (count == 0)
    {
        return cells;
    }
    const double gap = layout.EffectiveGap();
    const auto how_many = static_cast<double>(count);

    if (layout.type_ == PC_LayoutType::e_side_by_side)
    {
        const double cell_width = (width - (how_many - 1) * gap) / how_many;
        for (size_t i = 0; i < count; ++i)
        {
            cells.push_back({.x_ = static_cast<double>(i) * (cell_width + gap),
                             .y_ = 0,
                             .width_ = cell_width,
                             .height_ = static_cast<double>(height)});
        }
        return cells;
    }

    const auto columns = static_cast<size_t>(std::max(1, layout.columns_));
    const size_t rows = (count + columns - 1) / columns;
    const double cell_width = (width - static_cast<double>(columns - 1) * gap) / static_cast<double>(columns);
    const double cell_height = (height - static_cast<double>(rows - 1) * gap) / static_cast<double>(rows);

    for (size_t i = 0; i < count; ++i)
    {
        const auto row = i / columns;
        const auto col = i % columns;
        cells.push_back({.x_ = static_cast<double>(col) * (cell_width + gap),
                         .y_ = static_cast<double>(row) * (cell_height + gap),
                         .width_ = cell_width,
                         .height_ = cell_height});
    }
    return cells;
}

PC_Margin AdjustMargins(const PC_Margin &margin, double cell_width, double cell_height)
{
    const double scale = std::min(cell_width / kReferenceWidth, cell_height / kReferenceHeight);
    return {.top_ = std::max(margin.top_ * scale, kMinTopLeftMargin),
            .bottom_ = std::max(margin.bottom_ * scale, kMinBottomRightMargin),
            .left_ = std::max(margin.left_ * scale, kMinTopLeftMargin),
            .right_ = std::max(margin.right_ * scale, kMinBottomRightMargin)};
}

std::unique_ptr<PC_Surface> MakeCDSurface(int32_t width, int32_t height, PC_Color background)
{
    return std::make_unique<PC_CDSurface>(width, height, background);
}

std::vector<PC_ComparisonTask> MakeComparisonTasks(const PC_ComparisonConfig &config)
{
    std::vector<PC_ComparisonTask> tasks;
    if (config.symbols_.empty())
    {
        return tasks;
    }

    if (!config.timeframes_.empty())
    {
        // same symbol, 1 cell per timeframe, but never more cells than symbol slots

        const auto how_many = std::min(config.symbols_.size(), config.timeframes_.size());
        for (const auto &timeframe : config.timeframes_ | vws::take(how_many))
        {
            tasks.push_back({.symbol_ = config.symbols_.front(), .timeframe_ = timeframe});
        }
        return tasks;
    }

    for (const auto &symbol : config.symbols_)
    {
        tasks.push_back({.symbol_ = symbol, .timeframe_ = config.timeframe_});
    }
    return tasks;
}

//--------------------------------------------------------------------------------------
//       Class:  PC_Compositor
//      Method:  PC_Compositor
// Description:  constructor
//--------------------------------------------------------------------------------------
PC_Compositor::PC_Compositor(PC_Surface &destination) : destination_{destination}
{
}  // -----  end of method PC_Compositor::PC_Compositor  (constructor)  -----

void PC_Compositor::Place(const PC_Surface &cell, const PC_CellRect &where)
{
    const std::lock_guard<std::mutex> lock(destination_mutex_);
    destination_.DrawSurface(cell, static_cast<int32_t>(std::lround(where.x_)),
                             static_cast<int32_t>(std::lround(where.y_)));
}  // -----  end of method PC_Compositor::Place  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_ComparisonService
//      Method:  PC_ComparisonService
// Description:  constructor
//--------------------------------------------------------------------------------------
PC_ComparisonService::PC_ComparisonService(const PC_DataSource &data_source, PC_SurfaceFactory surface_factory)
    : data_source_{data_source}, surface_factory_{std::move(surface_factory)}
{
}  // -----  end of method PC_ComparisonService::PC_ComparisonService  (constructor)  -----

//--------------------------------------------------------------------------------------
//       Class:  PC_ComparisonService
//      Method:  PC_ComparisonService::Compose
// Description:  fetch all cells, lay out the ones we got, draw them, then place
//               them in order.
//--------------------------------------------------------------------------------------
PC_ComparisonResult PC_ComparisonService::Compose(const PC_ComparisonConfig &config, PC_Surface &destination) const
{
    if (config.layout_.type_ == PC_LayoutType::e_grid)
    {
        CheckGridConstraints(config.symbols_, config.layout_.columns_);
    }

    const auto tasks = MakeComparisonTasks(config);
    std::vector<std::string> cell_names;
    rng::transform(tasks, std::back_inserter(cell_names),
                   [](const auto &task) { return std::format("{} {}", task.symbol_, task.timeframe_); });
    spdlog::info(fmt::format("Comparing {} chart(s) with {} layout: {}", tasks.size(),
                             std::format("{}", config.layout_.type_), fmt::join(cell_names, ", ")));

    PC_ComparisonResult result{.output_path_ = config.output_path_};

    // fetches are independent so run them all at once.

    std::vector<std::future<PC_Series>> fetches;
    fetches.reserve(tasks.size());
    for (const auto &task : tasks)
    {
        fetches.emplace_back(std::async(std::launch::async, [this, &task, limit = config.limit_]()
                                        { return data_source_.FetchOHLCV(task.symbol_, task.timeframe_, limit); }));
    }

    struct FetchedCell
    {
        const PC_ComparisonTask *task_;
        PC_Series series_;
    };
    std::vector<FetchedCell> fetched;

    for (size_t i = 0; i < fetches.size(); ++i)
    {
        try
        {
            fetched.push_back({.task_ = &tasks[i], .series_ = fetches[i].get()});
        }
        catch (const std::exception &e)
        {
            spdlog::error(std::format("Skipping {} {}. {}", tasks[i].symbol_, tasks[i].timeframe_, e.what()));
            ++result.cells_skipped_;
        }
    }

    if (fetched.empty())
    {
        result.error_ = "No charts could be generated for comparison.";
        return result;
    }

    // lay out only what we actually have

    const auto cells = ComputeCellRects(fetched.size(), config.width_, config.height_, config.layout_);

    std::vector<std::future<std::pair<std::unique_ptr<PC_Surface>, PC_RenderResult>>> renders;
    renders.reserve(fetched.size());
    for (size_t i = 0; i < fetched.size(); ++i)
    {
        auto cell_options = config.cell_options_;
        cell_options.width_ = static_cast<int32_t>(cells[i].width_);
        cell_options.height_ = static_cast<int32_t>(cells[i].height_);
        cell_options.margin_ = AdjustMargins(config.cell_options_.margin_, cells[i].width_, cells[i].height_);
        cell_options.title_ = std::format("{} {}", fetched[i].task_->symbol_, fetched[i].task_->timeframe_);

        renders.emplace_back(std::async(
            std::launch::async,
            [this, options = std::move(cell_options), &series = fetched[i].series_]()
            {
                auto surface = surface_factory_(options.width_, options.height_, ResolveColors(options).background_);
                auto render_result = RenderToSurface(series, options, *surface);
                return std::make_pair(std::move(surface), render_result);
            }));
    }

    // single writer into the shared destination, in cell order.

    PC_Compositor compositor{destination};
    for (size_t i = 0; i < renders.size(); ++i)
    {
        try
        {
            auto [surface, render_result] = renders[i].get();
            if (!render_result.success_)
            {
                spdlog::error(std::format("Unable to draw cell: {} {}. {}", fetched[i].task_->symbol_,
                                          fetched[i].task_->timeframe_, render_result.error_));
                ++result.cells_skipped_;
                continue;
            }
            compositor.Place(*surface, cells[i]);
            ++result.cells_rendered_;
        }
        catch (const std::exception &e)
        {
            spdlog::error(std::format("Unable to draw cell: {} {}. {}", fetched[i].task_->symbol_,
                                      fetched[i].task_->timeframe_, e.what()));
            ++result.cells_skipped_;
        }
    }

    result.success_ = result.cells_rendered_ > 0;
    if (!result.success_)
    {
        result.error_ = "No charts could be generated for comparison.";
    }
    return result;
}  // -----  end of method PC_ComparisonService::Compose  -----

PC_ComparisonResult PC_ComparisonService::Generate(const PC_ComparisonConfig &config) const
{
    // find out about a bad output name before fetching anything

    static_cast<void>(ImageFormatFromPath(config.output_path_));

    auto destination =
        surface_factory_(config.width_, config.height_, ResolveColors(config.cell_options_).background_);

    auto result = Compose(config, *destination);
    if (!result.success_)
    {
        return result;
    }

    try
    {
        WriteImageFile(*destination, config.output_path_);
        spdlog::info(std::format("Comparison chart saved to: {}", config.output_path_.string()));
    }
    catch (const std::exception &e)
    {
        result.success_ = false;
        result.error_ = e.what();
    }
    return result;
}  // -----  end of method PC_ComparisonService::Generate  -----
