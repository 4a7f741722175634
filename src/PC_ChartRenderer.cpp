// =====================================================================================
//
//       Filename:  PC_ChartRenderer.cpp
//
//    Description:  draw 1 complete chart in fixed layer order
//
//        Version:  1.0
//        Created:  2025-03-07 09:20 AM
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

#include <exception>

#include <spdlog/spdlog.h>

#include "PC_CDSurface.h"
#include "PC_ChartElements.h"
#include "PC_ChartRenderer.h"
#include "PC_Indicators.h"
#include "PC_PrimaryDrawer.h"
#include "PC_Scaling.h"
#include "PC_Transforms.h"

// NOLINTBEGIN
constexpr PC_Color VWAP_ORANGE = 0xFF9800;
constexpr PC_Color EMA_BLUE = 0x2196F3;
constexpr PC_Color SMA_PURPLE = 0xAB47BC;

constexpr double kVWAPLabelOffset = 15;
constexpr double kEMALabelOffset = 30;
constexpr double kSMALabelOffset = 45;
// NOLINTEND

std::vector<PC_Layer> DrawChart(const PC_Series &series, const PC_RenderOptions &options, PC_Surface &surface)
{
    std::vector<PC_Layer> layers;

    const auto dims = MakeDimensions(options);
    const auto colors = ResolveColors(options);

    surface.FillRect(0, 0, dims.width_, dims.height_, colors.background_);
    layers.push_back(PC_Layer::e_background);

    if (!series.empty())
    {
        const auto drawn = TransformSeries(options.chart_type_, series, options.transform_params_);

        // the range comes from what is actually drawn. If the transform
        // produced nothing (a quiet Renko chart) the axes still need a range.

        PC_PriceRange price_range;
        if (drawn.empty())
        {
            price_range = ComputeRange(series, options.scale_);
        }
        else
        {
            price_range = drawn.UsesBricks() ? ComputeRange(drawn.bricks_, options.scale_)
                                             : ComputeRange(drawn.candles_, options.scale_);
        }

        const PC_DrawContext context{.dimensions_ = dims, .price_range_ = price_range, .colors_ = colors};

        const auto drawer = MakePrimaryDrawer(options.chart_type_);
        drawer->Draw(surface, drawn, context);
        layers.push_back(PC_Layer::e_primary);

        // overlays are computed from the original candles and spread across
        // the plot the same way the primary shape is.

        const auto convention = drawer->XConvention();

        if (options.show_vwap_ && HasVolumeData(series))
        {
            DrawOverlay(surface, ComputeVWAP(series), 0, series.size(), convention, context,
                        {.color_ = VWAP_ORANGE,
                         .line_style_ = PC_LineStyle::e_dashed,
                         .label_ = "VWAP",
                         .label_offset_ = kVWAPLabelOffset});
            layers.push_back(PC_Layer::e_vwap);
        }
        if (options.show_ema_)
        {
            DrawOverlay(surface, ComputeEMA(series, options.ema_period_), 0, series.size(), convention, context,
                        {.color_ = EMA_BLUE,
                         .line_style_ = PC_LineStyle::e_solid,
                         .label_ = std::format("EMA({})", options.ema_period_),
                         .label_offset_ = kEMALabelOffset});
            layers.push_back(PC_Layer::e_ema);
        }
        if (options.show_sma_)
        {
            DrawOverlay(surface, ComputeSMA(series, options.sma_period_), static_cast<size_t>(options.sma_period_ - 1), series.size(),
                        convention, context,
                        {.color_ = SMA_PURPLE,
                         .line_style_ = PC_LineStyle::e_solid,
                         .label_ = std::format("SMA({})", options.sma_period_),
                         .label_offset_ = kSMALabelOffset});
            layers.push_back(PC_Layer::e_sma);
        }

        if (!options.levels_.empty())
        {
            DrawLevels(surface, options.levels_, context);
            layers.push_back(PC_Layer::e_levels);
        }

        if (options.show_grid_)
        {
            DrawGrid(surface, context);
            layers.push_back(PC_Layer::e_grid);
        }

        DrawAxes(surface, series, options.show_time_axis_, context);
        layers.push_back(PC_Layer::e_axes);
    }
    else
    {
        spdlog::debug("Empty series. Drawing background, title and watermark only.");
    }

    const PC_DrawContext frame_context{.dimensions_ = dims, .price_range_ = {}, .colors_ = colors};

    if (options.show_title_ && !options.title_.empty())
    {
        DrawTitle(surface, options.title_, frame_context);
        layers.push_back(PC_Layer::e_title);
    }

    if (options.watermark_ && !options.watermark_->text_.empty())
    {
        DrawWatermark(surface, options.watermark_.value(), frame_context);
        layers.push_back(PC_Layer::e_watermark);
    }

    return layers;
}

PC_RenderResult RenderToSurface(const PC_Series &series, const PC_RenderOptions &options, PC_Surface &surface)
{
    try
    {
        const auto layers = DrawChart(series, options, surface);
        spdlog::debug(std::format("Drew {} chart with {} candles: {}x{}, {} layers.", options.chart_type_,
                                  series.size(), options.width_, options.height_, layers.size()));
        return {.success_ = true, .error_ = {}, .output_path_ = {}};
    }
    catch (const std::exception &e)
    {
        spdlog::error(std::format("Unable to draw chart: {}", e.what()));
        return {.success_ = false, .error_ = e.what(), .output_path_ = {}};
    }
}

PC_RenderResult RenderChart(const PC_Series &series, const PC_RenderOptions &options, const fs::path &output_path)
{
    try
    {
        // check the extension before doing any drawing

        static_cast<void>(ImageFormatFromPath(output_path));

        PC_CDSurface surface{options.width_, options.height_, ResolveColors(options).background_};
        auto result = RenderToSurface(series, options, surface);
        if (!result.success_)
        {
            return result;
        }
        WriteImageFile(surface, output_path);
        spdlog::info(std::format("Chart saved to: {}", output_path.string()));
        return {.success_ = true, .error_ = {}, .output_path_ = output_path};
    }
    catch (const std::exception &e)
    {
        spdlog::error(std::format("Unable to render chart to: {}. {}", output_path.string(), e.what()));
        return {.success_ = false, .error_ = e.what(), .output_path_ = output_path};
    }
}
