// =====================================================================================
//
//       Filename:  PC_Comparison.h
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

#ifndef PC_COMPARISON_INC_
#define PC_COMPARISON_INC_

#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "PC_Candle.h"
#include "PC_DataSource.h"
#include "PC_RenderOptions.h"
#include "PC_Surface.h"
#include "utilities.h"

enum class PC_LayoutType : int32_t
{
    e_side_by_side,
    e_grid
};

[[nodiscard]] PC_LayoutType ParseLayoutType(std::string_view layout_type);

struct PC_ComparisonLayout
{
    PC_LayoutType type_ = PC_LayoutType::e_side_by_side;
    int32_t columns_ = 2;
    std::optional<int32_t> gap_;

    // 20 side by side, 15 for a grid, unless told otherwise
    [[nodiscard]] int32_t EffectiveGap() const;
};

struct PC_CellRect
{
    double x_ = 0;
    double y_ = 0;
    double width_ = 0;
    double height_ = 0;
};

// grids are limited to 2 charts in at most 2 columns. Throws PC_LayoutConstraintError.
void CheckGridConstraints(const std::vector<std::string> &symbols, int32_t columns);

[[nodiscard]] std::vector<PC_CellRect> ComputeCellRects(size_t count, int32_t width, int32_t height,
                                                        const PC_ComparisonLayout &layout);

// scale margins to the cell relative to an 800x600 chart, with a floor so labels still fit
[[nodiscard]] PC_Margin AdjustMargins(const PC_Margin &margin, double cell_width, double cell_height);

using PC_SurfaceFactory = std::function<std::unique_ptr<PC_Surface>(int32_t width, int32_t height, PC_Color background)>;

[[nodiscard]] std::unique_ptr<PC_Surface> MakeCDSurface(int32_t width, int32_t height, PC_Color background);

// =====================================================================================
//        Class:  PC_Compositor
//  Description:  the only thing allowed to write into the shared destination.
//                1 cell at a time.
// =====================================================================================
class PC_Compositor
{
public:
    // ====================  LIFECYCLE     =======================================

    PC_Compositor() = delete;
    explicit PC_Compositor(PC_Surface &destination);

    // ====================  MUTATORS      =======================================

    void Place(const PC_Surface &cell, const PC_CellRect &where);

private:
    // ====================  DATA MEMBERS  =======================================

    std::mutex destination_mutex_;
    PC_Surface &destination_;

};  // -----  end of class PC_Compositor  -----

struct PC_ComparisonConfig
{
    std::vector<std::string> symbols_;

    // when not empty we compare timeframes of symbols_[0] instead of symbols
    std::vector<std::string> timeframes_;

    std::string timeframe_ = "1h";
    int32_t limit_ = 100;

    PC_ComparisonLayout layout_;
    int32_t width_ = 1600;
    int32_t height_ = 800;

    // applied to every cell. Size, margins and title are set per cell.
    PC_RenderOptions cell_options_;

    fs::path output_path_;
};

// 1 independent chart in the comparison
struct PC_ComparisonTask
{
    std::string symbol_;
    std::string timeframe_;
};

struct PC_ComparisonResult
{
    bool success_ = false;
    std::string error_;
    fs::path output_path_;
    int32_t cells_rendered_ = 0;
    int32_t cells_skipped_ = 0;
};

[[nodiscard]] std::vector<PC_ComparisonTask> MakeComparisonTasks(const PC_ComparisonConfig &config);

// =====================================================================================
//        Class:  PC_ComparisonService
//  Description:  fetch, draw and assemble the cells of a comparison
// =====================================================================================
class PC_ComparisonService
{
public:
    // ====================  LIFECYCLE     =======================================

    PC_ComparisonService() = delete;
    PC_ComparisonService(const PC_DataSource &data_source, PC_SurfaceFactory surface_factory);

    // ====================  ACCESSORS     =======================================

    // draw everything onto 'destination' which must be config.width_ x config.height_.
    // Throws PC_LayoutConstraintError for a grid we won't build. Cells whose data can't
    // be fetched are skipped.
    [[nodiscard]] PC_ComparisonResult Compose(const PC_ComparisonConfig &config, PC_Surface &destination) const;

    // Compose onto a new surface then write it to config.output_path_
    [[nodiscard]] PC_ComparisonResult Generate(const PC_ComparisonConfig &config) const;

private:
    // ====================  DATA MEMBERS  =======================================

    const PC_DataSource &data_source_;
    PC_SurfaceFactory surface_factory_;

};  // -----  end of class PC_ComparisonService  -----

template <>
struct std::formatter<PC_LayoutType> : std::formatter<std::string>
{
    // parse is inherited from formatter<string>.
    auto format(const PC_LayoutType &layout_type, std::format_context &ctx) const
    {
        std::string s;
        switch (layout_type)
        {
            using enum PC_LayoutType;
            case e_side_by_side:
                std::format_to(std::back_inserter(s), "{}", "side-by-side");
                break;
            case e_grid:
                std::format_to(std::back_inserter(s), "{}", "grid");
                break;
        };
        return formatter<std::string>::format(s, ctx);
    }
};

#endif // ----- #ifndef PC_COMPARISON_INC_  -----
