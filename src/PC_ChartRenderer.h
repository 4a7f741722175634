// =====================================================================================
//
//       Filename:  PC_ChartRenderer.h
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

#ifndef PC_CHARTRENDERER_INC_
#define PC_CHARTRENDERER_INC_

#include <cstdint>
#include <format>
#include <string>
#include <vector>

#include "PC_Candle.h"
#include "PC_RenderOptions.h"
#include "PC_Surface.h"
#include "utilities.h"

// later layers are drawn over earlier ones

enum class PC_Layer : int32_t
{
    e_background,
    e_primary,
    e_vwap,
    e_ema,
    e_sma,
    e_levels,
    e_grid,
    e_axes,
    e_title,
    e_watermark
};

struct PC_RenderResult
{
    bool success_ = false;
    std::string error_;
    fs::path output_path_;
};

// draws onto 'surface' which must already be options.width_ x options.height_.
// Returns the layers actually drawn, in order. Throws on drawing failures.

std::vector<PC_Layer> DrawChart(const PC_Series &series, const PC_RenderOptions &options, PC_Surface &surface);

// same as DrawChart but any failure comes back in the result instead of as an exception

[[nodiscard]] PC_RenderResult RenderToSurface(const PC_Series &series, const PC_RenderOptions &options,
                                              PC_Surface &surface);

// render to a new ChartDirector surface then encode and write it out.
// the output format comes from the file extension.

[[nodiscard]] PC_RenderResult RenderChart(const PC_Series &series, const PC_RenderOptions &options,
                                          const fs::path &output_path);

template <>
struct std::formatter<PC_Layer> : std::formatter<std::string>
{
    // parse is inherited from formatter<string>.
    auto format(const PC_Layer &layer, std::format_context &ctx) const
    {
        std::string s;
        switch (layer)
        {
            using enum PC_Layer;
            case e_background:
                std::format_to(std::back_inserter(s), "{}", "background");
                break;
            case e_primary:
                std::format_to(std::back_inserter(s), "{}", "primary");
                break;
            case e_vwap:
                std::format_to(std::back_inserter(s), "{}", "vwap");
                break;
            case e_ema:
                std::format_to(std::back_inserter(s), "{}", "ema");
                break;
            case e_sma:
                std::format_to(std::back_inserter(s), "{}", "sma");
                break;
            case e_levels:
                std::format_to(std::back_inserter(s), "{}", "levels");
                break;
            case e_grid:
                std::format_to(std::back_inserter(s), "{}", "grid");
                break;
            case e_axes:
                std::format_to(std::back_inserter(s), "{}", "axes");
                break;
            case e_title:
                std::format_to(std::back_inserter(s), "{}", "title");
                break;
            case e_watermark:
                std::format_to(std::back_inserter(s), "{}", "watermark");
                break;
        };
        return formatter<std::string>::format(s, ctx);
    }
};

#endif // ----- #ifndef PC_CHARTRENDERER_INC_  -----
