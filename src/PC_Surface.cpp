// =====================================================================================
//
//       Filename:  PC_Surface.cpp
//
//    Description:  abstract raster surface the chart pipeline draws onto
//
//        Version:  1.0
//        Created:  2025-03-05 10:10 AM
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

#include <format>
#include <fstream>

#include <spdlog/spdlog.h>

#include "PC_Errors.h"
#include "PC_Surface.h"

PC_ImageFormat ImageFormatFromPath(const fs::path &output_path)
{
    const auto extension = output_path.extension().string();
    if (EqualsIgnoreCase(extension, ".png"))
    {
        return PC_ImageFormat::e_png;
    }
    if (EqualsIgnoreCase(extension, ".jpg") || EqualsIgnoreCase(extension, ".jpeg"))
    {
        return PC_ImageFormat::e_jpeg;
    }
    if (EqualsIgnoreCase(extension, ".svg"))
    {
        return PC_ImageFormat::e_svg;
    }
    throw PC_ConfigurationError(
        std::format("Output path must have a valid image extension (.png, .jpg, .jpeg, .svg): {}",
                    output_path.string()));
}

void WriteImageFile(const PC_Surface &surface, const fs::path &output_path)
{
    const auto format = ImageFormatFromPath(output_path);
    const auto image_data = surface.Encode(format);

    if (output_path.has_parent_path() && !fs::exists(output_path.parent_path()))
    {
        fs::create_directories(output_path.parent_path());
    }

    std::ofstream output{output_path, std::ios::out | std::ios::binary | std::ios::trunc};
    if (!output)
    {
        throw std::runtime_error(std::format("Unable to open output file: {}", output_path.string()));
    }
    output.write(image_data.data(), static_cast<std::streamsize>(image_data.size()));
    output.close();
    if (!output)
    {
        throw std::runtime_error(std::format("Problem writing image to: {}", output_path.string()));
    }
    spdlog::debug(std::format("Wrote {} bytes to: {}", image_data.size(), output_path.string()));
}
