// =====================================================================================
//
//       Filename:  PC_Indicators.h
//
//    Description:  overlay indicators computed from the original candle series
//
//        Version:  1.0
//        Created:  2025-03-04 02:30 PM
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

#ifndef PC_INDICATORS_INC_
#define PC_INDICATORS_INC_

#include <cstdint>
#include <vector>

#include "PC_Candle.h"

// cumulative (not windowed) volume weighted average of the typical price.
// falls back to the typical price while no volume has accumulated.

[[nodiscard]] PC_IndicatorSeries ComputeVWAP(const PC_Series &series);

// seeded directly from the first close, so there is 1 point per candle.

[[nodiscard]] PC_IndicatorSeries ComputeEMA(const PC_Series &series, int32_t period);

// 1 point per full window of closes. Empty if the series is shorter than 'period'.

[[nodiscard]] PC_IndicatorSeries ComputeSMA(const PC_Series &series, int32_t period);

// simple average RSI, 1 value per index from 'period' on. Not drawn.

[[nodiscard]] std::vector<double> ComputeRSI(const std::vector<double> &closes, int32_t period = 14);

[[nodiscard]] std::vector<double> ExtractCloses(const PC_Series &series);

#endif // ----- #ifndef PC_INDICATORS_INC_  -----
