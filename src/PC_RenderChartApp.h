// =====================================================================================
//
//       Filename:  PC_RenderChartApp.h
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

#ifndef PC_RENDERCHARTAPP_INC_
#define PC_RENDERCHARTAPP_INC_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

#include <spdlog/spdlog.h>

#include "PC_ChartConfig.h"
#include "PC_Comparison.h"
#include "PC_DataSource.h"
#include "utilities.h"

// =====================================================================================
//        Class:  PC_RenderChartApp
//  Description:  application specific stuff
// =====================================================================================
class PC_RenderChartApp
{
public:
    enum class Mode : int32_t
    {
        e_single,
        e_compare,
        e_batch,
        e_fetch
    };

    struct RunSummary
    {
        int32_t succeeded_ = 0;
        int32_t failed_ = 0;
    };

    // ====================  LIFECYCLE     =======================================

    PC_RenderChartApp(int argc, char *argv[]);  // constructor

    // use ctor below for testing with predefined options

    explicit PC_RenderChartApp(const std::vector<std::string> &tokens);

    PC_RenderChartApp() = delete;
    PC_RenderChartApp(const PC_RenderChartApp &rhs) = delete;
    PC_RenderChartApp(PC_RenderChartApp &&rhs) = delete;

    ~PC_RenderChartApp() = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] Mode GetMode() const { return mode_; }
    [[nodiscard]] const PC_ChartConfig &GetChartConfig() const { return chart_config_; }
    [[nodiscard]] const PC_ComparisonConfig &GetComparisonConfig() const { return comparison_config_; }

    // what --fetch brought back
    [[nodiscard]] const PC_Series &GetFetchedSeries() const { return fetched_series_; }

    // ====================  MUTATORS      =======================================

    bool Startup();
    RunSummary Run();
    void Shutdown();

    // ====================  OPERATORS     =======================================

    PC_RenderChartApp &operator=(const PC_RenderChartApp &rhs) = delete;
    PC_RenderChartApp &operator=(PC_RenderChartApp &&rhs) = delete;

protected:
    //	Setup for parsing program options.

    void SetupProgramOptions();
    void ParseProgramOptions(const std::vector<std::string> &tokens);

    void ConfigureLogging();

    bool CheckArgs();

    RunSummary Run_Single();
    RunSummary Run_Compare();
    RunSummary Run_Batch();
    RunSummary Run_Fetch();

    [[nodiscard]] std::unique_ptr<PC_DataSource> MakeDataSource(const std::string &exchange) const;

private:
    void ApplyChartOptions();

    // ====================  DATA MEMBERS  =======================================

    std::shared_ptr<spdlog::logger> logger_;

    std::unique_ptr<po::options_description> newoptions_;  //	new style options (with identifiers)
    po::variables_map variablemap_;

    int argc_ = 0;
    char **argv_ = nullptr;
    const std::vector<std::string> tokens_;

    fs::path log_file_path_name_;
    std::string logging_level_{"information"};

    PC_ChartConfig chart_config_;
    PC_ComparisonConfig comparison_config_;
    PC_Series fetched_series_;

    Mode mode_ = Mode::e_single;

    // raw option values. Turned into the configs above by CheckArgs.

    std::string output_path_i_;
    std::string custom_colors_i_;
    std::string levels_i_;
    std::string background_color_i_;
    std::string text_color_i_;
    std::string watermark_color_i_;

    std::string compare_i_;
    std::string layout_i_;
    std::string timeframes_i_;
    std::optional<int32_t> gap_;
    int32_t columns_ = 2;

    fs::path batch_file_;
    fs::path save_to_;
    fs::path data_directory_;

    std::string binance_host_;
    std::string binance_port_;

    bool fetch_only_ = false;
    bool hide_title_ = false;
    bool hide_time_axis_ = false;
    bool hide_grid_ = false;

};  // -----  end of class PC_RenderChartApp  -----

#endif // ----- #ifndef PC_RENDERCHARTAPP_INC_  -----
