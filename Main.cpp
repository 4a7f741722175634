// =====================================================================================
//
//       Filename:  Main.cpp
//
//    Description:  Driver program for application
//
//        Version:  1.0
//        Created:  03/12/2025 09:00:00 AM
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
#include <iostream>
#include <system_error>

#include "PC_RenderChartApp.h"

int main(int argc, char** argv)
{
	//	help to optimize c++ stream I/O (may screw up threaded I/O though)

	std::ios_base::sync_with_stdio(false);

	int result = 0;

	try
	{
		PC_RenderChartApp  myApp(argc, argv);
		bool startup_ok = myApp.Startup();
        if (startup_ok)
        {
            const auto summary = myApp.Run();
            myApp.Shutdown();

            // any chart we couldn't make counts as a failed run

            result = summary.failed_ == 0 ? 0 : 1;
        }
        else
        {
            result = 1;
        }
	}

    catch (std::system_error& e)
    {
        auto ec = e.code();
        std::cerr << "Category: " << ec.category().name() << ". Value: " << ec.value() <<
                ". Message: " << ec.message() << '\n';
        result = 2;
    }
    catch (std::exception& e)
    {
        std::cerr << "Problem rendering charts: " << e.what() << '\n';
        result = 2;
    }

	return result;
}
