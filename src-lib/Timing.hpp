/* Darknet/YOLO:  https://github.com/hank-ai/darknet
 * Copyright 2024-2025 Stephane Charette
 */

#pragma once

/** @file
 * Macros used for timing and tracking.
 *
 * Every function starts with @p TAT(TATPARMS).  Normally these macros compile to nothing.  When YoloSplit is built
 * with the extra cmake parameter shown below, the macros are mapped onto CTrack (https://github.com/Compaile/ctrack)
 * which must be installed where the compiler can find @p ctrack.hpp.  When YoloSplit exits, the results are shown in
 * a table.  This is meant for developers, not for "normal" users, since it slows things down.
 *
 * ~~~~
 * cmake -DENABLE_TIMING_AND_TRACKING=ON -DCMAKE_BUILD_TYPE=Release ..
 * ~~~~
 */

#ifdef YOLOSPLIT_TIMING_AND_TRACKING_ENABLED

#include <ctrack.hpp>
#include <iostream>
#include <string>

inline void yolosplit_ctrack_print_results()
{
#ifndef CTRACK_DISABLE
	ctrack::ctrack_result_settings settings;
	settings.min_percent_active_exclusive = 0.5;
	std::cout << std::endl << "===== ctrack Performance Analysis =====" << std::endl;
	ctrack::result_print(settings);
	std::cout << "=====================================" << std::endl << std::endl;
#else
	std::cout << std::endl << "===== ctrack is disabled (CTRACK_DISABLE is defined) =====" << std::endl << std::endl;
#endif
}

/// Create a ctrack event using CTRACK_NAME.
#define TAT(n) CTRACK_NAME(n)
#define TATPARMS __builtin_FUNCTION()
#define TT_PRINT yolosplit_ctrack_print_results()

#else // YOLOSPLIT_TIMING_AND_TRACKING_ENABLED is not defined

#define TAT(...)
#define TATPARMS ""
#define TT_PRINT /* Do nothing if timing is not enabled */

#endif // YOLOSPLIT_TIMING_AND_TRACKING_ENABLED
