#pragma once

#ifndef __cplusplus
#error "The YoloSplit project requires a C++ compiler."
#endif

// C headers
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <ciso646>

// C++ headers
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <sstream>

// 3rd-party lib headers
#include <opencv2/opencv.hpp>

#include "yolosplit.hpp"			// the public C++ header
#include "yolosplit_version.h"		// version macros

#include "Timing.hpp"
#include "yolosplit_args_and_parms.hpp"
#include "yolosplit_cfg_and_state.hpp"
#include "yolosplit_format_and_colour.hpp"
#include "yolosplit_utils.hpp"
#include "pruner.hpp"
#include "orchestrator.hpp"
#include "report.hpp"
#include "materialize.hpp"
