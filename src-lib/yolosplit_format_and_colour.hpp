/* Darknet/YOLO:  https://github.com/hank-ai/darknet
 * Copyright 2024-2025 Stephane Charette
 */

#pragma once

#include "yolosplit_internal.hpp"


namespace YoloSplit
{
	enum EColour
	{
		kNormal			= 0,
		kBlack			,
		kRed			,
		kGreen			,
		kBrown			,
		kBlue			,
		kMagenta		,
		kCyan			,
		kLightGrey		,
		kDarkGrey		,
		kBrightRed		,
		kBrightGreen	,
		kYellow			,
		kBrightBlue		,
		kBrightMagenta	,
		kBrightCyan		,
		kBrightWhite	,
	};

	std::string in_colour(const EColour colour, const int i);
	std::string in_colour(const EColour colour, const size_t st);
	std::string in_colour(const EColour colour, const double d);
	std::string in_colour(const EColour colour, const std::string & msg);
	std::string in_colour(const EColour colour);

	/// The text string will be left-aligned.  If the length is negative, then it will be right-aligned.
	std::string format_in_colour(const std::string & str, const EColour & colour, const int & len);
	std::string format_in_colour(const int & i, const EColour & colour, const size_t & len);
	std::string format_in_colour(const size_t & st, const EColour & colour, const size_t & len);
	std::string format_in_colour(const double & d, const EColour & colour, const size_t & len);

	/// Format a fraction such as @p 0.2 as @p "20.00%".
	std::string format_fraction(const double & d, const EColour & colour = EColour::kBrightWhite);

	/// Display the given message in bright red (if colour is enabled).  The message is not linefeed terminated.
	void display_error_msg(const std::string & msg);

	/// Display the given message in yellow (if colour is enabled).  The message is not linefeed terminated.
	void display_warning_msg(const std::string & msg);
}
