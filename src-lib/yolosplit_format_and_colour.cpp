#include "yolosplit_format_and_colour.hpp"


namespace
{
	/// Text strings with the VT100/ANSI escape codes needed to display colour output.
	static const YoloSplit::VStr ansi_colours =
	{
		"\033[0m",		// EColour::kNormal
		"\033[0;30m",	// EColour::kBlack
		"\033[0;31m",	// EColour::kRed
		"\033[0;32m",	// EColour::kGreen
		"\033[0;33m",	// EColour::kBrown
		"\033[0;34m",	// EColour::kBlue
		"\033[0;35m",	// EColour::kMagenta
		"\033[0;36m",	// EColour::kCyan
		"\033[0;37m",	// EColour::kLightGrey
		"\033[1;30m",	// EColour::kDarkGrey
		"\033[1;31m",	// EColour::kBrightRed
		"\033[1;32m",	// EColour::kBrightGreen
		"\033[1;33m",	// EColour::kYellow
		"\033[1;34m",	// EColour::kBrightBlue
		"\033[1;35m",	// EColour::kBrightMagenta
		"\033[1;36m",	// EColour::kBrightCyan
		"\033[1;37m"	// EColour::kBrightWhite
	};

	static auto & cfg_and_state = YoloSplit::CfgAndState::get();
}


std::string YoloSplit::in_colour(const YoloSplit::EColour colour, const int i)
{
	TAT(TATPARMS);

	return in_colour(colour, std::to_string(i));
}


std::string YoloSplit::in_colour(const EColour colour, const size_t st)
{
	TAT(TATPARMS);

	return in_colour(colour, std::to_string(st));
}


std::string YoloSplit::in_colour(const EColour colour, const double d)
{
	TAT(TATPARMS);

	return in_colour(colour, std::to_string(d));
}


std::string YoloSplit::in_colour(const EColour colour, const std::string & msg)
{
	TAT(TATPARMS);

	if (cfg_and_state.colour_is_enabled)
	{
		return ansi_colours[colour] + msg + ansi_colours[EColour::kNormal];
	}

	return msg;
}


std::string YoloSplit::in_colour(const EColour colour)
{
	TAT(TATPARMS);

	if (cfg_and_state.colour_is_enabled)
	{
		return ansi_colours[colour];
	}

	return "";
}


std::string YoloSplit::format_in_colour(const std::string & str, const EColour & colour, const int & len)
{
	TAT(TATPARMS);

	// The text string will be left-aligned.  If the length is negative, then it will be right-aligned.
	const size_t l = static_cast<size_t>(len < 0 ? -len : len);

	std::string padding;
	if (str.length() < l)
	{
		padding = std::string(l - str.length(), ' ');
	}

	if (len < 0)
	{
		return padding + in_colour(colour, str);
	}

	return in_colour(colour, str) + padding;
}


std::string YoloSplit::format_in_colour(const int & i, const EColour & colour, const size_t & len)
{
	TAT(TATPARMS);

	std::string str = std::to_string(i);
	std::string padding;
	if (str.length() < len)
	{
		padding = std::string(len - str.length(), ' ');
	}

	return padding + in_colour(colour, str);
}


std::string YoloSplit::format_in_colour(const size_t & st, const EColour & colour, const size_t & len)
{
	TAT(TATPARMS);

	std::string str = std::to_string(st);
	std::string padding;
	if (str.length() < len)
	{
		padding = std::string(len - str.length(), ' ');
	}

	return padding + in_colour(colour, str);
}


std::string YoloSplit::format_in_colour(const double & d, const EColour & colour, const size_t & len)
{
	TAT(TATPARMS);

	std::stringstream ss;
	ss << std::fixed << std::setprecision(4);
	ss << (std::isfinite(d) ? d : 0.0);

	const std::string str = ss.str();
	std::string padding;
	if (str.length() < len)
	{
		padding = std::string(len - str.length(), ' ');
	}

	return padding + in_colour(colour, str);
}


std::string YoloSplit::format_fraction(const double & d, const EColour & colour)
{
	TAT(TATPARMS);

	std::stringstream ss;
	ss << std::fixed << std::setprecision(2) << (100.0 * d) << "%";

	return in_colour(colour, ss.str());
}


void YoloSplit::display_error_msg(const std::string & msg)
{
	TAT(TATPARMS);

	if (not msg.empty())
	{
		*cfg_and_state.output << in_colour(EColour::kBrightRed, msg);
	}

	return;
}


void YoloSplit::display_warning_msg(const std::string & msg)
{
	TAT(TATPARMS);

	if (not msg.empty())
	{
		*cfg_and_state.output << in_colour(EColour::kYellow, msg) << std::flush;
	}

	return;
}
