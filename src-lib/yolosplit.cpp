#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();
}


YoloSplit::ConfigurationError::ConfigurationError(const std::string & msg) :
	std::invalid_argument(msg)
{
	return;
}


YoloSplit::ParseError::ParseError(const std::filesystem::path & fn, const size_t line, const std::string & msg) :
	std::runtime_error(
		"\"" + fn.string() + "\"" +
		(line > 0 ? ", line #" + std::to_string(line) : std::string()) +
		": " + msg),
	filename(fn),
	line_number(line)
{
	return;
}


YoloSplit::PartitionError::PartitionError(const std::string & msg) :
	std::runtime_error(msg)
{
	return;
}


void YoloSplit::show_version_info()
{
	TAT(TATPARMS);

	*cfg_and_state.output
		<< "YoloSplit " << in_colour(EColour::kBrightWhite, YOLOSPLIT_VERSION_STRING)
		<< " \"" << YOLOSPLIT_VERSION_KEYWORD << "\""
		<< " built on " << __DATE__ << std::endl
		<< "OpenCV " << in_colour(EColour::kBrightWhite, CV_VERSION)
		<< ", C++ " << __cplusplus
		<< std::endl;

	return;
}


void YoloSplit::set_verbose(const bool flag)
{
	TAT(TATPARMS);

	cfg_and_state.is_verbose = flag;

	// disabling verbose also disables trace
	if (not flag)
	{
		cfg_and_state.is_trace = false;
	}

	return;
}


void YoloSplit::set_trace(const bool flag)
{
	TAT(TATPARMS);

	cfg_and_state.is_trace = flag;

	// enabling trace also enables verbose
	if (flag)
	{
		cfg_and_state.is_verbose = true;
	}

	return;
}


void YoloSplit::set_colour_enabled(const bool flag)
{
	TAT(TATPARMS);

	cfg_and_state.colour_is_enabled = flag;

	return;
}


void YoloSplit::set_output_stream(const std::filesystem::path & filename)
{
	TAT(TATPARMS);

	if (filename.empty())
	{
		cfg_and_state.output = &std::cout;
		cfg_and_state.log_file.reset();
	}
	else
	{
		auto file = std::make_unique<std::ofstream>(filename, std::ios::out | std::ios::trunc);
		if (not file->good())
		{
			throw ConfigurationError("failed to open log file " + filename.string());
		}

		cfg_and_state.output = file.get();
		cfg_and_state.log_file = std::move(file);

		// log files are never coloured
		cfg_and_state.colour_is_enabled = false;
	}

	// see CfgAndState::reset()
	*cfg_and_state.output << std::fixed;

	return;
}


std::string YoloSplit::label_name(const int label)
{
	TAT(TATPARMS);

	if (label == kEmptyLabel)
	{
		return "empty";
	}

	if (label == kUnassignedLabel)
	{
		return "unassigned";
	}

	return "class #" + std::to_string(label);
}


std::string YoloSplit::to_string(const ESplitMethod method)
{
	TAT(TATPARMS);

	switch (method)
	{
		case ESplitMethod::kStratified:	return "stratified";
		case ESplitMethod::kFallback:	return "random fallback";
	}

	return "unknown";
}
