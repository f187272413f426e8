#include "yolosplit_internal.hpp"


YoloSplit::ArgsAndParms::~ArgsAndParms()
{
	TAT(TATPARMS);

	return;
}


YoloSplit::ArgsAndParms::ArgsAndParms() :
	ArgsAndParms("", "")
{
	TAT(TATPARMS);

	return;
}


YoloSplit::ArgsAndParms::ArgsAndParms(const std::string & n1, const std::string & n2, const std::string & txt) :
	name			(n1					),
	name_alternate	(n2					),
	description		(txt				),
	type			(EType::kParameter	),
	expect_parm		(false				),
	expect_path		(false				),
	arg_index		(-1					),
	value			(0.0				)
{
	TAT(TATPARMS);

	return;
}


YoloSplit::ArgsAndParms::ArgsAndParms(const std::string & n1, const EType t, const std::string & txt) :
	ArgsAndParms(n1, "", txt)
{
	TAT(TATPARMS);

	type = t;

	return;
}


YoloSplit::ArgsAndParms::ArgsAndParms(const std::string & n1, const std::string & n2, const int i, const std::string & txt) :
	ArgsAndParms(n1, n2, txt)
{
	TAT(TATPARMS);

	expect_parm	= true;
	value		= i;

	return;
}


YoloSplit::ArgsAndParms::ArgsAndParms(const std::string & n1, const std::string & n2, const double d, const std::string & txt) :
	ArgsAndParms(n1, n2, txt)
{
	TAT(TATPARMS);

	expect_parm	= true;
	value		= d;

	return;
}


YoloSplit::ArgsAndParms::ArgsAndParms(const std::string & n1, const std::string & n2, const std::filesystem::path & path, const std::string & txt) :
	ArgsAndParms(n1, n2, txt)
{
	TAT(TATPARMS);

	expect_parm	= true;
	expect_path	= true;
	filename	= path;

	return;
}


const YoloSplit::SArgsAndParms & YoloSplit::get_all_possible_arguments()
{
	TAT(TATPARMS);

	static const SArgsAndParms all =
	{
		ArgsAndParms("help"			, ArgsAndParms::EType::kCommand	, "Display usage information."),
		ArgsAndParms("split"		, ArgsAndParms::EType::kCommand	, "Prune the dataset and split it into balanced training, validation, and test sets."),
		ArgsAndParms("summary"		, ArgsAndParms::EType::kCommand	, "Display the distribution of representative labels without modifying anything."),
		ArgsAndParms("version"		, ArgsAndParms::EType::kCommand	, "Display version information."),

		// global options
		ArgsAndParms("colour"		, "color"							, "Enable colour output in the console.  This is the default."),
		ArgsAndParms("nocolour"		, "nocolor"							, "Disable colour output in the console."),
		ArgsAndParms("verbose"		, "show_details"					, "Logs more verbose messages."),
		ArgsAndParms("trace"		, ArgsAndParms::EType::kParameter	, "Intended for debug purposes.  This logs all the parsed arguments."),
		ArgsAndParms("log"			, ""	, std::filesystem::path()	, "Send all output to the given file instead of the console."),

		// directories
		ArgsAndParms("src"			, "source"	, std::filesystem::path(), "Directory which contains \"all_images\" and \"all_labels\"."),
		ArgsAndParms("out"			, "output"	, std::filesystem::path(), "Directory where \"train\", \"valid\", and \"test\" are created.  Default is the source directory."),
		ArgsAndParms("images"		, ""		, std::filesystem::path(), "Directory with the images.  Default is \"<src>/all_images\"."),
		ArgsAndParms("labels"		, ""		, std::filesystem::path(), "Directory with the YOLO annotations.  Default is \"<src>/all_labels\"."),

		// split and pruning options
		ArgsAndParms("valid"		, "validation"	, 0.2	, "Fraction of the dataset to use for validation, between 0 and 1."),
		ArgsAndParms("test"			, ""			, 0.0	, "Fraction of the dataset to use for testing, between 0 and 1.  When not set, no test split is created."),
		ArgsAndParms("dump"			, "ndump"		, 0		, "Number of images with empty annotations to randomly drop."),
		ArgsAndParms("minsamples"	, ""			, 10	, "Classes with fewer samples than this are removed."),
		ArgsAndParms("rand"			, "seed"		, 1		, "Seed used for all random selections.  The same seed and dataset always results in the same split."),

		// other options
		ArgsAndParms("dryrun"		, ""			, "Display the results without copying any files."),
		ArgsAndParms("overwrite"	, ""			, "Replace existing \"train\", \"valid\", and \"test\" directories."),
		ArgsAndParms("verifyimages"	, ""			, "Use OpenCV to confirm each image is in a format that can be read."),
	};

	return all;
}


void YoloSplit::display_usage()
{
	TAT(TATPARMS);

	const auto & all = YoloSplit::get_all_possible_arguments();

	auto & output = *YoloSplit::CfgAndState::get().output;

	output
		<< std::endl
		<< "YoloSplit CLI usage:" << std::endl
		<< std::endl
		<< "\t\tyolosplit <command> [<options>]" << std::endl
		<< std::endl
		<< "Example:" << std::endl
		<< std::endl
		<< "\t\tyolosplit split --src ~/nn/animals --valid 0.2 --test 0.1 --dump 50" << std::endl
		<< std::endl
		<< "Commands:" << std::endl;

	// show the details for the commands, one per line
	for (const auto & item : all)
	{
		if (item.type == ArgsAndParms::EType::kCommand)
		{
			output << "  " << YoloSplit::format_in_colour(item.name, YoloSplit::EColour::kBrightWhite, -10) << ":  " << item.description << std::endl;
		}
	}

	output << std::endl << "Options:" << std::endl;

	for (const auto & item : all)
	{
		if (item.type != ArgsAndParms::EType::kParameter)
		{
			continue;
		}

		std::string name = item.name;
		if (not item.name_alternate.empty())
		{
			name += " (" + item.name_alternate + ")";
		}

		output << "  " << YoloSplit::format_in_colour(name, YoloSplit::EColour::kBrightCyan, -28) << ":  " << item.description;

		if (item.expect_parm and not item.expect_path)
		{
			output << "  [default=" << item.value << "]";
		}
		output << std::endl;
	}

	output
		<< std::endl
		<< "Options are case-insensitive, and all non-alphanumeric characters are ignored.  This means \"--min_samples\"," << std::endl
		<< "\"-minsamples\", and \"MinSamples\" all refer to the same option." << std::endl
		<< std::endl;

	return;
}
