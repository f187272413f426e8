#include <csignal>

#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();


	void yolosplit_signal_handler(int sig)
	{
		// prevent recursion if this signal happens again (set the default signal action)
		std::signal(sig, SIG_DFL);

		std::cout << std::endl << "YoloSplit interrupted by signal #" << sig << " (" << strsignal(sig) << ")" << std::endl;

		// output files may be incomplete, so re-raise the signal and let the default action terminate the process
		std::raise(sig);
	}


	YoloSplit::Parameters get_parameters()
	{
		TAT(TATPARMS);

		const auto parms = YoloSplit::Parameters::from_cfg();
		if (parms.source_directory.empty())
		{
			throw YoloSplit::ConfigurationError("the dataset directory must be specified (run \"yolosplit help\" for details)");
		}

		if (cfg_and_state.is_verbose)
		{
			*cfg_and_state.output
				<< "-> source:      " << parms.source_directory.string()	<< std::endl
				<< "-> images:      " << parms.images_directory.string()	<< std::endl
				<< "-> labels:      " << parms.labels_directory.string()	<< std::endl
				<< "-> output:      " << parms.output_directory.string()	<< std::endl
				<< "-> valid:       " << parms.validation_fraction			<< std::endl
				<< "-> test:        " << (parms.test_fraction.has_value() ? std::to_string(parms.test_fraction.value()) : "none") << std::endl
				<< "-> dump:        " << (parms.n_dump.has_value() ? std::to_string(parms.n_dump.value()) : "none") << std::endl
				<< "-> min samples: " << parms.min_samples					<< std::endl
				<< "-> seed:        " << parms.random_seed					<< std::endl;
		}

		return parms;
	}


	void summary()
	{
		TAT(TATPARMS);

		const auto parms = get_parameters();

		const auto pool = YoloSplit::scan_pool(parms.images_directory, parms.labels_directory, parms.verify_images);
		const auto summarized = YoloSplit::summarize_pool(pool);

		YoloSplit::display_summary(YoloSplit::build_histogram(summarized));

		return;
	}


	void split()
	{
		TAT(TATPARMS);

		const auto parms = get_parameters();
		parms.validate();

		// fail early if we'd end up overwriting a previous split
		YoloSplit::check_output_directories(parms);

		const auto result = YoloSplit::run_pipeline(parms);

		YoloSplit::display_report(YoloSplit::make_report(result));
		YoloSplit::materialize(result, parms);

		return;
	}
}


int main(int argc, char **argv)
{
	int rc = 0;

	try
	{
		std::signal(SIGINT	, yolosplit_signal_handler);	// 2: CTRL+C
		std::signal(SIGTERM	, yolosplit_signal_handler);	// 15: terminate
#ifndef WIN32
		std::signal(SIGHUP	, yolosplit_signal_handler);	// 1: hangup
		std::signal(SIGQUIT	, yolosplit_signal_handler);	// 3: quit
#endif

		// process the args before printing anything so we can handle "-colour" and "-nocolour" correctly
		cfg_and_state.process_arguments(argc, argv);

		*cfg_and_state.output << "YoloSplit \"" << YOLOSPLIT_VERSION_KEYWORD << "\" " << YoloSplit::in_colour(YoloSplit::EColour::kBrightWhite, YOLOSPLIT_VERSION_STRING) << std::endl;

		// a dataset directory without a command means we want to split it
		if (cfg_and_state.command.empty() and (cfg_and_state.is_set("src") or not cfg_and_state.filenames.empty()))
		{
			cfg_and_state.command = "split";
		}

		if		(cfg_and_state.command.empty())			{ YoloSplit::display_usage();		}
		else if (cfg_and_state.command == "help")		{ YoloSplit::display_usage();		}
		else if (cfg_and_state.command == "version")	{ YoloSplit::show_version_info();	}
		else if (cfg_and_state.command == "summary")	{ summary();						}
		else if (cfg_and_state.command == "split")		{ split();							}
		else
		{
			throw std::invalid_argument("invalid command (run \"yolosplit help\" for a list of possible commands)");
		}
	}
	catch (const std::exception & e)
	{
		*cfg_and_state.output << std::endl << "Error: " << YoloSplit::in_colour(YoloSplit::EColour::kBrightRed, e.what()) << std::endl;
		rc = 1;
	}

	TT_PRINT;

	return rc;
}
