#include "yolosplit_internal.hpp"


YoloSplit::CfgAndState::CfgAndState()
{
	TAT(TATPARMS);

	reset();

	return;
}


YoloSplit::CfgAndState::~CfgAndState()
{
	TAT(TATPARMS);

	return;
}


YoloSplit::CfgAndState & YoloSplit::CfgAndState::get()
{
	TAT(TATPARMS);

	static CfgAndState cfg_and_state;

	return cfg_and_state;
}


YoloSplit::CfgAndState & YoloSplit::CfgAndState::reset()
{
	TAT(TATPARMS);

	/* Default is to use std::cout for console output.  Do *NOT* call set_output_stream() from here,
	 * since it will cause infinite recursion when it attempts to call CfgAndState::get().
	 */
	output = &std::cout;
	*output << std::fixed; // if this is changed, see set_output_stream()
	log_file.reset();

	colour_is_enabled		= true;
	is_verbose				= false;
	is_trace				= false;

	argv					.clear();
	args					.clear();
	command					.clear();
	filenames				.clear();
	additional_arguments	.clear();

	return *this;
}


YoloSplit::CfgAndState & YoloSplit::CfgAndState::process_arguments(int argc, char ** argp)
{
	TAT(TATPARMS);

	argv.clear();
	args.clear();

	argv.reserve(argc);

	for (int idx = 1; idx < argc; idx ++) // ignore argv[0]
	{
		argv.push_back(argp[idx]);
	}

	return process_arguments(argv);
}


YoloSplit::CfgAndState & YoloSplit::CfgAndState::process_arguments(const VStr & v)
{
	TAT(TATPARMS);

	args.clear();
	const auto & all_known_args = YoloSplit::get_all_possible_arguments();

	for (size_t idx = 0; idx < v.size(); idx ++)
	{
		const std::string & original_arg = v.at(idx);
		const std::string str = convert_to_lowercase_alphanum(original_arg);

		// see if this parameter exists, either as primary name or an alternate spelling
		const auto iter = [&]()
		{
			for (auto i = all_known_args.begin(); i != all_known_args.end(); i++)
			{
				if (i->name == str or (not i->name_alternate.empty() and convert_to_lowercase_alphanum(i->name_alternate) == str))
				{
					return i;
				}
			}

			// name was not found
			return all_known_args.end();
		}();

		if (iter == all_known_args.end())
		{
			// see if the argument is a valid filename or directory
			std::filesystem::path path(original_arg);
			if (not original_arg.empty() and std::filesystem::exists(path))
			{
				filenames.push_back(path.string());

				// we don't have an "iter" for filenames, so loop back up to the top of the for() loop
				continue;
			}

			// this argument is unknown to YoloSplit (we even looked through the alternate spellings)
			additional_arguments.push_back(original_arg);
			display_warning_msg("skipped argument #" + std::to_string(idx) + " \"" + original_arg + "\" (does not appear to be a known parameter, file, or directory)\n");

			continue;
		}

		if (args.count(iter->name) > 0)
		{
			// why was this parameter specified more than once?
			throw std::invalid_argument("argument \"" + original_arg + "\" specified more than once (argument #" + std::to_string(args[iter->name].arg_index) + " and #" + std::to_string(idx) + ")");
		}

		ArgsAndParms args_and_parms	= *iter;
		args_and_parms.arg_index	= idx;

		if (args_and_parms.type == ArgsAndParms::EType::kCommand)
		{
			if (not command.empty())
			{
				throw std::invalid_argument("command \"" + command + "\" is already set while processing new command argument \"" + original_arg + "\"");
			}
			command = iter->name;
		}

		if (args_and_parms.type == ArgsAndParms::EType::kParameter and args_and_parms.expect_parm)
		{
			const size_t next_arg_idx = idx + 1;
			if (next_arg_idx >= v.size())
			{
				throw std::invalid_argument("expected an additional parameter after " + original_arg);
			}

			const std::string & next_arg = v.at(next_arg_idx);

			if (args_and_parms.expect_path)
			{
				args_and_parms.filename = next_arg;
			}
			else
			{
				// the next parm should be a numeric value
				size_t pos = 0;
				try
				{
					args_and_parms.value = std::stod(next_arg, &pos);
				}
				catch (const std::exception &)
				{
					pos = 0;
				}

				if (pos == 0 or pos != next_arg.size())
				{
					throw std::invalid_argument("expected a numeric parameter after " + original_arg + ", not \"" + next_arg + "\"");
				}
			}

			// consume the next argument
			idx ++;
		}

		args[iter->name] = args_and_parms;
	}

	if (args.count("verbose") > 0)
	{
		is_verbose = true;
	}

	if (args.count("trace") > 0)
	{
		is_verbose	= true;
		is_trace	= true;
	}

	if (args.count("colour") > 0)
	{
		colour_is_enabled = true;
	}

	if (args.count("nocolour") > 0)
	{
		colour_is_enabled = false;
	}

	if (args.count("log") > 0)
	{
		set_output_stream(get_path("log"));
	}

	// for debug purposes, display all arguments
	if (is_trace)
	{
		*output
			<< "--------------------------------" << std::endl
			<< "CMD=" << command << std::endl
			<< "ARG=" << args.size() << std::endl;
		for (const auto & [key, val] : args)
		{
			*output
				<< "IDX=" << val.arg_index
				<< " NUM=" << val.value
				<< " EXPECT=" << val.expect_parm
				<< " KEY=" << key
				<< " VAL=" << val.name
				<< " PATH=" << val.filename.string();
			if (val.name_alternate.empty() == false)
			{
				*output << " ALT=" << val.name_alternate;
			}
			*output << std::endl;
		}
		for (const auto & fn : filenames)
		{
			*output << "FILE=" << fn << std::endl;
		}
		*output << "--------------------------------" << std::endl;
	}

	return *this;
}


bool YoloSplit::CfgAndState::is_set(const std::string & arg, const bool default_value) const
{
	TAT(TATPARMS);

	const std::string name = convert_to_lowercase_alphanum(arg);

	if (args.count(name) > 0)
	{
		return true;
	}

	// if we get here we haven't yet found a match, so look through all the "alternate" names as well

	for (const auto & [key, val] : args)
	{
		if (convert_to_lowercase_alphanum(val.name_alternate) == name and not name.empty())
		{
			return true;
		}
	}

	return default_value;
}


const YoloSplit::ArgsAndParms & YoloSplit::CfgAndState::get(const std::string & arg) const
{
	TAT(TATPARMS);

	const std::string name = convert_to_lowercase_alphanum(arg);

	if (args.count(name))
	{
		return args.at(name);
	}

	// if we get here we don't have a perfect match, so go ahead and check the alternate names

	for (const auto & [key, val] : args)
	{
		if (not val.name_alternate.empty() and convert_to_lowercase_alphanum(val.name_alternate) == name)
		{
			return val;
		}
	}

	// if we get here, this argument wasn't specified on the CLI so get the default value from the known list of arguments

	const auto & all_known_args = YoloSplit::get_all_possible_arguments();
	for (const auto & known_arg : all_known_args)
	{
		if (known_arg.name == name or
			(not known_arg.name_alternate.empty() and convert_to_lowercase_alphanum(known_arg.name_alternate) == name))
		{
			return known_arg;
		}
	}

	// if we get here, we have no idea what this argument might be
	throw std::invalid_argument("cannot find argument \"" + arg + "\"");
}


double YoloSplit::CfgAndState::get(const std::string & arg, const double d) const
{
	TAT(TATPARMS);

	try
	{
		return get(arg).value;
	}
	catch (const std::invalid_argument &)
	{
		// no clue what this might be so use the default value that was passed in
	}

	return d;
}


double YoloSplit::CfgAndState::get_double(const std::string & arg) const
{
	TAT(TATPARMS);

	if (not is_set(arg))
	{
		throw std::invalid_argument("failed to find a parameter named \"" + arg + "\"");
	}

	return get(arg).value;
}


std::filesystem::path YoloSplit::CfgAndState::get_path(const std::string & arg) const
{
	TAT(TATPARMS);

	if (not is_set(arg))
	{
		return {};
	}

	return get(arg).filename;
}
