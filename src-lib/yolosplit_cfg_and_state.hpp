/* Darknet/YOLO:  https://github.com/hank-ai/darknet
 * Copyright 2024-2025 Stephane Charette
 */

#pragma once

#include "yolosplit.hpp"
#include "yolosplit_args_and_parms.hpp"


namespace YoloSplit
{
	class CfgAndState final
	{
		private:

			/// Private constructor.  Use @ref get().
			CfgAndState();

		public:

			/// Destructor.
			~CfgAndState();

			/// Get a reference to the singleton used by YoloSplit.
			static CfgAndState & get();

			/// Clear out all settings and state to a known initial state.
			CfgAndState & reset();

			/// Process @p argv[] from @p main() and store the results in @p argv and @p args.
			CfgAndState & process_arguments(int argc, char ** argp);

			/// Process the given arguments.
			CfgAndState & process_arguments(const VStr & v);

			/** Determine if the user specified the given option, or if unspecified then use the default value.
			 *
			 * For example:
			 * ~~~~
			 * if (cfg.is_set("dryrun"))
			 * {
			 *     // do something when the user specified --dry_run
			 * }
			 * ~~~~
			 */
			bool is_set(const std::string & arg, const bool default_value = false) const;

			/** Get a CLI argument based on the name.  For example, if you call it with @p "valid" you'd get the validation
			 * argument with the default value of 0.2 or whatever the user typed on the CLI.
			 */
			const ArgsAndParms & get(const std::string & arg) const;

			/// Get a numeric parameter.  This provided default value will be used if this parameter does not exist.
			double get(const std::string & arg, const double d) const;

			/// Get a numeric parameter.  This @em must have been specified, otherwise @p std::invalid_argument is thrown.
			double get_double(const std::string & arg) const;

			/// Get a path parameter.  Returns an empty path if it was not specified.
			std::filesystem::path get_path(const std::string & arg) const;

			/// Output from YoloSplit is logged to this stream, which defaults to @p std::cout.  This can be changed with @p --log.
			std::ostream * output;

			/// When @p --log is used, this is the file which @ref output references.
			std::unique_ptr<std::ofstream> log_file;

			/// Determines if ANSI colour output will be used with the console output.  Default is @p true.
			bool colour_is_enabled;

			/** Whether YoloSplit was started with the @p --verbose flag.  Default is @p false.
			 * @see @ref YoloSplit::set_verbose()
			 * @see @ref is_trace
			 */
			bool is_verbose;

			/** Whether YoloSplit was started with the @p --trace flag.  This will also enable @ref is_verbose.  Default is @p false.
			 * @see @ref YoloSplit::set_trace()
			 * @see @ref is_verbose
			 */
			bool is_trace;

			/// Every argument starting with @p argv[1], unmodified, and in the exact order they were specified.
			VStr argv;

			/** A map of all arguments.  Note this only has the arguments the user specified, not a collection of "all"
			 * possible arguments.  @see @ref YoloSplit::get_all_possible_arguments()
			 */
			MArgsAndParms args;

			std::string command;

			/// Existing files and directories which were given without an option name.
			VStr filenames;

			/// Parameters that were unrecognized.
			VStr additional_arguments;
	};
}
