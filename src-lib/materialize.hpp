#pragma once

#include "yolosplit_internal.hpp"


namespace YoloSplit
{
	/// Get the names of the split directories which will be created, such as @p "train" and @p "valid".
	VStr get_split_names(const bool has_test);

	/** Verify that we won't silently replace the results of a previous run.  If any of the split directories or image
	 * list files already exist in the output directory, then @p --overwrite must have been specified.
	 *
	 * @throw ConfigurationError if the output already exists and overwriting was not requested.
	 */
	void check_output_directories(const Parameters & parms);

	/** Copy the images and annotations of each split into @p "<out>/<split>/images" and @p "<out>/<split>/labels", and
	 * write the Darknet image list files @p "<out>/train.txt", @p "<out>/valid.txt", and @p "<out>/test.txt".  When
	 * @p --overwrite is set, the existing split directories are deleted first.  Does nothing if @p --dry_run is set.
	 *
	 * @returns the number of files copied.
	 * @throw std::filesystem::filesystem_error if a directory cannot be created or a file cannot be copied.
	 */
	size_t materialize(const SplitResult & result, const Parameters & parms);
}
