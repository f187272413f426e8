#pragma once

/** @file
 * Collection of helper and utility functions for YoloSplit.
 */


#include "yolosplit_internal.hpp"


namespace YoloSplit
{
	/// Convert to lowercase and remove all but alphanumerics.
	std::string convert_to_lowercase_alphanum(const std::string & arg);

	/// Trim leading and trailing whitespace.
	std::string trim(const std::string & str);

	/// Trim leading and trailing whitespace.  The string is modified in place.
	std::string & trim(std::string & str);

	/// Convert the string to lowercase.
	std::string lowercase(const std::string & str);

	/// Convert the string to lowercase.  The string is modified in place.
	std::string & lowercase(std::string & str);

	/// Determine if the filename has one of the image extensions we recognize.  The comparison is case-insensitive.
	bool is_image_filename(const std::filesystem::path & path);

	/// Format a count with the singular or plural noun, such as @p "1 sample" or @p "23 samples".
	std::string format_count(const size_t count, const std::string & singular, const std::string & plural = "");
}
