/* Darknet/YOLO:  https://github.com/hank-ai/darknet
 * Copyright 2024-2025 Stephane Charette
 */

#pragma once

#ifndef __cplusplus
#error "The YoloSplit project requires a C++ compiler."
#endif

/** @file
 * Include this file to get access to the YoloSplit C++ API, used to prune and partition Darknet/YOLO datasets into
 * balanced training, validation, and test sets.
 */

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <ciso646>


/** The namespace for the YoloSplit C++ API.  Note this namespace contains both public and private API calls.
 * The structures, enums, classes and functions declared in yolosplit.hpp are part of the public API.
 */
namespace YoloSplit
{
	/// @{ Convenient simple types used in the YoloSplit C++ API.
	using MStr			= std::map<std::string, std::string>;
	using SStr			= std::set<std::string>;
	using SInt			= std::set<int>;
	using VInt			= std::vector<int>;
	using VSizeT		= std::vector<size_t>;
	using VStr			= std::vector<std::string>;
	/// @}

	/// Representative label given to a sample whose annotation file does not contain any objects.
	constexpr int kEmptyLabel = -1;

	/// Placeholder label for samples which have not yet been summarized.  @see @ref summarize_pool()
	constexpr int kUnassignedLabel = -2;

	/** An image and its annotation file.  Both files share the same stem.  The annotation file must exist, while the
	 * image is optional (some datasets contain annotations for images which have since been deleted).
	 */
	struct Sample
	{
		std::string stem;					///< The common stem, such as @p "frame_000123".
		std::filesystem::path image;		///< Full path to the image.  Empty if no image was found for this stem.
		std::filesystem::path annotation;	///< Full path to the YOLO @p .txt annotation file.
		int label;							///< The representative class.  @see @ref kEmptyLabel @see @ref kUnassignedLabel
	};

	/// An ordered collection of samples.  The order is always the sorted order of the annotation filenames.
	using Pool = std::vector<Sample>;

	/// The key is the representative label, the value is the number of samples with that label.
	using ClassHistogram = std::map<int, size_t>;

	/// Which algorithm was used to split a pool.  @see @ref Partition
	enum class ESplitMethod
	{
		kStratified,	///< Per-class proportions were preserved.
		kFallback		///< Stratification was not possible, so a uniform random split was used instead.
	};

	/** The result of splitting a pool in two.  @p held_out is the validation (or test) side, @p kept is everything else.
	 * Both sides preserve the order of the original pool.
	 */
	struct Partition
	{
		Pool kept;
		Pool held_out;
		ESplitMethod method;
		double fraction;	///< The fraction that was requested for @p held_out.
		std::string reason;	///< When @p method is @ref ESplitMethod::kFallback, why stratification was not possible.
	};

	/** All the settings which control a single run.  Normally populated from the command-line with
	 * @ref Parameters::from_cfg(), but may also be filled in manually when using YoloSplit as a library.
	 */
	struct Parameters
	{
		Parameters();

		/// Get the parameters from the command-line arguments stored in @ref CfgAndState.
		static Parameters from_cfg();

		/// Throws @ref ConfigurationError if the parameters are contradictory or out of range.
		const Parameters & validate() const;

		/// Directory which contains @p "all_images" and @p "all_labels".
		std::filesystem::path source_directory;

		/// Where the @p "train", @p "valid", and @p "test" directories are created.  Defaults to @ref source_directory.
		std::filesystem::path output_directory;

		/// Defaults to @p "<src>/all_images".
		std::filesystem::path images_directory;

		/// Defaults to @p "<src>/all_labels".
		std::filesystem::path labels_directory;

		double validation_fraction;
		std::optional<double> test_fraction;

		/// Number of empty samples to randomly drop.
		std::optional<size_t> n_dump;

		/// Classes with fewer samples than this are removed.
		size_t min_samples;

		unsigned int random_seed;

		bool overwrite;
		bool dry_run;
		bool verify_images;
	};

	/// Thrown when parameters are contradictory, out of range, or cannot be satisfied by the dataset.
	class ConfigurationError : public std::invalid_argument
	{
		public:

			explicit ConfigurationError(const std::string & msg);
	};

	/// Thrown when an annotation file cannot be read or contains an invalid class index.
	class ParseError : public std::runtime_error
	{
		public:

			ParseError(const std::filesystem::path & fn, const size_t line, const std::string & msg);

			std::filesystem::path filename;

			/// The 1-based line number, or zero if the problem is not related to a specific line.
			size_t line_number;
	};

	/// Thrown when a pool cannot be split into two non-empty sides.
	class PartitionError : public std::runtime_error
	{
		public:

			explicit PartitionError(const std::string & msg);
	};

	/** Display a few lines of text with some version information.
	 */
	void show_version_info();

	/** Set the @ref CfgAndState::is_verbose flag.  When enabled, extra information will be sent to the output stream.
	 * Default value is @p false.  Disabling @p verbose will also disable @p trace.
	 */
	void set_verbose(const bool flag);

	/// Set the @ref CfgAndState::is_trace flag.  Enabling @p trace will also enable @p verbose.
	void set_trace(const bool flag);

	/// Enable or disable ANSI colour output.
	void set_colour_enabled(const bool flag);

	/** Set the stream where all output is logged.  An empty filename resets the output to @p std::cout.  Otherwise the
	 * file is truncated and opened for writing.
	 */
	void set_output_stream(const std::filesystem::path & filename);

	/** Find all the images and annotations in the given directories, and pair them by stem.  The resulting samples have
	 * the label @ref kUnassignedLabel.
	 *
	 * @throw ConfigurationError if either directory does not exist.
	 * @throw ParseError if two images share the same stem.
	 */
	Pool scan_pool(const std::filesystem::path & images_directory, const std::filesystem::path & labels_directory, const bool verify_images = false);

	/** Read a YOLO annotation file and return the class index found on each non-blank line.
	 *
	 * @throw ParseError if the file cannot be read, or a line does not start with a non-negative integer.
	 */
	VInt read_annotation(const std::filesystem::path & filename);

	/** Get the representative label for the given class indices:  @ref kEmptyLabel when empty, otherwise the most
	 * frequent class.  When several classes are tied, the lowest class index wins.
	 */
	int representative_label(const VInt & class_indices);

	/// Return a copy of the pool where each sample has been assigned its representative label.
	Pool summarize_pool(const Pool & pool);

	/// Count the number of samples per representative label.
	ClassHistogram build_histogram(const Pool & pool);

	/// Get a human-readable name for the label, such as @p "class #3" or @p "empty".
	std::string label_name(const int label);

	/// Get a human-readable name for the split method.
	std::string to_string(const ESplitMethod method);

	/** Split @p pool so that approximately @p fraction of the samples are held out, preserving the proportion of each
	 * class when possible.  Falls back to a uniform random split when stratification cannot be done.
	 *
	 * @throw PartitionError if the pool is empty, the fraction is not within (0, 1), or either side would be empty.
	 */
	Partition partition(const Pool & pool, const double fraction, std::mt19937 & rng);
}
