#pragma once

#include "yolosplit_internal.hpp"


namespace YoloSplit
{
	/// What happened during one binary split.
	struct StageReport
	{
		std::string name;		///< E.g., @p "train/valid".
		ESplitMethod method;
		double fraction;		///< The fraction requested for the held-out side of this stage.
		size_t input_size;
		size_t kept_size;
		size_t held_out_size;
		std::string reason;		///< Why stratification was not possible.  Empty when @p method is @ref ESplitMethod::kStratified.
	};

	using VStageReports = std::vector<StageReport>;

	/// The final train, validation, and optional test sets.  @see @ref split_dataset()
	struct SplitResult
	{
		Pool train;
		Pool valid;

		/// Always empty when @ref has_test is @p false.
		Pool test;
		bool has_test;

		PruneResult pruning;
		VStageReports stages;
	};

	/** Prune the summarized pool and split it into training and validation sets, and optionally a test set.  A single
	 * random number generator is seeded from @p parms and is used by every random step, so the same input and the same
	 * parameters always result in the same split.
	 *
	 * With a test fraction @p t and validation fraction @p v, the pool is first split in two with @p v+t held out, and the
	 * held-out portion is then split again with @p t/(v+t) going to the test set.
	 *
	 * @throw ConfigurationError if the parameters are invalid or cannot be satisfied.
	 * @throw PartitionError if either of the splits fails.  No partial result is returned.
	 */
	SplitResult split_dataset(const Pool & summarized, const Parameters & parms);

	/// Scan, summarize, prune, and split.  Nothing is written to disk.
	SplitResult run_pipeline(const Parameters & parms);

	/// Get a copy of the stems in the pool, in the pool order.
	VStr get_stems(const Pool & pool);
}
