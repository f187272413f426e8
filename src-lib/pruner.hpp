#pragma once

#include "yolosplit_internal.hpp"


namespace YoloSplit
{
	/// Everything we know about the pruning which happened prior to splitting the pool.  @see @ref prune()
	struct PruneResult
	{
		/// The samples which remain after both pruning passes.
		Pool pool;

		ClassHistogram histogram_before;
		ClassHistogram histogram_after;

		/// Number of samples which had the empty label before anything was dumped.
		size_t empty_available;

		/// Number of empty samples which were randomly dropped.
		size_t empty_dumped;

		/// Classes removed because they had too few samples.  The value is the number of samples which had that label.
		ClassHistogram classes_removed;

		/// Total number of samples removed because their class had too few samples.
		size_t samples_removed;
	};

	/** Randomly remove exactly @p n_dump samples which have the label @ref kEmptyLabel.
	 *
	 * @throw ConfigurationError if the pool does not contain at least @p n_dump empty samples.  The pool is not modified.
	 */
	Pool dump_empty_samples(const Pool & pool, const size_t n_dump, std::mt19937 & rng);

	/** Remove every sample whose class has fewer than @p min_samples samples.  This is a single pass:  classes which are
	 * not below the threshold when this is called are never removed, even if the pool changes as a result.
	 *
	 * @param [out] removed The classes that were removed, and how many samples each one had.
	 */
	Pool remove_small_classes(const Pool & pool, const size_t min_samples, ClassHistogram & removed);

	/// Apply @ref dump_empty_samples() when @p n_dump is set, and then @ref remove_small_classes().
	PruneResult prune(const Pool & pool, const std::optional<size_t> & n_dump, const size_t min_samples, std::mt19937 & rng);
}
