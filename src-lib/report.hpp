#pragma once

#include "yolosplit_internal.hpp"


namespace YoloSplit
{
	/// Everything we display once a dataset has been pruned and split.  @see @ref make_report()
	struct Report
	{
		ClassHistogram histogram_before;
		ClassHistogram histogram_after;

		size_t empty_found;
		size_t empty_dumped;

		ClassHistogram classes_removed;
		size_t samples_removed;

		VStageReports stages;

		bool has_test;
		ClassHistogram train;
		ClassHistogram valid;
		ClassHistogram test;
	};

	/// Gather the statistics from a split so they can be displayed.
	Report make_report(const SplitResult & result);

	/** Format a histogram as a table with one row per label, the number of samples, and the percentage of the total.
	 * Each line is terminated with a newline.
	 */
	std::string format_histogram(const ClassHistogram & histogram);

	/// Display the class distribution of a summarized pool.  Used by the @p summary command.
	void display_summary(const ClassHistogram & histogram);

	/// Display the pruning, the split method used by each stage, and the final class distribution of each split.
	void display_report(const Report & report);
}
