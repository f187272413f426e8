#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();

	/// Absorbs floating point noise such as 0.7 * 10 = 7.000000000000001 before rounding.
	constexpr double kEpsilon = 1.0e-9;


	/// Get a random permutation of the indexes @p [0, n).
	YoloSplit::VSizeT random_permutation(const size_t n, std::mt19937 & rng)
	{
		TAT(TATPARMS);

		YoloSplit::VSizeT indexes(n);
		std::iota(indexes.begin(), indexes.end(), 0);
		std::shuffle(indexes.begin(), indexes.end(), rng);

		return indexes;
	}


	/// Build the final partition from a flag per sample.  Both sides keep the order of the original pool.
	YoloSplit::Partition build_partition(const YoloSplit::Pool & pool, const std::vector<bool> & is_held_out, const YoloSplit::ESplitMethod method, const double fraction)
	{
		TAT(TATPARMS);

		YoloSplit::Partition partition;
		partition.method	= method;
		partition.fraction	= fraction;

		for (size_t idx = 0; idx < pool.size(); idx ++)
		{
			if (is_held_out[idx])
			{
				partition.held_out.push_back(pool[idx]);
			}
			else
			{
				partition.kept.push_back(pool[idx]);
			}
		}

		return partition;
	}


	/** Returns an empty string if the pool can be stratified, otherwise returns a description of the first problem found.
	 * These are the same conditions under which a stratified shuffle split cannot guarantee every class appears on both
	 * sides of the split.
	 */
	std::string stratification_problem(const YoloSplit::ClassHistogram & histogram, const size_t n_held, const size_t n_kept)
	{
		TAT(TATPARMS);

		for (const auto & [label, count] : histogram)
		{
			if (count < 2)
			{
				return YoloSplit::label_name(label) + " has only " + YoloSplit::format_count(count, "member") + ", which cannot be split";
			}
		}

		if (n_held < histogram.size())
		{
			return "the held-out size (" + std::to_string(n_held) + ") is smaller than the number of classes (" + std::to_string(histogram.size()) + ")";
		}

		if (n_kept < histogram.size())
		{
			return "the kept size (" + std::to_string(n_kept) + ") is smaller than the number of classes (" + std::to_string(histogram.size()) + ")";
		}

		return "";
	}


	/** Distribute @p n_held across the classes in proportion to the class sizes using the largest remainder method.  The
	 * units left over after rounding down go to the largest fractional parts; ties go to the larger class, and then to
	 * the lower label.  No class is given more than @p ceil(fraction * count), so rounding the total up never pushes a
	 * class more than one sample past its own share.
	 */
	YoloSplit::ClassHistogram allocate_held_out(const YoloSplit::ClassHistogram & histogram, const size_t n_held, const size_t n, const double fraction)
	{
		TAT(TATPARMS);

		struct Remainder
		{
			int label;
			size_t count;
			size_t limit;
			double fraction;
		};
		std::vector<Remainder> remainders;

		YoloSplit::ClassHistogram allocation;
		size_t allocated = 0;

		for (const auto & [label, count] : histogram)
		{
			const double exact = static_cast<double>(n_held) * static_cast<double>(count) / static_cast<double>(n);
			const size_t limit = static_cast<size_t>(std::ceil(fraction * static_cast<double>(count) - kEpsilon));
			const size_t whole = std::min(limit, static_cast<size_t>(std::floor(exact + kEpsilon)));

			allocation[label] = whole;
			allocated += whole;
			remainders.push_back({label, count, limit, exact - static_cast<double>(whole)});
		}

		std::sort(remainders.begin(), remainders.end(),
			[](const Remainder & lhs, const Remainder & rhs)
			{
				if (std::fabs(lhs.fraction - rhs.fraction) > kEpsilon)
				{
					return lhs.fraction > rhs.fraction;
				}
				if (lhs.count != rhs.count)
				{
					return lhs.count > rhs.count;
				}
				return lhs.label < rhs.label;
			});

		// classes already at their limit are skipped, so more than one pass may be needed
		bool progress = true;
		while (allocated < n_held and progress)
		{
			progress = false;
			for (size_t idx = 0; allocated < n_held and idx < remainders.size(); idx ++)
			{
				auto & quota = allocation[remainders[idx].label];
				if (quota < remainders[idx].limit)
				{
					quota ++;
					allocated ++;
					progress = true;
				}
			}
		}

		return allocation;
	}


	YoloSplit::Partition stratified_split(const YoloSplit::Pool & pool, const YoloSplit::ClassHistogram & histogram, const size_t n_held, const double fraction, std::mt19937 & rng)
	{
		TAT(TATPARMS);

		auto remaining = allocate_held_out(histogram, n_held, pool.size(), fraction);

		// walk a single permutation of the entire pool, and hold out the first members we encounter from each class
		std::vector<bool> is_held_out(pool.size(), false);
		for (const size_t idx : random_permutation(pool.size(), rng))
		{
			auto & quota = remaining[pool[idx].label];
			if (quota > 0)
			{
				is_held_out[idx] = true;
				quota --;
			}
		}

		return build_partition(pool, is_held_out, YoloSplit::ESplitMethod::kStratified, fraction);
	}


	YoloSplit::Partition random_split(const YoloSplit::Pool & pool, const double fraction, std::mt19937 & rng)
	{
		TAT(TATPARMS);

		const size_t n_held = static_cast<size_t>(std::floor(fraction * static_cast<double>(pool.size()) + kEpsilon));

		const auto permutation = random_permutation(pool.size(), rng);

		std::vector<bool> is_held_out(pool.size(), false);
		for (size_t idx = 0; idx < n_held; idx ++)
		{
			is_held_out[permutation[idx]] = true;
		}

		return build_partition(pool, is_held_out, YoloSplit::ESplitMethod::kFallback, fraction);
	}
}


YoloSplit::Partition YoloSplit::partition(const Pool & pool, const double fraction, std::mt19937 & rng)
{
	TAT(TATPARMS);

	if (pool.empty())
	{
		throw PartitionError("cannot split an empty pool");
	}

	if (not (fraction > 0.0 and fraction < 1.0))
	{
		throw PartitionError("the split fraction must be between 0 and 1, not " + std::to_string(fraction));
	}

	const size_t n		= pool.size();
	const size_t n_held	= std::min(n, static_cast<size_t>(std::ceil(fraction * static_cast<double>(n) - kEpsilon)));
	const size_t n_kept	= n - n_held;

	const auto histogram = build_histogram(pool);
	const std::string problem = stratification_problem(histogram, n_held, n_kept);

	Partition result;
	if (problem.empty())
	{
		result = stratified_split(pool, histogram, n_held, fraction, rng);
	}
	else
	{
		display_warning_msg("cannot stratify " + format_count(n, "sample") + " (" + problem + "); using a random split instead\n");
		result = random_split(pool, fraction, rng);
		result.reason = problem;
	}

	if (result.kept.empty() or result.held_out.empty())
	{
		throw PartitionError(
			"splitting " + format_count(n, "sample") + " at " + std::to_string(fraction) +
			" results in " + std::to_string(result.kept.size()) + " kept and " + std::to_string(result.held_out.size()) + " held out");
	}

	if (cfg_and_state.is_verbose)
	{
		*cfg_and_state.output
			<< "-> " << to_string(result.method) << " split of " << format_count(n, "sample")
			<< " at " << format_fraction(fraction)
			<< ": " << result.kept.size() << " kept, " << result.held_out.size() << " held out" << std::endl;
	}

	return result;
}
