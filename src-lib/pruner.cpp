#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();
}


YoloSplit::Pool YoloSplit::dump_empty_samples(const Pool & pool, const size_t n_dump, std::mt19937 & rng)
{
	TAT(TATPARMS);

	VSizeT empty;
	for (size_t idx = 0; idx < pool.size(); idx ++)
	{
		if (pool[idx].label == kEmptyLabel)
		{
			empty.push_back(idx);
		}
	}

	if (n_dump > empty.size())
	{
		throw ConfigurationError(
			"cannot dump " + format_count(n_dump, "empty sample") +
			" since the dataset only has " + format_count(empty.size(), "empty sample"));
	}

	// std::sample() selects without replacement, and keeps the selected indexes in ascending order
	VSizeT targets;
	targets.reserve(n_dump);
	std::sample(empty.begin(), empty.end(), std::back_inserter(targets), n_dump, rng);

	std::vector<bool> is_dumped(pool.size(), false);
	for (const size_t idx : targets)
	{
		is_dumped[idx] = true;
	}

	Pool result;
	result.reserve(pool.size() - targets.size());
	for (size_t idx = 0; idx < pool.size(); idx ++)
	{
		if (is_dumped[idx])
		{
			if (cfg_and_state.is_verbose)
			{
				*cfg_and_state.output << "-> dumping empty sample " << pool[idx].stem << std::endl;
			}
			continue;
		}
		result.push_back(pool[idx]);
	}

	return result;
}


YoloSplit::Pool YoloSplit::remove_small_classes(const Pool & pool, const size_t min_samples, ClassHistogram & removed)
{
	TAT(TATPARMS);

	removed.clear();

	const auto histogram = build_histogram(pool);
	for (const auto & [label, count] : histogram)
	{
		if (count < min_samples)
		{
			removed[label] = count;
		}
	}

	Pool result;
	result.reserve(pool.size());
	for (const auto & sample : pool)
	{
		if (removed.count(sample.label) == 0)
		{
			result.push_back(sample);
		}
	}

	return result;
}


YoloSplit::PruneResult YoloSplit::prune(const Pool & pool, const std::optional<size_t> & n_dump, const size_t min_samples, std::mt19937 & rng)
{
	TAT(TATPARMS);

	PruneResult result;
	result.histogram_before	= build_histogram(pool);
	result.empty_available	= result.histogram_before.count(kEmptyLabel) ? result.histogram_before.at(kEmptyLabel) : 0;
	result.empty_dumped		= 0;
	result.samples_removed	= 0;

	Pool working = pool;

	if (n_dump.has_value())
	{
		working = dump_empty_samples(working, n_dump.value(), rng);
		result.empty_dumped = pool.size() - working.size();
	}

	const size_t size_before_filter = working.size();
	result.pool				= remove_small_classes(working, min_samples, result.classes_removed);
	result.samples_removed	= size_before_filter - result.pool.size();
	result.histogram_after	= build_histogram(result.pool);

	return result;
}
