#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();


	YoloSplit::StageReport make_stage_report(const std::string & name, const YoloSplit::Pool & input, const YoloSplit::Partition & partition)
	{
		TAT(TATPARMS);

		YoloSplit::StageReport stage;
		stage.name			= name;
		stage.method		= partition.method;
		stage.fraction		= partition.fraction;
		stage.input_size	= input.size();
		stage.kept_size		= partition.kept.size();
		stage.held_out_size	= partition.held_out.size();
		stage.reason		= partition.reason;

		return stage;
	}
}


YoloSplit::SplitResult YoloSplit::split_dataset(const Pool & summarized, const Parameters & parms)
{
	TAT(TATPARMS);

	parms.validate();

	// one generator for the entire run, used by both pruning and splitting
	std::mt19937 rng(parms.random_seed);

	SplitResult result;
	result.has_test	= parms.test_fraction.has_value();
	result.pruning	= prune(summarized, parms.n_dump, parms.min_samples, rng);

	const Pool & pool = result.pruning.pool;

	if (cfg_and_state.is_verbose)
	{
		*cfg_and_state.output
			<< "-> splitting " << format_count(pool.size(), "sample")
			<< " using seed " << parms.random_seed << std::endl;
	}

	if (not result.has_test)
	{
		const auto train_and_valid = partition(pool, parms.validation_fraction, rng);

		result.train = train_and_valid.kept;
		result.valid = train_and_valid.held_out;
		result.stages.push_back(make_stage_report("train/valid", pool, train_and_valid));

		return result;
	}

	const double v = parms.validation_fraction;
	const double t = parms.test_fraction.value();

	const auto train_and_rest = partition(pool, v + t, rng);
	result.stages.push_back(make_stage_report("train/valid+test", pool, train_and_rest));

	const auto valid_and_test = partition(train_and_rest.held_out, t / (v + t), rng);
	result.stages.push_back(make_stage_report("valid/test", train_and_rest.held_out, valid_and_test));

	result.train	= train_and_rest.kept;
	result.valid	= valid_and_test.kept;
	result.test		= valid_and_test.held_out;

	return result;
}


YoloSplit::SplitResult YoloSplit::run_pipeline(const Parameters & parms)
{
	TAT(TATPARMS);

	parms.validate();

	const Pool pool = scan_pool(parms.images_directory, parms.labels_directory, parms.verify_images);
	if (pool.empty())
	{
		throw ConfigurationError("no annotation files found in " + parms.labels_directory.string());
	}

	return split_dataset(summarize_pool(pool), parms);
}


YoloSplit::VStr YoloSplit::get_stems(const Pool & pool)
{
	TAT(TATPARMS);

	VStr stems;
	stems.reserve(pool.size());
	for (const auto & sample : pool)
	{
		stems.push_back(sample.stem);
	}

	return stems;
}
