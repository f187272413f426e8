#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();


	/// Get a whole non-negative number from the CLI, such as the number of samples to dump.
	size_t get_count(const std::string & name, const size_t default_value, const size_t maximum = std::numeric_limits<size_t>::max())
	{
		TAT(TATPARMS);

		const double d = cfg_and_state.get(name, static_cast<double>(default_value));
		if (d < 0.0 or d != std::floor(d))
		{
			throw YoloSplit::ConfigurationError("\"" + name + "\" must be a whole number greater or equal to zero, not " + std::to_string(d));
		}

		if (d > static_cast<double>(maximum))
		{
			throw YoloSplit::ConfigurationError("\"" + name + "\" cannot be larger than " + std::to_string(maximum) + ", not " + std::to_string(d));
		}

		return static_cast<size_t>(d);
	}
}


YoloSplit::Parameters::Parameters() :
	validation_fraction(0.2),
	min_samples(10),
	random_seed(1),
	overwrite(false),
	dry_run(false),
	verify_images(false)
{
	TAT(TATPARMS);

	return;
}


YoloSplit::Parameters YoloSplit::Parameters::from_cfg()
{
	TAT(TATPARMS);

	Parameters parms;

	parms.source_directory = cfg_and_state.get_path("src");
	if (parms.source_directory.empty())
	{
		// see if a directory was given without using "--src"
		for (const auto & fn : cfg_and_state.filenames)
		{
			if (std::filesystem::is_directory(fn))
			{
				parms.source_directory = fn;
				break;
			}
		}
	}

	parms.output_directory = cfg_and_state.get_path("out");
	parms.images_directory = cfg_and_state.get_path("images");
	parms.labels_directory = cfg_and_state.get_path("labels");

	if (not parms.source_directory.empty())
	{
		if (parms.output_directory.empty())
		{
			parms.output_directory = parms.source_directory;
		}
		if (parms.images_directory.empty())
		{
			parms.images_directory = parms.source_directory / "all_images";
		}
		if (parms.labels_directory.empty())
		{
			parms.labels_directory = parms.source_directory / "all_labels";
		}
	}

	parms.validation_fraction = cfg_and_state.get("valid", parms.validation_fraction);

	if (cfg_and_state.is_set("test"))
	{
		parms.test_fraction = cfg_and_state.get_double("test");
	}

	if (cfg_and_state.is_set("dump"))
	{
		parms.n_dump = get_count("dump", 0);
	}

	parms.min_samples	= get_count("minsamples"	, parms.min_samples);
	parms.random_seed	= static_cast<unsigned int>(get_count("rand", parms.random_seed, std::numeric_limits<unsigned int>::max()));
	parms.overwrite		= cfg_and_state.is_set("overwrite");
	parms.dry_run		= cfg_and_state.is_set("dryrun");
	parms.verify_images	= cfg_and_state.is_set("verifyimages");

	return parms;
}


const YoloSplit::Parameters & YoloSplit::Parameters::validate() const
{
	TAT(TATPARMS);

	if (source_directory.empty() and (images_directory.empty() or labels_directory.empty()))
	{
		throw ConfigurationError("the source directory must be specified (e.g., \"--src /path/to/dataset\")");
	}

	if (output_directory.empty())
	{
		throw ConfigurationError("the output directory must be specified");
	}

	if (not (validation_fraction > 0.0 and validation_fraction < 1.0))
	{
		throw ConfigurationError("the validation fraction must be between 0 and 1, not " + std::to_string(validation_fraction));
	}

	if (test_fraction.has_value())
	{
		const double t = test_fraction.value();
		if (not (t > 0.0 and t < 1.0))
		{
			throw ConfigurationError("the test fraction must be between 0 and 1, not " + std::to_string(t));
		}

		if (validation_fraction + t >= 1.0)
		{
			throw ConfigurationError(
				"the validation and test fractions combined must be less than 1 (" +
				std::to_string(validation_fraction) + " + " + std::to_string(t) + " = " + std::to_string(validation_fraction + t) + ")");
		}
	}

	if (min_samples < 1)
	{
		throw ConfigurationError("the minimum number of samples per class must be at least 1");
	}

	return *this;
}
