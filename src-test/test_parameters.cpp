#include "test_helpers.hpp"


TEST(Parameters, Defaults)
{
	const YoloSplit::Parameters parms;

	ASSERT_DOUBLE_EQ(parms.validation_fraction, 0.2);
	ASSERT_FALSE(parms.test_fraction.has_value());
	ASSERT_FALSE(parms.n_dump.has_value());
	ASSERT_EQ(parms.min_samples, 10);
	ASSERT_EQ(parms.random_seed, 1);
	ASSERT_FALSE(parms.overwrite);
	ASSERT_FALSE(parms.dry_run);
	ASSERT_FALSE(parms.verify_images);

	// the source directory is mandatory
	ASSERT_THROW(parms.validate(), YoloSplit::ConfigurationError);
}


TEST(Parameters, FromCommandLine)
{
	const auto dir = fresh_directory("parameters_cli");

	auto & cfg = YoloSplit::CfgAndState::get().reset();
	cfg.process_arguments({"split", "--src", dir.string(), "--test", "0.1", "--dump", "3", "--rand", "99", "--min_samples", "4", "--overwrite", "--verify_images"});

	const auto parms = YoloSplit::Parameters::from_cfg();
	ASSERT_EQ(parms.source_directory, dir);
	ASSERT_EQ(parms.output_directory, dir);
	ASSERT_EQ(parms.images_directory, dir / "all_images");
	ASSERT_EQ(parms.labels_directory, dir / "all_labels");
	ASSERT_DOUBLE_EQ(parms.validation_fraction, 0.2);
	ASSERT_TRUE(parms.test_fraction.has_value());
	ASSERT_DOUBLE_EQ(parms.test_fraction.value(), 0.1);
	ASSERT_TRUE(parms.n_dump.has_value());
	ASSERT_EQ(parms.n_dump.value(), 3);
	ASSERT_EQ(parms.random_seed, 99);
	ASSERT_EQ(parms.min_samples, 4);
	ASSERT_TRUE(parms.overwrite);
	ASSERT_FALSE(parms.dry_run);
	ASSERT_TRUE(parms.verify_images);
	ASSERT_NO_THROW(parms.validate());

	cfg.reset();
	std::filesystem::remove_all(dir);
}


TEST(Parameters, BareDirectory)
{
	const auto dir = fresh_directory("parameters_bare");

	auto & cfg = YoloSplit::CfgAndState::get().reset();
	cfg.process_arguments({dir.string(), "--out", "/tmp/yolosplit_output", "--images", "/tmp/yolosplit_images"});

	const auto parms = YoloSplit::Parameters::from_cfg();
	ASSERT_EQ(parms.source_directory, dir);
	ASSERT_EQ(parms.output_directory.string(), "/tmp/yolosplit_output");
	ASSERT_EQ(parms.images_directory.string(), "/tmp/yolosplit_images");
	ASSERT_EQ(parms.labels_directory, dir / "all_labels");

	cfg.reset();
	std::filesystem::remove_all(dir);
}


TEST(Parameters, NegativeDump)
{
	const auto dir = fresh_directory("parameters_negative");

	auto & cfg = YoloSplit::CfgAndState::get().reset();
	cfg.process_arguments({"--src", dir.string(), "--dump", "-2"});
	ASSERT_THROW(YoloSplit::Parameters::from_cfg(), YoloSplit::ConfigurationError);

	cfg.reset();
	cfg.process_arguments({"--src", dir.string(), "--minsamples", "1.5"});
	ASSERT_THROW(YoloSplit::Parameters::from_cfg(), YoloSplit::ConfigurationError);

	cfg.reset();
	std::filesystem::remove_all(dir);
}


TEST(Parameters, RandomSeedRange)
{
	const auto dir = fresh_directory("parameters_seed");

	auto & cfg = YoloSplit::CfgAndState::get().reset();
	cfg.process_arguments({"--src", dir.string(), "--rand", "4294967295"});
	ASSERT_EQ(YoloSplit::Parameters::from_cfg().random_seed, 4294967295u);

	// 2^32 would silently wrap around to a seed of zero
	cfg.reset();
	cfg.process_arguments({"--src", dir.string(), "--rand", "4294967296"});
	ASSERT_THROW(YoloSplit::Parameters::from_cfg(), YoloSplit::ConfigurationError);

	cfg.reset();
	cfg.process_arguments({"--src", dir.string(), "--rand", "-1"});
	ASSERT_THROW(YoloSplit::Parameters::from_cfg(), YoloSplit::ConfigurationError);

	cfg.reset();
	std::filesystem::remove_all(dir);
}


TEST(Parameters, Validate)
{
	YoloSplit::Parameters parms;
	parms.source_directory = "dataset";
	parms.output_directory = "dataset";
	ASSERT_NO_THROW(parms.validate());

	parms.validation_fraction = 0.0;
	ASSERT_THROW(parms.validate(), YoloSplit::ConfigurationError);
	parms.validation_fraction = 1.0;
	ASSERT_THROW(parms.validate(), YoloSplit::ConfigurationError);
	parms.validation_fraction = 0.5;
	ASSERT_NO_THROW(parms.validate());

	parms.test_fraction = 0.5;
	ASSERT_THROW(parms.validate(), YoloSplit::ConfigurationError);
	parms.test_fraction = 0.0;
	ASSERT_THROW(parms.validate(), YoloSplit::ConfigurationError);
	parms.test_fraction = 0.49;
	ASSERT_NO_THROW(parms.validate());
	parms.test_fraction.reset();

	parms.min_samples = 0;
	ASSERT_THROW(parms.validate(), YoloSplit::ConfigurationError);
	parms.min_samples = 1;
	ASSERT_NO_THROW(parms.validate());

	parms.output_directory.clear();
	ASSERT_THROW(parms.validate(), YoloSplit::ConfigurationError);
}
