#include "test_helpers.hpp"


namespace
{
	YoloSplit::Parameters make_parameters(const std::filesystem::path & dir)
	{
		YoloSplit::Parameters parms;
		parms.source_directory		= dir;
		parms.output_directory		= dir / "output";
		parms.images_directory		= dir / "all_images";
		parms.labels_directory		= dir / "all_labels";
		parms.validation_fraction	= 0.25;

		return parms;
	}


	YoloSplit::VStr read_lines(const std::filesystem::path & filename)
	{
		YoloSplit::VStr lines;

		std::ifstream ifs(filename);
		std::string line;
		while (std::getline(ifs, line))
		{
			lines.push_back(line);
		}

		return lines;
	}


	size_t count_files(const std::filesystem::path & dir)
	{
		size_t count = 0;
		for (const auto & entry : std::filesystem::directory_iterator(dir))
		{
			if (entry.is_regular_file())
			{
				count ++;
			}
		}

		return count;
	}
}


TEST(Materialize, SplitNames)
{
	ASSERT_EQ(YoloSplit::get_split_names(false), YoloSplit::VStr({"train", "valid"}));
	ASSERT_EQ(YoloSplit::get_split_names(true), YoloSplit::VStr({"train", "valid", "test"}));
}


TEST(Materialize, TwoWay)
{
	const auto dir = fresh_directory("materialize_two_way");
	make_dataset(dir, {{0, 20}, {1, 20}});
	const auto parms = make_parameters(dir);

	const auto result = YoloSplit::run_pipeline(parms);
	const size_t files_copied = YoloSplit::materialize(result, parms);

	// 40 images and 40 annotations
	ASSERT_EQ(files_copied, 80);

	const auto out = parms.output_directory;
	ASSERT_EQ(count_files(out / "train" / "images"), 30);
	ASSERT_EQ(count_files(out / "train" / "labels"), 30);
	ASSERT_EQ(count_files(out / "valid" / "images"), 10);
	ASSERT_EQ(count_files(out / "valid" / "labels"), 10);
	ASSERT_FALSE(std::filesystem::exists(out / "test"));
	ASSERT_FALSE(std::filesystem::exists(out / "test.txt"));

	const auto train = read_lines(out / "train.txt");
	const auto valid = read_lines(out / "valid.txt");
	ASSERT_EQ(train.size(), 30);
	ASSERT_EQ(valid.size(), 10);
	for (const auto & line : train)
	{
		const std::filesystem::path path(line);
		ASSERT_TRUE(path.is_absolute()) << line;
		ASSERT_TRUE(std::filesystem::exists(path)) << line;
		ASSERT_EQ(path.parent_path().filename().string(), "images") << line;
	}

	// the original dataset is left untouched
	ASSERT_EQ(count_files(dir / "all_images"), 40);
	ASSERT_EQ(count_files(dir / "all_labels"), 40);

	std::filesystem::remove_all(dir);
}


TEST(Materialize, ThreeWayWithMissingImages)
{
	const auto dir = fresh_directory("materialize_three_way");
	make_dataset(dir, {{0, 20}, {1, 20}});
	std::filesystem::remove(dir / "all_images" / "img_00000.jpg");

	auto parms = make_parameters(dir);
	parms.validation_fraction	= 0.2;
	parms.test_fraction			= 0.2;

	const auto result = YoloSplit::run_pipeline(parms);
	const size_t files_copied = YoloSplit::materialize(result, parms);

	// every annotation is copied, but one of the images is missing
	ASSERT_EQ(files_copied, 79);

	const auto out = parms.output_directory;
	const size_t total_images =
		read_lines(out / "train.txt").size() +
		read_lines(out / "valid.txt").size() +
		read_lines(out / "test.txt").size();
	ASSERT_EQ(total_images, 39);
	ASSERT_EQ(count_files(out / "test" / "labels"), result.test.size());

	std::filesystem::remove_all(dir);
}


TEST(Materialize, Overwrite)
{
	const auto dir = fresh_directory("materialize_overwrite");
	make_dataset(dir, {{0, 20}, {1, 20}});
	auto parms = make_parameters(dir);

	const auto result = YoloSplit::run_pipeline(parms);
	YoloSplit::materialize(result, parms);

	// a second run must not silently replace the first one
	ASSERT_THROW(YoloSplit::check_output_directories(parms), YoloSplit::ConfigurationError);
	ASSERT_THROW(YoloSplit::materialize(result, parms), YoloSplit::ConfigurationError);

	// leave a stale file behind which must be deleted when overwriting
	write_file(parms.output_directory / "train" / "images" / "stale.jpg", "stale");

	parms.overwrite = true;
	ASSERT_NO_THROW(YoloSplit::check_output_directories(parms));
	ASSERT_EQ(YoloSplit::materialize(result, parms), 80);
	ASSERT_FALSE(std::filesystem::exists(parms.output_directory / "train" / "images" / "stale.jpg"));
	ASSERT_EQ(count_files(parms.output_directory / "train" / "images"), 30);

	std::filesystem::remove_all(dir);
}


TEST(Materialize, DryRun)
{
	const auto dir = fresh_directory("materialize_dry_run");
	make_dataset(dir, {{0, 20}, {1, 20}});
	auto parms = make_parameters(dir);
	parms.dry_run = true;

	const auto result = YoloSplit::run_pipeline(parms);

	ASSERT_EQ(YoloSplit::materialize(result, parms), 0);
	ASSERT_FALSE(std::filesystem::exists(parms.output_directory));

	std::filesystem::remove_all(dir);
}
