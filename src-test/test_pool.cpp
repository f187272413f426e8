#include "test_helpers.hpp"


TEST(Pool, PairByStem)
{
	const auto dir = fresh_directory("pool_pair");
	const auto images = dir / "all_images";
	const auto labels = dir / "all_labels";

	write_file(images / "b.PNG"		, "png");
	write_file(images / "a.jpg"		, "jpg");
	write_file(images / "c.jpeg"	, "jpeg");		// no annotation
	write_file(images / "notes.md"	, "not an image");
	write_file(labels / "b.txt"		, "1 0.5 0.5 0.1 0.1\n");
	write_file(labels / "a.txt"		, "");
	write_file(labels / "d.txt"		, "0 0.5 0.5 0.1 0.1\n");	// no image
	write_file(labels / "classes.names", "dog\ncat\n");

	const auto pool = YoloSplit::scan_pool(images, labels);

	ASSERT_EQ(pool.size(), 3);
	ASSERT_EQ(pool[0].stem, "a");
	ASSERT_EQ(pool[1].stem, "b");
	ASSERT_EQ(pool[2].stem, "d");

	ASSERT_EQ(pool[0].image, images / "a.jpg");
	ASSERT_EQ(pool[1].image, images / "b.PNG");
	ASSERT_TRUE(pool[2].image.empty());

	ASSERT_EQ(pool[0].annotation, labels / "a.txt");
	for (const auto & sample : pool)
	{
		ASSERT_EQ(sample.label, YoloSplit::kUnassignedLabel);
	}

	std::filesystem::remove_all(dir);
}


TEST(Pool, DuplicateStem)
{
	const auto dir = fresh_directory("pool_duplicate");

	write_file(dir / "all_images" / "x.jpg", "jpg");
	write_file(dir / "all_images" / "x.png", "png");
	write_file(dir / "all_labels" / "x.txt", "0 0.5 0.5 0.1 0.1\n");

	ASSERT_THROW(YoloSplit::scan_pool(dir / "all_images", dir / "all_labels"), YoloSplit::ParseError);

	std::filesystem::remove_all(dir);
}


TEST(Pool, DuplicateAnnotationStem)
{
	const auto dir = fresh_directory("pool_duplicate_annotation");

	write_file(dir / "all_images" / "x.jpg", "jpg");
	write_file(dir / "all_labels" / "x.txt", "0 0.5 0.5 0.1 0.1\n");
	write_file(dir / "all_labels" / "x.TXT", "1 0.5 0.5 0.1 0.1\n");

	ASSERT_THROW(YoloSplit::scan_pool(dir / "all_images", dir / "all_labels"), YoloSplit::ParseError);

	std::filesystem::remove_all(dir);
}


TEST(Pool, MissingDirectory)
{
	const auto dir = fresh_directory("pool_missing");
	std::filesystem::create_directories(dir / "all_labels");

	ASSERT_THROW(YoloSplit::scan_pool(dir / "all_images", dir / "all_labels")	, YoloSplit::ConfigurationError);
	ASSERT_THROW(YoloSplit::scan_pool(dir / "all_labels", dir / "nothing")		, YoloSplit::ConfigurationError);
	ASSERT_THROW(YoloSplit::scan_pool("", dir / "all_labels")					, YoloSplit::ConfigurationError);

	std::filesystem::remove_all(dir);
}


TEST(Pool, VerifyImages)
{
	const auto dir = fresh_directory("pool_verify");
	const auto images = dir / "all_images";
	const auto labels = dir / "all_labels";

	// the content is not a valid image, so OpenCV will not find a decoder for it
	write_file(images / "broken.jpg", "this is not a jpeg file");
	write_file(labels / "broken.txt", "0 0.5 0.5 0.1 0.1\n");

	const auto unverified = YoloSplit::scan_pool(images, labels, false);
	ASSERT_EQ(unverified.size(), 1);
	ASSERT_FALSE(unverified[0].image.empty());

	const auto verified = YoloSplit::scan_pool(images, labels, true);
	ASSERT_EQ(verified.size(), 1);
	ASSERT_TRUE(verified[0].image.empty());

	std::filesystem::remove_all(dir);
}


TEST(Pool, RunPipeline)
{
	const auto dir = fresh_directory("pool_pipeline");
	make_dataset(dir, {{YoloSplit::kEmptyLabel, 4}, {0, 30}, {1, 20}});

	YoloSplit::Parameters parms;
	parms.source_directory = dir;
	parms.output_directory = dir;
	parms.images_directory = dir / "all_images";
	parms.labels_directory = dir / "all_labels";

	const auto result = YoloSplit::run_pipeline(parms);

	ASSERT_EQ(result.pruning.histogram_before.at(YoloSplit::kEmptyLabel), 4);
	ASSERT_EQ(result.pruning.histogram_before.at(0), 30);
	ASSERT_EQ(result.pruning.histogram_before.at(1), 20);
	ASSERT_EQ(result.pruning.classes_removed.size(), 1);
	ASSERT_EQ(result.train.size(), 40);
	ASSERT_EQ(result.valid.size(), 10);

	std::filesystem::remove_all(dir);
}


TEST(Pool, RunPipelineNoAnnotations)
{
	const auto dir = fresh_directory("pool_no_annotations");
	std::filesystem::create_directories(dir / "all_images");
	std::filesystem::create_directories(dir / "all_labels");

	YoloSplit::Parameters parms;
	parms.source_directory = dir;
	parms.output_directory = dir;
	parms.images_directory = dir / "all_images";
	parms.labels_directory = dir / "all_labels";

	ASSERT_THROW(YoloSplit::run_pipeline(parms), YoloSplit::ConfigurationError);

	std::filesystem::remove_all(dir);
}
