#include "test_helpers.hpp"


TEST(Pruner, DumpMoreThanAvailable)
{
	const auto pool = make_pool({{YoloSplit::kEmptyLabel, 3}, {0, 20}});
	std::mt19937 rng(1);

	ASSERT_THROW(YoloSplit::dump_empty_samples(pool, 5, rng), YoloSplit::ConfigurationError);
	ASSERT_THROW(YoloSplit::prune(pool, 5, 1, rng), YoloSplit::ConfigurationError);

	// nothing was removed
	ASSERT_EQ(pool.size(), 23);
	ASSERT_EQ(count_label(pool, YoloSplit::kEmptyLabel), 3);
}


TEST(Pruner, DumpExactCount)
{
	const auto pool = make_pool({{YoloSplit::kEmptyLabel, 30}, {0, 20}, {1, 20}});
	std::mt19937 rng(1);

	const auto result = YoloSplit::dump_empty_samples(pool, 12, rng);
	ASSERT_EQ(result.size(), pool.size() - 12);
	ASSERT_EQ(count_label(result, YoloSplit::kEmptyLabel), 18);
	ASSERT_EQ(count_label(result, 0), 20);
	ASSERT_EQ(count_label(result, 1), 20);
	ASSERT_TRUE(is_in_pool_order(result));
}


TEST(Pruner, DumpAllAndNone)
{
	const auto pool = make_pool({{YoloSplit::kEmptyLabel, 5}, {0, 20}});
	std::mt19937 rng(1);

	ASSERT_EQ(YoloSplit::dump_empty_samples(pool, 0, rng).size(), 25);

	const auto result = YoloSplit::dump_empty_samples(pool, 5, rng);
	ASSERT_EQ(result.size(), 20);
	ASSERT_EQ(count_label(result, YoloSplit::kEmptyLabel), 0);
}


TEST(Pruner, DumpIsDeterministic)
{
	const auto pool = make_pool({{YoloSplit::kEmptyLabel, 50}, {0, 50}});

	std::mt19937 rng1(42);
	std::mt19937 rng2(42);

	const auto result1 = YoloSplit::dump_empty_samples(pool, 25, rng1);
	const auto result2 = YoloSplit::dump_empty_samples(pool, 25, rng2);

	ASSERT_EQ(YoloSplit::get_stems(result1), YoloSplit::get_stems(result2));
}


TEST(Pruner, RemoveSmallClasses)
{
	const auto pool = make_pool({{YoloSplit::kEmptyLabel, 3}, {0, 20}, {1, 5}, {2, 10}, {3, 9}});

	YoloSplit::ClassHistogram removed;
	const auto result = YoloSplit::remove_small_classes(pool, 10, removed);

	// the empty label is treated like any other class
	ASSERT_EQ(removed.size(), 3);
	ASSERT_EQ(removed.at(YoloSplit::kEmptyLabel), 3);
	ASSERT_EQ(removed.at(1), 5);
	ASSERT_EQ(removed.at(3), 9);

	ASSERT_EQ(result.size(), 30);
	for (const auto & [label, count] : YoloSplit::build_histogram(result))
	{
		ASSERT_GE(count, 10) << YoloSplit::label_name(label);
	}
	ASSERT_TRUE(is_in_pool_order(result));
}


TEST(Pruner, RemoveEverything)
{
	const auto pool = make_pool({{0, 4}, {1, 9}});

	YoloSplit::ClassHistogram removed;
	const auto result = YoloSplit::remove_small_classes(pool, 10, removed);

	ASSERT_TRUE(result.empty());
	ASSERT_EQ(removed.size(), 2);
}


TEST(Pruner, Prune)
{
	const auto pool = make_pool({{YoloSplit::kEmptyLabel, 40}, {0, 25}, {1, 8}, {2, 12}});
	std::mt19937 rng(3);

	const auto result = YoloSplit::prune(pool, 31, 10, rng);

	ASSERT_EQ(result.empty_available, 40);
	ASSERT_EQ(result.empty_dumped, 31);

	// 9 empty samples remain after the dump, which is below the minimum so they are removed as well
	ASSERT_EQ(result.classes_removed.size(), 2);
	ASSERT_EQ(result.classes_removed.at(YoloSplit::kEmptyLabel), 9);
	ASSERT_EQ(result.classes_removed.at(1), 8);
	ASSERT_EQ(result.samples_removed, 17);

	ASSERT_EQ(result.histogram_before.at(YoloSplit::kEmptyLabel), 40);
	ASSERT_EQ(result.histogram_before.at(1), 8);
	ASSERT_EQ(result.histogram_after.size(), 2);
	ASSERT_EQ(result.histogram_after.at(0), 25);
	ASSERT_EQ(result.histogram_after.at(2), 12);
	ASSERT_EQ(result.pool.size(), 37);
}


TEST(Pruner, PruneWithoutDump)
{
	const auto pool = make_pool({{YoloSplit::kEmptyLabel, 15}, {0, 25}});
	std::mt19937 rng(3);

	const auto result = YoloSplit::prune(pool, std::nullopt, 10, rng);

	ASSERT_EQ(result.empty_available, 15);
	ASSERT_EQ(result.empty_dumped, 0);
	ASSERT_TRUE(result.classes_removed.empty());
	ASSERT_EQ(result.samples_removed, 0);
	ASSERT_EQ(result.pool.size(), 40);
}
