#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();


	size_t total(const YoloSplit::ClassHistogram & histogram)
	{
		TAT(TATPARMS);

		size_t count = 0;
		for (const auto & [label, n] : histogram)
		{
			count += n;
		}

		return count;
	}


	size_t lookup(const YoloSplit::ClassHistogram & histogram, const int label)
	{
		TAT(TATPARMS);

		const auto iter = histogram.find(label);
		if (iter == histogram.end())
		{
			return 0;
		}

		return iter->second;
	}


	std::string format_percentage(const size_t count, const size_t denominator)
	{
		TAT(TATPARMS);

		const double d = (denominator == 0 ? 0.0 : static_cast<double>(count) / static_cast<double>(denominator));

		std::stringstream ss;
		ss << std::fixed << std::setprecision(2) << (100.0 * d) << "%";

		return ss.str();
	}
}


YoloSplit::Report YoloSplit::make_report(const SplitResult & result)
{
	TAT(TATPARMS);

	Report report;
	report.histogram_before	= result.pruning.histogram_before;
	report.histogram_after	= result.pruning.histogram_after;
	report.empty_found		= result.pruning.empty_available;
	report.empty_dumped		= result.pruning.empty_dumped;
	report.classes_removed	= result.pruning.classes_removed;
	report.samples_removed	= result.pruning.samples_removed;
	report.stages			= result.stages;
	report.has_test			= result.has_test;
	report.train			= build_histogram(result.train);
	report.valid			= build_histogram(result.valid);
	report.test				= build_histogram(result.test);

	return report;
}


std::string YoloSplit::format_histogram(const ClassHistogram & histogram)
{
	TAT(TATPARMS);

	const size_t count = total(histogram);

	std::string output =
		"  label          samples  percent\n"
		"  ------------ --------- --------\n";

	for (const auto & [label, n] : histogram)
	{
		output +=
			"  " +
			format_in_colour(label_name(label)				, EColour::kBrightWhite	, 12) + " " +
			format_in_colour(n								, EColour::kNormal		, 9	) + " " +
			format_in_colour(format_percentage(n, count)	, EColour::kNormal		, -8) + "\n";
	}

	output +=
		"  ------------ --------- --------\n"
		"  " +
		format_in_colour("total"	, EColour::kBrightWhite	, 12) + " " +
		format_in_colour(count		, EColour::kBrightWhite	, 9	) + "\n";

	return output;
}


void YoloSplit::display_summary(const ClassHistogram & histogram)
{
	TAT(TATPARMS);

	*cfg_and_state.output
		<< std::endl
		<< "Distribution of representative labels:" << std::endl
		<< format_histogram(histogram);

	const size_t empty = lookup(histogram, kEmptyLabel);
	if (empty)
	{
		*cfg_and_state.output
			<< in_colour(EColour::kBrightWhite, format_count(empty, "sample")) << " without any annotations"
			<< " (use " << in_colour(EColour::kBrightCyan, "--dump") << " to randomly drop some of them)" << std::endl;
	}

	return;
}


void YoloSplit::display_report(const Report & report)
{
	TAT(TATPARMS);

	auto & out = *cfg_and_state.output;

	out << std::endl << "Before pruning:" << std::endl << format_histogram(report.histogram_before);

	if (report.empty_dumped)
	{
		out	<< "Dumped " << in_colour(EColour::kBrightWhite, report.empty_dumped)
			<< " of " << format_count(report.empty_found, "empty sample") << std::endl;
	}

	if (not report.classes_removed.empty())
	{
		display_warning_msg(
			"removed " + format_count(report.classes_removed.size(), "class", "classes") +
			" (" + format_count(report.samples_removed, "sample") + ") with too few samples:\n");
		for (const auto & [label, count] : report.classes_removed)
		{
			out << "  " << format_in_colour(label_name(label), EColour::kYellow, 12) << " " << format_count(count, "sample") << std::endl;
		}
	}

	out << std::endl << "After pruning:" << std::endl << format_histogram(report.histogram_after);

	out << std::endl;
	for (const auto & stage : report.stages)
	{
		const EColour colour = (stage.method == ESplitMethod::kStratified ? EColour::kBrightGreen : EColour::kYellow);

		out	<< "Split " << in_colour(EColour::kBrightWhite, stage.name)
			<< ": " << in_colour(colour, to_string(stage.method))
			<< " at " << format_fraction(stage.fraction)
			<< " of " << format_count(stage.input_size, "sample")
			<< " -> " << stage.kept_size << " + " << stage.held_out_size << std::endl;

		if (stage.method == ESplitMethod::kFallback)
		{
			display_warning_msg("class balance is not preserved for " + stage.name + ": " + stage.reason + "\n");
		}
	}

	// per-class distribution across the final splits
	SInt labels;
	for (const auto & [label, count] : report.histogram_after)
	{
		labels.insert(label);
	}

	const size_t train_total	= total(report.train);
	const size_t valid_total	= total(report.valid);
	const size_t test_total		= total(report.test);

	out	<< std::endl
		<< "  label            train     valid" << (report.has_test ? "      test" : "") << std::endl
		<< "  ------------ --------- ---------" << (report.has_test ? " ---------" : "") << std::endl;

	for (const int label : labels)
	{
		out	<< "  " << format_in_colour(label_name(label), EColour::kBrightWhite, 12)
			<< " " << format_in_colour(lookup(report.train, label), EColour::kNormal, 9)
			<< " " << format_in_colour(lookup(report.valid, label), EColour::kNormal, 9);
		if (report.has_test)
		{
			out << " " << format_in_colour(lookup(report.test, label), EColour::kNormal, 9);
		}
		out << std::endl;
	}

	const size_t grand_total = train_total + valid_total + test_total;

	out	<< "  ------------ --------- ---------" << (report.has_test ? " ---------" : "") << std::endl
		<< "  " << format_in_colour("total", EColour::kBrightWhite, 12)
		<< " " << format_in_colour(train_total, EColour::kBrightWhite, 9)
		<< " " << format_in_colour(valid_total, EColour::kBrightWhite, 9);
	if (report.has_test)
	{
		out << " " << format_in_colour(test_total, EColour::kBrightWhite, 9);
	}
	out	<< std::endl
		<< "  " << format_in_colour("percent", EColour::kNormal, 12)
		<< " " << format_in_colour(format_percentage(train_total, grand_total), EColour::kNormal, -9)
		<< " " << format_in_colour(format_percentage(valid_total, grand_total), EColour::kNormal, -9);
	if (report.has_test)
	{
		out << " " << format_in_colour(format_percentage(test_total, grand_total), EColour::kNormal, -9);
	}
	out << std::endl;

	return;
}
