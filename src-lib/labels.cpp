#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();
}


YoloSplit::VInt YoloSplit::read_annotation(const std::filesystem::path & filename)
{
	TAT(TATPARMS);

	std::ifstream ifs(filename);
	if (not ifs.is_open())
	{
		throw ParseError(filename, 0, "failed to open annotation file");
	}

	VInt class_indices;
	size_t line_number = 0;
	std::string line;
	while (std::getline(ifs, line))
	{
		line_number ++;

		trim(line);
		if (line.empty())
		{
			continue;
		}

		// the class index is the first token, everything after it is coordinates which we don't need
		const std::string token = line.substr(0, line.find_first_of(" \t"));

		size_t pos = 0;
		long idx = -1;
		try
		{
			idx = std::stol(token, &pos);
		}
		catch (const std::exception &)
		{
			pos = 0;
		}

		if (pos == 0 or pos != token.size())
		{
			throw ParseError(filename, line_number, "expected an integer class index but found \"" + token + "\"");
		}
		if (idx < 0 or idx > std::numeric_limits<int>::max())
		{
			throw ParseError(filename, line_number, "class index " + token + " is out of range");
		}

		class_indices.push_back(static_cast<int>(idx));
	}

	if (ifs.bad())
	{
		throw ParseError(filename, line_number, "error while reading annotation file");
	}

	return class_indices;
}


int YoloSplit::representative_label(const VInt & class_indices)
{
	TAT(TATPARMS);

	if (class_indices.empty())
	{
		return kEmptyLabel;
	}

	std::map<int, size_t> counts;
	for (const int idx : class_indices)
	{
		counts[idx] ++;
	}

	// the map is sorted by class index, and only a strictly greater count replaces the best, so the lowest index wins ties
	int best_label = counts.begin()->first;
	size_t best_count = 0;
	for (const auto & [label, count] : counts)
	{
		if (count > best_count)
		{
			best_label = label;
			best_count = count;
		}
	}

	return best_label;
}


YoloSplit::Pool YoloSplit::summarize_pool(const Pool & pool)
{
	TAT(TATPARMS);

	Pool summarized;
	summarized.reserve(pool.size());

	for (const auto & sample : pool)
	{
		Sample s = sample;
		s.label = representative_label(read_annotation(sample.annotation));
		summarized.push_back(s);

		if (cfg_and_state.is_trace)
		{
			*cfg_and_state.output << "-> " << s.stem << ": " << label_name(s.label) << std::endl;
		}
	}

	return summarized;
}


YoloSplit::ClassHistogram YoloSplit::build_histogram(const Pool & pool)
{
	TAT(TATPARMS);

	ClassHistogram histogram;
	for (const auto & sample : pool)
	{
		histogram[sample.label] ++;
	}

	return histogram;
}
