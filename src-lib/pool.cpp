#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();


	void must_be_directory(const std::filesystem::path & path, const std::string & description)
	{
		TAT(TATPARMS);

		if (path.empty())
		{
			throw YoloSplit::ConfigurationError("the " + description + " directory was not specified");
		}

		if (not std::filesystem::is_directory(path))
		{
			throw YoloSplit::ConfigurationError("the " + description + " directory " + path.string() + " does not exist");
		}

		return;
	}
}


YoloSplit::Pool YoloSplit::scan_pool(const std::filesystem::path & images_directory, const std::filesystem::path & labels_directory, const bool verify_images)
{
	TAT(TATPARMS);

	must_be_directory(images_directory, "images");
	must_be_directory(labels_directory, "labels");

	// the key is the stem, the value is the full path to the image
	std::map<std::string, std::filesystem::path> images;
	for (const auto & entry : std::filesystem::directory_iterator(images_directory))
	{
		const auto & path = entry.path();
		if (not entry.is_regular_file() or not is_image_filename(path))
		{
			continue;
		}

		const std::string stem = path.stem().string();
		if (images.count(stem))
		{
			throw ParseError(path, 0, "image has the same stem as " + images.at(stem).string());
		}
		images[stem] = path;
	}

	// the key is the stem, the value is the full path to the annotation
	std::map<std::string, std::filesystem::path> annotation_stems;
	std::vector<std::filesystem::path> annotations;
	for (const auto & entry : std::filesystem::directory_iterator(labels_directory))
	{
		const auto & path = entry.path();
		if (not entry.is_regular_file() or lowercase(path.extension().string()) != ".txt")
		{
			continue;
		}

		// "a.txt" and "a.TXT" would both be copied to the same labels/a.txt
		const std::string stem = path.stem().string();
		if (annotation_stems.count(stem))
		{
			throw ParseError(path, 0, "annotation has the same stem as " + annotation_stems.at(stem).string());
		}
		annotation_stems[stem] = path;
		annotations.push_back(path);
	}

	// directory iteration order is unspecified, but the pool order must be the same on every run
	std::sort(annotations.begin(), annotations.end());

	*cfg_and_state.output
		<< "Found " << in_colour(EColour::kBrightWhite, format_count(images.size(), "image"))
		<< " in " << images_directory.string() << std::endl
		<< "Found " << in_colour(EColour::kBrightWhite, format_count(annotations.size(), "annotation"))
		<< " in " << labels_directory.string() << std::endl;

	Pool pool;
	pool.reserve(annotations.size());

	size_t missing_images		= 0;
	size_t unreadable_images	= 0;
	SStr annotated_stems;

	for (const auto & annotation : annotations)
	{
		Sample sample;
		sample.stem			= annotation.stem().string();
		sample.annotation	= annotation;
		sample.label		= kUnassignedLabel;

		auto iter = images.find(sample.stem);
		if (iter == images.end())
		{
			missing_images ++;
			if (cfg_and_state.is_verbose)
			{
				*cfg_and_state.output << "-> no image for " << annotation.string() << std::endl;
			}
		}
		else if (verify_images and not cv::haveImageReader(iter->second.string()))
		{
			unreadable_images ++;
			display_warning_msg("OpenCV cannot read image " + iter->second.string() + "\n");
		}
		else
		{
			sample.image = iter->second;
		}

		annotated_stems.insert(sample.stem);
		pool.push_back(sample);
	}

	size_t images_without_annotations = 0;
	for (const auto & [stem, path] : images)
	{
		if (annotated_stems.count(stem) == 0)
		{
			images_without_annotations ++;
			if (cfg_and_state.is_verbose)
			{
				*cfg_and_state.output << "-> no annotation for " << path.string() << std::endl;
			}
		}
	}

	if (images_without_annotations)
	{
		display_warning_msg("ignoring " + format_count(images_without_annotations, "image") + " without annotations\n");
	}
	if (missing_images)
	{
		display_warning_msg(format_count(missing_images, "annotation") + " without a matching image\n");
	}
	if (unreadable_images)
	{
		display_warning_msg(format_count(unreadable_images, "image") + " cannot be read by OpenCV and will not be copied\n");
	}

	return pool;
}
