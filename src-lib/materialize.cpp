#include "yolosplit_internal.hpp"


namespace
{
	static auto & cfg_and_state = YoloSplit::CfgAndState::get();


	/// Get all the directories and files in the output directory which a run may create.
	std::vector<std::filesystem::path> get_outputs(const std::filesystem::path & output_directory)
	{
		TAT(TATPARMS);

		std::vector<std::filesystem::path> outputs;
		for (const auto & name : YoloSplit::get_split_names(true))
		{
			outputs.push_back(output_directory / name);
			outputs.push_back(output_directory / (name + ".txt"));
		}

		return outputs;
	}


	/// Copy the samples into @p directory and write the list of images to @p list_filename.
	size_t copy_split(const YoloSplit::Pool & pool, const std::filesystem::path & directory, const std::filesystem::path & list_filename)
	{
		TAT(TATPARMS);

		const auto images_directory = directory / "images";
		const auto labels_directory = directory / "labels";
		std::filesystem::create_directories(images_directory);
		std::filesystem::create_directories(labels_directory);

		std::ofstream ofs(list_filename);
		if (not ofs.is_open())
		{
			throw std::filesystem::filesystem_error("failed to create image list", list_filename, std::make_error_code(std::errc::io_error));
		}

		size_t files_copied = 0;
		for (const auto & sample : pool)
		{
			std::filesystem::copy_file(sample.annotation, labels_directory / sample.annotation.filename(), std::filesystem::copy_options::overwrite_existing);
			files_copied ++;

			if (sample.image.empty())
			{
				continue;
			}

			const auto dst = images_directory / sample.image.filename();
			std::filesystem::copy_file(sample.image, dst, std::filesystem::copy_options::overwrite_existing);
			files_copied ++;

			ofs << std::filesystem::absolute(dst).lexically_normal().string() << std::endl;
		}

		if (not ofs.good())
		{
			throw std::filesystem::filesystem_error("failed to write image list", list_filename, std::make_error_code(std::errc::io_error));
		}

		if (cfg_and_state.is_verbose)
		{
			*cfg_and_state.output
				<< "-> copied " << YoloSplit::format_count(files_copied, "file")
				<< " to " << directory.string() << std::endl;
		}

		return files_copied;
	}
}


YoloSplit::VStr YoloSplit::get_split_names(const bool has_test)
{
	TAT(TATPARMS);

	VStr names = {"train", "valid"};
	if (has_test)
	{
		names.push_back("test");
	}

	return names;
}


void YoloSplit::check_output_directories(const Parameters & parms)
{
	TAT(TATPARMS);

	if (parms.dry_run or parms.overwrite)
	{
		return;
	}

	for (const auto & path : get_outputs(parms.output_directory))
	{
		if (std::filesystem::exists(path))
		{
			throw ConfigurationError(path.string() + " already exists (use --overwrite to replace the previous results)");
		}
	}

	return;
}


size_t YoloSplit::materialize(const SplitResult & result, const Parameters & parms)
{
	TAT(TATPARMS);

	if (parms.dry_run)
	{
		*cfg_and_state.output << "Dry run:  " << in_colour(EColour::kYellow, "no files were copied") << std::endl;
		return 0;
	}

	check_output_directories(parms);

	if (parms.overwrite)
	{
		for (const auto & path : get_outputs(parms.output_directory))
		{
			if (std::filesystem::exists(path))
			{
				if (cfg_and_state.is_verbose)
				{
					*cfg_and_state.output << "-> deleting " << path.string() << std::endl;
				}
				std::filesystem::remove_all(path);
			}
		}
	}

	const std::vector<const Pool *> pools = {&result.train, &result.valid, &result.test};
	const VStr names = get_split_names(result.has_test);

	size_t files_copied = 0;
	for (size_t idx = 0; idx < names.size(); idx ++)
	{
		const auto & name = names[idx];
		files_copied += copy_split(*pools[idx], parms.output_directory / name, parms.output_directory / (name + ".txt"));
	}

	*cfg_and_state.output
		<< "Copied " << in_colour(EColour::kBrightWhite, format_count(files_copied, "file"))
		<< " to " << in_colour(EColour::kBrightCyan, parms.output_directory.string()) << std::endl;

	return files_copied;
}
