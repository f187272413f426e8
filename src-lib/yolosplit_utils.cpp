#include "yolosplit_internal.hpp"


namespace
{
	/// Image extensions which are recognized when scanning the images directory.  Must be lowercase.
	static const YoloSplit::SStr image_extensions =
	{
		".bmp",
		".jpeg",
		".jpg",
		".png",
		".tif",
		".tiff",
		".webp",
	};
}


std::string YoloSplit::convert_to_lowercase_alphanum(const std::string & arg)
{
	TAT(TATPARMS);

	std::string str;
	str.reserve(arg.length());
	for (const unsigned char c : arg)
	{
		if (std::isalnum(c))
		{
			str.push_back(std::tolower(c));
		}
	}

	return str;
}


std::string YoloSplit::trim(const std::string & str)
{
	TAT(TATPARMS);

	std::string txt = str;
	trim(txt);
	return txt;
}


std::string & YoloSplit::trim(std::string & str)
{
	TAT(TATPARMS);

	// trim trailing whitespace characters
	auto pos = str.find_last_not_of(" \t\r\n");
	if (pos != std::string::npos)
	{
		str.erase(pos + 1);
	}
	else
	{
		// nothing but whitespace
		str.clear();
	}

	// trim leading whitespace characters
	pos = str.find_first_not_of(" \t\r\n");
	if (pos != std::string::npos)
	{
		str.erase(0, pos);
	}

	return str;
}


std::string YoloSplit::lowercase(const std::string & str)
{
	TAT(TATPARMS);

	std::string txt = str;
	lowercase(txt);
	return txt;
}


std::string & YoloSplit::lowercase(std::string & str)
{
	TAT(TATPARMS);

	std::transform(str.begin(), str.end(), str.begin(),
		[](unsigned char c)
		{
			return std::tolower(c);
		});

	return str;
}


bool YoloSplit::is_image_filename(const std::filesystem::path & path)
{
	TAT(TATPARMS);

	const std::string extension = lowercase(path.extension().string());

	return image_extensions.count(extension) > 0;
}


std::string YoloSplit::format_count(const size_t count, const std::string & singular, const std::string & plural)
{
	TAT(TATPARMS);

	std::string str = std::to_string(count) + " ";

	if (count == 1)
	{
		str += singular;
	}
	else if (plural.empty())
	{
		str += singular + "s";
	}
	else
	{
		str += plural;
	}

	return str;
}
