#include "vision/imageIo.hpp"

#include "Logging.hpp"

#include <opencv2/imgcodecs.hpp>

#include <format>

namespace warlens::vision {

cv::Mat readImage(const std::filesystem::path& path) {
	cv::Mat image;
	try {
		image = cv::imread(path.string(), cv::IMREAD_COLOR);
	} catch (const cv::Exception& e) {
		throw ImageReadError(std::format("Could not decode '{}': {}", path.string(), e.what()));
	}

	if (image.empty()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[ImageIo] Could not read '{}'.", path.string()));
		throw ImageReadError(std::format("Could not read image '{}'.", path.string()));
	}
	return image;
}

std::optional<cv::Mat> tryReadImage(const std::filesystem::path& path) {
	cv::Mat image;
	try {
		image = cv::imread(path.string(), cv::IMREAD_COLOR);
	} catch (const cv::Exception& e) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[ImageIo] Decoding '{}' failed: {}", path.string(), e.what()));
		return std::nullopt;
	}

	if (image.empty()) {
		return std::nullopt;
	}
	return image;
}

std::size_t writeRowCrops(const std::filesystem::path& directory, const std::vector<RowSlice>& rows) {
	std::filesystem::create_directories(directory);

	std::size_t written = 0;
	auto write = [&](const std::string& name, const cv::Mat& image) {
		if (image.empty()) {
			return;
		}

		const auto path = directory / name;
		try {
			if (cv::imwrite(path.string(), image)) {
				++written;
				return;
			}
		} catch (const cv::Exception& e) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[ImageIo] Writing '{}' failed: {}", path.string(), e.what()));
			return;
		}
		Logger().Log(Logging::LogLevel::Warning, std::format("[ImageIo] Could not write '{}'.", path.string()));
	};

	for (std::size_t i = 0; i < rows.size(); ++i) {
		write(std::format("row{:02}_left.png", i + 1), rows[i].left);
		write(std::format("row{:02}_mid.png", i + 1), rows[i].mid);
		write(std::format("row{:02}_right.png", i + 1), rows[i].right);
	}
	return written;
}

} // namespace warlens::vision
