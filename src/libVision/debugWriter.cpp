#include "vision/debugWriter.hpp"

#include "Logging.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <format>

namespace warlens::vision {

DebugWriter::DebugWriter(std::filesystem::path directory) : m_directory(std::move(directory)) {
	std::error_code ec{};
	std::filesystem::create_directories(m_directory, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Debug] Could not create directory '{}': {}", m_directory.string(), ec.message()));
	}
}

bool DebugWriter::add(const std::string& name, const cv::Mat& image) const {
	if (image.empty()) {
		return false;
	}

	const auto path = m_directory / (name + ".png");
	try {
		if (cv::imwrite(path.string(), image)) {
			return true;
		}
	} catch (const cv::Exception& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Debug] Writing '{}' failed: {}", path.string(), e.what()));
		return false;
	}

	Logger().Log(Logging::LogLevel::Warning, std::format("[Debug] Could not write '{}'.", path.string()));
	return false;
}

cv::Mat drawOverview(const cv::Mat& roi, const OverviewData& data) {
	cv::Mat drawn = roi.clone();
	const int W   = drawn.cols;
	const int H   = drawn.rows;

	// Detection band
	cv::line(drawn, {0, data.contentRange.first}, {W - 1, data.contentRange.first}, cv::Scalar(255, 128, 0), 2);
	cv::line(drawn, {0, data.contentRange.second}, {W - 1, data.contentRange.second}, cv::Scalar(255, 128, 0), 2);

	// Mid column
	cv::line(drawn, {data.midX, 0}, {data.midX, H - 1}, cv::Scalar(0, 255, 255), 2);

	for (const auto& box : data.hexBoxes) {
		cv::rectangle(drawn, box.rect(), cv::Scalar(0, 255, 0), 2);
	}

	int index = 1;
	for (const auto& row : data.rows) {
		const auto [y1, y2]   = row.bounds;
		const auto [mx1, mx2] = row.midBounds;
		cv::rectangle(drawn, cv::Point(0, y1), cv::Point(W - 1, y2), cv::Scalar(255, 0, 0), 2);
		cv::rectangle(drawn, cv::Point(mx1, y1), cv::Point(mx2, y2), cv::Scalar(0, 255, 255), 2);
		cv::putText(drawn, std::format("row {}", index++), cv::Point(10, std::max(25, y1 + 25)), cv::FONT_HERSHEY_SIMPLEX, 0.7,
		            cv::Scalar(255, 255, 255), 2);
	}
	return drawn;
}

} // namespace warlens::vision
