#include "match/descriptor.hpp"

#include "match/batchScope.hpp"
#include "match/textFeatures.hpp"

#include <opencv2/imgproc.hpp>

#include <bit>
#include <stdexcept>

namespace warlens::match {

cv::Mat canonicalGray(const cv::Mat& image, cv::Size size, BatchScope* scope) {
	if (image.empty()) {
		throw std::invalid_argument("Cannot build a canonical gray of an empty image.");
	}

	auto toGray = [&](int code) {
		if (scope) {
			return scope->cvtColor(image, code);
		}
		cv::Mat converted;
		cv::cvtColor(image, converted, code);
		return converted;
	};

	cv::Mat gray;
	switch (image.channels()) {
	case 1:
		gray = image;
		break;
	case 3:
		gray = toGray(cv::COLOR_BGR2GRAY);
		break;
	case 4:
		gray = toGray(cv::COLOR_BGRA2GRAY);
		break;
	default:
		throw std::invalid_argument("Unsupported channel count.");
	}

	if (scope) {
		return scope->resize(gray, size, cv::INTER_AREA);
	}
	cv::Mat resized;
	cv::resize(gray, resized, size, 0, 0, cv::INTER_AREA);
	return resized;
}

std::uint64_t dhash64(const cv::Mat& gray) {
	cv::Mat small;
	cv::resize(gray, small, {9, 8}, 0, 0, cv::INTER_AREA);

	std::uint64_t hash = 0;
	for (int y = 0; y < 8; ++y) {
		const uchar* row = small.ptr<uchar>(y);
		for (int x = 0; x < 8; ++x) {
			hash = (hash << 1) | (row[x + 1] > row[x] ? 1u : 0u);
		}
	}
	return hash;
}

int hamming64(std::uint64_t a, std::uint64_t b) {
	return std::popcount(a ^ b);
}

Descriptor buildDescriptor(const cv::Mat& image, cv::Size canonicalSize, BatchScope* scope) {
	Descriptor desc;
	desc.gray    = canonicalGray(image, canonicalSize, scope);
	desc.hash    = dhash64(desc.gray);
	desc.profile = columnProfile(inkMask(desc.gray, scope));
	desc.width   = image.cols;
	desc.height  = image.rows;
	return desc;
}

std::uint64_t imageHash64(const cv::Mat& bgr) {
	return dhash64(canonicalGray(bgr, {256, 64}));
}

} // namespace warlens::match
