#include "vision/masks.hpp"

#include "vision/structuringElements.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace warlens::vision {

cv::Mat buildDarkMask(const ColorPlanes& planes, const SegmenterConfig& cfg) {
	const int H = planes.hsv.rows;
	const int W = planes.hsv.cols;

	// 1. HSV: dark and desaturated.
	cv::Mat mHsv;
	cv::inRange(planes.hsv, cv::Scalar(0, 0, 0), cv::Scalar(179, cfg.darkSatMax, cfg.darkValMax), mHsv);

	// 2. Lab: near-neutral chroma and low lightness.
	cv::Mat mChroma;
	cv::threshold(chromaSquared(planes.a, planes.b), mChroma, cfg.darkChromaMax * cfg.darkChromaMax, 255, cv::THRESH_BINARY_INV);
	mChroma.convertTo(mChroma, CV_8U);

	cv::Mat mL;
	cv::threshold(planes.L, mL, cfg.darkLightnessMax, 255, cv::THRESH_BINARY_INV);

	cv::Mat mask;
	cv::bitwise_and(mL, mChroma, mask);
	cv::bitwise_or(mHsv, mask, mask);

	const int k = std::max(2, static_cast<int>(std::min(H, W) * 0.008));
	cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, seEllipse(k));

	// 3. Remove tiny components.
	cv::Mat labels;
	cv::Mat stats;
	cv::Mat centroids;
	const int count   = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8);
	const int areaMin = static_cast<int>(cfg.darkMinAreaFrac * H * W);

	std::vector<uchar> keep(static_cast<std::size_t>(count), 0u);
	for (int i = 1; i < count; ++i) {
		keep[static_cast<std::size_t>(i)] = stats.at<int>(i, cv::CC_STAT_AREA) >= areaMin ? 255u : 0u;
	}

	cv::Mat out = cv::Mat::zeros(mask.size(), CV_8U);
	for (int y = 0; y < H; ++y) {
		const int* lab = labels.ptr<int>(y);
		uchar* dst     = out.ptr<uchar>(y);
		for (int x = 0; x < W; ++x) {
			dst[x] = keep[static_cast<std::size_t>(lab[x])];
		}
	}
	return out;
}

cv::Mat buildBrightMask(const ColorPlanes& planes, const SegmenterConfig& cfg) {
	cv::Mat mL;
	cv::threshold(planes.L, mL, cfg.brightLightnessMin, 255, cv::THRESH_BINARY);

	cv::Mat mChroma;
	cv::threshold(chromaSquared(planes.a, planes.b), mChroma, cfg.brightChromaMax * cfg.brightChromaMax, 255, cv::THRESH_BINARY_INV);
	mChroma.convertTo(mChroma, CV_8U);

	cv::Mat mask;
	cv::bitwise_and(mL, mChroma, mask);
	cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, seEllipse(3));
	return mask;
}

cv::Mat buildTrimMask(const ColorPlanes& planes, const cv::Mat& dark, const cv::Mat& bright, const SegmenterConfig& cfg) {
	// Warm tones keep informative pixels (coloured nicknames, alliance tags).
	cv::Mat warm1;
	cv::Mat warm2;
	cv::inRange(planes.hsv, cv::Scalar(0, 70, 80), cv::Scalar(35, 255, 255), warm1);
	cv::inRange(planes.hsv, cv::Scalar(140, 60, 80), cv::Scalar(179, 255, 255), warm2);

	cv::Mat mask;
	cv::bitwise_or(dark, bright, mask);
	cv::bitwise_or(mask, warm1, mask);
	cv::bitwise_or(mask, warm2, mask);

	cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, seEllipse(3));
	const int kx = std::max(3, static_cast<int>(mask.cols * cfg.trimCloseFrac) | 1);
	cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, seRect(kx, 1));
	return mask;
}

FrameMasks buildMasks(const ColorPlanes& planes, const SegmenterConfig& cfg) {
	FrameMasks masks;
	masks.dark   = buildDarkMask(planes, cfg);
	masks.bright = buildBrightMask(planes, cfg);
	masks.trim   = buildTrimMask(planes, masks.dark, masks.bright, cfg);
	return masks;
}

} // namespace warlens::vision
