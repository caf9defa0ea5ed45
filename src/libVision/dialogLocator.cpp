#include "vision/dialogLocator.hpp"

#include "Logging.hpp"
#include "vision/structuringElements.hpp"

#include <opencv2/imgproc.hpp>

#include <format>
#include <vector>

namespace warlens::vision {
namespace internal {

//! Pick the largest dialog-like contour. Thin or irregular shapes are rejected by their extent.
static std::optional<Box> largestReasonableBox(const cv::Mat& mask, const SegmenterConfig& cfg) {
	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
	if (contours.empty()) {
		return std::nullopt;
	}

	const int minW = static_cast<int>(cfg.minDialogWidth * mask.cols);
	const int minH = static_cast<int>(cfg.minDialogHeight * mask.rows);

	std::optional<Box> best;
	double bestArea = -1.0;
	for (const auto& contour : contours) {
		const cv::Rect r = cv::boundingRect(contour);
		if (r.width < minW || r.height < minH) {
			continue;
		}

		const double boxArea = static_cast<double>(r.area());
		if (boxArea <= 1.0) {
			continue;
		}
		const double area = cv::contourArea(contour);
		if (area / boxArea < cfg.minDialogExtent) {
			continue;
		}
		if (area > bestArea) {
			bestArea = area;
			best     = Box{r.x, r.y, r.width, r.height};
		}
	}
	return best;
}

} // namespace internal

DialogRoi locateDialog(const cv::Mat& frame, const SegmenterConfig& cfg, const DebugWriter* debugger) {
	const int H = frame.rows;
	const int W = frame.cols;

	cv::Mat hsv;
	cv::cvtColor(frame, hsv, cv::COLOR_BGR2HSV);

	cv::Mat mask = cv::Mat::zeros(H, W, CV_8U);
	for (const auto& range : cfg.dialogHueRanges) {
		cv::Mat part;
		cv::inRange(hsv, range.lo, range.hi, part);
		cv::bitwise_or(mask, part, mask);
	}
	cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, seRect(cfg.dialogCloseKernel, cfg.dialogCloseKernel), cv::Point(-1, -1), 2);
	if (debugger) {
		debugger->add("dialog_mask", mask);
	}

	const auto box = internal::largestReasonableBox(mask, cfg);
	if (!box) {
		Logger().Log(Logging::LogLevel::Debug, "[Dialog] No dialog found. Using the full frame.");
		return {frame, std::nullopt};
	}

	const int x1 = clip(box->x - cfg.dialogPad, 0, W - 1);
	const int y1 = clip(box->y - cfg.dialogPad, 0, H - 1);
	const int x2 = clip(box->x + box->w + cfg.dialogPad, 1, W);
	const int y2 = clip(box->y + box->h + cfg.dialogPad, 1, H);

	const Box padded{x1, y1, x2 - x1, y2 - y1};
	Logger().Log(Logging::LogLevel::Debug, std::format("[Dialog] Found dialog at ({}, {}) {}x{}.", padded.x, padded.y, padded.w, padded.h));
	return {frame(padded.rect()), padded};
}

} // namespace warlens::vision
