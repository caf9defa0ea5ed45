#include "vision/rowSlicer.hpp"

#include "statistics.hpp"
#include "vision/colorPlanes.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace warlens::vision {
namespace internal {

//! Smooth a 1xN float profile in place with an odd Gaussian kernel.
static void smoothProfile(cv::Mat& profile, int kernel) {
	kernel |= 1;
	if (kernel > 1) {
		cv::GaussianBlur(profile, profile, cv::Size(kernel, 1), 0);
	}
}

static std::vector<bool> columnsAtLeast(const cv::Mat& profile, double thr) {
	std::vector<bool> on(static_cast<std::size_t>(profile.cols), false);
	const float* p = profile.ptr<float>(0);
	for (int i = 0; i < profile.cols; ++i) {
		on[static_cast<std::size_t>(i)] = p[i] >= thr;
	}
	return on;
}

//! Padded span around the anchored columns if it is at least `minWidth` wide.
static std::optional<cv::Range> paddedSpan(const std::vector<bool>& on, Side side, int width, const SegmenterConfig& cfg) {
	const auto span = anchoredSpan(on, side, cfg.anchorGap);
	if (!span) {
		return std::nullopt;
	}

	const int x1 = std::max(0, span->first - cfg.trimPad);
	const int x2 = std::min(width, span->second + 1 + cfg.trimPad);
	if (x2 - x1 < cfg.trimMinWidth) {
		return std::nullopt;
	}
	return cv::Range(x1, x2);
}

} // namespace internal

std::optional<std::pair<int, int>> anchoredSpan(const std::vector<bool>& columnsOn, Side side, int gapAllow) {
	const int n = static_cast<int>(columnsOn.size());

	int anchor = -1;
	if (side == Side::Left) {
		for (int i = n - 1; i >= 0 && anchor < 0; --i) {
			anchor = columnsOn[i] ? i : -1;
		}
	} else {
		for (int i = 0; i < n && anchor < 0; ++i) {
			anchor = columnsOn[i] ? i : -1;
		}
	}
	if (anchor < 0) {
		return std::nullopt;
	}

	int left = anchor;
	int gaps = 0;
	for (int i = anchor - 1; i >= 0; --i) {
		if (columnsOn[i]) {
			left = i;
			gaps = 0;
		} else if (++gaps > gapAllow) {
			break;
		}
	}

	int right = anchor;
	gaps      = 0;
	for (int i = anchor + 1; i < n; ++i) {
		if (columnsOn[i]) {
			right = i;
			gaps  = 0;
		} else if (++gaps > gapAllow) {
			break;
		}
	}
	return std::make_pair(left, right);
}

std::optional<cv::Range> trimColumns(const cv::Mat& mask, const cv::Mat& edgeMag, Side side, const SegmenterConfig& cfg) {
	if (mask.empty() || mask.cols < 2) {
		return std::nullopt;
	}
	const int Hs = mask.rows;
	const int Ws = mask.cols;

	// 1. Text mask column profile.
	cv::Mat binary;
	cv::compare(mask, 0, binary, cv::CMP_GT);
	cv::Mat columns;
	cv::reduce(binary, columns, 0, cv::REDUCE_SUM, CV_32F);
	columns /= 255.0;
	internal::smoothProfile(columns, cfg.trimSmoothKernel);

	double peak = 0.0;
	cv::minMaxLoc(columns, nullptr, &peak);
	if (peak > 1e-6) {
		const double thrAbs = cfg.trimHeightFrac * Hs;
		const double thr    = std::max(cfg.trimPeakFrac * peak, thrAbs);

		auto on = internal::columnsAtLeast(columns, thr);
		if (std::none_of(on.begin(), on.end(), [](bool v) { return v; })) {
			on = internal::columnsAtLeast(columns, std::max(0.06 * peak, 0.5 * thrAbs));
		}
		if (auto range = internal::paddedSpan(on, side, Ws, cfg)) {
			return range;
		}
	}

	// 2. Fallback: gradient energy.
	if (edgeMag.empty() || edgeMag.size() != mask.size()) {
		return std::nullopt;
	}
	cv::Mat energy;
	cv::reduce(edgeMag, energy, 0, cv::REDUCE_AVG, CV_32F);
	internal::smoothProfile(energy, cfg.trimSmoothKernel);

	double peakEnergy = 0.0;
	cv::minMaxLoc(energy, nullptr, &peakEnergy);
	if (peakEnergy <= 1e-6) {
		return std::nullopt;
	}
	return internal::paddedSpan(internal::columnsAtLeast(energy, cfg.trimEdgePeakFrac * peakEnergy), side, Ws, cfg);
}

cv::Mat trimHorizontal(const cv::Mat& image, const cv::Mat& mask, const cv::Mat& edgeMag, Side side, const SegmenterConfig& cfg) {
	if (image.empty() || mask.empty()) {
		return image;
	}

	cv::Mat magnitude = edgeMag;
	if (magnitude.empty()) {
		cv::Mat gray;
		cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
		magnitude = gradientMagnitude(gray);
	}

	const auto range = trimColumns(mask, magnitude, side, cfg);
	return range ? image.colRange(*range) : image;
}

std::pair<int, int> midBoundsFromGlobal(int frameWidth, int midX, int width) {
	width        = std::max(1, width);
	const int c  = clip(midX, 0, frameWidth - 1);
	int mx1      = clip(c - width / 2, 0, frameWidth - 1);
	const int mx2 = clip(mx1 + width, 1, frameWidth);
	if (mx2 - mx1 < width) {
		mx1 = clip(mx2 - width, 0, frameWidth - 1);
	}
	return {mx1, mx2};
}

int targetRowHeight(const std::vector<Box>& hexBoxes, int frameHeight, const SegmenterConfig& cfg) {
	std::vector<double> heights;
	heights.reserve(hexBoxes.size());
	for (const auto& box : hexBoxes) {
		heights.push_back(box.h);
	}

	int target = static_cast<int>(trimmedMedian(heights));
	target     = static_cast<int>(target * cfg.rowHeightGain);

	const int medianHex = static_cast<int>(median(heights));
	target              = std::max(target, static_cast<int>(medianHex * (1.0 + 2.0 * cfg.rowPadY)));
	return std::max(1, std::min(target, frameHeight));
}

std::vector<RowSlice> sliceRows(const cv::Mat& roi, const SliceInput& input, const SegmenterConfig& cfg) {
	if (input.hexBoxes.empty() || roi.empty()) {
		return {};
	}
	const int H = roi.rows;
	const int W = roi.cols;

	const int rowH        = targetRowHeight(input.hexBoxes, H, cfg);
	const int baseMinMidW = std::max(static_cast<int>(cfg.minMidWidthFrac * W), static_cast<int>(cfg.minMidWidthRow * rowH));
	const int midWidthAll = input.fixedMidWidth ? std::max(1, *input.fixedMidWidth) : baseMinMidW;

	std::vector<RowSlice> rows;
	rows.reserve(input.hexBoxes.size());
	for (const auto& hex : input.hexBoxes) {
		// 1. Vertical window centred on the marker, shifted (not shrunk) into the frame.
		int y1               = static_cast<int>(std::lround(hex.centerY() - rowH / 2.0));
		const int offTop     = std::max(0, -y1);
		const int offBottom  = std::max(0, y1 + rowH - H);
		y1                  += offTop - offBottom;
		y1                   = clip(y1, 0, H - 1);
		const int y2         = clip(y1 + rowH, 1, H);

		// 2. Mid column bounds: global hint (locked) or around the marker (local).
		std::pair<int, int> midBounds;
		if (cfg.lockMidToGlobal && input.midGlobalX) {
			midBounds = midBoundsFromGlobal(W, *input.midGlobalX, midWidthAll);
		} else {
			const int pad = static_cast<int>(W * cfg.midPadX / 2);
			int mx1       = clip(hex.x - pad, 0, W - 1);
			int mx2       = clip(hex.x + hex.w + pad, 0, W - 1);
			if (mx2 - mx1 < baseMinMidW) {
				const int c = (mx1 + mx2) / 2;
				mx1         = clip(c - baseMinMidW / 2, 0, W - 1);
				mx2         = clip(mx1 + baseMinMidW, 1, W);
			}
			midBounds = {mx1, mx2};
		}
		const auto [mx1, mx2] = midBounds;

		const cv::Range rowRange(y1, y2);
		const cv::Mat rowImg  = roi.rowRange(rowRange);
		const cv::Mat rowMask = input.trimMask.rowRange(rowRange);
		const cv::Mat rowMag  = input.edgeMag.empty() ? cv::Mat() : input.edgeMag.rowRange(rowRange);

		auto part = [](const cv::Mat& m, int a, int b) { return m.empty() ? cv::Mat() : m.colRange(a, b); };

		RowSlice slice;
		slice.bounds     = {y1, y2};
		slice.hex        = hex;
		slice.row        = rowImg;
		slice.left       = trimHorizontal(part(rowImg, 0, mx1), part(rowMask, 0, mx1), part(rowMag, 0, mx1), Side::Left, cfg);
		slice.mid        = rowImg.colRange(mx1, mx2);
		slice.right      = trimHorizontal(part(rowImg, mx2, W), part(rowMask, mx2, W), part(rowMag, mx2, W), Side::Right, cfg);
		slice.midBounds  = midBounds;
		slice.midGlobalX = input.midGlobalX;
		rows.push_back(std::move(slice));
	}
	return rows;
}

} // namespace warlens::vision
