#include "vision/rowDetector.hpp"

#include "Logging.hpp"
#include "statistics.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <numeric>
#include <tuple>
#include <utility>

namespace warlens::vision {
namespace internal {

//! Odd kernel size proportional to `length`, at least `minSize`.
static int oddKernel(int length, double frac, int minSize) {
	return std::max(minSize, static_cast<int>(frac * length) | 1);
}

//! Lag of the strongest autocorrelation within [minLag, maxLag). Falls back to `fallback` for short profiles.
static int estimateSpacing(const std::vector<float>& profile, int minLag, int searchLen, int fallback) {
	const int n = static_cast<int>(profile.size());
	if (n <= minLag + 3) {
		return std::max(minLag, fallback);
	}

	const double m = std::accumulate(profile.begin(), profile.end(), 0.0) / n;

	const int maxLag = std::min(n, minLag + std::max(1, searchLen));
	int bestLag      = minLag;
	double bestAc    = -std::numeric_limits<double>::infinity();
	for (int lag = minLag; lag < maxLag; ++lag) {
		double ac = 0.0;
		for (int i = 0; i + lag < n; ++i) {
			ac += (profile[i] - m) * (profile[i + lag] - m);
		}
		if (ac > bestAc) {
			bestAc  = ac;
			bestLag = lag;
		}
	}
	return std::max(minLag, bestLag);
}

} // namespace internal

int findMidColumn(const cv::Mat& darkMask, const FracRange& yRange, const SegmenterConfig& cfg) {
	const int W          = darkMask.cols;
	const auto [y1, y2]  = yBounds(darkMask.rows, yRange);

	cv::Mat columns;
	cv::reduce(darkMask.rowRange(y1, y2), columns, 0, cv::REDUCE_SUM, CV_32F);

	const int k = internal::oddKernel(W, 0.01, 5);
	cv::GaussianBlur(columns, columns, cv::Size(k, 1), 0);

	const int x1 = clip(static_cast<int>(cfg.centerBand.begin * W), 0, W - 1);
	const int x2 = clip(static_cast<int>(cfg.centerBand.end * W), x1 + 1, W);

	cv::Point maxLoc;
	cv::minMaxLoc(columns.colRange(x1, x2), nullptr, nullptr, nullptr, &maxLoc);
	return x1 + maxLoc.x;
}

int refineMidColumn(int midX, const std::vector<Box>& boxes) {
	if (boxes.empty()) {
		return midX;
	}

	std::vector<double> centers;
	centers.reserve(boxes.size());
	for (const auto& box : boxes) {
		centers.push_back(box.centerX());
	}
	return static_cast<int>(median(std::move(centers)));
}

std::vector<Box> detectContourMarkers(const cv::Mat& band, cv::Point offset, cv::Size frameSize, const SegmenterConfig& cfg) {
	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(band.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

	const double minH = cfg.hexHeight.begin * frameSize.height;
	const double maxH = cfg.hexHeight.end * frameSize.height;

	std::vector<Box> candidates;
	for (const auto& contour : contours) {
		const cv::Rect r = cv::boundingRect(contour);
		if (r.height < minH || r.height > maxH) {
			continue;
		}

		const double aspect = r.width / (r.height + 1e-6);
		if (aspect < cfg.hexAspect.begin || aspect > cfg.hexAspect.end) {
			continue;
		}

		const Box box{offset.x + r.x, offset.y + r.y, r.width, r.height};
		if (box.centerX() < 0.0 || box.centerX() > frameSize.width - 1 || box.centerY() < 0.0 || box.centerY() > frameSize.height - 1) {
			continue;
		}
		candidates.push_back(box);
	}
	return clusterRows(std::move(candidates), cfg);
}

std::vector<Box> detectProfileMarkers(const cv::Mat& band, int midX, int frameWidth, int offsetY, const SegmenterConfig& cfg) {
	const int Hband = band.rows;
	if (Hband < 3) {
		return {};
	}

	// 1. Row-wise pixel count, smoothed.
	cv::Mat rowSums;
	cv::reduce(band, rowSums, 1, cv::REDUCE_SUM, CV_32F);
	rowSums /= 255.0;

	const int k = internal::oddKernel(Hband, 0.015, 5);
	cv::GaussianBlur(rowSums, rowSums, cv::Size(1, k), 0);

	std::vector<float> prof(rowSums.begin<float>(), rowSums.end<float>());
	const float peakMax = *std::max_element(prof.begin(), prof.end());
	if (peakMax < 1e-6f) {
		return {};
	}
	const double thr = std::max(cfg.profilePeakFrac * peakMax, cfg.profilePeakFloor);

	// 2. Row spacing from the autocorrelation suppresses near-duplicate peaks.
	const int minSep = std::max(6, static_cast<int>(0.025 * Hband));
	const int estSep = internal::estimateSpacing(prof, minSep, static_cast<int>(0.12 * Hband), static_cast<int>(0.06 * Hband));

	// 3. Local maxima above threshold. A close peak replaces the previous one only if it is stronger.
	std::vector<int> peaks;
	int last = std::numeric_limits<int>::min() / 2;
	for (int i = 1; i + 1 < Hband; ++i) {
		if (prof[i] <= thr || prof[i] < prof[i - 1] || prof[i] < prof[i + 1]) {
			continue;
		}
		if (!peaks.empty() && (i - last) < estSep / 2) {
			if (prof[i] > prof[peaks.back()]) {
				peaks.back() = i;
				last         = i;
			}
		} else {
			peaks.push_back(i);
			last = i;
		}
	}

	// 4. Expand each peak to its full width at rowFwhmK of the peak, then pad.
	const int w = std::max(6, static_cast<int>(0.006 * frameWidth));
	std::vector<Box> boxes;
	boxes.reserve(peaks.size());
	for (const int p : peaks) {
		const double half = prof[p] * cfg.rowFwhmK;

		int up = p;
		while (up + 1 < Hband && prof[up + 1] >= half) {
			++up;
		}
		int dn = p;
		while (dn - 1 >= 0 && prof[dn - 1] >= half) {
			--dn;
		}

		const int span = up - dn + 1;
		const int padY = std::max(cfg.rowMinPad, static_cast<int>(cfg.rowExpandFrac * span));
		dn             = std::max(0, dn - padY);
		up             = std::min(Hband - 1, up + padY);

		const int yy1 = offsetY + dn;
		const int yy2 = offsetY + up + 1;
		// A remembered column near the frame edge must not push the box outside.
		boxes.push_back(clipBox(Box{midX - w / 2, yy1, w, std::max(1, yy2 - yy1)}, {frameWidth, offsetY + Hband}));
	}
	return boxes;
}

std::vector<Box> fuseDetections(const std::vector<Box>& primary, const std::vector<Box>& secondary, const ProximityPredicate& isNear) {
	std::vector<Box> fused;
	std::vector<bool> used(secondary.size(), false);

	for (const auto& p : primary) {
		std::vector<std::size_t> matches;
		for (std::size_t i = 0; i < secondary.size(); ++i) {
			if (!used[i] && isNear(p, secondary[i])) {
				matches.push_back(i);
			}
		}

		// One or more secondary boxes localise the row more precisely than the primary box.
		if (matches.empty()) {
			fused.push_back(p);
			continue;
		}
		for (const auto i : matches) {
			used[i] = true;
			fused.push_back(secondary[i]);
		}
	}

	for (std::size_t i = 0; i < secondary.size(); ++i) {
		if (!used[i]) {
			fused.push_back(secondary[i]);
		}
	}
	return fused;
}

ProximityPredicate rowProximity(const SegmenterConfig& cfg) {
	return [contourFrac = cfg.fuseContourFrac, profileFrac = cfg.fuseProfileFrac](const Box& contour, const Box& profile) {
		const double radius = std::max(contourFrac * contour.h, profileFrac * profile.h);
		return std::abs(profile.centerY() - contour.centerY()) <= radius;
	};
}

std::vector<Box> clusterRows(std::vector<Box> boxes, const SegmenterConfig& cfg) {
	if (boxes.empty()) {
		return boxes;
	}

	std::stable_sort(boxes.begin(), boxes.end(), [](const Box& a, const Box& b) { return a.centerY() < b.centerY(); });

	std::vector<double> centers;
	std::vector<double> heights;
	for (const auto& box : boxes) {
		centers.push_back(box.centerY());
		heights.push_back(box.h);
	}
	const double medH   = median(heights);
	const double medSep = centers.size() >= 2u ? median(consecutiveGaps(centers)) : medH * 1.1;
	const double thr    = std::max(cfg.clusterHeightFrac * medH, cfg.clusterSpacingFrac * medSep);

	std::vector<std::vector<Box>> clusters{{boxes.front()}};
	for (std::size_t i = 1; i < boxes.size(); ++i) {
		const Box& cur = boxes[i];
		bool newRow    = (centers[i] - centers[i - 1]) > thr;

		if (!newRow) {
			// Boxes that barely overlap vertically are distinct rows even when their centres are close.
			const Box& prev     = clusters.back().back();
			const int top       = std::max(prev.y, cur.y);
			const int bottom    = std::min(prev.y + prev.h, cur.y + cur.h);
			const double overlap = bottom - top;
			if (overlap < cfg.clusterMinOverlap * std::min(prev.h, cur.h)) {
				newRow = true;
			}
		}

		if (newRow) {
			clusters.push_back({cur});
		} else {
			clusters.back().push_back(cur);
		}
	}

	std::vector<Box> merged;
	merged.reserve(clusters.size());
	for (const auto& cluster : clusters) {
		merged.push_back(*std::max_element(cluster.begin(), cluster.end(), [](const Box& a, const Box& b) { return a.h < b.h; }));
	}
	return merged;
}

std::vector<Box> detectMarkersInBand(const FrameMasks& masks, int midX, const FracRange& yRange, const SegmenterConfig& cfg) {
	const int H = masks.dark.rows;
	const int W = masks.dark.cols;

	const int dx        = static_cast<int>(cfg.workBandHalf * W);
	const int x1        = clip(midX - dx, 0, W - 1);
	const int x2        = clip(midX + dx, 0, W - 1);
	const auto [y1, y2] = yBounds(H, yRange);
	if (x2 <= x1) {
		return {};
	}

	const cv::Rect bandRect(x1, y1, x2 - x1, y2 - y1);
	cv::Mat band;
	cv::bitwise_or(masks.dark(bandRect), masks.bright(bandRect), band);

	const auto contourBoxes = detectContourMarkers(band, {x1, y1}, masks.dark.size(), cfg);
	const auto profileBoxes = detectProfileMarkers(band, midX, W, y1, cfg);

	return clusterRows(fuseDetections(contourBoxes, profileBoxes, rowProximity(cfg)), cfg);
}

RowDetection detectRows(const FrameMasks& masks, const SegmenterMemory& memory, const SegmenterConfig& cfg) {
	const int W = masks.dark.cols;
	auto logger = Logger();

	RowDetection result;
	result.yRange = cfg.contentRange;

	if (memory.isSet()) {
		// Memory: reuse the remembered column for this width, no re-estimation.
		result.usedMemory    = true;
		result.midX          = static_cast<int>(std::lround(memory.hint->midFrac * W));
		result.fixedMidWidth = static_cast<int>(std::lround(memory.hint->widthFrac * W));
		result.boxes         = detectMarkersInBand(masks, result.midX, result.yRange, cfg);

		if (result.boxes.size() < cfg.minRows) {
			auto fallback = detectMarkersInBand(masks, result.midX, cfg.fallbackContentRange, cfg);
			if (fallback.size() >= result.boxes.size()) {
				result.boxes  = std::move(fallback);
				result.yRange = cfg.fallbackContentRange;
			}
		}
		logger.Log(Logging::LogLevel::Debug, std::format("[RowDetector] {} rows at remembered column {}.", result.boxes.size(), result.midX));
		return result;
	}

	// Estimate, detect and refine the mid column once.
	auto detectInRange = [&](const FracRange& yRange) {
		int midX   = findMidColumn(masks.dark, yRange, cfg);
		auto boxes = detectMarkersInBand(masks, midX, yRange, cfg);
		if (!boxes.empty()) {
			const int refined = refineMidColumn(midX, boxes);
			if (std::abs(refined - midX) > cfg.refineMinShift) {
				midX  = refined;
				boxes = detectMarkersInBand(masks, midX, yRange, cfg);
			}
		}
		return std::make_pair(midX, std::move(boxes));
	};

	std::tie(result.midX, result.boxes) = detectInRange(cfg.contentRange);

	if (result.boxes.size() < cfg.minRows) {
		auto [fallbackMid, fallbackBoxes] = detectInRange(cfg.fallbackContentRange);
		if (fallbackBoxes.size() >= result.boxes.size()) {
			result.midX   = fallbackMid;
			result.boxes  = std::move(fallbackBoxes);
			result.yRange = cfg.fallbackContentRange;
		}
	}

	logger.Log(Logging::LogLevel::Debug, std::format("[RowDetector] {} rows at column {}.", result.boxes.size(), result.midX));
	return result;
}

} // namespace warlens::vision
