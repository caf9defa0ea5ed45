#pragma once

#include <opencv2/core/mat.hpp>

#include <optional>
#include <utility>

namespace warlens::vision {

//! Axis-aligned rectangle in pixel units of the frame it was detected in.
struct Box {
	int x = 0;
	int y = 0;
	int w = 0;
	int h = 0;

	double centerX() const { return x + w / 2.0; }
	double centerY() const { return y + h / 2.0; }

	cv::Rect rect() const { return {x, y, w, h}; }

	bool operator==(const Box&) const = default;
};

//! Fractional range [begin, end) along one image axis.
struct FracRange {
	double begin = 0.0;
	double end   = 1.0;
};

//! Per-row crops of one combat row. Mats share memory with the analysed frame.
struct RowSlice {
	std::pair<int, int> bounds;    //!< Row y-bounds [y1, y2) in ROI coordinates.
	Box hex;                       //!< Detected row marker.
	cv::Mat row;                   //!< Full-width row crop.
	cv::Mat left;                  //!< Attacker crop, trimmed to text-bearing columns.
	cv::Mat mid;                   //!< Score column crop.
	cv::Mat right;                 //!< Defender crop, trimmed to text-bearing columns.
	std::pair<int, int> midBounds; //!< Mid column x-bounds [mx1, mx2).
	std::optional<int> midGlobalX; //!< Global mid column used for this row (locked mode).
};

//! Clamp an integer value into [lo, hi].
inline int clip(int v, int lo, int hi) {
	return v < lo ? lo : (v > hi ? hi : v);
}

//! Intersect a box with [0, size). A box entirely outside collapses to a 1x1 box at the nearest corner.
inline Box clipBox(const Box& box, cv::Size size) {
	const cv::Rect r = box.rect() & cv::Rect(0, 0, size.width, size.height);
	if (r.empty()) {
		return {clip(box.x, 0, size.width - 1), clip(box.y, 0, size.height - 1), 1, 1};
	}
	return {r.x, r.y, r.width, r.height};
}

//! Convert a fractional y-range into pixel bounds. Falls back to the full height if degenerate.
inline std::pair<int, int> yBounds(int height, const FracRange& range) {
	int y1 = clip(static_cast<int>(range.begin * height), 0, height - 1);
	int y2 = clip(static_cast<int>(range.end * height), 1, height);
	if (y2 <= y1 + 1) {
		y1 = 0;
		y2 = height;
	}
	return {y1, y2};
}

} // namespace warlens::vision
