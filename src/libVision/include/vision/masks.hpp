#pragma once

#include "vision/colorPlanes.hpp"
#include "vision/config.hpp"

#include <opencv2/core/mat.hpp>

namespace warlens::vision {

//! The three binary masks (CV_8U, 0/255) derived from one frame.
struct FrameMasks {
	cv::Mat dark;   //!< Dark/desaturated UI and text.
	cv::Mat bright; //!< Bright low-chroma digits.
	cv::Mat trim;   //!< Text-like pixels used for horizontal trimming.
};

//! Dark mask: (HSV low S and low V) or (Lab near-neutral and low L), closed and despeckled.
cv::Mat buildDarkMask(const ColorPlanes& planes, const SegmenterConfig& cfg);

//! Bright digit mask: high Lab lightness and low chroma, lightly closed.
cv::Mat buildBrightMask(const ColorPlanes& planes, const SegmenterConfig& cfg);

//! Trim mask: dark | bright | warm hues, closed with a small ellipse and a wide horizontal bar.
cv::Mat buildTrimMask(const ColorPlanes& planes, const cv::Mat& dark, const cv::Mat& bright, const SegmenterConfig& cfg);

//! Build all masks from shared colour planes (no redundant conversions).
FrameMasks buildMasks(const ColorPlanes& planes, const SegmenterConfig& cfg);

} // namespace warlens::vision
