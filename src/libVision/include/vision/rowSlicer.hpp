#pragma once

#include "vision/config.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <optional>
#include <vector>

namespace warlens::vision {

//! Side of the row a sub-image belongs to. The text of the left side is anchored at its right end and vice versa.
enum class Side { Left, Right };

/*! Grow a span of "on" columns outward from an anchor column, bridging gaps of up to `gapAllow` columns.
 * \param [in] columnsOn Per-column flags.
 * \param [in] side      Left: anchor at the last "on" column. Right: anchor at the first "on" column.
 * \param [in] gapAllow  Longest run of "off" columns that does not terminate the span.
 * \return     Inclusive [first, last] columns, or nothing if no column is "on".
 */
std::optional<std::pair<int, int>> anchoredSpan(const std::vector<bool>& columnsOn, Side side, int gapAllow);

/*! Columns of a sub-image that carry text.
 * \param [in] mask    Text mask of the sub-image (CV_8U).
 * \param [in] edgeMag Gradient magnitude of the sub-image (CV_32F), used when the mask yields no usable span. May be empty.
 * \param [in] side    Side of the row the sub-image belongs to.
 * \param [in] cfg     Trimming parameters.
 * \return     Column range [start, end) to keep, or nothing if the sub-image should stay untrimmed.
 */
std::optional<cv::Range> trimColumns(const cv::Mat& mask, const cv::Mat& edgeMag, Side side, const SegmenterConfig& cfg);

//! Trim `image` to its text-bearing columns; returns `image` unchanged if no span qualifies. Never throws.
cv::Mat trimHorizontal(const cv::Mat& image, const cv::Mat& mask, const cv::Mat& edgeMag, Side side, const SegmenterConfig& cfg);

//! Safe [x1, x2) bounds of the given width centred on `midX` inside [0, width).
std::pair<int, int> midBoundsFromGlobal(int frameWidth, int midX, int width);

//! Row height used for every row: gain-adjusted trimmed median of marker heights, floored and capped to the frame.
int targetRowHeight(const std::vector<Box>& hexBoxes, int frameHeight, const SegmenterConfig& cfg);

//! Inputs of the row slicer besides the image.
struct SliceInput {
	std::vector<Box> hexBoxes;        //!< One marker per row.
	cv::Mat trimMask;                 //!< Text mask of the ROI.
	cv::Mat edgeMag;                  //!< Gradient magnitude of the ROI (may be empty).
	std::optional<int> midGlobalX;    //!< Global mid column (locked mode).
	std::optional<int> fixedMidWidth; //!< Mid crop width from memory.
};

/*! Cut every row into left/mid/right crops and trim left/right to their text.
 * \param [in] roi   BGR region the markers were detected in.
 * \param [in] input Markers, masks and mid column information.
 * \param [in] cfg   Slicing parameters.
 * \return     One RowSlice per marker in the input order.
 */
std::vector<RowSlice> sliceRows(const cv::Mat& roi, const SliceInput& input, const SegmenterConfig& cfg);

} // namespace warlens::vision
