#pragma once

#include "vision/config.hpp"
#include "vision/debugWriter.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>

namespace warlens::vision {

//! Result of the dialog localisation stage.
struct DialogRoi {
	cv::Mat roi;             //!< Padded dialog region (view into the frame) or the full frame if not found.
	std::optional<Box> bbox; //!< Region in frame coordinates; empty if the dialog was not found.
};

/*! Localise the battle report dialog by its border colour.
 * \param [in]     frame    BGR frame.
 * \param [in]     cfg      Hue windows, kernel and geometric gates.
 * \param [in,out] debugger Optional writer for the dialog mask.
 * \return         The padded dialog region, or the unchanged frame (bbox empty) if no plausible dialog exists.
 */
DialogRoi locateDialog(const cv::Mat& frame, const SegmenterConfig& cfg, const DebugWriter* debugger = nullptr);

} // namespace warlens::vision
