#pragma once

#include "vision/config.hpp"
#include "vision/masks.hpp"
#include "vision/segmenterMemory.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <functional>
#include <optional>
#include <vector>

namespace warlens::vision {

//! Returns true if the secondary box belongs to the same row as the primary box.
using ProximityPredicate = std::function<bool(const Box& primary, const Box& secondary)>;

//! Outcome of the row marker detection.
struct RowDetection {
	std::vector<Box> boxes;          //!< One marker per row, sorted top to bottom. Empty if the frame is unsegmentable.
	int midX = 0;                    //!< Mid column used for the final detection (px).
	FracRange yRange;                //!< Vertical content range used for the final detection.
	bool usedMemory = false;         //!< True if the mid column came from the memory hint.
	std::optional<int> fixedMidWidth; //!< Mid crop width taken from memory (px).
};

/*! Estimate the x coordinate of the central score column.
 * \param [in] darkMask Dark mask of the ROI.
 * \param [in] yRange   Vertical range whose columns are summed.
 * \param [in] cfg      Central search band.
 * \return     Column with the strongest smoothed dark response inside the central band.
 */
int findMidColumn(const cv::Mat& darkMask, const FracRange& yRange, const SegmenterConfig& cfg);

//! Median of the box centres; `midX` unchanged if there are no boxes.
int refineMidColumn(int midX, const std::vector<Box>& boxes);

/*! Contour based marker detection inside the working band.
 * \param [in] band      Binary band mask.
 * \param [in] offset    Position of the band in the ROI.
 * \param [in] frameSize Size of the ROI (height gates are fractions of it).
 * \param [in] cfg       Height and aspect ratio gates.
 * \return     Marker boxes in ROI coordinates, one per row.
 */
std::vector<Box> detectContourMarkers(const cv::Mat& band, cv::Point offset, cv::Size frameSize, const SegmenterConfig& cfg);

/*! Energy-profile based marker detection inside the working band.
 * Rows are peaks of the smoothed row-wise pixel count. Peaks closer than half the autocorrelation spacing are merged,
 * each remaining peak is expanded to its full width at `rowFwhmK` of the peak.
 * \param [in] band       Binary band mask.
 * \param [in] midX       Mid column in ROI coordinates (boxes are centred on it).
 * \param [in] frameWidth ROI width (box width is a fraction of it).
 * \param [in] offsetY    Top of the band in ROI coordinates.
 * \param [in] cfg        Peak and padding parameters.
 */
std::vector<Box> detectProfileMarkers(const cv::Mat& band, int midX, int frameWidth, int offsetY, const SegmenterConfig& cfg);

/*! Reconcile two ordered detection lists.
 * For each primary box the not yet used secondary boxes satisfying `isNear` are collected: if any match they replace
 * the primary box, otherwise the primary box is kept. Unmatched secondary boxes are appended.
 */
std::vector<Box> fuseDetections(const std::vector<Box>& primary, const std::vector<Box>& secondary, const ProximityPredicate& isNear);

//! Proximity rule between contour and profile boxes: centre distance within max(a * contour h, b * profile h).
ProximityPredicate rowProximity(const SegmenterConfig& cfg);

//! Merge boxes into one per row (the tallest member of each cluster), sorted by vertical centre.
std::vector<Box> clusterRows(std::vector<Box> boxes, const SegmenterConfig& cfg);

//! Run both detectors on the band around `midX` and fuse their results.
std::vector<Box> detectMarkersInBand(const FrameMasks& masks, int midX, const FracRange& yRange, const SegmenterConfig& cfg);

/*! Detect one marker per combat row, with mid column refinement and fallback range escalation.
 * \param [in] masks  Masks of the ROI.
 * \param [in] memory Mid column memory; if set, its column is reused without re-estimation.
 * \param [in] cfg    Detection parameters.
 */
RowDetection detectRows(const FrameMasks& masks, const SegmenterMemory& memory, const SegmenterConfig& cfg);

} // namespace warlens::vision
