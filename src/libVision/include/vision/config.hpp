#pragma once

#include "vision/configReader.hpp"
#include "vision/types.hpp"

#include <opencv2/core/types.hpp>

#include <filesystem>
#include <vector>

namespace warlens::vision {

//! Inclusive HSV window (OpenCV scale: H in [0,179], S/V in [0,255]).
struct HsvRange {
	cv::Scalar lo;
	cv::Scalar hi;
};

//! Tunable thresholds of the segmentation pipeline. Defaults are tuned on 1080p/1440p captures of the dark battle report.
struct SegmenterConfig {
	// Dialog localisation
	std::vector<HsvRange> dialogHueRanges{
	    {{95, 80, 60}, {125, 255, 255}}, // saturated border blue
	    {{85, 40, 120}, {105, 255, 255}} // washed-out cyan highlight
	};
	int dialogCloseKernel   = 15;   //!< Rect kernel size used to bridge border gaps (px).
	int dialogPad           = 8;    //!< Padding around the found dialog (px).
	double minDialogWidth   = 0.35; //!< Minimum dialog width as fraction of frame width.
	double minDialogHeight  = 0.35; //!< Minimum dialog height as fraction of frame height.
	double minDialogExtent  = 0.65; //!< Minimum contour area / bounding box area.

	// Masks
	int darkSatMax          = 60;      //!< HSV saturation upper bound for "dark".
	int darkValMax          = 80;      //!< HSV value upper bound for "dark".
	double darkChromaMax    = 18.0;    //!< Lab chroma distance from neutral for "dark".
	int darkLightnessMax    = 90;      //!< Lab L upper bound for "dark".
	double darkMinAreaFrac  = 0.00003; //!< Components smaller than this fraction of the frame are noise.
	int brightLightnessMin  = 200;     //!< Lab L lower bound of bright digits.
	double brightChromaMax  = 25.0;    //!< Lab chroma upper bound of bright digits.
	double trimCloseFrac    = 0.01;    //!< Horizontal closing width of the trim mask as fraction of frame width.

	// Row / hex detection
	FracRange centerBand{0.35, 0.65};        //!< Horizontal search band of the mid column.
	FracRange contentRange{0.12, 0.95};      //!< Primary vertical content range.
	FracRange fallbackContentRange{0.05, 0.98};
	double workBandHalf      = 0.06;         //!< Half-width of the detection band as fraction of frame width.
	FracRange hexHeight{0.02, 0.09};         //!< Marker height as fraction of frame height.
	FracRange hexAspect{0.6, 1.6};           //!< Marker aspect ratio (w/h).
	double profilePeakFrac   = 0.22;         //!< Profile peak threshold as fraction of the maximum.
	double profilePeakFloor  = 2.0;          //!< Absolute floor of the profile peak threshold.
	double rowFwhmK          = 0.5;          //!< Fraction of the peak that bounds a row span.
	double rowExpandFrac     = 0.15;         //!< Padding of a row span as fraction of its height.
	int rowMinPad            = 2;            //!< Minimum padding of a row span (px).
	double fuseContourFrac   = 0.45;         //!< Fusion radius as fraction of the contour box height.
	double fuseProfileFrac   = 0.35;         //!< Fusion radius as fraction of the profile box height.
	double clusterHeightFrac = 0.38;         //!< Row gap threshold as fraction of median height.
	double clusterSpacingFrac = 0.55;        //!< Row gap threshold as fraction of median spacing.
	double clusterMinOverlap = 0.15;         //!< Boxes overlapping less than this are separate rows.
	int refineMinShift       = 2;            //!< Mid column shift (px) that triggers a redetection.
	std::size_t minRows      = 12;           //!< Fewer rows than this trigger the fallback range.

	// Row slicing
	bool lockMidToGlobal     = true; //!< Use one global mid column for all rows.
	double rowHeightGain     = 1.6;  //!< Row height relative to the trimmed median marker height.
	double rowPadY           = 0.25; //!< Vertical padding of a row relative to its marker.
	double midPadX           = 0.04; //!< Local mode: padding around the marker as fraction of width.
	double minMidWidthFrac   = 0.08; //!< Minimum mid crop width as fraction of frame width.
	double minMidWidthRow    = 1.2;  //!< Minimum mid crop width relative to the row height.

	// Trimming
	int trimPad              = 4;    //!< Padding added around the kept span (px).
	int trimMinWidth         = 24;   //!< Narrower spans fall back to the gradient profile (px).
	int trimSmoothKernel     = 9;    //!< Gaussian kernel of the column profile.
	double trimPeakFrac      = 0.12; //!< Mask threshold as fraction of the peak.
	double trimHeightFrac    = 0.06; //!< Mask threshold floor as fraction of the slice height.
	double trimEdgePeakFrac  = 0.18; //!< Gradient threshold as fraction of the peak.
	int anchorGap            = 6;    //!< Longest run of empty columns bridged by a span (px).
};

using warlens::ConfigError;

/*! Load a segmenter configuration from a YAML/JSON file (cv::FileStorage format).
 * Keys mirror the member names; missing keys keep their defaults.
 * \throws ConfigError if the file cannot be opened or a kernel size, width or count is not positive.
 */
SegmenterConfig loadSegmenterConfig(const std::filesystem::path& path);

} // namespace warlens::vision
