#include "vision/segmenter.hpp"

#include "Logging.hpp"
#include "vision/colorPlanes.hpp"
#include "vision/dialogLocator.hpp"
#include "vision/masks.hpp"
#include "vision/rowDetector.hpp"
#include "vision/rowSlicer.hpp"
#include "vision/scopedTimer.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace warlens::vision {

//! Bring the frame into 3-channel BGR.
static cv::Mat toBgr(const cv::Mat& frame) {
	if (frame.empty()) {
		throw std::invalid_argument("Cannot segment an empty frame.");
	}
	if (frame.depth() != CV_8U) {
		throw std::invalid_argument(std::format("Unsupported frame depth {}. Expected 8 bit.", frame.depth()));
	}

	switch (frame.channels()) {
	case 3:
		return frame;
	case 4: {
		cv::Mat bgr;
		cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
		return bgr;
	}
	case 1: {
		cv::Mat bgr;
		cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
		return bgr;
	}
	default:
		throw std::invalid_argument(std::format("Unsupported channel count {}.", frame.channels()));
	}
}

Segmenter::Segmenter(SegmenterConfig config) : m_config(std::move(config)) {
}

SegmentationResult Segmenter::segment(const cv::Mat& frame, const SegmenterMemory& memory, const DebugWriter* debugger) const {
	const cv::Mat bgr = toBgr(frame);
	ScopedTimer timer("Segmentation", Logger());

	SegmentationResult result;
	result.memory = memory;

	// 1. Dialog region
	auto dialog   = locateDialog(bgr, m_config, debugger);
	result.dialog = dialog.bbox;
	result.roi    = dialog.roi;

	// 2. Colour planes and masks, computed once for all stages.
	const auto planes = prepareColorPlanes(result.roi);
	const auto masks  = buildMasks(planes, m_config);
	if (debugger) {
		debugger->add("mask_dark", masks.dark);
		debugger->add("mask_trim", masks.trim);
	}

	// 3. Row markers
	const auto detection = detectRows(masks, memory, m_config);
	result.midX          = detection.midX;
	result.yRange        = yBounds(result.roi.rows, detection.yRange);
	result.hexBoxes      = detection.boxes;

	// 4. Row slices
	if (!detection.boxes.empty()) {
		SliceInput input;
		input.hexBoxes      = detection.boxes;
		input.trimMask      = masks.trim;
		input.edgeMag       = planes.gradMag;
		input.midGlobalX    = detection.midX;
		input.fixedMidWidth = detection.fixedMidWidth;
		result.rows         = sliceRows(result.roi, input, m_config);
	}

	// 5. Remember the mid column for the next frames of this sequence.
	if (!detection.usedMemory && !result.rows.empty()) {
		const double W          = result.roi.cols;
		const auto [mx1, mx2]   = result.rows.front().midBounds;
		result.memory.hint      = MidColumnHint{detection.midX / W, std::max(1, mx2 - mx1) / W};
		Logger().Log(Logging::LogLevel::Debug, std::format("[Segmenter] Stored mid column {:.3f} width {:.3f}.", result.memory.hint->midFrac, result.memory.hint->widthFrac));
	}

	if (debugger) {
		debugger->add("debug", drawOverview(result.roi, {result.midX, result.yRange, result.hexBoxes, result.rows}));
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Segmenter] Found {} rows (mid column {}, memory {}).", result.rows.size(), result.midX, detection.usedMemory ? "used" : "unused"));
	return result;
}

SequenceSegmenter::SequenceSegmenter(SegmenterConfig config) : m_segmenter(std::move(config)) {
}

std::vector<RowSlice> SequenceSegmenter::run(const cv::Mat& frame, const DebugWriter* debugger) {
	auto result = m_segmenter.segment(frame, m_memory, debugger);
	m_memory    = result.memory;
	return std::move(result.rows);
}

void SequenceSegmenter::resetMemory() {
	m_memory.reset();
}

} // namespace warlens::vision
