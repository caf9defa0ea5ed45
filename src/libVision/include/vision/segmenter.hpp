#pragma once

#include "vision/config.hpp"
#include "vision/debugWriter.hpp"
#include "vision/segmenterMemory.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>
#include <vector>

namespace warlens::vision {

//! Everything a segmentation call produces.
struct SegmentationResult {
	std::vector<RowSlice> rows;    //!< Ordered top to bottom. Empty if the frame is unsegmentable.
	SegmenterMemory memory;        //!< Memory to pass into the next call of the same sequence.
	std::optional<Box> dialog;     //!< Dialog region in frame coordinates, if found.
	cv::Mat roi;                   //!< Region the rows were detected in (view into the frame).
	int midX = 0;                  //!< Mid column in ROI coordinates.
	std::pair<int, int> yRange{};  //!< Vertical detection range in ROI pixels.
	std::vector<Box> hexBoxes;     //!< Row markers in ROI coordinates.
};

/*! Stateless battle report segmenter.
 *
 * Cross-frame state lives in the SegmenterMemory value passed to segment(); the segmenter itself can be shared.
 */
class Segmenter {
public:
	explicit Segmenter(SegmenterConfig config = {});

	/*! Segment one frame into row slices.
	 * \param [in] frame    BGR (or gray/BGRA) frame; converted to BGR if needed.
	 * \param [in] memory   Memory of the previous frames of this sequence.
	 * \param [in] debugger Optional writer for intermediate masks and an annotated overview.
	 * \throws std::invalid_argument if the frame is empty or has an unsupported channel count.
	 */
	SegmentationResult segment(const cv::Mat& frame, const SegmenterMemory& memory, const DebugWriter* debugger = nullptr) const;

	const SegmenterConfig& config() const { return m_config; }

private:
	SegmenterConfig m_config;
};

/*! Segmenter bound to one image sequence. Owns its memory, not thread safe.
 * Use one instance per sequence or call resetMemory() before switching to an unrelated sequence.
 */
class SequenceSegmenter {
public:
	explicit SequenceSegmenter(SegmenterConfig config = {});

	//! Segment the next frame of the sequence and update the memory.
	std::vector<RowSlice> run(const cv::Mat& frame, const DebugWriter* debugger = nullptr);

	void resetMemory();
	const SegmenterMemory& memory() const { return m_memory; }

private:
	Segmenter m_segmenter;
	SegmenterMemory m_memory;
};

} // namespace warlens::vision
