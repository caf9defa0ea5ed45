#pragma once

#include <optional>

namespace warlens::vision {

//! Mid column position and mid crop width, both as fractions of the frame width.
struct MidColumnHint {
	double midFrac   = 0.5;
	double widthFrac = 0.0;

	bool operator==(const MidColumnHint&) const = default;
};

/*! Cross-frame memory of the segmenter. Either fully set or unset.
 *
 * The value is owned by the caller, passed into each segmentation call and returned updated.
 * It must be reset between unrelated image sequences, otherwise detection anchors on a stale column.
 */
struct SegmenterMemory {
	std::optional<MidColumnHint> hint;

	bool isSet() const { return hint.has_value(); }
	void reset() { hint.reset(); }

	bool operator==(const SegmenterMemory&) const = default;
};

} // namespace warlens::vision
