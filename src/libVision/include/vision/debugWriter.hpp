#pragma once

#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace warlens::vision {

//! Best-effort writer of intermediate images. Failures are logged and never propagated.
class DebugWriter {
public:
	explicit DebugWriter(std::filesystem::path directory);

	//! Write `image` as `<directory>/<name>.png`. Returns false if the image could not be written.
	bool add(const std::string& name, const cv::Mat& image) const;

	const std::filesystem::path& directory() const { return m_directory; }

private:
	std::filesystem::path m_directory;
};

//! Parameters of the annotated overview image.
struct OverviewData {
	int midX = 0;                     //!< Mid column in ROI coordinates.
	std::pair<int, int> contentRange; //!< Vertical detection range [y1, y2).
	std::vector<Box> hexBoxes;        //!< Detected row markers.
	std::vector<RowSlice> rows;       //!< Sliced rows.
};

/*! Draw the detection band, mid column, marker boxes and row rectangles onto a copy of `roi`.
 * \param [in] roi  BGR region the detection ran on.
 * \param [in] data Detection results to annotate.
 * \return     Annotated BGR image.
 */
cv::Mat drawOverview(const cv::Mat& roi, const OverviewData& data);

} // namespace warlens::vision
