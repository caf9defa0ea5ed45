#pragma once

#include <opencv2/core/mat.hpp>

#include <cstdint>

namespace warlens::match {

class BatchScope;

//! Similarity summary of one crop. Immutable once built.
struct Descriptor {
	std::uint64_t hash = 0; //!< 64 bit difference hash of the canonical gray.
	cv::Mat profile;        //!< L2 normalised ink column profile (1 x canonical width, CV_32F).
	int width  = 0;         //!< Source crop width (px).
	int height = 0;         //!< Source crop height (px).
	cv::Mat gray;           //!< Canonical grayscale (CV_8U).
};

/*! Grayscale of `image` resized to `size` with area interpolation.
 * \param [in] image BGR, BGRA or gray 8 bit image.
 * \param [in] size  Canonical size.
 * \param [in] scope Optional per-call memo of conversions.
 */
cv::Mat canonicalGray(const cv::Mat& image, cv::Size size, BatchScope* scope = nullptr);

//! 64 bit difference hash: 9x8 area resize, bit set where a pixel is brighter than its left neighbour, row-major, MSB first.
std::uint64_t dhash64(const cv::Mat& gray);

//! Number of differing bits.
int hamming64(std::uint64_t a, std::uint64_t b);

//! Hash, ink profile, source geometry and canonical gray of `image`.
Descriptor buildDescriptor(const cv::Mat& image, cv::Size canonicalSize, BatchScope* scope = nullptr);

//! dHash of the 256x64 canonical gray of a BGR image.
std::uint64_t imageHash64(const cv::Mat& bgr);

} // namespace warlens::match
