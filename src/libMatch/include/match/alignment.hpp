#pragma once

#include "match/cacheContext.hpp"
#include "match/config.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>

namespace warlens::match {

class BatchScope;

//! Zero-mean normalised cross correlation of two equally sized images, in [-1, 1]. Only the conversion of `a` is memoised.
double ncc(const cv::Mat& a, const cv::Mat& b, BatchScope* scope = nullptr);

//! Central crop covering `frac` of both axes (clamped to [0.1, 1]). Shares memory with `gray`.
cv::Mat cropCenter(const cv::Mat& gray, double frac);

//! Sobel gradient magnitude divided by its standard deviation (CV_32F).
cv::Mat sobelMagnitude(const cv::Mat& gray);

//! Rotation by `angleDeg` around the image centre, same size, replicated border.
cv::Mat rotateGray(const cv::Mat& gray, double angleDeg);

//! rotateGray memoised by buffer identity and angle.
cv::Mat rotateGrayCached(const cv::Mat& gray, double angleDeg, RotationCache& cache);

struct PhaseAlignment {
	cv::Mat aligned; //!< Moving image translated onto the reference.
	double dx = 0.0; //!< Translation of the moving image relative to the reference (px).
	double dy = 0.0;
};

/*! Translate `moving` onto `reference` by the sub-pixel shift found by Hann windowed phase correlation.
 * \param [in] reference Reference gray.
 * \param [in] moving    Gray of the same size.
 */
PhaseAlignment phaseAlign(const cv::Mat& reference, const cv::Mat& moving, BatchScope* scope = nullptr);

struct EccAlignment {
	cv::Mat aligned;
	double correlation = 0.0; //!< Final ECC correlation coefficient.
};

/*! Register `moving` onto `reference` with ECC.
 * \return The warped moving image, or nothing if ECC did not converge.
 */
std::optional<EccAlignment> eccAlign(const cv::Mat& reference, const cv::Mat& moving, MotionKind motion, int maxIter, double eps, int gaussSize,
                                     BatchScope* scope = nullptr);

} // namespace warlens::match
