#pragma once

#include <opencv2/core/mat.hpp>

namespace warlens::vision {

//! Colour-space views of one frame, computed once and shared by all mask builders.
struct ColorPlanes {
	cv::Mat hsv;     //!< HSV (CV_8UC3, H in [0,179]).
	cv::Mat lab;     //!< Lab (CV_8UC3, a/b neutral at 128).
	cv::Mat L;       //!< Lightness channel (CV_8U).
	cv::Mat a;       //!< a channel (CV_8U).
	cv::Mat b;       //!< b channel (CV_8U).
	cv::Mat gray;    //!< Grayscale (CV_8U).
	cv::Mat gradMag; //!< Sobel gradient magnitude of gray (CV_32F).
};

/*! Compute every colour plane of a BGR frame.
 * \param [in] bgr 3-channel 8-bit frame.
 * \return     Planes with the same size as the input.
 */
ColorPlanes prepareColorPlanes(const cv::Mat& bgr);

//! Sobel gradient magnitude (3x3) of a grayscale image as CV_32F.
cv::Mat gradientMagnitude(const cv::Mat& gray);

//! Squared Lab chroma distance from neutral (128,128) as CV_32F.
cv::Mat chromaSquared(const cv::Mat& a, const cv::Mat& b);

} // namespace warlens::vision
