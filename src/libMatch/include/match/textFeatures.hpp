#pragma once

#include <opencv2/core/mat.hpp>

#include <utility>

namespace warlens::match {

class BatchScope;

//! Binary mask (0/255) of dark text strokes: Otsu and adaptive Gaussian threshold combined, then opened and closed.
cv::Mat inkMask(const cv::Mat& gray, BatchScope* scope = nullptr);

//! IoU of two binary masks after a 1x3 dilation. Returns 0 if both are empty.
double maskIou(const cv::Mat& a, const cv::Mat& b);

//! Column sums of a mask as a L2 normalised 1xW CV_32F row.
cv::Mat columnProfile(const cv::Mat& mask);

//! Cosine similarity in [-1, 1]; 0 if either vector is all zero.
double cosine(const cv::Mat& u, const cv::Mat& v);

//! Profile shifted by `shift` columns with zero fill.
cv::Mat shiftProfile(const cv::Mat& profile, int shift);

//! Best cosine over integer shifts of `b` in [-maxShift, maxShift] and the shift reaching it.
std::pair<double, int> bestShiftedCosine(const cv::Mat& a, const cv::Mat& b, int maxShift);

//! Fraction of non-zero mask pixels.
double coverage(const cv::Mat& mask);

} // namespace warlens::match
