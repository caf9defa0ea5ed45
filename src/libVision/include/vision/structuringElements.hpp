#pragma once

#include <opencv2/core/mat.hpp>

namespace warlens::vision {

//! Elliptical k x k structuring element. Kernels are created once per shape and shared (thread-safe).
cv::Mat seEllipse(int k);

//! Rectangular w x h structuring element. Kernels are created once per shape and shared (thread-safe).
cv::Mat seRect(int w, int h);

} // namespace warlens::vision
