#pragma once

#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <vector>

namespace warlens::vision {

//! Raised when an image file cannot be read or decoded.
class ImageReadError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/*! Decode an image file into a 3-channel BGR buffer.
 * \throws ImageReadError if the file is missing or cannot be decoded.
 */
cv::Mat readImage(const std::filesystem::path& path);

//! Same as readImage but reports failure as an empty optional. Failures are left to the caller to log.
std::optional<cv::Mat> tryReadImage(const std::filesystem::path& path);

/*! Write the crops of every row as rowNN_left.png, rowNN_mid.png and rowNN_right.png (NN counts from 01).
 * Empty crops are skipped. A crop that fails to encode is logged and skipped.
 * \param [in] directory Output directory, created if missing.
 * \param [in] rows      Rows in top to bottom order.
 * \return     Number of files written.
 * \throws     std::filesystem::filesystem_error if the directory cannot be created.
 */
std::size_t writeRowCrops(const std::filesystem::path& directory, const std::vector<RowSlice>& rows);

} // namespace warlens::vision
