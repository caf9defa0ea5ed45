#pragma once

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <string>
#include <vector>

namespace warlens::gtest {

//! Olive frame that is neither dark, bright, warm nor dialog blue.
inline cv::Mat plainFrame(int width = 600, int height = 400) {
	return cv::Mat(height, width, CV_8UC3, cv::Scalar(60, 140, 100));
}

//! Frame with black 20x24 row markers centred at x = `centerX` and the given y centres.
inline cv::Mat markerFrame(int centerX, const std::vector<int>& centersY, int width = 600, int height = 400) {
	cv::Mat frame = plainFrame(width, height);
	for (const int cy : centersY) {
		cv::rectangle(frame, cv::Rect(centerX - 10, cy - 12, 20, 24), cv::Scalar(0, 0, 0), cv::FILLED);
	}
	return frame;
}

//! Dark text on a white canvas, as found in player name crops.
inline cv::Mat textCrop(const std::string& text, cv::Size size = {300, 80}, double scale = 1.6, int thickness = 4) {
	cv::Mat image(size, CV_8UC3, cv::Scalar(255, 255, 255));
	cv::putText(image, text, cv::Point(12, size.height - 22), cv::FONT_HERSHEY_SIMPLEX, scale, cv::Scalar(20, 20, 20), thickness, cv::LINE_AA);
	return image;
}

//! `image` translated by (dx, dy) and rotated by `angleDeg` around its centre, border replicated.
inline cv::Mat shiftedRotated(const cv::Mat& image, double dx, double dy, double angleDeg) {
	cv::Mat M = cv::getRotationMatrix2D(cv::Point2f(image.cols / 2.0f, image.rows / 2.0f), angleDeg, 1.0);
	M.at<double>(0, 2) += dx;
	M.at<double>(1, 2) += dy;

	cv::Mat out;
	cv::warpAffine(image, out, M, image.size(), cv::INTER_LINEAR, cv::BORDER_REPLICATE);
	return out;
}

} // namespace warlens::gtest
