#include "vision/colorPlanes.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace warlens::vision {

ColorPlanes prepareColorPlanes(const cv::Mat& bgr) {
	ColorPlanes planes;
	cv::cvtColor(bgr, planes.hsv, cv::COLOR_BGR2HSV);
	cv::cvtColor(bgr, planes.lab, cv::COLOR_BGR2Lab);
	cv::extractChannel(planes.lab, planes.L, 0);
	cv::extractChannel(planes.lab, planes.a, 1);
	cv::extractChannel(planes.lab, planes.b, 2);

	cv::cvtColor(bgr, planes.gray, cv::COLOR_BGR2GRAY);
	planes.gradMag = gradientMagnitude(planes.gray);
	return planes;
}

cv::Mat gradientMagnitude(const cv::Mat& gray) {
	cv::Mat gx;
	cv::Mat gy;
	cv::Sobel(gray, gx, CV_32F, 1, 0, 3);
	cv::Sobel(gray, gy, CV_32F, 0, 1, 3);

	cv::Mat mag;
	cv::magnitude(gx, gy, mag);
	return mag;
}

cv::Mat chromaSquared(const cv::Mat& a, const cv::Mat& b) {
	cv::Mat da;
	cv::Mat db;
	cv::absdiff(a, cv::Scalar(128), da);
	cv::absdiff(b, cv::Scalar(128), db);
	da.convertTo(da, CV_32F);
	db.convertTo(db, CV_32F);
	return da.mul(da) + db.mul(db);
}

} // namespace warlens::vision
