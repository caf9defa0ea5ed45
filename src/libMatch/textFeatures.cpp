#include "match/textFeatures.hpp"

#include "match/batchScope.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <cmath>

namespace warlens::match {

cv::Mat inkMask(const cv::Mat& gray, BatchScope* scope) {
	cv::Mat blurred;
	if (scope) {
		blurred = scope->gaussianBlur(gray, {3, 3});
	} else {
		cv::GaussianBlur(gray, blurred, {3, 3}, 0);
	}

	cv::Mat otsu, adaptive;
	cv::threshold(blurred, otsu, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
	cv::adaptiveThreshold(blurred, adaptive, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, 21, 8);

	cv::Mat mask;
	cv::bitwise_and(otsu, adaptive, mask);

	const cv::Mat kernel = cv::Mat::ones(2, 2, CV_8U);
	cv::morphologyEx(mask, mask, cv::MORPH_OPEN, kernel);
	cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, kernel);
	return mask;
}

double maskIou(const cv::Mat& a, const cv::Mat& b) {
	CV_Assert(a.size() == b.size());

	const cv::Mat kernel = cv::Mat::ones(1, 3, CV_8U);
	cv::Mat A, B;
	cv::dilate(a > 0, A, kernel);
	cv::dilate(b > 0, B, kernel);

	cv::Mat inter, uni;
	cv::bitwise_and(A, B, inter);
	cv::bitwise_or(A, B, uni);

	const int unionCount = cv::countNonZero(uni);
	if (unionCount == 0) {
		return 0.0;
	}
	return static_cast<double>(cv::countNonZero(inter)) / unionCount;
}

cv::Mat columnProfile(const cv::Mat& mask) {
	cv::Mat binary = mask > 0;
	cv::Mat profile;
	cv::reduce(binary, profile, 0, cv::REDUCE_SUM, CV_32F);

	const double norm = cv::norm(profile);
	if (norm > 1e-9) {
		profile /= norm;
	}
	return profile;
}

double cosine(const cv::Mat& u, const cv::Mat& v) {
	const double nu = cv::norm(u);
	const double nv = cv::norm(v);
	if (nu < 1e-9 || nv < 1e-9) {
		return 0.0;
	}
	return u.dot(v) / (nu * nv);
}

cv::Mat shiftProfile(const cv::Mat& profile, int shift) {
	const int n       = profile.cols;
	cv::Mat shifted   = cv::Mat::zeros(profile.size(), profile.type());
	const int length  = n - std::abs(shift);
	if (length <= 0) {
		return shifted;
	}

	if (shift >= 0) {
		profile.colRange(0, length).copyTo(shifted.colRange(shift, n));
	} else {
		profile.colRange(-shift, n).copyTo(shifted.colRange(0, length));
	}
	return shifted;
}

std::pair<double, int> bestShiftedCosine(const cv::Mat& a, const cv::Mat& b, int maxShift) {
	double best   = -1.0;
	int bestShift = 0;
	for (int s = -maxShift; s <= maxShift; ++s) {
		const double c = cosine(a, shiftProfile(b, s));
		if (c > best) {
			best      = c;
			bestShift = s;
		}
	}
	return {best, bestShift};
}

double coverage(const cv::Mat& mask) {
	if (mask.empty()) {
		return 0.0;
	}
	return static_cast<double>(cv::countNonZero(mask)) / static_cast<double>(mask.total());
}

} // namespace warlens::match
