#include "match/alignment.hpp"

#include "Logging.hpp"
#include "match/batchScope.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/video/tracking.hpp>

#include <algorithm>
#include <format>
#include <map>
#include <mutex>

namespace warlens::match {

//! Float copy of `src`, memoised if a scope is available.
static cv::Mat asFloat(const cv::Mat& src, double scale, BatchScope* scope) {
	if (scope) {
		return scope->toFloat(src, scale);
	}
	cv::Mat dst;
	src.convertTo(dst, CV_32F, scale);
	return dst;
}

//! Hann windows are reused between calls of the same size.
static cv::Mat hannWindow(cv::Size size) {
	static std::mutex mutex;
	static std::map<std::pair<int, int>, cv::Mat> windows;

	std::lock_guard<std::mutex> lock(mutex);
	auto& window = windows[{size.width, size.height}];
	if (window.empty()) {
		cv::createHanningWindow(window, size, CV_32F);
	}
	return window;
}

static int motionType(MotionKind kind) {
	switch (kind) {
	case MotionKind::Translation: return cv::MOTION_TRANSLATION;
	case MotionKind::Affine: return cv::MOTION_AFFINE;
	case MotionKind::Euclidean: break;
	}
	return cv::MOTION_EUCLIDEAN;
}

double ncc(const cv::Mat& a, const cv::Mat& b, BatchScope* scope) {
	CV_Assert(a.size() == b.size());

	const cv::Mat fa = asFloat(a, 1.0, scope);
	const cv::Mat fb = asFloat(b, 1.0, nullptr);
	const cv::Mat A  = fa - cv::mean(fa);
	const cv::Mat B  = fb - cv::mean(fb);

	const double denom = cv::norm(A) * cv::norm(B) + 1e-12;
	return A.dot(B) / denom;
}

cv::Mat cropCenter(const cv::Mat& gray, double frac) {
	const double f = std::clamp(frac, 0.1, 1.0);
	const int w    = static_cast<int>(gray.cols * f);
	const int h    = static_cast<int>(gray.rows * f);
	const int x1   = (gray.cols - w) / 2;
	const int y1   = (gray.rows - h) / 2;
	return gray(cv::Rect(x1, y1, w, h));
}

cv::Mat sobelMagnitude(const cv::Mat& gray) {
	cv::Mat g;
	gray.convertTo(g, CV_32F);

	cv::Mat gx, gy, mag;
	cv::Sobel(g, gx, CV_32F, 1, 0, 3);
	cv::Sobel(g, gy, CV_32F, 0, 1, 3);
	cv::magnitude(gx, gy, mag);

	cv::Scalar mean, stddev;
	cv::meanStdDev(mag, mean, stddev);
	return mag / (stddev[0] + 1e-6);
}

cv::Mat rotateGray(const cv::Mat& gray, double angleDeg) {
	const cv::Mat M = cv::getRotationMatrix2D(cv::Point2f(gray.cols / 2.0f, gray.rows / 2.0f), angleDeg, 1.0);
	cv::Mat rotated;
	cv::warpAffine(gray, rotated, M, gray.size(), cv::INTER_LINEAR, cv::BORDER_REPLICATE);
	return rotated;
}

cv::Mat rotateGrayCached(const cv::Mat& gray, double angleDeg, RotationCache& cache) {
	const RotationKey key{gray.data, angleDeg};
	if (const auto hit = cache.get(key); hit && hit->source.size() == gray.size()) {
		return hit->rotated;
	}

	cv::Mat rotated = rotateGray(gray, angleDeg);
	cache.put(key, RotatedImage{gray, rotated});
	return rotated;
}

PhaseAlignment phaseAlign(const cv::Mat& reference, const cv::Mat& moving, BatchScope* scope) {
	const cv::Mat ref = asFloat(reference, 1.0, scope);
	const cv::Mat mov = asFloat(moving, 1.0, scope);

	// moving(x) ~ reference(x - d): sample moving at x + d to bring it back onto the reference.
	const cv::Point2d d = cv::phaseCorrelate(ref, mov, hannWindow(ref.size()));

	const cv::Mat M = (cv::Mat_<double>(2, 3) << 1, 0, d.x, 0, 1, d.y);
	PhaseAlignment result;
	cv::warpAffine(moving, result.aligned, M, moving.size(), cv::INTER_LINEAR | cv::WARP_INVERSE_MAP, cv::BORDER_REPLICATE);
	result.dx = d.x;
	result.dy = d.y;
	return result;
}

std::optional<EccAlignment> eccAlign(const cv::Mat& reference, const cv::Mat& moving, MotionKind motion, int maxIter, double eps, int gaussSize,
                                     BatchScope* scope) {
	const cv::Mat ref = asFloat(reference, 1.0 / 255.0, scope);
	const cv::Mat mov = asFloat(moving, 1.0 / 255.0, scope);

	cv::Mat warp = cv::Mat::eye(2, 3, CV_32F);
	const cv::TermCriteria criteria(cv::TermCriteria::COUNT | cv::TermCriteria::EPS, maxIter, eps);

	EccAlignment result;
	try {
		result.correlation = cv::findTransformECC(ref, mov, warp, motionType(motion), criteria, cv::noArray(), gaussSize);
	} catch (const cv::Exception& e) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Alignment] ECC ({}, gauss {}) failed: {}", toString(motion), gaussSize, e.err));
		return std::nullopt;
	}

	cv::warpAffine(moving, result.aligned, warp, reference.size(), cv::INTER_LINEAR | cv::WARP_INVERSE_MAP, cv::BORDER_REPLICATE);
	return result;
}

} // namespace warlens::match
