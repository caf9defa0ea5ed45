#include "vision/structuringElements.hpp"

#include <opencv2/imgproc.hpp>

#include <map>
#include <mutex>
#include <tuple>

namespace warlens::vision {
namespace {

using KernelKey = std::tuple<int, int, int>; //!< (shape, width, height)

cv::Mat cachedKernel(int shape, int w, int h) {
	static std::map<KernelKey, cv::Mat> cache;
	static std::mutex mutex;

	const KernelKey key{shape, w, h};
	std::lock_guard<std::mutex> lock(mutex);
	auto it = cache.find(key);
	if (it == cache.end()) {
		it = cache.emplace(key, cv::getStructuringElement(shape, cv::Size(w, h))).first;
	}
	return it->second;
}

} // namespace

cv::Mat seEllipse(int k) {
	return cachedKernel(cv::MORPH_ELLIPSE, k, k);
}

cv::Mat seRect(int w, int h) {
	return cachedKernel(cv::MORPH_RECT, w, h);
}

} // namespace warlens::vision
