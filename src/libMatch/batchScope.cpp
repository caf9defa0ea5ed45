#include "match/batchScope.hpp"

#include "match/cache.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <functional>

namespace warlens::match {

std::size_t BatchScope::SourceKeyHash::operator()(const SourceKey& key) const {
	std::size_t seed = std::hash<const void*>{}(key.data);
	hashCombine(seed, std::hash<int>{}(key.rows));
	hashCombine(seed, std::hash<int>{}(key.cols));
	hashCombine(seed, std::hash<int>{}(key.type));
	hashCombine(seed, std::hash<std::size_t>{}(key.step));
	return seed;
}

std::size_t BatchScope::OpKeyHash::operator()(const OpKey& key) const {
	std::size_t seed = std::hash<int>{}(static_cast<int>(key.op));
	for (const double p : key.params) {
		hashCombine(seed, std::hash<double>{}(p));
	}
	return seed;
}

BatchScope::BatchScope(std::size_t limit) : m_limit(std::max<std::size_t>(1, limit)) {
}

template <typename Compute>
cv::Mat BatchScope::memo(const cv::Mat& src, const OpKey& key, Compute&& compute) {
	if (src.empty()) {
		return compute();
	}

	auto& entry = m_sources[SourceKey{src.data, src.rows, src.cols, src.type(), src.step[0]}];
	if (entry.source.empty()) {
		entry.source = src;
	}

	if (const auto it = entry.results.find(key); it != entry.results.end()) {
		++m_hits;
		return it->second;
	}

	if (entry.results.size() >= m_limit) {
		entry.results.clear();
	}
	cv::Mat result = compute();
	entry.results.emplace(key, result);
	return result;
}

cv::Mat BatchScope::cvtColor(const cv::Mat& src, int code) {
	return memo(src, {Op::CvtColor, {static_cast<double>(code), 0.0, 0.0}}, [&] {
		cv::Mat dst;
		cv::cvtColor(src, dst, code);
		return dst;
	});
}

cv::Mat BatchScope::gaussianBlur(const cv::Mat& src, cv::Size kernel, double sigma) {
	return memo(src, {Op::GaussianBlur, {static_cast<double>(kernel.width), static_cast<double>(kernel.height), sigma}}, [&] {
		cv::Mat dst;
		cv::GaussianBlur(src, dst, kernel, sigma);
		return dst;
	});
}

cv::Mat BatchScope::resize(const cv::Mat& src, cv::Size size, int interpolation) {
	return memo(src, {Op::Resize, {static_cast<double>(size.width), static_cast<double>(size.height), static_cast<double>(interpolation)}}, [&] {
		cv::Mat dst;
		cv::resize(src, dst, size, 0, 0, interpolation);
		return dst;
	});
}

cv::Mat BatchScope::toFloat(const cv::Mat& src, double scale) {
	return memo(src, {Op::ToFloat, {scale, 0.0, 0.0}}, [&] {
		cv::Mat dst;
		src.convertTo(dst, CV_32F, scale);
		return dst;
	});
}

std::size_t BatchScope::size() const {
	std::size_t total = 0;
	for (const auto& [key, entry] : m_sources) {
		total += entry.results.size();
	}
	return total;
}

} // namespace warlens::match
