#pragma once

#include <opencv2/core/mat.hpp>

#include <array>
#include <cstddef>
#include <unordered_map>

namespace warlens::match {

/*! Per-call memo of image preprocessing.
 *
 * Created at the top of one resolution call and passed down to every stage. Results are keyed by the identity of the
 * source buffer and the operation parameters. Sources are kept alive by the scope, so a buffer address cannot be reused
 * for a different image while the scope exists. Returned images are shared and must not be modified.
 */
class BatchScope {
public:
	explicit BatchScope(std::size_t limit = 1024);

	BatchScope(const BatchScope&)            = delete;
	BatchScope& operator=(const BatchScope&) = delete;

	cv::Mat cvtColor(const cv::Mat& src, int code);
	cv::Mat gaussianBlur(const cv::Mat& src, cv::Size kernel, double sigma = 0.0);
	cv::Mat resize(const cv::Mat& src, cv::Size size, int interpolation);
	//! `src * scale` converted to CV_32F.
	cv::Mat toFloat(const cv::Mat& src, double scale = 1.0);

	//! Number of memoised results over all sources.
	std::size_t size() const;
	std::size_t hits() const { return m_hits; }

private:
	enum class Op { CvtColor, GaussianBlur, Resize, ToFloat };

	struct SourceKey {
		const uchar* data;
		int rows;
		int cols;
		int type;
		std::size_t step;

		bool operator==(const SourceKey&) const = default;
	};

	struct OpKey {
		Op op;
		std::array<double, 3> params;

		bool operator==(const OpKey&) const = default;
	};

	struct SourceKeyHash {
		std::size_t operator()(const SourceKey& key) const;
	};
	struct OpKeyHash {
		std::size_t operator()(const OpKey& key) const;
	};

	struct SourceEntry {
		cv::Mat source;
		std::unordered_map<OpKey, cv::Mat, OpKeyHash> results;
	};

	template <typename Compute>
	cv::Mat memo(const cv::Mat& src, const OpKey& key, Compute&& compute);

	std::size_t m_limit;
	std::size_t m_hits = 0;
	std::unordered_map<SourceKey, SourceEntry, SourceKeyHash> m_sources;
};

} // namespace warlens::match
