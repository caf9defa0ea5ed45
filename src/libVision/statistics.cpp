#include "statistics.hpp"

#include <algorithm>
#include <numeric>

namespace warlens::vision {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double median(std::vector<double> values) {
	if (values.empty()) {
		return 0.0;
	}

	std::sort(values.begin(), values.end());
	const auto n = values.size();
	if (n % 2u == 1u) {
		return values[n / 2];
	}
	return 0.5 * (values[n / 2 - 1] + values[n / 2]);
}

double trimmedMedian(std::vector<double> values) {
	if (values.size() < 4u) {
		return median(std::move(values));
	}

	std::sort(values.begin(), values.end());
	const auto k = std::max<std::size_t>(1u, values.size() / 4u);
	return median(std::vector<double>(values.begin() + static_cast<std::ptrdiff_t>(k), values.end() - static_cast<std::ptrdiff_t>(k)));
}

std::vector<double> consecutiveGaps(const std::vector<double>& v) {
	std::vector<double> gaps;
	if (v.size() < 2u) {
		return gaps;
	}
	gaps.reserve(v.size() - 1);
	for (std::size_t i = 1; i < v.size(); ++i) {
		gaps.push_back(v[i] - v[i - 1]);
	}
	return gaps;
}

} // namespace warlens::vision
