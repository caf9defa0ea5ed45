#pragma once

#include <vector>

namespace warlens::vision {

double mean(const std::vector<double>& v);

//! Median with averaging of the two central values for even sizes. Returns 0 for empty input.
double median(std::vector<double> values);

//! Median after dropping a quarter of the sorted values at each end (only when there are at least 4 values).
double trimmedMedian(std::vector<double> values);

//! Differences between neighbouring values (size = v.size() - 1).
std::vector<double> consecutiveGaps(const std::vector<double>& v);

} // namespace warlens::vision
