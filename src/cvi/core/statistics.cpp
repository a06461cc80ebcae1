#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>

namespace coastvi::cvi::core {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	};
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double median(std::vector<double> values) {
	if (values.empty()) {
		return 0.0;
	}

	const std::size_t n   = values.size();
	const std::size_t mid = n / 2;

	std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
	double m = values[mid];

	if (n % 2 == 0) {
		std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid) - 1, values.end());
		m = 0.5 * (m + values[mid - 1]);
	}

	return m;
}

double product(const std::vector<double>& v) {
	return std::accumulate(v.begin(), v.end(), 1.0, std::multiplies<>());
}

std::vector<double> presentValues(const std::vector<std::optional<double>>& v) {
	std::vector<double> out;
	out.reserve(v.size());
	for (const auto& x: v) {
		if (x && !std::isnan(*x)) {
			out.push_back(*x);
		}
	}
	return out;
}

std::optional<std::pair<double, double>> presentMinMax(const std::vector<std::optional<double>>& v) {
	const std::vector<double> present = presentValues(v);
	if (present.empty()) {
		return std::nullopt;
	}

	const auto [lo, hi] = std::minmax_element(present.begin(), present.end());
	return std::make_pair(*lo, *hi);
}

} // namespace coastvi::cvi::core
