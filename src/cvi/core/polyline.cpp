#include "cvi/core/polyline.hpp"

#include <algorithm>
#include <cmath>

namespace coastvi::cvi::core {

double distance(const Point2D& a, const Point2D& b) {
	return std::hypot(b.x - a.x, b.y - a.y);
}

Polyline::Polyline(std::vector<Point2D> points) : m_points(std::move(points)) {
	m_cumulative.reserve(m_points.size());

	double total = 0.0;
	for (std::size_t i = 0; i < m_points.size(); ++i) {
		if (i > 0) {
			total += distance(m_points[i - 1], m_points[i]);
		}
		m_cumulative.push_back(total);
	}
}

double Polyline::length() const {
	return m_cumulative.empty() ? 0.0 : m_cumulative.back();
}

Point2D Polyline::pointAt(double distance) const {
	if (m_points.empty()) {
		return {};
	}
	if (distance <= 0.0 || m_points.size() == 1u) {
		return m_points.front();
	}
	if (distance >= length()) {
		return m_points.back();
	}

	// First vertex strictly beyond the requested distance. Exists since distance < length().
	const auto it         = std::upper_bound(m_cumulative.begin(), m_cumulative.end(), distance);
	const std::size_t hi  = static_cast<std::size_t>(std::distance(m_cumulative.begin(), it));
	const std::size_t lo  = hi - 1u;
	const double segStart = m_cumulative[lo];
	const double segLen   = m_cumulative[hi] - segStart;
	if (segLen <= 0.0) {
		return m_points[lo];
	}

	const double t = (distance - segStart) / segLen;
	return m_points[lo] + (m_points[hi] - m_points[lo]) * t;
}

Polyline Polyline::resample(double length, std::size_t steps) const {
	if (m_points.empty()) {
		return {};
	}

	const double span = std::clamp(length, 0.0, this->length());
	if (steps == 0u) {
		return Polyline({pointAt(0.0)});
	}

	std::vector<Point2D> samples;
	samples.reserve(steps + 1u);
	for (std::size_t k = 0; k <= steps; ++k) {
		const double d = span * static_cast<double>(k) / static_cast<double>(steps);
		samples.push_back(pointAt(d));
	}
	return Polyline(std::move(samples));
}

} // namespace coastvi::cvi::core
