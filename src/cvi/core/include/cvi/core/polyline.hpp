#pragma once

#include <opencv2/core/types.hpp>

#include <cstddef>
#include <vector>

namespace coastvi::cvi::core {

//! Planar coordinate in the projected (metric) frame.
using Point2D = cv::Point2d;

//! Ordered run of >= 2 points as delivered by the coastline source. Never modified.
using LineSegment = std::vector<Point2D>;

/*! Continuous path through an ordered list of points.
 *  Cumulative arc length is computed once on construction and used for distance queries.
 */
class Polyline {
public:
	Polyline() = default;
	explicit Polyline(std::vector<Point2D> points);

	const std::vector<Point2D>& points() const { return m_points; }
	std::size_t size() const { return m_points.size(); }
	bool empty() const { return m_points.empty(); }

	//! Total length along the path (0 for fewer than two points).
	double length() const;

	/*! Point at a given distance along the path.
	 * \param [in] distance Arc length from the first point. Clamped to [0, length()].
	 * \return     Linearly interpolated point. Default point for an empty polyline.
	 */
	Point2D pointAt(double distance) const;

	/*! Resample the first @p length units of the path at @p steps equal arc-length intervals.
	 * \param [in] length Arc length covered by the result (clamped to length()).
	 * \param [in] steps  Number of intervals. The result holds steps + 1 points (1 point if steps == 0).
	 */
	Polyline resample(double length, std::size_t steps) const;

private:
	std::vector<Point2D> m_points;     //!< Path vertices.
	std::vector<double> m_cumulative; //!< m_cumulative[i] = arc length from m_points[0] to m_points[i].
};

//! Euclidean distance between two points.
double distance(const Point2D& a, const Point2D& b);

} // namespace coastvi::cvi::core
