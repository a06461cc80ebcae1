#include "cvi/core/overlay.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <opencv2/imgproc.hpp>

namespace coastvi::cvi::core::debugging {

namespace {

static constexpr int CANVAS_SIZE = 800; //!< Canvas width and height (px).
static constexpr int MARGIN      = 20;  //!< Empty border around the drawing (px).

//! Maps world coordinates (metres, y up) into canvas pixels (y down).
struct CanvasMapping {
	double minX{0.0};
	double maxY{0.0};
	double scale{1.0};

	cv::Point operator()(const Point2D& p) const {
		return {MARGIN + static_cast<int>(std::lround((p.x - minX) * scale)), MARGIN + static_cast<int>(std::lround((maxY - p.y) * scale))};
	}
};

static CanvasMapping fitCanvas(const std::vector<Point2D>& points) {
	double minX = std::numeric_limits<double>::max(), minY = std::numeric_limits<double>::max();
	double maxX = std::numeric_limits<double>::lowest(), maxY = std::numeric_limits<double>::lowest();
	for (const auto& p: points) {
		minX = std::min(minX, p.x);
		minY = std::min(minY, p.y);
		maxX = std::max(maxX, p.x);
		maxY = std::max(maxY, p.y);
	}

	CanvasMapping mapping{};
	if (points.empty()) {
		return mapping;
	}

	const double extent = std::max(maxX - minX, maxY - minY);
	mapping.minX        = minX;
	mapping.maxY        = maxY;
	mapping.scale       = extent > 0.0 ? static_cast<double>(CANVAS_SIZE - 2 * MARGIN) / extent : 1.0;
	return mapping;
}

static int hexDigit(char c) {
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

} // namespace

cv::Scalar toScalar(const std::string& color) {
	static const cv::Scalar GRAY(128, 128, 128);

	if (color.size() == 7u && color[0] == '#') {
		int rgb[3];
		for (int i = 0; i < 3; ++i) {
			const int hi = hexDigit(color[1 + 2 * i]);
			const int lo = hexDigit(color[2 + 2 * i]);
			if (hi < 0 || lo < 0) {
				return GRAY;
			}
			rgb[i] = hi * 16 + lo;
		}
		return {static_cast<double>(rgb[2]), static_cast<double>(rgb[1]), static_cast<double>(rgb[0])};
	}

	if (color == "green")
		return {0, 160, 0};
	if (color == "yellow")
		return {0, 220, 220};
	if (color == "orange")
		return {0, 140, 255};
	if (color == "red")
		return {0, 0, 220};
	if (color == "darkred")
		return {0, 0, 139};
	return GRAY;
}

cv::Mat drawOverlay(const Polyline& coastline, const std::vector<Transect>& transects, const std::vector<std::string>& colors) {
	std::vector<Point2D> all = coastline.points();
	for (const auto& t: transects) {
		all.push_back(t.start);
		all.push_back(t.end);
	}

	cv::Mat canvas(CANVAS_SIZE, CANVAS_SIZE, CV_8UC3, cv::Scalar(30, 30, 30));
	if (all.empty()) {
		return canvas;
	}
	const CanvasMapping toPx = fitCanvas(all);

	std::vector<cv::Point> path;
	path.reserve(coastline.size());
	for (const auto& p: coastline.points()) {
		path.push_back(toPx(p));
	}
	if (path.size() > 1u) {
		cv::polylines(canvas, path, false, cv::Scalar(255, 255, 255), 2, cv::LINE_AA);
	}

	const bool perTransect = colors.size() == transects.size();
	for (std::size_t i = 0; i < transects.size(); ++i) {
		const cv::Scalar col = perTransect ? toScalar(colors[i]) : cv::Scalar(255, 160, 0);
		cv::line(canvas, toPx(transects[i].start), toPx(transects[i].end), col, 1, cv::LINE_AA);
	}

	return canvas;
}

cv::Mat drawSegments(const std::vector<LineSegment>& segments) {
	std::vector<Point2D> all;
	for (const auto& s: segments) {
		all.insert(all.end(), s.begin(), s.end());
	}

	cv::Mat canvas(CANVAS_SIZE, CANVAS_SIZE, CV_8UC3, cv::Scalar(30, 30, 30));
	if (all.empty()) {
		return canvas;
	}
	const CanvasMapping toPx = fitCanvas(all);

	// One hue per segment, spread evenly over the OpenCV hue range [0, 180).
	cv::Mat hsv(1, static_cast<int>(segments.size()), CV_8UC3);
	for (int i = 0; i < hsv.cols; ++i) {
		hsv.at<cv::Vec3b>(0, i) = cv::Vec3b(static_cast<uchar>((i * 180) / std::max(1, hsv.cols)), 255, 255);
	}
	cv::Mat bgr;
	cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);

	for (std::size_t i = 0; i < segments.size(); ++i) {
		std::vector<cv::Point> path;
		for (const auto& p: segments[i]) {
			path.push_back(toPx(p));
		}
		const cv::Vec3b c = bgr.at<cv::Vec3b>(0, static_cast<int>(i));
		cv::polylines(canvas, path, false, cv::Scalar(c[0], c[1], c[2]), 2, cv::LINE_AA);
		if (!path.empty()) {
			cv::circle(canvas, path.front(), 3, cv::Scalar(c[0], c[1], c[2]), cv::FILLED);
		}
	}

	return canvas;
}

} // namespace coastvi::cvi::core::debugging
