#include "cvi/core/polyline.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace coastvi::cvi::core {
namespace gtest {

TEST(Polyline, LengthSumsSegments) {
	const Polyline line({{0.0, 0.0}, {3.0, 4.0}, {3.0, 10.0}});
	EXPECT_DOUBLE_EQ(line.length(), 11.0);
	EXPECT_EQ(line.size(), 3u);
}

TEST(Polyline, LengthOfDegenerateLines) {
	EXPECT_DOUBLE_EQ(Polyline().length(), 0.0);
	EXPECT_DOUBLE_EQ(Polyline({{5.0, 5.0}}).length(), 0.0);
	EXPECT_DOUBLE_EQ(Polyline({{5.0, 5.0}, {5.0, 5.0}}).length(), 0.0);
}

TEST(Polyline, PointAtInterpolates) {
	const Polyline line({{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}});

	const Point2D a = line.pointAt(5.0);
	EXPECT_DOUBLE_EQ(a.x, 5.0);
	EXPECT_DOUBLE_EQ(a.y, 0.0);

	const Point2D b = line.pointAt(10.0);
	EXPECT_DOUBLE_EQ(b.x, 10.0);
	EXPECT_DOUBLE_EQ(b.y, 0.0);

	const Point2D c = line.pointAt(12.5);
	EXPECT_DOUBLE_EQ(c.x, 10.0);
	EXPECT_DOUBLE_EQ(c.y, 2.5);
}

TEST(Polyline, PointAtClamps) {
	const Polyline line({{0.0, 0.0}, {10.0, 0.0}});
	EXPECT_EQ(line.pointAt(-3.0), Point2D(0.0, 0.0));
	EXPECT_EQ(line.pointAt(100.0), Point2D(10.0, 0.0));
}

TEST(Polyline, PointAtSkipsRepeatedVertices) {
	const Polyline line({{0.0, 0.0}, {4.0, 0.0}, {4.0, 0.0}, {4.0, 6.0}});
	const Point2D p = line.pointAt(7.0);
	EXPECT_DOUBLE_EQ(p.x, 4.0);
	EXPECT_DOUBLE_EQ(p.y, 3.0);
}

TEST(Polyline, ResampleEqualSteps) {
	const Polyline line({{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}});
	const Polyline resampled = line.resample(15.0, 3u);

	ASSERT_EQ(resampled.size(), 4u);
	EXPECT_DOUBLE_EQ(resampled.length(), 15.0);
	EXPECT_EQ(resampled.points()[1], Point2D(5.0, 0.0));
	EXPECT_EQ(resampled.points()[2], Point2D(10.0, 0.0));
	EXPECT_DOUBLE_EQ(resampled.points()[3].y, 5.0);
}

TEST(Polyline, ResampleClampsLengthAndSteps) {
	const Polyline line({{0.0, 0.0}, {10.0, 0.0}});

	const Polyline longer = line.resample(50.0, 2u);
	ASSERT_EQ(longer.size(), 3u);
	EXPECT_DOUBLE_EQ(longer.length(), 10.0);

	const Polyline single = line.resample(10.0, 0u);
	ASSERT_EQ(single.size(), 1u);
	EXPECT_EQ(single.points().front(), Point2D(0.0, 0.0));
}

} // namespace gtest
} // namespace coastvi::cvi::core
