#include "cvi/core/errors.hpp"
#include "cvi/core/transectSampler.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace coastvi::cvi::core {
namespace gtest {

static constexpr double EPS = 1e-9;

static Point2D centre(const Transect& t) {
	return (t.start + t.end) * 0.5;
}

TEST(TransectSampler, UsableLengthIsCapped) {
	const Polyline shortLine({{0.0, 0.0}, {12000.0, 0.0}});
	const Polyline longLine({{0.0, 0.0}, {20000.0, 0.0}});

	EXPECT_DOUBLE_EQ(usableLength(shortLine, 15000.0), 12000.0);
	EXPECT_DOUBLE_EQ(usableLength(longLine, 15000.0), 15000.0);
}

TEST(TransectSampler, StraightLineThreeTransects) {
	const Polyline line({{0.0, 0.0}, {100.0, 0.0}});
	const std::vector<Transect> transects = sampleTransects(line, {50.0, 400.0, 1000.0});

	ASSERT_EQ(transects.size(), 3u);
	const double expected[] = {0.0, 50.0, 100.0};
	for (std::size_t i = 0; i < transects.size(); ++i) {
		const Transect& t = transects[i];
		EXPECT_EQ(t.label, "T" + std::to_string(i + 1u));
		EXPECT_EQ(t.index, i);
		EXPECT_NEAR(t.distance, expected[i], EPS);

		const Point2D c = centre(t);
		EXPECT_NEAR(c.x, expected[i], EPS);
		EXPECT_NEAR(c.y, 0.0, EPS);

		// Full length and perpendicular to the (x-axis) coastline.
		const Point2D d = t.end - t.start;
		EXPECT_NEAR(std::hypot(d.x, d.y), 400.0, EPS);
		EXPECT_NEAR(d.x * 1.0 + d.y * 0.0, 0.0, EPS);
	}
}

TEST(TransectSampler, NormalPointsLeftOfTravelDirection) {
	const Polyline line({{0.0, 0.0}, {100.0, 0.0}});
	const std::vector<Transect> transects = sampleTransects(line, {50.0, 10.0, 1000.0});

	ASSERT_FALSE(transects.empty());
	EXPECT_NEAR(transects[0].start.y, -5.0, EPS);
	EXPECT_NEAR(transects[0].end.y, 5.0, EPS);
}

TEST(TransectSampler, OnlyProcessedLengthIsSampled) {
	const Polyline line({{0.0, 0.0}, {1000.0, 0.0}});
	const std::vector<Transect> transects = sampleTransects(line, {50.0, 100.0, 120.0});

	ASSERT_EQ(transects.size(), 3u);
	EXPECT_NEAR(centre(transects.back()).x, 100.0, EPS);
}

TEST(TransectSampler, CoastlineShorterThanSpacing) {
	const Polyline line({{0.0, 0.0}, {0.0, 30.0}});
	const std::vector<Transect> transects = sampleTransects(line, {50.0, 20.0, 1000.0});

	ASSERT_EQ(transects.size(), 1u);
	EXPECT_NEAR(transects[0].start.x, 10.0, EPS);
	EXPECT_NEAR(transects[0].end.x, -10.0, EPS);
}

TEST(TransectSampler, FollowsBends) {
	// L-shaped coast: 100 m east, then 100 m north.
	const Polyline line({{0.0, 0.0}, {100.0, 0.0}, {100.0, 100.0}});
	const std::vector<Transect> transects = sampleTransects(line, {50.0, 10.0, 1000.0});

	ASSERT_EQ(transects.size(), 5u);
	const Transect& north = transects[3]; // at (100, 50)
	EXPECT_NEAR(centre(north).x, 100.0, EPS);
	EXPECT_NEAR(centre(north).y, 50.0, EPS);
	EXPECT_NEAR(north.end.y - north.start.y, 0.0, EPS);
	EXPECT_NEAR(std::abs(north.end.x - north.start.x), 10.0, EPS);
}

TEST(TransectSampler, ZeroLengthCoastlineYieldsNoTransects) {
	DebugVisualizer debugger;
	const Polyline line({{5.0, 5.0}, {5.0, 5.0}});
	const std::vector<Transect> transects = sampleTransects(line, {50.0, 400.0, 1000.0}, &debugger);

	EXPECT_TRUE(transects.empty());
	EXPECT_NE(debugger.buildReport().find("Skipped"), std::string::npos);
}

TEST(TransectSampler, LabelsAreUnique) {
	const Polyline line({{0.0, 0.0}, {300.0, 40.0}, {650.0, -20.0}});
	const std::vector<Transect> transects = sampleTransects(line, {25.0, 50.0, 1000.0});

	ASSERT_FALSE(transects.empty());
	for (std::size_t i = 0; i < transects.size(); ++i) {
		EXPECT_EQ(transects[i].label, "T" + std::to_string(i + 1u));
	}
}

TEST(TransectSampler, InvalidParametersThrow) {
	const Polyline line({{0.0, 0.0}, {100.0, 0.0}});
	const double nan = std::numeric_limits<double>::quiet_NaN();

	EXPECT_THROW(sampleTransects(line, {0.0, 400.0, 1000.0}), InputError);
	EXPECT_THROW(sampleTransects(line, {-50.0, 400.0, 1000.0}), InputError);
	EXPECT_THROW(sampleTransects(line, {50.0, 0.0, 1000.0}), InputError);
	EXPECT_THROW(sampleTransects(line, {50.0, 400.0, -1.0}), InputError);
	EXPECT_THROW(sampleTransects(line, {nan, 400.0, 1000.0}), InputError);
}

TEST(TransectSampler, SinglePointCoastlineThrows) {
	EXPECT_THROW(sampleTransects(Polyline({{1.0, 1.0}}), {50.0, 400.0, 1000.0}), InputError);
}

} // namespace gtest
} // namespace coastvi::cvi::core
