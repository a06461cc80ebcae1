#include "cvi/assessment.hpp"
#include "cvi/core/errors.hpp"
#include "cvi/core/thresholdConfig.hpp"
#include "cvi/geoJson.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

namespace coastvi::cvi {
namespace gtest {

static const std::filesystem::path DATA = std::filesystem::path(PATH_TEST_DATA);

static core::SamplingParams defaultParams() {
	return {50.0, 400.0, 15000.0};
}

TEST(Assessment, TransectsFromCoastlineFile) {
	Assessment assessment;
	const core::TransectSet& transects = assessment.generateTransects(readCoastline(DATA / "coastline.geojson"), defaultParams());

	// Three input lines, one flipped, form a straight 400 m coast.
	ASSERT_EQ(assessment.coastline().size(), 5u);
	EXPECT_DOUBLE_EQ(assessment.coastline().length(), 400.0);
	EXPECT_DOUBLE_EQ(assessment.processedLength(), 400.0);

	ASSERT_EQ(transects.size(), 9u);
	EXPECT_EQ(transects.records().front().transect.label, "T1");
	EXPECT_EQ(transects.records().back().transect.label, "T9");
	EXPECT_NEAR(transects.records().back().transect.distance, 400.0, 1e-9);
}

TEST(Assessment, ProcessedLengthIsCapped) {
	Assessment assessment;
	assessment.generateTransects({{{0.0, 0.0}, {1000.0, 0.0}}}, {100.0, 50.0, 250.0});

	EXPECT_DOUBLE_EQ(assessment.processedLength(), 250.0);
	EXPECT_DOUBLE_EQ(assessment.coastline().length(), 1000.0);
	EXPECT_EQ(assessment.transects().size(), 3u);
}

TEST(Assessment, EmptyCoastlineThrows) {
	Assessment assessment;
	EXPECT_THROW(assessment.generateTransects({}, defaultParams()), core::EmptyInputError);
}

TEST(Assessment, JoinMissesAreCounted) {
	core::DebugVisualizer debugger;
	Assessment assessment(&debugger);
	assessment.generateTransects({{{0.0, 0.0}, {100.0, 0.0}}}, defaultParams());

	const std::size_t joined = assessment.attachScores("slope", {{"T1", 2.0}, {"T2", std::nullopt}, {"T42", 5.0}, {"X", 1.0}});
	EXPECT_EQ(joined, 2u);
	EXPECT_EQ(assessment.transects().size(), 3u);

	const std::string report = debugger.buildReport();
	EXPECT_NE(report.find("Joined: 2 of 3 transects"), std::string::npos);
	EXPECT_NE(report.find("Unknown Labels: 2 ignored (T42, X)"), std::string::npos);
}

TEST(Assessment, FullIndexComputation) {
	const core::IndexConfig config = core::loadIndexConfig(DATA / "config.json");

	core::DebugVisualizer debugger;
	Assessment assessment(&debugger);
	assessment.generateTransects(readCoastline(DATA / "coastline.geojson"), defaultParams());

	assessment.attachValues(*config.findDimension("land_cover"), {{"T1", 50.0}, {"T2", 10.0}});
	assessment.attachValues(*config.findDimension("slope"), {{"T1", 1.0}, {"T2", 13.0}});
	assessment.attachValues(*config.findDimension("erosion"), {{"T1", 3.0}, {"T2", 1.0}});
	assessment.attachValues(*config.findDimension("elevation"), {{"T1", 1.0}, {"T2", 25.0}});
	assessment.attachScores("wave_exposure", {{"T3", 4.0}});

	const std::vector<core::CompositeRecord> index = assessment.computeIndex(config.composite);
	ASSERT_EQ(index.size(), 9u);

	// T1: all four configured dimensions score 5. wave_exposure is absent for T1 and skipped.
	EXPECT_DOUBLE_EQ(*index[0].raw, std::sqrt(625.0 / 4.0));
	EXPECT_EQ(index[0].classification.label, "Very High");
	EXPECT_DOUBLE_EQ(*index[0].normalized, 1.0);

	// T2: 2 * 1 * 1 * 1 over four scores.
	EXPECT_DOUBLE_EQ(*index[1].raw, std::sqrt(0.5));
	EXPECT_EQ(index[1].classification.label, "Very Low");
	EXPECT_DOUBLE_EQ(*index[1].normalized, 0.0);

	// T3: a single ready-made score.
	EXPECT_DOUBLE_EQ(*index[2].raw, 2.0);
	EXPECT_EQ(index[2].classification.label, "Low");

	// Nothing attached.
	EXPECT_FALSE(index[3].raw.has_value());
	EXPECT_EQ(index[3].classification.color, "gray");

	const core::TransectRecord* t1 = assessment.transects().find("T1");
	ASSERT_NE(t1, nullptr);
	ASSERT_TRUE(t1->composite.has_value());
	EXPECT_EQ(t1->composite->classification.color, "#d73027");
	EXPECT_EQ(t1->dimensions.at("slope").classification.label, "Very flat");
	EXPECT_DOUBLE_EQ(*t1->scores.at("erosion"), 5.0);

	EXPECT_FALSE(debugger.buildMosaic().empty());
}

TEST(Assessment, ReusesTransectsFromEarlierRun) {
	Assessment assessment;
	assessment.setTransects({{"A", {0.0, 0.0}, {0.0, 1.0}, 0u, 0.0}, {"B", {1.0, 0.0}, {1.0, 1.0}, 1u, 1.0}}, 1.0);
	assessment.attachScores("slope", {{"B", 3.0}});

	const auto index = assessment.computeIndex(core::ThresholdTable({{1, 0.0, 10.0, "Any", "green"}}));
	ASSERT_EQ(index.size(), 2u);
	EXPECT_FALSE(index[0].raw.has_value());
	EXPECT_DOUBLE_EQ(*index[1].raw, std::sqrt(3.0));
	EXPECT_DOUBLE_EQ(assessment.processedLength(), 1.0);
}

} // namespace gtest
} // namespace coastvi::cvi
