#include "cvi/core/compositeScorer.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace coastvi::cvi::core {
namespace gtest {

static constexpr double INF = std::numeric_limits<double>::infinity();

static ScoreRecord record(std::string label, std::vector<std::optional<double>> scores) {
	static const char* DIMENSIONS[] = {"land_cover", "slope", "erosion", "elevation"};

	ScoreRecord r{std::move(label), {}};
	for (std::size_t i = 0; i < scores.size() && i < 4u; ++i) {
		r.scores[DIMENSIONS[i]] = scores[i];
	}
	return r;
}

static ThresholdTable compositeTable() {
	return ThresholdTable({
	        {1, -INF, 1.5, "Low", "#1a9850"},
	        {2, 1.5, 3.0, "Moderate", "#fee08b"},
	        {3, 3.0, INF, "High", "#d73027"},
	});
}

TEST(CompositeScorer, ProductOverCount) {
	const auto value = compositeValue(record("T1", {1.0, 2.0, 3.0, 4.0}));
	ASSERT_TRUE(value.has_value());
	EXPECT_DOUBLE_EQ(*value, std::sqrt(6.0));
}

TEST(CompositeScorer, MissingScoresAreSkipped) {
	// Only present scores enter product and count: sqrt(2 * 5 / 2).
	const auto value = compositeValue(record("T1", {2.0, std::nullopt, 5.0, std::nullopt}));
	ASSERT_TRUE(value.has_value());
	EXPECT_DOUBLE_EQ(*value, std::sqrt(5.0));
}

TEST(CompositeScorer, NoScoresIsAbsent) {
	EXPECT_FALSE(compositeValue(record("T1", {})).has_value());
	EXPECT_FALSE(compositeValue(record("T1", {std::nullopt, std::nullopt})).has_value());
}

TEST(CompositeScorer, NegativeProductIsAbsent) {
	EXPECT_FALSE(compositeValue(record("T1", {-2.0, 3.0})).has_value());
	EXPECT_FALSE(compositeValue(record("T1", {INF, 3.0})).has_value());
	// Two negative scores multiply to a positive value.
	EXPECT_DOUBLE_EQ(*compositeValue(record("T1", {-2.0, -3.0, 1.0})), std::sqrt(2.0));

	const std::vector<CompositeRecord> records = scoreComposite({record("T1", {-2.0, 3.0}), record("T2", {2.0, 2.0})}, compositeTable());
	ASSERT_EQ(records.size(), 2u);
	EXPECT_FALSE(records[0].raw.has_value());
	EXPECT_FALSE(records[0].normalized.has_value());
	EXPECT_FALSE(records[0].classification.hasData());
	EXPECT_DOUBLE_EQ(*records[1].normalized, 0.0);
}

TEST(CompositeScorer, NormalizeMinMax) {
	const auto normalized = normalizeMinMax({1.0, 3.0});
	ASSERT_EQ(normalized.size(), 2u);
	EXPECT_DOUBLE_EQ(*normalized[0], 0.0);
	EXPECT_DOUBLE_EQ(*normalized[1], 1.0);

	const auto middle = normalizeMinMax({2.0, std::nullopt, 4.0, 3.0});
	EXPECT_DOUBLE_EQ(*middle[3], 0.5);
	EXPECT_FALSE(middle[1].has_value());
}

TEST(CompositeScorer, EqualValuesNormalizeToZero) {
	for (const auto& normalized: {normalizeMinMax({2.5, 2.5, 2.5}), normalizeMinMax({7.0})}) {
		for (const auto& v: normalized) {
			ASSERT_TRUE(v.has_value());
			EXPECT_DOUBLE_EQ(*v, 0.0);
		}
	}
}

TEST(CompositeScorer, AllAbsentStaysAbsent) {
	const auto normalized = normalizeMinMax({std::nullopt, std::nullopt});
	ASSERT_EQ(normalized.size(), 2u);
	EXPECT_FALSE(normalized[0].has_value());
	EXPECT_FALSE(normalized[1].has_value());
}

TEST(CompositeScorer, ClassifiesRawValue) {
	DebugVisualizer debugger;
	const std::vector<ScoreRecord> records{
	        record("T1", {1.0, 1.0, 1.0, 1.0}),     // sqrt(1/4) = 0.5
	        record("T2", {2.0, 2.0, 2.0, 2.0}),     // sqrt(16/4) = 2
	        record("T3", {5.0, 5.0, 5.0, 5.0}),     // sqrt(625/4) = 12.5
	        record("T4", {std::nullopt, std::nullopt}),
	};

	const std::vector<CompositeRecord> out = scoreComposite(records, compositeTable(), &debugger);
	ASSERT_EQ(out.size(), 4u);

	EXPECT_EQ(out[0].label, "T1");
	EXPECT_DOUBLE_EQ(*out[0].raw, 0.5);
	EXPECT_DOUBLE_EQ(*out[0].normalized, 0.0);
	EXPECT_EQ(out[0].classification.label, "Low");

	EXPECT_DOUBLE_EQ(*out[1].raw, 2.0);
	EXPECT_DOUBLE_EQ(*out[1].normalized, 1.5 / 12.0);
	EXPECT_EQ(out[1].classification.label, "Moderate");

	EXPECT_DOUBLE_EQ(*out[2].normalized, 1.0);
	EXPECT_EQ(out[2].classification.rank, 3);

	EXPECT_FALSE(out[3].raw.has_value());
	EXPECT_FALSE(out[3].normalized.has_value());
	EXPECT_EQ(out[3].classification.label, "No Data");
	EXPECT_EQ(out[3].classification.color, "gray");

	ASSERT_EQ(debugger.stages().size(), 1u);
	EXPECT_EQ(debugger.stages().front().name, "Composite Index");
}

} // namespace gtest
} // namespace coastvi::cvi::core
