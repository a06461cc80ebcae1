#include "cvi/core/dimensionScorer.hpp"

#include <cmath>

namespace coastvi::cvi::core {

//! Integer value of a double if it has no fractional part.
static std::optional<int> asInteger(double value) {
	const double rounded = std::round(value);
	if (rounded != value || std::abs(rounded) > 1e9) {
		return std::nullopt;
	}
	return static_cast<int>(rounded);
}

static std::optional<double> rankAsScore(const Classification& c) {
	if (!c.rank) {
		return std::nullopt;
	}
	return static_cast<double>(*c.rank);
}

DimensionScore scoreDimension(std::optional<double> value, const DimensionTable& dimension) {
	if (!value || std::isnan(*value)) {
		return {std::nullopt, std::nullopt, noData()};
	}

	switch (dimension.mode) {
	case MatchMode::Interval: {
		Classification c = classify(value, dimension.table);
		return {value, rankAsScore(c), std::move(c)};
	}

	case MatchMode::Exact: {
		std::optional<double> score = value;
		if (!dimension.rescale.empty()) {
			score.reset();
			if (const auto raw = asInteger(*value)) {
				const auto it = dimension.rescale.find(*raw);
				if (it != dimension.rescale.end()) {
					score = static_cast<double>(it->second);
				}
			}
		}
		// A value outside every class is not scored, rescaled or not.
		Classification c = classifyExact(score, dimension.table);
		if (!c.hasData()) {
			score.reset();
		}
		return {value, score, std::move(c)};
	}

	case MatchMode::Code: {
		Classification c = classifyCode(asInteger(*value), dimension.table);
		return {value, rankAsScore(c), std::move(c)};
	}
	}

	return {value, std::nullopt, noData()};
}

std::string toString(MatchMode mode) {
	switch (mode) {
	case MatchMode::Interval:
		return "interval";
	case MatchMode::Exact:
		return "exact";
	case MatchMode::Code:
		return "codes";
	}
	return "unknown";
}

} // namespace coastvi::cvi::core
