#include "cvi/core/compositeScorer.hpp"

#include "statistics.hpp"

#include <cmath>
#include <string>

namespace coastvi::cvi::core {

std::optional<double> compositeValue(const ScoreRecord& record) {
	std::vector<std::optional<double>> scores;
	scores.reserve(record.scores.size());
	for (const auto& [dimension, score]: record.scores) {
		scores.push_back(score);
	}

	const std::vector<double> present = presentValues(scores);
	if (present.empty()) {
		return std::nullopt;
	}
	// An odd number of negative scores has no real root.
	const double ratio = product(present) / static_cast<double>(present.size());
	if (!std::isfinite(ratio) || ratio < 0.0) {
		return std::nullopt;
	}
	return std::sqrt(ratio);
}

std::vector<std::optional<double>> normalizeMinMax(const std::vector<std::optional<double>>& values) {
	std::vector<std::optional<double>> normalized(values.size());

	const auto range = presentMinMax(values);
	if (!range) {
		return normalized;
	}

	const auto [lo, hi] = *range;
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (!values[i] || std::isnan(*values[i])) {
			continue;
		}
		normalized[i] = (hi == lo) ? 0.0 : (*values[i] - lo) / (hi - lo);
	}
	return normalized;
}

std::vector<CompositeRecord> scoreComposite(const std::vector<ScoreRecord>& records, const ThresholdTable& composite, DebugVisualizer* debugger) {
	if (debugger) {
		debugger->beginStage("Composite Index");
	}

	// 1. Per-transect raw value. Independent per record.
	std::vector<std::optional<double>> raws;
	raws.reserve(records.size());
	for (const auto& record: records) {
		raws.push_back(compositeValue(record));
	}

	// 2. Dataset-wide normalisation. Needs every raw value.
	const std::vector<std::optional<double>> normalized = normalizeMinMax(raws);

	// 3. Classify the raw value.
	std::vector<CompositeRecord> out;
	out.reserve(records.size());
	std::size_t noDataCount = 0u;
	for (std::size_t i = 0; i < records.size(); ++i) {
		Classification c = classify(raws[i], composite);
		if (!c.hasData()) {
			++noDataCount;
		}
		out.push_back(CompositeRecord{records[i].label, raws[i], normalized[i], std::move(c)});
	}

	if (debugger) {
		const std::vector<double> present = presentValues(raws);
		debugger->log("Records", std::to_string(records.size()) + " transects, " + std::to_string(present.size()) + " with a composite value");
		if (!present.empty()) {
			const auto range = presentMinMax(raws);
			debugger->log("Raw Index", "min " + std::to_string(range->first) + ", median " + std::to_string(median(present)) + ", mean " +
			                                   std::to_string(mean(present)) + ", max " + std::to_string(range->second));
		}
		debugger->log("No Data", std::to_string(noDataCount) + " transects without a composite class");
		debugger->endStage();
	}

	return out;
}

} // namespace coastvi::cvi::core
