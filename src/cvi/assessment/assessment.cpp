#include "cvi/assessment.hpp"

#include "cvi/core/overlay.hpp"
#include "cvi/core/segmentStitcher.hpp"

#include <string>

namespace coastvi::cvi {

//! Only the first few unknown labels are listed in the log.
static constexpr std::size_t MAX_LISTED_MISSES = 5u;

Assessment::Assessment(core::DebugVisualizer* debugger) : m_debugger{debugger} {
}

const core::TransectSet& Assessment::generateTransects(const std::vector<core::LineSegment>& segments, const core::SamplingParams& params) {
	core::Polyline coastline = core::stitchSegments(segments, m_debugger);
	std::vector<core::Transect> sampled = core::sampleTransects(coastline, params, m_debugger);

	m_processedLength = core::usableLength(coastline, params.maxTotalLength);
	m_coastline       = std::move(coastline);
	m_transects       = core::TransectSet(std::move(sampled));
	return m_transects;
}

void Assessment::setTransects(std::vector<core::Transect> transects, double processedLength) {
	m_transects       = core::TransectSet(std::move(transects));
	m_coastline       = {};
	m_processedLength = processedLength;
}

std::size_t Assessment::attachScores(const std::string& dimension, const Attachments& scores) {
	std::size_t matched = 0u;
	std::vector<std::string> misses;
	for (const auto& [label, score]: scores) {
		if (m_transects.attachScore(dimension, label, score)) {
			++matched;
		} else {
			misses.push_back(label);
		}
	}

	logJoin(dimension, matched, misses);
	if (m_debugger) {
		m_debugger->endStage();
	}
	return matched;
}

std::size_t Assessment::attachValues(const core::DimensionTable& dimension, const Attachments& values) {
	std::size_t matched = 0u;
	std::size_t noData  = 0u;
	std::vector<std::string> misses;
	for (const auto& [label, value]: values) {
		core::DimensionScore score = core::scoreDimension(value, dimension);
		const bool hasData         = score.classification.hasData();
		if (m_transects.attachDimension(dimension.name, label, std::move(score))) {
			++matched;
			noData += hasData ? 0u : 1u;
		} else {
			misses.push_back(label);
		}
	}

	logJoin(dimension.name, matched, misses);
	if (m_debugger) {
		m_debugger->log("No Data", std::to_string(noData) + " " + dimension.name + " values outside every " + core::toString(dimension.mode) + " class");
		m_debugger->endStage();
	}
	return matched;
}

std::vector<core::CompositeRecord> Assessment::computeIndex(const core::ThresholdTable& composite) {
	std::vector<core::CompositeRecord> records = core::scoreComposite(m_transects.scoreRecords(), composite, m_debugger);
	for (const auto& record: records) {
		m_transects.attachComposite(record);
	}

	if (m_debugger) {
		std::vector<core::Transect> geometry;
		std::vector<std::string> colors;
		for (const auto& r: m_transects.records()) {
			geometry.push_back(r.transect);
			colors.push_back(r.composite ? r.composite->classification.color : core::noData().color);
		}
		m_debugger->beginStage("Classified Transects");
		m_debugger->add("Composite Class", core::debugging::drawOverlay(m_coastline, geometry, colors));
		m_debugger->endStage();
	}

	return records;
}

void Assessment::logJoin(const std::string& dimension, std::size_t matched, const std::vector<std::string>& misses) {
	if (!m_debugger) {
		return;
	}

	m_debugger->beginStage("Attach " + dimension);
	m_debugger->log("Joined", std::to_string(matched) + " of " + std::to_string(m_transects.size()) + " transects");
	if (!misses.empty()) {
		std::string listed;
		for (std::size_t i = 0; i < misses.size() && i < MAX_LISTED_MISSES; ++i) {
			listed += (i ? ", " : "") + misses[i];
		}
		m_debugger->log("Unknown Labels", std::to_string(misses.size()) + " ignored (" + listed + (misses.size() > MAX_LISTED_MISSES ? ", ...)" : ")"));
	}
}

} // namespace coastvi::cvi
