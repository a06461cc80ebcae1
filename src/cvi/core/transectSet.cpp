#include "cvi/core/transectSet.hpp"

#include "cvi/core/errors.hpp"

#include <algorithm>

namespace coastvi::cvi::core {

TransectSet::TransectSet(std::vector<Transect> transects) {
	m_records.reserve(transects.size());
	for (auto& t: transects) {
		const auto [it, inserted] = m_byLabel.emplace(t.label, m_records.size());
		if (!inserted) {
			throw InputError("Transect label '" + t.label + "' is not unique.");
		}
		m_records.push_back(TransectRecord{std::move(t)});
	}
}

const TransectRecord* TransectSet::find(const std::string& label) const {
	const auto it = m_byLabel.find(label);
	return it == m_byLabel.end() ? nullptr : &m_records[it->second];
}

TransectRecord* TransectSet::findRecord(const std::string& label) {
	const auto it = m_byLabel.find(label);
	return it == m_byLabel.end() ? nullptr : &m_records[it->second];
}

void TransectSet::registerDimension(const std::string& dimension) {
	if (std::find(m_dimensions.begin(), m_dimensions.end(), dimension) == m_dimensions.end()) {
		m_dimensions.push_back(dimension);
	}
}

bool TransectSet::attachScore(const std::string& dimension, const std::string& label, std::optional<double> score) {
	registerDimension(dimension);

	TransectRecord* record = findRecord(label);
	if (!record) {
		return false;
	}
	record->scores[dimension] = score;
	return true;
}

bool TransectSet::attachDimension(const std::string& dimension, const std::string& label, DimensionScore score) {
	registerDimension(dimension);

	TransectRecord* record = findRecord(label);
	if (!record) {
		return false;
	}
	record->scores[dimension]     = score.score;
	record->dimensions[dimension] = std::move(score);
	return true;
}

bool TransectSet::attachComposite(CompositeRecord composite) {
	TransectRecord* record = findRecord(composite.label);
	if (!record) {
		return false;
	}
	record->composite = std::move(composite);
	return true;
}

std::vector<ScoreRecord> TransectSet::scoreRecords() const {
	std::vector<ScoreRecord> out;
	out.reserve(m_records.size());

	for (const auto& record: m_records) {
		ScoreRecord scores{record.transect.label, {}};
		for (const auto& dimension: m_dimensions) {
			const auto it             = record.scores.find(dimension);
			scores.scores[dimension] = (it == record.scores.end()) ? std::nullopt : it->second;
		}
		out.push_back(std::move(scores));
	}
	return out;
}

} // namespace coastvi::cvi::core
