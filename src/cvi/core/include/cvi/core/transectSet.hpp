#pragma once

#include "cvi/core/compositeScorer.hpp"
#include "cvi/core/dimensionScorer.hpp"
#include "cvi/core/transectSampler.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coastvi::cvi::core {

//! A transect together with everything attached to it during one run.
struct TransectRecord {
	Transect transect;
	std::map<std::string, std::optional<double>> scores{}; //!< Dimension -> score (absent = missing data).
	std::map<std::string, DimensionScore> dimensions{};    //!< Dimension -> raw value and class (only for dimensions scored from raw values).
	std::optional<CompositeRecord> composite{};            //!< Set once the index has been computed.
};

/*! The transects of one run, keyed by their unique label.
 *  Label is the only join key: attachments for unknown labels are ignored and never create a transect.
 */
class TransectSet {
public:
	TransectSet() = default;

	//! \throws InputError if two transects share a label.
	explicit TransectSet(std::vector<Transect> transects);

	std::size_t size() const { return m_records.size(); }
	bool empty() const { return m_records.empty(); }

	const std::vector<TransectRecord>& records() const { return m_records; }
	const TransectRecord* find(const std::string& label) const;

	//! Dimensions attached so far, in first-attached order.
	const std::vector<std::string>& dimensions() const { return m_dimensions; }

	//! Attach a score. \return False if the label is unknown.
	bool attachScore(const std::string& dimension, const std::string& label, std::optional<double> score);

	//! Attach a classified dimension score (score and class). \return False if the label is unknown.
	bool attachDimension(const std::string& dimension, const std::string& label, DimensionScore score);

	//! Attach a computed composite. \return False if the label is unknown.
	bool attachComposite(CompositeRecord composite);

	//! One score record per transect in transect order. Dimensions without a score for a transect are present as empty optionals.
	std::vector<ScoreRecord> scoreRecords() const;

private:
	TransectRecord* findRecord(const std::string& label);
	void registerDimension(const std::string& dimension);

private:
	std::vector<TransectRecord> m_records;                  //!< In emission order.
	std::unordered_map<std::string, std::size_t> m_byLabel; //!< Label -> index into m_records.
	std::vector<std::string> m_dimensions;
};

} // namespace coastvi::cvi::core
