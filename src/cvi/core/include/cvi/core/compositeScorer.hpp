#pragma once

#include "cvi/core/debugVisualizer.hpp"
#include "cvi/core/thresholdTable.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coastvi::cvi::core {

//! Per-transect dimension scores. An empty optional marks genuinely missing data.
struct ScoreRecord {
	std::string label;                                   //!< Transect label.
	std::map<std::string, std::optional<double>> scores; //!< Dimension name -> score.
};

//! Final composite index of one transect.
struct CompositeRecord {
	std::string label;
	std::optional<double> raw;        //!< sqrt(product / count) over the present scores. Empty if none is present.
	std::optional<double> normalized; //!< (raw - min) / (max - min) over the dataset. Empty if raw is empty.
	Classification classification;    //!< Class of the raw value in the composite table.
};

/*! Composite value of a single record: sqrt(product(present) / count(present)).
 *  This is the index formula of the CVI method, intentionally not a geometric mean.
 * \return Empty if the record has no present score.
 */
std::optional<double> compositeValue(const ScoreRecord& record);

/*! Min-max normalise present values over the whole dataset.
 *  If all present values are equal (single value included) every present value normalises to 0.
 * \return Same size as @p values, absent entries stay absent.
 */
std::vector<std::optional<double>> normalizeMinMax(const std::vector<std::optional<double>>& values);

/*! Compute, normalise and classify the composite index for every record.
 * \param [in]     records   Score records, any order. Output order matches.
 * \param [in]     composite Composite ("total") table. The raw value is classified, not the normalised one.
 * \param [in,out] debugger  Optional debug visualizer for messages.
 */
std::vector<CompositeRecord> scoreComposite(const std::vector<ScoreRecord>& records, const ThresholdTable& composite,
                                            DebugVisualizer* debugger = nullptr);

} // namespace coastvi::cvi::core
