#pragma once

#include "cvi/core/thresholdTable.hpp"

#include <map>
#include <optional>
#include <string>

namespace coastvi::cvi::core {

//! How raw values of a dimension are matched against its table.
enum class MatchMode {
	Interval, //!< min <= value < max (slope, elevation, composite).
	Exact,    //!< value == rank, after optional rescaling (erosion).
	Code,     //!< integer category code in bin.codes (land cover).
};

//! Deltares coastal hazard wheel erosion classes {1, 2, 3} rescaled to the 1-5 vulnerability scale.
inline const std::map<int, int> DELTARES_EROSION_RESCALE{{1, 1}, {2, 3}, {3, 5}};

//! Classification rules of a single vulnerability dimension.
struct DimensionTable {
	std::string name;              //!< Dimension name (e.g. "slope"). Used as score key.
	MatchMode mode{MatchMode::Interval};
	ThresholdTable table;
	std::map<int, int> rescale{}; //!< Exact mode only: raw class -> score. Empty = identity.
};

//! Score of one transect along one dimension.
struct DimensionScore {
	std::optional<double> value;   //!< Raw measurement delivered by the external collaborator.
	std::optional<double> score;   //!< Score entering the composite index.
	Classification classification; //!< Class of the score (or value for interval/code matching).
};

/*! Turn a raw per-transect measurement into a dimension score.
 *  Interval and code mode score with the matched rank. Exact mode scores with the (rescaled) value itself,
 *  as long as it matches a rank of the table.
 * \param [in] value     Raw measurement. Absent or NaN yields an absent score and noData().
 * \param [in] dimension Rules of the dimension.
 */
DimensionScore scoreDimension(std::optional<double> value, const DimensionTable& dimension);

std::string toString(MatchMode mode);

} // namespace coastvi::cvi::core
