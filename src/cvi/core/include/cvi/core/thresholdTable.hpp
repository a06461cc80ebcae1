#pragma once

#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace coastvi::cvi::core {

//! One class of a threshold table. Matches values in [min, max).
struct ThresholdBin {
	int rank;                                                  //!< Vulnerability rank (1 = lowest).
	double min{-std::numeric_limits<double>::infinity()};      //!< Inclusive lower bound. -inf if unbounded.
	double max{std::numeric_limits<double>::infinity()};       //!< Exclusive upper bound. +inf if unbounded.
	std::string label;                                         //!< Human readable class name.
	std::string color;                                         //!< Display color (resolved, e.g. "#1a9850").
	std::vector<int> codes{};                                  //!< Category codes for code-matched dimensions (land cover).
};

//! Result of classifying one value.
struct Classification {
	std::optional<int> rank; //!< Matched bin rank. Empty for "No Data".
	std::string label;
	std::string color;

	bool hasData() const { return rank.has_value(); }
};

//! The "No Data" sentinel for absent values and values outside every bin.
Classification noData();

/*! Validated, rank-ordered list of bins.
 *  Construction checks the contract every classifier relies on and fails fast.
 */
class ThresholdTable {
public:
	ThresholdTable() = default;

	/*! Validate and sort bins.
	 * \param [in] bins Bins in any order.
	 * \throws     ConfigError if a bin has no color, min >= max (or NaN bounds), a rank is repeated or a code is used by two bins.
	 */
	explicit ThresholdTable(std::vector<ThresholdBin> bins);

	const std::vector<ThresholdBin>& bins() const { return m_bins; }
	bool empty() const { return m_bins.empty(); }

	//! Bin with the given rank or nullptr.
	const ThresholdBin* findRank(int rank) const;

private:
	std::vector<ThresholdBin> m_bins; //!< Sorted ascending by rank.
};

/*! Interval classification. First bin (in rank order) with min <= value < max.
 * \param [in] value Value to classify. Absent or NaN yields noData().
 */
Classification classify(std::optional<double> value, const ThresholdTable& table);

//! Equality classification for values that are already discrete ranks (value == bin.rank).
Classification classifyExact(std::optional<double> value, const ThresholdTable& table);

//! Category classification. Matches an integer code against each bin's code list.
Classification classifyCode(std::optional<int> code, const ThresholdTable& table);

} // namespace coastvi::cvi::core
