#include "cvi/core/thresholdTable.hpp"

#include "cvi/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace coastvi::cvi::core {

Classification noData() {
	return {std::nullopt, "No Data", "gray"};
}

static Classification fromBin(const ThresholdBin& bin) {
	return {bin.rank, bin.label, bin.color};
}

ThresholdTable::ThresholdTable(std::vector<ThresholdBin> bins) : m_bins(std::move(bins)) {
	std::set<int> ranks;
	std::set<int> codes;

	for (const auto& bin: m_bins) {
		const std::string where = "Threshold bin with rank " + std::to_string(bin.rank);

		if (!ranks.insert(bin.rank).second) {
			throw ConfigError(where + " is defined more than once.");
		}
		if (bin.color.empty()) {
			throw ConfigError(where + " has no color.");
		}
		if (std::isnan(bin.min) || std::isnan(bin.max) || !(bin.min < bin.max)) {
			throw ConfigError(where + " requires min < max.");
		}
		for (int code: bin.codes) {
			if (!codes.insert(code).second) {
				throw ConfigError(where + " reuses category code " + std::to_string(code) + ".");
			}
		}
	}

	std::sort(m_bins.begin(), m_bins.end(), [](const ThresholdBin& a, const ThresholdBin& b) { return a.rank < b.rank; });
}

const ThresholdBin* ThresholdTable::findRank(int rank) const {
	const auto it = std::find_if(m_bins.begin(), m_bins.end(), [rank](const ThresholdBin& b) { return b.rank == rank; });
	return it == m_bins.end() ? nullptr : &*it;
}

Classification classify(std::optional<double> value, const ThresholdTable& table) {
	if (!value || std::isnan(*value)) {
		return noData();
	}

	for (const auto& bin: table.bins()) {
		if (bin.min <= *value && *value < bin.max) {
			return fromBin(bin);
		}
	}
	return noData();
}

Classification classifyExact(std::optional<double> value, const ThresholdTable& table) {
	if (!value || std::isnan(*value)) {
		return noData();
	}

	for (const auto& bin: table.bins()) {
		if (*value == static_cast<double>(bin.rank)) {
			return fromBin(bin);
		}
	}
	return noData();
}

Classification classifyCode(std::optional<int> code, const ThresholdTable& table) {
	if (!code) {
		return noData();
	}

	for (const auto& bin: table.bins()) {
		if (std::find(bin.codes.begin(), bin.codes.end(), *code) != bin.codes.end()) {
			return fromBin(bin);
		}
	}
	return noData();
}

} // namespace coastvi::cvi::core
