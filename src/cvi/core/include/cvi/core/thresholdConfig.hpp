#pragma once

#include "cvi/core/dimensionScorer.hpp"
#include "cvi/core/thresholdTable.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

// Threshold tables are configured per dimension in a JSON document:
//
//   meta.default_palette   : { "<ref>": { "color": "#rrggbb" }, ... }
//   <dimension>.classes    : { "<rank>": { "min": 0, "max": 2, "label": "...", "palette": <ref> | "color": "...", "codes": [..] }, ... }
//   <dimension>.match      : optional "interval" | "exact" | "codes" (defaults depend on the dimension name)
//   <dimension>.rescale    : optional { "<raw>": <score>, ... } for exact matching
//   total_cvi.fixed        : composite classes, same shape as <dimension>.classes
//
// Unbounded ends are written by leaving out "min" or "max", or by setting them to null. The palette reference
// defaults to the rank.
namespace coastvi::cvi::core {

//! JSON document with the key order of the file. Dimensions are kept in document order.
using Json = nlohmann::ordered_json;

//! Palette reference -> display color.
using Palette = std::map<std::string, std::string>;

//! Everything needed to score transects: one table per dimension plus the composite table.
struct IndexConfig {
	Palette palette;
	std::vector<DimensionTable> dimensions; //!< In document order.
	ThresholdTable composite;

	//! Dimension with the given name or nullptr.
	const DimensionTable* findDimension(const std::string& name) const;
};

//! Read meta.default_palette. \throws ConfigError if missing or malformed.
Palette parsePalette(const Json& root);

/*! Build a validated table from a "classes"-style map node.
 * \param [in] classes Map of rank -> class definition.
 * \param [in] palette Palette used to resolve color references.
 * \param [in] context Name used in error messages.
 * \throws     ConfigError on a non-integer rank, missing label, unresolvable color, bad bounds or repeated ranks/codes.
 */
ThresholdTable parseThresholdTable(const Json& classes, const Palette& palette, const std::string& context);

//! Build the rules of one dimension section (node holding "classes"). \throws ConfigError
DimensionTable parseDimensionTable(const Json& section, const std::string& name, const Palette& palette);

//! Parse a complete configuration document. \throws ConfigError
IndexConfig parseIndexConfig(const Json& document);

//! Open and parse a configuration file. \throws ConfigError if the file cannot be opened or parsed.
IndexConfig loadIndexConfig(const std::filesystem::path& path);

} // namespace coastvi::cvi::core
