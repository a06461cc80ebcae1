#include "cvi/core/thresholdConfig.hpp"

#include "cvi/core/errors.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <limits>

namespace coastvi::cvi::core {

namespace {

static constexpr const char* META_KEY      = "meta";
static constexpr const char* PALETTE_KEY   = "default_palette";
static constexpr const char* CLASSES_KEY   = "classes";
static constexpr const char* COMPOSITE_KEY = "total_cvi";
static constexpr const char* FIXED_KEY     = "fixed";

//! Parse an integer key such as "3". Rejects trailing characters.
static std::optional<int> parseInt(const std::string& text) {
	int value        = 0;
	const char* last = text.data() + text.size();
	const auto res   = std::from_chars(text.data(), last, value);
	if (res.ec != std::errc{} || res.ptr != last || text.empty()) {
		return std::nullopt;
	}
	return value;
}

//! Member of a JSON object. nullptr if the node is no object, or the member is missing or null.
static const Json* member(const Json& node, const std::string& key) {
	if (!node.is_object()) {
		return nullptr;
	}
	const auto it = node.find(key);
	if (it == node.end() || it->is_null()) {
		return nullptr;
	}
	return &*it;
}

//! Bound of a bin. Missing or null means unbounded.
static double readBound(const Json* node, double unbounded, const std::string& where) {
	if (!node) {
		return unbounded;
	}
	if (!node->is_number()) {
		throw ConfigError(where + " is not a number.");
	}
	return node->get<double>();
}

//! Palette references may be written as numbers (1) or strings ("1").
static std::string readReference(const Json* node, const std::string& fallback, const std::string& where) {
	if (!node) {
		return fallback;
	}
	if (node->is_number_integer()) {
		return std::to_string(node->get<long long>());
	}
	if (node->is_string()) {
		return node->get<std::string>();
	}
	throw ConfigError(where + " palette reference must be a number or a string.");
}

static MatchMode defaultMode(const std::string& dimension) {
	if (dimension == "land_cover") {
		return MatchMode::Code;
	}
	if (dimension == "erosion") {
		return MatchMode::Exact;
	}
	return MatchMode::Interval;
}

static MatchMode parseMode(const Json* node, const std::string& dimension) {
	if (!node) {
		return defaultMode(dimension);
	}

	const std::string mode = node->is_string() ? node->get<std::string>() : node->dump();
	if (mode == "interval")
		return MatchMode::Interval;
	if (mode == "exact")
		return MatchMode::Exact;
	if (mode == "codes")
		return MatchMode::Code;
	throw ConfigError("Dimension '" + dimension + "' has unknown match mode '" + mode + "'.");
}

} // namespace

const DimensionTable* IndexConfig::findDimension(const std::string& name) const {
	const auto it = std::find_if(dimensions.begin(), dimensions.end(), [&name](const DimensionTable& d) { return d.name == name; });
	return it == dimensions.end() ? nullptr : &*it;
}

Palette parsePalette(const Json& root) {
	const Json* meta        = member(root, META_KEY);
	const Json* paletteNode = meta ? member(*meta, PALETTE_KEY) : nullptr;
	if (!paletteNode || !paletteNode->is_object()) {
		throw ConfigError("Configuration has no meta.default_palette map.");
	}

	Palette palette;
	for (const auto& [ref, entry]: paletteNode->items()) {
		const Json* color = entry.is_object() ? member(entry, "color") : &entry;
		if (!color || !color->is_string() || color->get<std::string>().empty()) {
			throw ConfigError("Palette entry '" + ref + "' has no color.");
		}
		palette[ref] = color->get<std::string>();
	}
	return palette;
}

ThresholdTable parseThresholdTable(const Json& classes, const Palette& palette, const std::string& context) {
	if (!classes.is_object() || classes.empty()) {
		throw ConfigError(context + " has no classes.");
	}

	static constexpr double INF = std::numeric_limits<double>::infinity();

	std::vector<ThresholdBin> bins;
	for (const auto& [key, definition]: classes.items()) {
		const std::string where = context + " class '" + key + "'";

		const auto rank = parseInt(key);
		if (!rank) {
			throw ConfigError(where + " rank is not an integer.");
		}
		if (!definition.is_object()) {
			throw ConfigError(where + " is not a map.");
		}

		ThresholdBin bin{*rank};
		bin.min = readBound(member(definition, "min"), -INF, where + " min");
		bin.max = readBound(member(definition, "max"), INF, where + " max");

		const Json* label = member(definition, "label");
		if (!label || !label->is_string()) {
			throw ConfigError(where + " has no label.");
		}
		bin.label = label->get<std::string>();

		// A literal color wins over a palette reference.
		const Json* literal = member(definition, "color");
		if (literal && literal->is_string() && !literal->get<std::string>().empty()) {
			bin.color = literal->get<std::string>();
		} else {
			const std::string ref = readReference(member(definition, "palette"), key, where);
			const auto it         = palette.find(ref);
			if (it == palette.end()) {
				throw ConfigError(where + " references unknown palette entry '" + ref + "'.");
			}
			bin.color = it->second;
		}

		if (const Json* codes = member(definition, "codes")) {
			if (!codes->is_array()) {
				throw ConfigError(where + " codes must be a list.");
			}
			for (const Json& code: *codes) {
				if (!code.is_number_integer()) {
					throw ConfigError(where + " codes must be integers.");
				}
				bin.codes.push_back(code.get<int>());
			}
		}

		bins.push_back(std::move(bin));
	}

	return ThresholdTable(std::move(bins));
}

DimensionTable parseDimensionTable(const Json& section, const std::string& name, const Palette& palette) {
	const Json* classes = member(section, CLASSES_KEY);
	if (!classes) {
		throw ConfigError("Dimension '" + name + "' has no classes.");
	}

	DimensionTable dimension{};
	dimension.name  = name;
	dimension.mode  = parseMode(member(section, "match"), name);
	dimension.table = parseThresholdTable(*classes, palette, "Dimension '" + name + "'");

	if (dimension.mode == MatchMode::Code) {
		const bool anyCodes = std::any_of(dimension.table.bins().begin(), dimension.table.bins().end(),
		                                  [](const ThresholdBin& b) { return !b.codes.empty(); });
		if (!anyCodes) {
			throw ConfigError("Dimension '" + name + "' matches by code but defines no codes.");
		}
	}

	if (const Json* rescale = member(section, "rescale")) {
		if (!rescale->is_object()) {
			throw ConfigError("Dimension '" + name + "' rescale must be a map.");
		}
		for (const auto& [raw, score]: rescale->items()) {
			const auto from = parseInt(raw);
			if (!from || !score.is_number_integer()) {
				throw ConfigError("Dimension '" + name + "' rescale entries must map integers to integers.");
			}
			dimension.rescale[*from] = score.get<int>();
		}
	} else if (name == "erosion" && dimension.mode == MatchMode::Exact) {
		dimension.rescale = DELTARES_EROSION_RESCALE;
	}

	return dimension;
}

IndexConfig parseIndexConfig(const Json& document) {
	if (!document.is_object()) {
		throw ConfigError("Configuration root must be a map.");
	}

	IndexConfig config{};
	config.palette = parsePalette(document);

	for (const auto& [name, section]: document.items()) {
		if (name == META_KEY || name == COMPOSITE_KEY || !member(section, CLASSES_KEY)) {
			continue;
		}
		config.dimensions.push_back(parseDimensionTable(section, name, config.palette));
	}

	const Json* total     = member(document, COMPOSITE_KEY);
	const Json* composite = total ? member(*total, FIXED_KEY) : nullptr;
	if (!composite) {
		throw ConfigError("Configuration has no total_cvi.fixed classes.");
	}
	config.composite = parseThresholdTable(*composite, config.palette, "Composite index");

	return config;
}

IndexConfig loadIndexConfig(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		throw ConfigError("Could not open configuration file " + path.string() + ".");
	}

	Json document;
	try {
		document = Json::parse(file);
	} catch (const nlohmann::json::exception& e) {
		throw ConfigError("Could not parse configuration file " + path.string() + ": " + e.what());
	}

	return parseIndexConfig(document);
}

} // namespace coastvi::cvi::core
