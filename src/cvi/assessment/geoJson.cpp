#include "cvi/geoJson.hpp"

#include "cvi/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace coastvi::cvi {

namespace {

using Json = nlohmann::ordered_json;

static constexpr const char* LABEL_KEY     = "label";
static constexpr const char* INDEX_KEY     = "index";
static constexpr const char* DISTANCE_KEY  = "distance";
static constexpr const char* PROCESSED_KEY = "processed_length_km";
static constexpr const char* COMPOSITE_KEY = "CVI_equal";

static Json readDocument(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		throw core::InputError("Could not open '" + path.string() + "'.");
	}

	try {
		return Json::parse(file);
	} catch (const nlohmann::json::exception& e) {
		throw core::InputError("Could not parse '" + path.string() + "': " + e.what());
	}
}

//! Member of an object node or a null node if it is missing.
static const Json& memberOf(const Json& node, const char* key) {
	static const Json NONE;
	if (!node.is_object()) {
		return NONE;
	}
	const auto it = node.find(key);
	return it == node.end() ? NONE : *it;
}

//! The "features" array of a FeatureCollection.
static const Json& featuresOf(const Json& document, const std::filesystem::path& path) {
	const Json& features = memberOf(document, "features");
	if (!features.is_array()) {
		throw core::InputError("'" + path.string() + "' is not a GeoJSON FeatureCollection.");
	}
	return features;
}

//! Missing, null and non-numeric values are absent.
static std::optional<double> readNumber(const Json& node) {
	if (!node.is_number()) {
		return std::nullopt;
	}
	return node.get<double>();
}

static std::string typeOf(const Json& geometry) {
	const Json& type = memberOf(geometry, "type");
	return type.is_string() ? type.get<std::string>() : std::string{};
}

//! GeoJSON position [x, y] or [x, y, z]. Only x and y are used.
static core::Point2D readPosition(const Json& node) {
	if (!node.is_array() || node.size() < 2u || !node[0].is_number() || !node[1].is_number()) {
		throw core::InputError("GeoJSON position must hold at least two numbers.");
	}
	return {node[0].get<double>(), node[1].get<double>()};
}

static core::LineSegment readLine(const Json& coordinates) {
	if (!coordinates.is_array()) {
		throw core::InputError("LineString coordinates must be a sequence of positions.");
	}

	core::LineSegment line;
	line.reserve(coordinates.size());
	for (const Json& position: coordinates) {
		line.push_back(readPosition(position));
	}
	return line;
}

static std::string readLabel(const Json& properties, std::size_t feature) {
	const Json& label = memberOf(properties, LABEL_KEY);
	if (label.is_string()) {
		return label.get<std::string>();
	}
	if (label.is_number_integer()) {
		return std::to_string(label.get<long long>());
	}
	throw core::InputError("Feature " + std::to_string(feature) + " has no label.");
}

//! Absent values are written as null.
static Json toJson(const std::optional<double>& value) {
	return value ? Json(*value) : Json(nullptr);
}

static Json toJson(const core::Point2D& p) {
	return Json::array({p.x, p.y});
}

static void writeClassification(Json& properties, const std::string& prefix, const core::Classification& c) {
	properties[prefix + "_class"] = c.rank ? Json(*c.rank) : Json(nullptr);
	properties[prefix + "_label"] = c.label;
	properties[prefix + "_color"] = c.color;
}

//! Every attached dimension gets a score column. Transects it never reached hold null.
static Json toProperties(const core::TransectRecord& record, const std::vector<std::string>& dimensions, double processedKm) {
	Json properties           = Json::object();
	properties[LABEL_KEY]     = record.transect.label;
	properties[INDEX_KEY]     = record.transect.index;
	properties[DISTANCE_KEY]  = record.transect.distance;
	properties[PROCESSED_KEY] = processedKm;

	for (const auto& dimension: dimensions) {
		const auto it                    = record.scores.find(dimension);
		properties[dimension + "_score"] = it == record.scores.end() ? Json(nullptr) : toJson(it->second);
	}
	for (const auto& [dimension, scored]: record.dimensions) {
		properties[dimension + "_value"] = toJson(scored.value);
		writeClassification(properties, dimension, scored.classification);
	}

	if (record.composite) {
		const core::CompositeRecord& composite           = *record.composite;
		properties[COMPOSITE_KEY]                        = toJson(composite.raw);
		properties[std::string(COMPOSITE_KEY) + "_norm"] = toJson(composite.normalized);
		writeClassification(properties, COMPOSITE_KEY, composite.classification);
	}
	return properties;
}

} // namespace

std::vector<core::LineSegment> readCoastline(const std::filesystem::path& path) {
	const Json document = readDocument(path);

	std::vector<core::LineSegment> segments;
	std::size_t skipped = 0u;
	for (const Json& feature: featuresOf(document, path)) {
		const Json& geometry   = memberOf(feature, "geometry");
		const std::string type = typeOf(geometry);

		if (type == "LineString") {
			segments.push_back(readLine(memberOf(geometry, "coordinates")));
		} else if (type == "MultiLineString") {
			const Json& lines = memberOf(geometry, "coordinates");
			if (!lines.is_array()) {
				throw core::InputError("MultiLineString coordinates must be a sequence of lines.");
			}
			for (const Json& line: lines) {
				segments.push_back(readLine(line));
			}
		} else {
			++skipped;
		}
	}

	if (skipped) {
		std::cerr << "[Warning] Ignored " << skipped << " non-line features in '" << path.string() << "'.\n";
	}
	return segments;
}

TransectFile readTransects(const std::filesystem::path& path) {
	const Json document = readDocument(path);

	TransectFile result;
	std::size_t feature = 0u;
	for (const Json& node: featuresOf(document, path)) {
		const Json& geometry   = memberOf(node, "geometry");
		const Json& properties = memberOf(node, "properties");
		if (typeOf(geometry) != "LineString") {
			throw core::InputError("Transect feature " + std::to_string(feature) + " is not a LineString.");
		}

		const core::LineSegment line = readLine(memberOf(geometry, "coordinates"));
		if (line.size() != 2u) {
			throw core::InputError("Transect feature " + std::to_string(feature) + " must have exactly two positions.");
		}

		const Json& index = memberOf(properties, INDEX_KEY);
		result.transects.push_back(core::Transect{
		        readLabel(properties, feature),
		        line.front(),
		        line.back(),
		        index.is_number_unsigned() ? index.get<std::size_t>() : feature,
		        readNumber(memberOf(properties, DISTANCE_KEY)).value_or(0.0),
		});

		if (const auto km = readNumber(memberOf(properties, PROCESSED_KEY))) {
			result.processedLength = *km * 1000.0;
		}
		++feature;
	}

	return result;
}

Attachments readAttachments(const std::filesystem::path& path, const std::string& property) {
	const Json document = readDocument(path);

	Attachments attachments;
	std::size_t feature = 0u;
	for (const Json& node: featuresOf(document, path)) {
		const Json& properties = memberOf(node, "properties");
		attachments.emplace_back(readLabel(properties, feature), readNumber(memberOf(properties, property.c_str())));
		++feature;
	}
	return attachments;
}

void writeTransects(const std::filesystem::path& path, const Assessment& assessment) {
	const double processedKm = assessment.processedLength() / 1000.0;

	Json features = Json::array();
	for (const auto& record: assessment.transects().records()) {
		Json geometry           = Json::object();
		geometry["type"]        = "LineString";
		geometry["coordinates"] = Json::array({toJson(record.transect.start), toJson(record.transect.end)});

		Json feature          = Json::object();
		feature["type"]       = "Feature";
		feature["geometry"]   = std::move(geometry);
		feature["properties"] = toProperties(record, assessment.transects().dimensions(), processedKm);
		features.push_back(std::move(feature));
	}

	Json document        = Json::object();
	document["type"]     = "FeatureCollection";
	document["features"] = std::move(features);

	std::ofstream file(path);
	if (!file) {
		throw core::InputError("Could not open '" + path.string() + "' for writing.");
	}
	try {
		file << document.dump(2) << '\n';
	} catch (const nlohmann::json::exception& e) {
		throw core::InputError("Could not write '" + path.string() + "': " + e.what());
	}
	if (!file) {
		throw core::InputError("Could not write '" + path.string() + "'.");
	}
}

} // namespace coastvi::cvi
