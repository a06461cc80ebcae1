#pragma once

#include "cvi/assessment.hpp"
#include "cvi/core/polyline.hpp"
#include "cvi/core/transectSampler.hpp"

#include <filesystem>
#include <string>
#include <vector>

// GeoJSON adapters of the index computation, read and written with nlohmann::json. A null property is an absent value.
// Coordinates are taken as they are: the caller provides data in a projected, metric frame.
namespace coastvi::cvi {

//! Transects read back from an earlier run.
struct TransectFile {
	std::vector<core::Transect> transects;
	double processedLength{0.0}; //!< Sampled coastline length (m), from the processed_length_km property.
};

//! Read every LineString / MultiLineString line of a FeatureCollection as one coastline segment. \throws core::InputError
std::vector<core::LineSegment> readCoastline(const std::filesystem::path& path);

//! Read transects written by writeTransects(). \throws core::InputError
TransectFile readTransects(const std::filesystem::path& path);

/*! Read one numeric property per feature, keyed by the feature's label.
 * \param [in] path     FeatureCollection with a "label" property per feature.
 * \param [in] property Name of the numeric property. Features without it yield an absent value.
 * \throws     core::InputError if the file cannot be read or a feature has no label.
 */
Attachments readAttachments(const std::filesystem::path& path, const std::string& property);

//! Write all transects of an assessment with their scores, classes and composite index. \throws core::InputError
void writeTransects(const std::filesystem::path& path, const Assessment& assessment);

} // namespace coastvi::cvi
