#pragma once

#include "cvi/core/polyline.hpp"
#include "cvi/core/transectSampler.hpp"

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace coastvi::cvi::core::debugging {

//! Convert a class color ("#rrggbb" or one of a few names) to BGR. Unknown names map to gray.
cv::Scalar toScalar(const std::string& color);

/*! Draw the coastline and optional transects onto a fresh canvas, fitted to their common bounding box.
 * \param [in] coastline Coastline polyline (drawn in white). May be empty.
 * \param [in] transects Transects to draw.
 * \param [in] colors    Per-transect colors (same size as transects) or empty for a uniform color.
 */
cv::Mat drawOverlay(const Polyline& coastline, const std::vector<Transect>& transects, const std::vector<std::string>& colors = {});

//! Draw unordered segments, each in a different hue. Used to visualise the stitcher input.
cv::Mat drawSegments(const std::vector<LineSegment>& segments);

} // namespace coastvi::cvi::core::debugging
