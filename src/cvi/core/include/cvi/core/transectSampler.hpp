#pragma once

#include "cvi/core/debugVisualizer.hpp"
#include "cvi/core/polyline.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Sampling is the second step of the index computation.
// Given the stitched coastline, we walk along it at a fixed arc-length spacing and place a short line perpendicular to the coast at every
// sample position. These "transects" are the units every vulnerability dimension is measured on.
namespace coastvi::cvi::core {

//! A cross-shore line perpendicular to the coastline.
struct Transect {
	std::string label; //!< Unique join key ("T1", "T2", ...).
	Point2D start;     //!< Landward/seaward end (centre - normal * length / 2).
	Point2D end;       //!< Opposite end (centre + normal * length / 2).
	std::size_t index; //!< Emission order (0-based).
	double distance;   //!< Arc-length position of the transect centre along the truncated coastline.
};

//! Caller supplied sampling parameters (all in the units of the coordinate frame).
struct SamplingParams {
	double spacing;        //!< Arc length between two sample positions.
	double transectLength; //!< Full length of each transect.
	double maxTotalLength; //!< Only the first maxTotalLength units of the coastline are sampled.
};

//! Length of the coastline that is actually sampled: min(maxTotalLength, polyline length).
double usableLength(const Polyline& coastline, double maxTotalLength);

/*! Sample perpendicular transects along a coastline.
 * \param [in]     coastline Stitched coastline (>= 2 points).
 * \param [in]     params    Spacing, transect length and processed-length cap. Must be positive.
 * \param [in,out] debugger  Optional debug visualizer for messages and overlays.
 * \return         Transects in emission order. Positions with a degenerate tangent are skipped without reserving a label.
 * \note           Sample positions are i * spacing for i in [0, floor(usable / spacing)], the end of the processed stretch included.
 * \throws         InputError on invalid parameters or a coastline with fewer than two points.
 */
std::vector<Transect> sampleTransects(const Polyline& coastline, const SamplingParams& params, DebugVisualizer* debugger = nullptr);

} // namespace coastvi::cvi::core
