#pragma once

#include "cvi/core/debugVisualizer.hpp"
#include "cvi/core/polyline.hpp"

#include <cstddef>
#include <vector>

// Stitching is the first step of the index computation.
// Motivation: coastline sources deliver the shore as many disjoint line segments in no particular order or orientation.
// Goal:       One continuous path along the coast that can be walked by arc length.
// Process:    Greedy nearest neighbour. Start at the westernmost segment start and repeatedly append the remaining segment whose start or
//             end point is closest to the current chain end (reversed if its end is closer). Not globally optimal; O(n^2) in segment count.
namespace coastvi::cvi::core {

//! Above this many segments the quadratic stitcher emits a warning.
static constexpr std::size_t STITCH_WARN_SEGMENTS = 1000u;

/*! Join unordered coastline segments into one continuous polyline.
 * \param [in]     segments Coastline segments (each >= 2 points). Orientation is arbitrary.
 * \param [in,out] debugger Optional debug visualizer for messages and overlays.
 * \return         Chain starting with the segment whose first point has the smallest x. The shared point of appended segments is dropped.
 * \throws         EmptyInputError if @p segments is empty, InputError if a segment has fewer than two points.
 */
Polyline stitchSegments(const std::vector<LineSegment>& segments, DebugVisualizer* debugger = nullptr);

} // namespace coastvi::cvi::core
