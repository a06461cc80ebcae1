#include "cvi/core/segmentStitcher.hpp"

#include "cvi/core/errors.hpp"
#include "cvi/core/overlay.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>

namespace coastvi::cvi::core {

//! Index of the segment whose first point has the smallest x. First one wins on ties.
static std::size_t westernmostStart(const std::vector<LineSegment>& segments) {
	std::size_t best = 0;
	for (std::size_t i = 1; i < segments.size(); ++i) {
		if (segments[i].front().x < segments[best].front().x) {
			best = i;
		}
	}
	return best;
}

//! Append the points of a segment without its shared first point. Points equal to the chain end are not repeated.
template <typename Iterator>
static void appendJoined(std::vector<Point2D>& chain, Iterator first, Iterator last) {
	for (; first != last; ++first) {
		if (*first != chain.back()) {
			chain.push_back(*first);
		}
	}
}

Polyline stitchSegments(const std::vector<LineSegment>& segments, DebugVisualizer* debugger) {
	if (segments.empty()) {
		throw EmptyInputError("Cannot stitch an empty set of coastline segments.");
	}
	for (std::size_t i = 0; i < segments.size(); ++i) {
		if (segments[i].size() < 2u) {
			throw InputError("Coastline segment " + std::to_string(i) + " has fewer than two points.");
		}
	}

	if (debugger) {
		debugger->beginStage("Stitch Segments");
		debugger->add("Input Segments", debugging::drawSegments(segments));
		debugger->log("Input", std::to_string(segments.size()) + " segments");
	}

	if (segments.size() > STITCH_WARN_SEGMENTS) {
		const std::string warning = "Greedy stitching is quadratic; " + std::to_string(segments.size()) + " segments may take a while.";
		std::cerr << "[Warning] " << warning << '\n';
		if (debugger)
			debugger->log("Warning", warning);
	}

	// Remaining segments are kept as indices into the input. Removal keeps the iteration order stable for tie-breaking.
	std::vector<std::size_t> remaining(segments.size());
	for (std::size_t i = 0; i < remaining.size(); ++i) {
		remaining[i] = i;
	}

	const std::size_t seed = westernmostStart(segments);
	remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(seed));
	std::vector<Point2D> chain = segments[seed];

	std::size_t flipped = 0u;
	double totalGap     = 0.0;
	while (!remaining.empty()) {
		const Point2D endPoint = chain.back();

		std::size_t bestPos = 0;
		double bestDist     = std::numeric_limits<double>::infinity();
		bool bestFlip       = false;

		for (std::size_t pos = 0; pos < remaining.size(); ++pos) {
			const LineSegment& candidate = segments[remaining[pos]];

			const double dStart = distance(endPoint, candidate.front());
			if (dStart < bestDist) {
				bestPos  = pos;
				bestDist = dStart;
				bestFlip = false;
			}

			// Strict comparison: for a zero-length segment start and end are the same candidate and the start wins.
			const double dEnd = distance(endPoint, candidate.back());
			if (dEnd < bestDist) {
				bestPos  = pos;
				bestDist = dEnd;
				bestFlip = true;
			}
		}

		const LineSegment& next = segments[remaining[bestPos]];
		remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(bestPos));

		if (bestFlip) {
			appendJoined(chain, std::next(next.rbegin()), next.rend());
			++flipped;
		} else {
			appendJoined(chain, std::next(next.begin()), next.end());
		}
		totalGap += bestDist;
	}

	Polyline stitched(std::move(chain));

	if (debugger) {
		debugger->log("Result", std::to_string(stitched.size()) + " points, length " + std::to_string(stitched.length()) + " m");
		debugger->log("Joins", std::to_string(flipped) + " segments reversed, summed join gap " + std::to_string(totalGap) + " m");
		debugger->add("Stitched Coastline", debugging::drawOverlay(stitched, {}));
		debugger->endStage();
	}

	return stitched;
}

} // namespace coastvi::cvi::core
