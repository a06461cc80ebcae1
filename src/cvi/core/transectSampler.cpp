#include "cvi/core/transectSampler.hpp"

#include "cvi/core/errors.hpp"
#include "cvi/core/overlay.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace coastvi::cvi::core {

//! Lookahead distance used to estimate the local tangent (coordinate units).
static constexpr double TANGENT_LOOKAHEAD = 1.0;

static bool isPositiveFinite(double v) {
	return std::isfinite(v) && v > 0.0;
}

double usableLength(const Polyline& coastline, double maxTotalLength) {
	return std::min(maxTotalLength, coastline.length());
}

std::vector<Transect> sampleTransects(const Polyline& coastline, const SamplingParams& params, DebugVisualizer* debugger) {
	if (!isPositiveFinite(params.spacing) || !isPositiveFinite(params.transectLength) || !isPositiveFinite(params.maxTotalLength)) {
		throw InputError("Sampling spacing, transect length and maximum length must be positive.");
	}
	if (coastline.size() < 2u) {
		throw InputError("Coastline needs at least two points to be sampled.");
	}

	if (debugger) {
		debugger->beginStage("Sample Transects");
	}

	// 1. Truncate the coastline to the processed length and resample it at equal arc-length steps.
	const double used            = usableLength(coastline, params.maxTotalLength);
	const auto numPoints         = static_cast<std::size_t>(std::floor(used / params.spacing));
	const Polyline truncated     = coastline.resample(used, std::max<std::size_t>(numPoints, 1u)); // Keep a direction if used < spacing.
	const double truncatedLength = truncated.length();

	if (debugger) {
		debugger->log("Processed Length",
		              std::to_string(used / 1000.0) + " km (of total " + std::to_string(coastline.length() / 1000.0) + " km)");
	}

	// 2. Place one perpendicular transect per sample position.
	std::vector<Transect> transects;
	transects.reserve(numPoints + 1u);
	std::size_t degenerate = 0u;

	const double half         = params.transectLength / 2.0;
	const double endTolerance = 1e-9 * std::max(1.0, truncatedLength); //!< Absorbs rounding in the resampled length.
	for (std::size_t i = 0; i <= numPoints; ++i) {
		const double d = static_cast<double>(i) * params.spacing;
		if (d > truncatedLength + endTolerance) {
			continue;
		}

		// Look ahead along the coast. The sample on the very end has nothing ahead of it and looks backwards instead.
		const Point2D point = truncated.pointAt(d);
		Point2D delta;
		if (d < truncatedLength - endTolerance) {
			delta = truncated.pointAt(std::min(d + TANGENT_LOOKAHEAD, truncatedLength)) - point;
		} else {
			delta = point - truncated.pointAt(std::max(truncatedLength - TANGENT_LOOKAHEAD, 0.0));
		}
		const double norm   = std::hypot(delta.x, delta.y);
		if (norm == 0.0) {
			// Degenerate tangent (repeated points). Skip the position, it does not consume a label.
			++degenerate;
			if (debugger)
				debugger->log("Skipped", "zero-length tangent at " + std::to_string(d) + " m");
			continue;
		}

		const Point2D tangent = delta / norm;
		const Point2D normal(-tangent.y, tangent.x);

		const std::size_t index = transects.size();
		transects.push_back(Transect{
		        "T" + std::to_string(index + 1u),
		        point - normal * half,
		        point + normal * half,
		        index,
		        d,
		});
	}

	if (debugger) {
		debugger->log("Transects", std::to_string(transects.size()) + " emitted, " + std::to_string(degenerate) + " positions skipped");
		debugger->add("Transects", debugging::drawOverlay(truncated, transects));
		debugger->endStage();
	}

	return transects;
}

} // namespace coastvi::cvi::core
