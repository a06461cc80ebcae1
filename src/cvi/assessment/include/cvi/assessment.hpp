#pragma once

#include "cvi/core/compositeScorer.hpp"
#include "cvi/core/debugVisualizer.hpp"
#include "cvi/core/dimensionScorer.hpp"
#include "cvi/core/polyline.hpp"
#include "cvi/core/transectSampler.hpp"
#include "cvi/core/transectSet.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace coastvi::cvi {

//! Label -> value pairs delivered by an external scoring collaborator (one per transect it could evaluate).
using Attachments = std::vector<std::pair<std::string, std::optional<double>>>;

/*! Runs the vulnerability index computation for one stretch of coast.
 *  Process: The user
 *   - Calls generateTransects() with the coastline segments (or setTransects() with transects produced earlier).
 *   - Hands the per-transect results of the external scoring steps to attachScores() / attachValues(). Results are joined by label.
 *   - Calls computeIndex() to aggregate, normalise and classify the composite index.
 */
class Assessment {
public:
	explicit Assessment(core::DebugVisualizer* debugger = nullptr);

	//! Stitch the coastline and sample transects. Replaces all previous transects and scores.
	//! \throws core::InputError on empty or invalid coastline input or invalid parameters.
	const core::TransectSet& generateTransects(const std::vector<core::LineSegment>& segments, const core::SamplingParams& params);

	//! Use transects generated by an earlier run. \throws core::InputError on duplicate labels.
	void setTransects(std::vector<core::Transect> transects, double processedLength);

	//! Attach ready-made scores of one dimension. \return Number of attachments that matched a transect.
	std::size_t attachScores(const std::string& dimension, const Attachments& scores);

	//! Score raw measurements of one dimension with its table and attach them. \return Number of attachments that matched a transect.
	std::size_t attachValues(const core::DimensionTable& dimension, const Attachments& values);

	//! Aggregate the attached scores into the composite index and store it on every transect.
	std::vector<core::CompositeRecord> computeIndex(const core::ThresholdTable& composite);

	const core::TransectSet& transects() const { return m_transects; }
	const core::Polyline& coastline() const { return m_coastline; }
	double processedLength() const { return m_processedLength; } //!< Sampled coastline length (m).

private:
	void logJoin(const std::string& dimension, std::size_t matched, const std::vector<std::string>& misses);

private:
	core::DebugVisualizer* m_debugger{nullptr}; //!< Optional diagnostics sink. Not owned.

	core::Polyline m_coastline;   //!< Stitched coastline of the last generateTransects() call.
	core::TransectSet m_transects; //!< Transects of the current run.
	double m_processedLength{0.0};
};

} // namespace coastvi::cvi
