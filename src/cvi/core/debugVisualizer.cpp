#include "cvi/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#include <opencv2/imgproc.hpp>

namespace coastvi::cvi::core {

void DebugVisualizer::setInteractive(bool interactive) {
	m_interactive = interactive;
}

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		beginStage("General");
	}

	m_currentStage.steps.push_back(DebugStep{std::move(name), {}, img.clone()});
}

void DebugVisualizer::log(std::string name, std::string message) {
	if (!m_hasActiveStage) {
		beginStage("General");
	}

	if (m_interactive) {
		std::cout << "[" << m_currentStage.name << "] " << name << ": " << message << '\n';
	}
	m_currentStage.steps.push_back(DebugStep{std::move(name), std::move(message), {}});
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

std::string DebugVisualizer::buildReport() {
	if (m_hasActiveStage) {
		endStage();
	}

	std::ostringstream out;
	for (const auto& stage: m_stages) {
		out << "== " << stage.name << '\n';
		for (const auto& step: stage.steps) {
			if (step.message.empty()) {
				continue;
			}
			out << "  " << step.name << ": " << step.message << '\n';
		}
	}
	return out.str();
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int DEFAULT_TILE_W = 480;
	static constexpr int STAGE_HEADER_H = 34;
	static constexpr int TILE_LABEL_H   = 28;
	static constexpr int TILE_PAD       = 4;
	static constexpr int MAX_MOSAIC_W   = 2000;
	static constexpr int MAX_MOSAIC_H   = 3000;

	static const cv::Scalar BG(20, 20, 20);
	static const cv::Scalar HEADER_BG(0, 0, 0);
	static const cv::Scalar HEADER_FG(255, 255, 255);

	if (m_hasActiveStage) {
		endStage();
	}

	// Only image steps take part in the mosaic. Stages without images get no column.
	std::vector<DebugStage> visual;
	for (const auto& stage: m_stages) {
		DebugStage column{stage.name, {}};
		for (const auto& step: stage.steps) {
			if (!step.image.empty()) {
				column.steps.push_back(step);
			}
		}
		if (!column.steps.empty()) {
			visual.push_back(std::move(column));
		}
	}
	if (visual.empty()) {
		return {};
	}

	size_t maxSteps = 0;
	for (const auto& stage: visual) {
		maxSteps = std::max(maxSteps, stage.steps.size());
	}

	const int cols = static_cast<int>(visual.size());
	int tileW      = DEFAULT_TILE_W;
	tileW          = std::min(tileW, std::max(1, MAX_MOSAIC_W / std::max(1, cols)));
	tileW          = std::min(tileW, std::max(1, (MAX_MOSAIC_H - STAGE_HEADER_H) / static_cast<int>(maxSteps)));

	const int tileH   = tileW;
	const int mosaicW = tileW * cols;
	const int mosaicH = STAGE_HEADER_H + static_cast<int>(maxSteps) * tileH;

	cv::Mat mosaic(mosaicH, mosaicW, CV_8UC3, BG);

	// Headers: one stage per column.
	for (int c = 0; c < cols; ++c) {
		const auto& stage = visual[static_cast<size_t>(c)];

		cv::Mat header = mosaic(cv::Rect(c * tileW, 0, tileW, STAGE_HEADER_H));
		cv::rectangle(header, cv::Rect(0, 0, header.cols, header.rows), HEADER_BG, cv::FILLED);
		const std::string stageName  = stage.name.empty() ? "Stage " + std::to_string(c + 1) : stage.name;
		const std::string headerText = stageName + " (" + std::to_string(stage.steps.size()) + ")";
		cv::putText(header, headerText, cv::Point(8, STAGE_HEADER_H - 10), cv::FONT_HERSHEY_SIMPLEX, 0.75, HEADER_FG, 1, cv::LINE_AA);
	}

	// Tiles: one row per step index, blank if a stage has fewer steps.
	for (size_t r = 0; r < maxSteps; ++r) {
		const int y = STAGE_HEADER_H + static_cast<int>(r) * tileH;
		for (int c = 0; c < cols; ++c) {
			const auto& stage = visual[static_cast<size_t>(c)];
			if (r >= stage.steps.size()) {
				continue;
			}

			const auto& step = stage.steps[r];
			cv::Mat cell     = mosaic(cv::Rect(c * tileW, y, tileW, tileH));

			// Label bar (separate from image so it doesn't cover content).
			cv::rectangle(cell, cv::Rect(0, 0, cell.cols, TILE_LABEL_H), HEADER_BG, cv::FILLED);
			cv::putText(cell, step.name, cv::Point(TILE_PAD, 20), cv::FONT_HERSHEY_SIMPLEX, 0.55, HEADER_FG, 1, cv::LINE_AA);

			const int availW = std::max(1, tileW - 2 * TILE_PAD);
			const int availH = std::max(1, tileH - TILE_LABEL_H - 2 * TILE_PAD);

			cv::Mat vis = toBgr(step.image);
			const double scale =
			        std::min(static_cast<double>(availW) / static_cast<double>(vis.cols), static_cast<double>(availH) / static_cast<double>(vis.rows));
			const int w             = std::max(1, std::min(availW, static_cast<int>(std::lround(vis.cols * scale))));
			const int h             = std::max(1, std::min(availH, static_cast<int>(std::lround(vis.rows * scale))));
			const int interpolation = (scale < 1.0) ? cv::INTER_AREA : cv::INTER_LINEAR;

			cv::Mat resized;
			cv::resize(vis, resized, cv::Size(w, h), 0.0, 0.0, interpolation);

			const int x0 = TILE_PAD + (availW - w) / 2;
			const int y0 = TILE_LABEL_H + TILE_PAD + (availH - h) / 2;
			resized.copyTo(cell(cv::Rect(x0, y0, w, h)));
		}
	}

	return mosaic;
}

//! Overlays are BGR already. Gray steps are expanded to three channels.
cv::Mat DebugVisualizer::toBgr(const cv::Mat& in) {
	if (in.channels() == 3) {
		return in;
	}
	cv::Mat out;
	cv::cvtColor(in, out, in.channels() == 4 ? cv::COLOR_BGRA2BGR : cv::COLOR_GRAY2BGR);
	return out;
}

} // namespace coastvi::cvi::core
