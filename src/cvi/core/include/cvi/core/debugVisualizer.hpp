#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace coastvi::cvi::core {

//! Each step in a stage. Either a message, an image, or both.
struct DebugStep {
	std::string name;    //!< Step name.
	std::string message; //!< Free text diagnostic. May be empty.
	cv::Mat image;       //!< Overlay produced by the step. May be empty.
};

//! The index computation has multiple stages (stitching, sampling, scoring). We collect the output per stage.
struct DebugStage {
	std::string name;               //!< Name of the stage.
	std::vector<DebugStep> steps{}; //!< Steps in the order they were added.
};

//! Can be passed to the stage functions to collect intermediate messages and overlays.
class DebugVisualizer {
public:
	void beginStage(std::string name);                    //!< New stage starts. Ends a still active stage.
	void add(std::string name, const cv::Mat& img);       //!< Add an overlay image given some step name.
	void log(std::string name, std::string message);      //!< Add a message. Printed immediately in interactive mode.
	void endStage();

	cv::Mat buildMosaic();     //!< Returns mosaic of all overlay images. Ends currently active stage.
	std::string buildReport(); //!< Returns all messages, grouped by stage. Ends currently active stage.

	void setInteractive(bool interactive); //!< Enable immediate message output in log().
	void clear();

	const std::vector<DebugStage>& stages() const { return m_stages; }

private:
	static cv::Mat toBgr(const cv::Mat& in);

private:
	bool m_interactive{false}; //!< Immediately print messages when they are added.

	DebugStage m_currentStage{};        //!< Currently active stage.
	bool m_hasActiveStage{false};       //!< A stage is active.
	std::vector<DebugStage> m_stages{}; //!< Collection of debug info for all stages.
};

} // namespace coastvi::cvi::core
