#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "cvi/assessment.hpp"
#include "cvi/core/errors.hpp"
#include "cvi/core/thresholdConfig.hpp"
#include "cvi/geoJson.hpp"

namespace coastvi::cvi {

// Default sampling in metres. Matches the spacing and cap used for the published assessments.
static constexpr double DEFAULT_SPACING          = 50.0;
static constexpr double DEFAULT_TRANSECT_LENGTH  = 400.0;
static constexpr double DEFAULT_MAX_TOTAL_LENGTH = 15000.0;

static void printUsage() {
	std::cerr << "Usage:\n"
	          << "  cvi_runner transects <coastline.geojson> <out.geojson> [spacing length maxLength] [--debug <mosaic.png>]\n"
	          << "  cvi_runner index <config.json> <transects.geojson> <out.geojson> <dimension>=<scores.geojson>... [--debug <mosaic.png>]\n";
}

static double parseNumber(const std::string& text, const std::string& name) {
	std::size_t used = 0;
	double value     = 0.0;
	try {
		value = std::stod(text, &used);
	} catch (const std::logic_error&) {
		used = 0;
	}
	if (used == 0 || used != text.size()) {
		throw core::InputError("Argument " + name + " is not a number: '" + text + "'.");
	}
	return value;
}

//! Score files are passed as "<dimension>=<path>".
static std::pair<std::string, std::filesystem::path> splitAttachment(const std::string& arg) {
	const auto pos = arg.find('=');
	if (pos == std::string::npos || pos == 0u || pos + 1u == arg.size()) {
		throw core::InputError("Expected <dimension>=<file>, got '" + arg + "'.");
	}
	return {arg.substr(0, pos), arg.substr(pos + 1u)};
}

static void runTransects(const std::vector<std::string>& args, core::DebugVisualizer* debugger) {
	if (args.size() != 2u && args.size() != 5u) {
		throw core::InputError("transects expects 2 or 5 arguments.");
	}

	core::SamplingParams params{DEFAULT_SPACING, DEFAULT_TRANSECT_LENGTH, DEFAULT_MAX_TOTAL_LENGTH};
	if (args.size() == 5u) {
		params.spacing        = parseNumber(args[2], "spacing");
		params.transectLength = parseNumber(args[3], "length");
		params.maxTotalLength = parseNumber(args[4], "maxLength");
	}

	Assessment assessment(debugger);
	const auto& transects = assessment.generateTransects(readCoastline(args[0]), params);
	writeTransects(args[1], assessment);

	std::cout << "Wrote " << transects.size() << " transects covering " << assessment.processedLength() / 1000.0 << " km to " << args[1] << "\n";
}

static void runIndex(const std::vector<std::string>& args, core::DebugVisualizer* debugger) {
	if (args.size() < 3u) {
		throw core::InputError("index expects a configuration, a transect file and an output file.");
	}

	const core::IndexConfig config = core::loadIndexConfig(args[0]);
	const TransectFile input       = readTransects(args[1]);

	Assessment assessment(debugger);
	assessment.setTransects(input.transects, input.processedLength);

	for (std::size_t i = 3; i < args.size(); ++i) {
		const auto [dimension, path] = splitAttachment(args[i]);

		// Raw measurements are classified with the configured table. Without one the file must carry ready scores.
		std::size_t joined = 0u;
		if (const core::DimensionTable* table = config.findDimension(dimension)) {
			joined = assessment.attachValues(*table, readAttachments(path, dimension + "_value"));
		} else {
			joined = assessment.attachScores(dimension, readAttachments(path, dimension + "_score"));
		}
		std::cout << dimension << ": joined " << joined << " of " << assessment.transects().size() << " transects\n";
	}

	assessment.computeIndex(config.composite);
	writeTransects(args[2], assessment);
	std::cout << "Wrote index of " << assessment.transects().size() << " transects to " << args[2] << "\n";
}

} // namespace coastvi::cvi

int main(int argc, char** argv) {
	if (argc < 2) {
		coastvi::cvi::printUsage();
		return 1;
	}

	const std::string command = argv[1];
	std::vector<std::string> args;
	std::optional<std::filesystem::path> mosaicPath;
	for (int i = 2; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "--debug" && i + 1 < argc) {
			mosaicPath = argv[++i];
		} else {
			args.push_back(arg);
		}
	}

	coastvi::cvi::core::DebugVisualizer debug;
	coastvi::cvi::core::DebugVisualizer* debugger = mosaicPath ? &debug : nullptr;

	try {
		if (command == "transects") {
			coastvi::cvi::runTransects(args, debugger);
		} else if (command == "index") {
			coastvi::cvi::runIndex(args, debugger);
		} else {
			coastvi::cvi::printUsage();
			return 1;
		}
	} catch (const coastvi::cvi::core::InputError& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return 1;
	} catch (const coastvi::cvi::core::ConfigError& e) {
		std::cerr << "[Error] Invalid configuration: " << e.what() << "\n";
		return 1;
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return 1;
	}

	if (debugger) {
		std::cout << debug.buildReport();
		const cv::Mat mosaic = debug.buildMosaic();
		if (!mosaic.empty() && !cv::imwrite(mosaicPath->string(), mosaic)) {
			std::cerr << "[Error] Could not write debug mosaic to " << *mosaicPath << "\n";
			return 1;
		}
	}

	return 0;
}
