#include "gridFile.hpp"

#include "analysis/core/colorPalette.hpp"
#include "analysis/core/deltaAnalyzer.hpp"
#include "analysis/core/description.hpp"
#include "analysis/core/errors.hpp"
#include "analysis/core/gridAnalyzer.hpp"
#include "analysis/grounding/coordinateExtractor.hpp"
#include "analysis/grounding/statementVerifier.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gridlens::tools {

// Developer tool to inspect what the analysis sees in a frame.
// Usage: gridInspector <frame.txt> [<next.txt>] [--palette N] [--claim "text"]
//  - One frame:  entropy, symmetry, histogram and components.
//  - Two frames: additionally the delta from the first to the second frame.
//  - --claim:    verify a statement against the last frame (the first frame is the prior one).

struct Options {
	std::vector<std::string> files;
	analysis::core::GridConfig grid{};
	std::optional<std::string> claim;
};

static std::optional<Options> parseOptions(int argc, char** argv) {
	Options options{};
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg(argv[i]);
		if (arg == "--claim" && i + 1 < argc) {
			options.claim = argv[++i];
		} else if (arg == "--palette" && i + 1 < argc) {
			const std::string_view value(argv[++i]);
			const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), options.grid.paletteSize);
			if (ec != std::errc{} || ptr != value.data() + value.size()) {
				return std::nullopt;
			}
		} else if (arg.starts_with("--")) {
			return std::nullopt;
		} else {
			options.files.emplace_back(arg);
		}
	}
	if (options.files.empty() || options.files.size() > 2u) {
		return std::nullopt;
	}
	return options;
}

static void printAnalysis(const analysis::core::GridAnalysis& analysis, const analysis::core::ColorPalette& palette) {
	using namespace analysis::core;

	std::cout << std::format("Grid {}x{}  entropy={:.3f} bits  components={}\n", analysis.rows, analysis.cols, analysis.entropy, analysis.components.size());
	const Symmetry& s = analysis.symmetry;
	std::cout << std::format("Symmetry: horizontal={} vertical={} diagonal={} antiDiagonal={} rotational180={} score={:.2f}\n", s.horizontal, s.vertical,
	                         s.diagonal, s.antiDiagonal, s.rotational180, s.score());

	std::cout << "Histogram:";
	for (const auto& [color, count]: analysis.histogram) {
		std::cout << ' ' << palette.nameOf(color) << '=' << count;
	}
	std::cout << '\n';

	for (const Component& c: analysis.components) {
		std::cout << std::format("  #{:<3} {:<10} size={:<4} bounds=({}, {})-({}, {}) centroid=({:.2f}, {:.2f}) {} {}\n", c.id, palette.nameOf(c.color), c.size,
		                         c.bounds.y, c.bounds.x, c.bounds.y + c.bounds.height - 1, c.bounds.x + c.bounds.width - 1, c.centroid.y, c.centroid.x,
		                         shapeName(classifyShape(c)), zoneName(zoneOf(c.centroid, analysis.rows, analysis.cols)));
	}
}

static int run(const Options& options) {
	using namespace analysis;

	const core::ColorPalette palette = core::ColorPalette::arc();

	std::vector<core::Grid> frames;
	for (const std::string& file: options.files) {
		frames.push_back(core::Grid::fromRows(readGridFile(file), options.grid));
	}

	const core::GridAnalysis current = core::analyseGrid(frames.back());
	printAnalysis(current, palette);

	const core::Grid* prior = frames.size() == 2u ? &frames.front() : nullptr;
	if (prior != nullptr) {
		const core::DeltaResult delta = core::analyseDelta(*prior, frames.back());
		std::cout << std::format("Delta: pixelsChanged={} transformations={}\n", delta.pixelsChanged, delta.transformations.size());
		for (const core::Insight& insight: core::describeDelta(delta, palette, current.rows, current.cols)) {
			std::cout << "  - " << insight.description << '\n';
		}
	}

	if (options.claim) {
		for (const grounding::CoordinateCandidate& c: grounding::extractCoordinates(*options.claim)) {
			std::cout << std::format("Coordinate {} -> ({}, {})\n", c.span, c.first, c.second);
		}

		const grounding::VerificationResult result = grounding::verifyStatement(*options.claim, prior, current.components, {palette, {}});
		std::cout << "Verified: " << (result.verified ? "yes" : "no") << '\n';
		for (const std::string& issue: result.issues) {
			std::cout << "  ! " << issue << '\n';
		}
	}
	return 0;
}

} // namespace gridlens::tools

int main(int argc, char** argv) {
	const auto options = gridlens::tools::parseOptions(argc, argv);
	if (!options) {
		std::cerr << "Usage: gridInspector <frame.txt> [<next.txt>] [--palette N] [--claim \"text\"]\n";
		return 2;
	}

	try {
		return gridlens::tools::run(*options);
	} catch (const gridlens::analysis::core::GridFormatError& e) {
		std::cerr << "[Error] Invalid grid: " << e.what() << '\n';
	} catch (const gridlens::analysis::core::DimensionMismatchError& e) {
		std::cerr << "[Error] " << e.what() << '\n';
	} catch (const std::runtime_error& e) {
		std::cerr << "[Error] " << e.what() << '\n';
	}
	return 1;
}
