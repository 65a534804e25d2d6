#include "analysis/core/gridAnalyzer.hpp"

#include "componentFinder.hpp"
#include "statistics.hpp"

#include <algorithm>

#include <opencv2/core.hpp>

namespace gridlens::analysis::core {

namespace {

//! Grid transformations checked for symmetry. Subset of D4 plus the two mirrors.
enum class Transform : unsigned char { FlipX, FlipY, Diag, AntiDiag, Rot180 };

static cv::Mat applyTransform(const cv::Mat& cells, const Transform t) {
	cv::Mat out;
	switch (t) {
	case Transform::FlipX:
		cv::flip(cells, out, 1);
		break;
	case Transform::FlipY:
		cv::flip(cells, out, 0);
		break;
	case Transform::Diag:
		cv::transpose(cells, out);
		break;
	case Transform::AntiDiag:
		cv::transpose(cells, out);
		cv::flip(out, out, -1);
		break;
	case Transform::Rot180:
		cv::flip(cells, out, -1);
		break;
	}
	return out;
}

//! True if the grid equals its transformed copy cell by cell.
static bool isInvariant(const cv::Mat& cells, const Transform t) {
	const cv::Mat transformed = applyTransform(cells, t);
	if (transformed.size() != cells.size()) {
		return false;
	}
	return cv::countNonZero(cells != transformed) == 0;
}

static std::map<int, int> colorHistogram(const Grid& grid) {
	std::map<int, int> histogram;
	const cv::Mat& cells = grid.mat();
	for (int r = 0; r < cells.rows; ++r) {
		const auto* row = cells.ptr<unsigned char>(r);
		for (int c = 0; c < cells.cols; ++c) {
			++histogram[row[c]];
		}
	}
	return histogram;
}

} // namespace

double Symmetry::score() const {
	const int count = static_cast<int>(horizontal) + static_cast<int>(vertical) + static_cast<int>(diagonal) + static_cast<int>(antiDiagonal) +
	                  static_cast<int>(rotational180);
	return static_cast<double>(count) / 5.0;
}

int GridAnalysis::dominantColor() const {
	const auto it = std::max_element(histogram.begin(), histogram.end(), [](const auto& a, const auto& b) { return a.second < b.second; });
	return it == histogram.end() ? 0 : it->first;
}

std::vector<const Component*> GridAnalysis::componentsOfColor(int color) const {
	std::vector<const Component*> out;
	for (const Component& component: components) {
		if (component.color == color) {
			out.push_back(&component);
		}
	}
	return out;
}

int GridAnalysis::cellCount(int color) const {
	const auto it = histogram.find(color);
	return it == histogram.end() ? 0 : it->second;
}

Symmetry analyseSymmetry(const Grid& grid) {
	const cv::Mat& cells = grid.mat();

	Symmetry symmetry{};
	symmetry.horizontal    = isInvariant(cells, Transform::FlipX);
	symmetry.vertical      = isInvariant(cells, Transform::FlipY);
	symmetry.rotational180 = isInvariant(cells, Transform::Rot180);

	// Transposition changes the shape of non-square grids, so they can never match.
	if (grid.isSquare()) {
		symmetry.diagonal     = isInvariant(cells, Transform::Diag);
		symmetry.antiDiagonal = isInvariant(cells, Transform::AntiDiag);
	}
	return symmetry;
}

GridAnalysis analyseGrid(const Grid& grid) {
	GridAnalysis analysis{};
	analysis.rows      = grid.rows();
	analysis.cols      = grid.cols();
	analysis.histogram = colorHistogram(grid);
	analysis.entropy   = shannonEntropy(analysis.histogram);

	Labelling labelling = labelComponents(grid);
	analysis.adjacency  = buildAdjacency(labelling.labels, labelling.components.size());
	analysis.components = std::move(labelling.components);

	analysis.symmetry = analyseSymmetry(grid);
	return analysis;
}

GridAnalysis analyseGrid(const GridRows& rows, const GridConfig& config) {
	return analyseGrid(Grid::fromRows(rows, config));
}

} // namespace gridlens::analysis::core
