#include "analysis/core/deltaAnalyzer.hpp"

#include "analysis/core/errors.hpp"
#include "analysis/core/gridAnalyzer.hpp"

#include <algorithm>

#include <opencv2/core.hpp>

namespace gridlens::analysis::core {

namespace {

static void requireSameShape(const Grid& before, const Grid& after) {
	if (!before.sameShape(after)) {
		throw DimensionMismatchError(before.rows(), before.cols(), after.rows(), after.cols());
	}
}

//! 8-bit mask, non-zero where the frames differ.
static cv::Mat differenceMask(const Grid& before, const Grid& after) {
	cv::Mat mask;
	cv::compare(before.mat(), after.mat(), mask, cv::CMP_NE);
	return mask;
}

} // namespace

std::size_t DeltaResult::count(TransformKind kind) const {
	return static_cast<std::size_t>(
	        std::count_if(transformations.begin(), transformations.end(), [kind](const ComponentTransformation& t) { return t.kind == kind; }));
}

int countChangedPixels(const Grid& before, const Grid& after) {
	requireSameShape(before, after);
	return cv::countNonZero(differenceMask(before, after));
}

std::vector<Cell> changedCells(const Grid& before, const Grid& after) {
	requireSameShape(before, after);

	const cv::Mat mask = differenceMask(before, after);
	std::vector<cv::Point> points;
	if (cv::countNonZero(mask) > 0) {
		cv::findNonZero(mask, points);
	}

	std::vector<Cell> cells;
	cells.reserve(points.size());
	for (const cv::Point& p: points) {
		cells.push_back({p.y, p.x});
	}
	// findNonZero scans row by row already. Sorting keeps the order explicit.
	std::sort(cells.begin(), cells.end());
	return cells;
}

DeltaResult analyseDelta(const Grid& before, const Grid& after, const MatchConfig& config) {
	DeltaResult result{};
	result.changedCells  = changedCells(before, after);
	result.pixelsChanged = static_cast<int>(result.changedCells.size());

	const GridAnalysis beforeAnalysis = analyseGrid(before);
	const GridAnalysis afterAnalysis  = analyseGrid(after);
	result.transformations            = matchComponents(beforeAnalysis.components, afterAnalysis.components, config);
	return result;
}

DeltaResult analyseDelta(const GridRows& before, const GridRows& after, const GridConfig& gridConfig, const MatchConfig& config) {
	return analyseDelta(Grid::fromRows(before, gridConfig), Grid::fromRows(after, gridConfig), config);
}

} // namespace gridlens::analysis::core
