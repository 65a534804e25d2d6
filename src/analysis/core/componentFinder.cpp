#include "componentFinder.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <array>

namespace gridlens::analysis::core {

namespace {

//! Label value of cells not yet assigned to a component.
static constexpr int UNLABELLED = -1;

//! Von Neumann neighbourhood (row, col offsets). No diagonals.
static constexpr std::array<Cell, 4> NEIGHBOURS = {Cell{-1, 0}, Cell{1, 0}, Cell{0, -1}, Cell{0, 1}};

//! Flood fill from a seed. Assigns `id` to every reached cell and returns the cells in visiting order.
static std::vector<Cell> floodFill(const Grid& grid, cv::Mat& labels, Cell seed, int id) {
	const int color = grid.at(seed);

	std::vector<Cell> members;
	std::vector<Cell> stack{seed};
	labels.at<int>(seed.row, seed.col) = id;

	while (!stack.empty()) {
		const Cell cell = stack.back();
		stack.pop_back();
		members.push_back(cell);

		for (const Cell offset: NEIGHBOURS) {
			const Cell next{cell.row + offset.row, cell.col + offset.col};
			if (!grid.contains(next) || labels.at<int>(next.row, next.col) != UNLABELLED || grid.at(next) != color) {
				continue;
			}
			labels.at<int>(next.row, next.col) = id;
			stack.push_back(next);
		}
	}

	return members;
}

static Component makeComponent(int id, int color, std::vector<Cell> cells) {
	int minRow = cells.front().row;
	int maxRow = minRow;
	int minCol = cells.front().col;
	int maxCol = minCol;

	std::vector<double> rowValues;
	std::vector<double> colValues;
	rowValues.reserve(cells.size());
	colValues.reserve(cells.size());
	for (const Cell cell: cells) {
		minRow = std::min(minRow, cell.row);
		maxRow = std::max(maxRow, cell.row);
		minCol = std::min(minCol, cell.col);
		maxCol = std::max(maxCol, cell.col);
		rowValues.push_back(static_cast<double>(cell.row));
		colValues.push_back(static_cast<double>(cell.col));
	}

	Component component{};
	component.id       = id;
	component.color    = color;
	component.size     = static_cast<int>(cells.size());
	component.bounds   = cv::Rect(minCol, minRow, maxCol - minCol + 1, maxRow - minRow + 1);
	component.centroid = cv::Point2d(mean(colValues), mean(rowValues));
	component.cells    = std::move(cells);
	return component;
}

} // namespace

Labelling labelComponents(const Grid& grid) {
	Labelling result{};
	result.labels = cv::Mat(grid.rows(), grid.cols(), CV_32SC1, cv::Scalar(UNLABELLED));

	for (int r = 0; r < grid.rows(); ++r) {
		for (int c = 0; c < grid.cols(); ++c) {
			if (result.labels.at<int>(r, c) != UNLABELLED) {
				continue;
			}
			const int id = static_cast<int>(result.components.size());
			result.components.push_back(makeComponent(id, grid.at(r, c), floodFill(grid, result.labels, {r, c}, id)));
		}
	}

	return result;
}

std::vector<std::vector<int>> buildAdjacency(const cv::Mat& labels, std::size_t componentCount) {
	std::vector<std::vector<int>> adjacency(componentCount);
	const auto link = [&](int a, int b) {
		if (a == b) {
			return;
		}
		adjacency[static_cast<std::size_t>(a)].push_back(b);
		adjacency[static_cast<std::size_t>(b)].push_back(a);
	};

	// Checking the right and lower neighbour covers every shared edge once.
	for (int r = 0; r < labels.rows; ++r) {
		for (int c = 0; c < labels.cols; ++c) {
			const int id = labels.at<int>(r, c);
			if (c + 1 < labels.cols) {
				link(id, labels.at<int>(r, c + 1));
			}
			if (r + 1 < labels.rows) {
				link(id, labels.at<int>(r + 1, c));
			}
		}
	}

	for (auto& neighbours: adjacency) {
		std::sort(neighbours.begin(), neighbours.end());
		neighbours.erase(std::unique(neighbours.begin(), neighbours.end()), neighbours.end());
	}
	return adjacency;
}

} // namespace gridlens::analysis::core
