#pragma once

#include <opencv2/core/mat.hpp>

#include <compare>
#include <vector>

// A grid is one game frame: a rectangular matrix of small colour indices.
// Rows are validated once when the grid is built. Afterwards the grid is immutable and all analysis stages read it through mat().
namespace gridlens::analysis::core {

using GridRows = std::vector<std::vector<int>>; //!< Raw row-major input as delivered by the caller.

//! Cell position in a grid. (0, 0) is the top-left cell.
struct Cell {
	int row;
	int col;

	auto operator<=>(const Cell&) const = default;
};

//! Validation parameters for raw grid input.
struct GridConfig {
	int paletteSize{16}; //!< Valid colours are [0, paletteSize). ARC frames use 10 or 16. At most 256.
};

class Grid {
public:
	/*! Validate raw rows and build a grid.
	 * \param [in] rows   Row-major colour values.
	 * \param [in] config Palette declaration.
	 * \throws GridFormatError for empty input, ragged rows or out-of-palette values.
	 */
	static Grid fromRows(const GridRows& rows, const GridConfig& config = GridConfig{});

	int rows() const { return m_cells.rows; }
	int cols() const { return m_cells.cols; }
	int cellCount() const { return m_cells.rows * m_cells.cols; }
	bool isSquare() const { return m_cells.rows == m_cells.cols; }
	bool sameShape(const Grid& other) const { return rows() == other.rows() && cols() == other.cols(); }
	bool contains(Cell cell) const { return cell.row >= 0 && cell.col >= 0 && cell.row < rows() && cell.col < cols(); }

	int at(int row, int col) const { return m_cells.at<unsigned char>(row, col); }
	int at(Cell cell) const { return at(cell.row, cell.col); }

	//! Read-only view of the colour matrix (CV_8UC1). Do not write through it.
	const cv::Mat& mat() const { return m_cells; }

	GridRows toRows() const;

	bool operator==(const Grid& other) const;

private:
	explicit Grid(cv::Mat cells);

private:
	cv::Mat m_cells; //!< CV_8UC1, rows x cols.
};

} // namespace gridlens::analysis::core
