#pragma once

#include "analysis/core/grid.hpp"

#include <opencv2/core/types.hpp>

#include <map>
#include <vector>

namespace gridlens::analysis::core {

//! Maximal 4-connected region of one colour.
struct Component {
	int id;                  //!< Discovery index in the row-major scan. Equals the index in GridAnalysis::components.
	int color;               //!< Colour index shared by all member cells.
	int size;                //!< Number of member cells.
	cv::Rect bounds;         //!< Bounding box in cells (x = column, y = row).
	cv::Point2d centroid;    //!< Mean member position (x = column, y = row).
	std::vector<Cell> cells; //!< Member cells in flood-fill order.

	Cell topLeft() const { return {bounds.y, bounds.x}; }
	bool covers(Cell cell) const { return bounds.contains(cv::Point{cell.col, cell.row}); }
};

//! Independent exact-equality checks of the grid against transformed copies of itself.
struct Symmetry {
	bool horizontal{false};    //!< Equal to itself with every row reversed (left-right mirror).
	bool vertical{false};      //!< Equal to itself with the row order reversed (top-bottom mirror).
	bool diagonal{false};      //!< Equal to its transpose. Always false for non-square grids.
	bool antiDiagonal{false};  //!< Equal to its anti-transpose. Always false for non-square grids.
	bool rotational180{false}; //!< Equal to itself rotated by 180 degrees. Any shape.

	//! Fraction of the five flags that hold.
	double score() const;
};

//! Structural facts about a single grid.
struct GridAnalysis {
	int rows{0};
	int cols{0};
	double entropy{0.0};                //!< Shannon entropy of the colour distribution in bits.
	std::vector<Component> components;  //!< Partition of the grid in discovery order.
	Symmetry symmetry{};                //!< Symmetry flags.
	std::map<int, int> histogram;       //!< Colour -> cell count. Only colours present.
	std::vector<std::vector<int>> adjacency; //!< adjacency[i]: sorted ids of components sharing an edge with component i.

	//! Colour with the most cells. Lowest colour index wins ties.
	int dominantColor() const;

	//! Components of one colour, in discovery order.
	std::vector<const Component*> componentsOfColor(int color) const;

	//! Total cell count of a colour. Zero if absent.
	int cellCount(int color) const;
};

/*! Compute entropy, connected components, adjacency and symmetry of a grid.
 * \param [in] grid Validated grid.
 * \return     Fresh analysis. Nothing is cached between calls.
 */
GridAnalysis analyseGrid(const Grid& grid);

/*! Validate raw rows and analyse them.
 * \throws GridFormatError if the rows do not form a valid grid.
 */
GridAnalysis analyseGrid(const GridRows& rows, const GridConfig& config = GridConfig{});

//! Evaluate the five symmetry checks.
Symmetry analyseSymmetry(const Grid& grid);

} // namespace gridlens::analysis::core
