#pragma once

#include "analysis/core/componentMatcher.hpp"
#include "analysis/core/grid.hpp"

#include <vector>

namespace gridlens::analysis::core {

//! Changes between two consecutive frames.
struct DeltaResult {
	int pixelsChanged{0};                                 //!< Number of cells whose colour differs.
	std::vector<Cell> changedCells;                       //!< Positions of those cells in row-major order.
	std::vector<ComponentTransformation> transformations; //!< Component-level changes. See matchComponents().

	//! Number of transformations of a given kind.
	std::size_t count(TransformKind kind) const;
};

/*! Count cells whose colour differs between two frames.
 * \throws DimensionMismatchError if the grids differ in shape.
 */
int countChangedPixels(const Grid& before, const Grid& after);

/*! Positions of cells whose colour differs, row-major.
 * \throws DimensionMismatchError if the grids differ in shape.
 */
std::vector<Cell> changedCells(const Grid& before, const Grid& after);

/*! Compare two frames at pixel and component level.
 *  Both frames are analysed independently with analyseGrid() and their components matched with matchComponents().
 *
 * \param [in] before Earlier frame.
 * \param [in] after  Later frame.
 * \param [in] config Component matching parameters.
 * \throws     DimensionMismatchError if the grids differ in shape.
 */
DeltaResult analyseDelta(const Grid& before, const Grid& after, const MatchConfig& config = MatchConfig{});

//! Validate raw rows and compare them. Throws GridFormatError before any comparison takes place.
DeltaResult analyseDelta(const GridRows& before, const GridRows& after, const GridConfig& gridConfig = GridConfig{},
                         const MatchConfig& config = MatchConfig{});

} // namespace gridlens::analysis::core
