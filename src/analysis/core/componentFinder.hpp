#pragma once

#include "analysis/core/grid.hpp"
#include "analysis/core/gridAnalyzer.hpp"

#include <opencv2/core/mat.hpp>

#include <vector>

namespace gridlens::analysis::core {

//! Result of connected-component labelling.
struct Labelling {
	cv::Mat labels;                    //!< CV_32SC1, same shape as the grid. labels(r, c) = id of the component owning the cell.
	std::vector<Component> components; //!< Components in discovery order.
};

/*! Label all 4-connected same-colour regions of a grid.
 *  Seeds are taken in row-major order, so component ids are reproducible for a given grid.
 *  Every cell is assigned exactly once. Single cells and the background colour form components too.
 *
 * \param [in] grid Validated grid.
 * \return     Label image and component list.
 */
Labelling labelComponents(const Grid& grid);

/*! Build the component adjacency graph from a label image.
 * \param [in] labels         Label image produced by labelComponents().
 * \param [in] componentCount Number of labels.
 * \return     For each component the sorted ids of components sharing at least one edge with it.
 */
std::vector<std::vector<int>> buildAdjacency(const cv::Mat& labels, std::size_t componentCount);

} // namespace gridlens::analysis::core
