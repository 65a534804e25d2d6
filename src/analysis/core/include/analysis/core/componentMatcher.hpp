#pragma once

#include "analysis/core/gridAnalyzer.hpp"

#include <optional>
#include <vector>

namespace gridlens::analysis::core {

//! How a component changed between two frames.
enum class TransformKind { Moved, Resized, Recolored, Appeared, Disappeared };

const char* transformKindName(TransformKind kind);

//! Correspondence between a component of the earlier frame and one of the later frame.
struct ComponentTransformation {
	TransformKind kind{TransformKind::Appeared};
	std::optional<Component> before; //!< Source component. Empty for Appeared.
	std::optional<Component> after;  //!< Destination component. Empty for Disappeared.
	int rowShift{0};                 //!< Moved only: translation of the bounding box in rows.
	int colShift{0};                 //!< Moved only: translation of the bounding box in columns.
};

//! Component correspondence parameters.
struct MatchConfig {
	double maxCentroidDistance{10.0}; //!< Components whose centroids are further apart (in cells) never correspond.
};

/*! Find correspondences between the components of two frames.
 *  Precedence per component:
 *   1) Exact: same colour, size and bounds. Not reported.
 *   2) Recolored: same bounds and size, different colour.
 *   3) Moved: same colour and size, bounds of equal extent translated by (rowShift, colShift).
 *   4) Resized: same colour, otherwise different. Nearest centroid.
 *   5) Disappeared / Appeared for whatever is left on either side.
 *  Steps 3 and 4 are greedy nearest-centroid within a colour class. Larger source components are processed first and ties go to the
 *  lower row-major top-left corner. This is a heuristic, not an optimal assignment.
 *
 * \param [in] before Components of the earlier frame (GridAnalysis::components).
 * \param [in] after  Components of the later frame.
 * \param [in] config Matching parameters.
 * \return     Matched pairs ordered by source id, then disappeared by source id, then appeared by destination id.
 * \note       Frames may differ in shape. Only component attributes are compared.
 */
std::vector<ComponentTransformation> matchComponents(const std::vector<Component>& before, const std::vector<Component>& after,
                                                     const MatchConfig& config = MatchConfig{});

} // namespace gridlens::analysis::core
