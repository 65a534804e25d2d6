#pragma once

#include "analysis/core/colorPalette.hpp"
#include "analysis/core/componentMatcher.hpp"
#include "analysis/core/grid.hpp"
#include "analysis/core/gridAnalyzer.hpp"
#include "analysis/grounding/claim.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace gridlens::analysis::grounding {

//! Outcome of checking a statement against grid facts.
struct VerificationResult {
	bool verified{false};            //!< True only if every claim in the statement was checked and holds.
	std::vector<std::string> issues; //!< One entry per failed or uncheckable claim, in statement order.
	std::vector<Claim> claims;       //!< Claims recognised in the statement.
};

struct VerifierConfig {
	core::ColorPalette palette{}; //!< Colour names the statement may use. Supplied by the caller, never global.
	core::MatchConfig match{};    //!< Correspondence parameters for movement claims.
};

/*! Check a natural-language statement against the current frame.
 *  The statement is split into sentences and each is parsed into a Claim. The result is the conjunction of all claims:
 *   - Position:  some component of the named colour has the claimed (row, col) inside its bounding box.
 *   - Count:     "pixels"/"cells" compare the colour's total cell count, other nouns its number of components.
 *   - Movement:  needs the prior frame. Holds if matching prior and current components yields a Moved transformation whose source covers
 *                the claimed origin and whose destination covers the claimed target.
 *   - Anything else is reported as unverifiable and fails the statement.
 *  Soft failures (unknown colour, missing prior frame) are issues, not exceptions.
 *
 * \param [in] statement  Free text claim(s).
 * \param [in] priorGrid  Previous frame, or nullptr if there is none.
 * \param [in] components Components of the current frame (GridAnalysis::components).
 * \param [in] config     Colour names and matching parameters.
 */
VerificationResult verifyStatement(std::string_view statement, const core::Grid* priorGrid, const std::vector<core::Component>& components,
                                   const VerifierConfig& config = VerifierConfig{});

} // namespace gridlens::analysis::grounding
