#pragma once

#include "analysis/core/colorPalette.hpp"
#include "analysis/core/componentMatcher.hpp"
#include "analysis/core/description.hpp"
#include "analysis/core/grid.hpp"
#include "analysis/core/gridAnalyzer.hpp"

#include <optional>
#include <vector>

namespace gridlens::analysis::core {

//! Change from the previous frame.
struct DeltaSummary {
	std::optional<int> pixelsChanged; //!< Empty if the two frames differ in shape.
	std::size_t matched{0u};          //!< Moved, resized and recoloured components.
	std::size_t appeared{0u};
	std::size_t disappeared{0u};
	std::vector<Insight> insights;
};

//! Condensed analysis of one frame in a sequence.
struct FrameSummary {
	std::size_t index{0u};
	double entropy{0.0};
	Symmetry symmetry{};
	std::size_t componentCount{0u};
	int dominantColor{0};
	std::optional<DeltaSummary> delta; //!< Empty for the first frame.
};

struct SequenceConfig {
	MatchConfig match{};
	ColorPalette palette{ColorPalette::arc()}; //!< Names used in insights.
};

/*! Summarise a sequence of frames.
 *  Each frame is analysed on its own. Every frame after the first is compared with its predecessor.
 *  Frames of different shape are still matched at component level, only the pixel count is left empty.
 *
 * \param [in] frames Frames in temporal order.
 * \param [in] config Matching parameters and colour names.
 * \return     One summary per frame.
 */
std::vector<FrameSummary> summariseSequence(const std::vector<Grid>& frames, const SequenceConfig& config = SequenceConfig{});

} // namespace gridlens::analysis::core
