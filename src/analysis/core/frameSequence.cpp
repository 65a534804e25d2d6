#include "analysis/core/frameSequence.hpp"

#include "analysis/core/deltaAnalyzer.hpp"

namespace gridlens::analysis::core {

static DeltaSummary summariseDelta(const Grid& previous, const GridAnalysis& previousAnalysis, const Grid& current, const GridAnalysis& currentAnalysis,
                                   const SequenceConfig& config) {
	DeltaResult delta{};
	delta.transformations = matchComponents(previousAnalysis.components, currentAnalysis.components, config.match);

	DeltaSummary summary{};
	if (previous.sameShape(current)) {
		delta.pixelsChanged   = countChangedPixels(previous, current);
		summary.pixelsChanged = delta.pixelsChanged;
	}

	summary.appeared    = delta.count(TransformKind::Appeared);
	summary.disappeared = delta.count(TransformKind::Disappeared);
	summary.matched     = delta.transformations.size() - summary.appeared - summary.disappeared;
	summary.insights    = describeDelta(delta, config.palette, current.rows(), current.cols());
	return summary;
}

std::vector<FrameSummary> summariseSequence(const std::vector<Grid>& frames, const SequenceConfig& config) {
	std::vector<FrameSummary> summaries;
	summaries.reserve(frames.size());

	std::optional<GridAnalysis> previous;
	for (std::size_t i = 0; i < frames.size(); ++i) {
		GridAnalysis analysis = analyseGrid(frames[i]);

		FrameSummary summary{};
		summary.index          = i;
		summary.entropy        = analysis.entropy;
		summary.symmetry       = analysis.symmetry;
		summary.componentCount = analysis.components.size();
		summary.dominantColor  = analysis.dominantColor();
		if (previous) {
			summary.delta = summariseDelta(frames[i - 1], *previous, frames[i], analysis, config);
		}

		summaries.push_back(std::move(summary));
		previous = std::move(analysis);
	}
	return summaries;
}

} // namespace gridlens::analysis::core
