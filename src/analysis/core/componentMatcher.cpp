#include "analysis/core/componentMatcher.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string_view>
#include <tuple>

#include <opencv2/core.hpp>

namespace gridlens::analysis::core {

namespace {

//! Index of a component in its frame's list. NONE if unmatched.
static constexpr int NONE = -1;

//! Enable matcher diagnostics via environment variable.
static bool deltaDebugEnabled() {
	const char* env = std::getenv("GRIDLENS_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

//! Key for components occupying the same place: bounds and size.
using PlacementKey = std::tuple<int, int, int, int, int>;

static PlacementKey placementKey(const Component& c) {
	return {c.bounds.y, c.bounds.x, c.bounds.height, c.bounds.width, c.size};
}

//! Row-major order of top-left corners.
static bool topLeftBefore(const Component& a, const Component& b) {
	return std::make_pair(a.bounds.y, a.bounds.x) < std::make_pair(b.bounds.y, b.bounds.x);
}

struct Pairing {
	int before{NONE};
	int after{NONE};
	TransformKind kind{TransformKind::Moved};
};

//! Matching state shared by all passes.
struct MatchState {
	const std::vector<Component>& before;
	const std::vector<Component>& after;
	std::vector<int> beforeMatch; //!< beforeMatch[i] = index into `after`, NONE if unmatched.
	std::vector<int> afterMatch;  //!< afterMatch[j] = index into `before`, NONE if unmatched.
	std::vector<Pairing> pairs;   //!< Reported pairs (exact matches are not stored).

	MatchState(const std::vector<Component>& b, const std::vector<Component>& a)
	    : before{b}, after{a}, beforeMatch(b.size(), NONE), afterMatch(a.size(), NONE) {
	}

	bool beforeFree(std::size_t i) const { return beforeMatch[i] == NONE; }
	bool afterFree(std::size_t j) const { return afterMatch[j] == NONE; }

	void link(std::size_t i, std::size_t j) {
		beforeMatch[i] = static_cast<int>(j);
		afterMatch[j]  = static_cast<int>(i);
	}
};

//! Exact and recoloured matches: components at the same place in both frames.
static void matchInPlace(MatchState& state) {
	std::map<PlacementKey, std::vector<std::size_t>> placements;
	for (std::size_t j = 0; j < state.after.size(); ++j) {
		placements[placementKey(state.after[j])].push_back(j);
	}

	const auto findAt = [&](const Component& source, bool sameColor) -> int {
		const auto it = placements.find(placementKey(source));
		if (it == placements.end()) {
			return NONE;
		}
		for (const std::size_t j: it->second) {
			if (state.afterFree(j) && (state.after[j].color == source.color) == sameColor) {
				return static_cast<int>(j);
			}
		}
		return NONE;
	};

	// Exact matches first over the whole frame, so a recolouring never steals a stationary component.
	for (std::size_t i = 0; i < state.before.size(); ++i) {
		const int j = findAt(state.before[i], true);
		if (j != NONE) {
			state.link(i, static_cast<std::size_t>(j));
		}
	}

	for (std::size_t i = 0; i < state.before.size(); ++i) {
		if (!state.beforeFree(i)) {
			continue;
		}
		const int j = findAt(state.before[i], false);
		if (j != NONE) {
			state.link(i, static_cast<std::size_t>(j));
			state.pairs.push_back({static_cast<int>(i), j, TransformKind::Recolored});
		}
	}
}

//! Greedy nearest-centroid pass within colour classes.
//! \param [in] sameExtent Only accept candidates with identical size and bounding box extent (move detection).
static void matchNearest(MatchState& state, const MatchConfig& config, bool sameExtent) {
	std::vector<std::size_t> order;
	for (std::size_t i = 0; i < state.before.size(); ++i) {
		if (state.beforeFree(i)) {
			order.push_back(i);
		}
	}
	std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
		const Component& ca = state.before[a];
		const Component& cb = state.before[b];
		if (ca.size != cb.size) {
			return ca.size > cb.size;
		}
		if (topLeftBefore(ca, cb) || topLeftBefore(cb, ca)) {
			return topLeftBefore(ca, cb);
		}
		return ca.id < cb.id;
	});

	for (const std::size_t i: order) {
		const Component& source = state.before[i];

		int best           = NONE;
		double bestDistance = 0.0;
		for (std::size_t j = 0; j < state.after.size(); ++j) {
			const Component& candidate = state.after[j];
			if (!state.afterFree(j) || candidate.color != source.color) {
				continue;
			}
			if (sameExtent && (candidate.size != source.size || candidate.bounds.size() != source.bounds.size())) {
				continue;
			}

			const double distance = cv::norm(candidate.centroid - source.centroid);
			if (distance > config.maxCentroidDistance) {
				continue;
			}
			if (best == NONE || distance < bestDistance ||
			    (distance == bestDistance && topLeftBefore(candidate, state.after[static_cast<std::size_t>(best)]))) {
				best         = static_cast<int>(j);
				bestDistance = distance;
			}
		}

		if (best != NONE) {
			state.link(i, static_cast<std::size_t>(best));
			state.pairs.push_back({static_cast<int>(i), best, sameExtent ? TransformKind::Moved : TransformKind::Resized});
		}
	}
}

static ComponentTransformation makeTransformation(const MatchState& state, const Pairing& pair) {
	ComponentTransformation t{};
	t.kind = pair.kind;
	if (pair.before != NONE) {
		t.before = state.before[static_cast<std::size_t>(pair.before)];
	}
	if (pair.after != NONE) {
		t.after = state.after[static_cast<std::size_t>(pair.after)];
	}
	if (pair.kind == TransformKind::Moved) {
		t.rowShift = t.after->bounds.y - t.before->bounds.y;
		t.colShift = t.after->bounds.x - t.before->bounds.x;
	}
	return t;
}

} // namespace

const char* transformKindName(TransformKind kind) {
	switch (kind) {
	case TransformKind::Moved:
		return "moved";
	case TransformKind::Resized:
		return "resized";
	case TransformKind::Recolored:
		return "recolored";
	case TransformKind::Appeared:
		return "appeared";
	case TransformKind::Disappeared:
		return "disappeared";
	}
	return "unknown";
}

std::vector<ComponentTransformation> matchComponents(const std::vector<Component>& before, const std::vector<Component>& after, const MatchConfig& config) {
	MatchState state(before, after);

	matchInPlace(state);
	const std::size_t recolored = state.pairs.size();
	matchNearest(state, config, true);
	const std::size_t moved = state.pairs.size() - recolored;
	matchNearest(state, config, false);
	const std::size_t resized = state.pairs.size() - recolored - moved;

	std::sort(state.pairs.begin(), state.pairs.end(), [](const Pairing& a, const Pairing& b) { return a.before < b.before; });

	std::vector<ComponentTransformation> out;
	out.reserve(state.pairs.size());
	for (const Pairing& pair: state.pairs) {
		out.push_back(makeTransformation(state, pair));
	}

	std::size_t disappeared = 0u;
	for (std::size_t i = 0; i < before.size(); ++i) {
		if (state.beforeFree(i)) {
			out.push_back(makeTransformation(state, {static_cast<int>(i), NONE, TransformKind::Disappeared}));
			++disappeared;
		}
	}
	std::size_t appeared = 0u;
	for (std::size_t j = 0; j < after.size(); ++j) {
		if (state.afterFree(j)) {
			out.push_back(makeTransformation(state, {NONE, static_cast<int>(j), TransformKind::Appeared}));
			++appeared;
		}
	}

	if (deltaDebugEnabled()) {
		std::cerr << "[delta-debug] before=" << before.size() << " after=" << after.size() << " recolored=" << recolored << " moved=" << moved
		          << " resized=" << resized << " disappeared=" << disappeared << " appeared=" << appeared << '\n';
	}
	return out;
}

} // namespace gridlens::analysis::core
