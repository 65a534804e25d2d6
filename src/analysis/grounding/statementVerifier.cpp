#include "analysis/grounding/statementVerifier.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <string_view>

namespace gridlens::analysis::grounding {

namespace {

//! Enable per-claim diagnostics via environment variable.
static bool claimDebugEnabled() {
	const char* env = std::getenv("GRIDLENS_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

static std::string formatCell(core::Cell cell) {
	return std::format("({}, {})", cell.row, cell.col);
}

//! Checks one claim against the current frame. Returns an issue, or nothing if the claim holds.
class ClaimChecker {
public:
	ClaimChecker(const core::Grid* priorGrid, const std::vector<core::Component>& components, const VerifierConfig& config)
	    : m_prior{priorGrid}, m_components{components}, m_config{config} {
	}

	std::optional<std::string> operator()(const PositionClaim& claim) const {
		const std::optional<int> color = m_config.palette.indexOf(claim.colorName);
		if (!color) {
			return unknownColor(claim.colorName);
		}

		bool present = false;
		for (const core::Component& component: m_components) {
			if (component.color != *color) {
				continue;
			}
			present = true;
			if (component.covers(claim.position)) {
				return std::nullopt;
			}
		}
		if (!present) {
			return std::format("color '{}' not found in grid", claim.colorName);
		}
		return std::format("no {} component covers {}", claim.colorName, formatCell(claim.position));
	}

	std::optional<std::string> operator()(const CountClaim& claim) const {
		const std::optional<int> color = m_config.palette.indexOf(claim.colorName);
		if (!color) {
			return unknownColor(claim.colorName);
		}

		int actual = 0;
		for (const core::Component& component: m_components) {
			if (component.color == *color) {
				actual += claim.unit == CountUnit::Cells ? component.size : 1;
			}
		}
		if (actual == claim.count) {
			return std::nullopt;
		}
		const char* noun = claim.unit == CountUnit::Cells ? "pixels" : "components";
		return std::format("count mismatch: claimed {} {} {}, found {}", claim.count, claim.colorName, noun, actual);
	}

	std::optional<std::string> operator()(const MovementClaim& claim) const {
		if (m_prior == nullptr) {
			return std::string("no prior frame supplied; cannot verify movement");
		}

		std::optional<int> color;
		if (claim.colorName) {
			color = m_config.palette.indexOf(*claim.colorName);
			if (!color) {
				return unknownColor(*claim.colorName);
			}
		}
		const auto colorMatches = [&](const core::Component& c) { return !color || c.color == *color; };

		const std::vector<core::Component> priorComponents = core::analyseGrid(*m_prior).components;
		const std::vector<core::ComponentTransformation> transformations = core::matchComponents(priorComponents, m_components, m_config.match);

		const bool moved = std::any_of(transformations.begin(), transformations.end(), [&](const core::ComponentTransformation& t) {
			return t.kind == core::TransformKind::Moved && colorMatches(*t.before) && t.before->covers(claim.from) && t.after->covers(claim.to);
		});
		if (moved) {
			return std::nullopt;
		}

		// Components without a transformation were matched exactly: they did not change between the frames.
		const auto stationaryBefore = [&](const core::Component& c) {
			return std::none_of(transformations.begin(), transformations.end(), [&](const core::ComponentTransformation& t) { return t.before && t.before->id == c.id; });
		};
		const auto stationaryAfter = [&](const core::Component& c) {
			return std::none_of(transformations.begin(), transformations.end(), [&](const core::ComponentTransformation& t) { return t.after && t.after->id == c.id; });
		};
		const bool originHeld = std::any_of(priorComponents.begin(), priorComponents.end(),
		                                    [&](const core::Component& c) { return colorMatches(c) && c.covers(claim.from) && stationaryBefore(c); });
		const bool targetHeld = std::any_of(m_components.begin(), m_components.end(),
		                                    [&](const core::Component& c) { return colorMatches(c) && c.covers(claim.to) && stationaryAfter(c); });

		if (originHeld && targetHeld) {
			return std::format("inconsistent movement: {} and {} are both occupied by coexisting stationary components in the prior and current frame, "
			                   "not a relocation",
			                   formatCell(claim.from), formatCell(claim.to));
		}
		return std::format("no movement from {} to {} detected", formatCell(claim.from), formatCell(claim.to));
	}

	std::optional<std::string> operator()(const UnverifiableClaim& claim) const {
		return std::format("unverifiable claim: {}", claim.reason);
	}

private:
	static std::string unknownColor(const std::string& name) {
		return std::format("unknown color name: {}", name);
	}

private:
	const core::Grid* m_prior;                          //!< Previous frame. May be null.
	const std::vector<core::Component>& m_components; //!< Components of the current frame.
	const VerifierConfig& m_config;
};

} // namespace

VerificationResult verifyStatement(std::string_view statement, const core::Grid* priorGrid, const std::vector<core::Component>& components,
                                   const VerifierConfig& config) {
	VerificationResult result{};
	result.claims = parseClaims(statement);
	if (result.claims.empty()) {
		result.claims.push_back(UnverifiableClaim{"empty statement", {}});
	}

	const ClaimChecker checker(priorGrid, components, config);
	const bool verbose = claimDebugEnabled();
	for (const Claim& claim: result.claims) {
		std::optional<std::string> issue = std::visit(checker, claim);
		if (verbose) {
			std::cerr << "[claim-debug] shape=" << claim.index() << " verdict=" << (issue ? *issue : std::string("ok")) << '\n';
		}
		if (issue) {
			result.issues.push_back(std::move(*issue));
		}
	}

	result.verified = result.issues.empty();
	return result;
}

} // namespace gridlens::analysis::grounding
