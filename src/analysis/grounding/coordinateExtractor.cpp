#include "analysis/grounding/coordinateExtractor.hpp"

#include <cctype>
#include <charconv>
#include <optional>
#include <regex>

namespace gridlens::analysis::grounding {

namespace {

// Groups 1/2: parenthesised pair. Groups 3/4: bare pair.
static const std::regex& coordinatePattern() {
	static const std::regex pattern(R"(\(\s*(-?\d+)\s*,\s*(-?\d+)\s*\)|(-?\d+)\s*,\s*(-?\d+))");
	return pattern;
}

static std::optional<int> parseInt(const std::csub_match& group) {
	int value         = 0;
	const char* first = group.first;
	const char* last  = group.second;
	const auto [ptr, ec] = std::from_chars(first, last, value);
	if (ec != std::errc{} || ptr != last) {
		return std::nullopt;
	}
	return value;
}

//! A bare pair must stand on its own: not the tail of a word or decimal, not followed by letters or decimals,
//! and not the content of a bracket that is never closed.
static bool isFreeStanding(std::string_view text, std::size_t begin, std::size_t end) {
	if (begin > 0u) {
		const auto before = static_cast<unsigned char>(text[begin - 1]);
		if (std::isalnum(before) || before == '_' || before == '.') {
			return false;
		}
	}
	if (begin > 0u) {
		const std::size_t opener = text.find_last_not_of(" \t\r\n", begin - 1);
		if (opener != std::string_view::npos && text[opener] == '(') {
			return false;
		}
	}
	if (end < text.size()) {
		const auto after = static_cast<unsigned char>(text[end]);
		if (std::isalpha(after) || after == '_') {
			return false;
		}
		if (after == '.' && end + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[end + 1]))) {
			return false;
		}
	}
	return true;
}

} // namespace

std::vector<CoordinateCandidate> extractCoordinates(std::string_view text) {
	std::vector<CoordinateCandidate> out;
	if (text.empty()) {
		return out;
	}
	const char* base = text.data();

	for (std::cregex_iterator it(base, base + text.size(), coordinatePattern()), end; it != end; ++it) {
		const std::cmatch& match = *it;
		const auto offset        = static_cast<std::size_t>(match.position(0));
		const auto length        = static_cast<std::size_t>(match.length(0));

		const bool parenthesised = match[1].matched;
		if (!parenthesised && !isFreeStanding(text, offset, offset + length)) {
			continue;
		}

		const std::optional<int> first  = parseInt(parenthesised ? match[1] : match[3]);
		const std::optional<int> second = parseInt(parenthesised ? match[2] : match[4]);
		if (!first || !second) {
			continue;
		}
		out.push_back({*first, *second, std::string(text.substr(offset, length)), offset});
	}
	return out;
}

} // namespace gridlens::analysis::grounding
