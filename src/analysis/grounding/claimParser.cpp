#include "analysis/grounding/claim.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <regex>

namespace gridlens::analysis::grounding {

namespace {

//! Nouns that name a grid object. The words right before one are read as its colour.
static constexpr std::array<std::string_view, 20> OBJECT_NOUNS = {
        "component", "components", "object", "objects", "block",  "blocks",  "piece", "pieces", "shape", "shapes",
        "square",    "squares",    "pixel",  "pixels",  "cell",   "cells",   "region", "regions", "blob", "blobs",
};

//! Words that end a colour phrase when scanning backwards from a noun.
static constexpr std::array<std::string_view, 24> STOP_WORDS = {
        "the", "a",  "an",  "this", "that", "these", "those", "my",  "our", "its", "their", "one",
        "each", "every", "single", "all", "is", "are", "was", "were", "i", "we", "it", "of",
};

//! Cues of a qualitative judgement rather than a factual claim.
static constexpr std::array<std::string_view, 14> SUBJECTIVE_CUES = {
        "symmetr", "entropy", "complex", "pattern", "interesting", "seem",      "probably",
        "likely",  "maybe",   "perhaps", "might",   "looks",       "important", "simple",
};

static bool contains(const auto& list, std::string_view word) {
	return std::find(list.begin(), list.end(), word) != list.end();
}

static std::string toLower(std::string_view text) {
	std::string out(text);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return out;
}

static std::string trim(std::string_view text) {
	const auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
	while (!text.empty() && isSpace(text.front())) {
		text.remove_prefix(1);
	}
	while (!text.empty() && isSpace(text.back())) {
		text.remove_suffix(1);
	}
	return std::string(text);
}

//! Lower-case words of a phrase with surrounding punctuation removed.
static std::vector<std::string> words(std::string_view phrase) {
	std::vector<std::string> out;
	std::string current;
	for (const char ch: phrase) {
		const auto c = static_cast<unsigned char>(ch);
		if (std::isalnum(c) || ch == '-') {
			current.push_back(static_cast<char>(std::tolower(c)));
		} else if (!current.empty()) {
			out.push_back(std::move(current));
			current.clear();
		}
	}
	if (!current.empty()) {
		out.push_back(std::move(current));
	}
	return out;
}

/*! Colour words in front of the first object noun of a phrase.
 *  "the light blue component is" -> "light blue". Empty if there is no object noun or nothing precedes it.
 */
static std::optional<std::string> colorBeforeNoun(std::string_view phrase) {
	const std::vector<std::string> tokens = words(phrase);
	const auto noun = std::find_if(tokens.begin(), tokens.end(), [](const std::string& w) { return contains(OBJECT_NOUNS, w); });
	if (noun == tokens.end()) {
		return std::nullopt;
	}

	auto first = noun;
	while (first != tokens.begin()) {
		const std::string& previous = *(first - 1);
		if (contains(STOP_WORDS, previous) || std::isdigit(static_cast<unsigned char>(previous.front()))) {
			break;
		}
		--first;
	}
	if (first == noun) {
		return std::nullopt;
	}

	std::string color;
	for (auto it = first; it != noun; ++it) {
		if (!color.empty()) {
			color.push_back(' ');
		}
		color += *it;
	}
	return color;
}

static std::optional<int> toInt(const std::ssub_match& group) {
	int value            = 0;
	const std::string s  = group.str();
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc{} || ptr != s.data() + s.size()) {
		return std::nullopt;
	}
	return value;
}

static const std::regex& movementPattern() {
	static const std::regex pattern(R"(\b(?:mov|shift|slid|push|pull|drag)\w*\b(.*?)\bfrom\s*\(?\s*(-?\d+)\s*,\s*(-?\d+)\s*\)?\s*to\s*\(?\s*(-?\d+)\s*,\s*(-?\d+)\s*\)?)",
	                                std::regex::ECMAScript | std::regex::icase);
	return pattern;
}

static const std::regex& countPattern() {
	static const std::regex pattern(R"(\b(\d+)\s+((?:[a-z]+[\s-]+)+?)(pixels?|cells?|components?|objects?|blocks?|shapes?|squares?|regions?)\b)",
	                                std::regex::ECMAScript | std::regex::icase);
	return pattern;
}

static const std::regex& positionPattern() {
	static const std::regex pattern(R"(^(.*?)\b(?:at|in)\s+(?:(?:the\s+)?(?:position|coordinates?|cell|location)\s+)?\(?\s*(-?\d+)\s*,\s*(-?\d+)\s*\)?)",
	                                std::regex::ECMAScript | std::regex::icase);
	return pattern;
}

static std::optional<Claim> parseMovement(const std::string& sentence) {
	std::smatch m;
	if (!std::regex_search(sentence, m, movementPattern())) {
		return std::nullopt;
	}
	const auto r1 = toInt(m[2]);
	const auto c1 = toInt(m[3]);
	const auto r2 = toInt(m[4]);
	const auto c2 = toInt(m[5]);
	if (!r1 || !c1 || !r2 || !c2) {
		return std::nullopt;
	}
	// "I moved the red block from ..." names the colour after the verb, "The red block moved from ..." before it.
	std::optional<std::string> color = colorBeforeNoun(m[1].str());
	if (!color) {
		color = colorBeforeNoun(m.prefix().str());
	}
	return MovementClaim{std::move(color), {*r1, *c1}, {*r2, *c2}, sentence};
}

static std::optional<Claim> parseCount(const std::string& sentence) {
	std::smatch m;
	if (!std::regex_search(sentence, m, countPattern())) {
		return std::nullopt;
	}
	const auto count = toInt(m[1]);
	if (!count) {
		return std::nullopt;
	}

	// Every word between the number and the noun must be a colour word.
	const std::vector<std::string> colorWords = words(m[2].str());
	if (colorWords.empty() || std::any_of(colorWords.begin(), colorWords.end(), [](const std::string& w) {
		    return contains(STOP_WORDS, w) || contains(OBJECT_NOUNS, w);
	    })) {
		return std::nullopt;
	}
	std::string color;
	for (const std::string& w: colorWords) {
		color += color.empty() ? w : " " + w;
	}

	const std::string noun = toLower(m[3].str());
	const CountUnit unit   = noun.starts_with("pixel") || noun.starts_with("cell") ? CountUnit::Cells : CountUnit::Components;
	return CountClaim{std::move(color), *count, unit, sentence};
}

static std::optional<Claim> parsePosition(const std::string& sentence) {
	std::smatch m;
	if (!std::regex_search(sentence, m, positionPattern())) {
		return std::nullopt;
	}
	const auto row = toInt(m[2]);
	const auto col = toInt(m[3]);
	if (!row || !col) {
		return std::nullopt;
	}

	std::optional<std::string> color = colorBeforeNoun(m[1].str());
	if (!color) {
		return UnverifiableClaim{std::format("position ({}, {}) is not attributed to a colour", *row, *col), sentence};
	}
	return PositionClaim{std::move(*color), {*row, *col}, sentence};
}

static UnverifiableClaim unverifiable(const std::string& sentence) {
	const std::string lower = toLower(sentence);
	const bool subjective   = std::any_of(SUBJECTIVE_CUES.begin(), SUBJECTIVE_CUES.end(), [&](std::string_view cue) { return lower.find(cue) != std::string::npos; });
	if (subjective) {
		return {std::format("subjective assessment \"{}\"", sentence), sentence};
	}
	return {std::format("no checkable assertion in \"{}\"", sentence), sentence, true};
}

//! Words joining two clauses.
static constexpr std::array<std::string_view, 3> CONJUNCTIONS = {"and", "but", "while"};

//! True for the comma of a bare coordinate such as "2,5" or "2, -5".
static bool isNumberComma(std::string_view text, std::size_t comma) {
	if (comma == 0u) {
		return false;
	}
	const std::size_t before = text.find_last_not_of(" \t", comma - 1);
	const std::size_t after  = text.find_first_not_of(" \t", comma + 1);
	if (before == std::string_view::npos || after == std::string_view::npos) {
		return false;
	}

	const auto isDigit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
	const bool negative = text[after] == '-' && after + 1 < text.size() && isDigit(text[after + 1]);
	return isDigit(text[before]) && (isDigit(text[after]) || negative);
}

//! Length of the conjunction starting at `pos`, or 0 if there is none.
static std::size_t conjunctionAt(std::string_view text, std::size_t pos) {
	const auto isWordChar = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };
	if (pos > 0u && isWordChar(text[pos - 1])) {
		return 0u;
	}
	for (const std::string_view word: CONJUNCTIONS) {
		if (pos + word.size() > text.size() || toLower(text.substr(pos, word.size())) != word) {
			continue;
		}
		if (pos + word.size() == text.size() || !isWordChar(text[pos + word.size()])) {
			return word.size();
		}
	}
	return 0u;
}

} // namespace

std::vector<std::string> splitSentences(std::string_view statement) {
	std::vector<std::string> sentences;
	std::size_t start = 0u;

	const auto flush = [&](std::size_t end) {
		std::string sentence = trim(statement.substr(start, end - start));
		if (!sentence.empty()) {
			sentences.push_back(std::move(sentence));
		}
		start = end + 1;
	};

	for (std::size_t i = 0; i < statement.size(); ++i) {
		const char ch = statement[i];
		if (ch == '!' || ch == '?' || ch == ';' || ch == '\n') {
			flush(i);
		} else if (ch == '.' && (i + 1 == statement.size() || std::isspace(static_cast<unsigned char>(statement[i + 1])))) {
			flush(i);
		}
	}
	if (start < statement.size()) {
		flush(statement.size());
	}
	return sentences;
}

std::vector<std::string> splitClauses(std::string_view sentence) {
	std::vector<std::string> clauses;
	std::size_t start = 0u;
	int depth         = 0;

	const auto flush = [&](std::size_t end, std::size_t next) {
		std::string clause = trim(sentence.substr(start, end - start));
		if (!clause.empty()) {
			clauses.push_back(std::move(clause));
		}
		start = next;
	};

	for (std::size_t i = 0; i < sentence.size(); ++i) {
		const char ch = sentence[i];
		if (ch == '(') {
			++depth;
		} else if (ch == ')') {
			depth = std::max(0, depth - 1);
		} else if (depth > 0) {
			continue;
		} else if (ch == ',') {
			if (!isNumberComma(sentence, i)) {
				flush(i, i + 1);
			}
		} else if (const std::size_t length = conjunctionAt(sentence, i); length > 0u) {
			flush(i, i + length);
			i += length - 1;
		}
	}
	flush(sentence.size(), sentence.size());
	return clauses;
}

Claim parseClaim(std::string_view sentence) {
	const std::string text = trim(sentence);
	if (text.empty()) {
		return UnverifiableClaim{"empty statement", text};
	}

	if (auto claim = parseMovement(text)) {
		return std::move(*claim);
	}
	if (auto claim = parseCount(text)) {
		return std::move(*claim);
	}
	if (auto claim = parsePosition(text)) {
		return std::move(*claim);
	}
	return unverifiable(text);
}

std::vector<Claim> parseClaims(std::string_view statement) {
	std::vector<Claim> claims;
	for (const std::string& sentence: splitSentences(statement)) {
		const std::size_t first = claims.size();
		for (const std::string& clause: splitClauses(sentence)) {
			Claim claim       = parseClaim(clause);
			const auto* vague = std::get_if<UnverifiableClaim>(&claim);
			if (vague == nullptr || !vague->filler) {
				claims.push_back(std::move(claim));
			}
		}
		if (claims.size() == first) {
			claims.push_back(parseClaim(sentence));
		}
	}
	return claims;
}

} // namespace gridlens::analysis::grounding
