#pragma once

#include "analysis/core/grid.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Claims are the checkable shapes recognised in a natural-language statement.
// Recognition is deliberately narrow pattern matching: a sentence either fits one of the shapes below or is unverifiable.
// Coordinates in claims are read as (row, col).
namespace gridlens::analysis::grounding {

//! "The red component is at position (r, c)".
struct PositionClaim {
	std::string colorName; //!< Colour words as written, e.g. "red" or "light blue".
	core::Cell position;
	std::string text; //!< Source sentence.
};

enum class CountUnit {
	Cells,      //!< "pixels", "cells": total cell count of the colour.
	Components, //!< "components", "objects", "shapes", ...: number of components of the colour.
};

//! "There are N blue pixels".
struct CountClaim {
	std::string colorName;
	int count;
	CountUnit unit;
	std::string text;
};

//! "I moved the component from (r1, c1) to (r2, c2)".
struct MovementClaim {
	std::optional<std::string> colorName; //!< Set if the moved object is named by colour.
	core::Cell from;
	core::Cell to;
	std::string text;
};

//! Anything that cannot be checked against grid facts.
struct UnverifiableClaim {
	std::string reason;
	std::string text;
	bool filler{false}; //!< Asserts nothing at all ("Hmm", "so"). Dropped when the same sentence holds a real claim.
};

using Claim = std::variant<PositionClaim, CountClaim, MovementClaim, UnverifiableClaim>;

/*! Split a statement into sentences.
 *  Boundaries are '!', '?', ';', line breaks and a '.' followed by whitespace or the end of text. Decimal points do not split.
 *  Sentences are trimmed; empty ones are dropped.
 */
std::vector<std::string> splitSentences(std::string_view statement);

/*! Split a sentence into clauses that may each carry a claim.
 *  Boundaries are ',' and the words "and", "but" and "while", outside parentheses. A comma between two numbers belongs to a bare
 *  coordinate ("2,5") and does not split. Clauses are trimmed; empty ones are dropped.
 */
std::vector<std::string> splitClauses(std::string_view sentence);

//! Classify a single clause or sentence. Shapes are tried in the order movement, count, position.
Claim parseClaim(std::string_view sentence);

/*! Split a statement into sentences and clauses and classify every clause.
 *  Every checkable or subjective clause yields its own claim, so a sentence with two assertions is checked twice.
 *  Filler clauses are dropped. A sentence made only of filler yields a single unverifiable claim.
 */
std::vector<Claim> parseClaims(std::string_view statement);

} // namespace gridlens::analysis::grounding
