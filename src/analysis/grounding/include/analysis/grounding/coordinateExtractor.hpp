#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gridlens::analysis::grounding {

//! Integer pair mentioned in free text.
struct CoordinateCandidate {
	int first;          //!< First number of the pair as written.
	int second;         //!< Second number of the pair as written.
	std::string span;   //!< Matched text, e.g. "(3, 4)".
	std::size_t offset; //!< Byte offset of the span in the source text.
};

/*! Find integer pairs in prose.
 *  Recognises "(x, y)", "(x,y)", "x,y" and "x, y" with an optional minus sign on each number.
 *  Pairs are returned in order of appearance and are not deduplicated or range checked.
 *  A bare pair glued to a word or a decimal ("ACTION6,7", "1.5, 2") is not a coordinate. Numbers that do not fit an int are skipped.
 *
 * \param [in] text Free text, typically model reasoning.
 * \return     Candidates, empty if nothing matched. Never throws on malformed text.
 */
std::vector<CoordinateCandidate> extractCoordinates(std::string_view text);

} // namespace gridlens::analysis::grounding
