#include "analysis/grounding/coordinateExtractor.hpp"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace gridlens::analysis::grounding {
namespace gtest {

using Pairs = std::vector<std::pair<int, int>>;

static Pairs pairsOf(std::string_view text) {
	Pairs out;
	for (const CoordinateCandidate& c: extractCoordinates(text)) {
		out.emplace_back(c.first, c.second);
	}
	return out;
}

TEST(CoordinateExtractor, Prose_Examples) {
	EXPECT_EQ(pairsOf("I should click at position (3, 4) to activate the switch"), (Pairs{{3, 4}}));
	EXPECT_EQ(pairsOf("The target is at coordinates 2,5"), (Pairs{{2, 5}}));
	EXPECT_EQ(pairsOf("Move to (1, 1) then press ACTION6"), (Pairs{{1, 1}}));
	EXPECT_EQ(pairsOf("No coordinates in this text"), Pairs{});
	EXPECT_EQ(pairsOf(""), Pairs{});
}

TEST(CoordinateExtractor, All_Forms_In_Order) {
	EXPECT_EQ(pairsOf("(1,2) then (3, 4) then 5,6 then 7, 8"), (Pairs{{1, 2}, {3, 4}, {5, 6}, {7, 8}}));
	EXPECT_EQ(pairsOf("( 10 , 20 )"), (Pairs{{10, 20}}));
	EXPECT_EQ(pairsOf("go to (-1, 5) or -2,-3"), (Pairs{{-1, 5}, {-2, -3}}));
}

TEST(CoordinateExtractor, No_Deduplication_Or_Bounds) {
	EXPECT_EQ(pairsOf("(1, 2) and again (1, 2)"), (Pairs{{1, 2}, {1, 2}}));
	EXPECT_EQ(pairsOf("(500, 9000)"), (Pairs{{500, 9000}}));
}

TEST(CoordinateExtractor, Span_And_Offset) {
	const auto candidates = extractCoordinates("Let me click at (3, 4) now");
	ASSERT_EQ(candidates.size(), 1u);
	EXPECT_EQ(candidates[0].span, "(3, 4)");
	EXPECT_EQ(candidates[0].offset, 16u);
}

TEST(CoordinateExtractor, Rejects_Glued_Numbers) {
	EXPECT_EQ(pairsOf("press ACTION6,7 twice"), Pairs{});
	EXPECT_EQ(pairsOf("a ratio of 1.5, 2"), Pairs{});
	EXPECT_EQ(pairsOf("values 3, 4.5 here"), Pairs{});
	EXPECT_EQ(pairsOf("sizes 12,34px"), Pairs{});
	// Parentheses make the pair explicit even next to a word.
	EXPECT_EQ(pairsOf("click(2, 3)"), (Pairs{{2, 3}}));
}

TEST(CoordinateExtractor, Malformed_Content) {
	EXPECT_EQ(pairsOf("(a, b) (1, ) (, 2) (1 2)"), Pairs{});
	EXPECT_EQ(pairsOf("(99999999999, 1)"), Pairs{});
}

TEST(CoordinateExtractor, Unclosed_Bracket) {
	EXPECT_EQ(pairsOf("click (3, 4 then wait"), Pairs{});
	EXPECT_EQ(pairsOf("(3,4"), Pairs{});
	EXPECT_EQ(pairsOf("( 7, 8"), Pairs{});
	// A closed pair after an unclosed one is still found.
	EXPECT_EQ(pairsOf("(3, 4 or (5, 6)"), (Pairs{{5, 6}}));
	EXPECT_EQ(pairsOf("((1, 2))"), (Pairs{{1, 2}}));
}

} // namespace gtest
} // namespace gridlens::analysis::grounding
