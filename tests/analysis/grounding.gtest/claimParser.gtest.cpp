#include "analysis/grounding/claim.hpp"

#include <gtest/gtest.h>

namespace gridlens::analysis::grounding {
namespace gtest {

TEST(ClaimParser, Split_Sentences) {
	EXPECT_EQ(splitSentences("First one. Second at 1.5 units! Third?; "), (std::vector<std::string>{"First one", "Second at 1.5 units", "Third"}));
	EXPECT_EQ(splitSentences("line one\nline two"), (std::vector<std::string>{"line one", "line two"}));
	EXPECT_TRUE(splitSentences("  .  ").empty());
	EXPECT_TRUE(splitSentences("").empty());
}

TEST(ClaimParser, Split_Clauses) {
	EXPECT_EQ(splitClauses("The red component is at (0, 0) and there are 2 blue pixels"),
	          (std::vector<std::string>{"The red component is at (0, 0)", "there are 2 blue pixels"}));
	EXPECT_EQ(splitClauses("The blue component is at (0, 1), the red component is at (2, 2)"),
	          (std::vector<std::string>{"The blue component is at (0, 1)", "the red component is at (2, 2)"}));
	// Commas of bare coordinates and words containing a conjunction do not split.
	EXPECT_EQ(splitClauses("Shifted the band from 0,0 to 0, -5"), (std::vector<std::string>{"Shifted the band from 0,0 to 0, -5"}));
	EXPECT_EQ(splitClauses("Meanwhile, 3 red cells but 2 green cells"),
	          (std::vector<std::string>{"Meanwhile", "3 red cells", "2 green cells"}));
	EXPECT_TRUE(splitClauses(" and , ").empty());
}

TEST(ClaimParser, Movement) {
	const Claim claim = parseClaim("I moved the red piece from (1, 2) to (3, 4)");
	const auto* movement = std::get_if<MovementClaim>(&claim);
	ASSERT_NE(movement, nullptr);
	ASSERT_TRUE(movement->colorName.has_value());
	EXPECT_EQ(*movement->colorName, "red");
	EXPECT_EQ(movement->from, (core::Cell{1, 2}));
	EXPECT_EQ(movement->to, (core::Cell{3, 4}));

	const Claim bare   = parseClaim("Shifted it from 0,0 to 0,5");
	const auto* shift = std::get_if<MovementClaim>(&bare);
	ASSERT_NE(shift, nullptr);
	EXPECT_FALSE(shift->colorName.has_value());
	EXPECT_EQ(shift->from, (core::Cell{0, 0}));
	EXPECT_EQ(shift->to, (core::Cell{0, 5}));

	const Claim subject  = parseClaim("The red block moved from (0,0) to (2,2)");
	const auto* named    = std::get_if<MovementClaim>(&subject);
	ASSERT_NE(named, nullptr);
	ASSERT_TRUE(named->colorName.has_value());
	EXPECT_EQ(*named->colorName, "red");

	const Claim plain    = parseClaim("I moved the component from (0,1) to (2,1)");
	const auto* unnamed = std::get_if<MovementClaim>(&plain);
	ASSERT_NE(unnamed, nullptr);
	EXPECT_FALSE(unnamed->colorName.has_value());
}

TEST(ClaimParser, Count) {
	const Claim cells = parseClaim("There are 12 light blue cells");
	const auto* count = std::get_if<CountClaim>(&cells);
	ASSERT_NE(count, nullptr);
	EXPECT_EQ(count->colorName, "light blue");
	EXPECT_EQ(count->count, 12);
	EXPECT_EQ(count->unit, CountUnit::Cells);

	const Claim objects   = parseClaim("I count 3 Red objects");
	const auto* components = std::get_if<CountClaim>(&objects);
	ASSERT_NE(components, nullptr);
	EXPECT_EQ(components->colorName, "red");
	EXPECT_EQ(components->count, 3);
	EXPECT_EQ(components->unit, CountUnit::Components);
}

TEST(ClaimParser, Position) {
	const Claim claim    = parseClaim("The Red component is at position (2, 3)");
	const auto* position = std::get_if<PositionClaim>(&claim);
	ASSERT_NE(position, nullptr);
	EXPECT_EQ(position->colorName, "red");
	EXPECT_EQ(position->position, (core::Cell{2, 3}));
	EXPECT_EQ(position->text, "The Red component is at position (2, 3)");

	const Claim yellow = parseClaim("The yellow block is in cell 4,0");
	ASSERT_TRUE(std::holds_alternative<PositionClaim>(yellow));
	EXPECT_EQ(std::get<PositionClaim>(yellow).colorName, "yellow");
	EXPECT_EQ(std::get<PositionClaim>(yellow).position, (core::Cell{4, 0}));
}

TEST(ClaimParser, Unverifiable) {
	const Claim anonymous = parseClaim("Something is at (2, 3)");
	ASSERT_TRUE(std::holds_alternative<UnverifiableClaim>(anonymous));
	EXPECT_EQ(std::get<UnverifiableClaim>(anonymous).reason, "position (2, 3) is not attributed to a colour");

	const Claim subjective = parseClaim("The grid has high symmetry");
	ASSERT_TRUE(std::holds_alternative<UnverifiableClaim>(subjective));
	EXPECT_EQ(std::get<UnverifiableClaim>(subjective).reason, "subjective assessment \"The grid has high symmetry\"");

	const Claim chatter = parseClaim("Hello there");
	ASSERT_TRUE(std::holds_alternative<UnverifiableClaim>(chatter));
	EXPECT_EQ(std::get<UnverifiableClaim>(chatter).reason, "no checkable assertion in \"Hello there\"");

	const Claim empty = parseClaim("   ");
	ASSERT_TRUE(std::holds_alternative<UnverifiableClaim>(empty));
	EXPECT_EQ(std::get<UnverifiableClaim>(empty).reason, "empty statement");
}

TEST(ClaimParser, Every_Clause_Is_A_Claim) {
	const auto pair = parseClaims("The red component is at (0, 0) and there are 2 blue pixels");
	ASSERT_EQ(pair.size(), 2u);
	ASSERT_TRUE(std::holds_alternative<PositionClaim>(pair[0]));
	EXPECT_EQ(std::get<PositionClaim>(pair[0]).colorName, "red");
	ASSERT_TRUE(std::holds_alternative<CountClaim>(pair[1]));
	EXPECT_EQ(std::get<CountClaim>(pair[1]).colorName, "blue");

	const auto counts = parseClaims("There are 2 blue pixels and 5 red pixels");
	ASSERT_EQ(counts.size(), 2u);
	ASSERT_TRUE(std::holds_alternative<CountClaim>(counts[1]));
	EXPECT_EQ(std::get<CountClaim>(counts[1]).count, 5);

	// Filler next to a real claim is dropped, a sentence of filler alone is kept once.
	const auto hedged = parseClaims("Hmm, the blue component is at (0, 1)");
	ASSERT_EQ(hedged.size(), 1u);
	EXPECT_TRUE(std::holds_alternative<PositionClaim>(hedged[0]));

	const auto chatter = parseClaims("Well, hello there");
	ASSERT_EQ(chatter.size(), 1u);
	ASSERT_TRUE(std::holds_alternative<UnverifiableClaim>(chatter[0]));
	EXPECT_EQ(std::get<UnverifiableClaim>(chatter[0]).text, "Well, hello there");

	// Subjective clauses are assertions and stay.
	EXPECT_EQ(parseClaims("There are 2 blue pixels and it looks symmetric").size(), 2u);
}

TEST(ClaimParser, Statement_Order) {
	const auto claims = parseClaims("There are 2 blue pixels. The blue component is at (0, 1). It looks nice");
	ASSERT_EQ(claims.size(), 3u);
	EXPECT_TRUE(std::holds_alternative<CountClaim>(claims[0]));
	EXPECT_TRUE(std::holds_alternative<PositionClaim>(claims[1]));
	EXPECT_TRUE(std::holds_alternative<UnverifiableClaim>(claims[2]));
}

} // namespace gtest
} // namespace gridlens::analysis::grounding
