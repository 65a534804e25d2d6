#include "analysis/core/description.hpp"
#include "analysis/core/frameSequence.hpp"

#include <gtest/gtest.h>

namespace gridlens::analysis::core {
namespace gtest {

//! Component with the given bounding box (column, row, width, height) and size. Cells are irrelevant for shape classification.
static Component makeComponent(int size, cv::Rect bounds) {
	return Component{0, 1, size, bounds, cv::Point2d(bounds.x, bounds.y), {}};
}

static std::vector<std::string> describe(const GridRows& before, const GridRows& after) {
	const DeltaResult delta = analyseDelta(before, after);
	std::vector<std::string> out;
	for (const Insight& insight: describeDelta(delta, ColorPalette::arc(), static_cast<int>(after.size()), static_cast<int>(after.front().size()))) {
		out.push_back(insight.description);
	}
	return out;
}

TEST(Description, Shapes) {
	EXPECT_EQ(classifyShape(makeComponent(1, {2, 2, 1, 1})), Shape::Dot);
	EXPECT_EQ(classifyShape(makeComponent(3, {0, 0, 3, 1})), Shape::HorizontalLine);
	EXPECT_EQ(classifyShape(makeComponent(4, {0, 0, 1, 4})), Shape::VerticalLine);
	EXPECT_EQ(classifyShape(makeComponent(4, {0, 0, 2, 2})), Shape::Square);
	EXPECT_EQ(classifyShape(makeComponent(6, {0, 0, 3, 2})), Shape::Rectangle);
	EXPECT_EQ(classifyShape(makeComponent(2, {0, 0, 2, 1})), Shape::Rectangle);
	EXPECT_EQ(classifyShape(makeComponent(4, {0, 0, 4, 4})), Shape::Scattered);
	EXPECT_EQ(classifyShape(makeComponent(5, {0, 0, 3, 3})), Shape::SparseShape);
	EXPECT_EQ(classifyShape(makeComponent(3, {0, 0, 2, 2})), Shape::Other);

	EXPECT_STREQ(shapeName(Shape::Other), "shape");
	EXPECT_STREQ(shapeName(Shape::HorizontalLine), "horizontal-line");
}

TEST(Description, Zones) {
	// Position is (x = column, y = row).
	EXPECT_EQ(zoneOf({0.0, 0.0}, 9, 9), Zone::TopLeft);
	EXPECT_EQ(zoneOf({8.0, 0.0}, 9, 9), Zone::TopRight);
	EXPECT_EQ(zoneOf({4.0, 4.0}, 9, 9), Zone::Center);
	EXPECT_EQ(zoneOf({0.0, 8.0}, 9, 9), Zone::BottomLeft);
	EXPECT_EQ(zoneOf({4.0, 8.0}, 9, 9), Zone::BottomCenter);
	EXPECT_EQ(zoneOf({1.0, 1.0}, 3, 3), Zone::Center);

	EXPECT_STREQ(zoneName(Zone::CenterRight), "center-right");
}

TEST(Description, Directions) {
	EXPECT_EQ(directionOf(0, 0), Direction::None);
	EXPECT_EQ(directionOf(-2, 1), Direction::Up);
	EXPECT_EQ(directionOf(1, 0), Direction::Down);
	EXPECT_EQ(directionOf(0, -1), Direction::Left);
	EXPECT_EQ(directionOf(3, 4), Direction::Right);
	// Equal magnitude favours the horizontal axis.
	EXPECT_EQ(directionOf(3, -3), Direction::Left);

	EXPECT_STREQ(directionName(Direction::Down), "DOWN");
}

TEST(Description, Delta_Sentences) {
	EXPECT_EQ(describe({{0, 0, 0, 0}, {0, 5, 0, 0}, {0, 0, 0, 0}}, {{0, 0, 0, 0}, {0, 0, 5, 0}, {0, 0, 0, 0}}),
	          (std::vector<std::string>{"gray dot moved RIGHT by (0, 1)"}));

	EXPECT_EQ(describe({{0, 0, 0}, {0, 5, 0}, {0, 0, 0}}, {{0, 0, 0}, {0, 7, 0}, {0, 0, 0}}),
	          (std::vector<std::string>{"gray dot at center turned orange"}));

	EXPECT_EQ(describe({{0, 0, 0, 0}, {0, 4, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}, {{0, 0, 0, 0}, {0, 4, 4, 0}, {0, 4, 4, 0}, {0, 0, 0, 0}}),
	          (std::vector<std::string>{"black component at center resized from 15 to 12 cells", "yellow component at center resized from 1 to 4 cells"}));

	GridRows before(12, std::vector<int>(12, 0));
	GridRows after = before;
	before[0][0]   = 3;
	after[11][11]  = 3;
	EXPECT_EQ(describe(before, after), (std::vector<std::string>{"green dot at top-left disappeared", "new green dot appeared at bottom-right"}));
}

TEST(Description, Unnamed_Colours) {
	const DeltaResult delta = analyseDelta(GridRows{{0, 0}, {0, 12}}, GridRows{{0, 0}, {0, 13}});
	const auto insights     = describeDelta(delta, ColorPalette{}, 2, 2);
	ASSERT_EQ(insights.size(), 1u);
	EXPECT_EQ(insights[0].kind, TransformKind::Recolored);
	EXPECT_EQ(insights[0].description, "color-12 dot at center turned color-13");
}

TEST(FrameSequence, Summaries) {
	const std::vector<Grid> frames = {
	        Grid::fromRows({{0, 0}, {0, 1}}),
	        Grid::fromRows({{0, 0}, {1, 0}}),
	        Grid::fromRows({{0, 0, 0}, {0, 0, 1}}),
	};

	const auto summaries = summariseSequence(frames);
	ASSERT_EQ(summaries.size(), 3u);

	EXPECT_EQ(summaries[0].index, 0u);
	EXPECT_EQ(summaries[0].componentCount, 2u);
	EXPECT_EQ(summaries[0].dominantColor, 0);
	EXPECT_NEAR(summaries[0].entropy, 0.811, 0.001);
	EXPECT_FALSE(summaries[0].delta.has_value());

	ASSERT_TRUE(summaries[1].delta.has_value());
	const DeltaSummary& step = *summaries[1].delta;
	EXPECT_EQ(step.pixelsChanged, 2);
	EXPECT_EQ(step.matched, 1u);
	EXPECT_EQ(step.appeared, 0u);
	EXPECT_EQ(step.disappeared, 0u);
	ASSERT_EQ(step.insights.size(), 1u);
	EXPECT_EQ(step.insights[0].description, "blue dot moved LEFT by (0, -1)");

	// Shape change: no pixel count, components are still matched.
	ASSERT_TRUE(summaries[2].delta.has_value());
	const DeltaSummary& reshaped = *summaries[2].delta;
	EXPECT_FALSE(reshaped.pixelsChanged.has_value());
	EXPECT_EQ(reshaped.matched, 2u);
	EXPECT_EQ(reshaped.appeared, 0u);
	EXPECT_EQ(reshaped.disappeared, 0u);
}

TEST(FrameSequence, Empty) {
	EXPECT_TRUE(summariseSequence({}).empty());
}

TEST(ColorPalette, Arc_Names) {
	const ColorPalette palette = ColorPalette::arc();
	EXPECT_EQ(palette.names().size(), 10u);
	EXPECT_EQ(palette.nameOf(0), "black");
	EXPECT_EQ(palette.nameOf(9), "brown");
	EXPECT_EQ(palette.nameOf(12), "color-12");
	EXPECT_EQ(palette.indexOf("BLUE"), 1);
	EXPECT_EQ(palette.indexOf(" Gray "), 5);
	EXPECT_FALSE(palette.indexOf("purple").has_value());
}

TEST(ColorPalette, Normalised_Lookup) {
	EXPECT_EQ(ColorPalette::normalise("Light  Blue"), "light-blue");
	EXPECT_EQ(ColorPalette::normalise("dark_red-"), "dark-red");
	EXPECT_EQ(ColorPalette::normalise(""), "");

	const ColorPalette palette({{3, "Light Blue"}, {4, "light_blue"}});
	EXPECT_EQ(palette.indexOf("light-blue"), 3);
	EXPECT_EQ(palette.nameOf(3), "Light Blue");

	EXPECT_TRUE(ColorPalette{}.empty());
	EXPECT_FALSE(ColorPalette{}.indexOf("black").has_value());
}

} // namespace gtest
} // namespace gridlens::analysis::core
