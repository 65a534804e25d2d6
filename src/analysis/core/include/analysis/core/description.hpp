#pragma once

#include "analysis/core/colorPalette.hpp"
#include "analysis/core/deltaAnalyzer.hpp"
#include "analysis/core/gridAnalyzer.hpp"

#include <string>
#include <vector>

// Plain-language descriptions of components and frame changes.
// These are aids for a reader of the analysis (or a prompt builder). They carry no game semantics.
namespace gridlens::analysis::core {

//! One of nine regions of a grid, splitting each axis into thirds.
enum class Zone { TopLeft, TopCenter, TopRight, CenterLeft, Center, CenterRight, BottomLeft, BottomCenter, BottomRight };

//! Coarse shape of a component judged by the fill ratio of its bounding box.
enum class Shape { Dot, HorizontalLine, VerticalLine, Square, Rectangle, Scattered, SparseShape, Other };

//! Dominant direction of a translation.
enum class Direction { None, Up, Down, Left, Right };

const char* zoneName(Zone zone);
const char* shapeName(Shape shape);
const char* directionName(Direction direction);

//! Zone of a position (x = column, y = row) in a rows x cols grid.
Zone zoneOf(const cv::Point2d& position, int rows, int cols);

Shape classifyShape(const Component& component);

//! Direction of the larger axis of (rowShift, colShift). Ties favour the horizontal axis. (0, 0) is Direction::None.
Direction directionOf(int rowShift, int colShift);

//! Human-readable observation about a change.
struct Insight {
	TransformKind kind;
	std::string description;
};

/*! Describe each component transformation of a delta in one sentence.
 * \param [in] delta   Frame delta.
 * \param [in] palette Colour names used in the sentences.
 * \param [in] rows    Height of the later frame (for zones).
 * \param [in] cols    Width of the later frame (for zones).
 */
std::vector<Insight> describeDelta(const DeltaResult& delta, const ColorPalette& palette, int rows, int cols);

} // namespace gridlens::analysis::core
