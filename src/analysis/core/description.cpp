#include "analysis/core/description.hpp"

#include <cstdlib>
#include <format>

namespace gridlens::analysis::core {

namespace {

//! Fill ratio above which a bounding box counts as solid.
static constexpr double SOLID_FILL = 0.8;
//! Fill ratio below which a component counts as scattered.
static constexpr double SCATTERED_FILL = 0.3;
//! Fill ratio below which a component counts as sparse.
static constexpr double SPARSE_FILL = 0.6;

//! 0, 1, 2 for the first, middle and last third of an axis.
static int third(double value, int extent) {
	const double size = static_cast<double>(extent);
	if (value < size / 3.0) {
		return 0;
	}
	if (value >= 2.0 * size / 3.0) {
		return 2;
	}
	return 1;
}

static std::string label(const Component& component, const ColorPalette& palette) {
	return std::format("{} {}", palette.nameOf(component.color), shapeName(classifyShape(component)));
}

} // namespace

const char* zoneName(Zone zone) {
	switch (zone) {
	case Zone::TopLeft:
		return "top-left";
	case Zone::TopCenter:
		return "top-center";
	case Zone::TopRight:
		return "top-right";
	case Zone::CenterLeft:
		return "center-left";
	case Zone::Center:
		return "center";
	case Zone::CenterRight:
		return "center-right";
	case Zone::BottomLeft:
		return "bottom-left";
	case Zone::BottomCenter:
		return "bottom-center";
	case Zone::BottomRight:
		return "bottom-right";
	}
	return "center";
}

const char* shapeName(Shape shape) {
	switch (shape) {
	case Shape::Dot:
		return "dot";
	case Shape::HorizontalLine:
		return "horizontal-line";
	case Shape::VerticalLine:
		return "vertical-line";
	case Shape::Square:
		return "square";
	case Shape::Rectangle:
		return "rectangle";
	case Shape::Scattered:
		return "scattered";
	case Shape::SparseShape:
		return "sparse-shape";
	case Shape::Other:
		return "shape";
	}
	return "shape";
}

const char* directionName(Direction direction) {
	switch (direction) {
	case Direction::None:
		return "NONE";
	case Direction::Up:
		return "UP";
	case Direction::Down:
		return "DOWN";
	case Direction::Left:
		return "LEFT";
	case Direction::Right:
		return "RIGHT";
	}
	return "NONE";
}

Zone zoneOf(const cv::Point2d& position, int rows, int cols) {
	const int rowThird = third(position.y, rows);
	const int colThird = third(position.x, cols);
	return static_cast<Zone>(rowThird * 3 + colThird);
}

Shape classifyShape(const Component& component) {
	if (component.size == 1) {
		return Shape::Dot;
	}

	const int height = component.bounds.height;
	const int width  = component.bounds.width;
	if (height == 1 && width > 2) {
		return Shape::HorizontalLine;
	}
	if (width == 1 && height > 2) {
		return Shape::VerticalLine;
	}

	const double fill = static_cast<double>(component.size) / static_cast<double>(component.bounds.area());
	if (height == width && fill > SOLID_FILL) {
		return Shape::Square;
	}
	if (fill > SOLID_FILL) {
		return Shape::Rectangle;
	}
	if (fill < SCATTERED_FILL) {
		return Shape::Scattered;
	}
	if (fill < SPARSE_FILL) {
		return Shape::SparseShape;
	}
	return Shape::Other;
}

Direction directionOf(int rowShift, int colShift) {
	if (rowShift == 0 && colShift == 0) {
		return Direction::None;
	}
	if (std::abs(rowShift) > std::abs(colShift)) {
		return rowShift > 0 ? Direction::Down : Direction::Up;
	}
	return colShift > 0 ? Direction::Right : Direction::Left;
}

std::vector<Insight> describeDelta(const DeltaResult& delta, const ColorPalette& palette, int rows, int cols) {
	std::vector<Insight> insights;
	insights.reserve(delta.transformations.size());

	for (const ComponentTransformation& t: delta.transformations) {
		std::string text;
		switch (t.kind) {
		case TransformKind::Moved:
			text = std::format("{} moved {} by ({}, {})", label(*t.before, palette), directionName(directionOf(t.rowShift, t.colShift)), t.rowShift,
			                   t.colShift);
			break;
		case TransformKind::Resized:
			text = std::format("{} component at {} resized from {} to {} cells", palette.nameOf(t.before->color),
			                   zoneName(zoneOf(t.after->centroid, rows, cols)), t.before->size, t.after->size);
			break;
		case TransformKind::Recolored:
			text = std::format("{} at {} turned {}", label(*t.before, palette), zoneName(zoneOf(t.after->centroid, rows, cols)),
			                   palette.nameOf(t.after->color));
			break;
		case TransformKind::Appeared:
			text = std::format("new {} appeared at {}", label(*t.after, palette), zoneName(zoneOf(t.after->centroid, rows, cols)));
			break;
		case TransformKind::Disappeared:
			text = std::format("{} at {} disappeared", label(*t.before, palette), zoneName(zoneOf(t.before->centroid, rows, cols)));
			break;
		}
		insights.push_back({t.kind, std::move(text)});
	}
	return insights;
}

} // namespace gridlens::analysis::core
