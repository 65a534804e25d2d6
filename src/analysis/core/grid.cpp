#include "analysis/core/grid.hpp"

#include "analysis/core/errors.hpp"

#include <format>

#include <opencv2/core.hpp>

namespace gridlens::analysis::core {

//! Largest palette an 8-bit cell can hold.
static constexpr int MAX_PALETTE_SIZE = 256;

Grid::Grid(cv::Mat cells) : m_cells{std::move(cells)} {
}

Grid Grid::fromRows(const GridRows& rows, const GridConfig& config) {
	if (config.paletteSize <= 0 || config.paletteSize > MAX_PALETTE_SIZE) {
		throw GridFormatError(std::format("Palette size {} outside [1, {}]", config.paletteSize, MAX_PALETTE_SIZE));
	}
	if (rows.empty()) {
		throw GridFormatError("Grid has no rows");
	}

	const std::size_t width = rows.front().size();
	if (width == 0u) {
		throw GridFormatError("Grid row is empty", 0);
	}

	cv::Mat cells(static_cast<int>(rows.size()), static_cast<int>(width), CV_8UC1);
	for (std::size_t r = 0; r < rows.size(); ++r) {
		const auto& row = rows[r];
		if (row.size() != width) {
			throw GridFormatError(std::format("Row has {} cells, expected {}", row.size(), width), static_cast<int>(r));
		}

		auto* out = cells.ptr<unsigned char>(static_cast<int>(r));
		for (std::size_t c = 0; c < width; ++c) {
			const int value = row[c];
			if (value < 0 || value >= config.paletteSize) {
				throw GridFormatError(std::format("Colour {} outside palette [0, {})", value, config.paletteSize), static_cast<int>(r), static_cast<int>(c));
			}
			out[c] = static_cast<unsigned char>(value);
		}
	}

	return Grid{std::move(cells)};
}

GridRows Grid::toRows() const {
	GridRows out(static_cast<std::size_t>(rows()));
	for (int r = 0; r < rows(); ++r) {
		const auto* in = m_cells.ptr<unsigned char>(r);
		out[static_cast<std::size_t>(r)].assign(in, in + cols());
	}
	return out;
}

bool Grid::operator==(const Grid& other) const {
	if (!sameShape(other)) {
		return false;
	}
	return cv::countNonZero(m_cells != other.m_cells) == 0;
}

} // namespace gridlens::analysis::core
