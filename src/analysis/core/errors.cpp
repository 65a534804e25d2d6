#include "analysis/core/errors.hpp"

#include <format>

namespace gridlens::analysis::core {

static std::string locate(const std::string& message, int row, int col) {
	if (row < 0) {
		return message;
	}
	if (col < 0) {
		return std::format("{} (row {})", message, row);
	}
	return std::format("{} (row {}, col {})", message, row, col);
}

GridFormatError::GridFormatError(const std::string& message, int row, int col)
    : std::invalid_argument(locate(message, row, col)), m_row{row}, m_col{col} {
}

DimensionMismatchError::DimensionMismatchError(int rowsBefore, int colsBefore, int rowsAfter, int colsAfter)
    : std::invalid_argument(std::format("Grid dimensions differ: {}x{} vs {}x{}", rowsBefore, colsBefore, rowsAfter, colsAfter)), m_rowsBefore{rowsBefore},
      m_colsBefore{colsBefore}, m_rowsAfter{rowsAfter}, m_colsAfter{colsAfter} {
}

} // namespace gridlens::analysis::core
