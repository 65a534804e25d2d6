#pragma once

#include <stdexcept>
#include <string>

namespace gridlens::analysis::core {

//! Raised for an empty grid, ragged rows or a colour outside the declared palette.
class GridFormatError : public std::invalid_argument {
public:
	//! \param [in] message Description of the fault.
	//! \param [in] row     Offending row or -1 if the whole grid is at fault.
	//! \param [in] col     Offending column or -1 if the whole row is at fault.
	GridFormatError(const std::string& message, int row = -1, int col = -1);

	int row() const noexcept { return m_row; }
	int col() const noexcept { return m_col; }

private:
	int m_row;
	int m_col;
};

//! Raised when a pixel comparison is requested on grids of different shape.
//! Both grids may be well-formed on their own.
class DimensionMismatchError : public std::invalid_argument {
public:
	DimensionMismatchError(int rowsBefore, int colsBefore, int rowsAfter, int colsAfter);

	int rowsBefore() const noexcept { return m_rowsBefore; }
	int colsBefore() const noexcept { return m_colsBefore; }
	int rowsAfter() const noexcept { return m_rowsAfter; }
	int colsAfter() const noexcept { return m_colsAfter; }

private:
	int m_rowsBefore;
	int m_colsBefore;
	int m_rowsAfter;
	int m_colsAfter;
};

} // namespace gridlens::analysis::core
