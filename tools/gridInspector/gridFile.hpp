#pragma once

#include "analysis/core/grid.hpp"

#include <filesystem>
#include <istream>

namespace gridlens::tools {

//! Read a grid from text: one row per line, cells separated by whitespace or commas. Blank lines are skipped.
//! \throws std::runtime_error if the file cannot be opened or a cell is not a number.
analysis::core::GridRows readGridRows(std::istream& in);
analysis::core::GridRows readGridFile(const std::filesystem::path& path);

} // namespace gridlens::tools
