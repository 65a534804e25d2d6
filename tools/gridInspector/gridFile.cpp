#include "gridFile.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace gridlens::tools {

analysis::core::GridRows readGridRows(std::istream& in) {
	analysis::core::GridRows rows;
	std::string line;
	std::size_t lineNumber = 0u;

	while (std::getline(in, line)) {
		++lineNumber;
		for (char& ch: line) {
			if (ch == ',' || ch == '[' || ch == ']') {
				ch = ' ';
			}
		}

		std::vector<int> row;
		std::size_t pos = 0u;
		while (pos < line.size()) {
			const std::size_t begin = line.find_first_not_of(" \t\r", pos);
			if (begin == std::string::npos) {
				break;
			}
			const std::size_t end = std::min(line.find_first_of(" \t\r", begin), line.size());

			int value            = 0;
			const auto [ptr, ec] = std::from_chars(line.data() + begin, line.data() + end, value);
			if (ec != std::errc{} || ptr != line.data() + end) {
				throw std::runtime_error(std::format("Line {}: '{}' is not a colour value", lineNumber, line.substr(begin, end - begin)));
			}
			row.push_back(value);
			pos = end;
		}

		if (!row.empty()) {
			rows.push_back(std::move(row));
		}
	}
	return rows;
}

analysis::core::GridRows readGridFile(const std::filesystem::path& path) {
	std::ifstream in(path);
	if (!in) {
		throw std::runtime_error(std::format("Could not open grid file {}", path.string()));
	}
	return readGridRows(in);
}

} // namespace gridlens::tools
