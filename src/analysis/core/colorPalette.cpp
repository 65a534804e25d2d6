#include "analysis/core/colorPalette.hpp"

#include <cctype>
#include <format>

namespace gridlens::analysis::core {

ColorPalette::ColorPalette(std::map<int, std::string> names) : m_names{std::move(names)} {
	for (const auto& [index, name]: m_names) {
		// First index wins if two colours share a name.
		m_indices.emplace(normalise(name), index);
	}
}

ColorPalette ColorPalette::arc() {
	return ColorPalette({
	        {0, "black"},
	        {1, "blue"},
	        {2, "red"},
	        {3, "green"},
	        {4, "yellow"},
	        {5, "gray"},
	        {6, "pink"},
	        {7, "orange"},
	        {8, "cyan"},
	        {9, "brown"},
	});
}

std::optional<int> ColorPalette::indexOf(std::string_view name) const {
	const auto it = m_indices.find(normalise(name));
	if (it == m_indices.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::string ColorPalette::nameOf(int color) const {
	const auto it = m_names.find(color);
	if (it == m_names.end()) {
		return std::format("color-{}", color);
	}
	return it->second;
}

std::string ColorPalette::normalise(std::string_view name) {
	std::string key;
	key.reserve(name.size());
	for (const char ch: name) {
		const auto c = static_cast<unsigned char>(ch);
		if (std::isspace(c) || ch == '_' || ch == '-') {
			if (!key.empty() && key.back() != '-') {
				key.push_back('-');
			}
			continue;
		}
		key.push_back(static_cast<char>(std::tolower(c)));
	}
	while (!key.empty() && key.back() == '-') {
		key.pop_back();
	}
	return key;
}

} // namespace gridlens::analysis::core
