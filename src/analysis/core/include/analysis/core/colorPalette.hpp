#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gridlens::analysis::core {

/*! Mapping between colour indices and human-readable names.
 *  Supplied by the caller per call. There is no process-wide palette, so callers with different palettes cannot interfere.
 *  Name lookup ignores case and treats spaces, hyphens and underscores alike ("Light Blue" == "light-blue").
 */
class ColorPalette {
public:
	ColorPalette() = default;
	explicit ColorPalette(std::map<int, std::string> names);

	//! ARC-AGI default names for colours 0-9.
	static ColorPalette arc();

	//! Colour index for a name. Empty if the name is not in the palette.
	std::optional<int> indexOf(std::string_view name) const;

	//! Name of a colour, or "color-<index>" if it has none.
	std::string nameOf(int color) const;

	bool empty() const { return m_names.empty(); }
	const std::map<int, std::string>& names() const { return m_names; }

	//! Normalised lookup key of a colour name.
	static std::string normalise(std::string_view name);

private:
	std::map<int, std::string> m_names;    //!< Index -> display name as given.
	std::map<std::string, int> m_indices;  //!< Normalised name -> index.
};

} // namespace gridlens::analysis::core
