#pragma once
#include <string>
#include <optional>
#include <tuple>
#include <cstddef>

namespace hilite {

// 256-color palette indices; an absent channel is left unspecified
struct Color {
    std::optional<int> fg;
    std::optional<int> bg;

    bool operator==(const Color& other) const { return fg == other.fg && bg == other.bg; }
    bool operator!=(const Color& other) const { return !(*this == other); }
    bool operator<(const Color& other) const {
        return std::tie(fg, bg) < std::tie(other.fg, other.bg);
    }
};

namespace color_code {

// Activation sequence for the given colors: "\033[38;5;<fg>m" then
// "\033[48;5;<bg>m", each only if present. Empty if both are absent.
// The result is memoized and the returned reference stays valid for the
// lifetime of the process.
const std::string& get(std::optional<int> fg, std::optional<int> bg = std::nullopt);
inline const std::string& get(const Color& color) { return get(color.fg, color.bg); }

// Sequence clearing all SGR attributes
const std::string& reset();

// Number of memoized activation sequences
size_t cache_size();

} // namespace color_code
} // namespace hilite
