#pragma once
#include "color_code.hpp"
#include "pcre2_regex.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

namespace hilite {

// Wraps regex matches of registered patterns in ANSI color codes.
//
// Patterns are registered once, then highlight() may be called any number
// of times (also concurrently, it does not modify the object). Registering
// while another thread highlights requires external locking.
class Highlighter {
public:
    explicit Highlighter(const Color& default_color = Color{1, std::nullopt});

    // Compile and register a pattern. Without a color the current default
    // color is bound now. Throws pcre2_regex::pattern_error, in which case
    // nothing is registered.
    void add_pattern(const std::string& pattern, const std::optional<Color>& color = std::nullopt,
                     uint32_t options = 0);
    // Register an already compiled pattern
    void add_pattern(std::shared_ptr<const pcre2_regex::Pattern> pattern,
                     const std::optional<Color>& color = std::nullopt);

    // Return text with color codes inserted around every match. Patterns
    // with capture groups color only their groups.
    std::string highlight(const std::string& text) const;

    void set_default_color(const Color& color) { default_color_ = color; }
    const Color& default_color() const { return default_color_; }

    size_t pattern_count() const { return registrations_.size(); }
    void clear() { registrations_.clear(); }

private:
    struct Registration {
        std::shared_ptr<const pcre2_regex::Pattern> pattern;
        Color color;
        const std::string* code; // cached activation sequence for color
        size_t order;
    };

    std::vector<Registration> registrations_;
    Color default_color_;
};

} // namespace hilite
