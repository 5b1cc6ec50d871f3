#pragma once
#include "color_code.hpp"
#include "diagnostics.hpp"
#include <string>
#include <vector>
#include <optional>
#include <iosfwd>
#include <stdexcept>
#include <cstdint>

namespace hilite {

// A pattern given on the command line, with the settings in effect at its position
struct PatternSpec {
    std::string pattern;
    std::optional<Color> color; // nullopt: use the default color
    uint32_t options;           // pcre2_regex::PatternOptions
};

enum class RunMode { FILTER, RAINBOW, STRESS, HELP, VERSION };

struct Options {
    RunMode mode = RunMode::FILTER;
    Color default_color;
    std::vector<PatternSpec> patterns;
    std::vector<std::string> input_files; // empty: read stdin
    long stress_iterations;

    Options();
};

namespace options {

constexpr long default_stress_iterations = 50000;

class color_spec_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parse "fg", "fg,bg", ",bg" or "fg,"; each value 0-255.
// Throws color_spec_error.
Color parse_color_spec(const std::string& spec);

// Parse command line arguments (without the program name). Errors are
// recorded in diag; a usage error stops parsing and is rethrown as
// usage_error.
Options parse_args(const std::vector<std::string>& args, Diagnostics& diag);

void print_usage(std::ostream& os);

} // namespace options
} // namespace hilite
