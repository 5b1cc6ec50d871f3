#include "options.hpp"
#include "globalvar.hpp"
#include "pcre2_regex.hpp"
#include "string_utils.hpp"
#include <regex>
#include <ostream>

namespace hilite {

Options::Options()
    : default_color{globalvar::default_fg, std::nullopt},
      stress_iterations(options::default_stress_iterations) {}

namespace options {

Color parse_color_spec(const std::string& spec) {
    static const std::regex spec_re(R"(^(\d{1,3})?(?:,(\d{1,3})?)?$)");
    std::smatch match;
    std::string s = string_utils::strip(spec);
    if (!std::regex_match(s, match, spec_re) || (!match[1].matched && !match[2].matched)) {
        throw color_spec_error("invalid color \"" + spec + "\" (expected fg[,bg])");
    }

    auto channel = [&](int index) -> std::optional<int> {
        if (!match[index].matched) return std::nullopt;
        int value = std::stoi(match[index].str());
        if (value >= globalvar::palette_size) {
            throw color_spec_error("color value " + match[index].str() + " in \"" + spec +
                                   "\" is out of range (0-255)");
        }
        return value;
    };

    Color color;
    color.fg = channel(1);
    color.bg = channel(2);
    return color;
}

Options parse_args(const std::vector<std::string>& args, Diagnostics& diag) {
    Options opts;

    if (auto env = globalvar::get_env(globalvar::default_color_env)) {
        try {
            opts.default_color = parse_color_spec(*env);
        } catch (const color_spec_error& e) {
            diag.handle_warning(std::string(e.what()) + " in $" + globalvar::default_color_env +
                                "; using the built-in default");
        }
    }

    static const std::regex count_re(R"(\d{1,9})");
    std::optional<Color> current_color;
    uint32_t current_options = 0;
    bool end_of_options = false;

    auto require_value = [&](size_t& i, const std::string& arg) -> const std::string& {
        if (i + 1 >= args.size()) {
            diag.handle_usage_error("option \"" + arg + "\" requires an argument");
        }
        return args[++i];
    };
    auto color_arg = [&](const std::string& value) -> Color {
        try {
            return parse_color_spec(value);
        } catch (const color_spec_error& e) {
            diag.handle_usage_error(e.what());
        }
        return Color{};
    };
    auto add_pattern = [&](const std::string& pattern) {
        opts.patterns.push_back({pattern, current_color, current_options});
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (end_of_options || arg.empty() || arg[0] != '-' || arg == "-") {
            add_pattern(arg);
        } else if (arg == "--") {
            end_of_options = true;
        } else if (arg == "-e" || arg == "--pattern") {
            add_pattern(require_value(i, arg));
        } else if (arg == "-c" || arg == "--color") {
            current_color = color_arg(require_value(i, arg));
        } else if (arg == "-d" || arg == "--default-color") {
            opts.default_color = color_arg(require_value(i, arg));
        } else if (arg == "-i" || arg == "--ignore-case") {
            current_options |= pcre2_regex::IGNORE_CASE;
        } else if (arg == "-F" || arg == "--fixed-strings") {
            current_options |= pcre2_regex::LITERAL;
        } else if (arg == "-f" || arg == "--file") {
            opts.input_files.push_back(require_value(i, arg));
        } else if (arg == "--rainbow") {
            opts.mode = RunMode::RAINBOW;
        } else if (arg == "--stress" || string_utils::starts_with(arg, "--stress=")) {
            opts.mode = RunMode::STRESS;
            std::optional<std::string> value;
            if (arg != "--stress") {
                value = arg.substr(std::string("--stress=").size());
            } else if (i + 1 < args.size() && std::regex_match(args[i + 1], count_re)) {
                value = args[++i];
            }
            if (value) {
                if (!std::regex_match(*value, count_re) || std::stol(*value) == 0) {
                    diag.handle_usage_error("invalid iteration count \"" + *value + "\"");
                }
                opts.stress_iterations = std::stol(*value);
            }
        } else if (arg == "-h" || arg == "--help") {
            opts.mode = RunMode::HELP;
        } else if (arg == "-V" || arg == "--version") {
            opts.mode = RunMode::VERSION;
        } else {
            diag.handle_usage_error("unknown option \"" + arg + "\"");
        }
    }

    if (opts.mode == RunMode::FILTER && opts.patterns.empty()) {
        diag.handle_warning("no patterns given; input is copied unchanged");
    }

    return opts;
}

void print_usage(std::ostream& os) {
    os << "Usage:\n"
       << "  " << globalvar::program_name << " [options] [PATTERN...]\n"
       << "\nOptions:\n"
       << "  -e, --pattern <regex>          Add a pattern (for patterns starting with '-')\n"
       << "  -c, --color <fg[,bg]>          Color for the patterns that follow (0-255 each)\n"
       << "  -d, --default-color <fg[,bg]>  Color for patterns without -c (default: "
       << globalvar::default_fg << ", or $" << globalvar::default_color_env << ")\n"
       << "  -i, --ignore-case              Match the patterns that follow caselessly\n"
       << "  -F, --fixed-strings            Treat the patterns that follow as literal strings\n"
       << "  -f, --file <path>              Read input from a file (repeatable; default: stdin)\n"
       << "      --rainbow                  Print the 256-color palette\n"
       << "      --stress [<iterations>]    Time color code generation (default: "
       << default_stress_iterations << ")\n"
       << "  -h, --help                     Show this help\n"
       << "  -V, --version                  Show version\n"
       << "\nPatterns with capture groups color only the groups.\n";
}

} // namespace options
} // namespace hilite
