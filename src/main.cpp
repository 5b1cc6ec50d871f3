#include "globalvar.hpp"
#include "diagnostics.hpp"
#include "options.hpp"
#include "highlighter.hpp"
#include "stream_filter.hpp"
#include "demo.hpp"
#include "pcre2_regex.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

using namespace hilite;

static int filter_file(const Highlighter& highlighter, const std::string& path, Diagnostics& diag) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        diag.handle_error("cannot open file \"" + path + "\": " + strerror(errno));
        return 1;
    }
    int status = 0;
    try {
        StreamFilter(highlighter, fd, STDOUT_FILENO).run();
    } catch (const std::exception& e) {
        diag.handle_error("\"" + path + "\": " + e.what());
        status = 1;
    }
    close(fd);
    return status;
}

static int cmd_filter(const Options& opts, Diagnostics& diag) {
    Highlighter highlighter(opts.default_color);

    for (const auto& spec : opts.patterns) {
        try {
            highlighter.add_pattern(spec.pattern, spec.color, spec.options);
        } catch (const pcre2_regex::pattern_error& e) {
            diag.handle_error(e.what());
        }
    }
    if (!diag.success) return 1;

    if (opts.input_files.empty()) {
        try {
            StreamFilter(highlighter, STDIN_FILENO, STDOUT_FILENO).run();
        } catch (const std::exception& e) {
            diag.handle_error(e.what());
            return 1;
        }
        return 0;
    }

    int status = 0;
    for (const auto& path : opts.input_files) {
        if (filter_file(highlighter, path, diag) != 0) status = 1;
    }
    return status;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Diagnostics diag;
    Options opts;

    try {
        opts = options::parse_args(args, diag);
    } catch (const usage_error&) {
        diag.print(std::cerr);
        options::print_usage(std::cerr);
        return 1;
    }
    // Warnings go out before any input is processed
    diag.print(std::cerr);
    diag.messages.clear();

    int status = 0;
    switch (opts.mode) {
    case RunMode::HELP:
        options::print_usage(std::cout);
        break;
    case RunMode::VERSION:
        std::cout << globalvar::program_name << " " << globalvar::hilite_version << "\n";
        break;
    case RunMode::RAINBOW:
        demo::print_rainbow(std::cout);
        break;
    case RunMode::STRESS: {
        auto elapsed = demo::run_stress_test(opts.stress_iterations);
        std::cout << opts.stress_iterations << " x " << globalvar::palette_size
                  << " color codes in " << elapsed.count() << " s\n";
        break;
    }
    case RunMode::FILTER:
        status = cmd_filter(opts, diag);
        break;
    }

    diag.print(std::cerr);
    return status;
}
