#include "demo.hpp"
#include "color_code.hpp"
#include "globalvar.hpp"
#include <iomanip>

namespace hilite {
namespace demo {

void print_rainbow(std::ostream& os) {
    for (int c = 0; c < globalvar::palette_size; c++) {
        os << std::setw(3) << c << ": " << color_code::get(c) << "-=-" << color_code::reset() << "\n";
    }
}

std::chrono::duration<double> run_stress_test(long iterations) {
    auto start = std::chrono::steady_clock::now();
    for (long i = 0; i < iterations; i++) {
        for (int c = 0; c < globalvar::palette_size; c++) {
            color_code::get(c);
        }
    }
    return std::chrono::steady_clock::now() - start;
}

} // namespace demo
} // namespace hilite
