#pragma once
#include <ostream>
#include <chrono>

namespace hilite {
namespace demo {

// Print every palette color as "NNN: -=-" in that color
void print_rainbow(std::ostream& os);

// Generate the code of every palette color `iterations` times
std::chrono::duration<double> run_stress_test(long iterations);

} // namespace demo
} // namespace hilite
