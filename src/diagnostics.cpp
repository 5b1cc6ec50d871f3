#include "diagnostics.hpp"
#include "globalvar.hpp"

namespace hilite {

Diagnostics::Diagnostics() : success(true) {}

void Diagnostics::handle_error(const std::string& message) {
    std::string output = "Error: " + message;
    success = false;
    messages.push_back(output);
}

void Diagnostics::handle_usage_error(const std::string& message) {
    std::string output = "Error: " + message;
    success = false;
    messages.push_back(output);
    throw usage_error(output);
}

void Diagnostics::handle_warning(const std::string& message) {
    std::string output = "Warning: " + message;
    messages.push_back(output);
}

void Diagnostics::print(std::ostream& os) const {
    for (const auto& msg : messages) {
        os << "[" << globalvar::program_name << "] " << msg << "\n";
    }
}

} // namespace hilite
