#pragma once
#include <string>
#include <vector>
#include <ostream>
#include <stdexcept>

namespace hilite {

// Collects error and warning messages produced while setting up a run
class Diagnostics {
public:
    bool success;
    std::vector<std::string> messages;

    Diagnostics();

    void handle_error(const std::string& message);
    // Records the error, then throws usage_error to abort argument parsing
    void handle_usage_error(const std::string& message);
    void handle_warning(const std::string& message);

    // Write all messages to os, one per line
    void print(std::ostream& os) const;
};

// Exception for command line errors (used to abort parsing)
class usage_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace hilite
