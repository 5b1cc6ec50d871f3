#include "globalvar.hpp"
#include <cstdlib>

namespace hilite {
namespace globalvar {

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value && value[0] != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace globalvar
} // namespace hilite
