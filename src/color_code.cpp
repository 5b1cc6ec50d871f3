#include "color_code.hpp"
#include <map>
#include <mutex>

namespace hilite {
namespace color_code {

namespace {

std::mutex cache_mutex;
std::map<Color, std::string> cache;

std::string format_code(std::optional<int> fg, std::optional<int> bg) {
    std::string result;
    if (fg.has_value()) result += "\033[38;5;" + std::to_string(*fg) + "m";
    if (bg.has_value()) result += "\033[48;5;" + std::to_string(*bg) + "m";
    return result;
}

} // namespace

const std::string& get(std::optional<int> fg, std::optional<int> bg) {
    Color key{fg, bg};
    std::lock_guard<std::mutex> lock(cache_mutex);
    auto it = cache.find(key);
    if (it == cache.end()) {
        it = cache.emplace(key, format_code(fg, bg)).first;
    }
    return it->second;
}

const std::string& reset() {
    static const std::string code = "\033[0;0;0m";
    return code;
}

size_t cache_size() {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return cache.size();
}

} // namespace color_code
} // namespace hilite
