#pragma once
#include <string>

namespace hilite {
namespace string_utils {

// Strip leading and trailing whitespace
inline std::string strip(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

// Check if string starts with prefix
inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Remove CSI escape sequences (ESC '[' parameter bytes final-byte).
// Malformed sequences are kept as they are.
inline std::string strip_ansi(const std::string& s) {
    std::string result;
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '\033' && i + 1 < s.size() && s[i + 1] == '[') {
            size_t j = i + 2;
            while (j < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[j]);
                if (c < 0x20 || c > 0x3f) break;
                j++;
            }
            if (j < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[j]);
                if (c >= 0x40 && c <= 0x7e) {
                    i = j + 1;
                    continue;
                }
            }
        }
        result += s[i];
        i++;
    }
    return result;
}

} // namespace string_utils
} // namespace hilite
