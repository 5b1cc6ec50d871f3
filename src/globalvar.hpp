#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <cstddef>

namespace hilite {
namespace globalvar {

// Version info
constexpr int version_major = 1;
constexpr int version_minor = 0;
inline const std::string hilite_version = "1.0";
inline const std::string program_name = "hilite";

// Default highlight color: palette index 1 (red) foreground
constexpr int default_fg = 1;

// Environment variable holding a color spec for the default color
inline const std::string default_color_env = "HILITE_DEFAULT_COLOR";

// Input read size and partial line flush timeout
constexpr size_t read_buffer_size = 4096;
constexpr std::chrono::milliseconds flush_timeout{5};

// Number of entries in the 256-color palette
constexpr int palette_size = 256;

// Get an environment variable; nullopt if unset or empty
std::optional<std::string> get_env(const std::string& name);

} // namespace globalvar
} // namespace hilite
