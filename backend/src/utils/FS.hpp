#pragma once

#include <filesystem>
#include <optional>

namespace tp::utils
{

inline constexpr char kAppName[] = "TinyPedal";

std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate);

// Global configuration directory (config.json, state store, log file).
// Windows: %APPDATA%/TinyPedal, elsewhere $XDG_CONFIG_HOME/TinyPedal.
std::filesystem::path global_config_root();

// Per-user data directory for recorded data (delta best, track maps...).
// Windows: the working directory, elsewhere $XDG_DATA_HOME/TinyPedal.
std::filesystem::path user_data_root();

} // namespace tp::utils
