#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace tp::utils
{

// True if `name` (without extension) may be used as a preset file name:
// not empty, no characters invalid in file names, not one of the reserved
// style file names and not a `backup` copy.
bool allowed_filename(std::string_view name);

// Removes a trailing `extension` (case-insensitive) and surrounding spaces.
std::string strip_filename_extension(std::string_view name,
                                     std::string_view extension);

// True if `path` is an existing directory or could be created as one.
bool user_data_path(std::filesystem::path const &path);

std::string to_lower(std::string_view value);

} // namespace tp::utils
