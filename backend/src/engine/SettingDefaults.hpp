#pragma once

#include "engine/SettingCategory.hpp"
#include "utils/Json.hpp"

#include <filesystem>

namespace tp::engine
{

class SettingDocument;

// Fresh copy of the built-in default template of a category.
json::MutableDocument default_template(Category category);

// Template a single entry of a style category must satisfy; null for
// categories without per-entry structure.
yyjson_val *style_entry_template(Category category);

// Platform adjustments of the global default: outside Windows the app is
// shown at startup, not minimized to tray, bypasses the window manager and
// keeps its user paths under the XDG config/data directories.
void apply_platform_defaults(SettingDocument &config,
                             std::filesystem::path const &config_root,
                             std::filesystem::path const &data_root);

} // namespace tp::engine
