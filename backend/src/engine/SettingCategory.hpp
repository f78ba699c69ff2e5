#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace tp::engine
{

// Each category is persisted to its own JSON file.
enum class Category
{
    config,
    setting,
    classes,
    heatmap,
    brands,
    brakes,
    compounds,
};

inline constexpr std::array<Category, 7> kAllCategories = {
    Category::config,  Category::setting, Category::classes,
    Category::heatmap, Category::brands,  Category::brakes,
    Category::compounds,
};

std::string_view category_name(Category category) noexcept;
std::optional<Category> parse_category(std::string_view name) noexcept;

// `config` lives in the global config directory, everything else in the
// settings (preset) directory.
constexpr bool is_global(Category category) noexcept
{
    return category == Category::config;
}

} // namespace tp::engine
