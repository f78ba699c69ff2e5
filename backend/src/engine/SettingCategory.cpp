#include "engine/SettingCategory.hpp"

namespace tp::engine
{

std::string_view category_name(Category category) noexcept
{
    switch (category)
    {
    case Category::config:
        return "config";
    case Category::setting:
        return "setting";
    case Category::classes:
        return "classes";
    case Category::heatmap:
        return "heatmap";
    case Category::brands:
        return "brands";
    case Category::brakes:
        return "brakes";
    case Category::compounds:
        return "compounds";
    }
    return "unknown";
}

std::optional<Category> parse_category(std::string_view name) noexcept
{
    for (auto category : kAllCategories)
    {
        if (category_name(category) == name)
        {
            return category;
        }
    }
    return std::nullopt;
}

} // namespace tp::engine
