#include "engine/SettingValidator.hpp"

#include "engine/SettingDefaults.hpp"

#include <string_view>

namespace tp::engine
{

namespace
{

yyjson_mut_val *copy_key(yyjson_mut_doc *doc, yyjson_mut_val *key)
{
    return yyjson_mut_strncpy(doc, yyjson_mut_get_str(key),
                              yyjson_mut_get_len(key));
}

yyjson_mut_val *merge_object(yyjson_mut_doc *doc, yyjson_mut_val *defaults,
                             yyjson_val *user, ValidationReport &report)
{
    auto *result = yyjson_mut_obj(doc);
    size_t idx, max;
    yyjson_mut_val *key = nullptr;
    yyjson_mut_val *fallback = nullptr;
    yyjson_mut_obj_foreach(defaults, idx, max, key, fallback)
    {
        auto *candidate =
            user ? yyjson_obj_getn(user, yyjson_mut_get_str(key),
                                   yyjson_mut_get_len(key))
                 : nullptr;
        auto const expected = json::kind_of(fallback);
        yyjson_mut_val *chosen = nullptr;
        if (candidate == nullptr)
        {
            ++report.restored;
            chosen = yyjson_mut_val_mut_copy(doc, fallback);
        }
        else if (expected == json::Kind::object)
        {
            if (json::kind_of(candidate) == json::Kind::object)
            {
                chosen = merge_object(doc, fallback, candidate, report);
            }
            else
            {
                ++report.reset;
                chosen = yyjson_mut_val_mut_copy(doc, fallback);
            }
        }
        else if (expected == json::Kind::null ||
                 json::kind_of(candidate) == expected)
        {
            chosen = yyjson_val_mut_copy(doc, candidate);
        }
        else
        {
            ++report.reset;
            chosen = yyjson_mut_val_mut_copy(doc, fallback);
        }
        yyjson_mut_obj_add(result, copy_key(doc, key), chosen);
    }
    if (user != nullptr)
    {
        size_t uidx, umax;
        yyjson_val *ukey = nullptr;
        yyjson_val *uval = nullptr;
        yyjson_obj_foreach(user, uidx, umax, ukey, uval)
        {
            if (yyjson_mut_obj_getn(defaults, yyjson_get_str(ukey),
                                    yyjson_get_len(ukey)) == nullptr)
            {
                ++report.dropped;
            }
        }
    }
    return result;
}

} // namespace

json::MutableDocument validate_preset(yyjson_val *user, yyjson_mut_val *defaults,
                                      ValidationReport *report)
{
    ValidationReport local;
    json::MutableDocument result;
    if (!result.is_valid() || defaults == nullptr ||
        !yyjson_mut_is_obj(defaults))
    {
        return result;
    }
    auto *user_obj = (user && yyjson_is_obj(user)) ? user : nullptr;
    result.set_root(merge_object(result.doc(), defaults, user_obj, local));
    if (report)
    {
        *report = local;
    }
    return result;
}

json::MutableDocument validate_style(Category category, yyjson_val *user,
                                     ValidationReport *report)
{
    if (user == nullptr || !yyjson_is_obj(user))
    {
        return json::MutableDocument();
    }
    ValidationReport local;
    auto result = json::MutableDocument::empty_object();
    auto *doc = result.doc();
    auto *root = result.root();
    auto *entry_template = style_entry_template(category);

    json::MutableDocument template_doc;
    if (entry_template != nullptr)
    {
        template_doc = json::MutableDocument::copy_of(entry_template);
    }

    size_t idx, max;
    yyjson_val *key = nullptr;
    yyjson_val *value = nullptr;
    yyjson_obj_foreach(user, idx, max, key, value)
    {
        std::string_view const name(yyjson_get_str(key), yyjson_get_len(key));
        auto *name_copy = yyjson_mut_strncpy(doc, name.data(), name.size());
        if (category == Category::brands)
        {
            if (yyjson_is_str(value))
            {
                yyjson_mut_obj_add(root, name_copy, yyjson_val_mut_copy(doc, value));
            }
            else
            {
                ++local.dropped;
            }
            continue;
        }
        if (entry_template == nullptr)
        {
            yyjson_mut_obj_add(root, name_copy, yyjson_val_mut_copy(doc, value));
            continue;
        }
        if (!yyjson_is_obj(value))
        {
            ++local.dropped;
            continue;
        }
        auto *entry = merge_object(doc, template_doc.root(), value, local);
        if (category == Category::classes && yyjson_obj_get(value, "alias") == nullptr)
        {
            // A class without alias displays under its own name.
            yyjson_mut_obj_put(entry, yyjson_mut_str(doc, "alias"),
                               yyjson_mut_strncpy(doc, name.data(), name.size()));
        }
        yyjson_mut_obj_add(root, name_copy, entry);
    }
    if (report)
    {
        *report = local;
    }
    return result;
}

int add_missing_keys(json::MutableDocument &target, yyjson_mut_val *defaults)
{
    auto *root = target.root();
    if (root == nullptr || !yyjson_mut_is_obj(root) || defaults == nullptr ||
        !yyjson_mut_is_obj(defaults))
    {
        return 0;
    }
    int added = 0;
    size_t idx, max;
    yyjson_mut_val *key = nullptr;
    yyjson_mut_val *value = nullptr;
    yyjson_mut_obj_foreach(defaults, idx, max, key, value)
    {
        if (yyjson_mut_obj_getn(root, yyjson_mut_get_str(key),
                                yyjson_mut_get_len(key)) != nullptr)
        {
            continue;
        }
        yyjson_mut_obj_add(root, copy_key(target.doc(), key),
                           yyjson_mut_val_mut_copy(target.doc(), value));
        ++added;
    }
    return added;
}

} // namespace tp::engine
