#include "engine/SettingDocument.hpp"

#include <cstdlib>
#include <limits>

namespace tp::engine
{

SettingDocument::SettingDocument(json::MutableDocument document)
    : document_(std::move(document))
{
    if (document_.is_valid() && !yyjson_mut_is_obj(document_.root()))
    {
        document_.set_root(yyjson_mut_obj(document_.doc()));
    }
}

std::string SettingDocument::serialize() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return document_.write_pretty();
}

bool SettingDocument::matches(yyjson_val *parsed) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return json::equals(document_.root(), parsed);
}

json::MutableDocument SettingDocument::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return document_.clone();
}

std::shared_ptr<SettingDocument> SettingDocument::clone() const
{
    return make(snapshot());
}

yyjson_mut_val *SettingDocument::find(KeyPath const &path) const
{
    auto *node = document_.root();
    for (auto const &key : path)
    {
        if (node == nullptr || !yyjson_mut_is_obj(node))
        {
            return nullptr;
        }
        node = yyjson_mut_obj_getn(node, key.data(), key.size());
    }
    return node;
}

bool SettingDocument::contains(KeyPath const &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return find(path) != nullptr;
}

std::optional<bool> SettingDocument::get_bool(KeyPath const &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *value = find(path);
    if (value == nullptr || !yyjson_mut_is_bool(value))
    {
        return std::nullopt;
    }
    return yyjson_mut_get_bool(value);
}

std::optional<std::int64_t> SettingDocument::get_int(KeyPath const &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *value = find(path);
    if (value == nullptr || !yyjson_mut_is_num(value))
    {
        return std::nullopt;
    }
    if (yyjson_mut_is_real(value))
    {
        // Out-of-range and NaN reals have no integer value.
        auto const real = yyjson_mut_get_real(value);
        if (!(real >= -9223372036854775808.0 && real < 9223372036854775808.0))
        {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(real);
    }
    if (yyjson_mut_is_uint(value))
    {
        auto const unsigned_value = yyjson_mut_get_uint(value);
        if (unsigned_value >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(unsigned_value);
    }
    return yyjson_mut_get_sint(value);
}

std::optional<double> SettingDocument::get_real(KeyPath const &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *value = find(path);
    if (value == nullptr || !yyjson_mut_is_num(value))
    {
        return std::nullopt;
    }
    return yyjson_mut_get_num(value);
}

std::optional<std::string> SettingDocument::get_string(KeyPath const &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *value = find(path);
    if (value == nullptr || !yyjson_mut_is_str(value))
    {
        return std::nullopt;
    }
    return std::string(yyjson_mut_get_str(value), yyjson_mut_get_len(value));
}

std::optional<std::string> SettingDocument::get_json(KeyPath const &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *value = find(path);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    size_t length = 0;
    char *text = yyjson_mut_val_write(value, 0, &length);
    if (text == nullptr)
    {
        return std::nullopt;
    }
    std::string result(text, length);
    std::free(text);
    return result;
}

std::vector<std::string> SettingDocument::keys(KeyPath const &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    auto *node = find(path);
    if (node == nullptr || !yyjson_mut_is_obj(node))
    {
        return result;
    }
    result.reserve(yyjson_mut_obj_size(node));
    size_t idx, max;
    yyjson_mut_val *key = nullptr;
    yyjson_mut_val *value = nullptr;
    yyjson_mut_obj_foreach(node, idx, max, key, value)
    {
        result.emplace_back(yyjson_mut_get_str(key), yyjson_mut_get_len(key));
    }
    return result;
}

// Callers hold mutex_. `value` must belong to document_.
bool SettingDocument::put(KeyPath const &path, yyjson_mut_val *value,
                          bool same_kind)
{
    if (path.empty() || value == nullptr)
    {
        return false;
    }
    KeyPath parent_path(path.begin(), path.end() - 1);
    auto *parent = find(parent_path);
    if (parent == nullptr || !yyjson_mut_is_obj(parent))
    {
        return false;
    }
    auto const &leaf = path.back();
    auto *existing = yyjson_mut_obj_getn(parent, leaf.data(), leaf.size());
    if (same_kind &&
        (existing == nullptr || json::kind_of(existing) != json::kind_of(value)))
    {
        return false;
    }
    auto *key = yyjson_mut_strncpy(document_.doc(), leaf.data(), leaf.size());
    return yyjson_mut_obj_put(parent, key, value);
}

bool SettingDocument::set_bool(KeyPath const &path, bool value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return put(path, yyjson_mut_bool(document_.doc(), value), false);
}

bool SettingDocument::set_int(KeyPath const &path, std::int64_t value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return put(path, yyjson_mut_sint(document_.doc(), value), false);
}

bool SettingDocument::set_real(KeyPath const &path, double value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return put(path, yyjson_mut_real(document_.doc(), value), false);
}

bool SettingDocument::set_string(KeyPath const &path, std::string_view value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return put(path,
               yyjson_mut_strncpy(document_.doc(), value.data(), value.size()),
               false);
}

bool SettingDocument::assign(KeyPath const &path, std::string_view text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return put(path, json::parse_value(document_.doc(), text), true);
}

bool SettingDocument::erase(KeyPath const &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (path.empty())
    {
        return false;
    }
    KeyPath parent_path(path.begin(), path.end() - 1);
    auto *parent = find(parent_path);
    if (parent == nullptr || !yyjson_mut_is_obj(parent))
    {
        return false;
    }
    return yyjson_mut_obj_remove_keyn(parent, path.back().data(),
                                      path.back().size()) != nullptr;
}

} // namespace tp::engine
