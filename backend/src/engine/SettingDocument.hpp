#pragma once

#include "utils/Json.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tp::engine
{

// Sequence of object keys from the document root, e.g.
// {"application", "maximum_saving_attempts"}.
using KeyPath = std::vector<std::string>;

// In-memory JSON dictionary of one setting category. UI code mutates it in
// place while the save worker serializes whatever it holds at write time, so
// every access goes through the internal lock.
class SettingDocument
{
  public:
    explicit SettingDocument(json::MutableDocument document);

    SettingDocument(SettingDocument const &) = delete;
    SettingDocument &operator=(SettingDocument const &) = delete;

    static std::shared_ptr<SettingDocument> make(json::MutableDocument document)
    {
        return std::make_shared<SettingDocument>(std::move(document));
    }

    // Runs fn(yyjson_mut_doc *, yyjson_mut_val *root) under the lock.
    template <typename Fn> decltype(auto) with_root(Fn &&fn) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(document_.doc(), document_.root());
    }

    std::string serialize() const;
    bool matches(yyjson_val *parsed) const;
    json::MutableDocument snapshot() const;
    std::shared_ptr<SettingDocument> clone() const;

    bool contains(KeyPath const &path) const;
    std::optional<bool> get_bool(KeyPath const &path) const;
    std::optional<std::int64_t> get_int(KeyPath const &path) const;
    std::optional<double> get_real(KeyPath const &path) const;
    std::optional<std::string> get_string(KeyPath const &path) const;
    // Compact JSON text of any value.
    std::optional<std::string> get_json(KeyPath const &path) const;
    std::vector<std::string> keys(KeyPath const &path = {}) const;

    bool set_bool(KeyPath const &path, bool value);
    bool set_int(KeyPath const &path, std::int64_t value);
    bool set_real(KeyPath const &path, double value);
    bool set_string(KeyPath const &path, std::string_view value);
    // Replaces an existing value with `text` parsed as JSON. The new value
    // must be of the same kind as the old one.
    bool assign(KeyPath const &path, std::string_view text);
    bool erase(KeyPath const &path);

  private:
    yyjson_mut_val *find(KeyPath const &path) const;
    bool put(KeyPath const &path, yyjson_mut_val *value, bool same_kind);

    mutable std::mutex mutex_;
    json::MutableDocument document_;
};

using SettingDocumentPtr = std::shared_ptr<SettingDocument>;

} // namespace tp::engine
