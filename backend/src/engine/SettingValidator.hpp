#pragma once

#include "engine/SettingCategory.hpp"
#include "utils/Json.hpp"

namespace tp::engine
{

struct ValidationReport
{
    int restored = 0; // missing keys filled from the template
    int dropped = 0;  // keys or entries removed
    int reset = 0;    // values of the wrong kind replaced by the template
};

// Builds a preset that has exactly the structure of `defaults`, taking every
// user value whose JSON kind matches the template. Nested objects are
// validated recursively.
json::MutableDocument validate_preset(yyjson_val *user, yyjson_mut_val *defaults,
                                      ValidationReport *report = nullptr);

// Repairs a style file (classes, brakes, compounds, brands). Every entry is
// checked against the category's entry template; entries that cannot be
// repaired are dropped. Returns a document without root if `user` is not an
// object.
json::MutableDocument validate_style(Category category, yyjson_val *user,
                                     ValidationReport *report = nullptr);

// Adds top-level keys present in `defaults` but missing from `target`.
int add_missing_keys(json::MutableDocument &target, yyjson_mut_val *defaults);

} // namespace tp::engine
