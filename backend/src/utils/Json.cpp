#include "utils/Json.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>

namespace tp::json
{

namespace
{

bool number_equals(yyjson_mut_val *lhs, yyjson_val *rhs)
{
    if (yyjson_mut_is_real(lhs) || yyjson_is_real(rhs))
    {
        return yyjson_mut_get_num(lhs) == yyjson_get_num(rhs);
    }
    bool const lhs_negative = yyjson_mut_is_sint(lhs) && yyjson_mut_get_sint(lhs) < 0;
    bool const rhs_negative = yyjson_is_sint(rhs) && yyjson_get_sint(rhs) < 0;
    if (lhs_negative != rhs_negative)
    {
        return false;
    }
    if (lhs_negative)
    {
        return yyjson_mut_get_sint(lhs) == yyjson_get_sint(rhs);
    }
    auto const lhs_value = yyjson_mut_is_uint(lhs)
                               ? yyjson_mut_get_uint(lhs)
                               : static_cast<std::uint64_t>(yyjson_mut_get_sint(lhs));
    auto const rhs_value = yyjson_is_uint(rhs)
                               ? yyjson_get_uint(rhs)
                               : static_cast<std::uint64_t>(yyjson_get_sint(rhs));
    return lhs_value == rhs_value;
}

bool object_equals(yyjson_mut_val *lhs, yyjson_val *rhs)
{
    if (yyjson_mut_obj_size(lhs) != yyjson_obj_size(rhs))
    {
        return false;
    }
    size_t idx, max;
    yyjson_mut_val *key = nullptr;
    yyjson_mut_val *value = nullptr;
    yyjson_mut_obj_foreach(lhs, idx, max, key, value)
    {
        auto *other = yyjson_obj_getn(rhs, yyjson_mut_get_str(key),
                                      yyjson_mut_get_len(key));
        if (other == nullptr || !equals(value, other))
        {
            return false;
        }
    }
    return true;
}

bool array_equals(yyjson_mut_val *lhs, yyjson_val *rhs)
{
    if (yyjson_mut_arr_size(lhs) != yyjson_arr_size(rhs))
    {
        return false;
    }
    yyjson_arr_iter iter;
    yyjson_arr_iter_init(rhs, &iter);
    size_t idx, max;
    yyjson_mut_val *value = nullptr;
    yyjson_mut_arr_foreach(lhs, idx, max, value)
    {
        auto *other = yyjson_arr_iter_next(&iter);
        if (other == nullptr || !equals(value, other))
        {
            return false;
        }
    }
    return true;
}

} // namespace

Document Document::read_file(std::filesystem::path const &path,
                             std::string *error)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        if (error)
        {
            *error = "unable to open file";
        }
        return Document();
    }
    std::string bytes((std::istreambuf_iterator<char>(input)),
                      std::istreambuf_iterator<char>());
    yyjson_read_err err{};
    auto *doc = yyjson_read_opts(bytes.data(), bytes.size(),
                                 YYJSON_READ_ALLOW_BOM, nullptr, &err);
    if (doc == nullptr && error)
    {
        *error = std::string(err.msg ? err.msg : "parse error") +
                 " at byte " + std::to_string(err.pos);
    }
    return Document(doc);
}

MutableDocument MutableDocument::copy_of(yyjson_val *value)
{
    MutableDocument result;
    if (result.doc_ && value)
    {
        result.set_root(yyjson_val_mut_copy(result.doc_, value));
    }
    return result;
}

MutableDocument MutableDocument::copy_of(yyjson_mut_val *value)
{
    MutableDocument result;
    if (result.doc_ && value)
    {
        result.set_root(yyjson_mut_val_mut_copy(result.doc_, value));
    }
    return result;
}

MutableDocument MutableDocument::empty_object()
{
    MutableDocument result;
    if (result.doc_)
    {
        result.set_root(yyjson_mut_obj(result.doc_));
    }
    return result;
}

Kind kind_of(yyjson_val *value) noexcept
{
    switch (yyjson_get_type(value))
    {
    case YYJSON_TYPE_NULL:
        return Kind::null;
    case YYJSON_TYPE_BOOL:
        return Kind::boolean;
    case YYJSON_TYPE_NUM:
        return Kind::number;
    case YYJSON_TYPE_STR:
        return Kind::string;
    case YYJSON_TYPE_ARR:
        return Kind::array;
    case YYJSON_TYPE_OBJ:
        return Kind::object;
    default:
        return Kind::unknown;
    }
}

Kind kind_of(yyjson_mut_val *value) noexcept
{
    switch (yyjson_mut_get_type(value))
    {
    case YYJSON_TYPE_NULL:
        return Kind::null;
    case YYJSON_TYPE_BOOL:
        return Kind::boolean;
    case YYJSON_TYPE_NUM:
        return Kind::number;
    case YYJSON_TYPE_STR:
        return Kind::string;
    case YYJSON_TYPE_ARR:
        return Kind::array;
    case YYJSON_TYPE_OBJ:
        return Kind::object;
    default:
        return Kind::unknown;
    }
}

bool equals(yyjson_mut_val *lhs, yyjson_val *rhs)
{
    if (lhs == nullptr || rhs == nullptr)
    {
        return lhs == nullptr && rhs == nullptr;
    }
    auto const kind = kind_of(lhs);
    if (kind != kind_of(rhs))
    {
        return false;
    }
    switch (kind)
    {
    case Kind::null:
        return true;
    case Kind::boolean:
        return yyjson_mut_get_bool(lhs) == yyjson_get_bool(rhs);
    case Kind::number:
        return number_equals(lhs, rhs);
    case Kind::string:
        return std::string_view(yyjson_mut_get_str(lhs), yyjson_mut_get_len(lhs)) ==
               std::string_view(yyjson_get_str(rhs), yyjson_get_len(rhs));
    case Kind::array:
        return array_equals(lhs, rhs);
    case Kind::object:
        return object_equals(lhs, rhs);
    default:
        return false;
    }
}

yyjson_mut_val *parse_value(yyjson_mut_doc *doc, std::string_view text)
{
    if (doc == nullptr)
    {
        return nullptr;
    }
    auto parsed = Document::parse(text);
    if (parsed.is_valid() && parsed.root() != nullptr)
    {
        return yyjson_val_mut_copy(doc, parsed.root());
    }
    return yyjson_mut_strncpy(doc, text.data(), text.size());
}

} // namespace tp::json
