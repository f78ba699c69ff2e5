#include "utils/Validator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>

namespace tp::utils
{

namespace
{

constexpr std::string_view kInvalidFilenameChars = "\\/:*?\"<>|";

// Style files share the preset directory and must never show up as presets.
constexpr std::array<std::string_view, 6> kReservedNames = {
    {"config", "classes", "heatmap", "brands", "brakes", "compounds"}};

std::string_view trim(std::string_view value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

std::string to_lower(std::string_view value)
{
    std::string lowercase(value);
    std::transform(lowercase.begin(), lowercase.end(), lowercase.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return lowercase;
}

bool allowed_filename(std::string_view name)
{
    if (name.empty() || trim(name).size() != name.size())
    {
        return false;
    }
    if (name.find_first_of(kInvalidFilenameChars) != std::string_view::npos)
    {
        return false;
    }
    if (std::any_of(name.begin(), name.end(),
                    [](unsigned char ch) { return ch < 0x20; }))
    {
        return false;
    }
    auto const lowercase = to_lower(name);
    if (lowercase == "." || lowercase == "..")
    {
        return false;
    }
    if (std::find(kReservedNames.begin(), kReservedNames.end(), lowercase) !=
        kReservedNames.end())
    {
        return false;
    }
    return lowercase.find("backup") == std::string::npos;
}

std::string strip_filename_extension(std::string_view name,
                                     std::string_view extension)
{
    auto trimmed = trim(name);
    if (!extension.empty() && trimmed.size() >= extension.size() &&
        to_lower(trimmed.substr(trimmed.size() - extension.size())) ==
            to_lower(extension))
    {
        trimmed.remove_suffix(extension.size());
    }
    return std::string(trim(trimmed));
}

bool user_data_path(std::filesystem::path const &path)
{
    if (path.empty())
    {
        return false;
    }
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
    {
        return true;
    }
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

} // namespace tp::utils
