#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>
#include <ShlObj.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#else
#include <unistd.h>
#endif

namespace tp::utils
{

namespace
{

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    return std::filesystem::current_path();
}

#if !defined(_WIN32)
std::optional<std::filesystem::path> xdg_base(char const *variable,
                                              char const *home_suffix)
{
    if (auto const *value = std::getenv(variable); value && *value)
    {
        return std::filesystem::path(value);
    }
    if (auto const *home = std::getenv("HOME"); home && *home)
    {
        return std::filesystem::path(home) / home_suffix;
    }
    return std::nullopt;
}
#endif

} // namespace

std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::is_directory(candidate, ec))
    {
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> executable_path()
{
#if defined(_WIN32)
    std::vector<wchar_t> buffer(32768);
    while (true)
    {
        DWORD length = GetModuleFileNameW(nullptr, buffer.data(),
                                          static_cast<DWORD>(buffer.size()));
        if (length == 0)
        {
            return std::nullopt;
        }
        if (length < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        if (buffer.size() >= (1 << 16))
        {
            return std::nullopt;
        }
        buffer.resize(buffer.size() * 2);
    }
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    if (size == 0)
    {
        return std::nullopt;
    }
    std::vector<char> buffer(size);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data());
#else
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

std::filesystem::path global_config_root()
{
#if defined(_WIN32)
    PWSTR roaming_app = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, KF_FLAG_CREATE,
                                       nullptr, &roaming_app)) &&
        roaming_app)
    {
        std::filesystem::path path(roaming_app);
        CoTaskMemFree(roaming_app);
        path /= kAppName;
        if (auto ensured = ensure_directory(path))
        {
            return *ensured;
        }
    }
#else
    if (auto base = xdg_base("XDG_CONFIG_HOME", ".config"))
    {
        if (auto ensured = ensure_directory(*base / kAppName))
        {
            return *ensured;
        }
    }
#endif
    auto fallback = fallback_root();
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return fallback;
}

std::filesystem::path user_data_root()
{
#if !defined(_WIN32)
    if (auto base = xdg_base("XDG_DATA_HOME", ".local/share"))
    {
        if (auto ensured = ensure_directory(*base / kAppName))
        {
            return *ensured;
        }
    }
#endif
    return std::filesystem::current_path();
}

} // namespace tp::utils
