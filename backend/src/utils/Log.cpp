#include "utils/Log.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>

namespace tp::log
{

namespace
{
std::mutex s_mutex;
std::ofstream s_ofs;
std::filesystem::path s_path;
} // namespace

void set_log_file(std::filesystem::path path)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_ofs.is_open())
    {
        s_ofs.close();
    }
    s_path = std::move(path);
    if (s_path.empty())
    {
        return;
    }
    std::error_code ec;
    if (auto parent = s_path.parent_path(); !parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
    }
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_path.empty())
    {
        return;
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path, std::ios::app | std::ios::out);
    }
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

} // namespace tp::log
