#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace tp::log
{

// Sets the file log lines are appended to. An empty path disables the file
// sink; stderr output is unaffected.
void set_log_file(std::filesystem::path path);

// Defined in Log.cpp.
void append_log_line_to_file(std::string const &line);

// If TP_ENABLE_LOGGING is defined and non-zero, it takes absolute
// precedence over TP_BUILD_MINIMAL.
#if !defined(TP_BUILD_MINIMAL) ||                                              \
    (defined(TP_ENABLE_LOGGING) && (TP_ENABLE_LOGGING))
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    const auto now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    append_log_line_to_file(final);
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
}

} // namespace tp::log

#if defined(TP_ENABLE_LOGGING) && (TP_ENABLE_LOGGING)
#define TP_LOG_INFO(fmt, ...) tp::log::write_line('I', fmt, ##__VA_ARGS__)
#define TP_LOG_DEBUG(fmt, ...) tp::log::write_line('D', fmt, ##__VA_ARGS__)
#define TP_LOG_WARN(fmt, ...) tp::log::write_line('W', fmt, ##__VA_ARGS__)
#define TP_LOG_ERROR(fmt, ...) tp::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#if defined(TP_BUILD_MINIMAL)
#define TP_LOG_INFO(fmt, ...) (void)0
#define TP_LOG_DEBUG(fmt, ...) (void)0
#define TP_LOG_WARN(fmt, ...) (void)0
#define TP_LOG_ERROR(fmt, ...) (void)0
#else
#define TP_LOG_INFO(fmt, ...) tp::log::write_line('I', fmt, ##__VA_ARGS__)
#define TP_LOG_DEBUG(fmt, ...) tp::log::write_line('D', fmt, ##__VA_ARGS__)
#define TP_LOG_WARN(fmt, ...) tp::log::write_line('W', fmt, ##__VA_ARGS__)
#define TP_LOG_ERROR(fmt, ...) tp::log::write_line('E', fmt, ##__VA_ARGS__)
#endif
#endif
