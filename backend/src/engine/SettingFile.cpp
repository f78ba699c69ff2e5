#include "engine/SettingFile.hpp"

#include "engine/SettingValidator.hpp"
#include "utils/Log.hpp"

#include <ctime>
#include <fstream>
#include <system_error>

namespace tp::engine
{

namespace
{

std::filesystem::path backup_path(std::string const &filename,
                                  std::filesystem::path const &filepath)
{
    return filepath / (filename + kBackupExtension);
}

std::string timestamp()
{
    auto const now = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    char buffer[32]{};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d-%H-%M-%S", &tm);
    return buffer;
}

bool uses_style_validator(Category category)
{
    return category == Category::classes || category == Category::brakes ||
           category == Category::compounds || category == Category::brands;
}

} // namespace

bool create_backup_file(std::string const &filename,
                        std::filesystem::path const &filepath)
{
    auto const target = filepath / filename;
    std::error_code ec;
    if (!std::filesystem::exists(target, ec))
    {
        return false;
    }
    std::filesystem::copy_file(target, backup_path(filename, filepath),
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec)
    {
        TP_LOG_ERROR("SETTING: failed backing up {}: {}", filename,
                     ec.message());
        return false;
    }
    return true;
}

bool restore_backup_file(std::string const &filename,
                         std::filesystem::path const &filepath)
{
    auto const backup = backup_path(filename, filepath);
    std::error_code ec;
    if (!std::filesystem::exists(backup, ec))
    {
        TP_LOG_WARN("SETTING: no backup of {} to restore", filename);
        return false;
    }
    std::filesystem::copy_file(backup, filepath / filename,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec)
    {
        TP_LOG_ERROR("SETTING: failed restoring {}: {}", filename,
                     ec.message());
        return false;
    }
    return true;
}

bool delete_backup_file(std::string const &filename,
                        std::filesystem::path const &filepath)
{
    std::error_code ec;
    auto const removed =
        std::filesystem::remove(backup_path(filename, filepath), ec);
    if (ec)
    {
        TP_LOG_ERROR("SETTING: failed deleting backup of {}: {}", filename,
                     ec.message());
        return false;
    }
    return removed;
}

bool json_file_exists(std::string const &filename,
                      std::filesystem::path const &filepath)
{
    std::error_code ec;
    auto const found = std::filesystem::exists(filepath / filename, ec);
    if (ec)
    {
        TP_LOG_WARN("SETTING: unable to check {}: {}", filename, ec.message());
        return true;
    }
    return found;
}

bool delete_json_file(std::string const &filename,
                      std::filesystem::path const &filepath)
{
    std::error_code ec;
    auto const removed = std::filesystem::remove(filepath / filename, ec);
    if (ec)
    {
        TP_LOG_ERROR("SETTING: failed removing {}: {}", filename, ec.message());
        return false;
    }
    return removed;
}

bool save_json_file(SettingDocument const &document, std::string const &filename,
                    std::filesystem::path const &filepath)
{
    auto const payload = document.serialize();
    std::ofstream output(filepath / filename,
                         std::ios::binary | std::ios::trunc);
    if (!output)
    {
        TP_LOG_ERROR("SETTING: unable to open {} for writing", filename);
        return false;
    }
    output << payload;
    output.flush();
    return static_cast<bool>(output);
}

bool verify_json_file(SettingDocument const &document,
                      std::string const &filename,
                      std::filesystem::path const &filepath)
{
    std::string error;
    auto parsed = json::Document::read_file(filepath / filename, &error);
    if (!parsed.is_valid())
    {
        TP_LOG_ERROR("SETTING: failed saving verification of {}: {}", filename,
                     error);
        return false;
    }
    return document.matches(parsed.root());
}

std::optional<std::filesystem::path>
backup_invalid_json_file(std::string const &filename,
                         std::filesystem::path const &filepath)
{
    auto const source = filepath / filename;
    std::error_code ec;
    if (!std::filesystem::exists(source, ec))
    {
        return std::nullopt;
    }
    auto const stem = std::filesystem::path(filename).stem().string();
    auto const target = filepath / (stem + "-backup " + timestamp() + ".json");
    std::filesystem::copy_file(source, target,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec)
    {
        TP_LOG_ERROR("SETTING: failed backing up invalid {}: {}", filename,
                     ec.message());
        return std::nullopt;
    }
    TP_LOG_INFO("SETTING: invalid {} backed up as {}", filename,
                target.filename().string());
    return target;
}

SettingDocumentPtr load_setting_json_file(std::string const &filename,
                                          std::filesystem::path const &filepath,
                                          SettingDocument const &defaults)
{
    std::string error;
    auto parsed = json::Document::read_file(filepath / filename, &error);
    if (!parsed.is_valid() || !yyjson_is_obj(parsed.root()))
    {
        std::error_code ec;
        if (std::filesystem::exists(filepath / filename, ec))
        {
            TP_LOG_ERROR("SETTING: {} failed loading, fall back to default ({})",
                         filename, parsed.is_valid() ? "not an object" : error);
            backup_invalid_json_file(filename, filepath);
        }
        else
        {
            TP_LOG_INFO("SETTING: {} not found, using default", filename);
        }
        return copy_setting(defaults);
    }

    ValidationReport report;
    auto validated = defaults.with_root(
        [&](yyjson_mut_doc *, yyjson_mut_val *root)
        { return validate_preset(parsed.root(), root, &report); });
    if (report.restored || report.dropped || report.reset)
    {
        TP_LOG_INFO("SETTING: {} validated ({} restored, {} dropped, {} reset)",
                    filename, report.restored, report.dropped, report.reset);
    }
    return SettingDocument::make(std::move(validated));
}

SettingDocumentPtr load_style_json_file(std::string const &filename,
                                        std::filesystem::path const &filepath,
                                        Category category,
                                        SettingDocument const &defaults,
                                        bool check_missing)
{
    auto const path = filepath / filename;
    std::string error;
    auto parsed = json::Document::read_file(path, &error);
    if (!parsed.is_valid() || !yyjson_is_obj(parsed.root()))
    {
        auto style = copy_setting(defaults);
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
        {
            TP_LOG_ERROR("SETTING: {} failed loading, fall back to default ({})",
                         filename, parsed.is_valid() ? "not an object" : error);
            backup_invalid_json_file(filename, filepath);
        }
        else if (!save_json_file(*style, filename, filepath))
        {
            TP_LOG_ERROR("SETTING: failed creating {}", filename);
        }
        return style;
    }

    json::MutableDocument style;
    if (uses_style_validator(category))
    {
        ValidationReport report;
        style = validate_style(category, parsed.root(), &report);
        if (report.restored || report.dropped || report.reset)
        {
            TP_LOG_INFO("SETTING: {} validated ({} restored, {} dropped, {} reset)",
                        filename, report.restored, report.dropped,
                        report.reset);
        }
    }
    else
    {
        style = json::MutableDocument::copy_of(parsed.root());
    }
    if (check_missing)
    {
        defaults.with_root([&](yyjson_mut_doc *, yyjson_mut_val *root)
                           { return add_missing_keys(style, root); });
    }
    return SettingDocument::make(std::move(style));
}

} // namespace tp::engine
