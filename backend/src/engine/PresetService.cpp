#include "engine/PresetService.hpp"

#include "utils/Log.hpp"
#include "utils/Validator.hpp"

#include <algorithm>
#include <system_error>

namespace tp::engine
{

namespace
{

constexpr std::string_view kPresetExtension = ".json";

std::string stem_of(std::string_view name)
{
    return utils::strip_filename_extension(name, kPresetExtension);
}

std::string file_of(std::string_view stem)
{
    return std::string(stem) + std::string(kPresetExtension);
}

} // namespace

std::string_view preset_status_name(PresetStatus status) noexcept
{
    switch (status)
    {
    case PresetStatus::ok:
        return "ok";
    case PresetStatus::invalid_name:
        return "invalid preset name";
    case PresetStatus::already_exists:
        return "preset already exists";
    case PresetStatus::not_found:
        return "preset not found";
    case PresetStatus::io_error:
        return "file error";
    }
    return "unknown";
}

PresetService::PresetService(SettingsManager &settings) : settings_(settings)
{
}

std::vector<PresetEntry> PresetService::list() const
{
    auto const &config = *settings_.user().config;
    auto const loaded = loaded_preset();
    std::vector<PresetEntry> entries;
    for (auto &name : settings_.preset_list())
    {
        PresetEntry entry;
        for (auto sim : kSimNames)
        {
            auto primary = config.get_string({"primary_preset", std::string(sim)});
            if (primary && *primary == name)
            {
                entry.primary_for.emplace_back(sim);
            }
        }
        entry.loaded = name == loaded;
        entry.name = std::move(name);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::string PresetService::loaded_preset() const
{
    return stem_of(settings_.filename().last_setting);
}

PresetStatus PresetService::load(std::string_view name)
{
    auto const stem = stem_of(name);
    if (!utils::allowed_filename(stem))
    {
        return PresetStatus::invalid_name;
    }
    if (!exists(stem))
    {
        return PresetStatus::not_found;
    }
    settings_.filename().setting = file_of(stem);
    settings_.load();
    return PresetStatus::ok;
}

PresetStatus PresetService::create(std::string_view name)
{
    std::string stem;
    if (auto status = check_new_name(name, stem); status != PresetStatus::ok)
    {
        return status;
    }
    settings_.filename().setting = file_of(stem);
    settings_.create();
    settings_.save(Category::setting, 0);
    settings_.wait_until_idle();
    if (!exists(stem))
    {
        TP_LOG_ERROR("PRESET: failed to create {}", stem);
        return PresetStatus::io_error;
    }
    TP_LOG_INFO("PRESET: created {}", stem);
    return PresetStatus::ok;
}

PresetStatus PresetService::duplicate(std::string_view source,
                                      std::string_view name)
{
    auto const source_stem = stem_of(source);
    if (!exists(source_stem))
    {
        return PresetStatus::not_found;
    }
    std::string stem;
    if (auto status = check_new_name(name, stem); status != PresetStatus::ok)
    {
        return status;
    }
    // Pending writes of the source land before it is copied.
    settings_.flush();
    std::error_code ec;
    std::filesystem::copy_file(preset_file(source_stem), preset_file(stem), ec);
    if (ec)
    {
        TP_LOG_ERROR("PRESET: failed to duplicate {} as {}: {}", source_stem,
                     stem, ec.message());
        return PresetStatus::io_error;
    }
    TP_LOG_INFO("PRESET: duplicated {} as {}", source_stem, stem);
    return PresetStatus::ok;
}

PresetStatus PresetService::rename(std::string_view source, std::string_view name)
{
    auto const source_stem = stem_of(source);
    if (!exists(source_stem))
    {
        return PresetStatus::not_found;
    }
    std::string stem;
    if (auto status = check_new_name(name, stem); status != PresetStatus::ok)
    {
        return status;
    }
    // A queued write would recreate the old file after the rename.
    settings_.flush();
    std::error_code ec;
    std::filesystem::rename(preset_file(source_stem), preset_file(stem), ec);
    if (ec)
    {
        TP_LOG_ERROR("PRESET: failed to rename {} to {}: {}", source_stem, stem,
                     ec.message());
        return PresetStatus::io_error;
    }
    TP_LOG_INFO("PRESET: renamed {} to {}", source_stem, stem);
    if (settings_.filename().setting == file_of(source_stem))
    {
        settings_.filename().setting = file_of(stem);
        settings_.load();
    }
    return PresetStatus::ok;
}

PresetStatus PresetService::remove(std::string_view name)
{
    auto const stem = stem_of(name);
    if (!utils::allowed_filename(stem))
    {
        return PresetStatus::invalid_name;
    }
    if (!exists(stem))
    {
        return PresetStatus::not_found;
    }
    settings_.flush();
    std::error_code ec;
    if (!std::filesystem::remove(preset_file(stem), ec) || ec)
    {
        TP_LOG_ERROR("PRESET: failed to delete {}: {}", stem, ec.message());
        return PresetStatus::io_error;
    }
    TP_LOG_INFO("PRESET: deleted {}", stem);
    return PresetStatus::ok;
}

PresetStatus PresetService::set_primary(std::string_view sim_name,
                                        std::string_view name)
{
    if (std::find(kSimNames.begin(), kSimNames.end(), sim_name) ==
        kSimNames.end())
    {
        return PresetStatus::invalid_name;
    }
    auto const stem = stem_of(name);
    if (!utils::allowed_filename(stem))
    {
        return PresetStatus::invalid_name;
    }
    if (!exists(stem))
    {
        return PresetStatus::not_found;
    }
    settings_.user(Category::config)
        .set_string({"primary_preset", std::string(sim_name)}, stem);
    settings_.save(Category::config);
    return PresetStatus::ok;
}

PresetStatus PresetService::clear_primary(std::string_view name)
{
    auto const stem = stem_of(name);
    auto &config = settings_.user(Category::config);
    bool tag_found = false;
    for (auto sim : kSimNames)
    {
        KeyPath const key{"primary_preset", std::string(sim)};
        auto primary = config.get_string(key);
        if (primary && *primary == stem)
        {
            config.set_string(key, "");
            tag_found = true;
        }
    }
    if (!tag_found)
    {
        return PresetStatus::not_found;
    }
    settings_.save(Category::config);
    return PresetStatus::ok;
}

bool PresetService::auto_load() const
{
    return settings_.user(Category::config)
        .get_bool({"application", "enable_auto_load_preset"})
        .value_or(false);
}

void PresetService::set_auto_load(bool enabled)
{
    settings_.user(Category::config)
        .set_bool({"application", "enable_auto_load_preset"}, enabled);
    settings_.save(Category::config);
}

PresetStatus PresetService::check_new_name(std::string_view entered,
                                           std::string &stem) const
{
    stem = stem_of(entered);
    if (!utils::allowed_filename(stem))
    {
        return PresetStatus::invalid_name;
    }
    auto const lowercase = utils::to_lower(stem);
    for (auto const &preset : settings_.preset_list())
    {
        if (utils::to_lower(preset) == lowercase)
        {
            return PresetStatus::already_exists;
        }
    }
    return PresetStatus::ok;
}

bool PresetService::exists(std::string_view stem) const
{
    std::error_code ec;
    return std::filesystem::is_regular_file(preset_file(stem), ec);
}

std::filesystem::path PresetService::preset_file(std::string_view stem) const
{
    return settings_.path().settings / file_of(stem);
}

} // namespace tp::engine
