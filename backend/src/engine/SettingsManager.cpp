#include "engine/SettingsManager.hpp"

#include "engine/SettingDefaults.hpp"
#include "engine/SettingFile.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Validator.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <system_error>
#include <utility>

namespace tp::engine
{

namespace
{

constexpr std::string_view kPresetExtension = ".json";

struct UserPathEntry
{
    std::string_view key;
    std::filesystem::path FilePath::*member;
};

constexpr std::array<UserPathEntry, 9> kUserPaths = {{
    {"settings_path", &FilePath::settings},
    {"brand_logo_path", &FilePath::brand_logo},
    {"delta_best_path", &FilePath::delta_best},
    {"sector_best_path", &FilePath::sector_best},
    {"energy_delta_path", &FilePath::energy_delta},
    {"fuel_delta_path", &FilePath::fuel_delta},
    {"track_map_path", &FilePath::track_map},
    {"pace_notes_path", &FilePath::pace_notes},
    {"track_notes_path", &FilePath::track_notes},
}};

std::filesystem::path resolve_user_path(std::string const &value,
                                        std::filesystem::path const &base)
{
    std::filesystem::path path(value);
    if (path.is_relative())
    {
        path = base / path;
    }
    return path.lexically_normal();
}

std::filesystem::path normalized_directory(std::filesystem::path const &path)
{
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        absolute = path;
    }
    absolute = absolute.lexically_normal();
    // "a/b/" and "a/b" name the same directory.
    if (!absolute.has_filename() && absolute.has_parent_path() &&
        absolute != absolute.root_path())
    {
        absolute = absolute.parent_path();
    }
    return absolute;
}

bool has_extension(std::filesystem::path const &path, std::string_view extension)
{
    return utils::to_lower(path.extension().string()) == extension;
}

} // namespace

std::string const &FileName::of(Category category) const
{
    switch (category)
    {
    case Category::config:
        return config;
    case Category::setting:
        return setting;
    case Category::classes:
        return classes;
    case Category::heatmap:
        return heatmap;
    case Category::brands:
        return brands;
    case Category::brakes:
        return brakes;
    case Category::compounds:
        return compounds;
    }
    return setting;
}

std::filesystem::path const &FilePath::of(Category category) const
{
    return is_global(category) ? config : settings;
}

void FilePath::update(SettingDocument &user_config,
                      SettingDocument const &default_config,
                      std::filesystem::path const &base)
{
    for (auto const &entry : kUserPaths)
    {
        KeyPath const key{"user_path", std::string(entry.key)};
        auto value = user_config.get_string(key);
        if (!value || !utils::user_data_path(resolve_user_path(*value, base)))
        {
            auto fallback = default_config.get_string(key);
            if (!fallback)
            {
                continue;
            }
            TP_LOG_WARN("SETTING: invalid {}, reset to {}", entry.key, *fallback);
            user_config.set_string(key, *fallback);
            if (!utils::user_data_path(resolve_user_path(*fallback, base)))
            {
                TP_LOG_ERROR("SETTING: cannot create {}", *fallback);
            }
            value = std::move(fallback);
        }
        this->*entry.member = resolve_user_path(*value, base);
    }
}

SettingDocumentPtr const &Preset::of(Category category) const
{
    switch (category)
    {
    case Category::config:
        return config;
    case Category::setting:
        return setting;
    case Category::classes:
        return classes;
    case Category::heatmap:
        return heatmap;
    case Category::brands:
        return brands;
    case Category::brakes:
        return brakes;
    case Category::compounds:
        return compounds;
    }
    return setting;
}

SettingDocumentPtr &Preset::of(Category category)
{
    return const_cast<SettingDocumentPtr &>(
        static_cast<Preset const &>(*this).of(category));
}

SettingsManager::SettingsManager(std::filesystem::path config_root,
                                 std::filesystem::path data_root,
                                 SettingsManagerOptions options)
    : data_root_(std::move(data_root)),
      persistence_(
          SettingsPersistenceService::Callbacks{
              [this] { return max_saving_attempts(); }, {}},
          std::move(options.file_ops), options.persistence)
{
    path_.config = std::move(config_root);
    for (auto category : kAllCategories)
    {
        default_.of(category) = SettingDocument::make(default_template(category));
    }
    apply_platform_defaults(*default_.config, path_.config, data_root_);
    for (auto category : kAllCategories)
    {
        user_.of(category) = default_.of(category)->clone();
    }

    if (!utils::ensure_directory(path_.config))
    {
        TP_LOG_ERROR("SETTING: cannot create config directory {}",
                     path_.config.string());
    }
    auto state_path = options.state_path.empty()
                          ? path_.config / kStateFileName
                          : std::move(options.state_path);
    state_store_ = std::make_unique<storage::StateStore>(std::move(state_path));
    if (!state_store_->is_valid())
    {
        TP_LOG_WARN("SETTING: state store unavailable at {}",
                    state_store_->path().string());
    }
}

SettingsManager::~SettingsManager()
{
    persistence_.flush();
}

void SettingsManager::load_global()
{
    std::error_code ec;
    bool const existed =
        std::filesystem::exists(path_.config / filename_.config, ec);
    auto config =
        load_setting_json_file(filename_.config, path_.config, *default_.config);
    path_.update(*config, *default_.config, data_root_);
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        user_.config = std::move(config);
    }
    if (!existed)
    {
        save(Category::config, 0);
    }
}

void SettingsManager::load()
{
    auto const &settings = path_.settings;
    user_.setting =
        load_setting_json_file(filename_.setting, settings, *default_.setting);
    user_.brands = load_style_json_file(filename_.brands, settings,
                                        Category::brands, *default_.brands);
    user_.classes = load_style_json_file(filename_.classes, settings,
                                         Category::classes, *default_.classes);
    user_.brakes = load_style_json_file(filename_.brakes, settings,
                                        Category::brakes, *default_.brakes);
    user_.compounds = load_style_json_file(
        filename_.compounds, settings, Category::compounds, *default_.compounds);
    user_.heatmap =
        load_style_json_file(filename_.heatmap, settings, Category::heatmap,
                             *default_.heatmap, true);
    user_.brands_logo = load_brand_logo_list(path_.brand_logo);
    filename_.last_setting = filename_.setting;
    record_last_preset();
    TP_LOG_INFO("SETTING: loaded {}", filename_.setting);
}

void SettingsManager::create()
{
    user_.setting = copy_setting(*default_.setting);
}

void SettingsManager::update_path()
{
    auto const old_settings = normalized_directory(path_.settings);
    path_.update(*user_.config, *default_.config, data_root_);
    if (normalized_directory(path_.settings) != old_settings)
    {
        filename_.setting = preset_list().front() + std::string(kPresetExtension);
    }
}

std::vector<std::string> SettingsManager::preset_list() const
{
    std::vector<std::pair<std::filesystem::file_time_type, std::string>> found;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(path_.settings, ec), end;
         !ec && it != end; it.increment(ec))
    {
        auto const &file = it->path();
        std::error_code file_ec;
        if (!it->is_regular_file(file_ec) || !has_extension(file, kPresetExtension))
        {
            continue;
        }
        auto const modified = std::filesystem::last_write_time(file, file_ec);
        if (file_ec)
        {
            continue;
        }
        found.emplace_back(modified, file.stem().string());
    }
    std::sort(found.begin(), found.end(),
              [](auto const &lhs, auto const &rhs) { return lhs > rhs; });

    std::vector<std::string> presets;
    for (auto &entry : found)
    {
        if (utils::allowed_filename(entry.second))
        {
            presets.push_back(std::move(entry.second));
        }
    }
    if (presets.empty())
    {
        presets.emplace_back("default");
    }
    return presets;
}

std::string
SettingsManager::get_primary_preset_name(std::string_view sim_name) const
{
    auto name = user_.config->get_string({"primary_preset", std::string(sim_name)});
    if (!name || !utils::allowed_filename(*name))
    {
        return {};
    }
    auto full_name = *name + std::string(kPresetExtension);
    std::error_code ec;
    if (std::filesystem::exists(path_.settings / full_name, ec))
    {
        return full_name;
    }
    return {};
}

std::string
SettingsManager::resolve_startup_preset(std::string_view sim_name) const
{
    if (user_.config->get_bool({"application", "enable_auto_load_preset"})
            .value_or(false))
    {
        auto primary = get_primary_preset_name(sim_name);
        if (!primary.empty())
        {
            return primary;
        }
    }
    if (state_store_ && state_store_->is_valid())
    {
        if (auto last = state_store_->get(kLastPresetKey))
        {
            auto const stem = utils::strip_filename_extension(*last, kPresetExtension);
            std::error_code ec;
            if (utils::allowed_filename(stem) &&
                std::filesystem::exists(
                    path_.settings / (stem + std::string(kPresetExtension)), ec))
            {
                return stem + std::string(kPresetExtension);
            }
        }
    }
    return preset_list().front() + std::string(kPresetExtension);
}

void SettingsManager::save(Category category, int delay_ticks)
{
    persistence_.request_save(
        {filename_.of(category), path_.of(category), user_.of(category)},
        delay_ticks);
}

void SettingsManager::save(std::string_view filetype, int delay_ticks)
{
    auto category = parse_category(filetype);
    if (!category)
    {
        TP_LOG_ERROR("SETTING: invalid file type, skipping");
        return;
    }
    save(*category, delay_ticks);
}

SettingDocument &SettingsManager::user(Category category) const
{
    return *user_.of(category);
}

int SettingsManager::max_saving_attempts() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    auto attempts =
        user_.config->get_int({"application", "maximum_saving_attempts"});
    if (!attempts)
    {
        return SettingsPersistenceService::kMinimumAttempts;
    }
    return static_cast<int>(std::clamp<std::int64_t>(
        *attempts, 0, std::numeric_limits<int>::max()));
}

void SettingsManager::record_last_preset()
{
    if (!state_store_ || !state_store_->is_valid())
    {
        return;
    }
    if (!state_store_->set(kLastPresetKey, filename_.last_setting))
    {
        TP_LOG_WARN("SETTING: failed to record last preset {}",
                    filename_.last_setting);
    }
}

std::vector<std::string> load_brand_logo_list(std::filesystem::path const &filepath)
{
    std::vector<std::string> logos;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(filepath, ec), end;
         !ec && it != end; it.increment(ec))
    {
        std::error_code file_ec;
        if (it->is_regular_file(file_ec) && has_extension(it->path(), ".png"))
        {
            logos.push_back(it->path().stem().string());
        }
    }
    std::sort(logos.begin(), logos.end());
    return logos;
}

} // namespace tp::engine
