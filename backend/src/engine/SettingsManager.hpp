#pragma once

#include "engine/SettingCategory.hpp"
#include "engine/SettingDocument.hpp"
#include "engine/SettingsPersistenceService.hpp"
#include "utils/StateStore.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tp::engine
{

// File name of every category. `setting` is the current preset and changes
// when another preset is loaded.
struct FileName
{
    std::string config = "config.json";
    std::string setting = "default.json";
    std::string classes = "classes.json";
    std::string heatmap = "heatmap.json";
    std::string brands = "brands.json";
    std::string brakes = "brakes.json";
    std::string compounds = "compounds.json";
    // Preset most recently loaded.
    std::string last_setting = "None.json";

    std::string const &of(Category category) const;
};

struct FilePath
{
    // Fixed global directory.
    std::filesystem::path config;
    // User defined, from the `user_path` section of config.json.
    std::filesystem::path settings;
    std::filesystem::path brand_logo;
    std::filesystem::path delta_best;
    std::filesystem::path sector_best;
    std::filesystem::path energy_delta;
    std::filesystem::path fuel_delta;
    std::filesystem::path track_map;
    std::filesystem::path pace_notes;
    std::filesystem::path track_notes;

    std::filesystem::path const &of(Category category) const;

    // Reads every `<name>_path` entry of `user_config`. An entry that is not
    // a usable directory is reset to its default in `user_config` and
    // created. Relative entries resolve against `base`.
    void update(SettingDocument &user_config,
                SettingDocument const &default_config,
                std::filesystem::path const &base);
};

struct Preset
{
    SettingDocumentPtr config;
    SettingDocumentPtr setting;
    SettingDocumentPtr classes;
    SettingDocumentPtr heatmap;
    SettingDocumentPtr brands;
    SettingDocumentPtr brakes;
    SettingDocumentPtr compounds;
    // Stems of the PNG files in the brand logo directory.
    std::vector<std::string> brands_logo;

    SettingDocumentPtr const &of(Category category) const;
    SettingDocumentPtr &of(Category category);
};

struct SettingsManagerOptions
{
    PersistenceOptions persistence;
    SettingsPersistenceService::FileOps file_ops =
        SettingsPersistenceService::FileOps::json_files();
    // Empty keeps the state database next to config.json.
    std::filesystem::path state_path;
};

// Owns the default and user setting documents, resolves where each of them
// lives on disk and routes saves through the persistence service.
class SettingsManager
{
  public:
    static constexpr char kStateFileName[] = "state.db";
    static constexpr char kLastPresetKey[] = "lastPreset";

    SettingsManager(std::filesystem::path config_root,
                    std::filesystem::path data_root,
                    SettingsManagerOptions options = {});
    ~SettingsManager();

    SettingsManager(SettingsManager const &) = delete;
    SettingsManager &operator=(SettingsManager const &) = delete;

    // Loads config.json. Done once per launch before load().
    void load_global();
    // Loads the current preset and every style file.
    void load();
    void create();
    // Reapplies `user_path`. Switches to the newest preset when the settings
    // directory moved.
    void update_path();

    // Preset names without extension, newest first. Never empty.
    std::vector<std::string> preset_list() const;
    // "<name>.json" of the primary preset of `sim_name`, or empty when none
    // is set or the file is gone.
    std::string get_primary_preset_name(std::string_view sim_name) const;
    // File name of the preset to load at startup.
    std::string resolve_startup_preset(std::string_view sim_name) const;

    void save(Category category = Category::setting,
              int delay_ticks = SettingsPersistenceService::kDefaultDelayTicks);
    // Same as above for a category given by name. Unknown names are logged
    // and ignored.
    void save(std::string_view filetype,
              int delay_ticks = SettingsPersistenceService::kDefaultDelayTicks);

    bool is_saving() const { return persistence_.is_saving(); }
    void wait_until_idle() const { persistence_.wait_until_idle(); }
    void flush() { persistence_.flush(); }

    FileName &filename() { return filename_; }
    FileName const &filename() const { return filename_; }
    FilePath const &path() const { return path_; }
    Preset const &defaults() const { return default_; }
    Preset const &user() const { return user_; }
    SettingDocument &user(Category category) const;

    std::filesystem::path const &data_root() const { return data_root_; }
    storage::StateStore *state_store() const { return state_store_.get(); }

  private:
    int max_saving_attempts() const;
    void record_last_preset();

    std::filesystem::path data_root_;
    FileName filename_;
    FilePath path_;
    Preset default_;
    Preset user_;
    std::unique_ptr<storage::StateStore> state_store_;
    // Guards user_.config against the save worker reading the attempt budget.
    mutable std::mutex config_mutex_;
    SettingsPersistenceService persistence_;
};

std::vector<std::string> load_brand_logo_list(std::filesystem::path const &filepath);

} // namespace tp::engine
