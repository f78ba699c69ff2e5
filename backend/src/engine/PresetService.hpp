#pragma once

#include "engine/SettingsManager.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace tp::engine
{

enum class PresetStatus
{
    ok,
    invalid_name,
    already_exists,
    not_found,
    io_error,
};

std::string_view preset_status_name(PresetStatus status) noexcept;

struct PresetEntry
{
    std::string name;
    // Simulators this preset is the primary preset of.
    std::vector<std::string> primary_for;
    bool loaded = false;
};

// Preset list operations on top of SettingsManager. Names are taken as typed
// by the user; a trailing ".json" is ignored.
class PresetService
{
  public:
    static constexpr std::array<std::string_view, 2> kSimNames = {"LMU", "RF2"};

    explicit PresetService(SettingsManager &settings);

    std::vector<PresetEntry> list() const;
    // Name of the loaded preset without extension.
    std::string loaded_preset() const;

    PresetStatus load(std::string_view name);
    // Writes a new preset from the defaults and makes it current. Returns
    // once the file is on disk.
    PresetStatus create(std::string_view name);
    PresetStatus duplicate(std::string_view source, std::string_view name);
    // Reloads when the renamed preset is the current one.
    PresetStatus rename(std::string_view source, std::string_view name);
    PresetStatus remove(std::string_view name);

    PresetStatus set_primary(std::string_view sim_name, std::string_view name);
    // Clears every primary tag pointing at `name`. not_found if none did.
    PresetStatus clear_primary(std::string_view name);

    bool auto_load() const;
    void set_auto_load(bool enabled);

  private:
    PresetStatus check_new_name(std::string_view entered,
                                std::string &stem) const;
    bool exists(std::string_view stem) const;
    std::filesystem::path preset_file(std::string_view stem) const;

    SettingsManager &settings_;
};

} // namespace tp::engine
