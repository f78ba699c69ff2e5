#include "engine/SettingsManager.hpp"

#include "TestUtils.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using tp::engine::Category;
using tp::engine::SettingsManager;

namespace
{

tp::engine::SettingsManagerOptions fast_options()
{
    tp::engine::SettingsManagerOptions options;
    options.persistence.tick = 1ms;
    options.persistence.retry_delay = 1ms;
    return options;
}

void touch(std::filesystem::path const &path, std::chrono::seconds age)
{
    tp::tests::write_text(path, "{}");
    std::filesystem::last_write_time(
        path, std::filesystem::file_time_type::clock::now() - age);
}

} // namespace

TEST_CASE("load_global writes a missing config and prepares user paths")
{
    tp::tests::TempDir dir("manager-global");
    auto const config_root = dir.path() / "config";
    SettingsManager settings(config_root, dir.path() / "data", fast_options());
    settings.load_global();
    settings.wait_until_idle();

    CHECK(std::filesystem::exists(config_root / "config.json"));
    CHECK(std::filesystem::is_directory(settings.path().settings));
    CHECK(std::filesystem::is_directory(settings.path().brand_logo));
    CHECK(std::filesystem::is_directory(settings.path().delta_best));
    CHECK(settings.path().config == config_root);
    CHECK(settings.user(Category::config)
              .get_int({"application", "maximum_saving_attempts"}) == 10);
}

TEST_CASE("unusable user path is reset to its default")
{
    tp::tests::TempDir dir("manager-path");
    auto const config_root = dir.path() / "config";
    std::filesystem::create_directories(config_root);
    auto const blocker = dir.path() / "not-a-directory";
    tp::tests::write_text(blocker, "x");
    tp::tests::write_text(config_root / "config.json",
                          R"({"user_path": {"settings_path": ")" +
                              blocker.generic_string() + R"("}})");

    SettingsManager settings(config_root, dir.path() / "data", fast_options());
    settings.load_global();

    auto const reset = settings.user(Category::config)
                           .get_string({"user_path", "settings_path"});
    auto const fallback = settings.defaults()
                              .config->get_string({"user_path", "settings_path"});
    REQUIRE(reset);
    CHECK(reset == fallback);
    CHECK(settings.path().settings != blocker);
    CHECK(std::filesystem::is_directory(settings.path().settings));
}

TEST_CASE("preset_list sorts by modification time and hides reserved files")
{
    tp::tests::TempDir dir("manager-list");
    SettingsManager settings(dir.path() / "config", dir.path() / "data",
                             fast_options());
    settings.load_global();
    settings.wait_until_idle();
    CHECK(settings.preset_list() == std::vector<std::string>{"default"});

    auto const presets = settings.path().settings;
    touch(presets / "old.json", 300s);
    touch(presets / "new.json", 10s);
    touch(presets / "middle.JSON", 100s);
    touch(presets / "classes.json", 0s);
    touch(presets / "new-backup 2024-01-01-00-00-00.json", 0s);
    tp::tests::write_text(presets / "notes.txt", "x");

    auto const expected = std::vector<std::string>{"new", "middle", "old"};
    CHECK(settings.preset_list() == expected);
}

TEST_CASE("load creates style files and remembers the preset")
{
    tp::tests::TempDir dir("manager-load");
    auto const config_root = dir.path() / "config";
    {
        SettingsManager settings(config_root, dir.path() / "data", fast_options());
        settings.load_global();
        settings.filename().setting = "race.json";
        settings.load();
        CHECK(settings.filename().last_setting == "race.json");
        for (auto const *name : {"classes.json", "heatmap.json", "brands.json",
                                 "brakes.json", "compounds.json"})
        {
            CHECK(std::filesystem::exists(settings.path().settings / name));
        }
        CHECK(settings.user(Category::setting)
                  .get_string({"units", "speed_unit"}) == "KPH");

        settings.user(Category::setting).set_string({"units", "speed_unit"}, "MPH");
        settings.save(Category::setting, 0);
        settings.wait_until_idle();
        CHECK(std::filesystem::exists(settings.path().settings / "race.json"));
    }

    SettingsManager relaunched(config_root, dir.path() / "data", fast_options());
    relaunched.load_global();
    CHECK(relaunched.resolve_startup_preset("LMU") == "race.json");
    relaunched.filename().setting = relaunched.resolve_startup_preset("LMU");
    relaunched.load();
    CHECK(relaunched.user(Category::setting)
              .get_string({"units", "speed_unit"}) == "MPH");
}

TEST_CASE("startup preset prefers the primary preset when auto-load is on")
{
    tp::tests::TempDir dir("manager-primary");
    SettingsManager settings(dir.path() / "config", dir.path() / "data",
                             fast_options());
    settings.load_global();
    auto const presets = settings.path().settings;
    touch(presets / "qualifying.json", 100s);
    touch(presets / "newest.json", 0s);

    auto &config = settings.user(Category::config);
    config.set_string({"primary_preset", "LMU"}, "qualifying");
    CHECK(settings.get_primary_preset_name("LMU") == "qualifying.json");
    CHECK(settings.get_primary_preset_name("RF2").empty());

    CHECK(settings.resolve_startup_preset("LMU") == "newest.json");
    config.set_bool({"application", "enable_auto_load_preset"}, true);
    CHECK(settings.resolve_startup_preset("LMU") == "qualifying.json");
    CHECK(settings.resolve_startup_preset("RF2") == "newest.json");

    config.set_string({"primary_preset", "LMU"}, "gone");
    CHECK(settings.get_primary_preset_name("LMU").empty());
    config.set_string({"primary_preset", "LMU"}, "../qualifying");
    CHECK(settings.get_primary_preset_name("LMU").empty());
}

TEST_CASE("update_path switches preset when the settings directory moves")
{
    tp::tests::TempDir dir("manager-update");
    SettingsManager settings(dir.path() / "config", dir.path() / "data",
                             fast_options());
    settings.load_global();
    settings.filename().setting = "kept.json";
    settings.update_path();
    CHECK(settings.filename().setting == "kept.json");

    auto const moved = dir.path() / "moved";
    std::filesystem::create_directories(moved);
    touch(moved / "other.json", 0s);
    settings.user(Category::config)
        .set_string({"user_path", "settings_path"}, moved.generic_string());
    settings.update_path();
    CHECK(settings.path().settings == moved);
    CHECK(settings.filename().setting == "other.json");
}

TEST_CASE("create replaces the preset with defaults")
{
    tp::tests::TempDir dir("manager-create");
    SettingsManager settings(dir.path() / "config", dir.path() / "data",
                             fast_options());
    settings.load_global();
    settings.load();
    settings.user(Category::setting).set_string({"units", "speed_unit"}, "MPH");
    settings.create();
    CHECK(settings.user(Category::setting).get_string({"units", "speed_unit"}) ==
          "KPH");
}

TEST_CASE("saving an unknown file type is ignored")
{
    tp::tests::TempDir dir("manager-invalid");
    SettingsManager settings(dir.path() / "config", dir.path() / "data",
                             fast_options());
    settings.save("widgets", 0);
    CHECK_FALSE(settings.is_saving());
    settings.save("config", 0);
    settings.wait_until_idle();
    CHECK(std::filesystem::exists(dir.path() / "config" / "config.json"));
}

TEST_CASE("brand logo list holds png stems")
{
    tp::tests::TempDir dir("manager-logo");
    tp::tests::write_text(dir.path() / "Ferrari.png", "");
    tp::tests::write_text(dir.path() / "Alpine.PNG", "");
    tp::tests::write_text(dir.path() / "readme.txt", "");
    auto const expected = std::vector<std::string>{"Alpine", "Ferrari"};
    CHECK(tp::engine::load_brand_logo_list(dir.path()) == expected);
    CHECK(tp::engine::load_brand_logo_list(dir.path() / "missing").empty());
}
