#include "engine/SettingDefaults.hpp"

#include "engine/SettingDocument.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace tp::engine
{

namespace
{

constexpr std::string_view kGlobalDefault = R"({
    "application": {
        "show_at_startup": false,
        "minimize_to_tray": true,
        "remember_position": true,
        "remember_size": true,
        "enable_high_dpi_scaling": true,
        "enable_auto_load_preset": false,
        "show_confirmation_for_batch_toggle": true,
        "maximum_saving_attempts": 10,
        "position_x": 0,
        "position_y": 0,
        "window_width": 0,
        "window_height": 0
    },
    "compatibility": {
        "enable_bypass_window_manager": false,
        "enable_translucent_background": true,
        "enable_x11_platform_plugin_override": false,
        "multimedia_plugin_on_windows": "WMF"
    },
    "primary_preset": {
        "LMU": "",
        "RF2": ""
    },
    "user_path": {
        "settings_path": "settings/",
        "brand_logo_path": "brandlogo/",
        "delta_best_path": "deltabest/",
        "sector_best_path": "deltabest/",
        "energy_delta_path": "deltabest/",
        "fuel_delta_path": "deltabest/",
        "track_map_path": "trackmap/",
        "pace_notes_path": "pacenotes/",
        "track_notes_path": "tracknotes/"
    }
})";

constexpr std::string_view kPresetDefault = R"({
    "overlay": {
        "fixed_position": false,
        "auto_hide": true,
        "enable_grid_move": false,
        "vr_compatibility": false
    },
    "shared_memory_api": {
        "api_name": "Le Mans Ultimate",
        "enable_player_index_override": false,
        "player_index": -1,
        "character_encoding": "UTF-8",
        "enable_active_state_override": false,
        "active_state": true
    },
    "units": {
        "distance_unit": "Meter",
        "fuel_unit": "Liter",
        "odometer_unit": "Kilometer",
        "power_unit": "Kilowatt",
        "speed_unit": "KPH",
        "temperature_unit": "Celsius",
        "turbo_pressure_unit": "bar",
        "tyre_pressure_unit": "kPa"
    },
    "module_delta": {
        "enable": true,
        "update_interval": 10,
        "idle_update_interval": 400,
        "minimum_delta_distance": 5,
        "delta_smoothing_samples": 30,
        "laptime_pace_samples": 6,
        "laptime_pace_margin": 5
    },
    "module_fuel": {
        "enable": true,
        "update_interval": 20,
        "idle_update_interval": 400,
        "minimum_delta_distance": 5,
        "number_of_consumption_samples": 6
    },
    "brake_wear": {
        "enable": false,
        "update_interval": 20,
        "position_x": 386,
        "position_y": 570,
        "opacity": 0.9,
        "layout": 0,
        "bar_gap": 2,
        "bar_padding": 0.2,
        "font_name": "Consolas",
        "font_size": 15,
        "font_weight": "bold",
        "show_caption": true,
        "font_color_caption": "#CCCCCC",
        "bkg_color_caption": "#777777",
        "show_thickness": false,
        "show_remaining": true,
        "font_color_remaining": "#AAAAAA",
        "bkg_color_remaining": "#222222",
        "warning_threshold_remaining": 30,
        "column_index_remaining": 1,
        "show_wear_difference": true,
        "font_color_wear_difference": "#AAAAAA",
        "bkg_color_wear_difference": "#222222",
        "warning_threshold_wear": 1.5,
        "column_index_wear_difference": 2,
        "show_lifespan_laps": true,
        "font_color_lifespan_laps": "#AAAAAA",
        "bkg_color_lifespan_laps": "#222222",
        "warning_threshold_laps": 5,
        "column_index_lifespan_laps": 3,
        "show_lifespan_minutes": true,
        "font_color_lifespan_minutes": "#AAAAAA",
        "bkg_color_lifespan_minutes": "#222222",
        "warning_threshold_minutes": 5,
        "column_index_lifespan_minutes": 4,
        "font_color_warning": "#FF2200"
    },
    "deltabest": {
        "enable": true,
        "update_interval": 20,
        "position_x": 386,
        "position_y": 454,
        "opacity": 0.9,
        "font_name": "Consolas",
        "font_size": 15,
        "font_weight": "bold",
        "delta_display_range": 2,
        "show_delta_bar": true,
        "bar_length": 300,
        "bar_height": 10
    }
})";

constexpr std::string_view kClassesDefault = R"({
    "Hypercar": {"alias": "HY", "color": "#FF4400"},
    "LMP2": {"alias": "LMP2", "color": "#0088FF"},
    "GTE": {"alias": "GTE", "color": "#FF8800"},
    "LMGT3": {"alias": "GT3", "color": "#00AA44"}
})";

constexpr std::string_view kHeatmapDefault = R"({
    "tyre_default": {
        "-273": "#4444FF",
        "40": "#4444FF",
        "60": "#48F",
        "80": "#44FF44",
        "100": "#FFFF00",
        "120": "#FF4400"
    },
    "brake_default": {
        "-273": "#4444FF",
        "100": "#48F",
        "300": "#44FF44",
        "500": "#FFFF00",
        "800": "#FF4400"
    }
})";

constexpr std::string_view kBrakesDefault = R"({
    "Front Brake": {"failure_thickness": 0.0, "heat_rate": 0.0},
    "Rear Brake": {"failure_thickness": 0.0, "heat_rate": 0.0}
})";

constexpr std::string_view kCompoundsDefault = R"({
    "Soft": {"symbol": "S", "heatmap": "tyre_default"},
    "Medium": {"symbol": "M", "heatmap": "tyre_default"},
    "Hard": {"symbol": "H", "heatmap": "tyre_default"},
    "Wet": {"symbol": "W", "heatmap": "tyre_default"}
})";

constexpr std::string_view kClassesEntry = R"({"alias": "", "color": "#888888"})";
constexpr std::string_view kBrakesEntry =
    R"({"failure_thickness": 0.0, "heat_rate": 0.0})";
constexpr std::string_view kCompoundsEntry =
    R"({"symbol": "?", "heatmap": "tyre_default"})";

// User paths kept in the config directory outside Windows; the rest go to
// the data directory.
constexpr std::array<std::string_view, 4> kConfigUserPaths = {
    {"settings_path", "brand_logo_path", "pace_notes_path",
     "track_notes_path"}};

std::string_view template_text(Category category)
{
    switch (category)
    {
    case Category::config:
        return kGlobalDefault;
    case Category::setting:
        return kPresetDefault;
    case Category::classes:
        return kClassesDefault;
    case Category::heatmap:
        return kHeatmapDefault;
    case Category::brands:
        return "{}";
    case Category::brakes:
        return kBrakesDefault;
    case Category::compounds:
        return kCompoundsDefault;
    }
    return "{}";
}

// Parsed once, read-only afterwards.
json::Document const &parsed_entry(Category category)
{
    static json::Document const classes = json::Document::parse(kClassesEntry);
    static json::Document const brakes = json::Document::parse(kBrakesEntry);
    static json::Document const compounds =
        json::Document::parse(kCompoundsEntry);
    static json::Document const none;
    switch (category)
    {
    case Category::classes:
        return classes;
    case Category::brakes:
        return brakes;
    case Category::compounds:
        return compounds;
    default:
        return none;
    }
}

} // namespace

json::MutableDocument default_template(Category category)
{
    auto parsed = json::Document::parse(template_text(category));
    if (!parsed.is_valid())
    {
        return json::MutableDocument::empty_object();
    }
    return json::MutableDocument::copy_of(parsed.root());
}

yyjson_val *style_entry_template(Category category)
{
    return parsed_entry(category).root();
}

void apply_platform_defaults(SettingDocument &config,
                             std::filesystem::path const &config_root,
                             std::filesystem::path const &data_root)
{
#if defined(_WIN32)
    (void)config;
    (void)config_root;
    (void)data_root;
#else
    config.set_bool({"application", "show_at_startup"}, true);
    config.set_bool({"application", "minimize_to_tray"}, false);
    config.set_bool({"compatibility", "enable_bypass_window_manager"}, true);
    for (auto const &key : config.keys({"user_path"}))
    {
        auto relative = config.get_string({"user_path", key});
        if (!relative)
        {
            continue;
        }
        bool const in_config =
            std::find(kConfigUserPaths.begin(), kConfigUserPaths.end(), key) !=
            kConfigUserPaths.end();
        auto const &root = in_config ? config_root : data_root;
        auto absolute = (root / *relative).lexically_normal();
        config.set_string({"user_path", key}, absolute.generic_string());
    }
#endif
}

} // namespace tp::engine
