#include "app/CliMain.hpp"

#include "engine/PresetService.hpp"
#include "engine/SettingsManager.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tp::app
{

namespace
{

constexpr char kLogFileName[] = "tinypedal.log";

struct CliOptions
{
    std::optional<std::filesystem::path> config_dir;
    std::string sim_name = "LMU";
    std::vector<std::string> command;
    bool show_version = false;
    bool show_help = false;
};

void print_usage()
{
    tp::log::print_status(
        "usage: tinypedal-cli [--config-dir DIR] [--sim NAME] <command>\n"
        "commands:\n"
        "  list                       list presets, newest first\n"
        "  load NAME                  load a preset\n"
        "  create NAME                create a preset from defaults\n"
        "  duplicate SOURCE NAME      copy a preset\n"
        "  rename SOURCE NAME         rename a preset\n"
        "  delete NAME                delete a preset\n"
        "  primary SIM NAME           set the primary preset of LMU or RF2\n"
        "  clear-primary NAME         remove primary tags of a preset\n"
        "  autoload on|off            auto-load the primary preset\n"
        "  get CATEGORY KEY[.KEY...]  print a setting as JSON\n"
        "  set CATEGORY KEY[.KEY...] VALUE\n"
        "                             change a setting and save it");
}

std::optional<CliOptions> parse_args(int argc, char *argv[])
{
    CliOptions options;
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] == nullptr)
        {
            continue;
        }
        std::string arg = argv[index];
        if (arg == "--version")
        {
            options.show_version = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
        }
        else if (arg.rfind("--config-dir=", 0) == 0)
        {
            options.config_dir = arg.substr(sizeof("--config-dir=") - 1);
        }
        else if (arg == "--config-dir" || arg == "--sim")
        {
            if (index + 1 >= argc || argv[index + 1] == nullptr)
            {
                std::fprintf(stderr, "%s requires a value\n", arg.c_str());
                return std::nullopt;
            }
            std::string value = argv[++index];
            if (arg == "--sim")
            {
                options.sim_name = std::move(value);
            }
            else
            {
                options.config_dir = std::filesystem::path(value);
            }
        }
        else if (arg.rfind("--sim=", 0) == 0)
        {
            options.sim_name = arg.substr(sizeof("--sim=") - 1);
        }
        else
        {
            options.command.push_back(std::move(arg));
        }
    }
    return options;
}

tp::engine::KeyPath split_key_path(std::string_view text)
{
    tp::engine::KeyPath path;
    while (!text.empty())
    {
        auto dot = text.find('.');
        path.emplace_back(text.substr(0, dot));
        if (dot == std::string_view::npos)
        {
            break;
        }
        text.remove_prefix(dot + 1);
    }
    return path;
}

int report(tp::engine::PresetStatus status)
{
    if (status == tp::engine::PresetStatus::ok)
    {
        return 0;
    }
    std::fprintf(stderr, "%s\n",
                 std::string(tp::engine::preset_status_name(status)).c_str());
    return 1;
}

int print_presets(tp::engine::PresetService const &presets)
{
    for (auto const &entry : presets.list())
    {
        std::string line = entry.name;
        for (auto const &sim : entry.primary_for)
        {
            line += " [" + sim + "]";
        }
        if (entry.loaded)
        {
            line += " *";
        }
        tp::log::print_status("{}", line);
    }
    tp::log::print_status("auto-load primary preset: {}",
                          presets.auto_load() ? "on" : "off");
    return 0;
}

int run_command(std::vector<std::string> const &command,
                tp::engine::SettingsManager &settings,
                tp::engine::PresetService &presets)
{
    using tp::engine::Category;
    auto const &name = command.front();
    auto const args = command.size() - 1;

    if (name == "list" && args == 0)
    {
        return print_presets(presets);
    }
    if (name == "load" && args == 1)
    {
        return report(presets.load(command[1]));
    }
    if (name == "create" && args == 1)
    {
        return report(presets.create(command[1]));
    }
    if (name == "duplicate" && args == 2)
    {
        return report(presets.duplicate(command[1], command[2]));
    }
    if (name == "rename" && args == 2)
    {
        return report(presets.rename(command[1], command[2]));
    }
    if (name == "delete" && args == 1)
    {
        return report(presets.remove(command[1]));
    }
    if (name == "primary" && args == 2)
    {
        return report(presets.set_primary(command[1], command[2]));
    }
    if (name == "clear-primary" && args == 1)
    {
        return report(presets.clear_primary(command[1]));
    }
    if (name == "autoload" && args == 1 &&
        (command[1] == "on" || command[1] == "off"))
    {
        presets.set_auto_load(command[1] == "on");
        return 0;
    }
    if ((name == "get" && args == 2) || (name == "set" && args == 3))
    {
        auto category = tp::engine::parse_category(command[1]);
        if (!category)
        {
            std::fprintf(stderr, "unknown category %s\n", command[1].c_str());
            return 1;
        }
        auto path = split_key_path(command[2]);
        auto &document = settings.user(*category);
        if (name == "get")
        {
            auto value = document.get_json(path);
            if (!value)
            {
                std::fprintf(stderr, "no such key %s\n", command[2].c_str());
                return 1;
            }
            tp::log::print_status("{}", *value);
            return 0;
        }
        if (!document.assign(path, command[3]))
        {
            std::fprintf(stderr, "cannot set %s to %s\n", command[2].c_str(),
                         command[3].c_str());
            return 1;
        }
        settings.save(*category, 0);
        return 0;
    }
    print_usage();
    return 2;
}

} // namespace

int cli_main(int argc, char *argv[])
{
    auto options = parse_args(argc, argv);
    if (!options)
    {
        print_usage();
        return 2;
    }
    if (options->show_version)
    {
        tp::log::print_status(
            "{}", std::string_view(tp::version::kDisplayVersion));
        return 0;
    }
    if (options->show_help || options->command.empty())
    {
        print_usage();
        return options->show_help ? 0 : 2;
    }

    int rc = 1;
    try
    {
        auto const config_root =
            options->config_dir ? *options->config_dir
                                : tp::utils::global_config_root();
        auto const data_root = options->config_dir
                                   ? *options->config_dir
                                   : tp::utils::user_data_root();
        if (tp::utils::ensure_directory(config_root))
        {
            tp::log::set_log_file(config_root / kLogFileName);
        }
        TP_LOG_INFO("{} starting; config directory {}",
                    std::string_view(tp::version::kDisplayVersion),
                    config_root.string());

        tp::engine::SettingsManager settings(config_root, data_root);
        settings.load_global();
        settings.filename().setting =
            settings.resolve_startup_preset(options->sim_name);
        settings.load();

        tp::engine::PresetService presets(settings);
        rc = run_command(options->command, settings, presets);

        settings.flush();
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "tinypedal-cli failed: %s\n", ex.what());
        TP_LOG_ERROR("tinypedal-cli failed: {}", ex.what());
        rc = 1;
    }
    tp::log::set_log_file({});
    return rc;
}

} // namespace tp::app
