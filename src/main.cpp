#include "helpers/Colors.hpp"
#include "helpers/Die.hpp"
#include "helpers/StringUtils.hpp"
#include "helpers/fs/FsUtils.hpp"
#include "debug/log/Logger.hpp"
#include "core/ModuleManager.hpp"
#include "core/Settings.hpp"

#include <cstdio>
#include <print>
#include <string>
#include <vector>

#include <hyprutils/memory/Casts.hpp>

#ifndef MMCONF_VERSION
#define MMCONF_VERSION "unknown"
#endif

constexpr std::string_view HELP = R"#(┏ mmconf, a MagicMirror config manager
┃
┣ menu                   → Interactive menu. Default when no command is given.
┣ populate [name...]     → Create missing module templates. With --force, rewrite
┃                          the named ones from their sources.
┣ test [module]          → Test a module alone, with pages, then with the full master.
┣ remove [module]        → Remove a module from the master, test and offer to keep it.
┣ list                   → List modules in the master and their template status.
┣ pages [module]         → Show the pages set up in MMM-pages.
┣ restore                → Put back config.Master and config.js from the last backup.
┃
┣ Flags:
┃
┣ --help         | -h    → Show this menu.
┣ --verbose      | -v    → Enable debug logging.
┣ --yes          | -y    → Answer yes to every question.
┣ --config FILE  | -c    → Use this settings file instead of ~/.config/mmconf/mmconf.toml.
┣ --no-verify            → Don't restart MagicMirror through pm2, treat every apply as good.
┣ --force        | -f    → populate: overwrite the named templates.
┣ --version              → Print the version.
┗
)#";

int main(int argc, char** argv) {
    std::vector<std::string> ARGS{sc<size_t>(argc)};
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    std::vector<std::string> command;
    bool                     verbose = false, yes = false, noVerify = false, force = false;
    std::string              configPath;

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i].starts_with("-")) {
            if (ARGS[i] == "--help" || ARGS[i] == "-h") {
                std::println("{}", HELP);
                return 0;
            } else if (ARGS[i] == "--version") {
                std::println("mmconf {}", MMCONF_VERSION);
                return 0;
            } else if (ARGS[i] == "--verbose" || ARGS[i] == "-v") {
                verbose = true;
            } else if (ARGS[i] == "--yes" || ARGS[i] == "-y") {
                yes = true;
            } else if (ARGS[i] == "--no-verify") {
                noVerify = true;
            } else if (ARGS[i] == "--force" || ARGS[i] == "-f") {
                force = true;
            } else if (ARGS[i] == "--config" || ARGS[i] == "-c") {
                if (i + 1 >= argc) {
                    std::println(stderr, "Missing argument for --config");
                    return 1;
                }
                configPath = ARGS[i + 1];
                i++;
            } else {
                std::println(stderr, "Unrecognized option {}", ARGS[i]);
                return 1;
            }
        } else
            command.push_back(ARGS[i]);
    }

    if (command.empty())
        command.emplace_back("menu");

    Log::init(verbose);

    if (!NFsUtils::getHome())
        Debug::die("$HOME is not set");

    auto settings = Settings::load(configPath);
    if (!settings)
        Debug::die("Couldn't load settings: {}", settings.error());

    if (noVerify)
        settings->verify.enabled = false;

    const auto& LAYOUT = settings->layout;

    if (!NFsUtils::dirExists(LAYOUT.mmHome))
        Debug::die("MagicMirror not found at {}. Set MAGICMIRROR_HOME or [paths] magicmirror_home.", LAYOUT.mmHome);

    if (!NFsUtils::dirExists(LAYOUT.mmHome + "/config"))
        Debug::die("{}/config doesn't exist", LAYOUT.mmHome);

    g_pModuleManager = makeUnique<CModuleManager>(*settings);

    if (yes)
        g_pModuleManager->m_confirm = [](const std::string& prompt) {
            std::println("{} [y/N]: y", prompt);
            return true;
        };

    if (auto ret = g_pModuleManager->init(); !ret)
        Debug::die("{}", ret.error());

    if (command[0] == "populate") {
        if (force && command.size() < 2) {
            std::println(stderr, "{}", failureString("--force needs the modules to refresh."));
            return 1;
        }

        std::vector<std::string> refresh;
        if (force)
            refresh.assign(command.begin() + 1, command.end());

        const auto RESULT = g_pModuleManager->populate(refresh);

        std::println("{}", infoString("{} template(s) written, {} skipped", RESULT.created(), RESULT.count(POPULATE_SKIPPED)));
        return RESULT.count(POPULATE_WRITE_FAILED) == 0 ? 0 : 1;
    } else if (command[0] == "test") {
        if (command.size() < 2) {
            std::println(stderr, "{}", failureString("Not enough args for test."));
            return 1;
        }

        g_pModuleManager->populate({}, true);

        return g_pModuleManager->testModule(command[1]) ? 0 : 1;
    } else if (command[0] == "remove") {
        if (command.size() < 2) {
            std::println(stderr, "{}", failureString("Not enough args for remove."));
            return 1;
        }

        g_pModuleManager->populate({}, true);

        return g_pModuleManager->removeModule(command[1]) ? 0 : 1;
    } else if (command[0] == "list") {
        g_pModuleManager->listModules();
    } else if (command[0] == "pages") {
        g_pModuleManager->listPages(command.size() >= 2 ? command[1] : "");
    } else if (command[0] == "restore") {
        return g_pModuleManager->restoreSnapshot() ? 0 : 1;
    } else if (command[0] == "menu") {
        g_pModuleManager->populate({}, true);
        g_pModuleManager->menu();
    } else {
        std::println(stderr, "{}", HELP);
        return 1;
    }

    return 0;
}
