#include "Settings.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <sstream>

#include <toml++/toml.hpp>

static std::string joinPath(const std::string& a, const std::string& b) {
    return (std::filesystem::path(a) / b).string();
}

std::string Settings::defaultConfigPath() {
    const auto XDG = getenv("XDG_CONFIG_HOME");

    if (XDG && XDG[0] != '\0')
        return std::string{XDG} + "/mmconf/mmconf.toml";

    return NFsUtils::expandHome("~/.config/mmconf/mmconf.toml");
}

SLayout Settings::layoutFor(const std::string& mmHome, const std::string& myConfig) {
    SLayout layout;

    layout.mmHome     = mmHome;
    layout.modulesDir = joinPath(mmHome, "modules");
    layout.configJs   = joinPath(joinPath(mmHome, "config"), "config.js");

    layout.myConfig     = myConfig;
    layout.templatesDir = joinPath(myConfig, "templates");
    layout.head         = joinPath(myConfig, "head");
    layout.tail         = joinPath(myConfig, "tail");
    layout.pages        = joinPath(myConfig, "pages");
    layout.master       = joinPath(myConfig, "config.Master");
    layout.masterBak    = joinPath(myConfig, "config.Master.bak");
    layout.configJsBak  = joinPath(myConfig, "config.js.bak");
    layout.lockFile     = joinPath(myConfig, ".mmconf.lock");

    return layout;
}

std::expected<SSettings, std::string> Settings::fromToml(const std::string& content, const std::string& sourceName) {
    toml::table DATA;

    try {
        DATA = toml::parse(content, sourceName);
    } catch (const toml::parse_error& e) {
        std::stringstream ss;
        ss << e.source().begin;
        return std::unexpected(std::format("{} at {}: {}", sourceName, ss.str(), e.description()));
    }

    SSettings  settings;

    const auto MMHOME   = NFsUtils::expandHome(DATA["paths"]["magicmirror_home"].value_or(std::string{"~/MagicMirror"}));
    const auto MYCONFIG = NFsUtils::expandHome(DATA["paths"]["my_config"].value_or(std::string{"~/my_config"}));

    settings.layout = layoutFor(MMHOME, MYCONFIG);

    auto& a          = settings.assembly;
    a.indent         = DATA["assembly"]["indent"].value_or(a.indent);
    a.placeholder    = DATA["assembly"]["placeholder"].value_or(a.placeholder);
    a.pagesModule    = DATA["assembly"]["pages_module"].value_or(a.pagesModule);
    a.baselineModule = DATA["assembly"]["baseline_module"].value_or(a.baselineModule);
    a.entityKeyword  = DATA["assembly"]["entity_keyword"].value_or(a.entityKeyword);

    auto& v           = settings.verify;
    v.pm2             = DATA["verify"]["pm2"].value_or(v.pm2);
    v.fallbackProcess = DATA["verify"]["fallback_process"].value_or(v.fallbackProcess);
    v.timeoutSecs     = DATA["verify"]["timeout_secs"].value_or(v.timeoutSecs);
    v.checkOnline     = DATA["verify"]["check_online"].value_or(v.checkOnline);
    v.settleMs        = DATA["verify"]["settle_ms"].value_or(v.settleMs);
    v.enabled         = DATA["verify"]["enabled"].value_or(v.enabled);

    if (a.placeholder.empty())
        return std::unexpected(std::format("{}: assembly.placeholder can't be empty", sourceName));

    if (a.entityKeyword.empty())
        return std::unexpected(std::format("{}: assembly.entity_keyword can't be empty", sourceName));

    if (v.timeoutSecs <= 0)
        return std::unexpected(std::format("{}: verify.timeout_secs must be positive", sourceName));

    if (v.settleMs < 0)
        return std::unexpected(std::format("{}: verify.settle_ms can't be negative", sourceName));

    return settings;
}

std::expected<SSettings, std::string> Settings::load(const std::string& configPath) {
    const bool  EXPLICIT = !configPath.empty();
    const auto  PATH     = EXPLICIT ? NFsUtils::expandHome(configPath) : defaultConfigPath();

    std::string content;

    if (NFsUtils::fileExists(PATH)) {
        const auto READ = NFsUtils::readFileAsString(PATH);
        if (!READ)
            return std::unexpected(std::format("couldn't read config file {}", PATH));

        content = *READ;
        Log::logger->log(Log::DEBUG, "Settings: loading {}", PATH);
    } else if (EXPLICIT)
        return std::unexpected(std::format("config file {} doesn't exist", PATH));
    else
        Log::logger->log(Log::DEBUG, "Settings: no config at {}, using defaults", PATH);

    auto settings = fromToml(content, PATH);
    if (!settings)
        return settings;

    // env beats the file, same as the old shell tooling
    const auto MMHOME_ENV = getenv("MAGICMIRROR_HOME");
    if (MMHOME_ENV && MMHOME_ENV[0] != '\0')
        settings->layout = layoutFor(MMHOME_ENV, settings->layout.myConfig);

    return settings;
}
