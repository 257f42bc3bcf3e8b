#pragma once

#include <expected>
#include <string>

// Where things live on disk. Everything is absolute after resolution.
struct SLayout {
    std::string mmHome;
    std::string modulesDir;
    std::string configJs;

    std::string myConfig;
    std::string templatesDir;
    std::string head;
    std::string tail;
    std::string pages;
    std::string master;
    std::string masterBak;
    std::string configJsBak;
    std::string lockFile;
};

struct SSettings {
    SLayout layout;

    struct {
        std::string indent         = "      ";
        std::string placeholder    = "MODULE";
        std::string pagesModule    = "MMM-pages";
        std::string baselineModule = "clock";
        std::string entityKeyword  = "module";
    } assembly;

    struct {
        std::string pm2             = "pm2";
        std::string fallbackProcess = "MagicMirror";
        int         timeoutSecs     = 30;
        bool        checkOnline     = true;
        int         settleMs        = 1500;
        bool        enabled         = true;
    } verify;
};

namespace Settings {
    // $XDG_CONFIG_HOME/mmconf/mmconf.toml or ~/.config/mmconf/mmconf.toml
    std::string                           defaultConfigPath();

    // builds the layout for the given roots
    SLayout                               layoutFor(const std::string& mmHome, const std::string& myConfig);

    // applies a TOML document on top of the defaults
    std::expected<SSettings, std::string> fromToml(const std::string& content, const std::string& sourceName = "mmconf.toml");

    // defaults + config file (if present) + environment.
    // configPath empty means the default location, which may be missing.
    std::expected<SSettings, std::string> load(const std::string& configPath = "");
};
