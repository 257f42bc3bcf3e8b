#include "ModuleDiscovery.hpp"
#include "FragmentStore.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>
#include <filesystem>

// bundled with MagicMirror itself, never templated from here
constexpr const char* DEFAULT_MODULES_DIR = "default";

CModuleDiscovery::CModuleDiscovery(const std::string& modulesDir) : m_modulesDir(modulesDir) {
    ;
}

std::vector<std::string> CModuleDiscovery::installedModules() {
    std::vector<std::string> mods;

    std::error_code          ec;
    if (!std::filesystem::is_directory(m_modulesDir, ec) || ec) {
        Log::logger->log(Log::WARN, "ModuleDiscovery: {} is not a directory", m_modulesDir);
        return mods;
    }

    for (const auto& entry : std::filesystem::directory_iterator(m_modulesDir, ec)) {
        if (!entry.is_directory())
            continue;

        const auto NAME = entry.path().filename().string();
        if (NAME.starts_with('.') || NAME == DEFAULT_MODULES_DIR)
            continue;

        mods.emplace_back(NAME);
    }

    if (ec)
        Log::logger->log(Log::WARN, "ModuleDiscovery: listing {} failed: {}", m_modulesDir, ec.message());

    std::ranges::sort(mods);
    return mods;
}

std::optional<std::string> CModuleDiscovery::readme(const std::string& module) {
    if (!CFragmentStore::validName(module))
        return std::nullopt;

    return NFsUtils::readFileAsString((std::filesystem::path(m_modulesDir) / module / "README.md").string());
}

std::optional<std::string> CModuleDiscovery::sample(const std::string& module) {
    if (!CFragmentStore::validName(module))
        return std::nullopt;

    return NFsUtils::readFileAsString((std::filesystem::path(m_modulesDir) / module / "sample" / (module + ".js")).string());
}
