#pragma once

#include <optional>
#include <string>
#include <vector>

// Where fragments can come from besides the master config.
class IModuleSource {
  public:
    virtual ~IModuleSource() = default;

    // installed module names, excluding the bundled defaults and hidden entries
    virtual std::vector<std::string>   installedModules() = 0;

    // the module's README, if it ships one
    virtual std::optional<std::string> readme(const std::string& module) = 0;

    // sample/<module>.js, used verbatim
    virtual std::optional<std::string> sample(const std::string& module) = 0;
};

// Reads <mm_home>/modules
class CModuleDiscovery : public IModuleSource {
  public:
    explicit CModuleDiscovery(const std::string& modulesDir);
    virtual ~CModuleDiscovery() = default;

    virtual std::vector<std::string>   installedModules();
    virtual std::optional<std::string> readme(const std::string& module);
    virtual std::optional<std::string> sample(const std::string& module);

  private:
    std::string m_modulesDir;
};
