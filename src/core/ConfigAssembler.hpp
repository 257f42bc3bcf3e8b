#pragma once

#include <expected>
#include <map>
#include <string>
#include <vector>

class CFragmentStore;

struct SAssemblyPlan {
    // order is kept as-is, never sorted
    std::vector<std::string>           modules;
    bool                               usePages = false;
    // substituted for the placeholder in the pages section, empty leaves it alone
    std::string                        pagesModuleName;
    // module -> fragment text used instead of the stored fragment, nothing is written
    std::map<std::string, std::string> overrides;
};

struct SAssemblyError {
    std::string path; // the missing resource
    std::string message;
};

class CConfigAssembler {
  public:
    struct SSources {
        std::string head;
        std::string tail;
        std::string pages;
    };

    CConfigAssembler(const CFragmentStore& store, const SSources& sources, const std::string& indent = "      ", const std::string& placeholder = "MODULE");

    // head + modules + (pages) + tail. Pure: only reads.
    std::expected<std::string, SAssemblyError> assemble(const SAssemblyPlan& plan) const;

    // trims surrounding whitespace, then drops one trailing separator
    static std::string normalizeFragment(const std::string& fragment);

    static std::string substitute(std::string text, const std::string& token, const std::string& with);

  private:
    const CFragmentStore& m_store;
    SSources              m_sources;
    std::string           m_indent;
    std::string           m_placeholder;
};
