#pragma once

#include <cstdint>
#include <string>
#include <vector>

class CFragmentStore;
class IModuleSource;

enum ePopulateOutcome : uint8_t {
    POPULATE_EXISTS = 0,
    POPULATE_FROM_MASTER,
    POPULATE_FROM_README,
    POPULATE_FROM_SAMPLE,
    POPULATE_SKIPPED,
    POPULATE_IGNORED_DEFAULT,
    POPULATE_INVALID_NAME,
    POPULATE_WRITE_FAILED,
};

struct SPopulateEntry {
    std::string      module;
    ePopulateOutcome outcome = POPULATE_SKIPPED;
    std::string      detail; // write error, if any
};

struct SPopulateResult {
    std::vector<SPopulateEntry> entries;

    size_t                      count(ePopulateOutcome outcome) const;
    size_t                      created() const;
};

/*
    Fills the fragment store from, in order: the master config, the module's
    README, the module's sample file. Existing fragments are left alone unless
    the module is explicitly listed in `refresh`.
*/
class CTemplatePopulator {
  public:
    CTemplatePopulator(CFragmentStore& store, IModuleSource& source, const std::string& keyword = "module");

    SPopulateResult populate(const std::vector<std::string>& modules, const std::string& masterText, const std::vector<std::string>& refresh = {});

    // single module, same rules
    SPopulateEntry  populateOne(const std::string& module, const std::string& masterText, bool force = false);

  private:
    CFragmentStore& m_store;
    IModuleSource&  m_source;
    std::string     m_keyword;
};

const char* populateOutcomeToString(ePopulateOutcome outcome);
