#pragma once

#include "Settings.hpp"
#include "FragmentStore.hpp"
#include "ConfigAssembler.hpp"
#include "SnapshotSlot.hpp"
#include "TemplatePopulator.hpp"
#include "ModuleDiscovery.hpp"
#include "Verifier.hpp"
#include "../helpers/memory/Memory.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class CTransaction;

class CModuleManager {
  public:
    explicit CModuleManager(const SSettings& settings);

    CModuleManager(const CModuleManager&) = delete;
    CModuleManager(CModuleManager&)       = delete;
    CModuleManager(CModuleManager&&)      = delete;

    // my_config + templates dir, seeds the master from config.js on first run
    std::expected<void, std::string> init();

    // installed modules plus whatever the master references
    SPopulateResult                  populate(const std::vector<std::string>& refresh = {}, bool quiet = false);

    // alone -> with the baseline on two pages -> full master. Returns whether the master was updated.
    bool                             testModule(const std::string& module);
    bool                             removeModule(const std::string& module);

    void                             listModules();
    void                             listPages(const std::string& module = "");

    // puts the snapshot slot back, for when a previous run died mid-way
    bool                             restoreSnapshot();

    // interactive front-end
    void                             menu();

    std::vector<std::string>         masterModules() const;

    void                             setVerifier(UP<IVerifier>&& verifier);
    void                             setModuleSource(UP<IModuleSource>&& source);

    // defaults to a [y/N] prompt on stdin
    std::function<bool(const std::string&)>     m_confirm;
    // defaults to a line from stdin, nullopt on EOF
    std::function<std::optional<std::string>()> m_readLine;

  private:
    std::optional<std::string> selectFrom(const std::vector<std::string>& items, const std::string& prompt, const std::string& emptyMessage);
    bool                       ensureFragment(const std::string& module);
    // restarted is set once the instance has been given a test config
    bool                       step(CTransaction& txn, const SAssemblyPlan& plan, const std::string& what, bool& restarted);
    bool                       finishWithAcceptance(CTransaction& txn, const SAssemblyPlan& plan);
    bool                       rollbackAndReload(CTransaction& txn);
    // restarts on whatever is on disk now
    bool                       reload();
    // asks for a page, returns the rewritten pages fragment or nullopt to leave it alone
    std::optional<std::string> placeOnPage(const std::string& module);

    SSettings                  m_settings;
    CFragmentStore             m_store;
    CConfigAssembler           m_assembler;
    CSnapshotSlot              m_slot;
    UP<IModuleSource>          m_source;
    UP<IProcessResolver>       m_resolver;
    UP<IVerifier>              m_verifier;
};

inline UP<CModuleManager> g_pModuleManager;
