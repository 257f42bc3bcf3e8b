#include "ModuleManager.hpp"
#include "BlockExtractor.hpp"
#include "Pages.hpp"
#include "Pm2.hpp"
#include "Transaction.hpp"
#include "../helpers/Colors.hpp"
#include "../helpers/StringUtils.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <print>

#include <hyprutils/string/String.hpp>
#include <hyprutils/utils/ScopeGuard.hpp>

using namespace Hyprutils::String;
using namespace Hyprutils::Utils;

static std::optional<std::string> readStdinLine() {
    std::string line;
    if (!std::getline(std::cin, line))
        return std::nullopt;

    return line;
}

CModuleManager::CModuleManager(const SSettings& settings) :
    m_settings(settings), m_store(settings.layout.templatesDir),
    m_assembler(m_store, {.head = settings.layout.head, .tail = settings.layout.tail, .pages = settings.layout.pages}, settings.assembly.indent, settings.assembly.placeholder),
    m_slot({.master    = settings.layout.master,
            .masterBak = settings.layout.masterBak,
            .active    = settings.layout.configJs,
            .activeBak = settings.layout.configJsBak,
            .lockFile  = settings.layout.lockFile}) {

    m_source = makeUnique<CModuleDiscovery>(settings.layout.modulesDir);

    if (settings.verify.enabled) {
        m_resolver = makeUnique<CPm2ProcessResolver>(settings);
        m_verifier = makeUnique<CPm2Verifier>(*m_resolver, settings);
    } else
        m_verifier = makeUnique<CNullVerifier>();

    m_readLine = readStdinLine;

    m_confirm = [this](const std::string& prompt) -> bool {
        std::print("{} [y/N]: ", prompt);
        std::fflush(stdout);

        const auto LINE = m_readLine();
        if (!LINE)
            return false;

        const auto ANSWER = trim(*LINE);
        return ANSWER == "y" || ANSWER == "Y";
    };
}

void CModuleManager::setVerifier(UP<IVerifier>&& verifier) {
    m_verifier = std::move(verifier);
}

void CModuleManager::setModuleSource(UP<IModuleSource>&& source) {
    m_source = std::move(source);
}

std::expected<void, std::string> CModuleManager::init() {
    const auto&     LAYOUT = m_settings.layout;

    std::error_code ec;
    std::filesystem::create_directories(LAYOUT.myConfig, ec);
    if (ec)
        return std::unexpected(std::format("couldn't create {}: {}", LAYOUT.myConfig, ec.message()));

    if (auto ret = m_store.ensureExists(); !ret)
        return ret;

    if (NFsUtils::fileExists(LAYOUT.master))
        return {};

    if (!NFsUtils::fileExists(LAYOUT.configJs))
        return std::unexpected(std::format("no master at {} and no {} to seed it from", LAYOUT.master, LAYOUT.configJs));

    std::println("{}", infoString("Creating {} from {}", LAYOUT.master, LAYOUT.configJs));

    if (auto ret = NFsUtils::copyFile(LAYOUT.configJs, LAYOUT.master); !ret)
        return std::unexpected(std::format("couldn't seed the master: {}", ret.error()));

    return {};
}

std::vector<std::string> CModuleManager::masterModules() const {
    const auto MASTER = NFsUtils::readFileAsString(m_settings.layout.master);
    if (!MASTER)
        return {};

    return NBlockExtractor::listEntities(*MASTER, m_settings.assembly.entityKeyword);
}

SPopulateResult CModuleManager::populate(const std::vector<std::string>& refresh, bool quiet) {
    const auto               MASTER = NFsUtils::readFileAsString(m_settings.layout.master).value_or("");

    std::vector<std::string> modules = m_source->installedModules();
    for (const auto& m : NBlockExtractor::listEntities(MASTER, m_settings.assembly.entityKeyword)) {
        if (std::ranges::find(modules, m) == modules.end())
            modules.emplace_back(m);
    }

    CTemplatePopulator populator(m_store, *m_source, m_settings.assembly.entityKeyword);
    const auto         RESULT = populator.populate(modules, MASTER, refresh);

    for (const auto& e : RESULT.entries) {
        switch (e.outcome) {
            case POPULATE_EXISTS:
                if (!quiet)
                    std::println("{}", successString("Template exists: {}", e.module));
                break;
            case POPULATE_IGNORED_DEFAULT:
                if (!quiet)
                    std::println("{}", infoString("Skipping {}, bundled with MagicMirror", e.module));
                break;
            case POPULATE_FROM_MASTER:
            case POPULATE_FROM_README:
            case POPULATE_FROM_SAMPLE: std::println("{}", successString("Template written: {}.js ({})", e.module, populateOutcomeToString(e.outcome))); break;
            case POPULATE_SKIPPED: std::println("{}", warningString("No template source found for {}, skipping", e.module)); break;
            case POPULATE_INVALID_NAME: std::println("{}", warningString("Ignoring module with an unusable name: \"{}\"", e.module)); break;
            case POPULATE_WRITE_FAILED: std::println(stderr, "{}", failureString("Couldn't write template for {}: {}", e.module, e.detail)); break;
        }
    }

    return RESULT;
}

bool CModuleManager::ensureFragment(const std::string& module) {
    if (m_store.exists(module))
        return true;

    const auto         MASTER = NFsUtils::readFileAsString(m_settings.layout.master).value_or("");

    CTemplatePopulator populator(m_store, *m_source, m_settings.assembly.entityKeyword);
    const auto         ENTRY = populator.populateOne(module, MASTER);

    if (m_store.exists(module)) {
        std::println("{}", successString("Template written: {}.js ({})", module, populateOutcomeToString(ENTRY.outcome)));
        return true;
    }

    std::println(stderr, "{}", failureString("No template for {} ({}). Put one at {}", module, populateOutcomeToString(ENTRY.outcome), m_store.pathFor(module)));
    return false;
}

bool CModuleManager::step(CTransaction& txn, const SAssemblyPlan& plan, const std::string& what, bool& restarted) {
    std::println("{}", headerString("{}", what));

    Log::logger->log(Log::DEBUG, "ModuleManager: {} ({} modules, pages: {})", what, plan.modules.size(), plan.usePages);

    if (auto ret = txn.apply(plan); !ret) {
        std::println(stderr, "{}", failureString("{}", ret.error().message));
        std::println("{}", infoString("Rolled back."));
        // an earlier step may have left the instance on a test config
        if (restarted)
            reload();
        return false;
    }

    std::println("{}", infoString("Restarting MagicMirror..."));
    restarted = true;

    if (auto ret = txn.verify(*m_verifier); !ret) {
        std::println(stderr, "{}", failureString("{}", ret.error().message));
        std::println("{}", infoString("Rolled back."));
        reload();
        return false;
    }

    std::println("{}", successString("Applied {} module(s){}", plan.modules.size(), plan.usePages ? " with pages" : ""));
    return true;
}

bool CModuleManager::rollbackAndReload(CTransaction& txn) {
    if (auto ret = txn.rollback(); !ret) {
        std::println(stderr, "{}", failureString("Rollback failed: {}", ret.error().message));
        return false;
    }

    return reload();
}

bool CModuleManager::reload() {
    std::println("{}", infoString("Restarting MagicMirror with the restored config..."));

    const auto REPORT = m_verifier->verify();
    if (REPORT.result != VERIFY_OK) {
        std::println(stderr, "{}", failureString("Reload {}: {}", verifyResultToString(REPORT.result), REPORT.message));
        return false;
    }

    return true;
}

bool CModuleManager::finishWithAcceptance(CTransaction& txn, const SAssemblyPlan& plan) {
    if (!m_confirm("Update Master?")) {
        if (rollbackAndReload(txn))
            std::println("{}", infoString("Rolled back, master unchanged."));
        return false;
    }

    if (auto ret = txn.accept(); !ret) {
        std::println(stderr, "{}", failureString("{}", ret.error().message));
        return false;
    }

    std::println("{}", successString("Master updated."));

    // keep the templates in line with what went into the master
    bool ok = true;
    for (const auto& [mod, text] : plan.overrides) {
        if (auto ret = m_store.write(mod, text); !ret) {
            std::println(stderr, "{}", failureString("Couldn't update the {} template: {}", mod, ret.error()));
            ok = false;
        } else
            std::println("{}", successString("Template updated: {}.js", mod));
    }

    return ok;
}

std::optional<std::string> CModuleManager::placeOnPage(const std::string& module) {
    const auto& PAGESMOD = m_settings.assembly.pagesModule;
    const auto  FRAGMENT = m_store.read(PAGESMOD);
    if (!FRAGMENT) {
        std::println("{}", warningString("No {} template, {} won't be placed on a page", PAGESMOD, module));
        return std::nullopt;
    }

    const auto PAGES = NPages::parse(*FRAGMENT, PAGESMOD, m_settings.assembly.entityKeyword);

    if (const auto ON = NPages::pagesWith(PAGES, module); !ON.empty()) {
        std::println("{}", infoString("{} is already on {}", module, ON.front().id));
        return std::nullopt;
    }

    std::println("\nDetected pages:");
    std::println("{}", std::string(40, '-'));
    for (size_t i = 0; i < PAGES.size(); ++i) {
        std::println("{:2}) {:<6} {}", i + 1, PAGES[i].id, PAGES[i].description);
    }
    std::println(" n) Create a NEW page");
    std::println(" s) Skip");
    std::print("\nSelect a page: ");
    std::fflush(stdout);

    const auto LINE = m_readLine();
    if (!LINE)
        return std::nullopt;

    const std::string CHOICE{trim(*LINE)};

    if (CHOICE == "s" || CHOICE.empty()) {
        std::println("{}", warningString("{} is not on any page, {} will hide it", module, PAGESMOD));
        return std::nullopt;
    }

    if (CHOICE == "n") {
        std::print("Page description: ");
        std::fflush(stdout);

        const std::string DESC{trim(m_readLine().value_or(""))};
        const auto        ID  = NPages::nextPageId(*FRAGMENT);
        auto              out = NPages::addPage(*FRAGMENT, module, DESC);

        if (!out) {
            std::println(stderr, "{}", failureString("Couldn't find the page list in the {} template", PAGESMOD));
            return std::nullopt;
        }

        std::println("{}", infoString("Adding {} ({}) with {}", ID, DESC, module));
        return out;
    }

    size_t     choice = 0;
    const auto [ptr, ec] = std::from_chars(CHOICE.data(), CHOICE.data() + CHOICE.size(), choice);

    if (ec != std::errc{} || ptr != CHOICE.data() + CHOICE.size() || choice < 1 || choice > PAGES.size()) {
        std::println("{}", warningString("Invalid page selection, {} won't be placed on a page", module));
        return std::nullopt;
    }

    std::println("{}", infoString("Adding {} to {}", module, PAGES[choice - 1].id));
    return NPages::addToPage(*FRAGMENT, PAGES[choice - 1].id, module);
}

bool CModuleManager::testModule(const std::string& module) {
    if (!ensureFragment(module))
        return false;

    const auto   MASTERMODS = masterModules();
    const bool   HASPAGES   = std::ranges::find(MASTERMODS, m_settings.assembly.pagesModule) != MASTERMODS.end();
    bool         restarted  = false;

    CTransaction txn(m_slot, m_assembler);

    if (auto ret = txn.begin(); !ret) {
        std::println(stderr, "{}", failureString("Couldn't start: {}", ret.error().message));
        return false;
    }

    if (!step(txn, {.modules = {module}}, std::format("Testing {} alone", module), restarted))
        return false;

    if (HASPAGES && m_confirm("Test with 2 pages?")) {
        const SAssemblyPlan PLAN{.modules = {m_settings.assembly.baselineModule, module}, .usePages = true, .pagesModuleName = module};

        if (!step(txn, PLAN, std::format("Testing {} with pages", module), restarted))
            return false;
    }

    if (!m_confirm("Test with full master?")) {
        std::println("{}", infoString("Testing cancelled."));
        if (rollbackAndReload(txn))
            std::println("{}", infoString("Rolled back, master unchanged."));
        return false;
    }

    // the pages module, if any, is part of the master list already
    SAssemblyPlan plan{.modules = MASTERMODS};

    if (std::ranges::find(plan.modules, module) == plan.modules.end()) {
        std::println("{}", infoString("Adding {} to master config...", module));
        plan.modules.emplace_back(module);
    } else
        std::println("{}", infoString("{} already in master config", module));

    if (HASPAGES && module != m_settings.assembly.pagesModule) {
        if (auto pages = placeOnPage(module))
            plan.overrides[m_settings.assembly.pagesModule] = std::move(*pages);
    }

    if (!step(txn, plan, "Testing with full master config", restarted))
        return false;

    return finishWithAcceptance(txn, plan);
}

bool CModuleManager::removeModule(const std::string& module) {
    auto mods = masterModules();

    if (std::ranges::find(mods, module) == mods.end()) {
        std::println(stderr, "{}", failureString("{} is not in the master config", module));
        return false;
    }

    if (!m_confirm(std::format("Remove {} from config?", module)))
        return false;

    std::erase(mods, module);

    SAssemblyPlan plan{.modules = mods};

    const auto&   PAGESMOD = m_settings.assembly.pagesModule;
    if (std::ranges::find(mods, PAGESMOD) != mods.end()) {
        if (const auto FRAGMENT = m_store.read(PAGESMOD)) {
            for (const auto& p : NPages::pagesWith(NPages::parse(*FRAGMENT, PAGESMOD, m_settings.assembly.entityKeyword), module)) {
                std::println("{}", infoString("Dropping {} from {} ({})", module, p.id, p.description));
            }

            if (auto updated = NPages::removeFromPages(*FRAGMENT, module); updated != *FRAGMENT)
                plan.overrides[PAGESMOD] = std::move(updated);
        }
    }

    CTransaction txn(m_slot, m_assembler);
    bool         restarted = false;

    if (auto ret = txn.begin(); !ret) {
        std::println(stderr, "{}", failureString("Couldn't start: {}", ret.error().message));
        return false;
    }

    if (!step(txn, plan, std::format("Testing config without {}", module), restarted))
        return false;

    return finishWithAcceptance(txn, plan);
}

void CModuleManager::listModules() {
    const auto MASTERMODS = masterModules();

    std::println("{}Modules in master config:{}", Colors::BLUE, Colors::RESET);
    if (MASTERMODS.empty())
        std::println("  (none)");

    for (const auto& m : MASTERMODS) {
        std::println("  {} {}", m_store.exists(m) ? std::format("{}✔{}", Colors::GREEN, Colors::RESET) : std::format("{}✖{}", Colors::RED, Colors::RESET), m);
    }

    std::vector<std::string> unused;
    for (const auto& m : m_source->installedModules()) {
        if (std::ranges::find(MASTERMODS, m) == MASTERMODS.end())
            unused.emplace_back(m);
    }

    if (unused.empty())
        return;

    std::println("{}Installed, not in master:{}", Colors::BLUE, Colors::RESET);
    for (const auto& m : unused) {
        std::println("  {} {}", m_store.exists(m) ? std::format("{}✔{}", Colors::GREEN, Colors::RESET) : std::format("{}✖{}", Colors::RED, Colors::RESET), m);
    }
}

void CModuleManager::listPages(const std::string& module) {
    const auto MASTER = NFsUtils::readFileAsString(m_settings.layout.master).value_or("");
    auto       pages  = NPages::parse(MASTER, m_settings.assembly.pagesModule, m_settings.assembly.entityKeyword);

    if (pages.empty()) {
        std::println("{}", infoString("Pages not in use."));
        return;
    }

    if (!module.empty()) {
        pages = NPages::pagesWith(pages, module);
        if (pages.empty()) {
            std::println("{}", infoString("{} is not on any pages.", module));
            return;
        }
    }

    for (const auto& p : pages) {
        std::string mods;
        for (const auto& m : p.modules) {
            mods += mods.empty() ? m : ", " + m;
        }

        std::println("  {:<6} {:<24} {}", p.id, p.description, mods);
    }
}

bool CModuleManager::restoreSnapshot() {
    if (auto ret = m_slot.lock(); !ret) {
        std::println(stderr, "{}", failureString("{}", ret.error()));
        return false;
    }

    CScopeGuard x([this] { m_slot.unlock(); });

    if (!m_slot.hasSnapshot()) {
        std::println("{}", infoString("Nothing to restore."));
        return false;
    }

    if (!m_confirm(std::format("Restore {} and {} from the last backup?", m_settings.layout.master, m_settings.layout.configJs)))
        return false;

    if (auto ret = m_slot.restore(); !ret) {
        std::println(stderr, "{}", failureString("{}", ret.error()));
        return false;
    }

    std::println("{}", successString("Restored."));
    return reload();
}

std::optional<std::string> CModuleManager::selectFrom(const std::vector<std::string>& items, const std::string& prompt, const std::string& emptyMessage) {
    if (items.empty()) {
        std::println("{}", emptyMessage);
        return std::nullopt;
    }

    std::println("\n{}:", prompt);
    std::println("{}", std::string(40, '-'));
    for (size_t i = 0; i < items.size(); ++i) {
        std::println("{:2}) {}", i + 1, items[i]);
    }
    std::print("\nEnter number: ");
    std::fflush(stdout);

    const auto LINE = m_readLine();
    if (!LINE) {
        std::println("\nCancelled");
        return std::nullopt;
    }

    const auto ANSWER = trim(*LINE);
    size_t     choice = 0;
    const auto [ptr, ec] = std::from_chars(ANSWER.data(), ANSWER.data() + ANSWER.size(), choice);

    if (ec != std::errc{} || ptr != ANSWER.data() + ANSWER.size() || choice < 1 || choice > items.size()) {
        std::println("Invalid selection");
        return std::nullopt;
    }

    return items[choice - 1];
}

void CModuleManager::menu() {
    constexpr std::string_view MENU = R"#(
MagicMirror Config Manager

1) Test a Module
2) Remove Module
3) List Modules
4) Show Pages
5) Exit
)#";

    while (true) {
        std::println("{}", MENU);
        std::print("Select: ");
        std::fflush(stdout);

        const auto LINE = m_readLine();
        if (!LINE)
            return;

        const auto CHOICE = trim(*LINE);

        if (CHOICE == "1") {
            // anything with a template can be tested, not just what's in the master
            auto candidates = m_store.list();
            for (const auto& m : masterModules()) {
                if (std::ranges::find(candidates, m) == candidates.end())
                    candidates.emplace_back(m);
            }

            if (const auto MOD = selectFrom(candidates, "Select module to test", "No module templates found"))
                testModule(*MOD);
        } else if (CHOICE == "2") {
            if (const auto MOD = selectFrom(masterModules(), "Select module to remove", "No modules found in master config"))
                removeModule(*MOD);
        } else if (CHOICE == "3")
            listModules();
        else if (CHOICE == "4")
            listPages();
        else if (CHOICE == "5")
            return;
    }
}
