#include "TemplatePopulator.hpp"
#include "BlockExtractor.hpp"
#include "FragmentStore.hpp"
#include "ModuleDiscovery.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>

constexpr std::string_view DEFAULT_SET_PREFIX = "default/";

size_t SPopulateResult::count(ePopulateOutcome outcome) const {
    return std::ranges::count_if(entries, [outcome](const auto& e) { return e.outcome == outcome; });
}

size_t SPopulateResult::created() const {
    return count(POPULATE_FROM_MASTER) + count(POPULATE_FROM_README) + count(POPULATE_FROM_SAMPLE);
}

const char* populateOutcomeToString(ePopulateOutcome outcome) {
    switch (outcome) {
        case POPULATE_EXISTS: return "exists";
        case POPULATE_FROM_MASTER: return "extracted from master";
        case POPULATE_FROM_README: return "extracted from README";
        case POPULATE_FROM_SAMPLE: return "copied from sample";
        case POPULATE_SKIPPED: return "no template source found";
        case POPULATE_IGNORED_DEFAULT: return "default module";
        case POPULATE_INVALID_NAME: return "invalid name";
        case POPULATE_WRITE_FAILED: return "write failed";
    }

    return "?";
}

CTemplatePopulator::CTemplatePopulator(CFragmentStore& store, IModuleSource& source, const std::string& keyword) : m_store(store), m_source(source), m_keyword(keyword) {
    ;
}

SPopulateEntry CTemplatePopulator::populateOne(const std::string& module, const std::string& masterText, bool force) {
    SPopulateEntry entry{.module = module};

    if (module.starts_with(DEFAULT_SET_PREFIX)) {
        entry.outcome = POPULATE_IGNORED_DEFAULT;
        return entry;
    }

    if (!CFragmentStore::validName(module)) {
        Log::logger->log(Log::WARN, "TemplatePopulator: refusing module name \"{}\"", module);
        entry.outcome = POPULATE_INVALID_NAME;
        return entry;
    }

    // protects manual edits
    if (!force && m_store.exists(module)) {
        entry.outcome = POPULATE_EXISTS;
        return entry;
    }

    std::optional<std::string> block;

    if ((block = NBlockExtractor::extract(masterText, module, m_keyword)))
        entry.outcome = POPULATE_FROM_MASTER;
    else if (const auto README = m_source.readme(module); README && (block = NBlockExtractor::extract(*README, module, m_keyword)))
        entry.outcome = POPULATE_FROM_README;
    else if ((block = m_source.sample(module)))
        entry.outcome = POPULATE_FROM_SAMPLE;
    else {
        Log::logger->log(Log::WARN, "TemplatePopulator: no template source found for {}, skipping", module);
        entry.outcome = POPULATE_SKIPPED;
        return entry;
    }

    if (auto ret = m_store.write(module, *block); !ret) {
        Log::logger->log(Log::ERR, "TemplatePopulator: couldn't write template for {}: {}", module, ret.error());
        entry.outcome = POPULATE_WRITE_FAILED;
        entry.detail  = ret.error();
        return entry;
    }

    Log::logger->log(Log::DEBUG, "TemplatePopulator: {} {}", module, populateOutcomeToString(entry.outcome));

    return entry;
}

SPopulateResult CTemplatePopulator::populate(const std::vector<std::string>& modules, const std::string& masterText, const std::vector<std::string>& refresh) {
    SPopulateResult result;

    for (const auto& m : modules) {
        const bool FORCE = std::ranges::find(refresh, m) != refresh.end();
        result.entries.emplace_back(populateOne(m, masterText, FORCE));
    }

    return result;
}
