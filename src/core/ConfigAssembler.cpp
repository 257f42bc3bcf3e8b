#include "ConfigAssembler.hpp"
#include "FragmentStore.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <format>
#include <optional>

#include <hyprutils/string/String.hpp>

using namespace Hyprutils::String;

constexpr char SEPARATOR = ',';

CConfigAssembler::CConfigAssembler(const CFragmentStore& store, const SSources& sources, const std::string& indent, const std::string& placeholder) :
    m_store(store), m_sources(sources), m_indent(indent), m_placeholder(placeholder) {
    ;
}

std::string CConfigAssembler::normalizeFragment(const std::string& fragment) {
    std::string out{trim(fragment)};

    if (out.ends_with(SEPARATOR))
        out.pop_back();

    return out;
}

std::string CConfigAssembler::substitute(std::string text, const std::string& token, const std::string& with) {
    if (token.empty())
        return text;

    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), with);
        pos += with.size();
    }

    return text;
}

std::expected<std::string, SAssemblyError> CConfigAssembler::assemble(const SAssemblyPlan& plan) const {
    const auto HEAD = NFsUtils::readFileAsString(m_sources.head);
    if (!HEAD)
        return std::unexpected(SAssemblyError{m_sources.head, std::format("Missing head file: {}", m_sources.head)});

    const auto TAIL = NFsUtils::readFileAsString(m_sources.tail);
    if (!TAIL)
        return std::unexpected(SAssemblyError{m_sources.tail, std::format("Missing tail file: {}", m_sources.tail)});

    std::string out = *HEAD;

    for (size_t i = 0; i < plan.modules.size(); ++i) {
        const auto& MODULE   = plan.modules[i];
        const auto  OVERRIDE = plan.overrides.find(MODULE);
        const auto  FRAGMENT = OVERRIDE != plan.overrides.end() ? std::optional<std::string>{OVERRIDE->second} : m_store.read(MODULE);

        if (!FRAGMENT)
            return std::unexpected(SAssemblyError{m_store.pathFor(MODULE), std::format("Missing template for {}: {}", MODULE, m_store.pathFor(MODULE))});

        out += m_indent;
        out += normalizeFragment(*FRAGMENT);

        // the pages section follows the last module, so it needs one too
        if (i + 1 < plan.modules.size() || plan.usePages)
            out += SEPARATOR;

        out += '\n';
    }

    if (plan.usePages) {
        const auto PAGES = NFsUtils::readFileAsString(m_sources.pages);
        if (!PAGES)
            return std::unexpected(SAssemblyError{m_sources.pages, std::format("Missing pages file: {}", m_sources.pages)});

        out += plan.pagesModuleName.empty() ? *PAGES : substitute(*PAGES, m_placeholder, plan.pagesModuleName);
    }

    out += *TAIL;

    Log::logger->log(Log::DEBUG, "ConfigAssembler: assembled {} modules{}, {} bytes", plan.modules.size(), plan.usePages ? " with pages" : "", out.size());

    return out;
}
