#include "Pages.hpp"
#include "BlockExtractor.hpp"

#include <algorithm>
#include <format>
#include <iterator>

#include <re2/re2.h>
#include <hyprutils/string/String.hpp>

using namespace Hyprutils::String;

static const RE2& pageLineRegex() {
    static const RE2 PAGE_LINE(R"(^\s*\[([^\]]*)\].*\b(PAGE[0-9]+)\b(.*)$)");
    return PAGE_LINE;
}

static std::vector<std::string> quotedNames(const std::string& list) {
    static const RE2         QUOTED(R"(["']([^"']+)["'])");

    std::vector<std::string> names;
    re2::StringPiece         input(list);
    std::string              name;
    while (RE2::FindAndConsume(&input, QUOTED, &name)) {
        names.emplace_back(name);
    }

    return names;
}

static std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i != 0)
            out += '\n';
        out += lines[i];
    }
    return out;
}

static std::vector<std::string> ownedLines(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& l : NBlockExtractor::splitLines(text)) {
        lines.emplace_back(l);
    }
    return lines;
}

static std::string leadingWhitespace(const std::string& line) {
    const auto FIRST = line.find_first_not_of(" \t");
    return FIRST == std::string::npos ? line : line.substr(0, FIRST);
}

std::vector<SPage> NPages::parse(const std::string& document, const std::string& pagesModule, const std::string& keyword) {
    std::vector<SPage> pages;

    const auto         BLOCK = NBlockExtractor::extract(document, pagesModule, keyword);
    if (!BLOCK)
        return pages;

    for (const auto& line : NBlockExtractor::splitLines(*BLOCK)) {
        std::string list, id, rest;
        if (!RE2::FullMatch(line, pageLineRegex(), &list, &id, &rest))
            continue;

        SPage page{.id = id};

        // " - Weather page" / ": Weather page"
        std::string desc{trim(rest)};
        while (!desc.empty() && (desc.front() == '-' || desc.front() == ':'))
            desc.erase(0, 1);
        page.description = trim(desc);

        page.modules = quotedNames(list);

        pages.emplace_back(std::move(page));
    }

    return pages;
}

std::vector<SPage> NPages::pagesWith(const std::vector<SPage>& pages, const std::string& module) {
    std::vector<SPage> out;
    std::ranges::copy_if(pages, std::back_inserter(out), [&module](const auto& p) { return std::ranges::find(p.modules, module) != p.modules.end(); });
    return out;
}

std::optional<std::string> NPages::addToPage(const std::string& fragment, const std::string& pageId, const std::string& module) {
    auto lines = ownedLines(fragment);

    for (auto& line : lines) {
        std::string list, id, rest;
        if (!RE2::FullMatch(line, pageLineRegex(), &list, &id, &rest) || id != pageId)
            continue;

        const auto NAMES = quotedNames(list);
        if (std::ranges::find(NAMES, module) != NAMES.end())
            return fragment;

        // the regex guarantees the list is the first [...] on the line
        const auto CLOSE = line.find(']');
        line.insert(CLOSE, trim(list).empty() ? std::format("\"{}\"", module) : std::format(", \"{}\"", module));

        return joinLines(lines);
    }

    return std::nullopt;
}

std::string NPages::nextPageId(const std::string& fragment) {
    static const RE2 PAGE_NUMBER(R"(\bPAGE([0-9]+)\b)");

    int              highest = 0;
    re2::StringPiece input(fragment);
    int              n = 0;
    while (RE2::FindAndConsume(&input, PAGE_NUMBER, &n)) {
        highest = std::max(highest, n);
    }

    return std::format("PAGE{}", highest + 1);
}

std::optional<std::string> NPages::addPage(const std::string& fragment, const std::string& module, const std::string& description) {
    static const RE2 MODULES_ARRAY(R"(\bmodules\s*:\s*\[)");

    auto             lines = ownedLines(fragment);

    // opening line of the array of pages
    std::optional<size_t> arrayIdx;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (RE2::PartialMatch(lines[i], MODULES_ARRAY)) {
            arrayIdx = i;
            break;
        }
    }

    // a one-line array has nowhere to put a new line
    if (!arrayIdx || std::ranges::count(lines[*arrayIdx], '[') == std::ranges::count(lines[*arrayIdx], ']'))
        return std::nullopt;

    std::optional<size_t> closeIdx;
    std::optional<size_t> lastPageIdx;
    for (size_t i = *arrayIdx + 1; i < lines.size(); ++i) {
        const std::string TRIMMED{trim(lines[i])};

        if (TRIMMED.starts_with(']')) {
            closeIdx = i;
            break;
        }

        if (TRIMMED.starts_with('['))
            lastPageIdx = i;
    }

    if (!closeIdx)
        return std::nullopt;

    std::string indent = leadingWhitespace(lines[*closeIdx]) + "  ";

    if (lastPageIdx) {
        auto&      last  = lines[*lastPageIdx];
        const auto CLOSE = last.find(']');
        if (CLOSE != std::string::npos) {
            const auto NEXT = last.find_first_not_of(" \t", CLOSE + 1);
            if (NEXT == std::string::npos || last[NEXT] != ',')
                last.insert(CLOSE + 1, ",");
        }

        indent = leadingWhitespace(last);
    }

    const auto  ID      = nextPageId(fragment);
    std::string newLine = std::format("{}[\"{}\"], // {}", indent, module, ID);
    if (!description.empty())
        newLine += std::format(" - {}", description);

    lines.insert(lines.begin() + *closeIdx, newLine);

    return joinLines(lines);
}

std::string NPages::removeFromPages(const std::string& fragment, const std::string& module) {
    auto lines   = ownedLines(fragment);
    bool changed = false;

    for (auto& line : lines) {
        std::string list, id, rest;
        if (!RE2::FullMatch(line, pageLineRegex(), &list, &id, &rest))
            continue;

        auto names = quotedNames(list);
        if (std::erase(names, module) == 0)
            continue;

        std::string rebuilt;
        for (const auto& n : names) {
            rebuilt += std::format("{}\"{}\"", rebuilt.empty() ? "" : ", ", n);
        }

        const auto OPEN  = line.find('[');
        const auto CLOSE = line.find(']', OPEN);
        line.replace(OPEN + 1, CLOSE - OPEN - 1, rebuilt);
        changed = true;
    }

    return changed ? joinLines(lines) : fragment;
}
