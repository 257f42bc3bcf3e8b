#include "BlockExtractor.hpp"

#include <algorithm>
#include <format>
#include <ranges>

#include <re2/re2.h>
#include <hyprutils/string/String.hpp>

using namespace Hyprutils::String;

static std::string declarationRegex(const std::string& entity, const std::string& keyword) {
    return std::format(R"({}:\s*["']{}["'])", RE2::QuoteMeta(keyword), RE2::QuoteMeta(entity));
}

std::vector<std::string_view> NBlockExtractor::splitLines(std::string_view document) {
    std::vector<std::string_view> lines;

    for (const auto& l : std::views::split(document, '\n')) {
        lines.emplace_back(std::string_view{l.begin(), l.end()});
    }

    return lines;
}

bool NBlockExtractor::isOpeningBraceLine(std::string_view line) {
    return trim(std::string{line}) == "{";
}

std::optional<std::string> NBlockExtractor::extract(const std::string& document, const std::string& entity, const std::string& keyword) {
    if (entity.empty())
        return std::nullopt;

    const RE2 DECLARATION(declarationRegex(entity, keyword));
    if (!DECLARATION.ok())
        return std::nullopt;

    const auto LINES = splitLines(document);

    // declaring line
    std::optional<size_t> declIdx;
    for (size_t i = 0; i < LINES.size(); ++i) {
        if (RE2::PartialMatch(LINES[i], DECLARATION)) {
            declIdx = i;
            break;
        }
    }

    if (!declIdx)
        return std::nullopt;

    // nearest standalone { at or above it. The declaring line can't be one itself
    // because it contains the declaration.
    std::optional<size_t> startIdx;
    for (size_t i = *declIdx + 1; i-- > 0;) {
        if (isOpeningBraceLine(LINES[i])) {
            startIdx = i;
            break;
        }
    }

    if (!startIdx)
        return std::nullopt;

    // depth walk, the block ends where depth first returns to 0 after the start
    long                  depth = 0;
    std::optional<size_t> endIdx;
    for (size_t i = *startIdx; i < LINES.size(); ++i) {
        depth += std::ranges::count(LINES[i], '{');
        depth -= std::ranges::count(LINES[i], '}');

        if (i > *startIdx && depth == 0) {
            endIdx = i;
            break;
        }
    }

    if (!endIdx)
        return std::nullopt;

    std::string block;
    for (size_t i = *startIdx; i <= *endIdx; ++i) {
        if (i != *startIdx)
            block += '\n';
        block += LINES[i];
    }

    return block;
}

std::vector<std::string> NBlockExtractor::listEntities(const std::string& document, const std::string& keyword) {
    const RE2                DECLARATION(std::format(R"({}:\s*["']([^"']+)["'])", RE2::QuoteMeta(keyword)));

    std::vector<std::string> entities;
    if (!DECLARATION.ok())
        return entities;

    re2::StringPiece input(document);
    std::string      name;
    while (RE2::FindAndConsume(&input, DECLARATION, &name)) {
        entities.emplace_back(name);
    }

    return entities;
}
