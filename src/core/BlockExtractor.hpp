#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/*
    Finds a named block in loosely structured text by counting braces.
    This is not a parser: the input may be unbalanced, half a README, or
    otherwise malformed. Anything that doesn't fit yields nullopt.
*/
namespace NBlockExtractor {
    // Block declaring `entity`, lines joined by '\n', no trailing newline.
    // The keyword is the key the entity name is assigned to (module: "name").
    std::optional<std::string> extract(const std::string& document, const std::string& entity, const std::string& keyword = "module");

    // every quoted name assigned to keyword, in document order, duplicates kept
    std::vector<std::string> listEntities(const std::string& document, const std::string& keyword = "module");

    // the document split on '\n', nothing trimmed or dropped
    std::vector<std::string_view> splitLines(std::string_view document);

    // "{" after trimming whitespace
    bool isOpeningBraceLine(std::string_view line);
};
