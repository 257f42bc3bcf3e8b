#pragma once
#include <expected>
#include <optional>
#include <string>

namespace NFsUtils {
    // $HOME, or nullopt if unset / empty
    std::optional<std::string> getHome();

    // expands a leading ~ to $HOME, leaves everything else alone
    std::string expandHome(const std::string& path);

    // byte-exact, no trimming
    std::optional<std::string> readFileAsString(const std::string& path);

    // writes to a sibling temp file and renames over the target
    std::expected<void, std::string> writeToFile(const std::string& path, const std::string& content);

    std::expected<void, std::string> copyFile(const std::string& from, const std::string& to);

    // removes the file if it exists. Missing is not an error.
    std::expected<void, std::string> removeFile(const std::string& path);

    bool                             fileExists(const std::string& path);
    bool                             dirExists(const std::string& path);
};
