#include "FragmentStore.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <format>

constexpr std::string_view FRAGMENT_EXTENSION = ".js";

CFragmentStore::CFragmentStore(const std::string& dir) : m_dir(dir) {
    ;
}

bool CFragmentStore::validName(const std::string& name) {
    if (name.empty() || name.starts_with('.'))
        return false;

    return std::ranges::all_of(name, [](const char& c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '@' || c == '+';
    });
}

std::string CFragmentStore::pathFor(const std::string& name) const {
    return (std::filesystem::path(m_dir) / (name + std::string{FRAGMENT_EXTENSION})).string();
}

bool CFragmentStore::exists(const std::string& name) const {
    return validName(name) && NFsUtils::fileExists(pathFor(name));
}

std::optional<std::string> CFragmentStore::read(const std::string& name) const {
    if (!validName(name))
        return std::nullopt;

    return NFsUtils::readFileAsString(pathFor(name));
}

std::expected<void, std::string> CFragmentStore::write(const std::string& name, const std::string& content) {
    if (!validName(name))
        return std::unexpected(std::format("invalid module name \"{}\"", name));

    if (auto ret = ensureExists(); !ret)
        return ret;

    auto ret = NFsUtils::writeToFile(pathFor(name), content);
    if (ret)
        Log::logger->log(Log::DEBUG, "FragmentStore: wrote {}", pathFor(name));

    return ret;
}

std::vector<std::string> CFragmentStore::list() const {
    std::vector<std::string> names;

    std::error_code          ec;
    if (!std::filesystem::is_directory(m_dir, ec) || ec)
        return names;

    for (const auto& entry : std::filesystem::directory_iterator(m_dir, ec)) {
        if (!entry.is_regular_file())
            continue;

        const auto FILENAME = entry.path().filename().string();
        if (!FILENAME.ends_with(FRAGMENT_EXTENSION))
            continue;

        const auto NAME = FILENAME.substr(0, FILENAME.size() - FRAGMENT_EXTENSION.size());
        if (validName(NAME))
            names.emplace_back(NAME);
    }

    std::ranges::sort(names);
    return names;
}

std::expected<void, std::string> CFragmentStore::ensureExists() const {
    std::error_code ec;
    if (std::filesystem::is_directory(m_dir, ec) && !ec)
        return {};

    std::filesystem::create_directories(m_dir, ec);
    if (ec)
        return std::unexpected(std::format("couldn't create {}: {}", m_dir, ec.message()));

    return {};
}

const std::string& CFragmentStore::dir() const {
    return m_dir;
}
