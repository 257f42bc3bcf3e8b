#include "FsUtils.hpp"
#include "../../debug/log/Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <unistd.h>

std::optional<std::string> NFsUtils::getHome() {
    const auto HOME = getenv("HOME");

    if (!HOME || HOME[0] == '\0')
        return std::nullopt;

    return std::string{HOME};
}

std::string NFsUtils::expandHome(const std::string& path) {
    if (!path.starts_with("~"))
        return path;

    if (path.size() > 1 && path[1] != '/')
        return path; // ~user is not supported

    const auto HOME = getHome();
    if (!HOME)
        return path;

    return *HOME + path.substr(1);
}

std::optional<std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::error_code ec;

    if (!std::filesystem::is_regular_file(path, ec) || ec)
        return std::nullopt;

    std::ifstream file(path, std::ios::binary);
    if (!file.good())
        return std::nullopt;

    return std::string((std::istreambuf_iterator<char>(file)), (std::istreambuf_iterator<char>()));
}

std::expected<void, std::string> NFsUtils::writeToFile(const std::string& path, const std::string& content) {
    const auto TEMP = std::format("{}.tmp.{}", path, getpid());

    {
        std::ofstream of(TEMP, std::ios::trunc | std::ios::binary);
        if (!of.good())
            return std::unexpected(std::format("couldn't open {} for writing", TEMP));

        of << content;
        of.flush();

        if (!of.good()) {
            std::error_code ec;
            std::filesystem::remove(TEMP, ec);
            return std::unexpected(std::format("couldn't write {}", TEMP));
        }
    }

    std::error_code ec;
    std::filesystem::rename(TEMP, path, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(TEMP, ec2);
        return std::unexpected(std::format("couldn't move {} into place: {}", path, ec.message()));
    }

    Log::logger->log(Log::TRACE, "FsUtils: wrote {} bytes to {}", content.size(), path);

    return {};
}

std::expected<void, std::string> NFsUtils::copyFile(const std::string& from, const std::string& to) {
    const auto CONTENT = readFileAsString(from);
    if (!CONTENT)
        return std::unexpected(std::format("couldn't read {}", from));

    return writeToFile(to, *CONTENT);
}

std::expected<void, std::string> NFsUtils::removeFile(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
        return std::unexpected(std::format("couldn't remove {}: {}", path, ec.message()));

    return {};
}

bool NFsUtils::fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

bool NFsUtils::dirExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec) && !ec;
}
