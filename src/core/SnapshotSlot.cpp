#include "SnapshotSlot.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/file.h>
#include <unistd.h>

using namespace Hyprutils::OS;

static std::expected<void, std::string> backupOne(const std::string& from, const std::string& bak) {
    if (!NFsUtils::fileExists(from))
        return NFsUtils::removeFile(bak);

    return NFsUtils::copyFile(from, bak);
}

static std::expected<void, std::string> restoreOne(const std::string& bak, const std::string& to) {
    if (!NFsUtils::fileExists(bak))
        return NFsUtils::removeFile(to);

    return NFsUtils::copyFile(bak, to);
}

CSnapshotSlot::CSnapshotSlot(const SPaths& paths) : m_paths(paths) {
    ;
}

std::expected<void, std::string> CSnapshotSlot::lock() {
    // held by another transaction on this very slot
    if (locked())
        return std::unexpected("another mmconf transaction is in progress");

    CFileDescriptor fd{open(m_paths.lockFile.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600)};
    if (!fd.isValid())
        return std::unexpected(std::format("couldn't open lock file {}: {}", m_paths.lockFile, strerror(errno)));

    if (flock(fd.get(), LOCK_EX | LOCK_NB) < 0) {
        if (errno == EWOULDBLOCK)
            return std::unexpected("another mmconf transaction is in progress");

        return std::unexpected(std::format("couldn't lock {}: {}", m_paths.lockFile, strerror(errno)));
    }

    m_lockFd = std::move(fd);

    Log::logger->log(Log::DEBUG, "SnapshotSlot: locked {}", m_paths.lockFile);

    return {};
}

void CSnapshotSlot::unlock() {
    if (!locked())
        return;

    // closing drops the flock
    m_lockFd = CFileDescriptor{};

    Log::logger->log(Log::DEBUG, "SnapshotSlot: unlocked {}", m_paths.lockFile);
}

bool CSnapshotSlot::locked() const {
    return m_lockFd.isValid();
}

std::expected<void, std::string> CSnapshotSlot::snapshot() {
    if (!locked())
        return std::unexpected("snapshot slot is not locked");

    if (auto ret = backupOne(m_paths.master, m_paths.masterBak); !ret)
        return std::unexpected(std::format("backing up the master failed: {}", ret.error()));

    if (auto ret = backupOne(m_paths.active, m_paths.activeBak); !ret)
        return std::unexpected(std::format("backing up the active config failed: {}", ret.error()));

    Log::logger->log(Log::DEBUG, "SnapshotSlot: snapshot taken");

    return {};
}

std::expected<void, std::string> CSnapshotSlot::restore() {
    if (!locked())
        return std::unexpected("snapshot slot is not locked");

    // try both even if the first fails, a half restore is better than none
    std::string errors;

    if (auto ret = restoreOne(m_paths.masterBak, m_paths.master); !ret)
        errors += std::format("restoring the master failed: {}", ret.error());

    if (auto ret = restoreOne(m_paths.activeBak, m_paths.active); !ret)
        errors += std::format("{}restoring the active config failed: {}", errors.empty() ? "" : "; ", ret.error());

    if (!errors.empty())
        return std::unexpected(errors);

    Log::logger->log(Log::DEBUG, "SnapshotSlot: restored");

    return {};
}

bool CSnapshotSlot::hasSnapshot() const {
    return NFsUtils::fileExists(m_paths.masterBak) || NFsUtils::fileExists(m_paths.activeBak);
}

const CSnapshotSlot::SPaths& CSnapshotSlot::paths() const {
    return m_paths;
}
