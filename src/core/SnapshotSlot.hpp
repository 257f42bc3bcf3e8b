#pragma once

#include <expected>
#include <string>

#include <hyprutils/os/FileDescriptor.hpp>

/*
    The single backup slot: one copy of the master and one of the active
    config. Each snapshot overwrites the previous one, so there is exactly one
    level of undo. Only the holder of the lock may snapshot or restore.
*/
class CSnapshotSlot {
  public:
    struct SPaths {
        std::string master;
        std::string masterBak;
        std::string active;
        std::string activeBak;
        std::string lockFile;
    };

    explicit CSnapshotSlot(const SPaths& paths);
    ~CSnapshotSlot() = default;

    CSnapshotSlot(const CSnapshotSlot&) = delete;
    CSnapshotSlot(CSnapshotSlot&)       = delete;
    CSnapshotSlot(CSnapshotSlot&&)      = delete;

    // non-blocking, fails if anyone holds the slot, this object included
    std::expected<void, std::string> lock();
    void                             unlock();
    bool                             locked() const;

    // copies both files into the slot. A file that doesn't exist has its
    // backup removed, so a restore removes it again.
    std::expected<void, std::string> snapshot();

    // puts both files back as they were at snapshot time
    std::expected<void, std::string> restore();

    // whether anything is in the slot on disk, for recovery after a crash
    bool                             hasSnapshot() const;

    const SPaths&                    paths() const;

  private:
    SPaths                         m_paths;
    Hyprutils::OS::CFileDescriptor m_lockFd;
};
