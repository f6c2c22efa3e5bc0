#pragma once

/**
 * @file dir_lock.hpp
 * @brief Advisory lock file shared by every outbox process on one data dir
 *
 * Each CLI command is its own process, so the in-process mutexes of the
 * stores do not stop two commands from rewriting the same blob. A
 * DirectoryLock is a boost::interprocess::file_lock on "<dir>/<name>.lock".
 *
 * POSIX record locks are owned by the process: two DirectoryLock objects in
 * the same process do not exclude each other. Threads must still serialise
 * with their own mutex.
 */

#include "outbox/core/result.hpp"

#include <boost/interprocess/sync/file_lock.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace outbox::storage {

class DirectoryLock {
public:
    DirectoryLock(const std::filesystem::path& dir, const std::string& name);
    ~DirectoryLock();

    DirectoryLock(const DirectoryLock&) = delete;
    DirectoryLock& operator=(const DirectoryLock&) = delete;

    /// Block until the lock is held.
    Result<void> lock();

    /// @return false when another process holds the lock
    Result<bool> try_lock();

    void unlock();

    bool owns() const noexcept { return owned_; }
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    Result<void> open();

    std::filesystem::path path_;
    std::optional<boost::interprocess::file_lock> lock_;
    bool owned_ = false;
};

} // namespace outbox::storage
