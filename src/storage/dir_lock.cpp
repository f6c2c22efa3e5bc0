#include "outbox/storage/dir_lock.hpp"

#include <boost/interprocess/exceptions.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace outbox::storage {
namespace fs = std::filesystem;
namespace ipc = boost::interprocess;

DirectoryLock::DirectoryLock(const fs::path& dir, const std::string& name)
    : path_(dir / (name + ".lock")) {}

DirectoryLock::~DirectoryLock() {
    unlock();
}

Result<void> DirectoryLock::open() {
    if (lock_) {
        return Ok();
    }

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    {
        // file_lock needs an existing file; appending never truncates it.
        std::ofstream touch(path_, std::ios::app);
        if (!touch) {
            return Fail<void>(ErrorCode::Storage, "Failed to create lock file " + path_.string());
        }
    }

    try {
        lock_.emplace(path_.c_str());
    } catch (const ipc::interprocess_exception& e) {
        return Fail<void>(ErrorCode::Storage, "Failed to open lock file " + path_.string() + ": " + e.what());
    }
    return Ok();
}

Result<void> DirectoryLock::lock() {
    if (owned_) {
        return Ok();
    }
    auto opened = open();
    if (opened.is_error()) {
        return opened;
    }
    try {
        lock_->lock();
    } catch (const ipc::interprocess_exception& e) {
        return Fail<void>(ErrorCode::Storage, "Failed to lock " + path_.string() + ": " + e.what());
    }
    owned_ = true;
    return Ok();
}

Result<bool> DirectoryLock::try_lock() {
    if (owned_) {
        return Ok(true);
    }
    auto opened = open();
    if (opened.is_error()) {
        return Err<bool>(opened.error());
    }
    try {
        owned_ = lock_->try_lock();
    } catch (const ipc::interprocess_exception& e) {
        return Fail<bool>(ErrorCode::Storage, "Failed to lock " + path_.string() + ": " + e.what());
    }
    return Ok(owned_);
}

void DirectoryLock::unlock() {
    if (!owned_) {
        return;
    }
    owned_ = false;
    try {
        lock_->unlock();
    } catch (const ipc::interprocess_exception& e) {
        // Closing the descriptor below releases the lock regardless.
        spdlog::warn("Failed to unlock {}: {}", path_.string(), e.what());
    }
    lock_.reset();
}

} // namespace outbox::storage
