/**
 * @file file_locks.cpp
 * @brief flock(2) based locks and rebuild coordination
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "file_locks.hpp"
#include "auth_error.hpp"
#include "auth_logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace authcore {

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

// ============================================================================
// FileLock
// ============================================================================

FileLock::FileLock(std::filesystem::path path) : path_(std::move(path)) {
    open();
}

FileLock::~FileLock() {
    if (isLocked()) unlock();
}

void FileLock::open() {
    fd_.reset(::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
    if (!fd_) {
        throw LockError("cannot open lock file " + path_.string() + ": " + std::strerror(errno));
    }
}

void FileLock::recordOwner() {
    if (::ftruncate(fd_.get(), 0) != 0) {
        LOG_WARNING("FileLock", "Cannot truncate " + path_.string() + ": " + std::strerror(errno));
        return;
    }
    if (mode_ != LockMode::EXCLUSIVE) return;
    std::string pid = std::to_string(::getpid()) + "\n";
    if (::pwrite(fd_.get(), pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size())) {
        LOG_WARNING("FileLock", "Cannot record owner in " + path_.string() + ": " + std::strerror(errno));
    }
}

bool FileLock::namesCurrentFile() const {
    struct stat opened {};
    struct stat named {};
    if (::fstat(fd_.get(), &opened) != 0 || ::stat(path_.c_str(), &named) != 0) return false;
    return opened.st_dev == named.st_dev && opened.st_ino == named.st_ino;
}

bool FileLock::tryLock(LockMode mode) {
    int op = (mode == LockMode::EXCLUSIVE ? LOCK_EX : LOCK_SH) | LOCK_NB;
    while (true) {
        if (::flock(fd_.get(), op) != 0) {
            if (errno == EWOULDBLOCK || errno == EINTR) return false;
            throw LockError("flock failed on " + path_.string() + ": " + std::strerror(errno));
        }
        if (isLocked() || namesCurrentFile()) break;
        // an orphaned file was removed meanwhile; reopening drops this lock
        open();
    }
    mode_ = mode;
    recordOwner();
    return true;
}

bool FileLock::lockFor(LockMode mode, const CancellationToken& token, std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    auto nextOrphanCheck = start + orphan_timeout_;
    while (true) {
        if (tryLock(mode)) return true;
        auto now = Clock::now();
        if (timeout != std::chrono::milliseconds::max() && now - start >= timeout) return false;
        if (!isLocked() && now >= nextOrphanCheck) {
            breakIfOrphaned();
            nextOrphanCheck = now + orphan_timeout_;
        }
        if (token.waitFor(poll_interval_)) throw CancelledError();
    }
}

void FileLock::unlock() {
    if (!isLocked()) return;
    if (mode_ == LockMode::EXCLUSIVE && ::ftruncate(fd_.get(), 0) != 0) {
        LOG_WARNING("FileLock", "Cannot truncate " + path_.string() + ": " + std::strerror(errno));
    }
    if (::flock(fd_.get(), LOCK_UN) != 0) {
        LOG_ERROR("FileLock", "Cannot unlock " + path_.string() + ": " + std::strerror(errno));
    }
    mode_.reset();
}

bool FileLock::breakIfOrphaned() {
    char buf[32] = {};
    ssize_t n = ::pread(fd_.get(), buf, sizeof(buf) - 1, 0);
    if (n <= 0) return false;
    long pid = std::strtol(buf, nullptr, 10);
    if (pid <= 0 || pid == ::getpid()) return false;
    if (::kill(static_cast<pid_t>(pid), 0) == 0 || errno != ESRCH) return false;

    if (!namesCurrentFile()) {
        // another waiter already replaced the file
        open();
        return true;
    }
    LOG_WARNING("FileLock", "Force-releasing " + path_.string() + " held by the dead process "
                + std::to_string(pid));
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        LOG_ERROR("FileLock", "Cannot remove " + path_.string() + ": " + std::strerror(errno));
        return false;
    }
    open();
    return true;
}

// ============================================================================
// RebuildCoordinator
// ============================================================================

RebuildCoordinator::RebuildCoordinator(const std::filesystem::path& directory, const CancellationToken& token)
    : token_(token),
      getjob_(directory / GETJOB_LOCK),
      job_(directory / JOB_LOCK),
      activity_(directory / ACTIVITY_LOCK),
      outcome_(directory / OUTCOME_LOCK) {}

RebuildCoordinator::~RebuildCoordinator() {
    releaseAll();
}

void RebuildCoordinator::enterActivity() {
    activity_.lockFor(LockMode::SHARED, token_);
}

bool RebuildCoordinator::designateLoadingAndPicklingJob() {
    getjob_.lockFor(LockMode::EXCLUSIVE, token_);
    bool leader = job_.tryLock(LockMode::EXCLUSIVE);
    getjob_.unlock();
    LOG_DEBUG("FileLock", leader ? "Designated to rebuild the shared cache"
                                 : "Another process is rebuilding the shared cache");
    return leader;
}

void RebuildCoordinator::beginPublishing() {
    activity_.unlock();
    activity_.lockFor(LockMode::EXCLUSIVE, token_);
}

void RebuildCoordinator::finishPublishing() {
    activity_.unlock();
    job_.unlock();
    if (outcome_.lockFor(LockMode::EXCLUSIVE, token_, outcome_timeout_)) {
        outcome_.unlock();
    } else {
        LOG_WARNING("FileLock", "Gave up waiting for other processes to consume the new cache");
    }
}

void RebuildCoordinator::awaitOutcome() {
    outcome_.lockFor(LockMode::SHARED, token_);
    activity_.unlock();
    job_.lockFor(LockMode::SHARED, token_);
    job_.unlock();
}

void RebuildCoordinator::finishConsuming() {
    outcome_.unlock();
}

void RebuildCoordinator::releaseAll() {
    getjob_.unlock();
    job_.unlock();
    activity_.unlock();
    outcome_.unlock();
}

} // namespace authcore
