/**
 * @file file_locks.hpp
 * @brief Advisory file locks and the cross-process rebuild coordination
 *        built on them
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_FILE_LOCKS_HPP
#define AUTHCORE_FILE_LOCKS_HPP

#include "cancellation.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace authcore {

/** @brief Owning file descriptor */
class UniqueFd {
public:
    explicit UniqueFd(int fd = -1) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& o) noexcept {
        if (this != &o) {
            reset();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    void reset(int fd = -1) noexcept;
    int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

private:
    int fd_;
};

enum class LockMode { SHARED, EXCLUSIVE };

/**
 * @class FileLock
 * @brief flock(2) lock on one file, owned by this object
 *
 * Two FileLock objects on the same path conflict with each other even
 * within one process. Changing the mode of a held lock is not atomic.
 * An exclusive holder records its pid in the file; a waiter that finds
 * the recorded process gone after the orphan timeout removes the file
 * and locks a fresh one. Acquiring a file that is no longer at the path
 * moves on to the file that is.
 */
class FileLock {
public:
    explicit FileLock(std::filesystem::path path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::filesystem::path& path() const { return path_; }
    bool isLocked() const { return mode_.has_value(); }
    std::optional<LockMode> mode() const { return mode_; }

    /**
     * @brief Non-blocking acquisition (or mode change)
     * @throws LockError on a failure other than contention
     */
    bool tryLock(LockMode mode);

    /**
     * @brief Wait for the lock, polling so that cancellation is noticed
     * @return false if @p timeout passed first
     * @throws CancelledError if @p token is cancelled while waiting
     */
    bool lockFor(LockMode mode, const CancellationToken& token,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

    void unlock();

    void setPollInterval(std::chrono::milliseconds interval) { poll_interval_ = interval; }
    void setOrphanTimeout(std::chrono::milliseconds timeout) { orphan_timeout_ = timeout; }

    /**
     * @brief Remove the lock file if its recorded exclusive holder is dead
     * @return true if this lock now refers to a fresh file at the path
     */
    bool breakIfOrphaned();

private:
    void open();
    bool namesCurrentFile() const;
    void recordOwner();

    std::filesystem::path path_;
    UniqueFd fd_;
    std::optional<LockMode> mode_;
    std::chrono::milliseconds poll_interval_{20};
    std::chrono::milliseconds orphan_timeout_{std::chrono::seconds(60)};
};

/**
 * @class RebuildCoordinator
 * @brief One process's part in deciding who rebuilds the shared cache
 *
 * Lock files in the cache directory:
 * | File    | Role |
 * |---------|------|
 * | GETJOB  | exclusive while deciding who rebuilds |
 * | JOB     | exclusive for the rebuilding process; followers wait on it shared |
 * | ACTIVITY| shared inside the coordinated section; exclusive while writing |
 * | OUTCOME | shared by followers until they consumed the new cache |
 *
 * Leader: enterActivity(), designateLoadingAndPicklingJob() == true,
 * rebuild, beginPublishing(), write, finishPublishing().
 * Follower: enterActivity(), designateLoadingAndPicklingJob() == false,
 * awaitOutcome(), read, finishConsuming().
 * The destructor releases whatever is still held.
 */
class RebuildCoordinator {
public:
    static constexpr const char* GETJOB_LOCK = "auth_api_prefetch.GETJOB.lock";
    static constexpr const char* JOB_LOCK = "auth_api_prefetch.JOB.lock";
    static constexpr const char* ACTIVITY_LOCK = "auth_api_prefetch.ACTIVITY.lock";
    static constexpr const char* OUTCOME_LOCK = "auth_api_prefetch.OUTCOME.lock";

    RebuildCoordinator(const std::filesystem::path& directory, const CancellationToken& token);
    ~RebuildCoordinator();

    RebuildCoordinator(const RebuildCoordinator&) = delete;
    RebuildCoordinator& operator=(const RebuildCoordinator&) = delete;

    void enterActivity();

    /**
     * @brief Decide whether this process rebuilds
     * @return true if this process now holds JOB and must rebuild
     */
    bool designateLoadingAndPicklingJob();

    bool isLeader() const { return job_.mode() == LockMode::EXCLUSIVE; }

    /** @brief Leader: wait until no other process is inside the section */
    void beginPublishing();

    /** @brief Leader: let followers in and wait (bounded) until they consumed */
    void finishPublishing();

    /** @brief Follower: wait until the running rebuild is finished */
    void awaitOutcome();

    void finishConsuming();

    /** @brief Release every held lock */
    void releaseAll();

    void setOutcomeTimeout(std::chrono::milliseconds timeout) { outcome_timeout_ = timeout; }

private:
    const CancellationToken& token_;
    FileLock getjob_;
    FileLock job_;
    FileLock activity_;
    FileLock outcome_;
    std::chrono::milliseconds outcome_timeout_{std::chrono::seconds(30)};
};

} // namespace authcore

#endif // AUTHCORE_FILE_LOCKS_HPP
