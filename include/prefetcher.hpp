/**
 * @file prefetcher.hpp
 * @brief Background snapshot refresh with the shared signed cache
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_PREFETCHER_HPP
#define AUTHCORE_PREFETCHER_HPP

#include "auth_config.hpp"
#include "cancellation.hpp"
#include "directory_backend.hpp"
#include "signed_cache.hpp"
#include "snapshot.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace authcore {

/** @brief Outcome of one refresh cycle */
enum class RefreshDecision {
    NONE,            ///< no cycle has completed
    REUSE_LAST,      ///< the published snapshot is still current
    REUSE_PICKLE,    ///< loaded from the shared cache
    REBUILD,         ///< fetched from the backend
    FAILED           ///< the cycle failed; the last snapshot is kept
};

std::string refreshDecisionToString(RefreshDecision decision);

/**
 * @class SnapshotPrefetcher
 * @brief Keeps a fresh snapshot published for the request threads
 *
 * Each cycle peeks the backend version, then reuses the published
 * snapshot, loads the shared cache or rebuilds, and sleeps until the next
 * check is due. A backend version lower than one already seen is treated
 * as a backend reset: comparison data is discarded and the snapshot is
 * rebuilt. When a rebuild fails and the published snapshot has been
 * outdated longer than the error tolerance allows, the fatal handler runs
 * (by default it logs and terminates the process).
 */
class SnapshotPrefetcher {
public:
    using FatalHandler = std::function<void(const std::string&)>;
    using Clock = std::function<double()>;

    SnapshotPrefetcher(std::shared_ptr<DirectoryBackend> backend, PrefetchConfig config,
                       CompilerMode mode = CompilerMode::DEFAULT);
    ~SnapshotPrefetcher();

    SnapshotPrefetcher(const SnapshotPrefetcher&) = delete;
    SnapshotPrefetcher& operator=(const SnapshotPrefetcher&) = delete;

    /** @brief Start the background thread */
    void start();

    /** @brief Cancel the background thread and join it */
    void stop();

    bool isRunning() const { return running_; }

    /** @brief The published snapshot, or nullptr before the first one */
    SnapshotPtr current() const;

    /**
     * @brief Block until the first snapshot is published
     * @throws UnrecoverableStalenessError or CancelledError if none ever will be
     */
    SnapshotPtr waitForFirstSnapshot() const;

    /** @return nullptr if @p timeout passes first */
    SnapshotPtr waitForFirstSnapshot(std::chrono::milliseconds timeout) const;

    /**
     * @brief Run one refresh cycle on the calling thread
     * @return seconds until the next cycle is due
     * @throws UnrecoverableStalenessError after the fatal handler returned
     */
    double runCycle();

    RefreshDecision lastDecision() const { return last_decision_; }
    double lastJobDuration() const { return last_job_duration_; }
    size_t publishCount() const { return publish_count_; }
    CompilerMode compilerMode() const { return mode_; }
    const PrefetchConfig& config() const { return config_; }

    void setFatalHandler(FatalHandler handler) { fatal_handler_ = std::move(handler); }
    void setClock(Clock clock) { clock_ = std::move(clock); }

    /** @brief Seconds the published data may lag behind the backend when a rebuild fails */
    double errorTolerance() const {
        return static_cast<double>(config_.tolerance_for_outdated) + config_.tolerance_for_outdated_on_error;
    }

private:
    void run();
    bool reusePickle(const BackendState& state, double now, bool requireRecent);
    void coordinatedRebuild(const BackendState& state, double now, bool allowCacheReuse);
    SnapshotPtr buildFresh();
    void publish(SnapshotPtr snapshot, double freshAsOf, RefreshDecision decision);
    void handleFailure(const std::exception& e, double now);
    double nextSleep(double now) const;

    std::shared_ptr<DirectoryBackend> backend_;
    PrefetchConfig config_;
    CompilerMode mode_;
    std::unique_ptr<SignedCache> cache_;

    CancellationToken token_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex mtx_;
    SnapshotPtr published_;
    double fresh_as_of_ = 0.0;          ///< last time the published data was known current
    std::optional<int64_t> observed_version_;
    double started_at_ = 0.0;

    std::promise<SnapshotPtr> first_promise_;
    std::shared_future<SnapshotPtr> first_future_;
    bool first_set_ = false;

    std::atomic<RefreshDecision> last_decision_{RefreshDecision::NONE};
    std::atomic<double> last_job_duration_{0.0};
    std::atomic<size_t> publish_count_{0};

    FatalHandler fatal_handler_;
    Clock clock_;
};

} // namespace authcore

#endif // AUTHCORE_PREFETCHER_HPP
