/**
 * @file prefetcher.cpp
 * @brief Snapshot refresh cycle, shared cache reuse and failure policy
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "prefetcher.hpp"
#include "auth_error.hpp"
#include "auth_logger.hpp"
#include "auth_views.hpp"
#include "file_locks.hpp"
#include "snapshot_codec.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace authcore {

std::string refreshDecisionToString(RefreshDecision decision) {
    switch (decision) {
        case RefreshDecision::NONE: return "NONE";
        case RefreshDecision::REUSE_LAST: return "REUSE_LAST";
        case RefreshDecision::REUSE_PICKLE: return "REUSE_PICKLE";
        case RefreshDecision::REBUILD: return "REBUILD";
        case RefreshDecision::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

namespace {

std::string seconds(double value) {
    std::ostringstream oss;
    oss.precision(3);
    oss << std::fixed << value << "s";
    return oss.str();
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

SnapshotPrefetcher::SnapshotPrefetcher(std::shared_ptr<DirectoryBackend> backend, PrefetchConfig config,
                                       CompilerMode mode)
    : backend_(std::move(backend)), config_(std::move(config)), mode_(mode),
      first_future_(first_promise_.get_future().share()),
      fatal_handler_([](const std::string&) {
          AuthLogger::instance().shutdown();
          std::quick_exit(1);
      }),
      clock_(wallClockNow) {
    if (config_.cacheEnabled()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.pickle_cache_dir, ec);
        if (ec) {
            throw ConfigurationError("cannot create pickle_cache_dir " + config_.pickle_cache_dir
                                     + ": " + ec.message());
        }
        cache_ = std::make_unique<SignedCache>(config_.pickle_cache_dir,
                                               config_.pickle_cache_signature_secret);
    }
}

SnapshotPrefetcher::~SnapshotPrefetcher() {
    stop();
}

void SnapshotPrefetcher::start() {
    if (running_) return;
    token_.reset();
    running_ = true;
    thread_ = std::thread(&SnapshotPrefetcher::run, this);
    LOG_INFO("Prefetcher", "Started (backend: " + backend_->getName() + ", shared cache: "
             + (cache_ ? cache_->directory().string() : std::string("disabled")) + ")");
}

void SnapshotPrefetcher::stop() {
    token_.cancel();
    if (thread_.joinable()) thread_.join();
    if (running_) LOG_INFO("Prefetcher", "Stopped");
    running_ = false;
    std::lock_guard<std::mutex> lock(mtx_);
    if (!first_set_) {
        first_promise_.set_exception(std::make_exception_ptr(CancelledError()));
        first_set_ = true;
    }
}

void SnapshotPrefetcher::run() {
    while (!token_.isCancelled()) {
        double sleepFor = 0.0;
        try {
            sleepFor = runCycle();
        } catch (const CancelledError&) {
            break;
        } catch (const UnrecoverableStalenessError&) {
            break;
        }
        if (token_.waitFor(std::chrono::duration<double>(sleepFor))) break;
    }
}

SnapshotPtr SnapshotPrefetcher::current() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return published_;
}

SnapshotPtr SnapshotPrefetcher::waitForFirstSnapshot() const {
    return first_future_.get();
}

SnapshotPtr SnapshotPrefetcher::waitForFirstSnapshot(std::chrono::milliseconds timeout) const {
    if (first_future_.wait_for(timeout) != std::future_status::ready) return nullptr;
    return first_future_.get();
}

// ============================================================================
// Refresh cycle
// ============================================================================

double SnapshotPrefetcher::runCycle() {
    double now = clock_();
    if (started_at_ == 0.0) started_at_ = now;

    try {
        BackendState state = backend_->peekVersionAndTimestamp();
        bool reset = observed_version_ && state.version < *observed_version_;
        if (reset) {
            LOG_ERROR("Prefetcher", "Backend version moved backward (from "
                      + std::to_string(*observed_version_) + " to " + std::to_string(state.version)
                      + "); discarding comparison data and rebuilding");
        }
        observed_version_ = state.version;

        SnapshotPtr last = current();
        if (!reset && last && last->version() == state.version) {
            fresh_as_of_ = now;
            last_decision_ = RefreshDecision::REUSE_LAST;
            LOG_DEBUG("Prefetcher", "Snapshot version " + std::to_string(state.version) + " is current");
        } else if (!reset && cache_ && reusePickle(state, now, true)) {
            // published by reusePickle()
        } else {
            if (cache_) {
                coordinatedRebuild(state, now, !reset);
            } else {
                publish(buildFresh(), now, RefreshDecision::REBUILD);
            }
        }
    } catch (const CancelledError&) {
        throw;
    } catch (const UnrecoverableStalenessError&) {
        throw;
    } catch (const std::exception& e) {
        handleFailure(e, now);
    }
    return nextSleep(clock_());
}

bool SnapshotPrefetcher::reusePickle(const BackendState& state, double now, bool requireRecent) {
    auto meta = cache_->readMetadata();
    if (!meta) {
        LOG_DEBUG("Prefetcher", "No usable shared cache metadata: " + meta.error().toString());
        return false;
    }
    const CacheMetadata& m = meta.value();
    bool sameVersion = m.version == state.version;
    bool recent = now - state.timestamp <= config_.tolerance_for_outdated + last_job_duration_.load();
    if (requireRecent && !sameVersion && !recent) return false;

    SnapshotPtr last = current();
    bool backendReset = last && last->version() > state.version;
    if (backendReset && !sameVersion) return false;
    if (last && !backendReset && m.version <= last->version()) {
        // nothing newer on disk; what is published stays acceptable while recent
        if (!sameVersion && !recent) return false;
        last_decision_ = RefreshDecision::REUSE_PICKLE;
        LOG_DEBUG("Prefetcher", "Keeping snapshot version " + std::to_string(last->version())
                  + " while backend version " + std::to_string(state.version) + " is recent");
        return true;
    }

    auto body = cache_->readPayload();
    if (!body) {
        LOG_WARNING("Prefetcher", "Ignoring the shared cache: " + body.error().toString());
        return false;
    }
    SnapshotPtr snapshot;
    try {
        snapshot = deserializeSnapshot(body.value(), mode_);
    } catch (const CacheIntegrityError& e) {
        LOG_WARNING("Prefetcher", std::string("Ignoring the shared cache: ") + e.what());
        return false;
    }
    if (snapshot->version() != m.version) {
        LOG_WARNING("Prefetcher", "Shared cache payload does not match its metadata; ignoring it");
        return false;
    }
    last_job_duration_ = m.job_duration;
    publish(snapshot, sameVersion ? now : std::min(now, state.timestamp), RefreshDecision::REUSE_PICKLE);
    return true;
}

void SnapshotPrefetcher::coordinatedRebuild(const BackendState& state, double now, bool allowCacheReuse) {
    RebuildCoordinator coordinator(cache_->directory(), token_);
    coordinator.enterActivity();

    if (!coordinator.designateLoadingAndPicklingJob()) {
        coordinator.awaitOutcome();
        bool loaded = reusePickle(state, now, true);
        coordinator.finishConsuming();
        if (!loaded) {
            LOG_WARNING("Prefetcher", "The shared cache was not refreshed by the other process; rebuilding locally");
            publish(buildFresh(), now, RefreshDecision::REBUILD);
        }
        return;
    }

    if (allowCacheReuse) {
        auto meta = cache_->readMetadata();
        if (meta && meta.value().version == state.version && reusePickle(state, now, false)) {
            return;
        }
    }

    SnapshotPtr snapshot = buildFresh();
    std::string body = serializeSnapshot(snapshot, mode_);
    coordinator.beginPublishing();
    CacheMetadata metadata{snapshot->version(), snapshot->timestamp(), last_job_duration_.load()};
    auto written = cache_->write(body, metadata);
    if (!written) {
        LOG_ERROR("Prefetcher", "Cannot write the shared cache: " + written.error().toString());
    }
    coordinator.finishPublishing();
    publish(snapshot, now, RefreshDecision::REBUILD);
}

SnapshotPtr SnapshotPrefetcher::buildFresh() {
    auto t0 = std::chrono::steady_clock::now();
    SnapshotPtr snapshot = backend_->fetch(token_);
    token_.throwIfCancelled();

    AuthViews views(snapshot, mode_);
    views.accessInfos();
    views.combinedConfigs();

    double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    last_job_duration_ = duration;
    LOG_INFO("Prefetcher", "Rebuilt snapshot version " + std::to_string(snapshot->version())
             + " in " + seconds(duration));
    return snapshot;
}

void SnapshotPrefetcher::publish(SnapshotPtr snapshot, double freshAsOf, RefreshDecision decision) {
    int64_t version = snapshot->version();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        published_ = snapshot;
        if (!first_set_) {
            first_promise_.set_value(std::move(snapshot));
            first_set_ = true;
        }
    }
    fresh_as_of_ = freshAsOf;
    last_decision_ = decision;
    ++publish_count_;
    LOG_INFO("Prefetcher", "Published snapshot version " + std::to_string(version)
             + " (" + refreshDecisionToString(decision) + ")");
}

void SnapshotPrefetcher::handleFailure(const std::exception& e, double now) {
    last_decision_ = RefreshDecision::FAILED;
    bool havePublished = current() != nullptr;
    double outdated = now - (havePublished ? fresh_as_of_ : started_at_);
    if (outdated <= errorTolerance()) {
        LOG_ERROR("Prefetcher", std::string("Refresh failed: ") + e.what() + "; "
                  + (havePublished ? "keeping the snapshot outdated by " + seconds(outdated)
                                   : std::string("no snapshot published yet")));
        return;
    }

    std::string message = std::string("Refresh failed: ") + e.what()
        + "; authorization data outdated for " + seconds(outdated)
        + " exceeds the tolerance of " + seconds(errorTolerance());
    LOG_FATAL("Prefetcher", message);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!first_set_) {
            first_promise_.set_exception(std::make_exception_ptr(UnrecoverableStalenessError(message)));
            first_set_ = true;
        }
    }
    fatal_handler_(message);
    throw UnrecoverableStalenessError(message);
}

double SnapshotPrefetcher::nextSleep(double now) const {
    double base = current() ? fresh_as_of_ : started_at_;
    double remaining = config_.tolerance_for_outdated - (now - base);
    double sleepFor = std::min<double>(config_.max_sleep_between_runs, remaining);
    return std::max(sleepFor, 1.0);
}

} // namespace authcore
