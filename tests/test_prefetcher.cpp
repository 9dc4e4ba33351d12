/**
 * @file test_prefetcher.cpp
 * @brief Tests for the snapshot refresh cycle and the shared cache
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "test_fixtures.hpp"
#include "auth_views.hpp"
#include "prefetcher.hpp"
#include <fstream>

using namespace authcore;
using namespace authcore::testing;
using namespace std::chrono_literals;

namespace {

const std::string SECRET = "prefetcher-test-signature-secret";

std::shared_ptr<InMemoryDirectoryBackend> sampleBackend(double timestamp = 1000.0) {
    auto backend = std::make_shared<InMemoryDirectoryBackend>();
    backend->setDirectory(fixtures::sampleDocument(), timestamp);
    return backend;
}

PrefetchConfig cachedConfig(const ScratchDir& dir) {
    PrefetchConfig config;
    config.pickle_cache_dir = dir.str();
    config.pickle_cache_signature_secret = SECRET;
    return config;
}

/** Manually driven clock and a fatal handler that only records */
struct ManualPrefetcher {
    double now = 1000.0;
    std::vector<std::string> fatal;
    std::unique_ptr<SnapshotPrefetcher> prefetcher;

    ManualPrefetcher(std::shared_ptr<DirectoryBackend> backend, PrefetchConfig config = {},
                     CompilerMode mode = CompilerMode::DEFAULT)
        : prefetcher(std::make_unique<SnapshotPrefetcher>(std::move(backend), std::move(config), mode)) {
        prefetcher->setClock([this] { return now; });
        prefetcher->setFatalHandler([this](const std::string& message) { fatal.push_back(message); });
    }

    SnapshotPrefetcher* operator->() { return prefetcher.get(); }
};

} // namespace

// ============================================================================
// Without the shared cache
// ============================================================================

TEST_CASE_SUITE(RebuildThenReuseLast, Prefetcher) {
    auto backend = sampleBackend();
    ManualPrefetcher pf(backend);

    double sleepFor = pf->runCycle();
    REQUIRE(pf->lastDecision() == RefreshDecision::REBUILD);
    REQUIRE_NOT_NULL(pf->current());
    REQUIRE_EQ(pf->current()->version(), int64_t{1});
    REQUIRE_NEAR(sleepFor, 12.0, 1e-9);

    pf.now += 10;
    pf->runCycle();
    REQUIRE(pf->lastDecision() == RefreshDecision::REUSE_LAST);
    REQUIRE_EQ(backend->fetchCount(), size_t{1});
    REQUIRE_EQ(pf->publishCount(), size_t{1});

    backend->setDirectory(fixtures::sampleDocument(), 1020.0);
    pf.now += 10;
    pf->runCycle();
    REQUIRE(pf->lastDecision() == RefreshDecision::REBUILD);
    REQUIRE_EQ(pf->current()->version(), int64_t{2});
    REQUIRE_EQ(backend->fetchCount(), size_t{2});
}

TEST_CASE_SUITE(PublishedSnapshotHasItsViewsReady, Prefetcher) {
    ManualPrefetcher pf(sampleBackend(), {}, CompilerMode::SKIP_OPTIMIZATION);
    pf->runCycle();
    SnapshotPtr snapshot = pf->current();
    REQUIRE(snapshot->isMemoized(views::accessInfos(CompilerMode::SKIP_OPTIMIZATION)));
    REQUIRE(snapshot->isMemoized(views::COMBINED_CONFIGS));
    REQUIRE(pf->waitForFirstSnapshot() == snapshot);
}

TEST_CASE_SUITE(SleepShrinksAsDataAges, Prefetcher) {
    PrefetchConfig config;
    config.max_sleep_between_runs = 60;
    config.tolerance_for_outdated = 100;
    auto backend = sampleBackend();
    ManualPrefetcher pf(backend, config);

    REQUIRE_NEAR(pf->runCycle(), 60.0, 1e-9);
    backend->setUnreachable(true);
    pf.now += 70;
    REQUIRE_NEAR(pf->runCycle(), 30.0, 1e-9);
    pf.now += 40;
    REQUIRE_NEAR(pf->runCycle(), 1.0, 1e-9);
}

TEST_CASE_SUITE(BackendResetForcesRebuild, Prefetcher) {
    auto backend = sampleBackend();
    backend->setVersion(5);
    ManualPrefetcher pf(backend);
    pf->runCycle();
    REQUIRE_EQ(pf->current()->version(), int64_t{5});

    backend->setVersion(3);
    pf.now += 5;
    pf->runCycle();
    REQUIRE(pf->lastDecision() == RefreshDecision::REBUILD);
    REQUIRE_EQ(pf->current()->version(), int64_t{3});
    REQUIRE_LOGGED("Backend version moved backward (from 5 to 3)");
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE_SUITE(FailureWithinToleranceKeepsSnapshot, Prefetcher) {
    auto backend = sampleBackend();
    ManualPrefetcher pf(backend);
    pf->runCycle();
    SnapshotPtr before = pf->current();

    backend->setUnreachable(true);
    pf.now += pf->errorTolerance() - 1;
    REQUIRE_NOTHROW(pf->runCycle());
    REQUIRE(pf->lastDecision() == RefreshDecision::FAILED);
    REQUIRE(pf->current() == before);
    REQUIRE_EMPTY(pf.fatal);
    REQUIRE_LOGGED("Refresh failed: in-memory backend marked unreachable");

    backend->setUnreachable(false);
    pf.now += 1;
    pf->runCycle();
    REQUIRE(pf->lastDecision() == RefreshDecision::REUSE_LAST);
}

TEST_CASE_SUITE(FailureBeyondToleranceIsFatal, Prefetcher) {
    auto backend = sampleBackend();
    ManualPrefetcher pf(backend);
    pf->runCycle();

    backend->setUnreachable(true);
    pf.now += pf->errorTolerance() + 1;
    REQUIRE_THROWS_AS(pf->runCycle(), UnrecoverableStalenessError);
    REQUIRE_SIZE(pf.fatal, 1u);
    REQUIRE_CONTAINS(pf.fatal.front(), "exceeds the tolerance of 1500.000s");
}

TEST_CASE_SUITE(NoSnapshotEverPublished, Prefetcher) {
    auto backend = sampleBackend();
    backend->setUnreachable(true);
    ManualPrefetcher pf(backend);

    pf->runCycle();
    REQUIRE_NULL(pf->current());
    REQUIRE_NULL(pf->waitForFirstSnapshot(10ms));
    REQUIRE_LOGGED("no snapshot published yet");

    pf.now += pf->errorTolerance() + 1;
    REQUIRE_THROWS_AS(pf->runCycle(), UnrecoverableStalenessError);
    REQUIRE_THROWS_AS(pf->waitForFirstSnapshot(), UnrecoverableStalenessError);
}

TEST_CASE_SUITE(StopBeforeFirstSnapshotCancelsWaiters, Prefetcher) {
    auto backend = sampleBackend();
    SnapshotPrefetcher pf(backend, {});
    pf.stop();
    REQUIRE_THROWS_AS(pf.waitForFirstSnapshot(), CancelledError);
}

TEST_CASE_SUITE(UncreatableCacheDirIsConfigurationError, Prefetcher) {
    ScratchDir dir;
    std::ofstream(dir.path() / "file") << "x";
    PrefetchConfig config;
    config.pickle_cache_dir = (dir.path() / "file" / "sub").string();
    config.pickle_cache_signature_secret = SECRET;
    REQUIRE_THROWS_AS(std::make_unique<SnapshotPrefetcher>(sampleBackend(), config), ConfigurationError);
}

// ============================================================================
// Background thread
// ============================================================================

TEST_CASE_SUITE(BackgroundThreadPublishes, Prefetcher) {
    SnapshotPrefetcher pf(sampleBackend(wallClockNow()), {});
    pf.start();
    REQUIRE(pf.isRunning());
    SnapshotPtr first = pf.waitForFirstSnapshot(5000ms);
    REQUIRE_NOT_NULL(first);
    REQUIRE_EQ(first->version(), int64_t{1});
    pf.stop();
    REQUIRE_FALSE(pf.isRunning());
    REQUIRE(pf.current() == first);
}

// ============================================================================
// Shared cache
// ============================================================================

TEST_CASE_SUITE(SecondProcessReusesPickle, PrefetcherCache) {
    ScratchDir dir;
    auto backend = sampleBackend();
    ManualPrefetcher writer(backend, cachedConfig(dir));
    ManualPrefetcher reader(backend, cachedConfig(dir));

    writer->runCycle();
    REQUIRE(writer->lastDecision() == RefreshDecision::REBUILD);
    REQUIRE(std::filesystem::exists(dir.path() / SignedCache::PAYLOAD_FILE_NAME));
    REQUIRE(std::filesystem::exists(dir.path() / SignedCache::METADATA_FILE_NAME));

    reader->runCycle();
    REQUIRE(reader->lastDecision() == RefreshDecision::REUSE_PICKLE);
    REQUIRE_EQ(backend->fetchCount(), size_t{1});
    REQUIRE(reader->current()->graph() == writer->current()->graph());
    REQUIRE(reader->current()->isMemoized(views::accessInfos(CompilerMode::DEFAULT)));
}

TEST_CASE_SUITE(TamperedPickleIsRebuilt, PrefetcherCache) {
    ScratchDir dir;
    auto backend = sampleBackend();
    ManualPrefetcher writer(backend, cachedConfig(dir));
    writer->runCycle();

    auto payloadPath = dir.path() / SignedCache::PAYLOAD_FILE_NAME;
    {
        std::ofstream out(payloadPath, std::ios::app);
        out << " ";
    }

    ManualPrefetcher reader(backend, cachedConfig(dir));
    reader->runCycle();
    REQUIRE(reader->lastDecision() == RefreshDecision::REBUILD);
    REQUIRE_EQ(backend->fetchCount(), size_t{2});
    REQUIRE_LOGGED("Ignoring the shared cache");
}

TEST_CASE_SUITE(OldPickleIsNotReloaded, PrefetcherCache) {
    ScratchDir dir;
    auto backend = sampleBackend();
    ManualPrefetcher writer(backend, cachedConfig(dir));
    ManualPrefetcher reader(backend, cachedConfig(dir));
    writer->runCycle();
    reader->runCycle();
    REQUIRE(reader->lastDecision() == RefreshDecision::REUSE_PICKLE);

    // the backend moved on long ago and nobody refreshed the cache
    backend->setDirectory(fixtures::sampleDocument(), 500.0);
    reader.now += 1000;
    reader->runCycle();
    REQUIRE(reader->lastDecision() == RefreshDecision::REBUILD);
    REQUIRE_EQ(reader->current()->version(), int64_t{2});

    // the cache now holds version 2, which the writer may load
    writer.now += 1000;
    writer->runCycle();
    REQUIRE(writer->lastDecision() == RefreshDecision::REUSE_PICKLE);
    REQUIRE_EQ(backend->fetchCount(), size_t{2});
}

TEST_CASE_SUITE(OlderPickleServesUntilToleranceEnds, PrefetcherCache) {
    ScratchDir dir;
    auto backend = sampleBackend();
    ManualPrefetcher writer(backend, cachedConfig(dir));
    writer->runCycle();

    backend->setDirectory(fixtures::sampleDocument(), 2000.0);
    ManualPrefetcher reader(backend, cachedConfig(dir));
    reader.now = 2010;
    reader->runCycle();
    REQUIRE(reader->lastDecision() == RefreshDecision::REUSE_PICKLE);
    REQUIRE_EQ(reader->current()->version(), int64_t{1});

    reader.now = 2022;
    reader->runCycle();
    REQUIRE(reader->lastDecision() == RefreshDecision::REUSE_PICKLE);
    REQUIRE_EQ(reader->current()->version(), int64_t{1});
    REQUIRE_EQ(reader->publishCount(), size_t{1});
    REQUIRE_EQ(backend->fetchCount(), size_t{1});

    reader.now = 2000.0 + reader->config().tolerance_for_outdated + 2;
    reader->runCycle();
    REQUIRE(reader->lastDecision() == RefreshDecision::REBUILD);
    REQUIRE_EQ(reader->current()->version(), int64_t{2});
    REQUIRE_EQ(backend->fetchCount(), size_t{2});
}

TEST_CASE_SUITE(PickleFromOtherModeRecomputesAccessInfos, PrefetcherCache) {
    ScratchDir dir;
    auto backend = sampleBackend();
    ManualPrefetcher writer(backend, cachedConfig(dir));
    ManualPrefetcher legacy(backend, cachedConfig(dir), CompilerMode::LEGACY_UNSAFE_NEGATION);
    writer->runCycle();
    legacy->runCycle();
    REQUIRE(legacy->lastDecision() == RefreshDecision::REUSE_PICKLE);
    REQUIRE_FALSE(legacy->current()->isMemoized(views::accessInfos(CompilerMode::LEGACY_UNSAFE_NEGATION)));
}
