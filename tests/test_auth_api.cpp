/**
 * @file test_auth_api.cpp
 * @brief Tests for authentication, lookups and snapshot sessions
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "test_fixtures.hpp"
#include "auth_api.hpp"
#include <thread>

using namespace authcore;
using namespace authcore::testing;

namespace {

struct PrefetchedApi {
    double now = 1000.0;
    std::shared_ptr<InMemoryDirectoryBackend> backend = std::make_shared<InMemoryDirectoryBackend>();
    std::shared_ptr<SnapshotPrefetcher> prefetcher;
    std::unique_ptr<AuthApi> api;

    PrefetchedApi() {
        backend->setDirectory(fixtures::sampleDocument(), now);
        prefetcher = std::make_shared<SnapshotPrefetcher>(backend, PrefetchConfig{});
        prefetcher->setClock([this] { return now; });
        prefetcher->setFatalHandler([](const std::string&) {});
        prefetcher->runCycle();
        api = std::make_unique<AuthApi>(prefetcher);
    }

    void publishNewVersion(DirectoryGraph graph) {
        DirectoryDocument doc;
        doc.graph = std::move(graph);
        now += 10;
        backend->setDirectory(std::move(doc), now);
        prefetcher->runCycle();
    }
};

} // namespace

// ============================================================================
// Authentication
// ============================================================================

TEST_CASE_SUITE(KnownUserOfOrganization, AuthApi) {
    AuthApi api(fixtures::sampleSnapshot(), CompilerMode::DEFAULT);
    auto checked = api.checkCredentials("o1", "alice@o1.example");
    REQUIRE_OK(checked);
    REQUIRE(checked.value() == (AuthData{"o1", "alice@o1.example"}));
    REQUIRE(api.authenticate("oA", "carol@a.example") == (AuthData{"oA", "carol@a.example"}));
}

TEST_CASE_SUITE(UnknownUser, AuthApi) {
    AuthApi api(fixtures::sampleSnapshot(), CompilerMode::DEFAULT);
    REQUIRE_ERR_CODE(api.checkCredentials("o1", "mallory@evil.example"), ErrorCode::UNKNOWN_USER);
    REQUIRE_THROWS_CODE(api.authenticate("o1", "mallory@evil.example"), ErrorCode::UNKNOWN_USER);
    REQUIRE_LOGGED("Authentication failed: UNKNOWN_USER");
}

TEST_CASE_SUITE(UserOfOtherOrganization, AuthApi) {
    AuthApi api(fixtures::sampleSnapshot(), CompilerMode::DEFAULT);
    REQUIRE_ERR_CODE(api.checkCredentials("o5", "alice@o1.example"), ErrorCode::ORG_MISMATCH);
    REQUIRE_THROWS_AS(api.authenticate("o5", "alice@o1.example"), AuthenticationError);
}

TEST_CASE_SUITE(FailureLogDoesNotCarryCredentials, AuthApi) {
    AuthApi api(fixtures::sampleSnapshot(), CompilerMode::DEFAULT);
    REQUIRE_THROWS(api.authenticate("o5", "secret-user@o1.example"));
    for (const auto& line : AuthLogger::instance().recentLines()) {
        REQUIRE(line.find("secret-user@o1.example") == std::string::npos);
    }
}

TEST_CASE_SUITE(NullSnapshotIsRejected, AuthApi) {
    REQUIRE_THROWS_CODE(AuthApi(SnapshotPtr{}, CompilerMode::DEFAULT), ErrorCode::INVALID_ARGUMENT);
}

// ============================================================================
// Lookups
// ============================================================================

TEST_CASE_SUITE(AccessInfoLookup, AuthApi) {
    AuthApi api(fixtures::sampleSnapshot(), CompilerMode::DEFAULT);
    auto info = api.accessInfo("o1");
    REQUIRE(info.has_value());
    REQUIRE(info->full_access);
    REQUIRE_FALSE(api.accessInfo("nobody").has_value());
    REQUIRE_SIZE(*api.orgIdsToAccessInfos(), 3u);
}

TEST_CASE_SUITE(ViewAccessors, AuthApi) {
    AuthApi api(fixtures::sampleSnapshot(), CompilerMode::DEFAULT);
    REQUIRE_SIZE(*api.orgIds(), 3u);
    REQUIRE_SIZE(*api.userIdsToOrgIds(), 3u);
    REQUIRE(*api.streamApiEnabledOrgIds() == StringSet{"o1"});
    REQUIRE_SIZE(*api.streamApiDisabledOrgIds(), 2u);
    REQUIRE_SIZE(*api.orgIdsToNotificationConfigs(), 1u);
    REQUIRE_SIZE(*api.orgIdsToCombinedConfigs(), 3u);
    REQUIRE_EQ(api.orgIdsToActualNames()->at("o1"), std::string("Organization One"));
    REQUIRE(api.sourceIdsToSubsToStreamApiAccessInfos()->count("source.one"));
    REQUIRE(api.sourceIdsToNotificationAccessInfoMappings()->count("source.one"));
    REQUIRE_EQ(api.anonymizedSourceMapping()->forward.at("source.one"), std::string("anon.one"));
    REQUIRE(api.dipAnonymizationDisabledSourceIds()->count("source.two"));
}

TEST_CASE_SUITE(MatchInsideHonorsFqdnOnlyCategories, AuthApi) {
    AuthApi api(fixtures::sampleSnapshot(), CompilerMode::DEFAULT, {"leak"});
    InsideMatchInput event;
    event.category = "leak";
    event.address.push_back({2, std::nullopt, std::nullopt});
    REQUIRE_EMPTY(api.matchInside(event).org_ids);
    event.category = "bots";
    REQUIRE(api.matchInside(event).org_ids == StringSet{"oA"});
}

// ============================================================================
// Sessions
// ============================================================================

TEST_CASE_SUITE(SessionPinsSnapshot, AuthApiSession) {
    PrefetchedApi fx;
    AuthApi& api = *fx.api;
    REQUIRE_EQ(api.currentSnapshot()->version(), int64_t{1});

    DirectoryGraph without = fixtures::sampleGraph();
    Organization o9 = fixtures::makeOrg("o9");
    o9.user_ids = {"dave@o9.example"};
    without.addOrganization(o9);

    {
        AuthApi::Session session(api);
        REQUIRE_EQ(session.snapshot()->version(), int64_t{1});
        fx.publishNewVersion(without);
        REQUIRE_EQ(fx.prefetcher->current()->version(), int64_t{2});

        // still the pinned snapshot
        REQUIRE_EQ(api.currentSnapshot()->version(), int64_t{1});
        REQUIRE_ERR_CODE(api.checkCredentials("o9", "dave@o9.example"), ErrorCode::UNKNOWN_USER);

        // another thread is not pinned
        int64_t seenElsewhere = 0;
        std::thread other([&] { seenElsewhere = api.currentSnapshot()->version(); });
        other.join();
        REQUIRE_EQ(seenElsewhere, int64_t{2});
    }

    REQUIRE_EQ(api.currentSnapshot()->version(), int64_t{2});
    REQUIRE_OK(api.checkCredentials("o9", "dave@o9.example"));
}

TEST_CASE_SUITE(NestedSessionsShareOutermostPin, AuthApiSession) {
    PrefetchedApi fx;
    AuthApi& api = *fx.api;
    {
        AuthApi::Session outer(api);
        fx.publishNewVersion(fixtures::sampleGraph());
        {
            AuthApi::Session inner(api);
            REQUIRE(inner.snapshot() == outer.snapshot());
            REQUIRE_EQ(inner.snapshot()->version(), int64_t{1});
        }
        REQUIRE_EQ(api.currentSnapshot()->version(), int64_t{1});
    }
    REQUIRE_EQ(api.currentSnapshot()->version(), int64_t{2});
}

TEST_CASE_SUITE(SessionsOfDifferentApisAreIndependent, AuthApiSession) {
    PrefetchedApi fx;
    AuthApi fixed(fixtures::sampleSnapshot(42), CompilerMode::DEFAULT);
    AuthApi::Session session(fixed);
    REQUIRE_EQ(fixed.currentSnapshot()->version(), int64_t{42});
    REQUIRE_EQ(fx.api->currentSnapshot()->version(), int64_t{1});
}

TEST_CASE_SUITE(FirstLookupWaitsForFirstSnapshot, AuthApiSession) {
    auto backend = std::make_shared<InMemoryDirectoryBackend>();
    backend->setDirectory(fixtures::sampleDocument(), wallClockNow());
    auto prefetcher = std::make_shared<SnapshotPrefetcher>(backend, PrefetchConfig{});
    AuthApi api(prefetcher);
    prefetcher->start();
    REQUIRE_OK(api.checkCredentials("o1", "alice@o1.example"));
    prefetcher->stop();
}

TEST_CASE_SUITE(FailedSessionLeavesNoPin, AuthApiSession) {
    auto backend = std::make_shared<InMemoryDirectoryBackend>();
    backend->setDirectory(fixtures::sampleDocument(), wallClockNow());
    auto prefetcher = std::make_shared<SnapshotPrefetcher>(backend, PrefetchConfig{});
    AuthApi api(prefetcher);
    prefetcher->stop();

    REQUIRE_THROWS_AS(AuthApi::Session session(api), CancelledError);
    REQUIRE_THROWS_AS(api.currentSnapshot(), CancelledError);
    REQUIRE_THROWS_AS(api.orgIds(), CancelledError);
}
