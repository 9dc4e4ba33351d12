/**
 * @file test_snapshot_cache.cpp
 * @brief Tests for the snapshot codec and the signed cache files
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "test_fixtures.hpp"
#include "signed_cache.hpp"
#include "snapshot_codec.hpp"
#include <fstream>
#include <sstream>

using namespace authcore;
using namespace authcore::testing;

namespace {

const std::string SECRET = "a-secret-long-enough-for-the-validator";

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

void spit(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace

// ============================================================================
// Codec
// ============================================================================

TEST_CASE_SUITE(RoundTripSeedsViews, SnapshotCodec) {
    SnapshotPtr original = fixtures::sampleSnapshot(7, 1234.5);
    std::string body = serializeSnapshot(original, CompilerMode::DEFAULT);

    SnapshotPtr back = deserializeSnapshot(body, CompilerMode::DEFAULT);
    REQUIRE_EQ(back->version(), int64_t{7});
    REQUIRE_NEAR(back->timestamp(), 1234.5, 1e-9);
    REQUIRE(back->graph() == original->graph());
    REQUIRE(back->isMemoized(views::accessInfos(CompilerMode::DEFAULT)));
    REQUIRE(back->isMemoized(views::COMBINED_CONFIGS));

    REQUIRE(*AuthViews(back).accessInfos() == *AuthViews(original).accessInfos());
    REQUIRE(*AuthViews(back).combinedConfigs() == *AuthViews(original).combinedConfigs());
}

TEST_CASE_SUITE(OtherModeIsRecomputed, SnapshotCodec) {
    std::string body = serializeSnapshot(fixtures::sampleSnapshot(), CompilerMode::DEFAULT);
    SnapshotPtr back = deserializeSnapshot(body, CompilerMode::LEGACY_UNSAFE_NEGATION);
    REQUIRE_FALSE(back->isMemoized(views::accessInfos(CompilerMode::LEGACY_UNSAFE_NEGATION)));
    REQUIRE_LOGGED("different compiler mode");

    auto legacy = AuthViews(back, CompilerMode::LEGACY_UNSAFE_NEGATION).accessInfos();
    REQUIRE_CONTAINS(legacy->at("o5").access_zone_conditions.at(AccessZone::THREATS).front().sql,
                     "event.asn NOT IN (1, 2, 3)");
}

TEST_CASE_SUITE(ResourceLimitsSurvive, SnapshotCodec) {
    ResourceLimits limits;
    limits.window = 60;
    limits.queries_limit = 10;
    limits.request_parameters = std::map<std::string, bool>{{"asn", false}, {"time.min", true}};
    REQUIRE(resourceLimitsFromJson(resourceLimitsToJson(limits)) == limits);
}

TEST_CASE_SUITE(MalformedBodyIsIntegrityError, SnapshotCodec) {
    REQUIRE_THROWS_AS(deserializeSnapshot("{ broken", CompilerMode::DEFAULT), CacheIntegrityError);
    REQUIRE_THROWS_CODE(deserializeSnapshot(R"({"format": 99})", CompilerMode::DEFAULT),
                        ErrorCode::CACHE_IO_ERROR);
}

// ============================================================================
// Signed cache
// ============================================================================

TEST_CASE_SUITE(WriteThenRead, SignedCache) {
    ScratchDir dir;
    SignedCache cache(dir.path(), SECRET);
    REQUIRE_EQ(cache.stamperId().size(), SignedCache::STAMPER_ID_HEX_LENGTH);

    CacheMetadata meta{5, 1000.25, 1.5};
    REQUIRE_OK(cache.write("the body\nwith lines", meta));

    auto body = cache.readPayload();
    REQUIRE_OK(body);
    REQUIRE_EQ(body.value(), std::string("the body\nwith lines"));

    auto readMeta = cache.readMetadata();
    REQUIRE_OK(readMeta);
    REQUIRE(readMeta.value() == meta);
}

TEST_CASE_SUITE(PayloadLayout, SignedCache) {
    ScratchDir dir;
    SignedCache cache(dir.path(), SECRET);
    std::string payload = cache.makePayload("B", 1700000000.5);
    REQUIRE_EQ(payload.size(), SignedCache::SIGNATURE_HEX_LENGTH + 1 + SignedCache::TIMESTAMP_LENGTH + 1
                               + SignedCache::STAMPER_ID_HEX_LENGTH + 1 + 1);
    REQUIRE_EQ(SignedCache::formatTimestamp(1700000000.5).size(), SignedCache::TIMESTAMP_LENGTH);
    REQUIRE_EQ(payload.substr(SignedCache::SIGNATURE_HEX_LENGTH + 1, SignedCache::TIMESTAMP_LENGTH),
               std::string("00001700000000.500000"));
}

TEST_CASE_SUITE(MissingFilesAreMisses, SignedCache) {
    ScratchDir dir;
    SignedCache cache(dir.path(), SECRET);
    REQUIRE_ERR_CODE(cache.readPayload(), ErrorCode::CACHE_MISS);
    REQUIRE_ERR_CODE(cache.readMetadata(), ErrorCode::CACHE_MISS);
}

TEST_CASE_SUITE(TamperedBodyIsRejected, SignedCache) {
    ScratchDir dir;
    SignedCache cache(dir.path(), SECRET);
    REQUIRE_OK(cache.write("{\"org\": \"o1\"}", CacheMetadata{1, 1.0, 0.1}));

    std::string payload = slurp(cache.payloadPath());
    payload.back() = payload.back() == 'x' ? 'y' : 'x';
    spit(cache.payloadPath(), payload);
    REQUIRE_ERR_CODE(cache.readPayload(), ErrorCode::CACHE_SIGNATURE_MISMATCH);
}

TEST_CASE_SUITE(OtherSecretIsRejected, SignedCache) {
    ScratchDir dir;
    SignedCache writer(dir.path(), SECRET);
    REQUIRE_OK(writer.write("body", CacheMetadata{1, 1.0, 0.1}));
    SignedCache reader(dir.path(), SECRET + "-rotated");
    REQUIRE_ERR_CODE(reader.readPayload(), ErrorCode::CACHE_SIGNATURE_MISMATCH);
}

TEST_CASE_SUITE(TruncatedHeaderIsRejected, SignedCache) {
    ScratchDir dir;
    SignedCache cache(dir.path(), SECRET);
    std::string payload = cache.makePayload("body", wallClockNow());
    REQUIRE_ERR_CODE(cache.verifyPayload(payload.substr(0, 100), wallClockNow()),
                     ErrorCode::CACHE_HEADER_TRUNCATED);
    REQUIRE_ERR_CODE(cache.verifyPayload("", wallClockNow()), ErrorCode::CACHE_HEADER_TRUNCATED);
}

TEST_CASE_SUITE(StaleHeaderIsRejected, SignedCache) {
    ScratchDir dir;
    SignedCache cache(dir.path(), SECRET);
    double stampedAt = 1700000000.0;
    std::string payload = cache.makePayload("body", stampedAt);
    REQUIRE_OK(cache.verifyPayload(payload, stampedAt + 3600));
    REQUIRE_ERR_CODE(cache.verifyPayload(payload, stampedAt + SignedCache::MAX_HEADER_AGE_SECONDS + 1),
                     ErrorCode::CACHE_HEADER_STALE);
}

TEST_CASE_SUITE(GarbageMetadataIsIoError, SignedCache) {
    ScratchDir dir;
    SignedCache cache(dir.path(), SECRET);
    spit(cache.metadataPath(), "[1, 2]");
    REQUIRE_ERR_CODE(cache.readMetadata(), ErrorCode::CACHE_IO_ERROR);
    spit(cache.metadataPath(), R"({"version": 1})");
    REQUIRE_ERR_CODE(cache.readMetadata(), ErrorCode::CACHE_IO_ERROR);
}

TEST_CASE_SUITE(SnapshotThroughCache, SignedCache) {
    ScratchDir dir;
    SignedCache cache(dir.path(), SECRET);
    SnapshotPtr original = fixtures::sampleSnapshot(3, 500.0);
    REQUIRE_OK(cache.write(serializeSnapshot(original, CompilerMode::DEFAULT), CacheMetadata{3, 500.0, 0.2}));

    auto body = cache.readPayload();
    REQUIRE_OK(body);
    SnapshotPtr back = deserializeSnapshot(body.value(), CompilerMode::DEFAULT);
    REQUIRE(back->graph() == original->graph());
    REQUIRE_EQ(AuthViews(back).accessInfos()->at("o1").access_zone_conditions.at(AccessZone::THREATS).front().sql,
               std::string("event.source = 'source.one' AND event.asn IN (1, 2, 3)"));
}
