/**
 * @file signed_cache.hpp
 * @brief HMAC-signed on-disk cache file pair shared between processes
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Payload file layout:
 * @code
 * <signature: 128 hex chars>\n<timestamp: 21 chars>\n<stamper id: 40 hex chars>\n<body>
 * @endcode
 * The signature is HMAC-SHA512 over everything after the first newline.
 * The metadata file holds {"version", "timestamp", "job_duration"}.
 */
#ifndef AUTHCORE_SIGNED_CACHE_HPP
#define AUTHCORE_SIGNED_CACHE_HPP

#include "result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace authcore {

/** @brief Identity of the snapshot a cache file pair holds */
struct CacheMetadata {
    int64_t version = 0;
    double timestamp = 0.0;       ///< backend timestamp of the snapshot
    double job_duration = 0.0;    ///< seconds the rebuild took

    bool operator==(const CacheMetadata&) const = default;
};

/**
 * @class SignedCache
 * @brief Reads and writes the signed payload and its metadata
 *
 * Writes go to a temporary file renamed into place, so a reader never
 * sees a partially written file. Cross-process exclusion is the caller's
 * job (see file_locks.hpp).
 */
class SignedCache {
public:
    static constexpr size_t SIGNATURE_HEX_LENGTH = 128;
    static constexpr size_t TIMESTAMP_LENGTH = 21;
    static constexpr size_t STAMPER_ID_HEX_LENGTH = 40;
    static constexpr double MAX_HEADER_AGE_SECONDS = 24 * 3600;

    static constexpr const char* PAYLOAD_FILE_NAME = "auth_api_prefetch.pickle";
    static constexpr const char* METADATA_FILE_NAME = "auth_api_prefetch.metadata";

    /** @throws AuthCoreError (SYSTEM_ERROR) if no random stamper id can be drawn */
    SignedCache(std::filesystem::path directory, std::string secret);

    const std::filesystem::path& directory() const { return dir_; }
    std::filesystem::path payloadPath() const { return dir_ / PAYLOAD_FILE_NAME; }
    std::filesystem::path metadataPath() const { return dir_ / METADATA_FILE_NAME; }

    /** @brief 40 hex chars identifying this writer */
    const std::string& stamperId() const { return stamper_id_; }

    Result<void> write(const std::string& body, const CacheMetadata& metadata) const;

    /**
     * @brief Verified body of the payload file
     * @return CACHE_MISS if there is no file, CACHE_HEADER_TRUNCATED,
     *         CACHE_SIGNATURE_MISMATCH or CACHE_HEADER_STALE if it cannot be
     *         trusted, CACHE_IO_ERROR on read failure
     */
    Result<std::string> readPayload() const;

    Result<CacheMetadata> readMetadata() const;

    /** @brief Full payload file content for @p body stamped at @p timestamp */
    std::string makePayload(const std::string& body, double timestamp) const;

    /**
     * @brief Verify a full payload and return its body
     * @param now current time in seconds since the epoch
     */
    Result<std::string> verifyPayload(const std::string& payload, double now) const;

    /** @brief Lowercase hex HMAC-SHA512 of @p data */
    std::string hmacHex(const std::string& data) const;

    static std::string formatTimestamp(double timestamp);

private:
    std::filesystem::path dir_;
    std::string secret_;
    std::string stamper_id_;
};

/** @brief Seconds since the epoch */
double wallClockNow();

} // namespace authcore

#endif // AUTHCORE_SIGNED_CACHE_HPP
