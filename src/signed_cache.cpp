/**
 * @file signed_cache.cpp
 * @brief Signed cache file pair (OpenSSL HMAC-SHA512)
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "signed_cache.hpp"
#include "auth_error.hpp"
#include "auth_json.hpp"
#include "auth_logger.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace authcore {

double wallClockNow() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

namespace {

std::string toHex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

bool isLowerHex(const std::string& s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

Result<std::string> readWholeFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<std::string>(ErrorCode::CACHE_MISS, "no cache file " + path.string());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) return Err<std::string>(ErrorCode::CACHE_IO_ERROR, "cannot open " + path.string());
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) return Err<std::string>(ErrorCode::CACHE_IO_ERROR, "cannot read " + path.string());
    return content.str();
}

Result<void> writeFileAtomically(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return Err(ErrorCode::CACHE_IO_ERROR, "cannot create " + tmp.string());
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) return Err(ErrorCode::CACHE_IO_ERROR, "cannot write " + tmp.string());
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return Err(ErrorCode::CACHE_IO_ERROR, "cannot rename " + tmp.string() + ": " + ec.message());
    }
    return Ok();
}

} // namespace

// ============================================================================
// SignedCache
// ============================================================================

SignedCache::SignedCache(std::filesystem::path directory, std::string secret)
    : dir_(std::move(directory)), secret_(std::move(secret)) {
    unsigned char id[STAMPER_ID_HEX_LENGTH / 2];
    if (RAND_bytes(id, sizeof(id)) != 1) {
        throw AuthCoreError(ErrorCode::SYSTEM_ERROR, "RAND_bytes failed");
    }
    stamper_id_ = toHex(id, sizeof(id));
}

std::string SignedCache::hmacHex(const std::string& data) const {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (HMAC(EVP_sha512(), secret_.data(), static_cast<int>(secret_.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &outLen) == nullptr) {
        throw AuthCoreError(ErrorCode::SYSTEM_ERROR, "HMAC-SHA512 computation failed");
    }
    return toHex(out, outLen);
}

std::string SignedCache::formatTimestamp(double timestamp) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%021.6f", timestamp);
    return buf;
}

std::string SignedCache::makePayload(const std::string& body, double timestamp) const {
    std::string signedPart = formatTimestamp(timestamp) + "\n" + stamper_id_ + "\n" + body;
    return hmacHex(signedPart) + "\n" + signedPart;
}

Result<std::string> SignedCache::verifyPayload(const std::string& payload, double now) const {
    const size_t headerLength = SIGNATURE_HEX_LENGTH + 1 + TIMESTAMP_LENGTH + 1 + STAMPER_ID_HEX_LENGTH + 1;
    if (payload.size() < headerLength ||
        payload[SIGNATURE_HEX_LENGTH] != '\n' ||
        payload[SIGNATURE_HEX_LENGTH + 1 + TIMESTAMP_LENGTH] != '\n' ||
        payload[headerLength - 1] != '\n') {
        return Err<std::string>(ErrorCode::CACHE_HEADER_TRUNCATED, "cache payload header is truncated");
    }

    std::string signature = payload.substr(0, SIGNATURE_HEX_LENGTH);
    std::string signedPart = payload.substr(SIGNATURE_HEX_LENGTH + 1);
    std::string expected = hmacHex(signedPart);
    if (!isLowerHex(signature) ||
        CRYPTO_memcmp(signature.data(), expected.data(), SIGNATURE_HEX_LENGTH) != 0) {
        return Err<std::string>(ErrorCode::CACHE_SIGNATURE_MISMATCH, "cache payload signature mismatch");
    }

    std::string stamp = signedPart.substr(0, TIMESTAMP_LENGTH);
    char* end = nullptr;
    double stampedAt = std::strtod(stamp.c_str(), &end);
    if (end != stamp.c_str() + stamp.size()) {
        return Err<std::string>(ErrorCode::CACHE_HEADER_TRUNCATED, "cache payload timestamp is malformed");
    }
    if (now - stampedAt > MAX_HEADER_AGE_SECONDS) {
        return Err<std::string>(ErrorCode::CACHE_HEADER_STALE,
                                "cache payload stamped at " + stamp + " is too old");
    }
    return payload.substr(headerLength);
}

Result<void> SignedCache::write(const std::string& body, const CacheMetadata& metadata) const {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) return Err(ErrorCode::CACHE_IO_ERROR, "cannot create " + dir_.string() + ": " + ec.message());

    auto payload = writeFileAtomically(payloadPath(), makePayload(body, wallClockNow()));
    if (!payload) return payload;

    json::JsonObject meta;
    meta["version"] = json::JsonValue(metadata.version);
    meta["timestamp"] = json::JsonValue(metadata.timestamp);
    meta["job_duration"] = json::JsonValue(metadata.job_duration);
    auto written = writeFileAtomically(metadataPath(), json::JsonValue(std::move(meta)).dump());
    if (!written) return written;

    LOG_DEBUG("SignedCache", "Wrote cache of version " + std::to_string(metadata.version)
              + " (" + std::to_string(body.size()) + " bytes) to " + dir_.string());
    return Ok();
}

Result<std::string> SignedCache::readPayload() const {
    auto content = readWholeFile(payloadPath());
    if (!content) return content;
    return verifyPayload(content.value(), wallClockNow());
}

Result<CacheMetadata> SignedCache::readMetadata() const {
    auto content = readWholeFile(metadataPath());
    if (!content) return Err<CacheMetadata>(content.error());
    auto doc = json::tryParse(content.value());
    if (!doc || !doc->isObject()) {
        return Err<CacheMetadata>(ErrorCode::CACHE_IO_ERROR, "cache metadata is not a JSON object");
    }
    auto version = doc->get("version");
    auto timestamp = doc->get("timestamp");
    auto duration = doc->get("job_duration");
    if (!version || !timestamp || !duration || !version->get().isNumber() ||
        !timestamp->get().isNumber() || !duration->get().isNumber()) {
        return Err<CacheMetadata>(ErrorCode::CACHE_IO_ERROR, "cache metadata lacks required fields");
    }
    CacheMetadata metadata;
    metadata.version = version->get().asInt64();
    metadata.timestamp = timestamp->get().asNumber();
    metadata.job_duration = duration->get().asNumber();
    return metadata;
}

} // namespace authcore
