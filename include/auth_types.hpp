/**
 * @file auth_types.hpp
 * @brief Core type definitions for the authorization core
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_AUTH_TYPES_HPP
#define AUTHCORE_AUTH_TYPES_HPP

#include "auth_string_utils.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace authcore {

constexpr const char* AUTHCORE_VERSION = "1.0.0";

//=============================================================================
// Limits and defaults
//=============================================================================

constexpr int DEFAULT_RESOURCE_LIMIT_WINDOW = 3600;   ///< seconds
constexpr int DEFAULT_MAX_DAYS_OLD = 100;
constexpr size_t CLIENT_ORGANIZATION_MAX_LENGTH = 32;

//=============================================================================
// Access zones
//=============================================================================

/**
 * @enum AccessZone
 * @brief Consumption mode an access fact applies to
 *
 * Enumerators are ordered by name so that ordered containers keyed on
 * zones iterate in the same order as the zone labels sort.
 */
enum class AccessZone {
    INSIDE,   ///< events concerning the organization's own network
    SEARCH,   ///< full search over events
    THREATS   ///< general threat feed
};

constexpr std::array<AccessZone, 3> ALL_ACCESS_ZONES = {
    AccessZone::INSIDE, AccessZone::SEARCH, AccessZone::THREATS
};

inline std::string accessZoneToString(AccessZone zone) {
    switch (zone) {
        case AccessZone::INSIDE: return "inside";
        case AccessZone::SEARCH: return "search";
        case AccessZone::THREATS: return "threats";
    }
    return "unknown";
}

inline std::optional<AccessZone> accessZoneFromString(const std::string& name) {
    if (name == "inside") return AccessZone::INSIDE;
    if (name == "search") return AccessZone::SEARCH;
    if (name == "threats") return AccessZone::THREATS;
    return std::nullopt;
}

/**
 * @brief Resource id of the report/query gateway endpoint for a zone
 */
inline std::string resourceIdForZone(AccessZone zone) {
    switch (zone) {
        case AccessZone::INSIDE: return "/report/inside";
        case AccessZone::SEARCH: return "/search/events";
        case AccessZone::THREATS: return "/report/threats";
    }
    return "";
}

inline std::optional<AccessZone> zoneForResourceId(const std::string& resourceId) {
    for (AccessZone zone : ALL_ACCESS_ZONES) {
        if (resourceIdForZone(zone) == resourceId) return zone;
    }
    return std::nullopt;
}

//=============================================================================
// Compiler mode
//=============================================================================

/**
 * @enum CompilerMode
 * @brief Selects the condition pipeline variant
 */
enum class CompilerMode {
    DEFAULT,                 ///< optimize, harden, compile
    SKIP_OPTIMIZATION,       ///< harden and compile only
    LEGACY_UNSAFE_NEGATION   ///< optimize, compile; negations stay NULL-unsafe
};

inline std::string compilerModeToString(CompilerMode mode) {
    switch (mode) {
        case CompilerMode::DEFAULT: return "default";
        case CompilerMode::SKIP_OPTIMIZATION: return "skip_optimization";
        case CompilerMode::LEGACY_UNSAFE_NEGATION: return "legacy_unsafe_negation";
    }
    return "unknown";
}

inline std::optional<CompilerMode> compilerModeFromString(const std::string& name) {
    std::string s = string_utils::toLower(string_utils::trim(name));
    if (s == "default") return CompilerMode::DEFAULT;
    if (s == "skip_optimization") return CompilerMode::SKIP_OPTIMIZATION;
    if (s == "legacy_unsafe_negation") return CompilerMode::LEGACY_UNSAFE_NEGATION;
    return std::nullopt;
}

//=============================================================================
// IP network bounds
//=============================================================================

/**
 * @brief Inclusive integer bounds of an IPv4 network
 *
 * The address 0 means "no IP" in event records, so a range starting at
 * 0.0.0.0 is narrowed to start at 1.
 */
inline std::optional<std::pair<int64_t, int64_t>> ipNetworkBounds(const std::string& cidr) {
    auto range = string_utils::parseIpv4Network(string_utils::trim(cidr));
    if (!range) return std::nullopt;
    int64_t lo = range->first;
    int64_t hi = range->second;
    if (lo == 0) lo = 1;
    if (lo > hi) return std::nullopt;
    return std::make_pair(lo, hi);
}

} // namespace authcore

#endif // AUTHCORE_AUTH_TYPES_HPP
