/**
 * @file snapshot_codec.hpp
 * @brief Serialization of a snapshot and its expensive views for the
 *        on-disk cache
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * The body is a JSON document:
 * @code
 * {
 *   "format": 1,
 *   "version": <int>, "timestamp": <float>,
 *   "compiler_mode": "default",
 *   "directory": { ...see directory_json.hpp... },
 *   "access_infos": { "<org id>": { "full_access", "access_zone_conditions",
 *                                   "resource_limits" } },
 *   "combined_configs": { "<org id>": { "inside_criteria", "notification_config" } }
 * }
 * @endcode
 * Conditions are stored after processing, so loading only recompiles
 * their SQL text and predicates.
 */
#ifndef AUTHCORE_SNAPSHOT_CODEC_HPP
#define AUTHCORE_SNAPSHOT_CODEC_HPP

#include "auth_json.hpp"
#include "auth_views.hpp"
#include "snapshot.hpp"
#include <string>

namespace authcore {

constexpr int SNAPSHOT_FORMAT = 1;

json::JsonValue resourceLimitsToJson(const ResourceLimits& limits);
ResourceLimits resourceLimitsFromJson(const json::JsonValue& doc);

json::JsonValue accessInfoToJson(const AccessInfo& info);
AccessInfo accessInfoFromJson(const json::JsonValue& doc);

json::JsonValue insideCriteriaToJson(const InsideCriteria& cri);
InsideCriteria insideCriteriaFromJson(const json::JsonValue& doc);

json::JsonValue notificationConfigToJson(const NotificationConfig& config);
NotificationConfig notificationConfigFromJson(const json::JsonValue& doc);

json::JsonValue combinedConfigToJson(const CombinedConfig& config);
CombinedConfig combinedConfigFromJson(const json::JsonValue& doc);

/**
 * @brief Serialize the snapshot, computing its access infos (for @p mode)
 *        and combined configs if they are not memoized yet
 */
std::string serializeSnapshot(const SnapshotPtr& snapshot, CompilerMode mode);

/**
 * @brief Rebuild a snapshot with its stored views already memoized
 *
 * Access infos are seeded only when they were stored for @p mode.
 *
 * @throws CacheIntegrityError (CACHE_IO_ERROR) if the body is malformed
 */
SnapshotPtr deserializeSnapshot(const std::string& body, CompilerMode mode);

} // namespace authcore

#endif // AUTHCORE_SNAPSHOT_CODEC_HPP
