/**
 * @file directory_json.hpp
 * @brief JSON encoding of the directory graph
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Document layout:
 * @code
 * {
 *   "organizations": [{"id", "attributes", "channels", "resources",
 *                      "org_groups", "users"}],
 *   "org_groups": [{"id", "channels"}],
 *   "sources": [{"id", "attributes"}],
 *   "subsources": [{"ref", "source", "inclusion_criteria", "exclusion_criteria"}],
 *   "subsource_groups": [{"ref", "subsources"}],
 *   "criteria_containers": [{"ref", "asn", "cc", "ip_network", "category", "name"}],
 *   "ignored_ip_networks": ["10.0.0.0/8"]
 * }
 * @endcode
 * Channels are keyed by zone name; an "-ex" suffix marks exclusion edges.
 * Each channel holds "subsources" and "subsource_groups" lists.
 */
#ifndef AUTHCORE_DIRECTORY_JSON_HPP
#define AUTHCORE_DIRECTORY_JSON_HPP

#include "auth_json.hpp"
#include "directory.hpp"
#include <string>
#include <vector>

namespace authcore {

struct DirectoryDocument {
    DirectoryGraph graph;
    std::vector<std::string> ignored_ip_networks;
};

json::JsonValue directoryToJson(const DirectoryGraph& graph,
                                const std::vector<std::string>& ignoredIpNetworks = {});

/**
 * @brief Decode and validate a directory document
 * @throws DirectoryStructureError if the document shape is wrong or a
 *         reference dangles
 */
DirectoryDocument directoryFromJson(const json::JsonValue& doc);

} // namespace authcore

#endif // AUTHCORE_DIRECTORY_JSON_HPP
