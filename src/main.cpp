/**
 * @file main.cpp
 * @brief authcore_cli entry point
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "auth_api.hpp"
#include "auth_args.hpp"
#include "auth_config.hpp"
#include "directory_backend.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace authcore;

namespace {

void printBanner() {
    std::cout << R"(
+===============================================================+
|              authcore - Authorization Data Core               |
|                         Version 1.0.0                         |
|                    Author: Bennie Shearer                     |
|         Copyright (c) 2025 Bennie Shearer - MIT License       |
+===============================================================+
)" << "\n";
}

args::ArgParser makeParser() {
    args::ArgParser parser("authcore_cli",
        "Load a directory, publish snapshots and answer authorization queries.");
    parser.addOption("config", 'c', "INI configuration file", "", "FILE")
          .addOption("directory", 'd', "Directory JSON file (overrides auth_api.directory_file)", "", "FILE")
          .addOption("org", 'o', "Organization id to query", "", "ORG")
          .addOption("user", 'u', "User id to authenticate against --org", "", "USER")
          .addOption("match-ip", '\0', "Find the organizations an IPv4 address is inside of", "", "IP")
          .addOption("match-fqdn", '\0', "Find the organizations a domain name is inside of", "", "FQDN")
          .addOption("category", '\0', "Event category used by the inside matchers", "other", "CATEGORY")
          .addOption("run-seconds", '\0', "Keep refreshing snapshots for this long", "0", "SECONDS")
          .addFlag("show-sql", 's', "Print the compiled access conditions of --org")
          .addFlag("quiet", 'q', "Do not print the banner");
    return parser;
}

Result<AuthConfig> loadConfig(const args::ParseResult& parsed) {
    AuthConfig config;
    if (parsed.has("config")) {
        auto loaded = AuthConfig::load(parsed["config"].asString());
        if (!loaded) return loaded;
        config = loaded.value();
    }
    if (parsed.has("directory")) config.directory_file = parsed["directory"].asString();
    if (string_utils::isBlank(config.directory_file)) {
        return Err<AuthConfig>(ErrorCode::CONFIG_MISSING,
                               "no directory file given (use --directory or auth_api.directory_file)");
    }
    return config;
}

void setupLogging(const AuthConfig& config) {
    AuthLogger& logger = AuthLogger::instance();
    logger.setLevel(config.log_level);
    logger.setConsoleOutput(config.log_console);
    if (!config.log_dir.empty() && !logger.initialize(config.log_dir, config.log_level)) {
        std::cerr << "Warning: cannot open a log file in " << config.log_dir << "\n";
    }
}

void printAccessInfo(const AuthApi& api, const std::string& orgId) {
    auto info = api.accessInfo(orgId);
    if (!info) {
        std::cout << "Organization '" << orgId << "' has no access\n";
        return;
    }
    std::cout << "Access of '" << orgId << "'" << (info->full_access ? " (full access)" : "") << ":\n";
    for (const auto& [zone, conditions] : info->access_zone_conditions) {
        for (const auto& condition : conditions) {
            std::cout << "  " << accessZoneToString(zone) << ": " << condition.sql << "\n";
        }
    }
    for (const auto& [resource, limits] : info->resource_limits) {
        std::cout << "  " << resource << " window=" << limits.window
                  << " max_days_old=" << limits.max_days_old;
        if (limits.queries_limit) std::cout << " queries_limit=" << *limits.queries_limit;
        if (limits.results_limit) std::cout << " results_limit=" << *limits.results_limit;
        std::cout << "\n";
    }
}

int matchInside(const AuthApi& api, const args::ParseResult& parsed) {
    InsideMatchInput event;
    event.category = parsed["category"].asString();
    if (parsed.has("match-ip")) {
        auto ip = string_utils::parseIpv4(parsed["match-ip"].asString());
        if (!ip) {
            std::cerr << "Error: '" << parsed["match-ip"].asString() << "' is not an IPv4 address\n";
            return 2;
        }
        event.address.push_back({*ip, std::nullopt, std::nullopt});
    }
    if (parsed.has("match-fqdn")) event.fqdn = parsed["match-fqdn"].asString();

    InsideMatchResult result = api.matchInside(event);
    std::cout << "Inside of: " << (result.org_ids.empty() ? "(none)" : string_utils::join(
        std::vector<std::string>(result.org_ids.begin(), result.org_ids.end()), ", ")) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    args::ArgParser parser = makeParser();
    args::ParseResult parsed = parser.parse(argc, argv);
    if (parsed.helpRequested()) {
        std::cout << parser.help();
        return 0;
    }
    if (!parsed.success()) {
        std::cerr << "Error: " << parsed.error() << "\n\n" << parser.help();
        return 2;
    }
    if (!parsed.has("quiet")) printBanner();

    auto config = loadConfig(parsed);
    if (!config) {
        std::cerr << "Configuration error: " << config.error().toString() << "\n";
        return 1;
    }
    auto runSeconds = parsed["run-seconds"].asInt64();
    if (!runSeconds) {
        std::cerr << "Error: --run-seconds: " << runSeconds.error().message << "\n";
        return 2;
    }
    setupLogging(config.value());

    try {
        ConfigValidator::require(config.value());
        LOG_INFO("Main", "Starting with directory file " + config.value().directory_file);
        auto backend = std::make_shared<JsonFileDirectoryBackend>(config.value().directory_file);
        auto prefetcher = std::make_shared<SnapshotPrefetcher>(
            backend, config.value().prefetching, config.value().compiler_mode);
        AuthApi api(prefetcher, config.value().fqdn_only_categories);
        prefetcher->start();

        SnapshotPtr first = prefetcher->waitForFirstSnapshot();
        std::cout << "Snapshot version " << first->version() << " published ("
                  << api.orgIds()->size() << " organizations)\n";

        int rc = 0;
        if (parsed.has("org") && parsed.has("user")) {
            AuthApi::Session session(api);
            auto checked = api.checkCredentials(parsed["org"].asString(), parsed["user"].asString());
            if (checked) {
                std::cout << "Authenticated '" << checked.value().user_id
                          << "' of '" << checked.value().org_id << "'\n";
            } else {
                std::cout << "Authentication failed: " << errorCodeToString(checked.error().code) << "\n";
                rc = 3;
            }
        }
        if (parsed.has("org") && parsed.has("show-sql")) printAccessInfo(api, parsed["org"].asString());
        if (parsed.has("match-ip") || parsed.has("match-fqdn")) {
            int matchRc = matchInside(api, parsed);
            if (matchRc != 0) rc = matchRc;
        }

        if (runSeconds.value() > 0) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(runSeconds.value());
            int64_t lastVersion = first->version();
            while (std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                SnapshotPtr current = prefetcher->current();
                if (current && current->version() != lastVersion) {
                    lastVersion = current->version();
                    std::cout << "Snapshot version " << lastVersion << " published\n";
                }
            }
        }

        prefetcher->stop();
        LOG_INFO("Main", "Stopped");
        AuthLogger::instance().shutdown();
        return rc;
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const AuthCoreError& e) {
        std::cerr << "Error [" << errorCodeToString(e.code()) << "]: " << e.what() << "\n";
        return 1;
    }
}
