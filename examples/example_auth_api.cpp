/**
 * @file example_auth_api.cpp
 * @brief Building a directory in memory and querying it through AuthApi
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "auth_api.hpp"
#include "directory_backend.hpp"
#include <iostream>

using namespace authcore;

namespace {

DirectoryDocument buildDirectory() {
    DirectoryDocument doc;
    DirectoryGraph& graph = doc.graph;

    graph.addSource({"cert.feed", {{"n6anonymized", {"hidden.feed"}}}});

    CriteriaContainer malware;
    malware.ref = "cri-malware";
    malware.category = {"bots", "cnc"};
    graph.addCriteriaContainer(malware);

    CriteriaContainer local;
    local.ref = "cri-local";
    local.ip_network = {"192.168.0.0/16"};
    graph.addCriteriaContainer(local);

    graph.addSubsource({"feed-malware", "cert.feed", {"cri-malware"}, {"cri-local"}});

    Organization bank;
    bank.id = "bank.example";
    bank.attributes = {
        {"name", {"Example Bank"}},
        {"n6stream-api-enabled", {"TRUE"}},
        {"n6ip-network", {"203.0.113.0/24"}},
        {"n6fqdn", {"bank.example"}},
    };
    bank.channels[AccessZone::SEARCH].subsource_refs = {"feed-malware"};
    bank.channels[AccessZone::INSIDE].subsource_refs = {"feed-malware"};
    bank.resources[AccessZone::SEARCH] = {{"n6time-window", {"3600"}}, {"n6queries-limit", {"100"}}};
    bank.resources[AccessZone::INSIDE] = {};
    bank.user_ids = {"analyst@bank.example"};
    graph.addOrganization(bank);

    return doc;
}

} // namespace

int main() {
    std::cout << "=== authcore AuthApi Example ===\n\n";
    AuthLogger::instance().setConsoleOutput(true);

    auto backend = std::make_shared<InMemoryDirectoryBackend>();
    backend->setDirectory(buildDirectory(), wallClockNow());

    auto prefetcher = std::make_shared<SnapshotPrefetcher>(backend, PrefetchConfig{});
    AuthApi api(prefetcher);
    prefetcher->start();

    try {
        AuthApi::Session session(api);
        std::cout << "Snapshot version " << session.snapshot()->version() << "\n\n";

        AuthData who = api.authenticate("bank.example", "analyst@bank.example");
        std::cout << "Authenticated " << who.user_id << " of " << who.org_id << "\n";

        auto info = api.accessInfo(who.org_id);
        for (const auto& [zone, conditions] : info->access_zone_conditions) {
            std::cout << "  " << accessZoneToString(zone) << ": " << conditions.front().sql << "\n";
        }

        InsideMatchInput event;
        event.category = "bots";
        event.fqdn = "www.bank.example";
        std::cout << "\nwww.bank.example is inside of " << api.matchInside(event).org_ids.size()
                  << " organization(s)\n";

        std::cout << "Anonymized name of cert.feed: "
                  << api.anonymizedSourceMapping()->forward.at("cert.feed") << "\n";

        api.authenticate("bank.example", "intruder@elsewhere.example");
    } catch (const AuthenticationError& e) {
        std::cout << "\nRejected: " << errorCodeToString(e.code()) << "\n";
    }

    prefetcher->stop();
    std::cout << "\nDone.\n";
    return 0;
}
