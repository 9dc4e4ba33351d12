/**
 * @file snapshot.hpp
 * @brief Immutable versioned directory snapshot with per-view memoization
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_SNAPSHOT_HPP
#define AUTHCORE_SNAPSHOT_HPP

#include "directory.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace authcore {

/**
 * @class Snapshot
 * @brief One point-in-time copy of the directory plus derived views
 *
 * The graph and its metadata never change after construction. Derived
 * views are computed on first request and stored under their view name;
 * concurrent first requests for one view compute it once. A failed
 * computation stores nothing, so the next request retries.
 */
class Snapshot {
public:
    Snapshot(DirectoryGraph graph, int64_t version, double timestamp,
             std::vector<std::string> ignoredIpNetworks = {})
        : graph_(std::move(graph)), version_(version), timestamp_(timestamp),
          ignored_ip_networks_(std::move(ignoredIpNetworks)) {}

    Snapshot(const Snapshot&) = delete;
    Snapshot& operator=(const Snapshot&) = delete;

    const DirectoryGraph& graph() const { return graph_; }
    int64_t version() const { return version_; }
    double timestamp() const { return timestamp_; }
    const std::vector<std::string>& ignoredIpNetworks() const { return ignored_ip_networks_; }

    /**
     * @brief Return the view named @p view, computing it if needed
     * @param compute callable returning T; called at most once per success
     */
    template<typename T, typename Compute>
    std::shared_ptr<const T> memoized(const std::string& view, Compute&& compute) const {
        std::shared_ptr<Entry> e = entry(view);
        std::lock_guard<std::mutex> lock(e->mtx);
        if (!e->value) {
            e->value = std::make_shared<const T>(compute());
        }
        return std::static_pointer_cast<const T>(e->value);
    }

    /** @brief Install an already computed view (e.g. one restored from the disk cache) */
    template<typename T>
    void seed(const std::string& view, std::shared_ptr<const T> value) const {
        std::shared_ptr<Entry> e = entry(view);
        std::lock_guard<std::mutex> lock(e->mtx);
        e->value = std::move(value);
    }

    bool isMemoized(const std::string& view) const {
        std::shared_ptr<Entry> e;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = memo_.find(view);
            if (it == memo_.end()) return false;
            e = it->second;
        }
        std::lock_guard<std::mutex> lock(e->mtx);
        return e->value != nullptr;
    }

private:
    struct Entry {
        std::mutex mtx;
        std::shared_ptr<const void> value;
    };

    std::shared_ptr<Entry> entry(const std::string& view) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto& slot = memo_[view];
        if (!slot) slot = std::make_shared<Entry>();
        return slot;
    }

    DirectoryGraph graph_;
    int64_t version_;
    double timestamp_;
    std::vector<std::string> ignored_ip_networks_;

    mutable std::mutex mtx_;
    mutable std::map<std::string, std::shared_ptr<Entry>> memo_;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

} // namespace authcore

#endif // AUTHCORE_SNAPSHOT_HPP
