/**
 * @file directory_backend.cpp
 * @brief In-memory and JSON file directory backends
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "directory_backend.hpp"
#include "auth_logger.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace authcore {

// ============================================================================
// InMemoryDirectoryBackend
// ============================================================================

void InMemoryDirectoryBackend::setDirectory(DirectoryDocument doc, double timestamp) {
    doc.graph.validate();
    std::lock_guard<std::mutex> lock(mtx_);
    doc_ = std::move(doc);
    state_.version += 1;
    state_.timestamp = timestamp > 0.0 ? timestamp
        : std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

void InMemoryDirectoryBackend::setVersion(int64_t version) {
    std::lock_guard<std::mutex> lock(mtx_);
    state_.version = version;
}

void InMemoryDirectoryBackend::checkReachable() const {
    if (unreachable_) throw CommunicationError("in-memory backend marked unreachable");
}

BackendState InMemoryDirectoryBackend::peekVersionAndTimestamp() {
    ++peek_count_;
    checkReachable();
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

SnapshotPtr InMemoryDirectoryBackend::fetch(const CancellationToken& token) {
    token.throwIfCancelled();
    checkReachable();
    ++fetch_count_;
    std::lock_guard<std::mutex> lock(mtx_);
    return std::make_shared<const Snapshot>(doc_.graph, state_.version, state_.timestamp,
                                            doc_.ignored_ip_networks);
}

// ============================================================================
// JsonFileDirectoryBackend
// ============================================================================

namespace {

BackendState statFile(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        throw CommunicationError("cannot stat directory file " + path.string());
    }
    int64_t micros = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000
                   + static_cast<int64_t>(st.st_mtim.tv_nsec) / 1000;
    BackendState state;
    state.version = micros;
    state.timestamp = static_cast<double>(micros) / 1e6;
    return state;
}

} // namespace

BackendState JsonFileDirectoryBackend::peekVersionAndTimestamp() {
    return statFile(path_);
}

SnapshotPtr JsonFileDirectoryBackend::fetch(const CancellationToken& token) {
    token.throwIfCancelled();
    BackendState before = statFile(path_);

    std::ifstream in(path_, std::ios::binary);
    if (!in) throw CommunicationError("cannot open directory file " + path_.string());
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) throw CommunicationError("cannot read directory file " + path_.string());

    token.throwIfCancelled();
    json::JsonValue doc;
    try {
        doc = json::parse(content.str());
    } catch (const json::JsonParseError& e) {
        throw DirectoryStructureError("directory file " + path_.string() + " is not valid JSON: " + e.what());
    }
    DirectoryDocument parsed = directoryFromJson(doc);
    token.throwIfCancelled();

    BackendState after = statFile(path_);
    if (after.version != before.version) {
        LOG_WARNING("Backend", "Directory file " + path_.string() + " changed while being read");
    }
    LOG_DEBUG("Backend", "Fetched " + std::to_string(parsed.graph.organizations().size())
              + " organizations from " + path_.string());
    return std::make_shared<const Snapshot>(std::move(parsed.graph), before.version, before.timestamp,
                                            std::move(parsed.ignored_ip_networks));
}

} // namespace authcore
