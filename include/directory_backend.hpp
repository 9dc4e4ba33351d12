/**
 * @file directory_backend.hpp
 * @brief Directory backend interface and the in-memory and JSON file backends
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_DIRECTORY_BACKEND_HPP
#define AUTHCORE_DIRECTORY_BACKEND_HPP

#include "cancellation.hpp"
#include "directory_json.hpp"
#include "snapshot.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace authcore {

/** @brief Cheap change marker of the backend's data state */
struct BackendState {
    int64_t version = 0;     ///< unique per distinct data state
    double timestamp = 0.0;  ///< seconds since the epoch

    bool operator==(const BackendState&) const = default;
};

// ============================================================================
// Backend Interface
// ============================================================================

/**
 * @brief Authoritative source of the directory graph
 *
 * Both operations throw CommunicationError when the backend cannot be
 * reached and DirectoryStructureError when the data cannot be used.
 */
class DirectoryBackend {
public:
    virtual ~DirectoryBackend() = default;

    virtual BackendState peekVersionAndTimestamp() = 0;

    /**
     * @brief Fetch the whole graph as one snapshot
     * @throws CancelledError if @p token is cancelled during the fetch
     */
    virtual SnapshotPtr fetch(const CancellationToken& token) = 0;

    virtual std::string getName() const = 0;
};

// ============================================================================
// In-memory backend
// ============================================================================

/**
 * @brief Backend holding a document set by the owner; each set bumps the version
 */
class InMemoryDirectoryBackend : public DirectoryBackend {
public:
    InMemoryDirectoryBackend() = default;
    explicit InMemoryDirectoryBackend(DirectoryDocument doc) { setDirectory(std::move(doc)); }

    /** @brief Replace the data; the version advances by one */
    void setDirectory(DirectoryDocument doc, double timestamp = 0.0);

    /** @brief Force a version, e.g. to simulate a backend reset */
    void setVersion(int64_t version);

    void setUnreachable(bool unreachable) { unreachable_ = unreachable; }

    size_t fetchCount() const { return fetch_count_; }
    size_t peekCount() const { return peek_count_; }

    BackendState peekVersionAndTimestamp() override;
    SnapshotPtr fetch(const CancellationToken& token) override;
    std::string getName() const override { return "memory"; }

private:
    void checkReachable() const;

    mutable std::mutex mtx_;
    DirectoryDocument doc_;
    BackendState state_;
    std::atomic<bool> unreachable_{false};
    std::atomic<size_t> fetch_count_{0};
    std::atomic<size_t> peek_count_{0};
};

// ============================================================================
// JSON file backend
// ============================================================================

/**
 * @brief Backend reading a JSON directory document from a file
 *
 * The version is the file's modification time in microseconds, so any
 * rewrite of the file counts as a new data state.
 */
class JsonFileDirectoryBackend : public DirectoryBackend {
public:
    explicit JsonFileDirectoryBackend(std::filesystem::path path) : path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }

    BackendState peekVersionAndTimestamp() override;
    SnapshotPtr fetch(const CancellationToken& token) override;
    std::string getName() const override { return "json-file:" + path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace authcore

#endif // AUTHCORE_DIRECTORY_BACKEND_HPP
