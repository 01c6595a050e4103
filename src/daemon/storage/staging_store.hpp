#pragma once

#include "clip_error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>

enum class MediaKind { Text, Png, Jpeg };

std::string_view media_kind_extension(MediaKind kind);
std::optional<MediaKind> media_kind_from_extension(std::string_view ext);
bool is_raster(MediaKind kind);

struct StagedArtifact {
    std::string content_hash;
    std::filesystem::path path;
    uint64_t byte_size = 0;
    MediaKind kind = MediaKind::Text;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::filesystem::path> thumbnail_path;
};

struct EvictionStats {
    size_t files_removed = 0;
    size_t index_pruned = 0;
    size_t failures = 0;
};

// Content-addressed cache of clipboard payloads under one directory.
//
// Files are named clip-<first 8 hex of sha256>.<ext>, so the same payload and
// kind always land on the same path, also across restarts. The directory is
// the source of truth; the in-memory index only saves writes and is checked
// against the filesystem on every hit. The index mutex is never held across
// file I/O.
class StagingStore {
public:
    StagingStore(std::filesystem::path root, std::chrono::seconds max_age, bool verbose = false);

    StagingStore(const StagingStore&) = delete;
    StagingStore& operator=(const StagingStore&) = delete;

    std::expected<StagedArtifact, ClipError> stage(std::span<const uint8_t> payload, MediaKind kind);
    std::expected<StagedArtifact, ClipError> stage_text(std::string_view text);

    // One cleanup pass: removes files and index entries older than max_age
    // as seen from `now`. Per-file failures are logged and counted.
    EvictionStats evict_expired(std::chrono::system_clock::time_point now);
    EvictionStats evict_expired() { return evict_expired(std::chrono::system_clock::now()); }

    // Runs evict_expired() every `interval` until stopped.
    void run_eviction(std::stop_token st, std::chrono::seconds interval);

    const std::filesystem::path& root() const { return root_; }
    std::chrono::seconds max_age() const { return max_age_; }
    size_t index_size() const;
    uint64_t write_count() const { return writes_.load(std::memory_order_relaxed); }

private:
    std::optional<StagedArtifact> lookup(const std::string& name) const;
    void remember(const std::string& name, const StagedArtifact& artifact);
    std::optional<std::filesystem::path> write_thumbnail(std::span<const uint8_t> payload,
                                                         const std::string& hash8);

    void log(const std::string& msg);

    std::filesystem::path root_;
    std::chrono::seconds max_age_;
    bool verbose_;

    mutable std::mutex index_mutex_;
    std::unordered_map<std::string, StagedArtifact> index_;
    std::atomic<uint64_t> writes_{0};

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
};
