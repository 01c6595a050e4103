#include "storage/staging_store.hpp"

#include "clipboard/content_hasher.hpp"
#include "image/image_codec.hpp"

#include <format>
#include <fstream>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

std::string_view media_kind_extension(MediaKind kind) {
    switch (kind) {
        case MediaKind::Text: return "txt";
        case MediaKind::Png: return "png";
        case MediaKind::Jpeg: return "jpeg";
    }
    return "bin";
}

std::optional<MediaKind> media_kind_from_extension(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
    if (ext == "txt" || ext == "text") return MediaKind::Text;
    if (ext == "png") return MediaKind::Png;
    if (ext == "jpeg" || ext == "jpg") return MediaKind::Jpeg;
    return std::nullopt;
}

bool is_raster(MediaKind kind) {
    return kind == MediaKind::Png || kind == MediaKind::Jpeg;
}

namespace {

// Writes to a private temporary sibling and renames it into place, so a
// reader never sees a partially written artifact.
std::expected<void, std::string> write_atomically(const fs::path& path, std::span<const uint8_t> data) {
    static std::atomic<uint64_t> seq{0};
    fs::path tmp = path;
    tmp += std::format(".{}.{}.tmp", ::getpid(), seq.fetch_add(1, std::memory_order_relaxed));

    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) {
            return std::unexpected("cannot open " + tmp.string());
        }
        f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        f.close();
        if (!f) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return std::unexpected("write to " + tmp.string() + " failed");
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected("rename to " + path.string() + " failed: " + ec.message());
    }
    return {};
}

} // namespace

StagingStore::StagingStore(fs::path root, std::chrono::seconds max_age, bool verbose)
    : root_(std::move(root)), max_age_(max_age), verbose_(verbose) {}

std::expected<StagedArtifact, ClipError> StagingStore::stage(std::span<const uint8_t> payload, MediaKind kind) {
    std::string hash = ContentHasher::digest(payload);
    std::string hash8 = hash.substr(0, 8);
    std::string name = std::format("clip-{}.{}", hash8, media_kind_extension(kind));
    fs::path path = root_ / name;

    if (auto hit = lookup(name)) {
        std::error_code ec;
        if (hit->content_hash != hash) {
            log("Short hash collision on " + name + ", restaging");
        } else if (fs::exists(hit->path, ec)) {
            log("Using cached file: " + hit->path.string());
            return *hit;
        } else {
            log("Cached file vanished, restaging: " + hit->path.string());
        }
    }

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return std::unexpected(ClipError{ClipErrorKind::StagingIo,
                                         "cannot create " + root_.string() + ": " + ec.message()});
    }

    auto written = write_atomically(path, payload);
    if (!written) {
        return std::unexpected(ClipError{ClipErrorKind::StagingIo, written.error()});
    }
    writes_.fetch_add(1, std::memory_order_relaxed);
    log(std::format("Staged file: {} ({} bytes)", path.string(), payload.size()));

    StagedArtifact artifact{
        .content_hash = std::move(hash),
        .path = std::move(path),
        .byte_size = payload.size(),
        .kind = kind,
        .created_at = std::chrono::system_clock::now(),
        .thumbnail_path = std::nullopt,
    };

    if (is_raster(kind)) {
        artifact.thumbnail_path = write_thumbnail(payload, hash8);
    }

    remember(name, artifact);
    return artifact;
}

std::expected<StagedArtifact, ClipError> StagingStore::stage_text(std::string_view text) {
    std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    return stage(bytes, MediaKind::Text);
}

std::optional<fs::path> StagingStore::write_thumbnail(std::span<const uint8_t> payload,
                                                     const std::string& hash8) {
    auto thumb = image_codec::make_thumbnail(payload, 256);
    if (!thumb) {
        std::println(stderr, "staging: failed to generate thumbnail for {}: {}", hash8, thumb.error());
        return std::nullopt;
    }

    fs::path thumb_path = root_ / (hash8 + ".thumb.png");
    auto written = write_atomically(thumb_path, *thumb);
    if (!written) {
        std::println(stderr, "staging: failed to save thumbnail: {}", written.error());
        return std::nullopt;
    }

    log("Generated thumbnail: " + thumb_path.string());
    return thumb_path;
}

EvictionStats StagingStore::evict_expired(std::chrono::system_clock::time_point now) {
    EvictionStats stats;

    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            std::println(stderr, "staging: failed to read {}: {}", root_.string(), ec.message());
            ++stats.failures;
        }
    } else {
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                std::println(stderr, "staging: directory scan aborted: {}", ec.message());
                ++stats.failures;
                break;
            }

            const auto& entry = *it;
            std::error_code fec;
            if (!entry.is_regular_file(fec)) continue;

            auto mtime = entry.last_write_time(fec);
            if (fec) {
                std::println(stderr, "staging: cannot stat {}: {}", entry.path().string(), fec.message());
                ++stats.failures;
                continue;
            }

            auto modified = std::chrono::file_clock::to_sys(mtime);
            if (now - modified <= max_age_) continue;

            fs::remove(entry.path(), fec);
            if (fec) {
                std::println(stderr, "staging: failed to remove {}: {}", entry.path().string(), fec.message());
                ++stats.failures;
            } else {
                ++stats.files_removed;
                log("Cleaned up old file: " + entry.path().string());
            }
        }
    }

    {
        std::lock_guard lock(index_mutex_);
        stats.index_pruned = std::erase_if(index_, [&](const auto& kv) {
            return now - kv.second.created_at > max_age_;
        });
    }

    return stats;
}

void StagingStore::run_eviction(std::stop_token st, std::chrono::seconds interval) {
    log(std::format("Eviction started (interval {}s, max age {}s)", interval.count(), max_age_.count()));

    while (!st.stop_requested()) {
        auto stats = evict_expired();
        if (stats.files_removed || stats.index_pruned || stats.failures) {
            log(std::format("Cleanup: {} files removed, {} index entries pruned, {} failures",
                            stats.files_removed, stats.index_pruned, stats.failures));
        }

        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_for(lock, st, interval, [] { return false; });
    }
}

size_t StagingStore::index_size() const {
    std::lock_guard lock(index_mutex_);
    return index_.size();
}

std::optional<StagedArtifact> StagingStore::lookup(const std::string& name) const {
    std::lock_guard lock(index_mutex_);
    auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

void StagingStore::remember(const std::string& name, const StagedArtifact& artifact) {
    std::lock_guard lock(index_mutex_);
    index_[name] = artifact;
}

void StagingStore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[clipstage] {}", msg);
    }
}
