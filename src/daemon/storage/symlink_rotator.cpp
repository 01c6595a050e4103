#include "storage/symlink_rotator.hpp"

#include <algorithm>
#include <charconv>
#include <ctime>
#include <format>
#include <print>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

std::string local_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
    return buf;
}

// Orders "<stamp>" < "<stamp>-1" < ... < "<stamp>-10" for names created
// within the same second.
std::pair<std::string, int> name_order(const std::string& stem) {
    constexpr size_t kStampLen = 15; // YYYYmmdd-HHMMSS
    if (stem.size() <= kStampLen + 1) return {stem, 0};
    int seq = 0;
    const char* first = stem.data() + kStampLen + 1;
    std::from_chars(first, stem.data() + stem.size(), seq);
    return {stem.substr(0, kStampLen), seq};
}

} // namespace

SymlinkRotator::SymlinkRotator(fs::path alias_dir, std::string prefix, size_t keep, bool verbose)
    : alias_dir_(std::move(alias_dir)), prefix_(std::move(prefix)), keep_(keep), verbose_(verbose) {}

std::expected<fs::path, ClipError> SymlinkRotator::create_alias(const fs::path& target, std::string_view ext) {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    fs::create_directories(alias_dir_, ec);
    if (ec) {
        return std::unexpected(ClipError{ClipErrorKind::Alias,
                                         "cannot create " + alias_dir_.string() + ": " + ec.message()});
    }

    // Several events within one second get a sequence suffix
    std::string stamp = local_timestamp();
    fs::path alias = alias_dir_ / std::format("{}-{}.{}", prefix_, stamp, ext);
    for (int seq = 1; seq < 1000 && fs::symlink_status(alias, ec).type() != fs::file_type::not_found; ++seq) {
        alias = alias_dir_ / std::format("{}-{}-{}.{}", prefix_, stamp, seq, ext);
    }

    fs::create_symlink(target, alias, ec);
    if (ec) {
        return std::unexpected(ClipError{ClipErrorKind::Alias,
                                         "symlink " + alias.string() + " failed: " + ec.message()});
    }

    fs::path latest = latest_alias(ext);
    fs::remove(latest, ec);
    fs::create_symlink(target, latest, ec);
    if (ec) {
        // The numbered alias exists; only the convenience link is stale
        std::println(stderr, "alias: failed to update {}: {}", latest.string(), ec.message());
    }

    log("Alias created: " + alias.string() + " -> " + target.string());
    return alias;
}

size_t SymlinkRotator::rotate(std::string_view ext) {
    std::lock_guard lock(mutex_);

    auto entries = scan(ext);
    if (entries.size() <= keep_) return 0;

    size_t removed = 0;
    for (size_t i = keep_; i < entries.size(); ++i) {
        std::error_code ec;
        fs::remove(entries[i].path, ec);
        if (ec) {
            std::println(stderr, "alias: failed to remove old symlink {}: {}",
                         entries[i].path.string(), ec.message());
            continue;
        }
        ++removed;
        log("Removed old symlink: " + entries[i].path.string());
    }
    return removed;
}

std::vector<fs::path> SymlinkRotator::numbered_aliases(std::string_view ext) const {
    std::vector<fs::path> out;
    for (auto& e : scan(ext)) out.push_back(std::move(e.path));
    return out;
}

fs::path SymlinkRotator::latest_alias(std::string_view ext) const {
    return alias_dir_ / std::format("{}.{}", prefix_, ext);
}

bool SymlinkRotator::is_numbered_name(const std::string& name, std::string_view ext) const {
    std::string head = prefix_ + "-";
    std::string tail = std::format(".{}", ext);
    return name.size() > head.size() + tail.size() &&
           name.starts_with(head) && name.ends_with(tail);
}

std::vector<SymlinkRotator::AliasEntry> SymlinkRotator::scan(std::string_view ext) const {
    std::vector<AliasEntry> entries;

    std::error_code ec;
    fs::directory_iterator it(alias_dir_, ec);
    if (ec) return entries;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;

        const auto& entry = *it;
        std::error_code fec;
        if (!entry.is_symlink(fec)) continue;
        if (!is_numbered_name(entry.path().filename().string(), ext)) continue;

        // The link's own mtime; std::filesystem would follow it
        struct stat st{};
        if (::lstat(entry.path().c_str(), &st) != 0) continue;
        int64_t ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1'000'000'000 + st.st_mtim.tv_nsec;

        std::string stem = entry.path().stem().string().substr(prefix_.size() + 1);
        entries.push_back({entry.path(), ns, name_order(stem)});
    }

    std::ranges::sort(entries, [](const AliasEntry& a, const AliasEntry& b) {
        if (a.mtime_ns != b.mtime_ns) return a.mtime_ns > b.mtime_ns;
        return a.order > b.order;
    });
    return entries;
}

void SymlinkRotator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[clipstage] {}", msg);
    }
}
