#pragma once

#include "clip_error.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Stable names for staged artifacts in a user-visible directory:
//   <prefix>-<YYYYmmdd-HHMMSS>.<ext>   one per staged event, newest K kept
//   <prefix>.<ext>                     always the most recent one
class SymlinkRotator {
public:
    SymlinkRotator(std::filesystem::path alias_dir, std::string prefix, size_t keep, bool verbose = false);

    SymlinkRotator(const SymlinkRotator&) = delete;
    SymlinkRotator& operator=(const SymlinkRotator&) = delete;

    std::expected<std::filesystem::path, ClipError> create_alias(const std::filesystem::path& target,
                                                                 std::string_view ext);

    // Removes numbered aliases of `ext` beyond the newest `keep`. Returns the
    // number removed.
    size_t rotate(std::string_view ext);

    // Newest first.
    std::vector<std::filesystem::path> numbered_aliases(std::string_view ext) const;
    std::filesystem::path latest_alias(std::string_view ext) const;

    const std::filesystem::path& alias_dir() const { return alias_dir_; }
    const std::string& prefix() const { return prefix_; }
    size_t keep() const { return keep_; }

private:
    struct AliasEntry {
        std::filesystem::path path;
        int64_t mtime_ns;
        std::pair<std::string, int> order;
    };

    std::vector<AliasEntry> scan(std::string_view ext) const;
    bool is_numbered_name(const std::string& name, std::string_view ext) const;

    void log(const std::string& msg);

    std::filesystem::path alias_dir_;
    std::string prefix_;
    size_t keep_;
    bool verbose_;

    // Serializes create/rotate within this process; other processes may
    // still race on the directory.
    std::mutex mutex_;
};
