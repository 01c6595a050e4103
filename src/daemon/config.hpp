#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Watch {
        bool enabled = true;
        uint32_t poll_interval_ms = 500;
        size_t channel_capacity = 100;
    } watch;

    struct Staging {
        std::string dir; // empty: <temp dir>/clipstage
        size_t inline_threshold = 64 * 1024;
        uint32_t cleanup_interval_s = 15 * 60;
        uint32_t max_age_s = 15 * 60;
    } staging;

    struct Aliases {
        std::string dir; // empty: ~/Desktop
        std::string prefix = "clip-paste";
        size_t keep = 5;
    } aliases;

    struct Clipboard {
        bool dual_format = true;
        bool notifications = true;
        uint32_t helper_timeout_ms = 2000;
    } clipboard;

    struct History {
        bool enabled = true;
    } history;

    std::string resolved_staging_dir() const;
    std::string resolved_alias_dir() const;

    static Config load(const std::string& path);
    static Config load_default();
};
