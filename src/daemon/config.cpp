#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

} // namespace

std::string Config::resolved_staging_dir() const {
    return staging.dir.empty() ? platform::default_staging_dir() : staging.dir;
}

std::string Config::resolved_alias_dir() const {
    return aliases.dir.empty() ? platform::default_alias_dir() : aliases.dir;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("watch")) {
            auto& w = j["watch"];
            read_key(w, "enabled", cfg.watch.enabled);
            read_key(w, "poll_interval_ms", cfg.watch.poll_interval_ms);
            read_key(w, "channel_capacity", cfg.watch.channel_capacity);
        }

        if (j.contains("staging")) {
            auto& s = j["staging"];
            read_key(s, "dir", cfg.staging.dir);
            read_key(s, "inline_threshold", cfg.staging.inline_threshold);
            read_key(s, "cleanup_interval_s", cfg.staging.cleanup_interval_s);
            read_key(s, "max_age_s", cfg.staging.max_age_s);
        }

        if (j.contains("aliases")) {
            auto& a = j["aliases"];
            read_key(a, "dir", cfg.aliases.dir);
            read_key(a, "prefix", cfg.aliases.prefix);
            read_key(a, "keep", cfg.aliases.keep);
        }

        if (j.contains("clipboard")) {
            auto& c = j["clipboard"];
            read_key(c, "dual_format", cfg.clipboard.dual_format);
            read_key(c, "notifications", cfg.clipboard.notifications);
            read_key(c, "helper_timeout_ms", cfg.clipboard.helper_timeout_ms);
        }

        if (j.contains("history")) {
            read_key(j["history"], "enabled", cfg.history.enabled);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}, using defaults", e.what());
        return Config{};
    }

    if (cfg.watch.poll_interval_ms == 0) {
        std::println(stderr, "config: watch.poll_interval_ms must be positive, using 500");
        cfg.watch.poll_interval_ms = 500;
    }
    if (cfg.aliases.prefix.empty()) {
        std::println(stderr, "config: aliases.prefix must not be empty, using clip-paste");
        cfg.aliases.prefix = "clip-paste";
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
