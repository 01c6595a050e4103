#include "clipboard/clipboard_watcher.hpp"

#include "clipboard/content_hasher.hpp"

#include <format>
#include <print>

ClipboardWatcher::ClipboardWatcher(ClipboardAccessor& accessor, EventChannel<ClipboardEvent>& channel,
                                   std::chrono::milliseconds interval, bool verbose)
    : accessor_(accessor), channel_(channel), interval_(interval), verbose_(verbose) {}

PollResult ClipboardWatcher::poll_once(std::stop_token st) {
    auto snapshot = accessor_.read();
    if (!snapshot) {
        log("No clipboard content: " + snapshot.error().message);
        return PollResult::Unavailable;
    }

    std::string fingerprint = ContentHasher::fingerprint(*snapshot);

    {
        std::lock_guard lock(state_mutex_);
        if (fingerprint == state_.last_fingerprint) {
            return PollResult::Unchanged;
        }
        state_.last_fingerprint = fingerprint;
        state_.last_seen_at = std::chrono::system_clock::now();
    }

    if (snapshot->is_text()) {
        log(std::format("New clipboard content: text ({} bytes)", snapshot->text().bytes.size()));
    } else {
        const auto& img = snapshot->image();
        log(std::format("New clipboard content: {} {}x{}", image_codec_extension(img.codec),
                        img.width, img.height));
    }

    // Blocks while the processor is 100 events behind
    if (!channel_.push(ClipboardEvent{std::move(*snapshot), std::move(fingerprint)}, st)) {
        return PollResult::Stopped;
    }
    return PollResult::Changed;
}

void ClipboardWatcher::run(std::stop_token st) {
    log(std::format("Clipboard watcher started (poll interval: {}ms)", interval_.count()));

    auto next_tick = std::chrono::steady_clock::now();
    while (!st.stop_requested()) {
        if (poll_once(st) == PollResult::Stopped) break;

        next_tick += interval_;
        auto now = std::chrono::steady_clock::now();
        if (next_tick <= now) {
            // Skip missed ticks, keeping the original phase
            auto behind = (now - next_tick) / interval_ + 1;
            next_tick += interval_ * behind;
        }

        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_until(lock, st, next_tick, [] { return false; });
    }

    log("Clipboard watcher stopped");
}

WatchState ClipboardWatcher::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

void ClipboardWatcher::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[clipstage] {}", msg);
    }
}
