#pragma once

#include "clipboard/clipboard_accessor.hpp"
#include "clipboard/snapshot.hpp"
#include "event_channel.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string>

struct ClipboardEvent {
    ClipboardSnapshot snapshot;
    std::string fingerprint;
};

struct WatchState {
    std::string last_fingerprint;
    std::chrono::system_clock::time_point last_seen_at;
};

enum class PollResult { Unavailable, Unchanged, Changed, Stopped };

// Polls the clipboard on a fixed interval and emits an event whenever the
// fingerprint differs from the previous successful read. Ticks missed while
// a poll or a full channel blocked are skipped, not replayed.
class ClipboardWatcher {
public:
    ClipboardWatcher(ClipboardAccessor& accessor, EventChannel<ClipboardEvent>& channel,
                     std::chrono::milliseconds interval, bool verbose = false);

    ClipboardWatcher(const ClipboardWatcher&) = delete;
    ClipboardWatcher& operator=(const ClipboardWatcher&) = delete;

    // One tick. Stopped means the event could not be queued before `st`
    // fired or the channel closed.
    PollResult poll_once(std::stop_token st = {});

    void run(std::stop_token st);

    WatchState state() const;
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void log(const std::string& msg);

    ClipboardAccessor& accessor_;
    EventChannel<ClipboardEvent>& channel_;
    std::chrono::milliseconds interval_;
    bool verbose_;

    mutable std::mutex state_mutex_;
    WatchState state_;

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
};
