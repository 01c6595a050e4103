#pragma once

#include "background_task.hpp"
#include "clip_error.hpp"
#include "clipboard/clipboard_accessor.hpp"
#include "clipboard/clipboard_processor.hpp"
#include "clipboard/clipboard_watcher.hpp"
#include "clipboard/snapshot.hpp"
#include "clipboard/write_strategy.hpp"
#include "config.hpp"
#include "event_channel.hpp"
#include "platform/clipboard_backend.hpp"
#include "platform/notifier.hpp"
#include "storage/history_db.hpp"
#include "storage/staging_store.hpp"
#include "storage/symlink_rotator.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <span>
#include <string>

class DaemonCore {
public:
    // `notifier` may be null.
    DaemonCore(Config config, bool verbose, ClipboardBackend& backend, Notifier* notifier);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the history database; `db_path` empty means the platform default.
    bool init(const std::string& db_path = {});

    // Starts staging cleanup, plus the watcher and processor when `watch`.
    void start_background(bool watch);

    // Entry point for a parsed control-socket request; a missing or
    // non-string "cmd" is answered with "malformed request".
    nlohmann::json handle_request(const nlohmann::json& cmd);
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    std::expected<ClipboardSnapshot, ClipError> get_snapshot();
    std::expected<void, ClipError> set_snapshot(const ClipboardContent& content);
    std::expected<StagedArtifact, ClipError> stage(std::span<const uint8_t> payload, MediaKind kind);
    const std::filesystem::path& staging_root() const { return store_.root(); }

    bool watching() const { return watcher_task_.running() && processor_task_.running(); }
    std::string_view strategy_name() const { return strategy_->name(); }

    void shutdown();

private:
    nlohmann::json handle_get(const nlohmann::json& cmd);
    nlohmann::json handle_paste(const nlohmann::json& cmd);
    nlohmann::json handle_set(const nlohmann::json& cmd);
    nlohmann::json handle_stage(const nlohmann::json& cmd);
    nlohmann::json handle_root(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);

    // Staged copy of an image snapshot; images with a file reference are
    // returned as is.
    std::expected<std::filesystem::path, ClipError> staged_image_path(const RasterImage& image);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    ClipboardAccessor accessor_;
    StagingStore store_;
    SymlinkRotator rotator_;
    std::unique_ptr<ClipboardWriteStrategy> strategy_;
    HistoryDb history_db_;

    EventChannel<ClipboardEvent> channel_;
    ClipboardWatcher watcher_;
    ClipboardProcessor processor_;

    BackgroundTask watcher_task_;
    BackgroundTask processor_task_;
    BackgroundTask eviction_task_;
};
