#pragma once

#include "clipboard/clipboard_accessor.hpp"
#include "clipboard/clipboard_watcher.hpp"
#include "clipboard/write_strategy.hpp"
#include "event_channel.hpp"
#include "platform/notifier.hpp"
#include "storage/history_db.hpp"
#include "storage/staging_store.hpp"
#include "storage/symlink_rotator.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

struct ProcessorOptions {
    size_t inline_threshold = 64 * 1024;
    bool dual_format = true;
    bool notifications = true;
};

enum class Disposition { Passthrough, StagedText, StagedImage, Failed };

struct ProcessOutcome {
    Disposition disposition = Disposition::Passthrough;
    std::optional<StagedArtifact> artifact;
    std::optional<std::filesystem::path> alias;
    std::string error;
};

// Turns change events into staged files. Events are handled one at a time in
// arrival order; a failure only affects its own event.
class ClipboardProcessor {
public:
    // `notifier` and `history` may be null.
    ClipboardProcessor(ProcessorOptions options, StagingStore& store, SymlinkRotator& rotator,
                       ClipboardAccessor& accessor, const ClipboardWriteStrategy& strategy,
                       Notifier* notifier, HistoryDb* history, bool verbose = false);

    ClipboardProcessor(const ClipboardProcessor&) = delete;
    ClipboardProcessor& operator=(const ClipboardProcessor&) = delete;

    ProcessOutcome process(const ClipboardEvent& event);

    // Consumes `channel` until it is closed or `st` fires.
    void run(EventChannel<ClipboardEvent>& channel, std::stop_token st);

private:
    ProcessOutcome process_image(const RasterImage& image);
    ProcessOutcome process_large_text(const TextContent& text);

    // Alias for `artifact`, or nullopt after logging the failure.
    std::optional<std::filesystem::path> make_alias(const StagedArtifact& artifact);
    void record(const ProcessOutcome& outcome, const char* action);
    void notify(const std::string& title, const std::string& body);

    void log(const std::string& msg);

    ProcessorOptions options_;
    StagingStore& store_;
    SymlinkRotator& rotator_;
    ClipboardAccessor& accessor_;
    const ClipboardWriteStrategy& strategy_;
    Notifier* notifier_;
    HistoryDb* history_;
    bool verbose_;
};
