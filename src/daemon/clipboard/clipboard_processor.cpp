#include "clipboard/clipboard_processor.hpp"

#include "image/image_codec.hpp"

#include <exception>
#include <format>
#include <print>

ClipboardProcessor::ClipboardProcessor(ProcessorOptions options, StagingStore& store,
                                       SymlinkRotator& rotator, ClipboardAccessor& accessor,
                                       const ClipboardWriteStrategy& strategy,
                                       Notifier* notifier, HistoryDb* history, bool verbose)
    : options_(options), store_(store), rotator_(rotator), accessor_(accessor),
      strategy_(strategy), notifier_(notifier), history_(history), verbose_(verbose) {}

ProcessOutcome ClipboardProcessor::process(const ClipboardEvent& event) {
    const auto& snapshot = event.snapshot;

    if (snapshot.is_image()) {
        return process_image(snapshot.image());
    }

    const auto& text = snapshot.text();
    if (text.bytes.size() > options_.inline_threshold) {
        return process_large_text(text);
    }

    log("Small text content, no processing needed");
    return {};
}

ProcessOutcome ClipboardProcessor::process_image(const RasterImage& image) {
    log(std::format("Processing image clipboard event ({}x{})", image.width, image.height));

    ProcessOutcome outcome;
    if (!image.resident()) {
        outcome.disposition = Disposition::Failed;
        outcome.error = "image payload not resident: " + image.reference;
        std::println(stderr, "processor: {}", outcome.error);
        return outcome;
    }

    std::vector<uint8_t> encoded;
    std::span<const uint8_t> payload = image.payload;
    if (image.codec == ImageCodec::Rgba) {
        auto png = image_codec::encode_png(image.payload, image.width, image.height);
        if (!png) {
            outcome.disposition = Disposition::Failed;
            outcome.error = png.error();
            std::println(stderr, "processor: failed to encode image: {}", outcome.error);
            return outcome;
        }
        encoded = std::move(*png);
        payload = encoded;
    }

    auto kind = image.codec == ImageCodec::Jpeg ? MediaKind::Jpeg : MediaKind::Png;
    auto staged = store_.stage(payload, kind);
    if (!staged) {
        outcome.disposition = Disposition::Failed;
        outcome.error = staged.error().message;
        std::println(stderr, "processor: failed to stage image: {}", outcome.error);
        return outcome;
    }

    outcome.disposition = Disposition::StagedImage;
    outcome.artifact = *staged;
    outcome.alias = make_alias(*staged);

    std::string clip_path = (outcome.alias ? *outcome.alias : staged->path).string();

    if (options_.dual_format) {
        auto res = strategy_.present(accessor_, clip_path, image);
        if (!res) {
            std::println(stderr, "processor: failed to update clipboard: {}", res.error().message);
        } else {
            log(std::format("Set clipboard ({}): {}", strategy_.name(), clip_path));
        }
    }

    if (outcome.alias) {
        rotator_.rotate(media_kind_extension(kind));
    }
    record(outcome, "staged-image");
    notify("Image ready", clip_path);

    log("Image processed: " + clip_path);
    return outcome;
}

ProcessOutcome ClipboardProcessor::process_large_text(const TextContent& text) {
    log(std::format("Processing large text clipboard event ({} bytes)", text.bytes.size()));

    ProcessOutcome outcome;
    auto staged = store_.stage_text(text.bytes);
    if (!staged) {
        outcome.disposition = Disposition::Failed;
        outcome.error = staged.error().message;
        std::println(stderr, "processor: failed to stage text: {}", outcome.error);
        return outcome;
    }

    outcome.disposition = Disposition::StagedText;
    outcome.artifact = *staged;
    outcome.alias = make_alias(*staged);

    std::string clip_path = (outcome.alias ? *outcome.alias : staged->path).string();

    auto res = accessor_.write_text(clip_path);
    if (!res) {
        std::println(stderr, "processor: failed to update clipboard: {}", res.error().message);
    }

    if (outcome.alias) {
        rotator_.rotate(media_kind_extension(MediaKind::Text));
    }
    record(outcome, "staged-text");
    notify("Large text staged", clip_path);

    log("Large text processed: " + clip_path);
    return outcome;
}

std::optional<std::filesystem::path> ClipboardProcessor::make_alias(const StagedArtifact& artifact) {
    auto alias = rotator_.create_alias(artifact.path, media_kind_extension(artifact.kind));
    if (!alias) {
        std::println(stderr, "processor: no alias for {}: {}", artifact.path.string(), alias.error().message);
        return std::nullopt;
    }
    return *alias;
}

void ClipboardProcessor::record(const ProcessOutcome& outcome, const char* action) {
    if (!history_ || !outcome.artifact) return;

    const auto& a = *outcome.artifact;
    HistoryEntry entry;
    entry.action = action;
    entry.kind = std::string(media_kind_extension(a.kind));
    entry.content_hash = a.content_hash;
    entry.byte_size = static_cast<int64_t>(a.byte_size);
    entry.staged_path = a.path.string();
    entry.alias_path = outcome.alias ? outcome.alias->string() : std::string();
    history_->insert(entry);
}

void ClipboardProcessor::notify(const std::string& title, const std::string& body) {
    if (!options_.notifications || !notifier_) return;

    auto res = notifier_->notify(title, body);
    if (!res) {
        log("Notification failed: " + res.error());
    }
}

void ClipboardProcessor::run(EventChannel<ClipboardEvent>& channel, std::stop_token st) {
    log("Clipboard processor started");

    while (auto event = channel.pop(st)) {
        try {
            process(*event);
        } catch (const std::exception& e) {
            std::println(stderr, "processor: event dropped: {}", e.what());
        }
    }

    log("Clipboard processor stopped");
}

void ClipboardProcessor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[clipstage] {}", msg);
    }
}
