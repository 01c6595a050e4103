#include "daemon_core.hpp"

#include "image/image_codec.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <fstream>
#include <iterator>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json error_response(const ClipError& err) {
    return {{"status", "error"}, {"kind", clip_error_name(err.kind)}, {"message", err.message}};
}

std::expected<std::vector<uint8_t>, ClipError> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(ClipError{ClipErrorKind::InvalidInput, "cannot open " + path});
    }
    std::vector<uint8_t> data{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    if (f.bad()) {
        return std::unexpected(ClipError{ClipErrorKind::InvalidInput, "cannot read " + path});
    }
    return data;
}

// Longest prefix of `text` within `limit` bytes that does not split a
// UTF-8 sequence.
std::string_view utf8_prefix(std::string_view text, size_t limit) {
    if (text.size() <= limit) return text;
    size_t end = limit;
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) --end;
    return text.substr(0, end);
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(tp));
}

json artifact_json(const StagedArtifact& a) {
    json j = {
        {"hash", a.content_hash},
        {"path", a.path.string()},
        {"size", a.byte_size},
        {"kind", std::string(media_kind_extension(a.kind))},
        {"created_at", iso_timestamp(a.created_at)},
    };
    if (a.thumbnail_path) j["thumbnail"] = a.thumbnail_path->string();
    return j;
}

const char* task_state(const BackgroundTask& task) {
    if (task.running()) return "running";
    if (task.started()) return "exited";
    return "stopped";
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, ClipboardBackend& backend, Notifier* notifier)
    : config_(std::move(config)), verbose_(verbose),
      accessor_(backend),
      store_(config_.resolved_staging_dir(), std::chrono::seconds(config_.staging.max_age_s), verbose_),
      rotator_(config_.resolved_alias_dir(), config_.aliases.prefix, config_.aliases.keep, verbose_),
      strategy_(select_write_strategy(accessor_)),
      channel_(config_.watch.channel_capacity),
      watcher_(accessor_, channel_, std::chrono::milliseconds(config_.watch.poll_interval_ms), verbose_),
      processor_(ProcessorOptions{
                     .inline_threshold = config_.staging.inline_threshold,
                     .dual_format = config_.clipboard.dual_format,
                     .notifications = config_.clipboard.notifications,
                 },
                 store_, rotator_, accessor_, *strategy_, notifier,
                 config_.history.enabled ? &history_db_ : nullptr, verbose_),
      watcher_task_("watcher", [this](std::stop_token st) { watcher_.run(st); }),
      processor_task_("processor", [this](std::stop_token st) { processor_.run(channel_, st); }),
      eviction_task_("eviction", [this](std::stop_token st) {
          store_.run_eviction(st, std::chrono::seconds(config_.staging.cleanup_interval_s));
      }) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init(const std::string& db_path) {
    if (config_.history.enabled) {
        std::string path = db_path;
        if (path.empty()) {
            auto data = platform::data_dir();
            path = data.empty() ? "/tmp/clipstage/history.db" : data + "/history.db";
        }
        std::error_code ec;
        fs::create_directories(fs::path(path).parent_path(), ec);
        if (!history_db_.open(path)) {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
        }
    }

    log(std::format("Staging root: {}", store_.root().string()));
    log(std::format("Alias directory: {}", rotator_.alias_dir().string()));
    log(std::format("Clipboard write strategy: {}", strategy_->name()));
    return true;
}

void DaemonCore::start_background(bool watch) {
    eviction_task_.start();

    if (!watch) {
        log("Clipboard watching disabled");
        return;
    }

    channel_.reset();
    processor_task_.start();
    watcher_task_.start();
    log(std::format("Watching clipboard every {}ms", config_.watch.poll_interval_ms));
}

json DaemonCore::handle_request(const json& cmd) {
    auto it = cmd.find("cmd");
    if (!cmd.is_object() || it == cmd.end() || !it->is_string()) {
        return {{"status", "error"}, {"message", "malformed request"}};
    }
    const auto& cmd_str = it->get_ref<const std::string&>();
    log("Command: " + cmd_str);
    return handle_command(cmd_str, cmd);
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    try {
        if (cmd_str == "get") return handle_get(cmd);
        if (cmd_str == "paste") return handle_paste(cmd);
        if (cmd_str == "set") return handle_set(cmd);
        if (cmd_str == "stage") return handle_stage(cmd);
        if (cmd_str == "root") return handle_root(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "history") return handle_history(cmd);
    } catch (const json::exception& e) {
        return {{"status", "error"}, {"message", std::format("invalid request: {}", e.what())}};
    }
    return {{"status", "error"}, {"message", "unknown command"}};
}

std::expected<ClipboardSnapshot, ClipError> DaemonCore::get_snapshot() {
    return accessor_.read();
}

std::expected<void, ClipError> DaemonCore::set_snapshot(const ClipboardContent& content) {
    return accessor_.write(content);
}

std::expected<StagedArtifact, ClipError> DaemonCore::stage(std::span<const uint8_t> payload,
                                                           MediaKind kind) {
    return store_.stage(payload, kind);
}

std::expected<fs::path, ClipError> DaemonCore::staged_image_path(const RasterImage& image) {
    if (!image.resident()) return fs::path(image.reference);

    if (image.codec == ImageCodec::Rgba) {
        auto png = image_codec::encode_png(image.payload, image.width, image.height);
        if (!png) return std::unexpected(ClipError{ClipErrorKind::InvalidInput, png.error()});
        auto staged = store_.stage(*png, MediaKind::Png);
        if (!staged) return std::unexpected(staged.error());
        return staged->path;
    }

    auto kind = image.codec == ImageCodec::Jpeg ? MediaKind::Jpeg : MediaKind::Png;
    auto staged = store_.stage(image.payload, kind);
    if (!staged) return std::unexpected(staged.error());
    return staged->path;
}

json DaemonCore::handle_get(const json& /*cmd*/) {
    auto snapshot = get_snapshot();
    if (!snapshot) {
        if (snapshot.error().kind == ClipErrorKind::Unavailable) {
            return {{"status", "error"}, {"message", "no content"}};
        }
        return error_response(snapshot.error());
    }

    json resp = {{"status", "ok"}};
    json metadata = {{"captured_at", iso_timestamp(snapshot->metadata.captured_at)}};
    if (snapshot->metadata.source) metadata["source"] = *snapshot->metadata.source;
    resp["metadata"] = metadata;

    if (snapshot->is_text()) {
        const auto& text = snapshot->text().bytes;
        resp["type"] = "text/plain";
        resp["size"] = text.size();

        if (text.size() > config_.staging.inline_threshold) {
            resp["data"] = std::string(utf8_prefix(text, config_.staging.inline_threshold));
            resp["truncated"] = true;

            auto staged = store_.stage_text(text);
            if (staged) {
                resp["file"] = staged->path.string();
            } else {
                std::println(stderr, "staging: failed to stage text for get: {}", staged.error().message);
            }
        } else {
            resp["data"] = text;
        }
        return resp;
    }

    const auto& image = snapshot->image();
    auto path = staged_image_path(image);
    if (!path) return error_response(path.error());

    resp["type"] = std::string(image_codec_mime(image.codec));
    resp["width"] = image.width;
    resp["height"] = image.height;
    resp["size"] = image.byte_size;
    resp["file"] = path->string();
    return resp;
}

json DaemonCore::handle_paste(const json& /*cmd*/) {
    auto snapshot = get_snapshot();
    if (!snapshot) {
        if (snapshot.error().kind == ClipErrorKind::Unavailable) {
            return {{"status", "error"}, {"message", "no content"}};
        }
        return error_response(snapshot.error());
    }

    if (snapshot->is_text()) {
        return {{"status", "ok"}, {"text", snapshot->text().bytes}};
    }

    auto path = staged_image_path(snapshot->image());
    if (!path) return error_response(path.error());
    return {{"status", "ok"}, {"path", path->string()}};
}

json DaemonCore::handle_set(const json& cmd) {
    if (cmd.contains("text")) {
        auto res = set_snapshot(TextContent{.bytes = cmd["text"].get<std::string>()});
        if (!res) return error_response(res.error());
        log("Clipboard set from text");
        return {{"status", "ok"}};
    }

    if (!cmd.contains("file")) {
        return error_response({ClipErrorKind::InvalidInput, "set needs \"text\" or \"file\""});
    }

    auto path = cmd["file"].get<std::string>();
    auto data = read_file(path);
    if (!data) return error_response(data.error());

    auto info = image_codec::probe(*data);
    if (!info) {
        return error_response({ClipErrorKind::Unsupported,
                               std::format("{} is not a PNG or JPEG image: {}", path, info.error())});
    }

    RasterImage image;
    image.width = info->width;
    image.height = info->height;
    image.codec = info->codec;
    image.byte_size = data->size();
    image.payload = std::move(*data);

    auto res = set_snapshot(std::move(image));
    if (!res) return error_response(res.error());
    log("Clipboard set from " + path);
    return {{"status", "ok"}};
}

json DaemonCore::handle_stage(const json& cmd) {
    std::expected<StagedArtifact, ClipError> staged;

    if (cmd.contains("text")) {
        staged = store_.stage_text(cmd["text"].get<std::string>());
    } else if (cmd.contains("file")) {
        auto path = cmd["file"].get<std::string>();
        auto kind_name = cmd.value("kind", fs::path(path).extension().string());
        auto kind = media_kind_from_extension(kind_name);
        if (!kind) {
            return error_response({ClipErrorKind::Unsupported,
                                   std::format("unsupported kind \"{}\"", kind_name)});
        }

        auto data = read_file(path);
        if (!data) return error_response(data.error());
        staged = stage(*data, *kind);
    } else {
        return error_response({ClipErrorKind::InvalidInput, "stage needs \"text\" or \"file\""});
    }

    if (!staged) return error_response(staged.error());

    json resp = {{"status", "ok"}};
    resp["artifact"] = artifact_json(*staged);
    return resp;
}

json DaemonCore::handle_root(const json& /*cmd*/) {
    return {{"status", "ok"}, {"path", staging_root().string()}};
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    return {
        {"status", "ok"},
        {"watching", watching()},
        {"tasks", {
            {"watcher", task_state(watcher_task_)},
            {"processor", task_state(processor_task_)},
            {"eviction", task_state(eviction_task_)},
        }},
        {"strategy", std::string(strategy_->name())},
        {"staging_root", store_.root().string()},
        {"index_size", store_.index_size()},
        {"alias_dir", rotator_.alias_dir().string()},
        {"history", history_db_.is_open()},
    };
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = std::clamp(cmd.value("limit", 10), 1, 1000);
    auto entries = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"action", e.action},
            {"kind", e.kind},
            {"hash", e.content_hash},
            {"size", e.byte_size},
            {"staged_path", e.staged_path},
            {"alias_path", e.alias_path},
        });
    }
    return resp;
}

void DaemonCore::shutdown() {
    watcher_task_.stop();
    channel_.close();
    processor_task_.stop();
    eviction_task_.stop();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[clipstage] {}", msg);
    }
}
