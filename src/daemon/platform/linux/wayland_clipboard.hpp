#pragma once

#include "platform/clipboard_backend.hpp"

#include <chrono>

// Clipboard access through the wl-clipboard helpers (wl-paste, wl-copy).
// wl-copy serves a single MIME type per invocation, so multi-type offers are
// not supported.
class WaylandClipboard : public ClipboardBackend {
public:
    explicit WaylandClipboard(std::chrono::milliseconds helper_timeout = std::chrono::milliseconds(2000));

    std::expected<std::vector<std::string>, std::string> offered_types() override;
    std::expected<std::string, std::string> read(const std::string& mime_type) override;
    std::expected<void, std::string> write(const std::string& mime_type, std::string_view data) override;

private:
    static bool display_available();

    std::chrono::milliseconds helper_timeout_;
};
