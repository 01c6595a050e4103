#include "platform/linux/wayland_clipboard.hpp"

#include "platform/linux/subprocess.hpp"

#include <cstdlib>
#include <sstream>

WaylandClipboard::WaylandClipboard(std::chrono::milliseconds helper_timeout)
    : helper_timeout_(helper_timeout) {}

bool WaylandClipboard::display_available() {
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    return wayland && wayland[0] != '\0';
}

std::expected<std::vector<std::string>, std::string> WaylandClipboard::offered_types() {
    if (!display_available()) {
        return std::unexpected(std::string("WAYLAND_DISPLAY not set"));
    }

    auto res = run_process({"wl-paste", "--list-types"}, {}, true, helper_timeout_);
    if (!res) return std::unexpected(res.error());

    // wl-paste exits non-zero when there is no selection
    std::vector<std::string> types;
    if (res->exit_code != 0) return types;

    std::istringstream lines(res->output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) types.push_back(line);
    }
    return types;
}

std::expected<std::string, std::string> WaylandClipboard::read(const std::string& mime_type) {
    if (!display_available()) {
        return std::unexpected(std::string("WAYLAND_DISPLAY not set"));
    }

    auto res = run_process({"wl-paste", "--no-newline", "--type", mime_type}, {}, true, helper_timeout_);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("wl-paste exited with code " + std::to_string(res->exit_code));
    }
    return std::move(res->output);
}

std::expected<void, std::string> WaylandClipboard::write(const std::string& mime_type, std::string_view data) {
    if (!display_available()) {
        return std::unexpected(std::string("WAYLAND_DISPLAY not set"));
    }

    auto res = run_process({"wl-copy", "--type", mime_type}, data, false, helper_timeout_);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("wl-copy exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
