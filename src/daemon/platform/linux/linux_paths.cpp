#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/clipstage";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/clipstage";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/clipstage";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/clipstage";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/clipstage.sock";
    return "/tmp/clipstage.sock";
}

std::string default_staging_dir() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "clipstage").string();
}

std::string default_alias_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home) + "/Desktop";
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "clipstage-aliases").string();
}

} // namespace platform
