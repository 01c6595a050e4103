#include "platform/linux/notify_send.hpp"

#include "platform/linux/subprocess.hpp"

NotifySend::NotifySend(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

std::expected<void, std::string> NotifySend::notify(const std::string& title, const std::string& body) {
    auto res = run_process({"notify-send", "clipstage", title + "\n" + body}, {}, false, timeout_);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("notify-send exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
