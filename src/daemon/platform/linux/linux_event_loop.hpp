#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/notify_send.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/wayland_clipboard.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, bool verbose = false, bool watch = true);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    bool watch_;

    // Platform implementations (constructed before core_)
    WaylandClipboard clipboard_;
    NotifySend notifier_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
