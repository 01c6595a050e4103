#pragma once

#include "platform/ipc_client.hpp"

// Connects to clipstaged's AF_UNIX stream socket. Paths longer than
// sockaddr_un allows are refused rather than truncated.
class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override { close(); }

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& socket_path) override;
    bool connected() const override { return fd_ >= 0; }
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& response, int timeout_ms = DEFAULT_TIMEOUT_MS) override;
    void close() override;

private:
    int fd_ = -1;
    // Bytes after the first newline, kept for the next recv.
    std::string pending_;
};
