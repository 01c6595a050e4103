#pragma once

#include "platform/ipc_server.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    // Requests carry whole clipboard texts, so a line may be large.
    static constexpr size_t MAX_LINE_BYTES = 64 * 1024 * 1024;

    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadStatus read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    struct ClientBuffer {
        int fd;
        std::string buf;
    };

    ClientBuffer* find_client(int fd);
    static std::optional<std::string> take_line(ClientBuffer& client);

    int server_fd_ = -1;
    std::string socket_path_;
    std::vector<ClientBuffer> clients_;
};
