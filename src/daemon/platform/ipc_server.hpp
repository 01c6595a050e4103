#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class ReadStatus {
    Ready,      // `cmd` holds the next command
    Pending,    // no complete line buffered yet
    Malformed,  // a line was consumed but is not JSON
    Closed,     // peer hung up, errored, or overflowed the buffer
};

// Control socket carrying one JSON object per line in each direction.
class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    // Returns buffered lines before reading more; call until Pending or Closed.
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
