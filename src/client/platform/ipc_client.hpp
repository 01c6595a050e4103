#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Client side of clipstaged's control socket. Requests and responses are
// single JSON objects, each terminated by a newline.
class IpcClient {
public:
    // Large `set` and `stage` payloads are staged before the reply.
    static constexpr int DEFAULT_TIMEOUT_MS = 30000;

    virtual ~IpcClient() = default;

    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool connected() const = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // False on timeout, disconnect, or a reply line that is not JSON.
    virtual bool recv(nlohmann::json& response, int timeout_ms = DEFAULT_TIMEOUT_MS) = 0;
    virtual void close() = 0;

    // One round trip. The error names the step that failed.
    std::expected<nlohmann::json, std::string> request(const nlohmann::json& cmd,
                                                       int timeout_ms = DEFAULT_TIMEOUT_MS) {
        if (!connected()) return std::unexpected("not connected");
        if (!send(cmd)) return std::unexpected("failed to send command");
        nlohmann::json response;
        if (!recv(response, timeout_ms)) return std::unexpected("no response from daemon (timeout)");
        return response;
    }
};
