#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& socket_path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long");
        return false;
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    // Remove stale socket
    ::unlink(socket_path.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    // Socket is owner-only.
    mode_t old_mask = ::umask(077);
    int rc = ::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::umask(old_mask);
    if (rc < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    socket_path_ = socket_path;

    if (::listen(server_fd_, 8) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

std::optional<std::string> UnixSocketServer::take_line(ClientBuffer& client) {
    auto pos = client.buf.find('\n');
    if (pos == std::string::npos) return std::nullopt;

    std::string line = client.buf.substr(0, pos);
    client.buf.erase(0, pos + 1);
    return line;
}

ReadStatus UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return ReadStatus::Closed;

    auto line = take_line(*client);
    while (!line) {
        char buf[4096];
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n == 0) return ReadStatus::Closed;
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return ReadStatus::Pending;
            if (errno == EINTR) continue;
            return ReadStatus::Closed;
        }

        client->buf.append(buf, static_cast<size_t>(n));
        line = take_line(*client);
        if (!line && client->buf.size() > MAX_LINE_BYTES) {
            std::println(stderr, "ipc: request exceeds {} bytes, dropping client", MAX_LINE_BYTES);
            return ReadStatus::Closed;
        }
    }

    try {
        cmd = nlohmann::json::parse(*line);
    } catch (const nlohmann::json::exception&) {
        return ReadStatus::Malformed;
    }
    if (!cmd.is_object()) return ReadStatus::Malformed;
    return ReadStatus::Ready;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    // Clipboard text is not guaranteed to be valid UTF-8.
    std::string msg = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";

    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent > 0) {
            off += static_cast<size_t>(sent);
            continue;
        }
        if (sent < 0 && errno == EINTR) continue;
        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
            if (::poll(&pfd, 1, 1000) > 0) continue;
        }
        std::println(stderr, "ipc: failed to send response to fd {}", client_fd);
        return false;
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
