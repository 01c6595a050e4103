#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void kill_and_reap(pid_t pid) {
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
}

} // namespace

std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      std::string_view input,
                                                      bool capture_output,
                                                      std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::unexpected(std::string("empty command"));
    }

    // Built before fork(): the child may only call async-signal-safe functions
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }
    if (capture_output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_message("pipe()");
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        return std::unexpected(msg);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        // Child: stdin from pipe, stdout to pipe or /dev/null, stderr discarded
        int devnull = ::open("/dev/null", O_WRONLY);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(capture_output ? out_pipe[1] : devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    set_nonblocking(in_fd);
    if (out_fd >= 0) set_nonblocking(out_fd);
    if (input.empty()) close_fd(in_fd);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remaining_ms = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return left.count();
    };

    ProcessResult result;
    size_t written = 0;

    while (in_fd >= 0 || out_fd >= 0) {
        auto left = remaining_ms();
        if (left <= 0) {
            close_fd(in_fd);
            close_fd(out_fd);
            kill_and_reap(pid);
            return std::unexpected(argv[0] + " timed out");
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        int in_idx = -1;
        int out_idx = -1;
        if (in_fd >= 0) {
            in_idx = static_cast<int>(nfds);
            fds[nfds++] = pollfd{.fd = in_fd, .events = POLLOUT, .revents = 0};
        }
        if (out_fd >= 0) {
            out_idx = static_cast<int>(nfds);
            fds[nfds++] = pollfd{.fd = out_fd, .events = POLLIN, .revents = 0};
        }

        int rc = ::poll(fds, nfds, static_cast<int>(left));
        if (rc < 0) {
            if (errno == EINTR) continue;
            auto msg = errno_message("poll()");
            close_fd(in_fd);
            close_fd(out_fd);
            kill_and_reap(pid);
            return std::unexpected(msg);
        }
        if (rc == 0) continue;

        if (in_idx >= 0 && fds[in_idx].revents != 0) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                close_fd(in_fd); // child stopped reading
            } else {
                ssize_t n = ::write(in_fd, input.data() + written, input.size() - written);
                if (n < 0) {
                    if (errno != EAGAIN && errno != EINTR) close_fd(in_fd);
                } else {
                    written += static_cast<size_t>(n);
                    if (written == input.size()) close_fd(in_fd);
                }
            }
        }

        if (out_idx >= 0 && fds[out_idx].revents != 0) {
            char buf[65536];
            ssize_t n = ::read(out_fd, buf, sizeof(buf));
            if (n > 0) {
                result.output.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                close_fd(out_fd);
            }
        }
    }

    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("waitpid()"));
        }
        if (remaining_ms() <= 0) {
            kill_and_reap(pid);
            return std::unexpected(argv[0] + " timed out");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (WIFSIGNALED(status)) {
        return std::unexpected(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (result.exit_code == 127) {
        return std::unexpected(argv[0] + " not found");
    }
    return result;
}
