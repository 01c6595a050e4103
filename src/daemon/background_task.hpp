#pragma once

#include <atomic>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

// A long-running loop on its own thread. The body receives a stop token and
// must return once it fires. Can be stopped and started again.
class BackgroundTask {
public:
    using Body = std::function<void(std::stop_token)>;

    BackgroundTask(std::string name, Body body)
        : name_(std::move(name)), body_(std::move(body)) {}

    ~BackgroundTask() { stop(); }

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    bool start() {
        if (thread_.joinable()) return false;
        running_.store(true, std::memory_order_release);
        thread_ = std::jthread([this](std::stop_token st) {
            body_(st);
            running_.store(false, std::memory_order_release);
        });
        return true;
    }

    void stop() {
        if (!thread_.joinable()) return;
        thread_.request_stop();
        thread_.join();
    }

    void restart() {
        stop();
        start();
    }

    // False once the body has returned, even if stop() was not called.
    bool running() const { return running_.load(std::memory_order_acquire); }
    bool started() const { return thread_.joinable(); }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    Body body_;
    std::atomic<bool> running_{false};
    std::jthread thread_;
};
