#pragma once

#include "platform/notifier.hpp"

#include <chrono>

class NotifySend : public Notifier {
public:
    explicit NotifySend(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    std::expected<void, std::string> notify(const std::string& title, const std::string& body) override;

private:
    std::chrono::milliseconds timeout_;
};
