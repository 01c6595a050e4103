#pragma once

#include "image/image_codec.hpp"
#include "platform/clipboard_backend.hpp"
#include "platform/notifier.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// In-memory clipboard. Writes replace the offered types the way a real
// clipboard owner change would.
class MockClipboardBackend : public ClipboardBackend {
public:
    struct Write {
        std::vector<ClipboardOffer> offers;
    };

    explicit MockClipboardBackend(bool multi_type = false) : multi_type_(multi_type) {}

    void set_text(const std::string& text) {
        std::lock_guard lock(mutex_);
        data_.clear();
        types_ = {"text/plain;charset=utf-8", "text/plain"};
        data_["text/plain;charset=utf-8"] = text;
        data_["text/plain"] = text;
    }

    void set_image(const std::string& mime, const std::string& bytes) {
        std::lock_guard lock(mutex_);
        data_.clear();
        types_ = {mime};
        data_[mime] = bytes;
    }

    void set_offer(std::vector<std::string> types, std::map<std::string, std::string> data) {
        std::lock_guard lock(mutex_);
        types_ = std::move(types);
        data_ = std::move(data);
    }

    void clear() {
        std::lock_guard lock(mutex_);
        types_.clear();
        data_.clear();
    }

    void fail_reads(bool fail) {
        std::lock_guard lock(mutex_);
        fail_reads_ = fail;
    }

    void fail_writes(bool fail) {
        std::lock_guard lock(mutex_);
        fail_writes_ = fail;
    }

    std::vector<Write> writes() const {
        std::lock_guard lock(mutex_);
        return writes_;
    }

    size_t read_calls() const {
        std::lock_guard lock(mutex_);
        return read_calls_;
    }

    std::expected<std::vector<std::string>, std::string> offered_types() override {
        std::lock_guard lock(mutex_);
        ++read_calls_;
        if (fail_reads_) return std::unexpected(std::string("mock: helper failed"));
        return types_;
    }

    std::expected<std::string, std::string> read(const std::string& mime_type) override {
        std::lock_guard lock(mutex_);
        if (fail_reads_) return std::unexpected(std::string("mock: helper failed"));
        auto it = data_.find(mime_type);
        if (it == data_.end()) return std::unexpected("mock: no " + mime_type);
        return it->second;
    }

    std::expected<void, std::string> write(const std::string& mime_type, std::string_view data) override {
        return write_multi({ClipboardOffer{mime_type, std::string(data)}});
    }

    bool supports_multi_type() const override { return multi_type_; }

    std::expected<void, std::string> write_multi(const std::vector<ClipboardOffer>& offers) override {
        std::lock_guard lock(mutex_);
        if (fail_writes_) return std::unexpected(std::string("mock: write refused"));
        if (offers.size() > 1 && !multi_type_) {
            return std::unexpected(std::string("mock: single type only"));
        }

        writes_.push_back({offers});
        types_.clear();
        data_.clear();
        for (const auto& o : offers) {
            types_.push_back(o.mime_type);
            data_[o.mime_type] = o.data;
        }
        return {};
    }

private:
    bool multi_type_;
    mutable std::mutex mutex_;
    std::vector<std::string> types_;
    std::map<std::string, std::string> data_;
    std::vector<Write> writes_;
    size_t read_calls_ = 0;
    bool fail_reads_ = false;
    bool fail_writes_ = false;
};

class MockNotifier : public Notifier {
public:
    struct Notification {
        std::string title;
        std::string body;
    };

    std::expected<void, std::string> notify(const std::string& title, const std::string& body) override {
        std::lock_guard lock(mutex_);
        sent_.push_back({title, body});
        return {};
    }

    std::vector<Notification> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Notification> sent_;
};

// PNG of a solid colour, for tests that need real image bytes.
inline std::string make_png(uint32_t width, uint32_t height, uint8_t shade = 0x80) {
    std::vector<uint8_t> rgba(static_cast<size_t>(width) * height * 4, shade);
    auto png = image_codec::encode_png(rgba, width, height);
    if (!png) return {};
    return std::string(png->begin(), png->end());
}
