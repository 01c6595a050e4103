#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

struct ClipboardOffer {
    std::string mime_type;
    std::string data;
};

// Raw MIME-typed access to the system clipboard. Not thread-safe; callers
// serialize through ClipboardAccessor.
class ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;

    // Empty vector when the clipboard holds nothing.
    virtual std::expected<std::vector<std::string>, std::string> offered_types() = 0;
    virtual std::expected<std::string, std::string> read(const std::string& mime_type) = 0;
    virtual std::expected<void, std::string> write(const std::string& mime_type, std::string_view data) = 0;

    // True if several MIME types can be offered at once.
    virtual bool supports_multi_type() const { return false; }
    virtual std::expected<void, std::string> write_multi(const std::vector<ClipboardOffer>& offers) {
        (void)offers;
        return std::unexpected(std::string("multi-type clipboard offers not supported"));
    }
};
