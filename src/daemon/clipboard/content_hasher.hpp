#pragma once

#include "clipboard/snapshot.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

// SHA-256 fingerprints used for change detection and staging names.
// Not an identity guarantee for reference-only images: two references with
// the same string and metadata hash equally.
class ContentHasher {
public:
    static std::string fingerprint(const ClipboardSnapshot& snapshot);
    static std::string digest(std::span<const uint8_t> data);
    static std::string digest(std::string_view data);
};
