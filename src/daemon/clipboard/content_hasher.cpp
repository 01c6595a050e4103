#include "clipboard/content_hasher.hpp"

#include <array>
#include <sodium.h>

namespace {

void ensure_sodium() {
    // Hashing works even if sodium_init() reports an RNG failure.
    static const int rc = sodium_init();
    (void)rc;
}

class Sha256 {
public:
    Sha256() {
        ensure_sodium();
        crypto_hash_sha256_init(&state_);
    }

    void update(const void* data, size_t len) {
        crypto_hash_sha256_update(&state_, static_cast<const unsigned char*>(data), len);
    }

    void update(std::string_view s) { update(s.data(), s.size()); }

    void update_u64(uint64_t v) {
        std::array<unsigned char, 8> le{};
        for (size_t i = 0; i < le.size(); ++i) {
            le[i] = static_cast<unsigned char>(v >> (8 * i));
        }
        update(le.data(), le.size());
    }

    std::string hex() {
        std::array<unsigned char, crypto_hash_sha256_BYTES> out{};
        crypto_hash_sha256_final(&state_, out.data());

        std::array<char, crypto_hash_sha256_BYTES * 2 + 1> buf{};
        sodium_bin2hex(buf.data(), buf.size(), out.data(), out.size());
        return std::string(buf.data(), crypto_hash_sha256_BYTES * 2);
    }

private:
    crypto_hash_sha256_state state_;
};

} // namespace

std::string ContentHasher::fingerprint(const ClipboardSnapshot& snapshot) {
    Sha256 h;
    if (snapshot.is_text()) {
        h.update("text:");
        h.update(snapshot.text().bytes);
    } else {
        const auto& img = snapshot.image();
        h.update("image:");
        h.update_u64(img.width);
        h.update_u64(img.height);
        h.update_u64(img.byte_size);
        if (img.resident()) {
            h.update(img.payload.data(), img.payload.size());
        } else {
            h.update(img.reference);
        }
    }
    return h.hex();
}

std::string ContentHasher::digest(std::span<const uint8_t> data) {
    Sha256 h;
    h.update(data.data(), data.size());
    return h.hex();
}

std::string ContentHasher::digest(std::string_view data) {
    Sha256 h;
    h.update(data);
    return h.hex();
}
