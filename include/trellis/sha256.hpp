#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

namespace trellis {

// Streaming SHA-256 (FIPS 180-4). Used for cache fingerprints.
class Sha256 {
public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(std::string_view s);

    // Pads and returns the digest. The context is reset afterwards, so the
    // same object can hash a new message.
    Digest finalize();

    static std::string to_hex(const Digest& digest);

    // One-shot: lowercase hex digest of the UTF-8 bytes of `input`
    static std::string hex(std::string_view input);

private:
    void reset();
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t message_len_ = 0;
};

} // namespace trellis
