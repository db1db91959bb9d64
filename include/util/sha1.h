#ifndef __sha1_h__
#define __sha1_h__

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <string>

namespace util {

// SHA-1 digest, only used for the WebSocket accept key
class Sha1 {
public:
    using Digest = std::array<uint8_t, 20>;

    Sha1() { reset(); }

    void reset() {
        h_[0] = 0x67452301;
        h_[1] = 0xEFCDAB89;
        h_[2] = 0x98BADCFE;
        h_[3] = 0x10325476;
        h_[4] = 0xC3D2E1F0;
        block_len_ = 0;
        total_bits_ = 0;
    }

    void update(const uint8_t* data, size_t len) {
        total_bits_ += static_cast<uint64_t>(len) * 8;
        while (len > 0) {
            size_t take = std::min(len, sizeof(block_) - block_len_);
            std::memcpy(block_ + block_len_, data, take);
            block_len_ += take;
            data += take;
            len -= take;
            if (block_len_ == sizeof(block_)) {
                compress();
                block_len_ = 0;
            }
        }
    }

    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    Digest finish() {
        uint64_t bits = total_bits_;
        block_[block_len_++] = 0x80;
        if (block_len_ > 56) {
            std::memset(block_ + block_len_, 0, sizeof(block_) - block_len_);
            compress();
            block_len_ = 0;
        }
        std::memset(block_ + block_len_, 0, 56 - block_len_);
        for (int i = 0; i < 8; ++i) {
            block_[63 - i] = static_cast<uint8_t>(bits >> (i * 8));
        }
        compress();

        Digest out{};
        for (int i = 0; i < 5; ++i) {
            out[i * 4 + 0] = static_cast<uint8_t>(h_[i] >> 24);
            out[i * 4 + 1] = static_cast<uint8_t>(h_[i] >> 16);
            out[i * 4 + 2] = static_cast<uint8_t>(h_[i] >> 8);
            out[i * 4 + 3] = static_cast<uint8_t>(h_[i]);
        }
        reset();
        return out;
    }

    static Digest of(const std::string& s) {
        Sha1 sha;
        sha.update(s);
        return sha.finish();
    }

private:
    static uint32_t rol(uint32_t v, int n) { return (v << n) | (v >> (32 - n)); }

    void compress() {
        uint32_t w[80];
        for (int i = 0; i < 16; ++i) {
            w[i] = (uint32_t(block_[i * 4]) << 24) | (uint32_t(block_[i * 4 + 1]) << 16) |
                   (uint32_t(block_[i * 4 + 2]) << 8) | uint32_t(block_[i * 4 + 3]);
        }
        for (int i = 16; i < 80; ++i) {
            w[i] = rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
        }

        uint32_t a = h_[0], b = h_[1], c = h_[2], d = h_[3], e = h_[4];
        for (int i = 0; i < 80; ++i) {
            uint32_t f, k;
            if (i < 20)      { f = (b & c) | (~b & d);          k = 0x5A827999; }
            else if (i < 40) { f = b ^ c ^ d;                   k = 0x6ED9EBA1; }
            else if (i < 60) { f = (b & c) | (b & d) | (c & d); k = 0x8F1BBCDC; }
            else             { f = b ^ c ^ d;                   k = 0xCA62C1D6; }
            uint32_t t = rol(a, 5) + f + e + k + w[i];
            e = d; d = c; c = rol(b, 30); b = a; a = t;
        }
        h_[0] += a; h_[1] += b; h_[2] += c; h_[3] += d; h_[4] += e;
    }

    uint32_t h_[5];
    uint8_t block_[64];
    size_t block_len_ = 0;
    uint64_t total_bits_ = 0;
};

} // namespace util

#endif
