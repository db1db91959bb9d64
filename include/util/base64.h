#ifndef __base64_h__
#define __base64_h__

#include <cstdint>
#include <string>

namespace util {

inline std::string base64_encode(const uint8_t* data, size_t len) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(table[(triple >> 18) & 0x3F]);
        out.push_back(table[(triple >> 12) & 0x3F]);
        out.push_back(table[(triple >> 6) & 0x3F]);
        out.push_back(table[triple & 0x3F]);
    }

    size_t rem = len - i;
    if (rem > 0) {
        uint32_t triple = uint32_t(data[i]) << 16;
        if (rem == 2) triple |= uint32_t(data[i + 1]) << 8;

        out.push_back(table[(triple >> 18) & 0x3F]);
        out.push_back(table[(triple >> 12) & 0x3F]);
        out.push_back(rem == 2 ? table[(triple >> 6) & 0x3F] : '=');
        out.push_back('=');
    }

    return out;
}

template <typename Bytes>
inline std::string base64_encode(const Bytes& bytes) {
    return base64_encode(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

} // namespace util

#endif
