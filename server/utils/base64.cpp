/*
 * Base64 Encoding Implementation
 */

#include "base64.h"

namespace base64 {

std::string encode(const uint8_t* data, size_t len) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < len) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        i += 3;

        out.push_back(table[(triple >> 18) & 0x3F]);
        out.push_back(table[(triple >> 12) & 0x3F]);
        out.push_back(table[(triple >> 6) & 0x3F]);
        out.push_back(table[triple & 0x3F]);
    }

    if (i < len) {
        uint32_t triple = uint32_t(data[i]) << 16;
        if (i + 1 < len) {
            triple |= uint32_t(data[i + 1]) << 8;
        }

        out.push_back(table[(triple >> 18) & 0x3F]);
        out.push_back(table[(triple >> 12) & 0x3F]);
        out.push_back(i + 1 < len ? table[(triple >> 6) & 0x3F] : '=');
        out.push_back('=');
    }

    return out;
}

} // namespace base64
