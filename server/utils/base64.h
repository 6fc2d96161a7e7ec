/*
 * Base64 Encoding (RFC 4648, with padding)
 *
 * Used for SDP sprop-parameter-sets.
 */

#ifndef BASE64_H
#define BASE64_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace base64 {

std::string encode(const uint8_t* data, size_t len);

} // namespace base64

#endif // BASE64_H
