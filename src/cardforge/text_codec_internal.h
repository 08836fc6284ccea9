#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cardforge::text_internal {

enum class InflateStatus : uint8_t {
    Ok,
    Malformed,
    LimitExceeded,
};

// Appends base64 (standard alphabet, '=' padding) of `bytes` to `out`.
void
base64_encode(std::span<const std::byte> bytes, std::string* out);

// Decodes base64 text leniently. Characters outside the alphabet are
// skipped, '=' in the first two positions of a quad is ignored, and a
// complete pad sequence ends the input. Returns false when the data
// characters do not end on a quad boundary.
bool
base64_decode(std::span<const std::byte> text, std::vector<std::byte>* out);

// Returns true if `bytes` is well-formed UTF-8.
bool
is_valid_utf8(std::span<const std::byte> bytes) noexcept;

// Decodes `bytes` as UTF-8, replacing each maximal invalid subpart with
// U+FFFD.
void
decode_utf8_lossy(std::span<const std::byte> bytes, std::string* out);

// Appends latin-1 `bytes` as UTF-8.
void
latin1_to_utf8(std::span<const std::byte> bytes, std::string* out);

// Inflates a complete zlib stream. Running out of input before the end of
// the stream is malformed.
InflateStatus
inflate_zlib(std::span<const std::byte> in, uint64_t max_output_bytes,
             std::vector<std::byte>* out);

}  // namespace cardforge::text_internal
