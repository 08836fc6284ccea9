#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file png_text.h
 * \brief Decoders and encoder for PNG text chunks (tEXt, zTXt, iTXt).
 */

namespace cardforge {

/// Outcome of decoding a single text chunk.
enum class TextDecodeStatus : uint8_t {
    Ok,
    /// The chunk is malformed and must be treated as absent.
    Unreadable,
    /// Decompressed text would exceed \ref TextDecodeLimits::max_inflate_bytes.
    LimitExceeded,
};

/// Outcome of encoding a text chunk.
enum class TextEncodeStatus : uint8_t {
    Ok,
    /// Keyword is empty, too long, contains NUL, or is not latin-1.
    InvalidKeyword,
    /// Text is not well-formed UTF-8 and would not read back unchanged.
    InvalidText,
};

const char*
text_decode_status_name(TextDecodeStatus status) noexcept;

const char*
text_encode_status_name(TextEncodeStatus status) noexcept;

/// Wire encoding a text record was read from.
enum class TextChunkKind : uint8_t {
    Plain,
    Compressed,
    International,
};

/**
 * \brief Decoded text chunk.
 *
 * Both fields are UTF-8. The keyword is stored as latin-1 on the wire and is
 * converted on read and write.
 */
struct TextRecord final {
    std::string keyword;
    std::string text;
    TextChunkKind kind = TextChunkKind::Plain;
};

struct TextDecodeLimits final {
    uint64_t max_inflate_bytes = 64ULL * 1024ULL * 1024ULL;
};

struct TextDecodeOptions final {
    TextDecodeLimits limits;
};

/// PNG keywords are 1-79 latin-1 bytes.
inline constexpr uint32_t kMaxKeywordBytes = 79;

/// Returns true for tEXt, zTXt and iTXt.
bool
is_text_chunk_type(uint32_t type) noexcept;

/**
 * \brief Decodes `keyword NUL value` from a tEXt chunk.
 *
 * The value is first tried as base64 of UTF-8 text. If that fails in any way,
 * the raw value bytes are decoded as UTF-8 with U+FFFD replacement. Only a
 * missing NUL separator makes the chunk unreadable.
 */
TextDecodeStatus
decode_plain_text(std::span<const std::byte> data, TextRecord* out);

/// Decodes `keyword NUL method deflate(text)` from a zTXt chunk.
TextDecodeStatus
decode_compressed_text(std::span<const std::byte> data, TextRecord* out,
                       const TextDecodeOptions& options
                       = TextDecodeOptions {});

/**
 * \brief Decodes an iTXt chunk.
 *
 * Layout: `keyword NUL flag method language NUL translated NUL text`. The text
 * is inflated first when flag is 1, then decoded as UTF-8 with replacement.
 */
TextDecodeStatus
decode_international_text(std::span<const std::byte> data, TextRecord* out,
                          const TextDecodeOptions& options
                          = TextDecodeOptions {});

/// Dispatches to the decoder for \p type; other types are unreadable.
TextDecodeStatus
decode_text_chunk(uint32_t type, std::span<const std::byte> data,
                  TextRecord* out,
                  const TextDecodeOptions& options = TextDecodeOptions {});

/**
 * \brief Encodes a tEXt chunk body: `keyword NUL base64(text)`.
 *
 * Base64 uses the standard alphabet with padding, so the payload never holds
 * NUL or line breaks. This is the only encoding ever written. \p text must be
 * well-formed UTF-8; anything else returns \ref TextEncodeStatus::InvalidText.
 */
TextEncodeStatus
encode_plain_text(std::string_view keyword, std::string_view text,
                  std::vector<std::byte>* out);

/// Converts a UTF-8 keyword to its latin-1 wire form.
TextEncodeStatus
keyword_to_latin1(std::string_view keyword, std::string* out);

}  // namespace cardforge
