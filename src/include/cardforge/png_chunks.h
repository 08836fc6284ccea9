#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file png_chunks.h
 * \brief PNG chunk stream parser and serializer.
 */

namespace cardforge {

/// Stream-level result status shared by the PNG chunk APIs.
enum class PngStatus : uint8_t {
    Ok,
    /// The bytes are not a PNG stream (short input or bad signature).
    InvalidFormat,
    /// A keyword cannot be written into a PNG text chunk.
    InvalidKeyword,
    /// Text to be written is not well-formed UTF-8.
    InvalidText,
    /// The requested chunk or payload is not present.
    NotFound,
    /// Resource limits were exceeded (too many chunks or a chunk too large).
    LimitExceeded,
};

/// Returns a stable lowercase name for \p status (e.g. "invalid_format").
const char*
png_status_name(PngStatus status) noexcept;

/// Size of the fixed PNG file signature.
inline constexpr uint32_t kPngSignatureSize = 8;

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

inline constexpr uint32_t kChunkIHDR = fourcc('I', 'H', 'D', 'R');
inline constexpr uint32_t kChunkIDAT = fourcc('I', 'D', 'A', 'T');
inline constexpr uint32_t kChunkIEND = fourcc('I', 'E', 'N', 'D');
inline constexpr uint32_t kChunkText = fourcc('t', 'E', 'X', 't');
inline constexpr uint32_t kChunkZtxt = fourcc('z', 'T', 'X', 't');
inline constexpr uint32_t kChunkItxt = fourcc('i', 'T', 'X', 't');

/**
 * \brief One PNG chunk: a FourCC type and its data bytes.
 *
 * The length is implied by \ref data. The CRC is not stored; it is recomputed
 * by \ref serialize_png_chunks.
 */
struct PngChunk final {
    uint32_t type = 0;
    std::vector<std::byte> data;
};

/// Resource limits applied while parsing untrusted PNG bytes.
struct PngParseLimits final {
    uint32_t max_chunks      = 1U << 16;
    uint64_t max_chunk_bytes = 256ULL * 1024ULL * 1024ULL;
};

struct PngParseOptions final {
    PngParseLimits limits;
};

struct PngParseResult final {
    PngStatus status = PngStatus::Ok;
    /// Number of chunks appended to the output.
    uint32_t chunks = 0;
    /// True if an IEND chunk terminated parsing.
    bool saw_iend = false;
    /// True if the input ended in the middle of a chunk.
    bool truncated = false;
    /// Bytes found after IEND (not part of the chunk sequence).
    uint64_t trailing_bytes = 0;
};

/// Returns true if \p bytes starts with the 8-byte PNG signature.
bool
is_png_signature(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Parses \p bytes into an ordered chunk sequence.
 *
 * Chunk CRCs are read but not validated. Parsing stops without error at the
 * first chunk that is not fully contained in \p bytes, and immediately after
 * the first IEND chunk; bytes after IEND are dropped.
 *
 * \p out is cleared first. On \ref PngStatus::InvalidFormat it stays empty.
 */
PngParseResult
parse_png_chunks(std::span<const std::byte> bytes, std::vector<PngChunk>* out,
                 const PngParseOptions& options = PngParseOptions {});

/**
 * \brief Serializes \p chunks as a PNG stream.
 *
 * Emits the signature, then `length || type || data || crc` for every chunk
 * in order. The CRC is always computed over `type || data`. No validation or
 * reordering is performed.
 */
void
serialize_png_chunks(std::span<const PngChunk> chunks,
                     std::vector<std::byte>* out);

/// CRC-32 (PNG/zlib polynomial) over the FourCC \p type followed by \p data.
uint32_t
png_chunk_crc(uint32_t type, std::span<const std::byte> data) noexcept;

/// Returns the four type characters of \p type (non-printables as '?').
std::string
format_fourcc(uint32_t type);

/// Collects the data of every chunk of \p type, in stream order.
std::vector<std::span<const std::byte>>
collect_chunk_data(std::span<const PngChunk> chunks, uint32_t type);

}  // namespace cardforge
