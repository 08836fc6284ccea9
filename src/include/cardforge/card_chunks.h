#pragma once

#include "cardforge/png_chunks.h"
#include "cardforge/png_text.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file card_chunks.h
 * \brief Read, inject and remove character card text chunks in PNG files.
 *
 * Every operation rewrites only the targeted text chunk. All other chunks
 * (IHDR, PLTE, IDAT, ancillary chunks, IEND) keep their exact data bytes and
 * their relative order.
 */

namespace cardforge {

/// Keyword of the V3 character card chunk.
inline constexpr std::string_view kCardKeywordV3 = "ccv3";
/// Keyword of the legacy V2 character card chunk.
inline constexpr std::string_view kCardKeywordV2 = "chara";

/// Keyword -> text, merged from all readable text chunks.
using TextChunkMap = std::map<std::string, std::string, std::less<>>;

struct CardChunkOptions final {
    PngParseOptions parse;
    TextDecodeOptions decode;
    /// If true, \ref inject_text_chunk replaces the first tEXt with the same
    /// keyword instead of adding a second one.
    bool replace = true;
};

/// Which chunk a card payload was read from.
enum class CardSource : uint8_t {
    Ccv3,
    Chara,
};

/// Returns "ccv3" or "chara".
const char*
card_source_name(CardSource source) noexcept;

struct CardPayload final {
    CardSource source = CardSource::Ccv3;
    std::string json;
};

/**
 * \brief Decodes every tEXt, zTXt and iTXt chunk into \p out.
 *
 * Chunks are read in stream order; a later chunk overwrites an earlier one
 * with the same keyword. Unreadable chunks are skipped. An empty map after
 * \ref PngStatus::Ok means the stream has no readable text.
 */
PngStatus
read_text_chunks(std::span<const std::byte> png, TextChunkMap* out,
                 const CardChunkOptions& options = CardChunkOptions {});

/**
 * \brief Writes \p text under \p keyword as a base64 tEXt chunk.
 *
 * With \ref CardChunkOptions::replace, the first tEXt chunk whose decoded
 * keyword matches is replaced in place (zTXt/iTXt are never replaced).
 * Otherwise the new chunk goes right before IEND, or at the end if the stream
 * has no IEND.
 */
PngStatus
inject_text_chunk(std::span<const std::byte> png, std::string_view keyword,
                  std::string_view text, std::vector<std::byte>* out,
                  const CardChunkOptions& options = CardChunkOptions {});

/**
 * \brief Drops every text chunk (any of the three kinds) whose keyword matches.
 *
 * The keyword is compared without decoding the chunk body, so compressed
 * chunks over the inflate limit and chunks with malformed bodies are removed
 * too.
 */
PngStatus
remove_text_chunks(std::span<const std::byte> png, std::string_view keyword,
                   std::vector<std::byte>* out,
                   const CardChunkOptions& options = CardChunkOptions {});

/**
 * \brief Returns the primary card payload.
 *
 * `ccv3` wins over `chara` when both exist. Returns
 * \ref PngStatus::NotFound when neither is present.
 */
PngStatus
find_card_payload(std::span<const std::byte> png, CardPayload* out,
                  const CardChunkOptions& options = CardChunkOptions {});

/**
 * \brief Embeds a card for export.
 *
 * Writes \p v3_json as `ccv3` and, if \p v2_json is not empty, a `chara`
 * chunk for V2 readers. Both use replace semantics.
 */
PngStatus
embed_card_payloads(std::span<const std::byte> png, std::string_view v3_json,
                    std::string_view v2_json, std::vector<std::byte>* out,
                    const CardChunkOptions& options = CardChunkOptions {});

/// Coarse classification of an uploaded card file.
enum class CardFileType : uint8_t {
    Png,
    Json,
    /// Any other input; callers hand it to an image converter.
    Image,
};

const char*
card_file_type_name(CardFileType type) noexcept;

/// Sniffs PNG / JSON / other image from leading bytes.
CardFileType
detect_card_file_type(std::span<const std::byte> bytes) noexcept;

}  // namespace cardforge
