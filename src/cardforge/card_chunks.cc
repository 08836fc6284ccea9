#include "cardforge/card_chunks.h"

#include "text_codec_internal.h"

#include <cstring>

namespace cardforge {
namespace {

    static uint8_t u8(std::byte b) noexcept { return static_cast<uint8_t>(b); }

    static bool starts_with(std::span<const std::byte> bytes,
                            std::string_view s) noexcept
    {
        if (bytes.size() < s.size()) {
            return false;
        }
        return std::memcmp(bytes.data(), s.data(), s.size()) == 0;
    }


    static bool is_json_space(uint8_t c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v'
               || c == '\f';
    }


    static PngStatus parse_for_edit(std::span<const std::byte> png,
                                    std::vector<PngChunk>* chunks,
                                    const CardChunkOptions& options)
    {
        const PngParseResult res = parse_png_chunks(png, chunks,
                                                    options.parse);
        return res.status;
    }


    // All three text chunk kinds start with `keyword NUL`. Matching on that
    // prefix alone keeps chunks with undecodable bodies addressable.
    static bool text_chunk_has_keyword(const PngChunk& chunk,
                                       std::string_view keyword)
    {
        const std::span<const std::byte> data(chunk.data);
        size_t nul = 0;
        while (nul < data.size() && u8(data[nul]) != 0) {
            ++nul;
        }
        if (nul >= data.size()) {
            return false;
        }
        std::string found;
        text_internal::latin1_to_utf8(data.first(nul), &found);
        return found == keyword;
    }

}  // namespace


const char*
card_source_name(CardSource source) noexcept
{
    switch (source) {
    case CardSource::Ccv3: return "ccv3";
    case CardSource::Chara: return "chara";
    }
    return "unknown";
}


PngStatus
read_text_chunks(std::span<const std::byte> png, TextChunkMap* out,
                 const CardChunkOptions& options)
{
    out->clear();

    std::vector<PngChunk> chunks;
    const PngStatus st = parse_for_edit(png, &chunks, options);
    if (st != PngStatus::Ok) {
        return st;
    }

    TextRecord rec;
    for (const PngChunk& chunk : chunks) {
        if (!is_text_chunk_type(chunk.type)) {
            continue;
        }
        if (decode_text_chunk(chunk.type, chunk.data, &rec, options.decode)
            != TextDecodeStatus::Ok) {
            continue;
        }
        (*out)[rec.keyword] = std::move(rec.text);
    }
    return PngStatus::Ok;
}


PngStatus
inject_text_chunk(std::span<const std::byte> png, std::string_view keyword,
                  std::string_view text, std::vector<std::byte>* out,
                  const CardChunkOptions& options)
{
    out->clear();

    std::vector<PngChunk> chunks;
    const PngStatus st = parse_for_edit(png, &chunks, options);
    if (st != PngStatus::Ok) {
        return st;
    }

    PngChunk injected;
    injected.type = kChunkText;
    switch (encode_plain_text(keyword, text, &injected.data)) {
    case TextEncodeStatus::Ok: break;
    case TextEncodeStatus::InvalidKeyword: return PngStatus::InvalidKeyword;
    case TextEncodeStatus::InvalidText: return PngStatus::InvalidText;
    }

    bool replaced = false;
    if (options.replace) {
        for (PngChunk& chunk : chunks) {
            if (chunk.type == kChunkText
                && text_chunk_has_keyword(chunk, keyword)) {
                chunk    = std::move(injected);
                replaced = true;
                break;
            }
        }
    }

    if (!replaced) {
        auto pos = chunks.begin();
        while (pos != chunks.end() && pos->type != kChunkIEND) {
            ++pos;
        }
        chunks.insert(pos, std::move(injected));
    }

    serialize_png_chunks(chunks, out);
    return PngStatus::Ok;
}


PngStatus
remove_text_chunks(std::span<const std::byte> png, std::string_view keyword,
                   std::vector<std::byte>* out,
                   const CardChunkOptions& options)
{
    out->clear();

    std::vector<PngChunk> chunks;
    const PngStatus st = parse_for_edit(png, &chunks, options);
    if (st != PngStatus::Ok) {
        return st;
    }

    std::vector<PngChunk> kept;
    kept.reserve(chunks.size());
    for (PngChunk& chunk : chunks) {
        if (is_text_chunk_type(chunk.type)
            && text_chunk_has_keyword(chunk, keyword)) {
            continue;
        }
        kept.push_back(std::move(chunk));
    }

    serialize_png_chunks(kept, out);
    return PngStatus::Ok;
}


PngStatus
find_card_payload(std::span<const std::byte> png, CardPayload* out,
                  const CardChunkOptions& options)
{
    TextChunkMap texts;
    const PngStatus st = read_text_chunks(png, &texts, options);
    if (st != PngStatus::Ok) {
        return st;
    }

    auto it = texts.find(kCardKeywordV3);
    if (it != texts.end()) {
        out->source = CardSource::Ccv3;
        out->json   = std::move(it->second);
        return PngStatus::Ok;
    }
    it = texts.find(kCardKeywordV2);
    if (it != texts.end()) {
        out->source = CardSource::Chara;
        out->json   = std::move(it->second);
        return PngStatus::Ok;
    }
    return PngStatus::NotFound;
}


PngStatus
embed_card_payloads(std::span<const std::byte> png, std::string_view v3_json,
                    std::string_view v2_json, std::vector<std::byte>* out,
                    const CardChunkOptions& options)
{
    CardChunkOptions opts = options;
    opts.replace          = true;

    const PngStatus st = inject_text_chunk(png, kCardKeywordV3, v3_json, out,
                                           opts);
    if (st != PngStatus::Ok || v2_json.empty()) {
        return st;
    }

    const std::vector<std::byte> with_v3 = std::move(*out);
    return inject_text_chunk(with_v3, kCardKeywordV2, v2_json, out, opts);
}


const char*
card_file_type_name(CardFileType type) noexcept
{
    switch (type) {
    case CardFileType::Png: return "png";
    case CardFileType::Json: return "json";
    case CardFileType::Image: return "image";
    }
    return "unknown";
}


CardFileType
detect_card_file_type(std::span<const std::byte> bytes) noexcept
{
    if (is_png_signature(bytes)) {
        return CardFileType::Png;
    }

    if (starts_with(bytes, "\xFF\xD8\xFF")) {
        return CardFileType::Image;
    }
    if (starts_with(bytes, "RIFF") && bytes.size() >= 12
        && std::memcmp(bytes.data() + 8, "WEBP", 4) == 0) {
        return CardFileType::Image;
    }
    if (starts_with(bytes, "GIF87a") || starts_with(bytes, "GIF89a")) {
        return CardFileType::Image;
    }
    if (starts_with(bytes, "BM")) {
        return CardFileType::Image;
    }

    for (const std::byte b : bytes) {
        const uint8_t c = u8(b);
        if (is_json_space(c)) {
            continue;
        }
        return (c == '{' || c == '[') ? CardFileType::Json
                                      : CardFileType::Image;
    }
    return CardFileType::Image;
}

}  // namespace cardforge
