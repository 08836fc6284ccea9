#include "cardforge/png_text.h"

#include "cardforge/png_chunks.h"
#include "text_codec_internal.h"

namespace cardforge {
namespace {

    using text_internal::InflateStatus;

    static uint8_t u8(std::byte b) noexcept { return static_cast<uint8_t>(b); }

    static size_t find_nul(std::span<const std::byte> bytes,
                           size_t from) noexcept
    {
        for (size_t i = from; i < bytes.size(); ++i) {
            if (u8(bytes[i]) == 0) {
                return i;
            }
        }
        return bytes.size();
    }


    static void set_keyword(std::span<const std::byte> data, size_t nul,
                            TextRecord* out)
    {
        out->keyword.clear();
        text_internal::latin1_to_utf8(data.first(nul), &out->keyword);
    }


    static TextDecodeStatus inflate_status(InflateStatus status) noexcept
    {
        switch (status) {
        case InflateStatus::Ok: return TextDecodeStatus::Ok;
        case InflateStatus::Malformed: return TextDecodeStatus::Unreadable;
        case InflateStatus::LimitExceeded:
            return TextDecodeStatus::LimitExceeded;
        }
        return TextDecodeStatus::Unreadable;
    }

}  // namespace


const char*
text_decode_status_name(TextDecodeStatus status) noexcept
{
    switch (status) {
    case TextDecodeStatus::Ok: return "ok";
    case TextDecodeStatus::Unreadable: return "unreadable";
    case TextDecodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


const char*
text_encode_status_name(TextEncodeStatus status) noexcept
{
    switch (status) {
    case TextEncodeStatus::Ok: return "ok";
    case TextEncodeStatus::InvalidKeyword: return "invalid_keyword";
    case TextEncodeStatus::InvalidText: return "invalid_text";
    }
    return "unknown";
}


bool
is_text_chunk_type(uint32_t type) noexcept
{
    return type == kChunkText || type == kChunkZtxt || type == kChunkItxt;
}


TextDecodeStatus
decode_plain_text(std::span<const std::byte> data, TextRecord* out)
{
    const size_t nul = find_nul(data, 0);
    if (nul >= data.size()) {
        return TextDecodeStatus::Unreadable;
    }

    set_keyword(data, nul, out);
    out->kind = TextChunkKind::Plain;

    const std::span<const std::byte> value = data.subspan(nul + 1);
    std::vector<std::byte> decoded;
    if (text_internal::base64_decode(value, &decoded)
        && text_internal::is_valid_utf8(decoded)) {
        out->text.assign(reinterpret_cast<const char*>(decoded.data()),
                         decoded.size());
        return TextDecodeStatus::Ok;
    }

    // Producers that skip base64 store the text directly.
    text_internal::decode_utf8_lossy(value, &out->text);
    return TextDecodeStatus::Ok;
}


TextDecodeStatus
decode_compressed_text(std::span<const std::byte> data, TextRecord* out,
                       const TextDecodeOptions& options)
{
    const size_t nul = find_nul(data, 0);
    if (nul + 1 >= data.size()) {
        return TextDecodeStatus::Unreadable;
    }
    if (u8(data[nul + 1]) != 0) {
        return TextDecodeStatus::Unreadable;
    }

    std::vector<std::byte> inflated;
    const InflateStatus st
        = text_internal::inflate_zlib(data.subspan(nul + 2),
                                      options.limits.max_inflate_bytes,
                                      &inflated);
    if (st != InflateStatus::Ok) {
        return inflate_status(st);
    }
    if (!text_internal::is_valid_utf8(inflated)) {
        return TextDecodeStatus::Unreadable;
    }

    set_keyword(data, nul, out);
    out->kind = TextChunkKind::Compressed;
    out->text.assign(reinterpret_cast<const char*>(inflated.data()),
                     inflated.size());
    return TextDecodeStatus::Ok;
}


TextDecodeStatus
decode_international_text(std::span<const std::byte> data, TextRecord* out,
                          const TextDecodeOptions& options)
{
    const size_t nul = find_nul(data, 0);
    if (nul >= data.size() || data.size() - (nul + 1) < 2) {
        return TextDecodeStatus::Unreadable;
    }

    const uint8_t comp_flag = u8(data[nul + 1]);
    // data[nul + 2] is the compression method; only its presence matters.
    const size_t lang_end = find_nul(data, nul + 3);
    if (lang_end >= data.size()) {
        return TextDecodeStatus::Unreadable;
    }
    const size_t trans_end = find_nul(data, lang_end + 1);
    if (trans_end >= data.size()) {
        return TextDecodeStatus::Unreadable;
    }

    const std::span<const std::byte> text = data.subspan(trans_end + 1);
    if (comp_flag == 1) {
        std::vector<std::byte> inflated;
        const InflateStatus st
            = text_internal::inflate_zlib(text,
                                          options.limits.max_inflate_bytes,
                                          &inflated);
        if (st != InflateStatus::Ok) {
            return inflate_status(st);
        }
        text_internal::decode_utf8_lossy(inflated, &out->text);
    } else {
        text_internal::decode_utf8_lossy(text, &out->text);
    }

    set_keyword(data, nul, out);
    out->kind = TextChunkKind::International;
    return TextDecodeStatus::Ok;
}


TextDecodeStatus
decode_text_chunk(uint32_t type, std::span<const std::byte> data,
                  TextRecord* out, const TextDecodeOptions& options)
{
    switch (type) {
    case kChunkText: return decode_plain_text(data, out);
    case kChunkZtxt: return decode_compressed_text(data, out, options);
    case kChunkItxt: return decode_international_text(data, out, options);
    default: break;
    }
    return TextDecodeStatus::Unreadable;
}


TextEncodeStatus
keyword_to_latin1(std::string_view keyword, std::string* out)
{
    out->clear();
    size_t i = 0;
    while (i < keyword.size()) {
        const uint8_t c = static_cast<uint8_t>(keyword[i]);
        if (c == 0) {
            return TextEncodeStatus::InvalidKeyword;
        }
        if (c < 0x80U) {
            out->push_back(static_cast<char>(c));
            i += 1;
            continue;
        }
        // Only U+0080..U+00FF (lead bytes C2/C3) fit in latin-1.
        if ((c != 0xC2U && c != 0xC3U) || i + 1 >= keyword.size()) {
            return TextEncodeStatus::InvalidKeyword;
        }
        const uint8_t c1 = static_cast<uint8_t>(keyword[i + 1]);
        if ((c1 & 0xC0U) != 0x80U) {
            return TextEncodeStatus::InvalidKeyword;
        }
        out->push_back(
            static_cast<char>(((c & 0x03U) << 6) | (c1 & 0x3FU)));
        i += 2;
    }
    if (out->empty() || out->size() > kMaxKeywordBytes) {
        return TextEncodeStatus::InvalidKeyword;
    }
    return TextEncodeStatus::Ok;
}


TextEncodeStatus
encode_plain_text(std::string_view keyword, std::string_view text,
                  std::vector<std::byte>* out)
{
    std::string latin1;
    const TextEncodeStatus st = keyword_to_latin1(keyword, &latin1);
    if (st != TextEncodeStatus::Ok) {
        return st;
    }

    const std::span<const std::byte> text_bytes(
        reinterpret_cast<const std::byte*>(text.data()), text.size());
    if (!text_internal::is_valid_utf8(text_bytes)) {
        return TextEncodeStatus::InvalidText;
    }

    std::string encoded;
    text_internal::base64_encode(text_bytes, &encoded);

    out->clear();
    out->reserve(latin1.size() + 1 + encoded.size());
    for (char c : latin1) {
        out->push_back(std::byte { static_cast<uint8_t>(c) });
    }
    out->push_back(std::byte { 0x00 });
    for (char c : encoded) {
        out->push_back(std::byte { static_cast<uint8_t>(c) });
    }
    return TextEncodeStatus::Ok;
}

}  // namespace cardforge
