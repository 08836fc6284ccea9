#include "text_codec_internal.h"

#include <array>

#include <zlib.h>

namespace cardforge::text_internal {
namespace {

    static constexpr char kBase64Alphabet[]
        = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    static uint8_t u8(std::byte b) noexcept { return static_cast<uint8_t>(b); }

    // 0-63 for alphabet characters, 64 for '=', 255 otherwise.
    static uint8_t base64_value(uint8_t c) noexcept
    {
        if (c >= 'A' && c <= 'Z') {
            return static_cast<uint8_t>(c - 'A');
        }
        if (c >= 'a' && c <= 'z') {
            return static_cast<uint8_t>(c - 'a' + 26);
        }
        if (c >= '0' && c <= '9') {
            return static_cast<uint8_t>(c - '0' + 52);
        }
        if (c == '+') {
            return 62;
        }
        if (c == '/') {
            return 63;
        }
        if (c == '=') {
            return 64;
        }
        return 255;
    }

    // Length of the UTF-8 sequence starting at `i` if it is well-formed,
    // otherwise 0. `*consumed` receives the size of the maximal invalid
    // subpart (at least 1) when the sequence is ill-formed.
    static size_t utf8_sequence(std::span<const std::byte> bytes, size_t i,
                                size_t* consumed) noexcept
    {
        const uint8_t b0 = u8(bytes[i]);
        *consumed        = 1;
        if (b0 <= 0x7FU) {
            return 1;
        }

        size_t len = 0;
        uint8_t lo = 0x80U;
        uint8_t hi = 0xBFU;
        if (b0 >= 0xC2U && b0 <= 0xDFU) {
            len = 2;
        } else if (b0 == 0xE0U) {
            len = 3;
            lo  = 0xA0U;
        } else if (b0 == 0xEDU) {
            len = 3;
            hi  = 0x9FU;
        } else if (b0 >= 0xE1U && b0 <= 0xEFU) {
            len = 3;
        } else if (b0 == 0xF0U) {
            len = 4;
            lo  = 0x90U;
        } else if (b0 == 0xF4U) {
            len = 4;
            hi  = 0x8FU;
        } else if (b0 >= 0xF1U && b0 <= 0xF3U) {
            len = 4;
        } else {
            return 0;
        }

        size_t k = 1;
        while (k < len && i + k < bytes.size()) {
            const uint8_t b = u8(bytes[i + k]);
            const uint8_t l = (k == 1) ? lo : 0x80U;
            const uint8_t h = (k == 1) ? hi : 0xBFU;
            if (b < l || b > h) {
                break;
            }
            k += 1;
        }
        if (k == len) {
            return len;
        }
        *consumed = k;
        return 0;
    }

}  // namespace


void
base64_encode(std::span<const std::byte> bytes, std::string* out)
{
    out->reserve(out->size() + ((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const uint32_t v = (static_cast<uint32_t>(u8(bytes[i])) << 16)
                           | (static_cast<uint32_t>(u8(bytes[i + 1])) << 8)
                           | static_cast<uint32_t>(u8(bytes[i + 2]));
        out->push_back(kBase64Alphabet[(v >> 18) & 0x3FU]);
        out->push_back(kBase64Alphabet[(v >> 12) & 0x3FU]);
        out->push_back(kBase64Alphabet[(v >> 6) & 0x3FU]);
        out->push_back(kBase64Alphabet[v & 0x3FU]);
    }

    const size_t rest = bytes.size() - i;
    if (rest == 1) {
        const uint32_t v = static_cast<uint32_t>(u8(bytes[i])) << 16;
        out->push_back(kBase64Alphabet[(v >> 18) & 0x3FU]);
        out->push_back(kBase64Alphabet[(v >> 12) & 0x3FU]);
        out->append("==");
    } else if (rest == 2) {
        const uint32_t v = (static_cast<uint32_t>(u8(bytes[i])) << 16)
                           | (static_cast<uint32_t>(u8(bytes[i + 1])) << 8);
        out->push_back(kBase64Alphabet[(v >> 18) & 0x3FU]);
        out->push_back(kBase64Alphabet[(v >> 12) & 0x3FU]);
        out->push_back(kBase64Alphabet[(v >> 6) & 0x3FU]);
        out->push_back('=');
    }
}


bool
base64_decode(std::span<const std::byte> text, std::vector<std::byte>* out)
{
    out->clear();
    out->reserve((text.size() / 4) * 3);

    uint32_t left   = 0;
    size_t quad_pos = 0;
    size_t pads     = 0;
    for (const std::byte b : text) {
        const uint8_t v = base64_value(u8(b));
        if (v == 64) {
            // '=' before the third character of a quad is ignored. A full
            // pad sequence ends the input.
            if (quad_pos >= 2 && quad_pos + ++pads >= 4) {
                return true;
            }
            continue;
        }
        if (v == 255) {
            continue;
        }

        switch (quad_pos) {
        case 0:
            left     = v;
            quad_pos = 1;
            break;
        case 1:
            out->push_back(std::byte { static_cast<uint8_t>(
                ((left << 2) | (v >> 4)) & 0xFFU) });
            left     = v & 0x0FU;
            quad_pos = 2;
            break;
        case 2:
            out->push_back(std::byte { static_cast<uint8_t>(
                ((left << 4) | (v >> 2)) & 0xFFU) });
            left     = v & 0x03U;
            quad_pos = 3;
            break;
        default:
            out->push_back(
                std::byte { static_cast<uint8_t>(((left << 6) | v) & 0xFFU) });
            left     = 0;
            quad_pos = 0;
            break;
        }
    }

    if (quad_pos != 0) {
        out->clear();
        return false;
    }
    return true;
}


bool
is_valid_utf8(std::span<const std::byte> bytes) noexcept
{
    size_t i = 0;
    while (i < bytes.size()) {
        size_t consumed  = 0;
        const size_t len = utf8_sequence(bytes, i, &consumed);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}


void
decode_utf8_lossy(std::span<const std::byte> bytes, std::string* out)
{
    out->clear();
    out->reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        size_t consumed  = 0;
        const size_t len = utf8_sequence(bytes, i, &consumed);
        if (len == 0) {
            out->append("\xEF\xBF\xBD");
            i += consumed;
            continue;
        }
        out->append(reinterpret_cast<const char*>(bytes.data() + i), len);
        i += len;
    }
}


void
latin1_to_utf8(std::span<const std::byte> bytes, std::string* out)
{
    out->reserve(out->size() + bytes.size());
    for (const std::byte b : bytes) {
        const uint8_t c = u8(b);
        if (c < 0x80U) {
            out->push_back(static_cast<char>(c));
        } else {
            out->push_back(static_cast<char>(0xC0U | (c >> 6)));
            out->push_back(static_cast<char>(0x80U | (c & 0x3FU)));
        }
    }
}


InflateStatus
inflate_zlib(std::span<const std::byte> in, uint64_t max_output_bytes,
             std::vector<std::byte>* out)
{
    out->clear();

    z_stream strm {};
    strm.zalloc = Z_NULL;
    strm.zfree  = Z_NULL;
    strm.opaque = Z_NULL;

    int ret = inflateInit(&strm);
    if (ret != Z_OK) {
        return InflateStatus::Malformed;
    }

    std::array<std::byte, 32768> buf {};
    uint64_t in_off = 0;

    for (;;) {
        if (strm.avail_in == 0 && in_off < in.size()) {
            const uint64_t remaining = static_cast<uint64_t>(in.size())
                                       - in_off;
            const uint32_t chunk = (remaining < 0x40000000ULL)
                                       ? static_cast<uint32_t>(remaining)
                                       : 0x40000000U;
            strm.next_in  = reinterpret_cast<Bytef*>(const_cast<std::byte*>(
                in.data() + static_cast<size_t>(in_off)));
            strm.avail_in = static_cast<uInt>(chunk);
            in_off += chunk;
        }

        strm.next_out  = reinterpret_cast<Bytef*>(buf.data());
        strm.avail_out = static_cast<uInt>(buf.size());

        ret                   = inflate(&strm, Z_NO_FLUSH);
        const size_t produced = buf.size() - strm.avail_out;

        if (max_output_bytes != 0U
            && static_cast<uint64_t>(out->size()) + produced
                   > max_output_bytes) {
            (void)inflateEnd(&strm);
            out->clear();
            return InflateStatus::LimitExceeded;
        }
        out->insert(out->end(), buf.begin(),
                    buf.begin() + static_cast<std::ptrdiff_t>(produced));

        if (ret == Z_STREAM_END) {
            break;
        }
        // Z_BUF_ERROR here means the input ended before the stream did.
        if (ret != Z_OK) {
            (void)inflateEnd(&strm);
            out->clear();
            return InflateStatus::Malformed;
        }
    }

    (void)inflateEnd(&strm);
    return InflateStatus::Ok;
}

}  // namespace cardforge::text_internal
