#include "cardforge/png_chunks.h"

#include <array>
#include <cstring>

#include <zlib.h>

namespace cardforge {
namespace {

    static constexpr std::array<std::byte, kPngSignatureSize> kPngSignature = {
        std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
        std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
        std::byte { 0x1A }, std::byte { 0x0A },
    };

    static uint32_t read_u32be(std::span<const std::byte> bytes,
                               uint64_t offset) noexcept
    {
        const size_t p = static_cast<size_t>(offset);
        return (static_cast<uint32_t>(bytes[p + 0]) << 24)
               | (static_cast<uint32_t>(bytes[p + 1]) << 16)
               | (static_cast<uint32_t>(bytes[p + 2]) << 8)
               | (static_cast<uint32_t>(bytes[p + 3]) << 0);
    }


    static void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }


    static uLong crc_update(uLong crc, const std::byte* data,
                            size_t size) noexcept
    {
        // zlib takes uInt lengths; feed large buffers in pieces.
        while (size > 0) {
            const size_t n = (size < 0x40000000U) ? size : 0x40000000U;
            crc            = ::crc32(crc, reinterpret_cast<const Bytef*>(data),
                                     static_cast<uInt>(n));
            data += n;
            size -= n;
        }
        return crc;
    }

}  // namespace


const char*
png_status_name(PngStatus status) noexcept
{
    switch (status) {
    case PngStatus::Ok: return "ok";
    case PngStatus::InvalidFormat: return "invalid_format";
    case PngStatus::InvalidKeyword: return "invalid_keyword";
    case PngStatus::InvalidText: return "invalid_text";
    case PngStatus::NotFound: return "not_found";
    case PngStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


bool
is_png_signature(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() < kPngSignatureSize) {
        return false;
    }
    return std::memcmp(bytes.data(), kPngSignature.data(), kPngSignatureSize)
           == 0;
}


PngParseResult
parse_png_chunks(std::span<const std::byte> bytes, std::vector<PngChunk>* out,
                 const PngParseOptions& options)
{
    PngParseResult res;
    out->clear();

    if (!is_png_signature(bytes)) {
        res.status = PngStatus::InvalidFormat;
        return res;
    }

    const uint64_t size = static_cast<uint64_t>(bytes.size());
    uint64_t offset     = kPngSignatureSize;
    while (offset < size) {
        if (offset + 8 > size) {
            res.truncated = true;
            break;
        }
        const uint32_t len        = read_u32be(bytes, offset);
        const uint32_t type       = read_u32be(bytes, offset + 4);
        const uint64_t data_off   = offset + 8;
        const uint64_t data_size  = static_cast<uint64_t>(len);
        const uint64_t chunk_size = 12 + data_size;
        if (offset + chunk_size > size) {
            res.truncated = true;
            break;
        }
        if (data_size > options.limits.max_chunk_bytes
            || res.chunks >= options.limits.max_chunks) {
            out->clear();
            res.chunks = 0;
            res.status = PngStatus::LimitExceeded;
            return res;
        }

        PngChunk chunk;
        chunk.type = type;
        const std::span<const std::byte> data
            = bytes.subspan(static_cast<size_t>(data_off),
                            static_cast<size_t>(data_size));
        chunk.data.assign(data.begin(), data.end());
        out->push_back(std::move(chunk));
        res.chunks += 1;

        offset += chunk_size;
        if (type == kChunkIEND) {
            res.saw_iend       = true;
            res.trailing_bytes = size - offset;
            break;
        }
    }

    return res;
}


void
serialize_png_chunks(std::span<const PngChunk> chunks,
                     std::vector<std::byte>* out)
{
    size_t total = kPngSignatureSize;
    for (const PngChunk& chunk : chunks) {
        total += 12 + chunk.data.size();
    }

    out->clear();
    out->reserve(total);
    out->insert(out->end(), kPngSignature.begin(), kPngSignature.end());

    for (const PngChunk& chunk : chunks) {
        append_u32be(out, static_cast<uint32_t>(chunk.data.size()));
        append_u32be(out, chunk.type);
        out->insert(out->end(), chunk.data.begin(), chunk.data.end());
        append_u32be(out, png_chunk_crc(chunk.type, chunk.data));
    }
}


uint32_t
png_chunk_crc(uint32_t type, std::span<const std::byte> data) noexcept
{
    const std::array<std::byte, 4> type_bytes = {
        std::byte { static_cast<uint8_t>((type >> 24) & 0xFF) },
        std::byte { static_cast<uint8_t>((type >> 16) & 0xFF) },
        std::byte { static_cast<uint8_t>((type >> 8) & 0xFF) },
        std::byte { static_cast<uint8_t>((type >> 0) & 0xFF) },
    };
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc       = crc_update(crc, type_bytes.data(), type_bytes.size());
    crc       = crc_update(crc, data.data(), data.size());
    return static_cast<uint32_t>(crc & 0xFFFFFFFFUL);
}


std::string
format_fourcc(uint32_t type)
{
    std::string s(4, '?');
    for (int i = 0; i < 4; ++i) {
        const unsigned c = (type >> (24 - 8 * i)) & 0xFFU;
        if (c >= 0x20U && c < 0x7FU) {
            s[static_cast<size_t>(i)] = static_cast<char>(c);
        }
    }
    return s;
}


std::vector<std::span<const std::byte>>
collect_chunk_data(std::span<const PngChunk> chunks, uint32_t type)
{
    std::vector<std::span<const std::byte>> out;
    for (const PngChunk& chunk : chunks) {
        if (chunk.type == type) {
            out.emplace_back(chunk.data);
        }
    }
    return out;
}

}  // namespace cardforge
