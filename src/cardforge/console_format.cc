#include "cardforge/console_format.h"

#include "cardforge/redact.h"

#include <cstdio>

namespace cardforge {
namespace {

    static uint32_t clamp_len(size_t size, uint32_t max_bytes) noexcept
    {
        if (max_bytes == 0U || size < max_bytes) {
            return static_cast<uint32_t>(size);
        }
        return max_bytes;
    }


    static void append_escape(std::string* out, unsigned char c) noexcept
    {
        switch (c) {
        case '\n': out->append("\\n"); return;
        case '\r': out->append("\\r"); return;
        case '\t': out->append("\\t"); return;
        default: break;
        }
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(c));
        out->append(buf);
    }

}  // namespace


bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool escaped     = false;
    const uint32_t n = clamp_len(s.size(), max_bytes);

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            append_escape(out, c);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    const uint32_t n             = clamp_len(bytes.size(), max_bytes);

    out->reserve(out->size() + static_cast<size_t>(n) * 2U);
    for (uint32_t i = 0; i < n; ++i) {
        const uint8_t v = static_cast<uint8_t>(bytes[i]);
        out->push_back(kHex[v >> 4]);
        out->push_back(kHex[v & 0x0FU]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


bool
append_console_redacted(std::string_view s, uint32_t max_bytes,
                        std::string* out)
{
    const std::string redacted = redact_sensitive_text(s);
    return append_console_escaped_ascii(redacted, max_bytes, out);
}

}  // namespace cardforge
