#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file console_format.h
 * \brief Terminal-safe rendering of untrusted card text.
 */

namespace cardforge {

/**
 * \brief Appends an ASCII-only, terminal-safe form of \p s to \p out.
 *
 * Control bytes and non-ASCII bytes become `\xNN`; `\n`, `\r` and `\t` use
 * their short escapes; `\` and `"` are backslash-escaped. At most
 * \p max_bytes input bytes are rendered (0 = unlimited), followed by "..."
 * when truncated.
 *
 * Returns true when anything was escaped or truncated.
 */
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

/// Appends uppercase hex (no "0x"), truncated like the function above.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

/**
 * \brief Redacts credentials in \p s, then escapes the result.
 *
 * Used for URLs and error text that may carry API keys.
 */
bool
append_console_redacted(std::string_view s, uint32_t max_bytes,
                        std::string* out);

}  // namespace cardforge
