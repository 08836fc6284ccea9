#pragma once

#include "cardforge/card_chunks.h"
#include "cardforge/png_chunks.h"
#include "cardforge/png_text.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for untrusted card files.
 */

namespace cardforge {

/**
 * \brief Storage-agnostic resource limits for untrusted PNG input.
 *
 * \ref max_input_bytes caps the whole upload; the other budgets bound chunk
 * parsing and text decompression so a small file cannot expand without limit.
 */
struct CardResourcePolicy final {
    /// Upload size cap (0 = unlimited).
    uint64_t max_input_bytes = 20ULL * 1024ULL * 1024ULL;

    /// Chunk count and per-chunk size budgets.
    PngParseLimits png_limits;

    /// zTXt/iTXt decompression budget.
    TextDecodeLimits text_limits;
};

inline void
apply_resource_policy(const CardResourcePolicy& policy,
                      CardChunkOptions* options) noexcept
{
    if (options) {
        options->parse.limits  = policy.png_limits;
        options->decode.limits = policy.text_limits;
    }
}

inline void
apply_resource_policy(const CardResourcePolicy& policy,
                      PngParseOptions* parse,
                      TextDecodeOptions* decode) noexcept
{
    if (parse) {
        parse->limits = policy.png_limits;
    }
    if (decode) {
        decode->limits = policy.text_limits;
    }
}

}  // namespace cardforge
