#pragma once

#include <string>
#include <string_view>

/**
 * \file redact.h
 * \brief Scrubs credentials from text destined for logs and error messages.
 */

namespace cardforge {

/// Placeholder written in place of a secret.
inline constexpr std::string_view kRedactedPlaceholder = "[REDACTED]";

/**
 * \brief Replaces credential-shaped substrings with \ref kRedactedPlaceholder.
 *
 * Covers `sk-` API keys, `api_key`/`api-key` values, bearer tokens and the
 * values of `Authorization`, `Cookie` and `x-api-key` fields. The prefix that
 * identifies the secret is kept; text without secrets is returned unchanged.
 */
std::string
redact_sensitive_text(std::string_view text);

}  // namespace cardforge
