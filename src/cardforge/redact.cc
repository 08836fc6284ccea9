#include "cardforge/redact.h"

#include <array>
#include <regex>

namespace cardforge {
namespace {

    struct RedactRule final {
        std::regex pattern;
    };

    // Every rule captures the identifying prefix in group 1.
    static const std::array<RedactRule, 6>& redact_rules()
    {
        static const auto kFlags = std::regex::ECMAScript | std::regex::icase;
        static const std::array<RedactRule, 6> kRules = {
            RedactRule { std::regex(R"((sk-)[a-zA-Z0-9]{20,})",
                                    std::regex::ECMAScript) },
            RedactRule { std::regex(
                R"((api[-_]?key["'\s:=]+)[a-zA-Z0-9\-_]{20,})", kFlags) },
            RedactRule { std::regex(R"((bearer\s+)[a-zA-Z0-9\-_.]+)",
                                    kFlags) },
            RedactRule { std::regex(
                R"((authorization["'\s:=]+)[^\s"']+)", kFlags) },
            RedactRule { std::regex(R"((cookie["'\s:=]+)[^\s"']+)", kFlags) },
            RedactRule { std::regex(
                R"((x-api-key["'\s:=]+)[a-zA-Z0-9\-_.]+)", kFlags) },
        };
        return kRules;
    }

}  // namespace


std::string
redact_sensitive_text(std::string_view text)
{
    std::string result(text);
    const std::string replacement = "$1" + std::string(kRedactedPlaceholder);
    for (const RedactRule& rule : redact_rules()) {
        result = std::regex_replace(result, rule.pattern, replacement);
    }
    return result;
}

}  // namespace cardforge
