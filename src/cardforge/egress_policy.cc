#include "cardforge/egress_policy.h"

#include <array>
#include <memory>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace cardforge {
namespace {

    static char ascii_lower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }


    static std::string to_lower(std::string_view s)
    {
        std::string out(s);
        for (char& c : out) {
            c = ascii_lower(c);
        }
        return out;
    }


    static bool ends_with(std::string_view s, std::string_view suffix) noexcept
    {
        return s.size() >= suffix.size()
               && s.substr(s.size() - suffix.size()) == suffix;
    }


    static bool is_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v'
               || c == '\f';
    }


    static bool is_scheme_char(char c, bool first) noexcept
    {
        const bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (first) {
            return alpha;
        }
        return alpha || (c >= '0' && c <= '9') || c == '+' || c == '-'
               || c == '.';
    }


    static bool is_word_char(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
               || (c >= '0' && c <= '9') || c == '_';
    }


    static bool parse_port(std::string_view s, uint16_t* out) noexcept
    {
        if (s.empty() || s.size() > 5) {
            return false;
        }
        uint32_t v = 0;
        for (char c : s) {
            if (c < '0' || c > '9') {
                return false;
            }
            v = v * 10U + static_cast<uint32_t>(c - '0');
        }
        if (v > 0xFFFFU) {
            return false;
        }
        *out = static_cast<uint16_t>(v);
        return true;
    }


    static bool in_v4(uint32_t v, uint32_t net, uint32_t bits) noexcept
    {
        const uint32_t mask = (bits == 0U) ? 0U : (0xFFFFFFFFU << (32U - bits));
        return (v & mask) == net;
    }


    static AddressClass classify_v4(uint32_t v) noexcept
    {
        if (v == 0U) {
            return AddressClass::Unspecified;
        }
        if (in_v4(v, 0x7F000000U, 8)) {
            return AddressClass::Loopback;
        }
        if (in_v4(v, 0xA9FE0000U, 16)) {
            return AddressClass::LinkLocal;
        }
        if (in_v4(v, 0x0A000000U, 8) || in_v4(v, 0xAC100000U, 12)
            || in_v4(v, 0xC0A80000U, 16)) {
            return AddressClass::Private;
        }
        if (in_v4(v, 0x64400000U, 10)) {
            return AddressClass::Cgnat;
        }
        if (in_v4(v, 0xE0000000U, 4)) {
            return AddressClass::Multicast;
        }
        // "This network", IETF assignments, documentation, benchmarking,
        // and 240/4 including broadcast.
        if (in_v4(v, 0x00000000U, 8) || in_v4(v, 0xC0000000U, 24)
            || in_v4(v, 0xC0000200U, 24) || in_v4(v, 0xC6120000U, 15)
            || in_v4(v, 0xC6336400U, 24) || in_v4(v, 0xCB007100U, 24)
            || in_v4(v, 0xF0000000U, 4)) {
            return AddressClass::Reserved;
        }
        return AddressClass::Public;
    }


    static AddressClass classify_v6(const std::array<uint8_t, 16>& a) noexcept
    {
        bool zero_prefix = true;
        for (size_t i = 0; i < 15; ++i) {
            if (a[i] != 0) {
                zero_prefix = false;
                break;
            }
        }
        if (zero_prefix && a[15] == 0) {
            return AddressClass::Unspecified;
        }
        if (zero_prefix && a[15] == 1) {
            return AddressClass::Loopback;
        }

        bool mapped = a[10] == 0xFF && a[11] == 0xFF;
        for (size_t i = 0; i < 10 && mapped; ++i) {
            mapped = a[i] == 0;
        }
        if (mapped) {
            const uint32_t v4 = (static_cast<uint32_t>(a[12]) << 24)
                                | (static_cast<uint32_t>(a[13]) << 16)
                                | (static_cast<uint32_t>(a[14]) << 8)
                                | static_cast<uint32_t>(a[15]);
            return classify_v4(v4);
        }

        if (a[0] == 0xFE && (a[1] & 0xC0U) == 0x80U) {
            return AddressClass::LinkLocal;
        }
        if ((a[0] & 0xFEU) == 0xFCU) {
            return AddressClass::Private;
        }
        if (a[0] == 0xFF) {
            return AddressClass::Multicast;
        }
        // Only 2000::/3 is global unicast.
        if ((a[0] & 0xE0U) != 0x20U) {
            return AddressClass::Reserved;
        }
        // 2001::/23 (IETF), 2001:db8::/32 (documentation), 2002::/16 (6to4).
        if (a[0] == 0x20 && a[1] == 0x01 && (a[2] & 0xFEU) == 0x00U) {
            return AddressClass::Reserved;
        }
        if (a[0] == 0x20 && a[1] == 0x01 && a[2] == 0x0D && a[3] == 0xB8) {
            return AddressClass::Reserved;
        }
        if (a[0] == 0x20 && a[1] == 0x02) {
            return AddressClass::Reserved;
        }
        return AddressClass::Public;
    }


    static void append_unique(std::vector<std::string>* out, const char* s)
    {
        for (const std::string& existing : *out) {
            if (existing == s) {
                return;
            }
        }
        out->emplace_back(s);
    }


    static EgressStatus finish(EgressVerdict* verdict, EgressVerdict&& v)
    {
        const EgressStatus status = v.status;
        if (verdict) {
            *verdict = std::move(v);
        }
        return status;
    }

}  // namespace


const char*
egress_status_name(EgressStatus status) noexcept
{
    switch (status) {
    case EgressStatus::Ok: return "ok";
    case EgressStatus::UrlBlocked: return "url_blocked";
    case EgressStatus::PrivateAddress: return "private_address";
    }
    return "unknown";
}


const char*
egress_reason_name(EgressReason reason) noexcept
{
    switch (reason) {
    case EgressReason::None: return "none";
    case EgressReason::InvalidUrl: return "invalid_url";
    case EgressReason::LocalhostNotAllowed: return "localhost_not_allowed";
    case EgressReason::NotInAllowlist: return "not_in_allowlist";
    case EgressReason::BlockedAddress: return "blocked_address";
    case EgressReason::ResolveFailed: return "resolve_failed";
    }
    return "unknown";
}


const char*
address_class_name(AddressClass cls) noexcept
{
    switch (cls) {
    case AddressClass::Public: return "public";
    case AddressClass::Loopback: return "loopback";
    case AddressClass::LinkLocal: return "link_local";
    case AddressClass::Private: return "private";
    case AddressClass::Cgnat: return "cgnat";
    case AddressClass::Reserved: return "reserved";
    case AddressClass::Multicast: return "multicast";
    case AddressClass::Unspecified: return "unspecified";
    case AddressClass::Invalid: return "invalid";
    }
    return "unknown";
}


const char*
egress_error_code(EgressStatus status) noexcept
{
    switch (status) {
    case EgressStatus::Ok: return "";
    case EgressStatus::UrlBlocked: return "URL_BLOCKED";
    case EgressStatus::PrivateAddress: return "PRIVATE_IP_BLOCKED";
    }
    return "SECURITY_ERROR";
}


EgressPolicy
default_egress_policy()
{
    EgressPolicy policy;
    policy.allowlist = {
        "api.openai.com",
        "api.anthropic.com",
        "openrouter.ai",
        "generativelanguage.googleapis.com",
    };
    return policy;
}


bool
SystemHostResolver::resolve(std::string_view host,
                            std::vector<std::string>* out)
{
    const std::string name(host);

    addrinfo hints {};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    if (::getaddrinfo(name.c_str(), nullptr, &hints, &raw) != 0) {
        return false;
    }
    const std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> list(
        raw, &::freeaddrinfo);

    for (const addrinfo* p = list.get(); p != nullptr; p = p->ai_next) {
        char buf[INET6_ADDRSTRLEN] = {};
        if (p->ai_family == AF_INET) {
            const auto* sin = reinterpret_cast<const sockaddr_in*>(
                p->ai_addr);
            if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
                append_unique(out, buf);
            }
        } else if (p->ai_family == AF_INET6) {
            const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(
                p->ai_addr);
            if (::inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf))) {
                append_unique(out, buf);
            }
        }
    }
    return true;
}


bool
parse_url_host(std::string_view url, UrlParts* out)
{
    *out = UrlParts {};

    while (!url.empty() && is_space(url.front())) {
        url.remove_prefix(1);
    }
    while (!url.empty() && is_space(url.back())) {
        url.remove_suffix(1);
    }
    for (char c : url) {
        if (static_cast<unsigned char>(c) < 0x20U || c == 0x7F) {
            return false;
        }
    }

    const size_t colon = url.find(':');
    if (colon != std::string_view::npos && colon > 0) {
        bool scheme_ok = true;
        for (size_t i = 0; i < colon; ++i) {
            if (!is_scheme_char(url[i], i == 0)) {
                scheme_ok = false;
                break;
            }
        }
        if (scheme_ok) {
            out->scheme = to_lower(url.substr(0, colon));
            url.remove_prefix(colon + 1);
        }
    }

    if (url.substr(0, 2) != "//") {
        return false;
    }
    url.remove_prefix(2);

    std::string_view authority = url.substr(0, url.find_first_of("/?#"));
    const size_t at            = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host;
    std::string_view port;
    bool has_port = false;
    if (!authority.empty() && authority.front() == '[') {
        const size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return false;
        }
        host                        = authority.substr(1, close - 1);
        const std::string_view tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return false;
            }
            port     = tail.substr(1);
            has_port = true;
        }
    } else {
        const size_t p = authority.find(':');
        host           = authority.substr(0, p);
        if (p != std::string_view::npos) {
            port     = authority.substr(p + 1);
            has_port = true;
        }
    }

    if (host.empty()) {
        return false;
    }
    if (has_port && !port.empty()) {
        if (!parse_port(port, &out->port)) {
            return false;
        }
        out->has_port = true;
    }
    out->host = to_lower(host);
    return true;
}


AddressClass
classify_address(std::string_view address) noexcept
{
    const size_t zone = address.find('%');
    if (zone != std::string_view::npos) {
        address = address.substr(0, zone);
    }
    if (address.empty() || address.size() >= INET6_ADDRSTRLEN) {
        return AddressClass::Invalid;
    }

    char buf[INET6_ADDRSTRLEN] = {};
    address.copy(buf, address.size());

    in_addr v4 {};
    if (::inet_pton(AF_INET, buf, &v4) == 1) {
        return classify_v4(ntohl(v4.s_addr));
    }

    in6_addr v6 {};
    if (::inet_pton(AF_INET6, buf, &v6) == 1) {
        std::array<uint8_t, 16> a {};
        for (size_t i = 0; i < a.size(); ++i) {
            a[i] = v6.s6_addr[i];
        }
        return classify_v6(a);
    }
    return AddressClass::Invalid;
}


bool
is_blocked_address_class(AddressClass cls) noexcept
{
    return cls != AddressClass::Public;
}


bool
is_localhost_host(std::string_view host) noexcept
{
    char lower[256];
    if (host.empty() || host.size() >= sizeof(lower)) {
        return false;
    }
    for (size_t i = 0; i < host.size(); ++i) {
        lower[i] = ascii_lower(host[i]);
    }
    const std::string_view h(lower, host.size());

    if (h == "localhost" || h == "localhost.localdomain" || h == "127.0.0.1"
        || h == "::1" || h == "[::1]") {
        return true;
    }
    if (h.substr(0, 4) == "127.") {
        return true;
    }
    if (h.size() > 10 && h.substr(0, 10) == "localhost.") {
        for (char c : h.substr(10)) {
            if (!is_word_char(c)) {
                return false;
            }
        }
        return true;
    }
    return false;
}


bool
host_matches_allowlist(std::string_view host,
                       std::span<const std::string> allowlist) noexcept
{
    char lower[256];
    if (host.empty() || host.size() >= sizeof(lower)) {
        return false;
    }
    for (size_t i = 0; i < host.size(); ++i) {
        lower[i] = ascii_lower(host[i]);
    }
    const std::string_view h(lower, host.size());

    for (const std::string& entry : allowlist) {
        char pat_buf[256];
        if (entry.empty() || entry.size() >= sizeof(pat_buf)) {
            continue;
        }
        for (size_t i = 0; i < entry.size(); ++i) {
            pat_buf[i] = ascii_lower(entry[i]);
        }
        const std::string_view pattern(pat_buf, entry.size());

        if (pattern.substr(0, 2) == "*.") {
            // "*.d" covers d itself and anything ending in ".d".
            if (ends_with(h, pattern.substr(1)) || h == pattern.substr(2)) {
                return true;
            }
            continue;
        }
        if (h == pattern) {
            return true;
        }
        if (h.size() > pattern.size() && ends_with(h, pattern)
            && h[h.size() - pattern.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}


EgressStatus
validate_egress_url(std::string_view url, const EgressPolicy& policy,
                    HostResolver& resolver, EgressVerdict* verdict)
{
    EgressVerdict v;

    UrlParts parts;
    if (!parse_url_host(url, &parts)) {
        v.status = EgressStatus::UrlBlocked;
        v.reason = EgressReason::InvalidUrl;
        return finish(verdict, std::move(v));
    }
    v.host = parts.host;

    if (is_localhost_host(v.host)) {
        if (!policy.allow_localhost) {
            v.status = EgressStatus::UrlBlocked;
            v.reason = EgressReason::LocalhostNotAllowed;
        }
        return finish(verdict, std::move(v));
    }

    if (!host_matches_allowlist(v.host, policy.allowlist)) {
        v.status = EgressStatus::UrlBlocked;
        v.reason = EgressReason::NotInAllowlist;
        return finish(verdict, std::move(v));
    }

    // Resolved on every call; answers are never cached.
    std::vector<std::string> addresses;
    const bool resolved = resolver.resolve(v.host, &addresses);
    if (!resolved || addresses.empty()) {
        if (policy.fail_closed_on_resolve_error) {
            v.status = EgressStatus::UrlBlocked;
            v.reason = EgressReason::ResolveFailed;
        }
        return finish(verdict, std::move(v));
    }

    for (const std::string& address : addresses) {
        const AddressClass cls = classify_address(address);
        if (is_blocked_address_class(cls)) {
            v.status        = EgressStatus::PrivateAddress;
            v.reason        = EgressReason::BlockedAddress;
            v.address       = address;
            v.address_class = cls;
            return finish(verdict, std::move(v));
        }
    }
    return finish(verdict, std::move(v));
}


EgressStatus
validate_egress_url(std::string_view url, const EgressPolicy& policy,
                    EgressVerdict* verdict)
{
    SystemHostResolver resolver;
    return validate_egress_url(url, policy, resolver, verdict);
}


std::string
format_egress_message(const EgressVerdict& verdict)
{
    std::string msg;
    switch (verdict.reason) {
    case EgressReason::None: break;
    case EgressReason::InvalidUrl:
        msg = "Blocked URL: Invalid URL: no hostname";
        break;
    case EgressReason::LocalhostNotAllowed:
        msg = "Blocked URL: localhost access not allowed";
        break;
    case EgressReason::NotInAllowlist:
        msg = "Blocked URL: Host '";
        msg.append(verdict.host);
        msg.append("' not in allowlist");
        break;
    case EgressReason::BlockedAddress:
        msg = "Private/internal IP blocked: ";
        msg.append(verdict.address);
        break;
    case EgressReason::ResolveFailed:
        msg = "Blocked URL: Host '";
        msg.append(verdict.host);
        msg.append("' could not be resolved");
        break;
    }
    return msg;
}

}  // namespace cardforge
