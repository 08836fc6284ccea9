#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file egress_policy.h
 * \brief Outbound destination checks for proxy and importer clients (SSRF).
 *
 * A destination URL passes when its host is an allowed localhost variant, or
 * when the host is on the allowlist and none of its current DNS answers is a
 * loopback, link-local, private, CGNAT, reserved, multicast or unspecified
 * address. Hosts are resolved on every call; nothing is cached, so a host
 * that is repointed to an internal address is caught on the next request.
 */

namespace cardforge {

/// Egress validation result.
enum class EgressStatus : uint8_t {
    Ok,
    /// The URL is unparseable, a disallowed localhost, or not allowlisted.
    UrlBlocked,
    /// The host is allowlisted but resolves to a non-public address.
    PrivateAddress,
};

/// Why a destination was rejected.
enum class EgressReason : uint8_t {
    None,
    InvalidUrl,
    LocalhostNotAllowed,
    NotInAllowlist,
    BlockedAddress,
    /// Resolution failed and the policy is fail-closed.
    ResolveFailed,
};

/// Classification of a single IP address.
enum class AddressClass : uint8_t {
    Public,
    Loopback,
    LinkLocal,
    /// RFC 1918 (IPv4) or unique local fc00::/7 (IPv6).
    Private,
    /// Carrier-grade NAT, 100.64.0.0/10.
    Cgnat,
    Reserved,
    Multicast,
    Unspecified,
    /// Text that is not an IP address.
    Invalid,
};

const char*
egress_status_name(EgressStatus status) noexcept;

const char*
egress_reason_name(EgressReason reason) noexcept;

const char*
address_class_name(AddressClass cls) noexcept;

/// Service error code for \p status: "URL_BLOCKED", "PRIVATE_IP_BLOCKED", or
/// an empty string for \ref EgressStatus::Ok.
const char*
egress_error_code(EgressStatus status) noexcept;

/**
 * \brief Egress configuration, passed explicitly to every check.
 *
 * Allowlist entries are hostnames. `*.example.com` matches `example.com` and
 * every subdomain; a plain `example.com` also matches its subdomains.
 * Matching is case-insensitive.
 */
struct EgressPolicy final {
    std::vector<std::string> allowlist;
    /// Lets localhost variants through without an allowlist or DNS check.
    bool allow_localhost = false;
    /// Rejects allowlisted hosts that fail to resolve. Off by default, which
    /// lets them through.
    bool fail_closed_on_resolve_error = false;
};

/// Default policy: the public AI API hosts, localhost blocked, fail-open.
EgressPolicy
default_egress_policy();

/// Details of a validation decision.
struct EgressVerdict final {
    EgressStatus status = EgressStatus::Ok;
    EgressReason reason = EgressReason::None;
    /// Lowercased host from the URL (empty if none could be parsed).
    std::string host;
    /// The blocked address for \ref EgressStatus::PrivateAddress.
    std::string address;
    AddressClass address_class = AddressClass::Public;
};

/**
 * \brief Name resolution used by \ref validate_egress_url.
 *
 * Implementations must not cache answers across calls.
 */
class HostResolver {
public:
    virtual ~HostResolver() = default;

    /// Appends the numeric addresses of \p host to \p out. Returns false if
    /// resolution failed.
    virtual bool resolve(std::string_view host, std::vector<std::string>* out)
        = 0;
};

/// Resolves through the system resolver (getaddrinfo, IPv4 and IPv6).
class SystemHostResolver final : public HostResolver {
public:
    bool resolve(std::string_view host,
                 std::vector<std::string>* out) override;
};

/// Components of a URL authority.
struct UrlParts final {
    /// Lowercased scheme, empty if absent.
    std::string scheme;
    /// Lowercased host without IPv6 brackets.
    std::string host;
    uint16_t port = 0;
    bool has_port = false;
};

/**
 * \brief Extracts scheme, host and port from \p url.
 *
 * The authority must be introduced by `//`. Userinfo is skipped; IPv6 hosts
 * are written in brackets. Returns false if no host can be found.
 */
bool
parse_url_host(std::string_view url, UrlParts* out);

/// Classifies a numeric IPv4/IPv6 address. IPv6 zone suffixes are ignored.
AddressClass
classify_address(std::string_view address) noexcept;

/// True for every class except \ref AddressClass::Public.
bool
is_blocked_address_class(AddressClass cls) noexcept;

/// Matches `localhost`, `localhost.<word>`, `127.*`, `::1` and `[::1]`.
bool
is_localhost_host(std::string_view host) noexcept;

bool
host_matches_allowlist(std::string_view host,
                       std::span<const std::string> allowlist) noexcept;

/**
 * \brief Checks that \p url may be contacted under \p policy.
 *
 * Order: host extraction, localhost policy, allowlist, DNS resolution through
 * \p resolver, address classification. When \p verdict is non-null it
 * receives the decision details.
 */
EgressStatus
validate_egress_url(std::string_view url, const EgressPolicy& policy,
                    HostResolver& resolver, EgressVerdict* verdict = nullptr);

/// Same as above with a \ref SystemHostResolver.
EgressStatus
validate_egress_url(std::string_view url, const EgressPolicy& policy,
                    EgressVerdict* verdict = nullptr);

/// Human-readable message for a rejected verdict (e.g. "Blocked URL: ...").
std::string
format_egress_message(const EgressVerdict& verdict);

}  // namespace cardforge
