#include "cardforge/build_info.h"
#include "cardforge/build_info_generated.h"
#include "cardforge/card_chunks.h"
#include "cardforge/console_format.h"
#include "cardforge/egress_policy.h"
#include "cardforge/redact.h"
#include "cardforge/resource_policy.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace cardforge {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::span<const std::byte> py_bytes(const nb::bytes& data) noexcept
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size());
    }


    static nb::bytes to_py_bytes(const std::vector<std::byte>& bytes)
    {
        return nb::bytes(reinterpret_cast<const char*>(bytes.data()),
                         bytes.size());
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static CardResourcePolicy policy_from_object(const nb::object& obj)
    {
        CardResourcePolicy policy;
        if (!obj.is_none()) {
            policy = nb::cast<CardResourcePolicy>(obj);
        }
        return policy;
    }


    static CardChunkOptions make_options(const CardResourcePolicy& policy)
    {
        CardChunkOptions options;
        apply_resource_policy(policy, &options);
        return options;
    }


    static void check_input_size(std::span<const std::byte> png,
                                 const CardResourcePolicy& policy)
    {
        if (policy.max_input_bytes != 0U
            && png.size() > policy.max_input_bytes) {
            throw nb::value_error("input too large");
        }
    }


    static void throw_png_status(PngStatus status)
    {
        throw nb::value_error(png_status_name(status));
    }


    static nb::dict py_read_text_chunks(const nb::bytes& png,
                                        const nb::object& policy_obj)
    {
        const CardResourcePolicy policy = policy_from_object(policy_obj);
        const std::span<const std::byte> bytes = py_bytes(png);
        check_input_size(bytes, policy);

        TextChunkMap texts;
        PngStatus st = PngStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            st = read_text_chunks(bytes, &texts, make_options(policy));
        }
        if (st != PngStatus::Ok) {
            throw_png_status(st);
        }

        nb::dict d;
        for (const auto& [keyword, text] : texts) {
            d[sv_to_py(keyword)] = sv_to_py(text);
        }
        return d;
    }


    static nb::bytes py_inject_text_chunk(const nb::bytes& png,
                                          const std::string& keyword,
                                          const std::string& text,
                                          bool replace,
                                          const nb::object& policy_obj)
    {
        const CardResourcePolicy policy = policy_from_object(policy_obj);
        const std::span<const std::byte> bytes = py_bytes(png);
        check_input_size(bytes, policy);

        CardChunkOptions options = make_options(policy);
        options.replace          = replace;

        std::vector<std::byte> out;
        PngStatus st = PngStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            st = inject_text_chunk(bytes, keyword, text, &out, options);
        }
        if (st != PngStatus::Ok) {
            throw_png_status(st);
        }
        return to_py_bytes(out);
    }


    static nb::bytes py_remove_text_chunks(const nb::bytes& png,
                                           const std::string& keyword,
                                           const nb::object& policy_obj)
    {
        const CardResourcePolicy policy = policy_from_object(policy_obj);
        const std::span<const std::byte> bytes = py_bytes(png);
        check_input_size(bytes, policy);

        std::vector<std::byte> out;
        PngStatus st = PngStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            st = remove_text_chunks(bytes, keyword, &out,
                                    make_options(policy));
        }
        if (st != PngStatus::Ok) {
            throw_png_status(st);
        }
        return to_py_bytes(out);
    }


    static nb::object py_find_card_payload(const nb::bytes& png,
                                           const nb::object& policy_obj)
    {
        const CardResourcePolicy policy = policy_from_object(policy_obj);
        const std::span<const std::byte> bytes = py_bytes(png);
        check_input_size(bytes, policy);

        CardPayload payload;
        PngStatus st = PngStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            st = find_card_payload(bytes, &payload, make_options(policy));
        }
        if (st == PngStatus::NotFound) {
            return nb::none();
        }
        if (st != PngStatus::Ok) {
            throw_png_status(st);
        }
        return nb::make_tuple(payload.source, sv_to_py(payload.json));
    }


    static nb::bytes py_embed_card_payloads(const nb::bytes& png,
                                            const std::string& v3_json,
                                            const std::string& v2_json,
                                            const nb::object& policy_obj)
    {
        const CardResourcePolicy policy = policy_from_object(policy_obj);
        const std::span<const std::byte> bytes = py_bytes(png);
        check_input_size(bytes, policy);

        std::vector<std::byte> out;
        PngStatus st = PngStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            st = embed_card_payloads(bytes, v3_json, v2_json, &out,
                                     make_options(policy));
        }
        if (st != PngStatus::Ok) {
            throw_png_status(st);
        }
        return to_py_bytes(out);
    }


    static EgressVerdict py_validate_egress_url(const std::string& url,
                                                const EgressPolicy& policy)
    {
        EgressVerdict verdict;
        EgressStatus st = EgressStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            st = validate_egress_url(url, policy, &verdict);
        }
        if (st != EgressStatus::Ok) {
            const std::string message = redact_sensitive_text(
                format_egress_message(verdict));
            PyErr_SetString(PyExc_PermissionError, message.c_str());
            throw nb::python_error();
        }
        return verdict;
    }


    static std::pair<std::string, bool> console_text(const nb::bytes& data,
                                                     uint32_t max_bytes)
    {
        const std::string_view s(reinterpret_cast<const char*>(data.data()),
                                 data.size());
        std::string out;
        const bool escaped = append_console_escaped_ascii(s, max_bytes, &out);
        return { std::move(out), escaped };
    }

}  // namespace
}  // namespace cardforge

NB_MODULE(_cardforge, m)
{
    using namespace cardforge;

    m.doc()               = "CardForge character card PNG bindings (nanobind).";
    m.attr("__version__") = CARDFORGE_VERSION_STRING;

    nb::enum_<PngStatus>(m, "PngStatus")
        .value("Ok", PngStatus::Ok)
        .value("InvalidFormat", PngStatus::InvalidFormat)
        .value("InvalidKeyword", PngStatus::InvalidKeyword)
        .value("InvalidText", PngStatus::InvalidText)
        .value("NotFound", PngStatus::NotFound)
        .value("LimitExceeded", PngStatus::LimitExceeded);

    nb::enum_<CardSource>(m, "CardSource")
        .value("Ccv3", CardSource::Ccv3)
        .value("Chara", CardSource::Chara);

    nb::enum_<CardFileType>(m, "CardFileType")
        .value("Png", CardFileType::Png)
        .value("Json", CardFileType::Json)
        .value("Image", CardFileType::Image);

    nb::enum_<EgressStatus>(m, "EgressStatus")
        .value("Ok", EgressStatus::Ok)
        .value("UrlBlocked", EgressStatus::UrlBlocked)
        .value("PrivateAddress", EgressStatus::PrivateAddress);

    nb::enum_<EgressReason>(m, "EgressReason")
        .value("None_", EgressReason::None)
        .value("InvalidUrl", EgressReason::InvalidUrl)
        .value("LocalhostNotAllowed", EgressReason::LocalhostNotAllowed)
        .value("NotInAllowlist", EgressReason::NotInAllowlist)
        .value("BlockedAddress", EgressReason::BlockedAddress)
        .value("ResolveFailed", EgressReason::ResolveFailed);

    nb::enum_<AddressClass>(m, "AddressClass")
        .value("Public", AddressClass::Public)
        .value("Loopback", AddressClass::Loopback)
        .value("LinkLocal", AddressClass::LinkLocal)
        .value("Private", AddressClass::Private)
        .value("Cgnat", AddressClass::Cgnat)
        .value("Reserved", AddressClass::Reserved)
        .value("Multicast", AddressClass::Multicast)
        .value("Unspecified", AddressClass::Unspecified)
        .value("Invalid", AddressClass::Invalid);

    nb::class_<PngParseLimits>(m, "PngParseLimits")
        .def(nb::init<>())
        .def_rw("max_chunks", &PngParseLimits::max_chunks)
        .def_rw("max_chunk_bytes", &PngParseLimits::max_chunk_bytes);

    nb::class_<TextDecodeLimits>(m, "TextDecodeLimits")
        .def(nb::init<>())
        .def_rw("max_inflate_bytes", &TextDecodeLimits::max_inflate_bytes);

    nb::class_<CardResourcePolicy>(m, "CardResourcePolicy")
        .def(nb::init<>())
        .def_rw("max_input_bytes", &CardResourcePolicy::max_input_bytes)
        .def_rw("png_limits", &CardResourcePolicy::png_limits)
        .def_rw("text_limits", &CardResourcePolicy::text_limits);

    nb::class_<EgressPolicy>(m, "EgressPolicy")
        .def(nb::init<>())
        .def_rw("allowlist", &EgressPolicy::allowlist)
        .def_rw("allow_localhost", &EgressPolicy::allow_localhost)
        .def_rw("fail_closed_on_resolve_error",
                &EgressPolicy::fail_closed_on_resolve_error);

    nb::class_<EgressVerdict>(m, "EgressVerdict")
        .def_ro("status", &EgressVerdict::status)
        .def_ro("reason", &EgressVerdict::reason)
        .def_ro("host", &EgressVerdict::host)
        .def_ro("address", &EgressVerdict::address)
        .def_ro("address_class", &EgressVerdict::address_class);

    m.def("default_egress_policy", &default_egress_policy);

    m.def("read_text_chunks", &py_read_text_chunks, "png"_a,
          "policy"_a = nb::none());
    m.def("inject_text_chunk", &py_inject_text_chunk, "png"_a, "keyword"_a,
          "text"_a, "replace"_a = true, "policy"_a = nb::none());
    m.def("remove_text_chunks", &py_remove_text_chunks, "png"_a, "keyword"_a,
          "policy"_a = nb::none());
    m.def("find_card_payload", &py_find_card_payload, "png"_a,
          "policy"_a = nb::none());
    m.def("embed_card_payloads", &py_embed_card_payloads, "png"_a,
          "v3_json"_a, "v2_json"_a = std::string(), "policy"_a = nb::none());
    m.def(
        "detect_card_file_type",
        [](const nb::bytes& data) {
            return detect_card_file_type(py_bytes(data));
        },
        "data"_a);

    m.def("validate_egress_url", &py_validate_egress_url, "url"_a,
          "policy"_a = default_egress_policy());
    m.def(
        "classify_address",
        [](const std::string& address) { return classify_address(address); },
        "address"_a);
    m.def("redact_sensitive_text",
          [](const std::string& text) { return redact_sensitive_text(text); },
          "text"_a);

    m.def("console_text", &console_text, "data"_a, "max_bytes"_a = 4096U);
    m.def("info_lines", &info_lines);
}
