#include "cardforge/build_info.h"
#include "cardforge/card_chunks.h"
#include "cardforge/console_format.h"
#include "cardforge/egress_policy.h"
#include "cardforge/png_chunks.h"
#include "cardforge/png_text.h"
#include "cardforge/redact.h"
#include "cardforge/resource_policy.h"

#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cardforge {
namespace {

    enum class ReadFileStatus : uint8_t {
        Ok,
        OpenFailed,
        IoFailed,
        TooLarge,
    };

    struct ToolOptions final {
        CardResourcePolicy policy;
        uint32_t max_print_bytes = 256;
    };

    struct CommandArgs final {
        std::vector<const char*> positional;
        const char* out_path = nullptr;
        bool no_replace      = false;
        std::vector<std::string> allow;
        bool allow_localhost = false;
        bool fail_closed     = false;
    };

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <command> [args]\n", argv0);
        std::printf("commands:\n");
        std::printf("  read FILE                           list text chunks and the card source\n");
        std::printf("  extract FILE [-o OUT]               write the card JSON (ccv3 over chara)\n");
        std::printf("  inject FILE KEYWORD TEXTFILE -o OUT  write TEXTFILE as a tEXt chunk\n");
        std::printf("  embed FILE V3JSON [V2JSON] -o OUT   embed ccv3 (and chara) payloads\n");
        std::printf("  remove FILE KEYWORD -o OUT          drop text chunks with KEYWORD\n");
        std::printf("  check-url URL [URL...]              validate outbound destinations\n");
        std::printf("  redact TEXT [TEXT...]               scrub credentials from TEXT\n");
        std::printf("options:\n");
        std::printf("  --version            print build info and exit\n");
        std::printf(
            "  --max-file-bytes N   refuse to read files larger than N bytes (default: 20971520; 0=unlimited)\n");
        std::printf(
            "  --max-bytes N        max bytes to print for chunk text (default: 256)\n");
        std::printf("inject options:\n");
        std::printf("  --no-replace         add a chunk even if KEYWORD exists\n");
        std::printf("check-url options:\n");
        std::printf("  --allow HOST         add HOST to the allowlist (repeatable)\n");
        std::printf("  --allow-localhost    let localhost destinations through\n");
        std::printf("  --fail-closed        block hosts that fail to resolve\n");
        std::printf("environment:\n");
        std::printf("  CARDFORGE_PROXY_URL_ALLOWLIST    comma-separated allowlist (replaces the default)\n");
        std::printf("  CARDFORGE_PROXY_ALLOW_LOCALHOST  1/true/yes/on allows localhost\n");
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    struct FileCloser final {
        void operator()(std::FILE* f) const noexcept { std::fclose(f); }
    };

    using FilePtr = std::unique_ptr<std::FILE, FileCloser>;


    // Reads in blocks rather than sizing the file up front, so pipes and
    // character devices work. Reading stops as soon as the total would pass
    // `max_bytes` (0 means unlimited).
    static ReadFileStatus read_file_bytes(const char* path, uint64_t max_bytes,
                                          std::vector<std::byte>* out)
    {
        out->clear();
        const FilePtr f(std::fopen(path, "rb"));
        if (!f) {
            return ReadFileStatus::OpenFailed;
        }

        std::array<std::byte, 64 * 1024> block;
        for (;;) {
            const size_t n = std::fread(block.data(), 1, block.size(), f.get());
            if (max_bytes != 0U
                && static_cast<uint64_t>(out->size()) + n > max_bytes) {
                out->clear();
                return ReadFileStatus::TooLarge;
            }
            out->insert(out->end(), block.begin(), block.begin() + n);
            if (n < block.size()) {
                break;
            }
        }
        if (std::ferror(f.get())) {
            out->clear();
            return ReadFileStatus::IoFailed;
        }
        return ReadFileStatus::Ok;
    }


    static bool load_file(const char* path, const ToolOptions& options,
                          std::vector<std::byte>* out)
    {
        const uint64_t max      = options.policy.max_input_bytes;
        const ReadFileStatus st = read_file_bytes(path, max, out);
        if (st == ReadFileStatus::Ok) {
            return true;
        }
        std::string shown;
        append_console_escaped_ascii(path, 0, &shown);
        switch (st) {
        case ReadFileStatus::TooLarge:
            std::fprintf(stderr,
                         "cardtool: `%s` is larger than --max-file-bytes=%llu\n",
                         shown.c_str(), static_cast<unsigned long long>(max));
            break;
        case ReadFileStatus::OpenFailed:
            std::fprintf(stderr, "cardtool: cannot open `%s`\n",
                         shown.c_str());
            break;
        default:
            std::fprintf(stderr, "cardtool: read error on `%s`\n",
                         shown.c_str());
            break;
        }
        return false;
    }


    static bool write_file_bytes(const char* path,
                                 std::span<const std::byte> bytes)
    {
        std::FILE* f = std::fopen(path, "wb");
        if (!f) {
            return false;
        }
        size_t written = 0;
        if (!bytes.empty()) {
            written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        }
        const bool closed = std::fclose(f) == 0;
        return closed && written == bytes.size();
    }


    static bool save_file(const char* path, std::span<const std::byte> bytes)
    {
        if (write_file_bytes(path, bytes)) {
            return true;
        }
        std::string shown;
        append_console_escaped_ascii(path, 0, &shown);
        std::fprintf(stderr, "cardtool: failed to write `%s`\n",
                     shown.c_str());
        return false;
    }


    static std::string_view as_text(std::span<const std::byte> bytes) noexcept
    {
        return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                                bytes.size());
    }


    static std::span<const std::byte> as_bytes(std::string_view s) noexcept
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(s.data()), s.size());
    }


    static int report_png_failure(const char* path, PngStatus status)
    {
        std::string shown;
        append_console_escaped_ascii(path, 0, &shown);
        std::fprintf(stderr, "cardtool: `%s`: %s\n", shown.c_str(),
                     png_status_name(status));
        return 1;
    }


    static const char* text_kind_name(TextChunkKind kind) noexcept
    {
        switch (kind) {
        case TextChunkKind::Plain: return "plain";
        case TextChunkKind::Compressed: return "compressed";
        case TextChunkKind::International: return "international";
        }
        return "unknown";
    }


    static bool env_flag(const char* name) noexcept
    {
        const char* v = std::getenv(name);
        if (!v) {
            return false;
        }
        std::string lowered;
        for (const char* p = v; *p; ++p) {
            lowered.push_back(static_cast<char>(
                std::tolower(static_cast<unsigned char>(*p))));
        }
        return lowered == "1" || lowered == "true" || lowered == "yes"
               || lowered == "on";
    }


    static void split_allowlist(std::string_view list,
                                std::vector<std::string>* out)
    {
        out->clear();
        while (!list.empty()) {
            const size_t comma     = list.find(',');
            std::string_view entry = list.substr(0, comma);
            const size_t first     = entry.find_first_not_of(" \t");
            const size_t last      = entry.find_last_not_of(" \t");
            if (first != std::string_view::npos) {
                out->emplace_back(entry.substr(first, last - first + 1));
            }
            if (comma == std::string_view::npos) {
                break;
            }
            list.remove_prefix(comma + 1);
        }
    }


    // Returns false on an unknown option or a missing option value.
    static bool parse_command_args(int argc, char** argv, int first,
                                   CommandArgs* out)
    {
        for (int i = first; i < argc; ++i) {
            const char* arg = argv[i];
            if (!arg) {
                continue;
            }
            if (std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--out") == 0) {
                if (i + 1 >= argc) {
                    std::fprintf(stderr, "cardtool: %s needs a path\n", arg);
                    return false;
                }
                out->out_path = argv[++i];
                continue;
            }
            if (std::strcmp(arg, "--allow") == 0) {
                if (i + 1 >= argc) {
                    std::fprintf(stderr, "cardtool: --allow needs a host\n");
                    return false;
                }
                out->allow.emplace_back(argv[++i]);
                continue;
            }
            if (std::strcmp(arg, "--no-replace") == 0) {
                out->no_replace = true;
                continue;
            }
            if (std::strcmp(arg, "--allow-localhost") == 0) {
                out->allow_localhost = true;
                continue;
            }
            if (std::strcmp(arg, "--fail-closed") == 0) {
                out->fail_closed = true;
                continue;
            }
            if (arg[0] == '-' && arg[1] == '-') {
                std::string shown;
                append_console_escaped_ascii(arg, 64, &shown);
                std::fprintf(stderr, "cardtool: unknown option `%s`\n",
                             shown.c_str());
                return false;
            }
            out->positional.push_back(arg);
        }
        return true;
    }


    static int cmd_read(const CommandArgs& args, const ToolOptions& options)
    {
        if (args.positional.size() != 1) {
            return 2;
        }
        const char* path = args.positional[0];

        std::vector<std::byte> bytes;
        if (!load_file(path, options, &bytes)) {
            return 1;
        }

        std::string shown;
        append_console_escaped_ascii(path, 0, &shown);
        std::printf("== %s\n", shown.c_str());
        std::printf("size=%zu type=%s\n", bytes.size(),
                    card_file_type_name(detect_card_file_type(bytes)));

        CardChunkOptions chunk_options;
        apply_resource_policy(options.policy, &chunk_options);

        std::vector<PngChunk> chunks;
        const PngParseResult res = parse_png_chunks(bytes, &chunks,
                                                    chunk_options.parse);
        if (res.status != PngStatus::Ok) {
            return report_png_failure(path, res.status);
        }
        std::printf("chunks=%u iend=%s truncated=%s trailing=%llu\n",
                    res.chunks, res.saw_iend ? "yes" : "no",
                    res.truncated ? "yes" : "no",
                    static_cast<unsigned long long>(res.trailing_bytes));

        for (size_t i = 0; i < chunks.size(); ++i) {
            const PngChunk& chunk = chunks[i];
            const std::string fcc = format_fourcc(chunk.type);
            if (!is_text_chunk_type(chunk.type)) {
                std::printf("[%zu] %s bytes=%zu\n", i, fcc.c_str(),
                            chunk.data.size());
                continue;
            }

            TextRecord rec;
            const TextDecodeStatus st = decode_text_chunk(
                chunk.type, chunk.data, &rec, chunk_options.decode);
            if (st != TextDecodeStatus::Ok) {
                std::string hex;
                append_hex_bytes(chunk.data, 16, &hex);
                std::printf("[%zu] %s bytes=%zu %s data=%s\n", i, fcc.c_str(),
                            chunk.data.size(), text_decode_status_name(st),
                            hex.c_str());
                continue;
            }

            std::string keyword;
            append_console_escaped_ascii(rec.keyword, 80, &keyword);
            std::string text;
            append_console_escaped_ascii(rec.text, options.max_print_bytes,
                                         &text);
            std::printf("[%zu] %s keyword=\"%s\" kind=%s text_bytes=%zu\n", i,
                        fcc.c_str(), keyword.c_str(), text_kind_name(rec.kind),
                        rec.text.size());
            std::printf("      \"%s\"\n", text.c_str());
        }

        CardPayload payload;
        const PngStatus st = find_card_payload(bytes, &payload,
                                               chunk_options);
        if (st == PngStatus::Ok) {
            std::printf("card=%s json_bytes=%zu\n",
                        card_source_name(payload.source), payload.json.size());
        } else {
            std::printf("card=none\n");
        }
        return 0;
    }


    static int cmd_extract(const CommandArgs& args, const ToolOptions& options)
    {
        if (args.positional.size() != 1) {
            return 2;
        }
        const char* path = args.positional[0];

        std::vector<std::byte> bytes;
        if (!load_file(path, options, &bytes)) {
            return 1;
        }

        CardChunkOptions chunk_options;
        apply_resource_policy(options.policy, &chunk_options);

        CardPayload payload;
        const PngStatus st = find_card_payload(bytes, &payload,
                                               chunk_options);
        if (st != PngStatus::Ok) {
            return report_png_failure(path, st);
        }

        if (args.out_path) {
            return save_file(args.out_path, as_bytes(payload.json)) ? 0 : 1;
        }
        // Raw JSON on stdout so it can be piped.
        std::fwrite(payload.json.data(), 1, payload.json.size(), stdout);
        std::fputc('\n', stdout);
        return 0;
    }


    static int cmd_inject(const CommandArgs& args, const ToolOptions& options)
    {
        if (args.positional.size() != 3 || !args.out_path) {
            return 2;
        }
        const char* path = args.positional[0];

        std::vector<std::byte> png;
        std::vector<std::byte> text;
        if (!load_file(path, options, &png)
            || !load_file(args.positional[2], options, &text)) {
            return 1;
        }

        CardChunkOptions chunk_options;
        apply_resource_policy(options.policy, &chunk_options);
        chunk_options.replace = !args.no_replace;

        std::vector<std::byte> out;
        const PngStatus st = inject_text_chunk(png, args.positional[1],
                                               as_text(text), &out,
                                               chunk_options);
        if (st != PngStatus::Ok) {
            return report_png_failure(path, st);
        }
        return save_file(args.out_path, out) ? 0 : 1;
    }


    static int cmd_embed(const CommandArgs& args, const ToolOptions& options)
    {
        if (args.positional.size() < 2 || args.positional.size() > 3
            || !args.out_path) {
            return 2;
        }
        const char* path = args.positional[0];

        std::vector<std::byte> png;
        std::vector<std::byte> v3;
        std::vector<std::byte> v2;
        if (!load_file(path, options, &png)
            || !load_file(args.positional[1], options, &v3)) {
            return 1;
        }
        if (args.positional.size() == 3
            && !load_file(args.positional[2], options, &v2)) {
            return 1;
        }

        CardChunkOptions chunk_options;
        apply_resource_policy(options.policy, &chunk_options);

        std::vector<std::byte> out;
        const PngStatus st = embed_card_payloads(png, as_text(v3), as_text(v2),
                                                 &out, chunk_options);
        if (st != PngStatus::Ok) {
            return report_png_failure(path, st);
        }
        return save_file(args.out_path, out) ? 0 : 1;
    }


    static int cmd_remove(const CommandArgs& args, const ToolOptions& options)
    {
        if (args.positional.size() != 2 || !args.out_path) {
            return 2;
        }
        const char* path = args.positional[0];

        std::vector<std::byte> png;
        if (!load_file(path, options, &png)) {
            return 1;
        }

        CardChunkOptions chunk_options;
        apply_resource_policy(options.policy, &chunk_options);

        std::vector<std::byte> out;
        const PngStatus st = remove_text_chunks(png, args.positional[1], &out,
                                                chunk_options);
        if (st != PngStatus::Ok) {
            return report_png_failure(path, st);
        }
        return save_file(args.out_path, out) ? 0 : 1;
    }


    static int cmd_check_url(const CommandArgs& args)
    {
        if (args.positional.empty()) {
            return 2;
        }

        EgressPolicy policy = default_egress_policy();
        if (const char* env = std::getenv("CARDFORGE_PROXY_URL_ALLOWLIST")) {
            split_allowlist(env, &policy.allowlist);
        }
        policy.allow_localhost = env_flag("CARDFORGE_PROXY_ALLOW_LOCALHOST")
                                 || args.allow_localhost;
        policy.fail_closed_on_resolve_error = args.fail_closed;
        for (const std::string& host : args.allow) {
            policy.allowlist.push_back(host);
        }

        SystemHostResolver resolver;
        int exit_code = 0;
        for (const char* url : args.positional) {
            EgressVerdict verdict;
            const EgressStatus st = validate_egress_url(url, policy, resolver,
                                                        &verdict);
            std::string shown;
            append_console_redacted(url, 512, &shown);
            if (st == EgressStatus::Ok) {
                std::string host;
                append_console_escaped_ascii(verdict.host, 256, &host);
                std::printf("ok %s host=%s\n", shown.c_str(), host.c_str());
                continue;
            }

            std::string message;
            append_console_redacted(format_egress_message(verdict), 512,
                                    &message);
            std::printf("blocked %s %s reason=%s: %s\n", shown.c_str(),
                        egress_error_code(st),
                        egress_reason_name(verdict.reason), message.c_str());
            exit_code = 1;
        }
        return exit_code;
    }


    static int cmd_redact(const CommandArgs& args)
    {
        if (args.positional.empty()) {
            return 2;
        }
        for (const char* text : args.positional) {
            std::string line;
            append_console_redacted(text, 0, &line);
            std::printf("%s\n", line.c_str());
        }
        return 0;
    }

}  // namespace
}  // namespace cardforge

int
main(int argc, char** argv)
{
    using namespace cardforge;

    ToolOptions options;

    int first = 1;
    for (; first < argc; ++first) {
        const char* arg = argv[first];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && first + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[first + 1], &v)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            options.policy.max_input_bytes = v;
            first += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && first + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[first + 1], &v)) {
                std::fprintf(stderr, "invalid --max-bytes value\n");
                return 2;
            }
            options.max_print_bytes = v;
            first += 1;
            continue;
        }
        break;
    }

    if (first >= argc || !argv[first]) {
        usage(argv[0]);
        return 2;
    }

    const std::string_view command = argv[first];
    CommandArgs args;
    if (!parse_command_args(argc, argv, first + 1, &args)) {
        return 2;
    }

    int rc = 2;
    if (command == "read") {
        rc = cmd_read(args, options);
    } else if (command == "extract") {
        rc = cmd_extract(args, options);
    } else if (command == "inject") {
        rc = cmd_inject(args, options);
    } else if (command == "embed") {
        rc = cmd_embed(args, options);
    } else if (command == "remove") {
        rc = cmd_remove(args, options);
    } else if (command == "check-url") {
        rc = cmd_check_url(args);
    } else if (command == "redact") {
        rc = cmd_redact(args);
    }

    if (rc == 2) {
        usage(argv[0]);
    }
    return rc;
}
