#include "cardforge/card_chunks.h"
#include "cardforge/resource_policy.h"

#include <gtest/gtest.h>

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cardforge {
namespace {

    static std::vector<std::byte> bytes_of(std::string_view s)
    {
        std::vector<std::byte> out;
        for (char c : s) {
            out.push_back(std::byte { static_cast<uint8_t>(c) });
        }
        return out;
    }


    static PngChunk make_chunk(uint32_t type, std::string_view data)
    {
        PngChunk chunk;
        chunk.type = type;
        chunk.data = bytes_of(data);
        return chunk;
    }


    static PngChunk make_plain(std::string_view keyword, std::string_view text)
    {
        PngChunk chunk;
        chunk.type = kChunkText;
        EXPECT_EQ(encode_plain_text(keyword, text, &chunk.data),
                  TextEncodeStatus::Ok);
        return chunk;
    }


    static PngChunk make_ztxt(std::string_view keyword, std::string_view text)
    {
        uLongf size = compressBound(static_cast<uLong>(text.size()));
        std::string packed(static_cast<size_t>(size), '\0');
        EXPECT_EQ(::compress(reinterpret_cast<Bytef*>(packed.data()), &size,
                             reinterpret_cast<const Bytef*>(text.data()),
                             static_cast<uLong>(text.size())),
                  Z_OK);
        packed.resize(static_cast<size_t>(size));

        std::string data(keyword);
        data.push_back('\0');
        data.push_back('\0');
        data.append(packed);
        return make_chunk(kChunkZtxt, data);
    }


    static PngChunk make_itxt(std::string_view keyword, std::string_view text)
    {
        std::string data(keyword);
        data.append(std::string_view("\0\0\0en\0\0", 7));
        data.append(text);
        return make_chunk(kChunkItxt, data);
    }


    static std::vector<PngChunk> base_chunks()
    {
        std::vector<PngChunk> chunks;
        chunks.push_back(make_chunk(
            kChunkIHDR, std::string_view("\0\0\0\2\0\0\0\2\x08\x06\0\0\0", 13)));
        chunks.push_back(make_chunk(fourcc('g', 'A', 'M', 'A'),
                                    std::string_view("\0\0\xB1\x8F", 4)));
        chunks.push_back(make_chunk(kChunkIDAT, "first idat block"));
        chunks.push_back(make_chunk(kChunkIDAT, "second idat block"));
        chunks.push_back(make_chunk(kChunkIEND, ""));
        return chunks;
    }


    static std::vector<std::byte> make_png(std::span<const PngChunk> chunks)
    {
        std::vector<std::byte> png;
        serialize_png_chunks(chunks, &png);
        return png;
    }


    static std::vector<PngChunk> parse_ok(std::span<const std::byte> png)
    {
        std::vector<PngChunk> chunks;
        EXPECT_EQ(parse_png_chunks(png, &chunks).status, PngStatus::Ok);
        return chunks;
    }


    static std::string keyword_of(const PngChunk& chunk)
    {
        TextRecord rec;
        if (decode_text_chunk(chunk.type, chunk.data, &rec)
            != TextDecodeStatus::Ok) {
            return std::string();
        }
        return rec.keyword;
    }


    static size_t count_keyword(std::span<const PngChunk> chunks,
                                std::string_view keyword)
    {
        size_t n = 0;
        for (const PngChunk& chunk : chunks) {
            if (is_text_chunk_type(chunk.type) && keyword_of(chunk) == keyword) {
                n += 1;
            }
        }
        return n;
    }


    // Chunks other than text chunks carrying `keyword`, in order.
    static std::vector<PngChunk>
    without_keyword(std::span<const PngChunk> chunks, std::string_view keyword)
    {
        std::vector<PngChunk> out;
        for (const PngChunk& chunk : chunks) {
            if (is_text_chunk_type(chunk.type) && keyword_of(chunk) == keyword) {
                continue;
            }
            out.push_back(chunk);
        }
        return out;
    }


    static void expect_same_chunks(std::span<const PngChunk> a,
                                   std::span<const PngChunk> b)
    {
        ASSERT_EQ(a.size(), b.size());
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT_EQ(a[i].type, b[i].type) << "chunk " << i;
            EXPECT_EQ(a[i].data, b[i].data) << "chunk " << i;
        }
    }


    TEST(CardChunks, ReadMergesAllTextKinds)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_plain("chara", "{\"v\":2}"));
        chunks.insert(chunks.begin() + 2, make_ztxt("Comment", "packed"));
        chunks.insert(chunks.begin() + 3, make_itxt("Title", "intl"));
        const std::vector<std::byte> png = make_png(chunks);

        TextChunkMap texts;
        ASSERT_EQ(read_text_chunks(png, &texts), PngStatus::Ok);
        ASSERT_EQ(texts.size(), 3U);
        EXPECT_EQ(texts["chara"], "{\"v\":2}");
        EXPECT_EQ(texts["Comment"], "packed");
        EXPECT_EQ(texts["Title"], "intl");
    }


    TEST(CardChunks, ReadLaterChunkWins)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_plain("k", "first"));
        chunks.insert(chunks.end() - 1, make_itxt("k", "second"));
        const std::vector<std::byte> png = make_png(chunks);

        TextChunkMap texts;
        ASSERT_EQ(read_text_chunks(png, &texts), PngStatus::Ok);
        EXPECT_EQ(texts["k"], "second");
    }


    TEST(CardChunks, ReadSkipsUnreadableChunks)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_chunk(kChunkText, "no nul"));
        chunks.insert(chunks.begin() + 2,
                      make_chunk(kChunkZtxt,
                                 std::string_view("k\0\0broken", 9)));
        chunks.insert(chunks.begin() + 3, make_plain("ok", "value"));
        const std::vector<std::byte> png = make_png(chunks);

        TextChunkMap texts;
        ASSERT_EQ(read_text_chunks(png, &texts), PngStatus::Ok);
        ASSERT_EQ(texts.size(), 1U);
        EXPECT_EQ(texts["ok"], "value");
    }


    TEST(CardChunks, ReadRejectsNonPng)
    {
        TextChunkMap texts;
        EXPECT_EQ(read_text_chunks(bytes_of("{\"spec\":\"chara_card_v3\"}"),
                                   &texts),
                  PngStatus::InvalidFormat);
        EXPECT_TRUE(texts.empty());
    }


    TEST(CardChunks, ReadWithoutTextIsEmpty)
    {
        const std::vector<PngChunk> chunks = base_chunks();
        TextChunkMap texts;
        ASSERT_EQ(read_text_chunks(make_png(chunks), &texts), PngStatus::Ok);
        EXPECT_TRUE(texts.empty());
    }


    TEST(CardChunks, InjectGoesBeforeIend)
    {
        const std::vector<PngChunk> chunks = base_chunks();
        const std::vector<std::byte> png   = make_png(chunks);

        std::vector<std::byte> out;
        ASSERT_EQ(inject_text_chunk(png, "ccv3", "{}", &out), PngStatus::Ok);

        const std::vector<PngChunk> result = parse_ok(out);
        ASSERT_EQ(result.size(), chunks.size() + 1);
        EXPECT_EQ(result[result.size() - 2].type, kChunkText);
        EXPECT_EQ(keyword_of(result[result.size() - 2]), "ccv3");
        EXPECT_EQ(result.back().type, kChunkIEND);
        expect_same_chunks(without_keyword(result, "ccv3"), chunks);
    }


    TEST(CardChunks, InjectAppendsWithoutIend)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.pop_back();
        const std::vector<std::byte> png = make_png(chunks);

        std::vector<std::byte> out;
        ASSERT_EQ(inject_text_chunk(png, "chara", "{}", &out), PngStatus::Ok);

        const std::vector<PngChunk> result = parse_ok(out);
        ASSERT_EQ(result.size(), chunks.size() + 1);
        EXPECT_EQ(keyword_of(result.back()), "chara");
    }


    TEST(CardChunks, RepeatedInjectionKeepsIdatIdentical)
    {
        const std::vector<PngChunk> chunks = base_chunks();
        std::vector<std::byte> png         = make_png(chunks);

        const std::vector<PngChunk> before = parse_ok(png);
        const std::vector<std::span<const std::byte>> idat_before
            = collect_chunk_data(before, kChunkIDAT);

        std::vector<std::byte> out;
        ASSERT_EQ(inject_text_chunk(png, "ccv3", "{\"v\":1}", &out),
                  PngStatus::Ok);
        png = out;
        ASSERT_EQ(inject_text_chunk(png, "chara", "{\"v\":2}", &out),
                  PngStatus::Ok);
        png = out;
        ASSERT_EQ(inject_text_chunk(png, "ccv3", "{\"v\":3}", &out),
                  PngStatus::Ok);

        const std::vector<PngChunk> after = parse_ok(out);
        const std::vector<std::span<const std::byte>> idat_after
            = collect_chunk_data(after, kChunkIDAT);
        ASSERT_EQ(idat_after.size(), idat_before.size());
        for (size_t i = 0; i < idat_before.size(); ++i) {
            EXPECT_TRUE(std::equal(idat_before[i].begin(), idat_before[i].end(),
                                   idat_after[i].begin(), idat_after[i].end()));
        }

        expect_same_chunks(without_keyword(without_keyword(after, "ccv3"),
                                           "chara"),
                           chunks);
    }


    TEST(CardChunks, ReplaceLeavesSingleChunk)
    {
        const std::vector<std::byte> png = make_png(base_chunks());

        std::vector<std::byte> once;
        std::vector<std::byte> twice;
        ASSERT_EQ(inject_text_chunk(png, "ccv3", "old", &once), PngStatus::Ok);
        ASSERT_EQ(inject_text_chunk(once, "ccv3", "new", &twice),
                  PngStatus::Ok);

        const std::vector<PngChunk> result = parse_ok(twice);
        EXPECT_EQ(count_keyword(result, "ccv3"), 1U);
        EXPECT_EQ(result.size(), parse_ok(once).size());

        TextChunkMap texts;
        ASSERT_EQ(read_text_chunks(twice, &texts), PngStatus::Ok);
        EXPECT_EQ(texts["ccv3"], "new");
    }


    TEST(CardChunks, ReplaceKeepsPosition)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_plain("chara", "old"));
        const std::vector<std::byte> png = make_png(chunks);

        std::vector<std::byte> out;
        ASSERT_EQ(inject_text_chunk(png, "chara", "new", &out), PngStatus::Ok);

        const std::vector<PngChunk> result = parse_ok(out);
        ASSERT_EQ(result.size(), chunks.size());
        EXPECT_EQ(keyword_of(result[1]), "chara");
        expect_same_chunks(without_keyword(result, "chara"),
                           without_keyword(chunks, "chara"));
    }


    TEST(CardChunks, NoReplaceAddsSecondChunk)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_plain("chara", "old"));
        const std::vector<std::byte> png = make_png(chunks);

        CardChunkOptions options;
        options.replace = false;

        std::vector<std::byte> out;
        ASSERT_EQ(inject_text_chunk(png, "chara", "new", &out, options),
                  PngStatus::Ok);
        EXPECT_EQ(count_keyword(parse_ok(out), "chara"), 2U);
    }


    TEST(CardChunks, CompressedChunksAreNotReplaceTargets)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_ztxt("ccv3", "legacy"));
        const std::vector<std::byte> png = make_png(chunks);

        std::vector<std::byte> out;
        ASSERT_EQ(inject_text_chunk(png, "ccv3", "fresh", &out),
                  PngStatus::Ok);

        const std::vector<PngChunk> result = parse_ok(out);
        EXPECT_EQ(count_keyword(result, "ccv3"), 2U);
        EXPECT_EQ(result[1].type, kChunkZtxt);

        TextChunkMap texts;
        ASSERT_EQ(read_text_chunks(out, &texts), PngStatus::Ok);
        EXPECT_EQ(texts["ccv3"], "fresh");
    }


    TEST(CardChunks, InjectFailures)
    {
        std::vector<std::byte> out;
        EXPECT_EQ(inject_text_chunk(bytes_of("GIF89a"), "ccv3", "{}", &out),
                  PngStatus::InvalidFormat);
        EXPECT_TRUE(out.empty());

        const std::vector<std::byte> png = make_png(base_chunks());
        EXPECT_EQ(inject_text_chunk(png, "", "{}", &out),
                  PngStatus::InvalidKeyword);
        EXPECT_TRUE(out.empty());

        // Latin-1 bytes would not read back as written.
        EXPECT_EQ(inject_text_chunk(png, "ccv3", "{\"name\":\"caf\xE9\"}",
                                    &out),
                  PngStatus::InvalidText);
        EXPECT_TRUE(out.empty());
        EXPECT_EQ(embed_card_payloads(png, "{}", "\xC0\xAF", &out),
                  PngStatus::InvalidText);
        EXPECT_TRUE(out.empty());
    }


    TEST(CardChunks, RemoveDropsEveryKind)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_plain("chara", "a"));
        chunks.insert(chunks.begin() + 2, make_ztxt("chara", "b"));
        chunks.insert(chunks.begin() + 3, make_itxt("chara", "c"));
        chunks.insert(chunks.begin() + 4, make_plain("ccv3", "d"));
        const std::vector<std::byte> png = make_png(chunks);

        std::vector<std::byte> out;
        ASSERT_EQ(remove_text_chunks(png, "chara", &out), PngStatus::Ok);

        const std::vector<PngChunk> result = parse_ok(out);
        EXPECT_EQ(count_keyword(result, "chara"), 0U);
        EXPECT_EQ(count_keyword(result, "ccv3"), 1U);
        expect_same_chunks(result, without_keyword(chunks, "chara"));
    }


    TEST(CardChunks, RemoveMatchesUndecodableChunks)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1,
                      make_ztxt("chara", std::string(4096, 'x')));
        chunks.insert(chunks.begin() + 2,
                      make_chunk(kChunkZtxt,
                                 std::string_view("chara\0\x01junk", 11)));
        chunks.insert(chunks.begin() + 3,
                      make_chunk(kChunkItxt, std::string_view(
                                                 "chara\0\x01\0en\0\0notzlib",
                                                 19)));
        chunks.insert(chunks.begin() + 4, make_plain("ccv3", "{}"));
        const std::vector<std::byte> png = make_png(chunks);

        CardChunkOptions options;
        options.decode.limits.max_inflate_bytes = 64;

        TextChunkMap texts;
        ASSERT_EQ(read_text_chunks(png, &texts, options), PngStatus::Ok);
        EXPECT_EQ(texts.count("chara"), 0U);

        std::vector<std::byte> out;
        ASSERT_EQ(remove_text_chunks(png, "chara", &out, options),
                  PngStatus::Ok);

        std::vector<PngChunk> expected = base_chunks();
        expected.insert(expected.begin() + 1, make_plain("ccv3", "{}"));
        expect_same_chunks(parse_ok(out), expected);
    }


    TEST(CardChunks, PrimaryPrefersCcv3)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_plain("chara", "v2"));
        chunks.insert(chunks.begin() + 2, make_plain("ccv3", "v3"));
        const std::vector<std::byte> both = make_png(chunks);

        CardPayload payload;
        ASSERT_EQ(find_card_payload(both, &payload), PngStatus::Ok);
        EXPECT_EQ(payload.source, CardSource::Ccv3);
        EXPECT_EQ(payload.json, "v3");
        EXPECT_STREQ(card_source_name(payload.source), "ccv3");

        std::vector<std::byte> v2_only;
        ASSERT_EQ(remove_text_chunks(both, "ccv3", &v2_only), PngStatus::Ok);
        ASSERT_EQ(find_card_payload(v2_only, &payload), PngStatus::Ok);
        EXPECT_EQ(payload.source, CardSource::Chara);
        EXPECT_EQ(payload.json, "v2");

        EXPECT_EQ(find_card_payload(make_png(base_chunks()), &payload),
                  PngStatus::NotFound);
    }


    TEST(CardChunks, TruncatedStreamStillReadable)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_plain("chara", "{\"v\":2}"));
        std::vector<std::byte> png = make_png(chunks);
        // Cut inside the second IDAT chunk.
        png.resize(png.size() - 12 - 10);

        const std::vector<PngChunk> parsed = parse_ok(png);
        EXPECT_EQ(parsed.size(), chunks.size() - 2);

        CardPayload payload;
        ASSERT_EQ(find_card_payload(png, &payload), PngStatus::Ok);
        EXPECT_EQ(payload.json, "{\"v\":2}");
    }


    TEST(CardChunks, TrailingBytesDoNotChangeChunks)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1, make_plain("ccv3", "{}"));
        const std::vector<std::byte> png = make_png(chunks);

        std::vector<std::byte> padded = png;
        const std::vector<std::byte> tail
            = bytes_of(std::string_view("\0\0\0\4tEXtjunk\xFF\xFF", 14));
        padded.insert(padded.end(), tail.begin(), tail.end());

        expect_same_chunks(parse_ok(padded), parse_ok(png));

        std::vector<std::byte> out;
        ASSERT_EQ(inject_text_chunk(padded, "chara", "{}", &out),
                  PngStatus::Ok);
        std::vector<std::byte> expected;
        ASSERT_EQ(inject_text_chunk(png, "chara", "{}", &expected),
                  PngStatus::Ok);
        EXPECT_EQ(out, expected);
    }


    TEST(CardChunks, EmbedWritesBothPayloads)
    {
        const std::vector<std::byte> png = make_png(base_chunks());

        std::vector<std::byte> out;
        ASSERT_EQ(embed_card_payloads(png, "{\"v\":3}", "{\"v\":2}", &out),
                  PngStatus::Ok);

        TextChunkMap texts;
        ASSERT_EQ(read_text_chunks(out, &texts), PngStatus::Ok);
        EXPECT_EQ(texts["ccv3"], "{\"v\":3}");
        EXPECT_EQ(texts["chara"], "{\"v\":2}");

        // Re-exporting replaces instead of stacking chunks.
        std::vector<std::byte> again;
        ASSERT_EQ(embed_card_payloads(out, "{\"v\":33}", "{\"v\":22}", &again),
                  PngStatus::Ok);
        const std::vector<PngChunk> result = parse_ok(again);
        EXPECT_EQ(count_keyword(result, "ccv3"), 1U);
        EXPECT_EQ(count_keyword(result, "chara"), 1U);
    }


    TEST(CardChunks, EmbedSkipsEmptyV2)
    {
        const std::vector<std::byte> png = make_png(base_chunks());

        std::vector<std::byte> out;
        ASSERT_EQ(embed_card_payloads(png, "{}", "", &out), PngStatus::Ok);

        TextChunkMap texts;
        ASSERT_EQ(read_text_chunks(out, &texts), PngStatus::Ok);
        EXPECT_EQ(texts.size(), 1U);
        EXPECT_EQ(texts.count("chara"), 0U);
    }


    TEST(CardChunks, ResourcePolicyBoundsParsing)
    {
        std::vector<PngChunk> chunks = base_chunks();
        chunks.insert(chunks.begin() + 1,
                      make_ztxt("ccv3", std::string(8192, 'x')));
        const std::vector<std::byte> png = make_png(chunks);

        CardResourcePolicy policy;
        policy.text_limits.max_inflate_bytes = 1024;
        CardChunkOptions options;
        apply_resource_policy(policy, &options);

        // The oversized chunk is skipped like any unreadable chunk.
        CardPayload payload;
        EXPECT_EQ(find_card_payload(png, &payload, options),
                  PngStatus::NotFound);

        policy.png_limits.max_chunks = 3;
        apply_resource_policy(policy, &options);
        TextChunkMap texts;
        EXPECT_EQ(read_text_chunks(png, &texts, options),
                  PngStatus::LimitExceeded);
    }


    TEST(CardChunks, DetectFileType)
    {
        EXPECT_EQ(detect_card_file_type(make_png(base_chunks())),
                  CardFileType::Png);
        EXPECT_EQ(detect_card_file_type(bytes_of("  \n{\"spec\":1}")),
                  CardFileType::Json);
        EXPECT_EQ(detect_card_file_type(bytes_of("[1]")), CardFileType::Json);
        EXPECT_EQ(detect_card_file_type(bytes_of("\xFF\xD8\xFF\xE0")),
                  CardFileType::Image);
        const std::vector<std::byte> webp = bytes_of(
            std::string_view("RIFF\0\0\0\0WEBPVP8 ", 16));
        EXPECT_EQ(detect_card_file_type(webp), CardFileType::Image);
        EXPECT_EQ(detect_card_file_type(bytes_of("GIF89a")),
                  CardFileType::Image);
        EXPECT_EQ(detect_card_file_type(bytes_of("plain text")),
                  CardFileType::Image);
        EXPECT_EQ(detect_card_file_type({}), CardFileType::Image);
        EXPECT_STREQ(card_file_type_name(CardFileType::Json), "json");
    }

}  // namespace
}  // namespace cardforge
