#include <catch2/catch_test_macros.hpp>
#include "processing/UnicodeTextNormalizer.hpp"
#include "processing/PreprocessorErrors.hpp"
#include <string>
#include <vector>

using namespace docstruct;

TEST_CASE("UnicodeTextNormalizer - normalizeLineEndings converts CRLF and CR to LF", "[normalizer]")
{
    UnicodeTextNormalizer normalizer;
    REQUIRE(normalizer.normalizeLineEndings("Line 1\r\nLine 2\rLine 3\nLine 4") == "Line 1\nLine 2\nLine 3\nLine 4");
    REQUIRE(normalizer.normalizeLineEndings("").empty());
}

TEST_CASE("UnicodeTextNormalizer - collapseNewlines keeps at most one blank line", "[normalizer]")
{
    UnicodeTextNormalizer normalizer;
    REQUIRE(normalizer.collapseNewlines("Line 1\n\nLine 2") == "Line 1\n\nLine 2");
    REQUIRE(normalizer.collapseNewlines("Line 1\n\n\n\n\nLine 2") == "Line 1\n\nLine 2");
    REQUIRE(normalizer.collapseNewlines("첫 줄\n\n\n\n둘째 줄") == "첫 줄\n\n둘째 줄");
}

TEST_CASE("UnicodeTextNormalizer - composeUnicode produces NFC", "[normalizer]")
{
    UnicodeTextNormalizer normalizer;

    SECTION("Decomposed Latin accent is composed")
    {
        // e + U+0301 COMBINING ACUTE ACCENT -> U+00E9
        REQUIRE(normalizer.composeUnicode("Caf\x65\xCC\x81") == "Caf\xC3\xA9");
    }

    SECTION("Decomposed Hangul jamo are composed into a syllable")
    {
        // U+1112 U+1161 U+11AB -> U+D55C
        REQUIRE(normalizer.composeUnicode("\xE1\x84\x92\xE1\x85\xA1\xE1\x86\xAB") == "한");
    }

    SECTION("Compatibility characters are kept (NFC, not NFKC)")
    {
        REQUIRE(normalizer.composeUnicode("１２３") == "１２３");
    }
}

TEST_CASE("UnicodeTextNormalizer - removeControlCharacters", "[normalizer]")
{
    UnicodeTextNormalizer normalizer;

    SECTION("C0 and DEL are removed")
    {
        REQUIRE(normalizer.removeControlCharacters("a\x01" "b\x7F" "c") == "abc");
    }

    SECTION("Tab, newline and carriage return are kept")
    {
        REQUIRE(normalizer.removeControlCharacters("a\tb\nc\rd") == "a\tb\nc\rd");
    }

    SECTION("Format characters such as zero width space are removed")
    {
        REQUIRE(normalizer.removeControlCharacters("a\xE2\x80\x8B" "b") == "ab");
    }

    SECTION("Korean text passes through")
    {
        REQUIRE(normalizer.removeControlCharacters("로그인 기능") == "로그인 기능");
    }

    SECTION("Invalid UTF-8 raises NormalizationError")
    {
        REQUIRE_THROWS_AS(normalizer.removeControlCharacters("abc\xFF"), NormalizationError);
    }
}

TEST_CASE("UnicodeTextNormalizer - normalizeWhitespace", "[normalizer]")
{
    UnicodeTextNormalizer normalizer;

    SECTION("Runs of spaces and tabs collapse to one space")
    {
        REQUIRE(normalizer.normalizeWhitespace("a  \t b") == "a b");
    }

    SECTION("Lines are trimmed and the result is trimmed")
    {
        REQUIRE(normalizer.normalizeWhitespace("  first  \n   second   ") == "first\nsecond");
    }

    SECTION("Three or more newlines become a paragraph break")
    {
        REQUIRE(normalizer.normalizeWhitespace("para 1\n\n\n\npara 2") == "para 1\n\npara 2");
    }

    SECTION("Lines holding only spaces count as blank")
    {
        REQUIRE(normalizer.normalizeWhitespace("a\n   \n   \n  \nb") == "a\n\nb");
    }

    SECTION("Whitespace-only input becomes empty")
    {
        REQUIRE(normalizer.normalizeWhitespace(" \t\n\r\n  ").empty());
    }
}

TEST_CASE("UnicodeTextNormalizer - normalize runs every enabled step", "[normalizer]")
{
    UnicodeTextNormalizer normalizer;

    REQUIRE(normalizer.normalize("  Caf\x65\xCC\x81 \t menu \n\n\n\n next ") == "Caf\xC3\xA9 menu\n\nnext");
    REQUIRE(normalizer.normalize("").empty());
    REQUIRE(normalizer.normalize("\x01\x02").empty());

    SECTION("Removing a control character lets marks compose with their base")
    {
        // e, ZERO WIDTH SPACE, combining acute: NFC cannot compose across the ZWSP
        REQUIRE(normalizer.normalize("\x65\xE2\x80\x8B\xCC\x81") == "\xC3\xA9");
    }

    SECTION("Invalid UTF-8 raises NormalizationError")
    {
        REQUIRE_THROWS_AS(normalizer.normalize("bad \xC3\x28 byte"), NormalizationError);
    }
}

TEST_CASE("UnicodeTextNormalizer - options disable individual steps", "[normalizer]")
{
    SECTION("Unicode composition off")
    {
        UnicodeTextNormalizer normalizer(NormalizerOptions{ false, true, true });
        REQUIRE(normalizer.normalize("\x65\xCC\x81") == "\x65\xCC\x81");
    }

    SECTION("Control character removal off")
    {
        UnicodeTextNormalizer normalizer(NormalizerOptions{ true, false, true });
        REQUIRE(normalizer.normalize("a\x01" "b") == "a\x01" "b");
    }

    SECTION("Whitespace normalization off")
    {
        UnicodeTextNormalizer normalizer(NormalizerOptions{ true, true, false });
        REQUIRE(normalizer.normalize("  a   b  ") == "  a   b  ");
        REQUIRE(normalizer.options().normalize_whitespace == false);
    }
}

TEST_CASE("UnicodeTextNormalizer - normalize is idempotent", "[normalizer][property]")
{
    const std::vector<std::string> samples = {
        "",
        "plain ascii",
        "  leading and trailing  ",
        "tabs\t\tand  spaces",
        "windows\r\nline\r\nendings\r\n",
        "old mac\rline endings",
        "many\n\n\n\n\n\nnewlines",
        "blank\n \t \n\t\nlines",
        "Caf\x65\xCC\x81",
        "\x65\xE2\x80\x8B\xCC\x81",
        "ctrl\x01\x02\x1F chars\x7F",
        "\xE1\x84\x92\xE1\x85\xA1\xE1\x86\xAB\xEA\xB8\x80",
        "1. 개요\n\n\n가. 로그인 기능",
        "\xE2\x80\x8B\xE2\x80\x8B",
        "form\x0C" "feed and\x0B" "vtab",
        "\xEF\xBB\xBF" "BOM prefixed",
    };

    const std::vector<NormalizerOptions> option_sets = {
        NormalizerOptions{ true, true, true },
        NormalizerOptions{ true, false, true },
        NormalizerOptions{ false, true, true },
        NormalizerOptions{ true, true, false },
        NormalizerOptions{ false, false, true },
    };

    for (const auto& options : option_sets)
    {
        UnicodeTextNormalizer normalizer(options);
        for (const auto& sample : samples)
        {
            INFO("sample: " << sample);
            const std::string once = normalizer.normalize(sample);
            REQUIRE(normalizer.normalize(once) == once);
        }
    }
}

TEST_CASE("UnicodeTextNormalizer - normalizeBatch", "[normalizer]")
{
    UnicodeTextNormalizer normalizer;
    auto out = normalizer.normalizeBatch({ "  a  ", "b\r\nc", "" });
    REQUIRE(out.size() == 3);
    REQUIRE(out[0] == "a");
    REQUIRE(out[1] == "b\nc");
    REQUIRE(out[2].empty());
}

TEST_CASE("UnicodeTextNormalizer - optional cleanups", "[normalizer]")
{
    UnicodeTextNormalizer normalizer;

    SECTION("normalizeQuotes maps typographic and CJK quotes to ASCII")
    {
        REQUIRE(normalizer.normalizeQuotes("\xE2\x80\x9Chi\xE2\x80\x9D \xE2\x80\x98x\xE2\x80\x99") == "\"hi\" 'x'");
        REQUIRE(normalizer.normalizeQuotes("「안녕」") == "\"안녕\"");
    }

    SECTION("normalizeNumbers maps full-width digits")
    {
        REQUIRE(normalizer.normalizeNumbers("제１２３조") == "제123조");
    }

    SECTION("removeExcessivePunctuation keeps two marks")
    {
        REQUIRE(normalizer.removeExcessivePunctuation("Wait!!!!") == "Wait!!");
        REQUIRE(normalizer.removeExcessivePunctuation("ok..") == "ok..");
    }

    SECTION("removeUrls drops links")
    {
        REQUIRE(normalizer.removeUrls("see https://example.com/a?b=1 now") == "see  now");
        REQUIRE(normalizer.removeUrls("visit www.example.org") == "visit ");
    }

    SECTION("cleanSpecialCharacters keeps words, whitespace and common punctuation")
    {
        REQUIRE(normalizer.cleanSpecialCharacters("요구사항 #3: 로그인 ★필수★ (v2.0)!") == "요구사항 3: 로그인 필수 (v2.0)!");
        REQUIRE(normalizer.cleanSpecialCharacters("a_b @ c\td") == "a_b  c\td");
        REQUIRE(normalizer.cleanSpecialCharacters("Ünïcode ½ → ok") == "Ünïcode ½  ok");
    }

    SECTION("cleanSpecialCharacters with a custom keep set")
    {
        REQUIRE(normalizer.cleanSpecialCharacters("price: $5, 10%", "$%") == "price $5 10%");
        REQUIRE(normalizer.cleanSpecialCharacters("a.b,c", "") == "abc");
    }
}
