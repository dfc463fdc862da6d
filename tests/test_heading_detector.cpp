#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "processing/HeadingDetector.hpp"
#include "utils/DocumentBuilder.hpp"

#include <string>

using namespace docstruct;
using Catch::Matchers::WithinAbs;

TEST_CASE("HeadingDetector - numbering patterns", "[heading]")
{
    HeadingDetector detector;

    SECTION("Decimal numbering sets the level from its depth")
    {
        auto h1 = detector.matchPattern("1. Introduction");
        REQUIRE(h1.has_value());
        REQUIRE(h1->title == "Introduction");
        REQUIRE(h1->level == 1);
        REQUIRE(h1->signal == HeadingSignal::Pattern);

        auto h2 = detector.matchPattern("2.3 Scope");
        REQUIRE(h2.has_value());
        REQUIRE(h2->title == "Scope");
        REQUIRE(h2->level == 2);

        auto h3 = detector.matchPattern("2.3.1 Details");
        REQUIRE(h3.has_value());
        REQUIRE(h3->title == "Details");
        REQUIRE(h3->level == 3);
    }

    SECTION("Markup headings use the number of hashes")
    {
        auto h = detector.matchPattern("### Deep heading");
        REQUIRE(h.has_value());
        REQUIRE(h->title == "Deep heading");
        REQUIRE(h->level == 3);
    }

    SECTION("Hangul ordinal")
    {
        auto h = detector.matchPattern("가. 로그인 기능");
        REQUIRE(h.has_value());
        REQUIRE(h->title == "로그인 기능");
        REQUIRE(h->level == 1);
    }

    SECTION("Bracketed numbers")
    {
        auto h = detector.matchPattern("[4] References");
        REQUIRE(h.has_value());
        REQUIRE(h->title == "References");
        REQUIRE(h->level == 1);
    }

    SECTION("Plain text is not a heading")
    {
        REQUIRE_FALSE(detector.matchPattern("The system shall respond.").has_value());
        REQUIRE_FALSE(detector.matchPattern("1.Introduction").has_value());
        REQUIRE_FALSE(detector.matchPattern("12").has_value());
        REQUIRE_FALSE(detector.matchPattern("가나다라").has_value());
        REQUIRE_FALSE(detector.matchPattern("#hashtag").has_value());
    }

    SECTION("Any whitespace separates the numbering from the title")
    {
        auto form_feed = detector.matchPattern("가.\f로그인 기능");
        REQUIRE(form_feed.has_value());
        REQUIRE(form_feed->title == "로그인 기능");

        REQUIRE(detector.matchPattern("나.\v결제").has_value());
        REQUIRE(detector.matchPattern("다.\u3000검색").has_value());
        REQUIRE(detector.matchPattern("1.\u00a0Introduction").has_value());
        REQUIRE(detector.matchPattern("## \t Setup")->title == "Setup");
    }

    SECTION("Titles spanning several lines are not headings")
    {
        REQUIRE_FALSE(detector.matchPattern("1. First line\nsecond line").has_value());
        REQUIRE_FALSE(detector.matchPattern("가. 첫 줄\n둘째 줄").has_value());
        REQUIRE_FALSE(detector.matchPattern("[2] Name\r\nMore").has_value());
    }

    SECTION("Prefix shape must be exact")
    {
        REQUIRE_FALSE(detector.matchPattern("####### Too deep").has_value());
        REQUIRE_FALSE(detector.matchPattern("1.1. Trailing period").has_value());
        REQUIRE_FALSE(detector.matchPattern("[a] Letter").has_value());
        REQUIRE(detector.matchPattern("[12] Twelve")->title == "Twelve");
    }

    SECTION("Registry lists every style in matching order")
    {
        const auto& patterns = detector.patterns();
        REQUIRE(patterns.size() == 6);
        REQUIRE(patterns.front().style == NumberingStyle::Decimal);
        REQUIRE(patterns.back().style == NumberingStyle::Bracketed);
    }
}

TEST_CASE("HeadingDetector - level helpers", "[heading]")
{
    REQUIRE(HeadingDetector::levelForNumbering("1") == 1);
    REQUIRE(HeadingDetector::levelForNumbering("1.2") == 2);
    REQUIRE(HeadingDetector::levelForNumbering("1.2.3") == 3);
    REQUIRE(HeadingDetector::levelForNumbering("##") == 2);

    REQUIRE(HeadingDetector::levelForFontRatio(2.0) == 1);
    REQUIRE(HeadingDetector::levelForFontRatio(1.8) == 1);
    REQUIRE(HeadingDetector::levelForFontRatio(1.6) == 2);
    REQUIRE(HeadingDetector::levelForFontRatio(1.3) == 3);
    REQUIRE(HeadingDetector::levelForFontRatio(1.1) == 4);
}

TEST_CASE("HeadingDetector - averageFontSize", "[heading]")
{
    test_utils::DocumentBuilder builder;
    builder.page().text("a", 10.0f).text("b", 14.0f).text("no size");
    builder.page().text("c", 12.0f).text("zero", 0.0f);

    REQUIRE_THAT(HeadingDetector::averageFontSize(builder.build()), WithinAbs(12.0, 0.001));

    SECTION("Defaults to 12 without font data")
    {
        REQUIRE_THAT(HeadingDetector::averageFontSize(test_utils::pagesFromTexts({ { "x" } })),
                     WithinAbs(12.0, 0.001));
    }
}

TEST_CASE("HeadingDetector - font size fallback", "[heading]")
{
    HeadingDetector detector;

    SECTION("Large text relative to the average becomes a heading")
    {
        auto h = detector.matchFontSize("Overview", 20.0f, 10.0);
        REQUIRE(h.has_value());
        REQUIRE(h->signal == HeadingSignal::FontSize);
        REQUIRE(h->level == 1);
        REQUIRE(h->title == "Overview");
    }

    SECTION("Below the ratio threshold")
    {
        REQUIRE_FALSE(detector.matchFontSize("Body", 12.5f, 11.0).has_value());
    }

    SECTION("Below the absolute minimum")
    {
        REQUIRE_FALSE(detector.matchFontSize("Small print", 11.0f, 6.0).has_value());
    }

    SECTION("Missing font size")
    {
        REQUIRE_FALSE(detector.matchFontSize("Unknown", std::nullopt, 10.0).has_value());
    }

    SECTION("Thresholds come from the options")
    {
        HeadingDetector strict(SegmenterOptions{ 18.0, 1.5 });
        REQUIRE_FALSE(strict.matchFontSize("Medium", 16.0f, 10.0).has_value());
        REQUIRE(strict.matchFontSize("Large", 18.0f, 10.0).has_value());
    }
}

TEST_CASE("HeadingDetector - detect prefers patterns over font size", "[heading]")
{
    HeadingDetector detector;

    auto numbered = detector.detect(test_utils::span(1, "  1.1 Scope  ", 24.0f, std::nullopt), 10.0);
    REQUIRE(numbered.has_value());
    REQUIRE(numbered->signal == HeadingSignal::Pattern);
    REQUIRE(numbered->level == 2);
    REQUIRE(numbered->title == "Scope");

    auto large = detector.detect(test_utils::span(1, "Summary", 24.0f, std::nullopt), 10.0);
    REQUIRE(large.has_value());
    REQUIRE(large->signal == HeadingSignal::FontSize);

    REQUIRE_FALSE(detector.detect(test_utils::span(1, "   ", 30.0f, std::nullopt), 10.0).has_value());
}

TEST_CASE("HeadingDetector - very long spans", "[heading]")
{
    HeadingDetector detector;
    const std::string body(200000, 'a');

    auto decimal = detector.detect(test_utils::span(1, "1. " + body), 12.0);
    REQUIRE(decimal.has_value());
    REQUIRE(decimal->level == 1);
    REQUIRE(decimal->title.size() == body.size());

    auto nested = detector.detect(test_utils::span(1, "2.3.4 " + body), 12.0);
    REQUIRE(nested.has_value());
    REQUIRE(nested->level == 3);

    REQUIRE(detector.matchPattern("### " + body).has_value());
    REQUIRE(detector.matchPattern("[7] " + body).has_value());
    REQUIRE_FALSE(detector.detect(test_utils::span(1, body), 12.0).has_value());
    REQUIRE_FALSE(detector.matchPattern(std::string(200000, '1')).has_value());
    REQUIRE_FALSE(detector.matchPattern("1. " + body + "\n" + body).has_value());
}
