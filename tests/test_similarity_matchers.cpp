#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "processing/SimilarityMatchers.hpp"

#include <memory>
#include <set>
#include <string>

using namespace docstruct;
using Catch::Matchers::WithinAbs;

TEST_CASE("CharacterSetMatcher - Jaccard over code point sets", "[similarity]")
{
    CharacterSetMatcher matcher;

    SECTION("Identical strings score 1.0")
    {
        REQUIRE_THAT(matcher.similarity("Confidential", "Confidential"), WithinAbs(1.0, 0.001));
    }

    SECTION("Case is folded before comparison")
    {
        REQUIRE_THAT(matcher.similarity("ACME Corp", "acme corp"), WithinAbs(1.0, 0.001));
    }

    SECTION("Partial overlap")
    {
        // {a,b,c} vs {b,c,d}: 2 / 4
        REQUIRE_THAT(matcher.similarity("abc", "bcd"), WithinAbs(0.5, 0.001));
    }

    SECTION("Order and multiplicity are ignored")
    {
        REQUIRE_THAT(matcher.similarity("12", "21"), WithinAbs(1.0, 0.001));
        REQUIRE_THAT(matcher.similarity("aab", "ab"), WithinAbs(1.0, 0.001));
    }

    SECTION("Multi-byte characters count as one element")
    {
        // {보,안} vs {보,고}: 1 / 3
        REQUIRE_THAT(matcher.similarity("보안", "보고"), WithinAbs(1.0 / 3.0, 0.001));
    }

    SECTION("Empty input scores 0.0")
    {
        REQUIRE(matcher.similarity("", "abc") == 0.0);
        REQUIRE(matcher.similarity("abc", "") == 0.0);
        REQUIRE(matcher.similarity("", "") == 0.0);
    }
}

TEST_CASE("RatioMatcher - normalized Indel ratio", "[similarity]")
{
    RatioMatcher matcher;

    SECTION("Identical strings score 1.0")
    {
        REQUIRE_THAT(matcher.similarity("Draft v3", "draft V3"), WithinAbs(1.0, 0.001));
    }

    SECTION("Order matters, unlike the character set metric")
    {
        REQUIRE(matcher.similarity("12", "21") < 0.9);
    }

    SECTION("One substituted character out of three")
    {
        // Indel distance 2 over 6 characters
        REQUIRE_THAT(matcher.similarity("abc", "abd"), WithinAbs(2.0 / 3.0, 0.001));
    }

    SECTION("Korean text compares per character")
    {
        REQUIRE_THAT(matcher.similarity("대외비 문서", "대외비 문서"), WithinAbs(1.0, 0.001));
        REQUIRE(matcher.similarity("대외비 문서", "공개 자료") < 0.5);
    }

    SECTION("Empty input scores 0.0")
    {
        REQUIRE(matcher.similarity("", "abc") == 0.0);
    }
}

TEST_CASE("ISimilarityMatcher - findBestMatch", "[similarity]")
{
    CharacterSetMatcher matcher;
    const std::set<std::string> patterns = { "ACME Confidential", "Page footer" };

    SECTION("Best pattern at or above the threshold is returned")
    {
        auto match = matcher.findBestMatch("acme confidential", patterns, 0.9);
        REQUIRE(match.has_value());
        REQUIRE(match->pattern == "ACME Confidential");
        REQUIRE_THAT(match->score, WithinAbs(1.0, 0.001));
    }

    SECTION("Score equal to the threshold qualifies")
    {
        auto match = matcher.findBestMatch("abc", { "bcd" }, 0.5);
        REQUIRE(match.has_value());
    }

    SECTION("Nothing above the threshold")
    {
        REQUIRE_FALSE(matcher.findBestMatch("Introduction", patterns, 0.9).has_value());
    }

    SECTION("No patterns")
    {
        REQUIRE_FALSE(matcher.findBestMatch("anything", {}, 0.0).has_value());
    }
}

TEST_CASE("makeSimilarityMatcher - selects the metric", "[similarity]")
{
    auto charset = makeSimilarityMatcher(SimilarityMetric::CharacterSet);
    auto ratio = makeSimilarityMatcher(SimilarityMetric::Ratio);

    REQUIRE(dynamic_cast<CharacterSetMatcher*>(charset.get()) != nullptr);
    REQUIRE(dynamic_cast<RatioMatcher*>(ratio.get()) != nullptr);
}
