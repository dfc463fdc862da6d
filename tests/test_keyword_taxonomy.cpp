#include <catch2/catch_test_macros.hpp>
#include "processing/KeywordTaxonomy.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace docstruct;

TEST_CASE("KeywordTaxonomy - built-in groups", "[taxonomy]")
{
    const KeywordTaxonomy& defaults = KeywordTaxonomy::defaults();

    REQUIRE(defaults.size() == 10);
    REQUIRE(defaults.groupNames().front() == "인증");
    REQUIRE(defaults.groupNames().back() == "보안");
    REQUIRE(defaults.contains("결제"));
    REQUIRE(defaults.contains("API"));

    SECTION("Keywords are case folded")
    {
        const auto* keywords = defaults.keywordsFor("인증");
        REQUIRE(keywords != nullptr);
        REQUIRE(std::find(keywords->begin(), keywords->end(), "oauth") != keywords->end());
        REQUIRE(std::find(keywords->begin(), keywords->end(), "OAuth") == keywords->end());
    }

    SECTION("defaults() is a single shared instance")
    {
        REQUIRE(&KeywordTaxonomy::defaults() == &defaults);
    }
}

TEST_CASE("KeywordTaxonomy - construction normalizes keywords", "[taxonomy]")
{
    KeywordTaxonomy taxonomy(KeywordList{ { "Auth", { " Login ", "login", "PASSWORD", "" } } });

    const auto* keywords = taxonomy.keywordsFor("Auth");
    REQUIRE(keywords != nullptr);
    REQUIRE(*keywords == std::vector<std::string>{ "login", "password" });
    REQUIRE(taxonomy.keywordsFor("auth") == nullptr);
}

TEST_CASE("KeywordTaxonomy - merged is additive and leaves the source untouched", "[taxonomy]")
{
    const KeywordTaxonomy& defaults = KeywordTaxonomy::defaults();
    const std::size_t before = defaults.keywordsFor("결제")->size();

    KeywordTaxonomy merged = defaults.merged({
        { "결제", { "invoice", "결제" } },
        { "Shipping", { "delivery", "courier" } },
    });

    SECTION("Existing group gains new keywords without duplicates")
    {
        const auto* keywords = merged.keywordsFor("결제");
        REQUIRE(keywords->size() == before + 1);
        REQUIRE(keywords->back() == "invoice");
    }

    SECTION("New group is appended at the end")
    {
        REQUIRE(merged.size() == defaults.size() + 1);
        REQUIRE(merged.groupNames().back() == "Shipping");
    }

    SECTION("Defaults are not mutated")
    {
        REQUIRE(defaults.size() == 10);
        REQUIRE(defaults.keywordsFor("결제")->size() == before);
        REQUIRE_FALSE(defaults.contains("Shipping"));
    }
}

TEST_CASE("KeywordTaxonomy - withGroup and withoutGroup return copies", "[taxonomy]")
{
    KeywordTaxonomy base(KeywordList{ { "Auth", { "login" } }, { "Billing", { "invoice" } } });

    KeywordTaxonomy extended = base.withGroup("Search", { "query" });
    REQUIRE(extended.groupNames() == std::vector<std::string>{ "Auth", "Billing", "Search" });
    REQUIRE(base.size() == 2);

    KeywordTaxonomy reduced = extended.withoutGroup("Auth");
    REQUIRE(reduced.groupNames() == std::vector<std::string>{ "Billing", "Search" });
    REQUIRE(extended.contains("Auth"));

    REQUIRE(base.withoutGroup("Unknown").size() == 2);
    REQUIRE(KeywordTaxonomy().empty());
}
