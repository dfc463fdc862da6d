#pragma once

#include "../model/DocumentTypes.hpp"
#include "KeywordTaxonomy.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace docstruct
{

struct GroupingResult
{
    std::vector<FunctionalGroup> groups;
    std::size_t classified_sections = 0;
    std::size_t unclassified_sections = 0;
    std::vector<std::string> warnings;
};

// Multi-label keyword classification of sections into functional groups.
// Groups reference the sections passed in; they must outlive the result.
class FunctionalGrouper
{
public:
    static constexpr const char* kUnclassifiedGroup = "unclassified";

    explicit FunctionalGrouper(KeywordTaxonomy taxonomy = KeywordTaxonomy::defaults());

    [[nodiscard]] std::vector<FunctionalGroup> group(const std::vector<Section>& sections) const;
    [[nodiscard]] GroupingResult analyze(const std::vector<Section>& sections) const;

    // Groups hit by the section (taxonomy order) with the keywords that matched
    [[nodiscard]] std::vector<std::pair<std::string, std::set<std::string>>> matchSection(const Section& section) const;

    [[nodiscard]] const KeywordTaxonomy& taxonomy() const noexcept { return taxonomy_; }

private:
    KeywordTaxonomy taxonomy_;
};

} // namespace docstruct
