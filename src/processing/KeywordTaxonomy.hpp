#pragma once

#include "../config/EngineConfig.hpp"

#include <string>
#include <vector>

namespace docstruct
{

// Ordered mapping: functional group name -> case-folded keywords.
// Immutable value; every modifier returns a fresh copy.
class KeywordTaxonomy
{
public:
    struct Entry
    {
        std::string name;
        std::vector<std::string> keywords; // Case-folded, unique, insertion order
    };

    KeywordTaxonomy() = default;
    explicit KeywordTaxonomy(const KeywordList& groups);

    // Built-in taxonomy, constructed once
    [[nodiscard]] static const KeywordTaxonomy& defaults();

    // Keywords for known groups are appended; unknown groups are added at the end
    [[nodiscard]] KeywordTaxonomy merged(const KeywordList& custom) const;
    [[nodiscard]] KeywordTaxonomy withGroup(const std::string& name, const std::vector<std::string>& keywords) const;
    [[nodiscard]] KeywordTaxonomy withoutGroup(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> groupNames() const;
    [[nodiscard]] const std::vector<std::string>* keywordsFor(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const { return keywordsFor(name) != nullptr; }

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    void append(const std::string& name, const std::vector<std::string>& keywords);

    std::vector<Entry> entries_;
};

} // namespace docstruct
