#include "FunctionalGrouper.hpp"
#include "Diagnostics.hpp"
#include "SectionSegmenter.hpp"
#include "TextUtils.hpp"

#include <map>

#include <plog/Log.h>

namespace docstruct
{

FunctionalGrouper::FunctionalGrouper(KeywordTaxonomy taxonomy)
    : taxonomy_(std::move(taxonomy))
{
}

std::vector<std::pair<std::string, std::set<std::string>>> FunctionalGrouper::matchSection(const Section& section) const
{
    std::vector<std::pair<std::string, std::set<std::string>>> hits;
    const std::string haystack = caseFold(section.title + " " + section.content);

    for (const auto& entry : taxonomy_.entries())
    {
        std::set<std::string> matched;
        for (const auto& keyword : entry.keywords)
        {
            if (haystack.find(keyword) != std::string::npos)
                matched.insert(keyword);
        }
        if (!matched.empty())
            hits.emplace_back(entry.name, std::move(matched));
    }
    return hits;
}

std::vector<FunctionalGroup> FunctionalGrouper::group(const std::vector<Section>& sections) const
{
    return analyze(sections).groups;
}

GroupingResult FunctionalGrouper::analyze(const std::vector<Section>& sections) const
{
    GroupingResult result;
    const std::vector<const Section*> flat = flattenSections(sections);
    PLOG_INFO << "[FunctionalGrouper] Grouping " << flat.size() << " sections into " << taxonomy_.size()
              << " candidate groups";

    std::map<std::string, FunctionalGroup> named;
    FunctionalGroup unclassified;
    unclassified.name = kUnclassifiedGroup;

    for (const Section* section : flat)
    {
        auto hits = matchSection(*section);
        if (hits.empty())
        {
            unclassified.sections.push_back(section);
            result.warnings.push_back("section matched no functional group: " + Diagnostics::Describe(*section));
            continue;
        }

        ++result.classified_sections;
        for (auto& [name, keywords] : hits)
        {
            FunctionalGroup& group = named[name];
            group.name = name;
            group.sections.push_back(section);
            group.keywords.insert(keywords.begin(), keywords.end());
        }
    }

    // Taxonomy order, then the fallback bucket
    for (const auto& entry : taxonomy_.entries())
    {
        auto it = named.find(entry.name);
        if (it != named.end())
            result.groups.push_back(std::move(it->second));
    }

    result.unclassified_sections = unclassified.sections.size();
    if (!unclassified.sections.empty())
    {
        PLOG_INFO << "[FunctionalGrouper] " << unclassified.sections.size() << " sections left unclassified";
        result.groups.push_back(std::move(unclassified));
    }

    if (Diagnostics::IsVerbose())
    {
        for (const auto& group : result.groups)
        {
            PLOG_INFO_(Diagnostics::kLogInstance) << "[FunctionalGrouper] group='" << group.name
                                                  << "' sections=" << group.sections.size()
                                                  << " keywords=" << group.keywords.size();
        }
    }

    PLOG_INFO << "[FunctionalGrouper] Created " << result.groups.size() << " functional groups";
    return result;
}

} // namespace docstruct
