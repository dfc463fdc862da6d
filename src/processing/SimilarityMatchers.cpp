#include "SimilarityMatchers.hpp"
#include "TextUtils.hpp"

#include <set>

#include <rapidfuzz/fuzz.hpp>

namespace docstruct
{

double CharacterSetMatcher::similarity(const std::string& s1, const std::string& s2) const
{
    if (s1.empty() || s2.empty())
    {
        return 0.0;
    }

    const std::u32string a = utf8ToUtf32(caseFold(s1));
    const std::u32string b = utf8ToUtf32(caseFold(s2));
    const std::set<char32_t> set1(a.begin(), a.end());
    const std::set<char32_t> set2(b.begin(), b.end());

    if (set1.empty() || set2.empty())
    {
        return 0.0;
    }

    std::size_t intersection = 0;
    for (char32_t cp : set1)
    {
        if (set2.count(cp))
            ++intersection;
    }
    const std::size_t union_size = set1.size() + set2.size() - intersection;

    return union_size > 0 ? static_cast<double>(intersection) / static_cast<double>(union_size) : 0.0;
}

double RatioMatcher::similarity(const std::string& s1, const std::string& s2) const
{
    if (s1.empty() || s2.empty())
    {
        return 0.0;
    }

    // Compare code points so multi-byte characters count once
    const std::u32string a = utf8ToUtf32(caseFold(s1));
    const std::u32string b = utf8ToUtf32(caseFold(s2));

    // Normalize from [0, 100] to [0.0, 1.0]
    return rapidfuzz::fuzz::ratio(a, b) / 100.0;
}

std::unique_ptr<ISimilarityMatcher> makeSimilarityMatcher(SimilarityMetric metric)
{
    switch (metric)
    {
    case SimilarityMetric::Ratio:
        return std::make_unique<RatioMatcher>();
    case SimilarityMetric::CharacterSet:
    default:
        return std::make_unique<CharacterSetMatcher>();
    }
}

} // namespace docstruct
