#pragma once

#include "ISimilarityMatcher.hpp"
#include "../config/EngineConfig.hpp"

#include <memory>

namespace docstruct
{

/**
 * @brief Unordered character-set Jaccard similarity.
 *
 * Both strings are case-folded and reduced to their sets of code points;
 * the score is |A ∩ B| / |A ∪ B|. Order and multiplicity are ignored, so
 * short strings with the same characters ("12" vs "21") score 1.0. This
 * coarse behaviour is what header/footer detection has always relied on.
 */
class CharacterSetMatcher : public ISimilarityMatcher
{
public:
    double similarity(const std::string& s1, const std::string& s2) const override;
};

/**
 * @brief Normalized Indel ratio (rapidfuzz::fuzz::ratio / 100) on case-folded text.
 *
 * Stricter alternative selectable with similarity_metric = "ratio".
 */
class RatioMatcher : public ISimilarityMatcher
{
public:
    double similarity(const std::string& s1, const std::string& s2) const override;
};

[[nodiscard]] std::unique_ptr<ISimilarityMatcher> makeSimilarityMatcher(SimilarityMetric metric);

} // namespace docstruct
