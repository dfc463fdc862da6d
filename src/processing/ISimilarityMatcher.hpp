#pragma once

#include <optional>
#include <set>
#include <string>

namespace docstruct
{

/**
 * @brief Result of matching a span text against known noise patterns.
 */
struct PatternMatch
{
    double score;        // Similarity normalized to [0.0, 1.0]
    std::string pattern; // The pattern that matched
};

/**
 * @brief Abstract interface for the near-duplicate test used by noise removal.
 *
 * Implementations compare a span text with header/footer patterns and score
 * the pair in [0.0, 1.0]. Empty inputs always score 0.0.
 */
class ISimilarityMatcher
{
public:
    virtual ~ISimilarityMatcher() = default;

    /**
     * @brief Calculate similarity between two strings.
     */
    virtual double similarity(const std::string& s1, const std::string& s2) const = 0;

    /**
     * @brief Find the best scoring pattern at or above the threshold.
     *
     * @param text Span text (already trimmed)
     * @param patterns Candidate patterns
     * @param threshold Minimum similarity score [0.0, 1.0] required for a match
     * @return The best match, ties resolved by pattern order; std::nullopt when none qualifies
     */
    std::optional<PatternMatch> findBestMatch(const std::string& text, const std::set<std::string>& patterns,
                                              double threshold) const
    {
        std::optional<PatternMatch> best;
        for (const auto& pattern : patterns)
        {
            double score = similarity(text, pattern);
            if (score >= threshold && (!best || score > best->score))
                best = PatternMatch{ score, pattern };
        }
        return best;
    }
};

} // namespace docstruct
