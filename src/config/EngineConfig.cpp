#include "EngineConfig.hpp"

#include <sstream>

namespace docstruct
{

const char* similarityMetricName(SimilarityMetric metric) noexcept
{
    switch (metric)
    {
    case SimilarityMetric::CharacterSet:
        return "charset";
    case SimilarityMetric::Ratio:
        return "ratio";
    default:
        return "charset";
    }
}

void validate(const EngineConfig& config)
{
    std::ostringstream problems;

    if (config.noise.min_repetition < 1)
        problems << "min_repetition must be >= 1 (got " << config.noise.min_repetition << "); ";
    if (config.noise.position_threshold < 0.0)
        problems << "position_threshold must be >= 0 (got " << config.noise.position_threshold << "); ";
    if (config.noise.similarity_threshold < 0.0 || config.noise.similarity_threshold > 1.0)
        problems << "similarity_threshold must be within [0, 1] (got " << config.noise.similarity_threshold << "); ";
    if (config.segmenter.min_heading_font_size < 0.0)
        problems << "min_heading_font_size must be >= 0 (got " << config.segmenter.min_heading_font_size << "); ";
    if (config.segmenter.font_size_ratio_threshold <= 0.0)
        problems << "font_size_ratio_threshold must be > 0 (got " << config.segmenter.font_size_ratio_threshold
                 << "); ";

    for (const auto& entry : config.custom_keywords)
    {
        if (entry.first.empty())
            problems << "custom keyword group with empty name; ";
    }

    std::string message = problems.str();
    if (!message.empty())
    {
        message.erase(message.size() - 2);
        throw ConfigError("invalid engine configuration: " + message);
    }
}

} // namespace docstruct
