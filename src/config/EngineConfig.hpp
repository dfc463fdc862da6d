#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docstruct
{

struct NormalizerOptions
{
    bool normalize_unicode = true;       // NFC
    bool remove_control_chars = true;    // Keeps \t \n \r
    bool normalize_whitespace = true;
};

enum class SimilarityMetric
{
    CharacterSet, // Unordered code point Jaccard (coarse, over-matches short strings)
    Ratio         // Normalized Indel ratio
};

struct NoiseRemoverOptions
{
    int min_repetition = 3;
    double position_threshold = 50.0;
    double similarity_threshold = 0.9;
    SimilarityMetric similarity_metric = SimilarityMetric::CharacterSet;
};

struct SegmenterOptions
{
    double min_heading_font_size = 12.0;
    double font_size_ratio_threshold = 1.2;
};

using KeywordList = std::vector<std::pair<std::string, std::vector<std::string>>>;

struct EngineConfig
{
    bool normalize_text = true;
    bool remove_headers_footers = true;
    bool segment_sections = true;
    bool group_by_function = true;

    NormalizerOptions normalizer;
    NoiseRemoverOptions noise;
    SegmenterOptions segmenter;

    // Appended to the built-in taxonomy, never replacing it
    KeywordList custom_keywords;
};

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] const char* similarityMetricName(SimilarityMetric metric) noexcept;

// Throws ConfigError on out-of-range values.
void validate(const EngineConfig& config);

} // namespace docstruct
