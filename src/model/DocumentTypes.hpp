#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace docstruct {

// Core data contracts for the structuring pipeline.
// Every stage takes these types as input and returns fresh values.

// Single run of text handed over by the extractor (native text layer or OCR)
struct TextSpan {
    int page = 1;                             // 1-indexed page the span belongs to
    std::string text;
    std::optional<float> font_size;           // Absent when the extractor had no font data
    std::optional<float> y_position;          // Distance from the page top, in points
};

struct Page {
    int number = 1;
    std::vector<TextSpan> spans;              // Document order
};

struct PageRange {
    int start = 1;
    int end = 1;

    bool operator==(const PageRange& other) const { return start == other.start && end == other.end; }
    bool operator!=(const PageRange& other) const { return !(*this == other); }
};

// Heading-delimited part of the document. Owns its subsections.
struct Section {
    std::string title;
    int level = 1;
    std::string content;                      // Non-heading span texts, newline-joined
    PageRange page_range;
    std::vector<Section> subsections;
};

// Topical bucket. Sections point into the tree owned by PreprocessResult.
struct FunctionalGroup {
    std::string name;
    std::vector<const Section*> sections;
    std::set<std::string> keywords;           // Keywords that actually matched
};

// Timing and counters collected while running the stages
struct StageStatistics {
    std::chrono::microseconds normalization_time{0};
    std::chrono::microseconds noise_removal_time{0};
    std::chrono::microseconds segmentation_time{0};
    std::chrono::microseconds grouping_time{0};
    std::chrono::microseconds total_time{0};

    std::size_t input_spans = 0;
    std::size_t removed_spans = 0;
    std::size_t headings_detected = 0;
    std::size_t section_count = 0;            // Flattened
    std::size_t group_count = 0;
};

struct PreprocessDiagnostics {
    std::vector<std::string> warnings;
    StageStatistics statistics;
};

// Output of one timed pipeline stage
template<typename T>
struct StageResult {
    T result{};
    std::chrono::microseconds duration{0};
    std::string stage_name;
};

} // namespace docstruct
