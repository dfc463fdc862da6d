#pragma once

#include "../config/EngineConfig.hpp"
#include "../model/DocumentTypes.hpp"
#include "HeadingDetector.hpp"

#include <string>
#include <vector>

namespace docstruct
{

struct SegmentationResult
{
    std::vector<Section> sections;            // Top-level sections
    std::size_t headings_detected = 0;
    std::size_t font_size_headings = 0;       // Headings found by the font fallback
    std::vector<std::string> warnings;
};

// Turns the flat span stream into a heading tree
class SectionSegmenter
{
public:
    static constexpr const char* kFallbackTitle = "Document Content";

    explicit SectionSegmenter(SegmenterOptions options = {});

    // Throws SegmentationError when pages are not numbered 1..N or a span sits on the wrong page
    [[nodiscard]] std::vector<Section> segment(const std::vector<Page>& pages) const;
    [[nodiscard]] SegmentationResult analyze(const std::vector<Page>& pages) const;

    [[nodiscard]] const HeadingDetector& detector() const noexcept { return detector_; }

private:
    HeadingDetector detector_;
};

// Pre-order walk of the tree
[[nodiscard]] std::vector<const Section*> flattenSections(const std::vector<Section>& sections);

// Case-insensitive title lookup, depth first
[[nodiscard]] const Section* findSectionByTitle(const std::vector<Section>& sections, const std::string& title);

} // namespace docstruct
