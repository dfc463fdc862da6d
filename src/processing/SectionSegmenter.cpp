#include "SectionSegmenter.hpp"
#include "Diagnostics.hpp"
#include "PreprocessorErrors.hpp"
#include "TextUtils.hpp"

#include <sstream>
#include <utility>

#include <plog/Log.h>

namespace docstruct
{

namespace
{

struct SpanRef
{
    int page;
    const TextSpan* span;
};

struct DetectedHeading
{
    std::size_t index; // Position in the flattened span stream
    int page;
    HeadingMatch match;
};

void validatePages(const std::vector<Page>& pages)
{
    for (std::size_t i = 0; i < pages.size(); ++i)
    {
        const int expected = static_cast<int>(i) + 1;
        if (pages[i].number != expected)
        {
            throw SegmentationError("page numbers must be contiguous from 1: expected " + std::to_string(expected) +
                                    ", got " + std::to_string(pages[i].number));
        }
        for (const auto& span : pages[i].spans)
        {
            if (span.page != pages[i].number)
            {
                throw SegmentationError("span on page " + std::to_string(pages[i].number) + " claims page " +
                                        std::to_string(span.page));
            }
        }
    }
}

std::string joinContent(const std::vector<SpanRef>& items, std::size_t begin, std::size_t end)
{
    std::string content;
    for (std::size_t i = begin; i < end; ++i)
    {
        const std::string text = trim(items[i].span->text);
        if (text.empty())
            continue;
        if (!content.empty())
            content.push_back('\n');
        content += text;
    }
    return content;
}

} // anonymous namespace

SectionSegmenter::SectionSegmenter(SegmenterOptions options)
    : detector_(options)
{
}

std::vector<Section> SectionSegmenter::segment(const std::vector<Page>& pages) const
{
    return analyze(pages).sections;
}

SegmentationResult SectionSegmenter::analyze(const std::vector<Page>& pages) const
{
    validatePages(pages);

    SegmentationResult result;
    if (pages.empty())
        return result;

    const int last_page = pages.back().number;
    const double avg_font_size = HeadingDetector::averageFontSize(pages);
    PLOG_DEBUG << "[SectionSegmenter] Average font size: " << avg_font_size;

    std::vector<SpanRef> items;
    for (const auto& page : pages)
    {
        for (const auto& span : page.spans)
            items.push_back(SpanRef{ page.number, &span });
    }

    std::vector<DetectedHeading> headings;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        auto match = detector_.detect(*items[i].span, avg_font_size);
        if (!match)
            continue;

        if (match->signal == HeadingSignal::FontSize)
        {
            ++result.font_size_headings;
            std::ostringstream oss;
            oss << "heading inferred from font size on p." << items[i].page << ": '"
                << Diagnostics::Preview(match->title) << "' (level " << match->level << ")";
            result.warnings.push_back(oss.str());
        }
        headings.push_back(DetectedHeading{ i, items[i].page, std::move(*match) });
    }
    result.headings_detected = headings.size();
    PLOG_INFO << "[SectionSegmenter] Identified " << headings.size() << " headings (" << result.font_size_headings
              << " by font size)";

    if (headings.empty())
    {
        std::string content = joinContent(items, 0, items.size());
        if (content.empty())
        {
            PLOG_WARNING << "[SectionSegmenter] No text found for segmentation";
            return result;
        }

        Section whole;
        whole.title = kFallbackTitle;
        whole.level = 1;
        whole.content = std::move(content);
        whole.page_range = PageRange{ pages.front().number, last_page };
        result.sections.push_back(std::move(whole));
        result.warnings.push_back("no headings detected; the whole document forms one section");
        return result;
    }

    const std::string preamble = joinContent(items, 0, headings.front().index);
    if (!preamble.empty())
    {
        result.warnings.push_back("text before the first heading is not part of any section: '" +
                                  Diagnostics::Preview(preamble) + "'");
    }

    // Open headings, innermost last. Pointers stay valid: a vector only grows
    // once every earlier child of its owner has been popped.
    std::vector<std::pair<int, Section*>> stack;

    for (std::size_t h = 0; h < headings.size(); ++h)
    {
        const DetectedHeading& heading = headings[h];
        const std::size_t content_end = (h + 1 < headings.size()) ? headings[h + 1].index : items.size();

        Section section;
        section.title = heading.match.title;
        section.level = heading.match.level;
        section.content = joinContent(items, heading.index + 1, content_end);
        section.page_range = PageRange{ heading.page, last_page };

        // Close sections that cannot be ancestors; they end just before this heading
        const int closing_page = heading.index > 0 ? items[heading.index - 1].page : heading.page;
        while (!stack.empty() && stack.back().first >= section.level)
        {
            stack.back().second->page_range.end = closing_page;
            stack.pop_back();
        }

        Section* placed = nullptr;
        if (stack.empty())
        {
            result.sections.push_back(std::move(section));
            placed = &result.sections.back();
        }
        else
        {
            Section* parent = stack.back().second;
            parent->subsections.push_back(std::move(section));
            placed = &parent->subsections.back();
        }
        stack.emplace_back(placed->level, placed);
    }

    PLOG_INFO << "[SectionSegmenter] Built " << result.sections.size() << " top-level sections";
    if (Diagnostics::IsVerbose())
    {
        for (const Section* s : flattenSections(result.sections))
            PLOG_INFO_(Diagnostics::kLogInstance) << "[SectionSegmenter] section " << Diagnostics::Describe(*s);
    }
    return result;
}

std::vector<const Section*> flattenSections(const std::vector<Section>& sections)
{
    std::vector<const Section*> flat;
    // Explicit stack keeps deep trees off the call stack
    std::vector<const Section*> pending;
    for (auto it = sections.rbegin(); it != sections.rend(); ++it)
        pending.push_back(&*it);

    while (!pending.empty())
    {
        const Section* current = pending.back();
        pending.pop_back();
        flat.push_back(current);
        for (auto it = current->subsections.rbegin(); it != current->subsections.rend(); ++it)
            pending.push_back(&*it);
    }
    return flat;
}

const Section* findSectionByTitle(const std::vector<Section>& sections, const std::string& title)
{
    const std::string wanted = caseFold(title);
    for (const Section* section : flattenSections(sections))
    {
        if (caseFold(section->title) == wanted)
            return section;
    }
    return nullptr;
}

} // namespace docstruct
