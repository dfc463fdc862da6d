#include "NoiseRemover.hpp"
#include "Diagnostics.hpp"
#include "SimilarityMatchers.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <regex>

#include <plog/Log.h>

namespace docstruct
{

namespace
{

// Longest label worth matching ("12345 / 12345" and friends); std::regex recurses per character
constexpr std::size_t kMaxPageLabelBytes = 32;

const std::array<std::regex, 6>& pageNumberShapes()
{
    static const std::array<std::regex, 6> shapes = {
        std::regex(R"(^\d+$)"),
        std::regex(R"(^page\s+\d+$)", std::regex::ECMAScript | std::regex::icase),
        std::regex(R"(^\d+\s*/\s*\d+$)"),
        std::regex(R"(^-\s*\d+\s*-$)"),
        std::regex(R"(^\d+\s+페이지$)"),
        std::regex(R"(^p\.\s*\d+$)", std::regex::ECMAScript | std::regex::icase),
    };
    return shapes;
}

std::string joinPatterns(const std::set<std::string>& patterns)
{
    std::string out;
    for (const auto& p : patterns)
    {
        if (!out.empty())
            out += " | ";
        out += Diagnostics::Preview(p);
    }
    return out;
}

} // anonymous namespace

NoiseRemover::NoiseRemover(NoiseRemoverOptions options)
    : options_(options)
    , matcher_(makeSimilarityMatcher(options.similarity_metric))
{
}

NoiseRemover::~NoiseRemover() = default;

bool NoiseRemover::isPageNumber(const std::string& text)
{
    const std::string trimmed = trim(text);
    if (trimmed.empty() || trimmed.size() > kMaxPageLabelBytes)
        return false;
    const auto& shapes = pageNumberShapes();
    return std::any_of(shapes.begin(), shapes.end(),
                       [&trimmed](const std::regex& shape) { return std::regex_match(trimmed, shape); });
}

std::vector<std::string> NoiseRemover::topBandTexts(const Page& page) const
{
    std::vector<std::string> texts;
    for (const auto& span : page.spans)
    {
        if (span.y_position && *span.y_position <= options_.position_threshold)
            texts.push_back(trim(span.text));
    }
    return texts;
}

std::vector<std::string> NoiseRemover::bottomBandTexts(const Page& page) const
{
    std::vector<std::string> texts;

    double max_y = 0.0;
    for (const auto& span : page.spans)
    {
        if (span.y_position)
            max_y = std::max(max_y, static_cast<double>(*span.y_position));
    }

    const double bottom_threshold = max_y - options_.position_threshold;
    for (const auto& span : page.spans)
    {
        if (span.y_position && *span.y_position >= bottom_threshold)
            texts.push_back(trim(span.text));
    }
    return texts;
}

std::set<std::string> NoiseRemover::detectPatterns(const std::vector<std::vector<std::string>>& band_texts) const
{
    // text -> indices of the pages it appears on
    std::map<std::string, std::set<std::size_t>> occurrences;
    for (std::size_t page_idx = 0; page_idx < band_texts.size(); ++page_idx)
    {
        for (const auto& text : band_texts[page_idx])
        {
            if (!text.empty())
                occurrences[text].insert(page_idx);
        }
    }

    std::set<std::string> patterns;
    for (const auto& [text, pages] : occurrences)
    {
        if (pages.size() >= static_cast<std::size_t>(options_.min_repetition) || isPageNumber(text))
            patterns.insert(text);
    }
    return patterns;
}

bool NoiseRemover::isNoise(const std::string& text, const std::set<std::string>& patterns) const
{
    if (text.empty() || patterns.empty())
        return false;
    if (patterns.count(text))
        return true;
    return matcher_->findBestMatch(text, patterns, options_.similarity_threshold).has_value();
}

NoiseRemovalResult NoiseRemover::remove(const std::vector<Page>& pages) const
{
    NoiseRemovalResult result;

    // Repetition cannot be established on a short document
    if (pages.size() < static_cast<std::size_t>(options_.min_repetition))
    {
        PLOG_DEBUG << "[NoiseRemover] " << pages.size() << " pages < min_repetition=" << options_.min_repetition
                   << ", skipping detection";
        result.pages = pages;
        return result;
    }

    std::vector<std::vector<std::string>> top_texts;
    std::vector<std::vector<std::string>> bottom_texts;
    top_texts.reserve(pages.size());
    bottom_texts.reserve(pages.size());
    for (const auto& page : pages)
    {
        top_texts.push_back(topBandTexts(page));
        bottom_texts.push_back(bottomBandTexts(page));
    }

    result.header_patterns = detectPatterns(top_texts);
    result.footer_patterns = detectPatterns(bottom_texts);

    PLOG_INFO << "[NoiseRemover] Detected " << result.header_patterns.size() << " header patterns and "
              << result.footer_patterns.size() << " footer patterns";
    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[NoiseRemover] headers=[" << joinPatterns(result.header_patterns)
                                              << "] footers=[" << joinPatterns(result.footer_patterns) << "]";
    }

    std::set<std::string> all_patterns = result.header_patterns;
    all_patterns.insert(result.footer_patterns.begin(), result.footer_patterns.end());

    result.pages.reserve(pages.size());
    for (const auto& page : pages)
    {
        Page cleaned;
        cleaned.number = page.number;
        cleaned.spans.reserve(page.spans.size());
        for (const auto& span : page.spans)
        {
            if (isNoise(trim(span.text), all_patterns))
            {
                ++result.removed_spans;
                continue;
            }
            cleaned.spans.push_back(span);
        }
        result.pages.push_back(std::move(cleaned));
    }

    PLOG_DEBUG << "[NoiseRemover] Removed " << result.removed_spans << " spans";
    return result;
}

} // namespace docstruct
