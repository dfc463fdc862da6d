#include "DocumentEngine.hpp"
#include "Diagnostics.hpp"
#include "FunctionalGrouper.hpp"
#include "NoiseRemover.hpp"
#include "PreprocessorErrors.hpp"
#include "SectionSegmenter.hpp"
#include "StageRunner.hpp"
#include "TextUtils.hpp"
#include "UnicodeTextNormalizer.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <chrono>
#include <plog/Log.h>

namespace docstruct
{

namespace
{

constexpr std::size_t kMinContentLength = 10;
constexpr std::size_t kMaxContentLength = 100000;

void addWarning(PreprocessDiagnostics& diagnostics, std::string message)
{
    PLOG_WARNING << "[DocumentEngine] " << message;
    diagnostics.warnings.push_back(std::move(message));
}

void addWarnings(PreprocessDiagnostics& diagnostics, std::vector<std::string>& messages)
{
    for (auto& message : messages)
        addWarning(diagnostics, std::move(message));
    messages.clear();
}

std::size_t validateInput(const std::vector<Page>& pages, PreprocessDiagnostics& diagnostics)
{
    if (pages.empty())
        throw InvalidContentError("document has no pages");

    std::size_t span_count = 0;
    bool has_text = false;
    for (const auto& page : pages)
    {
        span_count += page.spans.size();
        has_text = has_text || std::any_of(page.spans.begin(), page.spans.end(),
                                           [](const TextSpan& span) { return !isBlank(span.text); });
    }

    if (span_count == 0)
        throw InvalidContentError("document has no text spans");
    if (!has_text)
        addWarning(diagnostics, "document spans are all empty; continuing with whatever content remains");
    return span_count;
}

void validateResult(const PreprocessResult& result, PreprocessDiagnostics& diagnostics)
{
    if (result.groups.empty())
    {
        addWarning(diagnostics, "no functional groups created");
        return;
    }

    for (const auto& group : result.groups)
    {
        if (group.sections.empty())
            addWarning(diagnostics, "functional group '" + group.name + "' has no sections");
    }

    // Each section once, even when it sits in several groups
    for (const Section* section : flattenSections(result.sections))
    {
        if (isBlank(section->title))
        {
            addWarning(diagnostics, "section has empty title: " + Diagnostics::Describe(*section));
        }
        if (section->content.size() > kMaxContentLength)
        {
            addWarning(diagnostics, "section '" + Diagnostics::Preview(section->title) + "' has very long content (" +
                                        std::to_string(section->content.size()) + " chars)");
        }
        else if (section->content.size() < kMinContentLength)
        {
            addWarning(diagnostics, "section '" + Diagnostics::Preview(section->title) + "' has very short content (" +
                                        std::to_string(section->content.size()) + " chars)");
        }
    }
}

std::vector<Page> normalizePages(const UnicodeTextNormalizer& normalizer, const std::vector<Page>& pages)
{
    std::vector<Page> out = pages;
    for (auto& page : out)
    {
        for (auto& span : page.spans)
            span.text = normalizer.normalize(span.text);
    }
    return out;
}

void logStatistics(const PreprocessResult& result)
{
    const StageStatistics& stats = result.diagnostics.statistics;
    PLOG_INFO << "=== Preprocessing Statistics ===";
    PLOG_INFO << "Normalization time: " << stats.normalization_time.count() << "us";
    PLOG_INFO << "Header/footer removal time: " << stats.noise_removal_time.count() << "us";
    PLOG_INFO << "Segmentation time: " << stats.segmentation_time.count() << "us";
    PLOG_INFO << "Grouping time: " << stats.grouping_time.count() << "us";
    PLOG_INFO << "Total time: " << stats.total_time.count() << "us";
    PLOG_INFO << "Spans: " << stats.input_spans << " in, " << stats.removed_spans << " removed as noise";
    PLOG_INFO << "Sections: " << stats.section_count << " (" << stats.headings_detected << " headings)";
    PLOG_INFO << "Functional groups: " << stats.group_count;
    for (const auto& group : result.groups)
        PLOG_INFO << "  - " << group.name << ": " << group.sections.size() << " sections";
}

} // anonymous namespace

struct DocumentEngine::Impl
{
    explicit Impl(EngineConfig cfg)
        : config(std::move(cfg))
        , normalizer(config.normalizer)
        , noise_remover(config.noise)
        , segmenter(config.segmenter)
        , grouper(KeywordTaxonomy::defaults().merged(config.custom_keywords))
    {
    }

    EngineConfig config;
    UnicodeTextNormalizer normalizer;
    NoiseRemover noise_remover;
    SectionSegmenter segmenter;
    FunctionalGrouper grouper;
};

DocumentEngine::DocumentEngine(EngineConfig config)
{
    validate(config);
    impl_ = std::make_unique<Impl>(std::move(config));
}

DocumentEngine::~DocumentEngine() = default;

const EngineConfig& DocumentEngine::config() const noexcept { return impl_->config; }

const KeywordTaxonomy& DocumentEngine::taxonomy() const noexcept { return impl_->grouper.taxonomy(); }

PreprocessResult DocumentEngine::process(const std::vector<Page>& pages) const
{
    PROFILE_SCOPE_CUSTOM("DocumentEngine::process");

    const auto started = std::chrono::steady_clock::now();
    PreprocessResult result;
    result.config = impl_->config;
    result.taxonomy = impl_->grouper.taxonomy();
    PreprocessDiagnostics& diagnostics = result.diagnostics;
    StageStatistics& stats = diagnostics.statistics;

    PLOG_INFO << "[DocumentEngine] Starting preprocessing of " << pages.size() << " pages";
    stats.input_spans = validateInput(pages, diagnostics);

    std::vector<Page> current = pages;

    if (impl_->config.normalize_text)
    {
        auto stage = run_stage<std::vector<Page>, NormalizationError>("normalizer",
                                                                      [&]()
                                                                      {
                                                                          return normalizePages(impl_->normalizer, current);
                                                                      });
        stats.normalization_time = stage.duration;
        current = std::move(stage.result);
    }

    if (impl_->config.remove_headers_footers)
    {
        auto stage = run_stage<NoiseRemovalResult, NoiseRemovalError>("noise_remover",
                                                                      [&]()
                                                                      {
                                                                          return impl_->noise_remover.remove(current);
                                                                      });
        stats.noise_removal_time = stage.duration;
        stats.removed_spans = stage.result.removed_spans;
        result.removed_header_patterns = std::move(stage.result.header_patterns);
        result.removed_footer_patterns = std::move(stage.result.footer_patterns);
        current = std::move(stage.result.pages);
    }

    if (impl_->config.segment_sections)
    {
        auto stage = run_stage<SegmentationResult, SegmentationError>("segmenter",
                                                                      [&]()
                                                                      {
                                                                          return impl_->segmenter.analyze(current);
                                                                      });
        stats.segmentation_time = stage.duration;
        stats.headings_detected = stage.result.headings_detected;
        addWarnings(diagnostics, stage.result.warnings);
        result.sections = std::move(stage.result.sections);
    }
    stats.section_count = flattenSections(result.sections).size();

    // Groups point into result.sections, which is not touched after this point
    if (impl_->config.group_by_function && !result.sections.empty())
    {
        auto stage = run_stage<GroupingResult, GroupingError>("grouper",
                                                              [&]()
                                                              {
                                                                  return impl_->grouper.analyze(result.sections);
                                                              });
        stats.grouping_time = stage.duration;
        addWarnings(diagnostics, stage.result.warnings);
        result.groups = std::move(stage.result.groups);
    }
    else if (!result.sections.empty())
    {
        FunctionalGroup all;
        all.name = kAllSectionsGroup;
        for (const auto& section : result.sections)
            all.sections.push_back(&section);
        result.groups.push_back(std::move(all));
    }
    stats.group_count = result.groups.size();

    validateResult(result, diagnostics);

    stats.total_time =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    logStatistics(result);

    PLOG_INFO << "[DocumentEngine] Preprocessing completed in " << stats.total_time.count() << "us";
    return result;
}

} // namespace docstruct
