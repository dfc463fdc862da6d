#include "JsonSerialization.hpp"
#include "../processing/KeywordTaxonomy.hpp"
#include "../processing/PreprocessorErrors.hpp"

#include <fstream>
#include <optional>

#include <plog/Log.h>

using json = nlohmann::json;

namespace docstruct
{

namespace
{

/// Helper: read an optional number, null and absent both mean "no value"
std::optional<float> optionalNumber(const json& object, const char* key)
{
    if (!object.contains(key) || object[key].is_null())
        return std::nullopt;
    if (!object[key].is_number())
        throw InvalidContentError(std::string("span field '") + key + "' must be a number");
    return object[key].get<float>();
}

/// Helper: parse one span, defaulting its page to the enclosing page
TextSpan parseSpan(const json& span_json, int page_number)
{
    if (span_json.is_string())
    {
        TextSpan span;
        span.page = page_number;
        span.text = span_json.get<std::string>();
        return span;
    }
    if (!span_json.is_object())
        throw InvalidContentError("span must be an object or a string");

    TextSpan span;
    span.page = span_json.value("page", page_number);
    span.text = span_json.value("text", "");
    span.font_size = optionalNumber(span_json, "font_size");
    span.y_position = optionalNumber(span_json, "y");
    if (!span.y_position)
        span.y_position = optionalNumber(span_json, "y_position");
    return span;
}

Page parsePage(const json& page_json, int fallback_number)
{
    if (!page_json.is_object())
        throw InvalidContentError("page must be an object");

    Page page;
    page.number = page_json.value("page", fallback_number);

    if (page_json.contains("spans"))
    {
        const json& spans = page_json["spans"];
        if (!spans.is_array())
            throw InvalidContentError("page " + std::to_string(page.number) + ": 'spans' must be an array");
        for (const auto& span_json : spans)
            page.spans.push_back(parseSpan(span_json, page.number));
    }
    return page;
}

json patternArray(const std::set<std::string>& patterns)
{
    json arr = json::array();
    for (const auto& p : patterns)
        arr.push_back(p);
    return arr;
}

} // anonymous namespace

std::vector<Page> pagesFromJson(const json& document)
{
    const json* pages_json = &document;
    if (document.is_object())
    {
        if (!document.contains("pages"))
            throw InvalidContentError("span document has no 'pages' member");
        pages_json = &document["pages"];
    }
    if (!pages_json->is_array())
        throw InvalidContentError("'pages' must be an array");

    std::vector<Page> pages;
    pages.reserve(pages_json->size());
    int fallback = 1;
    try
    {
        for (const auto& page_json : *pages_json)
            pages.push_back(parsePage(page_json, fallback++));
    }
    catch (const json::exception& ex)
    {
        throw InvalidContentError(std::string("malformed span document: ") + ex.what());
    }
    return pages;
}

std::vector<Page> loadPages(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw InvalidContentError("cannot open span document: " + path);

    json document;
    try
    {
        document = json::parse(file);
    }
    catch (const json::parse_error& ex)
    {
        throw InvalidContentError("span document " + path + " is not valid JSON: " + ex.what());
    }

    auto pages = pagesFromJson(document);
    PLOG_INFO << "Loaded " << pages.size() << " pages from " << path;
    return pages;
}

json toJson(const Section& section)
{
    json j;
    j["title"] = section.title;
    j["level"] = section.level;
    j["page_range"] = { { "start", section.page_range.start }, { "end", section.page_range.end } };
    j["content"] = section.content;

    json subsections = json::array();
    for (const auto& sub : section.subsections)
        subsections.push_back(toJson(sub));
    j["subsections"] = std::move(subsections);
    return j;
}

json toJson(const FunctionalGroup& group)
{
    json j;
    j["name"] = group.name;
    j["keywords"] = patternArray(group.keywords);

    json sections = json::array();
    for (const Section* section : group.sections)
        sections.push_back(toJson(*section));
    j["sections"] = std::move(sections);
    return j;
}

json toJson(const StageStatistics& stats)
{
    return json{
        { "normalization_us", stats.normalization_time.count() },
        { "noise_removal_us", stats.noise_removal_time.count() },
        { "segmentation_us", stats.segmentation_time.count() },
        { "grouping_us", stats.grouping_time.count() },
        { "total_us", stats.total_time.count() },
        { "input_spans", stats.input_spans },
        { "removed_spans", stats.removed_spans },
        { "headings_detected", stats.headings_detected },
        { "sections", stats.section_count },
        { "groups", stats.group_count },
    };
}

json toJson(const EngineConfig& config, const KeywordTaxonomy& taxonomy)
{
    json j;
    j["stages"] = {
        { "normalize_text", config.normalize_text },
        { "remove_headers_footers", config.remove_headers_footers },
        { "segment_sections", config.segment_sections },
        { "group_by_function", config.group_by_function },
    };
    j["min_repetition"] = config.noise.min_repetition;
    j["position_threshold"] = config.noise.position_threshold;
    j["similarity_threshold"] = config.noise.similarity_threshold;
    j["similarity_metric"] = similarityMetricName(config.noise.similarity_metric);
    j["min_heading_font_size"] = config.segmenter.min_heading_font_size;
    j["font_size_ratio_threshold"] = config.segmenter.font_size_ratio_threshold;

    // Array keeps taxonomy order
    json groups = json::array();
    for (const auto& entry : taxonomy.entries())
        groups.push_back({ { "name", entry.name }, { "keywords", entry.keywords } });
    j["taxonomy"] = std::move(groups);
    return j;
}

json toJson(const PreprocessResult& result)
{
    json j;
    json groups = json::array();
    for (const auto& group : result.groups)
        groups.push_back(toJson(group));
    j["groups"] = std::move(groups);
    j["removed_header_patterns"] = patternArray(result.removed_header_patterns);
    j["removed_footer_patterns"] = patternArray(result.removed_footer_patterns);
    j["warnings"] = result.diagnostics.warnings;
    j["statistics"] = toJson(result.diagnostics.statistics);
    j["config"] = toJson(result.config, result.taxonomy);
    return j;
}

} // namespace docstruct
