#include "ConfigLoader.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include <plog/Log.h>
#include <toml++/toml.h>

namespace docstruct
{

namespace
{

[[noreturn]] void failType(const std::string& key, const char* expected)
{
    throw ConfigError("config key '" + key + "' must be " + expected);
}

void readBool(const toml::table& table, const char* key, const std::string& path, bool& out)
{
    const toml::node* node = table.get(key);
    if (!node)
        return;
    if (auto v = node->value<bool>())
        out = *v;
    else
        failType(path + "." + key, "a boolean");
}

void readInt(const toml::table& table, const char* key, const std::string& path, int& out)
{
    const toml::node* node = table.get(key);
    if (!node)
        return;
    const auto value = node->value<std::int64_t>();
    if (!node->is_integer() || !value)
        failType(path + "." + key, "an integer");
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
        throw ConfigError("config key '" + path + "." + key + "' is out of range: " + std::to_string(*value));
    out = static_cast<int>(*value);
}

void readDouble(const toml::table& table, const char* key, const std::string& path, double& out)
{
    const toml::node* node = table.get(key);
    if (!node)
        return;
    if (auto v = node->value<double>())
        out = *v;
    else
        failType(path + "." + key, "a number");
}

void readNormalizer(const toml::table& table, NormalizerOptions& options)
{
    readBool(table, "unicode", "preprocessor.normalizer", options.normalize_unicode);
    readBool(table, "control_chars", "preprocessor.normalizer", options.remove_control_chars);
    readBool(table, "whitespace", "preprocessor.normalizer", options.normalize_whitespace);
}

void readNoise(const toml::table& table, NoiseRemoverOptions& options)
{
    readInt(table, "min_repetition", "preprocessor.noise", options.min_repetition);
    readDouble(table, "position_threshold", "preprocessor.noise", options.position_threshold);
    readDouble(table, "similarity_threshold", "preprocessor.noise", options.similarity_threshold);

    if (const toml::node* metric = table.get("similarity_metric"))
    {
        auto name = metric->value<std::string>();
        if (!name)
            failType("preprocessor.noise.similarity_metric", "a string");
        options.similarity_metric = parseSimilarityMetric(*name);
    }
}

void readSegmenter(const toml::table& table, SegmenterOptions& options)
{
    readDouble(table, "min_heading_font_size", "preprocessor.segmenter", options.min_heading_font_size);
    readDouble(table, "font_size_ratio_threshold", "preprocessor.segmenter", options.font_size_ratio_threshold);
}

// toml++ tables iterate in key order, so custom groups are appended alphabetically
void readKeywords(const toml::table& table, KeywordList& out)
{
    for (auto&& [key, node] : table)
    {
        const std::string group(key.str());
        const toml::array* words = node.as_array();
        if (!words)
            failType("preprocessor.keywords." + group, "an array of strings");

        std::vector<std::string> keywords;
        keywords.reserve(words->size());
        for (const auto& word : *words)
        {
            auto text = word.value<std::string>();
            if (!text)
                failType("preprocessor.keywords." + group, "an array of strings");
            keywords.push_back(*text);
        }
        out.emplace_back(group, std::move(keywords));
    }
}

EngineConfig fromTable(const toml::table& root)
{
    EngineConfig config;

    const toml::table* pre = root["preprocessor"].as_table();
    if (pre)
    {
        readBool(*pre, "normalize_text", "preprocessor", config.normalize_text);
        readBool(*pre, "remove_headers_footers", "preprocessor", config.remove_headers_footers);
        readBool(*pre, "segment_sections", "preprocessor", config.segment_sections);
        readBool(*pre, "group_by_function", "preprocessor", config.group_by_function);

        if (auto t = (*pre)["normalizer"].as_table())
            readNormalizer(*t, config.normalizer);
        if (auto t = (*pre)["noise"].as_table())
            readNoise(*t, config.noise);
        if (auto t = (*pre)["segmenter"].as_table())
            readSegmenter(*t, config.segmenter);
        if (auto t = (*pre)["keywords"].as_table())
            readKeywords(*t, config.custom_keywords);
    }

    validate(config);
    return config;
}

} // namespace

SimilarityMetric parseSimilarityMetric(const std::string& name)
{
    if (name == "charset" || name == "character_set")
        return SimilarityMetric::CharacterSet;
    if (name == "ratio")
        return SimilarityMetric::Ratio;
    throw ConfigError("unknown similarity metric '" + name + "' (expected \"charset\" or \"ratio\")");
}

EngineConfig parseEngineConfig(const std::string& toml_text, const std::string& source)
{
    try
    {
        return fromTable(toml::parse(toml_text, source));
    }
    catch (const toml::parse_error& pe)
    {
        std::ostringstream oss;
        oss << "config parse error in " << source;
        if (pe.source().begin.line > 0)
            oss << " at line " << pe.source().begin.line;
        oss << ": " << pe.description();
        throw ConfigError(oss.str());
    }
}

EngineConfig loadEngineConfig(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "Config file " << path << " not found, using defaults";
        return EngineConfig{};
    }

    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    EngineConfig config = parseEngineConfig(buffer.str(), path);
    PLOG_INFO << "Loaded engine configuration from " << path;
    return config;
}

} // namespace docstruct
