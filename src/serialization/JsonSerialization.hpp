#pragma once

#include "../config/EngineConfig.hpp"
#include "../model/DocumentTypes.hpp"
#include "../model/PreprocessResult.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docstruct
{

class KeywordTaxonomy;

/// Parse the extractor hand-off: {"pages":[{"page":1,"spans":[{"text":"..","font_size":11.0,"y":42.0}]}]}
/// or a bare array of pages. Missing or null font_size / y leave the optional empty.
/// Throws InvalidContentError when the document does not have that shape.
std::vector<Page> pagesFromJson(const nlohmann::json& document);

/// Read and parse a span dump from disk
std::vector<Page> loadPages(const std::string& path);

nlohmann::json toJson(const Section& section);
nlohmann::json toJson(const FunctionalGroup& group);
nlohmann::json toJson(const StageStatistics& stats);
nlohmann::json toJson(const EngineConfig& config, const KeywordTaxonomy& taxonomy);
nlohmann::json toJson(const PreprocessResult& result);

} // namespace docstruct
