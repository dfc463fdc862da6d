#pragma once

#include "DocumentTypes.hpp"
#include "../config/EngineConfig.hpp"
#include "../processing/KeywordTaxonomy.hpp"

#include <set>
#include <string>
#include <vector>

namespace docstruct {

// Final output of the engine. Owns the section tree that the groups point into,
// so it can be moved but not copied.
struct PreprocessResult {
    std::vector<Section> sections;            // Top-level sections
    std::vector<FunctionalGroup> groups;      // Taxonomy order, "unclassified" last
    std::set<std::string> removed_header_patterns;
    std::set<std::string> removed_footer_patterns;
    PreprocessDiagnostics diagnostics;

    // What produced this result, for audit and reproducibility
    EngineConfig config;
    KeywordTaxonomy taxonomy;

    PreprocessResult() = default;
    PreprocessResult(const PreprocessResult&) = delete;
    PreprocessResult& operator=(const PreprocessResult&) = delete;
    PreprocessResult(PreprocessResult&&) = default;
    PreprocessResult& operator=(PreprocessResult&&) = default;
};

} // namespace docstruct
