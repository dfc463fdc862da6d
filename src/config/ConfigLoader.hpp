#pragma once

#include "EngineConfig.hpp"

#include <string>

namespace docstruct
{

// Reads the [preprocessor] tables of a TOML document into an EngineConfig.
// A missing file yields defaults; parse errors and invalid values throw ConfigError.
[[nodiscard]] EngineConfig loadEngineConfig(const std::string& path);

[[nodiscard]] EngineConfig parseEngineConfig(const std::string& toml_text, const std::string& source = "<string>");

[[nodiscard]] SimilarityMetric parseSimilarityMetric(const std::string& name);

} // namespace docstruct
