#pragma once

#include "../config/EngineConfig.hpp"
#include "../model/DocumentTypes.hpp"
#include "../model/PreprocessResult.hpp"

#include <memory>
#include <vector>

namespace docstruct
{

class KeywordTaxonomy;

// Runs normalize -> remove noise -> segment -> group over one document.
// Immutable after construction; process() may be called from several threads.
class DocumentEngine
{
public:
    static constexpr const char* kAllSectionsGroup = "all";

    // Throws ConfigError for invalid options
    explicit DocumentEngine(EngineConfig config = {});
    ~DocumentEngine();

    DocumentEngine(const DocumentEngine&) = delete;
    DocumentEngine& operator=(const DocumentEngine&) = delete;

    // Throws InvalidContentError for empty input, otherwise the failing stage's PreprocessorError
    [[nodiscard]] PreprocessResult process(const std::vector<Page>& pages) const;

    [[nodiscard]] const EngineConfig& config() const noexcept;
    [[nodiscard]] const KeywordTaxonomy& taxonomy() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace docstruct
