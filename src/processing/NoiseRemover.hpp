#pragma once

#include "../config/EngineConfig.hpp"
#include "../model/DocumentTypes.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace docstruct
{

class ISimilarityMatcher;

struct NoiseRemovalResult
{
    std::vector<Page> pages;                  // Same page count and order as the input
    std::set<std::string> header_patterns;
    std::set<std::string> footer_patterns;
    std::size_t removed_spans = 0;
};

// Detects running headers/footers and page numbers and strips them from every page.
class NoiseRemover
{
public:
    explicit NoiseRemover(NoiseRemoverOptions options = {});
    ~NoiseRemover();

    NoiseRemover(const NoiseRemover&) = delete;
    NoiseRemover& operator=(const NoiseRemover&) = delete;

    [[nodiscard]] NoiseRemovalResult remove(const std::vector<Page>& pages) const;

    // Trimmed texts of spans in the top band (y <= threshold)
    [[nodiscard]] std::vector<std::string> topBandTexts(const Page& page) const;

    // Trimmed texts of spans in the bottom band (y >= max y of the page - threshold)
    [[nodiscard]] std::vector<std::string> bottomBandTexts(const Page& page) const;

    // "12", "Page 3", "3 / 10", "- 4 -", "5 페이지", "p. 6"
    [[nodiscard]] static bool isPageNumber(const std::string& text);

    [[nodiscard]] const NoiseRemoverOptions& options() const noexcept { return options_; }

private:
    std::set<std::string> detectPatterns(const std::vector<std::vector<std::string>>& band_texts) const;
    bool isNoise(const std::string& text, const std::set<std::string>& patterns) const;

    NoiseRemoverOptions options_;
    std::unique_ptr<ISimilarityMatcher> matcher_;
};

} // namespace docstruct
