#pragma once

#include "ITextNormalizer.hpp"
#include "../config/EngineConfig.hpp"

#include <vector>

namespace docstruct
{

/**
 * @brief Span text cleaner: NFC composition, control character removal and
 * whitespace normalization, each step toggled by NormalizerOptions.
 *
 * normalize() is idempotent for every option combination. Invalid UTF-8
 * raises NormalizationError.
 *
 * Example:
 * @code
 * UnicodeTextNormalizer normalizer;
 * normalizer.normalize("  Café \t menu \n\n\n\n next ");  // "Café menu\n\nnext"
 * @endcode
 */
class UnicodeTextNormalizer : public ITextNormalizer
{
public:
    explicit UnicodeTextNormalizer(NormalizerOptions options = {});
    ~UnicodeTextNormalizer() override;

    [[nodiscard]] std::string normalizeLineEndings(const std::string& text) const override;
    [[nodiscard]] std::string collapseNewlines(const std::string& text) const override;
    [[nodiscard]] std::string normalize(const std::string& text) const override;

    [[nodiscard]] std::vector<std::string> normalizeBatch(const std::vector<std::string>& texts) const;

    // Individual steps
    [[nodiscard]] std::string composeUnicode(const std::string& text) const;
    [[nodiscard]] std::string removeControlCharacters(const std::string& text) const;
    [[nodiscard]] std::string normalizeWhitespace(const std::string& text) const;

    // Optional cleanups, not part of normalize()
    [[nodiscard]] std::string normalizeQuotes(const std::string& text) const;
    [[nodiscard]] std::string normalizeNumbers(const std::string& text) const;
    [[nodiscard]] std::string removeExcessivePunctuation(const std::string& text) const;
    [[nodiscard]] std::string removeUrls(const std::string& text) const;

    // Drops every code point that is not a letter, number, '_', whitespace or one of keep_chars
    [[nodiscard]] std::string cleanSpecialCharacters(const std::string& text,
                                                     const std::string& keep_chars = kDefaultKeepChars) const;

    static constexpr const char* kDefaultKeepChars = ".,!?;:()[]{}'\"-\n\t ";

    [[nodiscard]] const NormalizerOptions& options() const noexcept { return options_; }

private:
    NormalizerOptions options_;
};

} // namespace docstruct
