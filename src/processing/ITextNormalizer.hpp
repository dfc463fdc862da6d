#pragma once

#include <string>

namespace docstruct
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Converts \r\n and \r to \n
    [[nodiscard]] virtual std::string normalizeLineEndings(const std::string& text) const = 0;

    // Limits consecutive newlines to maximum 2
    [[nodiscard]] virtual std::string collapseNewlines(const std::string& text) const = 0;

    // Full normalization of a single span text. Must be idempotent.
    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;
};

} // namespace docstruct
