#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace docstruct
{

struct Section;
struct PageRange;

// Verbose stage tracing switch and log-safe text previews.
// Stage traces go to the plog instance kLogInstance.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Escapes line breaks/tabs, truncates on a UTF-8 boundary
    [[nodiscard]] static std::string Preview(std::string_view text);

    [[nodiscard]] static std::string Describe(const PageRange& range);
    [[nodiscard]] static std::string Describe(const Section& section);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace docstruct
