#include "Diagnostics.hpp"
#include "../model/DocumentTypes.hpp"

#include <algorithm>
#include <sstream>

namespace docstruct
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes == 0)
        bytes = 1;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t limit = std::min(text.size(), MaxPreview());
    // Never split a multi-byte sequence
    while (limit > 0 && limit < text.size() && (static_cast<unsigned char>(text[limit]) & 0xC0) == 0x80)
        --limit;

    std::string out;
    out.reserve(limit + 16);
    for (char ch : text.substr(0, limit))
    {
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(ch);
            break;
        }
    }

    if (text.size() > limit)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    sanitize(out);
    return out;
}

std::string Diagnostics::Describe(const PageRange& range)
{
    if (range.start == range.end)
        return "p." + std::to_string(range.start);
    return "pp." + std::to_string(range.start) + "-" + std::to_string(range.end);
}

std::string Diagnostics::Describe(const Section& section)
{
    std::ostringstream oss;
    oss << "'" << Preview(section.title) << "' level=" << section.level << " " << Describe(section.page_range)
        << " content=" << section.content.size() << "B subsections=" << section.subsections.size();
    return oss.str();
}

void Diagnostics::sanitize(std::string& text)
{
    auto is_control = [](unsigned char c)
    {
        return c < 0x20 || c == 0x7F;
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace docstruct
