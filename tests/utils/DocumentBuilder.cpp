#include "DocumentBuilder.hpp"

namespace test_utils {

docstruct::TextSpan span(int page, const std::string& text) {
    docstruct::TextSpan s;
    s.page = page;
    s.text = text;
    return s;
}

docstruct::TextSpan span(int page, const std::string& text, std::optional<float> font_size,
                         std::optional<float> y_position) {
    docstruct::TextSpan s = span(page, text);
    s.font_size = font_size;
    s.y_position = y_position;
    return s;
}

std::vector<docstruct::Page> pagesFromTexts(const std::vector<std::vector<std::string>>& texts) {
    std::vector<docstruct::Page> pages;
    for (const auto& page_texts : texts) {
        docstruct::Page page;
        page.number = static_cast<int>(pages.size()) + 1;
        for (const auto& text : page_texts)
            page.spans.push_back(span(page.number, text));
        pages.push_back(std::move(page));
    }
    return pages;
}

DocumentBuilder& DocumentBuilder::page() {
    docstruct::Page p;
    p.number = static_cast<int>(pages_.size()) + 1;
    pages_.push_back(std::move(p));
    return *this;
}

docstruct::Page& DocumentBuilder::current() {
    if (pages_.empty())
        page();
    return pages_.back();
}

DocumentBuilder& DocumentBuilder::text(const std::string& text) {
    docstruct::Page& p = current();
    p.spans.push_back(span(p.number, text));
    return *this;
}

DocumentBuilder& DocumentBuilder::text(const std::string& text, float font_size) {
    docstruct::Page& p = current();
    p.spans.push_back(span(p.number, text, font_size, std::nullopt));
    return *this;
}

DocumentBuilder& DocumentBuilder::at(const std::string& text, float y_position, float font_size) {
    docstruct::Page& p = current();
    p.spans.push_back(span(p.number, text, font_size, y_position));
    return *this;
}

DocumentBuilder& DocumentBuilder::header(const std::string& text) {
    return at(text, 20.0f, 9.0f);
}

DocumentBuilder& DocumentBuilder::footer(const std::string& text) {
    return at(text, 800.0f, 9.0f);
}

} // namespace test_utils
