#include "sturdypatch/core/document.hpp"
#include <algorithm>

namespace sturdypatch {

Document::Document() : lines_(std::make_shared<const std::vector<StructuredLine>>()) {}

Document::Document(std::vector<StructuredLine> lines)
    : lines_(std::make_shared<const std::vector<StructuredLine>>(std::move(lines))) {}

auto Document::lines() const -> std::span<const StructuredLine> { return *lines_; }

auto Document::size() const -> size_t { return lines_->size(); }

auto Document::empty() const -> bool { return lines_->empty(); }

auto Document::operator[](size_t index) const -> const StructuredLine& {
    return (*lines_)[index];
}

auto Document::operator==(const Document& other) const -> bool {
    return lines_ == other.lines_ || *lines_ == *other.lines_;
}

auto split_physical_lines(std::string_view text) -> std::vector<PhysicalLine> {
    std::vector<PhysicalLine> lines;
    size_t line_start = 0;

    while (line_start < text.size()) {
        auto newline = text.find('\n', line_start);
        if (newline == std::string_view::npos) {
            lines.push_back(
                PhysicalLine{.text = text.substr(line_start), .line_ending = LineEnding::NONE});
            break;
        }

        if (newline > line_start && text[newline - 1] == '\r') {
            lines.push_back(PhysicalLine{.text = text.substr(line_start, newline - 1 - line_start),
                                         .line_ending = LineEnding::CRLF});
        } else {
            lines.push_back(PhysicalLine{.text = text.substr(line_start, newline - line_start),
                                         .line_ending = LineEnding::LF});
        }
        line_start = newline + 1;
    }

    return lines;
}

auto build_document(std::string_view raw_text) -> Document {
    auto physical_lines = split_physical_lines(raw_text);

    std::vector<StructuredLine> lines;
    lines.reserve(physical_lines.size());
    for (const auto& physical : physical_lines) {
        lines.push_back(decompose(physical.text, physical.line_ending));
    }

    return Document(std::move(lines));
}

auto render_document(const Document& document) -> std::string {
    std::string text;
    for (const auto& line : document.lines()) {
        text += recompose(line);
    }
    return text;
}

auto dominant_line_ending(const Document& document) -> LineEnding {
    auto lines = document.lines();
    auto crlf_count = std::ranges::count(lines, LineEnding::CRLF, &StructuredLine::line_ending);
    auto lf_count = std::ranges::count(lines, LineEnding::LF, &StructuredLine::line_ending);
    return crlf_count > lf_count ? LineEnding::CRLF : LineEnding::LF;
}

auto tokenize_block(std::string_view raw_block) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    for (const auto& physical : split_physical_lines(raw_block)) {
        tokens.push_back(decompose(physical.text, physical.line_ending).content);
    }
    return tokens;
}

auto has_content(std::span<const std::string> tokens) -> bool {
    return std::ranges::any_of(tokens, [](const std::string& token) { return !token.empty(); });
}

} // namespace sturdypatch
