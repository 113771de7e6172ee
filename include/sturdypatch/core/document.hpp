#pragma once

#include "sturdypatch/core/structured_line.hpp"
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sturdypatch {

// A raw physical line as found in a text buffer, terminator split off
struct PhysicalLine {
    std::string_view text;
    LineEnding line_ending = LineEnding::NONE;
};

// Immutable snapshot of a text as StructuredLines. Copies share storage;
// edits build a new Document instead of touching this one.
class Document {
public:
    Document();
    explicit Document(std::vector<StructuredLine> lines);

    auto lines() const -> std::span<const StructuredLine>;
    auto size() const -> size_t;
    auto empty() const -> bool;
    auto operator[](size_t index) const -> const StructuredLine&;

    auto operator==(const Document& other) const -> bool;

private:
    std::shared_ptr<const std::vector<StructuredLine>> lines_;
};

// Split on LF, treating a preceding CR as part of a CRLF terminator.
// A terminated final line does not produce an extra empty line.
auto split_physical_lines(std::string_view text) -> std::vector<PhysicalLine>;

auto build_document(std::string_view raw_text) -> Document;
auto render_document(const Document& document) -> std::string;

// Terminator used for lines that need one but have no donor ending (majority, LF on ties)
auto dominant_line_ending(const Document& document) -> LineEnding;

// Content tokens of a search/replace block; the block's own formatting is discarded
auto tokenize_block(std::string_view raw_block) -> std::vector<std::string>;

// True when at least one token carries non-blank content
auto has_content(std::span<const std::string> tokens) -> bool;

} // namespace sturdypatch
