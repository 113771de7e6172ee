#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sturdypatch {

// Terminator captured per line so mixed-ending files round-trip
enum class LineEnding {
    NONE,  // Final line without terminator
    LF,    // "\n"
    CRLF   // "\r\n"
};

// One physical line split into its formatting and its comparable content.
// indentation + content + trailing + line_ending reproduces the line exactly.
struct StructuredLine {
    std::string indentation;                   // Leading blank run
    std::string content;                       // Unit of comparison, never holds a terminator
    std::string trailing;                      // Trailing blank run
    LineEnding line_ending = LineEnding::NONE;

    auto operator==(const StructuredLine& other) const -> bool = default;
};

// Pure functions for StructuredLine decomposition
auto decompose(std::string_view raw_line, LineEnding line_ending) -> StructuredLine;
auto recompose(const StructuredLine& line) -> std::string;

// Line text without its terminator
auto visible_text(const StructuredLine& line) -> std::string;

auto line_ending_text(LineEnding ending) -> std::string_view;

// Byte length of the blank character starting at pos (0 when not blank).
// Recognizes ASCII blanks and the UTF-8 encoded Unicode space separators.
auto blank_length_at(std::string_view text, size_t pos) -> size_t;

// Byte length of the blank character ending just before end (0 when not blank)
auto blank_length_before(std::string_view text, size_t end) -> size_t;

} // namespace sturdypatch
