#include "sturdypatch/core/structured_line.hpp"
#include <array>

namespace sturdypatch {

namespace {

// UTF-8 encodings of U+00A0, U+1680, U+2000..U+200A, U+202F, U+205F, U+3000
// and U+FEFF (byte order mark / zero width no-break space)
constexpr std::array<std::string_view, 17> multibyte_blanks{
    "\xC2\xA0",
    "\xE1\x9A\x80",
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",
    "\xE2\x80\xAF",
    "\xE2\x81\x9F",
    "\xE3\x80\x80",
    "\xEF\xBB\xBF"};

auto is_ascii_blank(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\v' || ch == '\f' || ch == '\r';
}

} // namespace

auto blank_length_at(std::string_view text, size_t pos) -> size_t {
    if (pos >= text.size()) {
        return 0;
    }
    if (is_ascii_blank(text[pos])) {
        return 1;
    }
    auto rest = text.substr(pos);
    for (auto blank : multibyte_blanks) {
        if (rest.starts_with(blank)) {
            return blank.size();
        }
    }
    return 0;
}

auto blank_length_before(std::string_view text, size_t end) -> size_t {
    if (end == 0 || end > text.size()) {
        return 0;
    }
    if (is_ascii_blank(text[end - 1])) {
        return 1;
    }
    auto head = text.substr(0, end);
    for (auto blank : multibyte_blanks) {
        if (head.ends_with(blank)) {
            return blank.size();
        }
    }
    return 0;
}

auto decompose(std::string_view raw_line, LineEnding line_ending) -> StructuredLine {
    size_t content_start = 0;
    while (auto length = blank_length_at(raw_line, content_start)) {
        content_start += length;
    }

    // All-blank lines keep everything as indentation so the split is unique
    if (content_start == raw_line.size()) {
        return StructuredLine{.indentation = std::string(raw_line),
                              .content = {},
                              .trailing = {},
                              .line_ending = line_ending};
    }

    size_t content_end = raw_line.size();
    while (auto length = blank_length_before(raw_line, content_end)) {
        if (content_end - length < content_start) {
            break;
        }
        content_end -= length;
    }

    return StructuredLine{
        .indentation = std::string(raw_line.substr(0, content_start)),
        .content = std::string(raw_line.substr(content_start, content_end - content_start)),
        .trailing = std::string(raw_line.substr(content_end)),
        .line_ending = line_ending};
}

auto recompose(const StructuredLine& line) -> std::string {
    auto raw = visible_text(line);
    raw += line_ending_text(line.line_ending);
    return raw;
}

auto visible_text(const StructuredLine& line) -> std::string {
    std::string text;
    text.reserve(line.indentation.size() + line.content.size() + line.trailing.size() + 2);
    text += line.indentation;
    text += line.content;
    text += line.trailing;
    return text;
}

auto line_ending_text(LineEnding ending) -> std::string_view {
    switch (ending) {
    case LineEnding::NONE:
        return "";
    case LineEnding::LF:
        return "\n";
    case LineEnding::CRLF:
        return "\r\n";
    }
    return "";
}

} // namespace sturdypatch
