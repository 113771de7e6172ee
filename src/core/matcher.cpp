#include "sturdypatch/core/matcher.hpp"
#include <algorithm>
#include <ranges>

namespace sturdypatch {

namespace {

template<std::ranges::random_access_range DocumentContents>
auto scan_for_block(const DocumentContents& contents, std::span<const std::string> tokens)
    -> std::vector<size_t> {
    std::vector<size_t> starts;
    auto window = tokens.size();
    auto line_count = std::ranges::size(contents);

    if (window == 0 || window > line_count) {
        return starts;
    }

    for (size_t start = 0; start + window <= line_count; ++start) {
        bool matched = true;
        for (size_t offset = 0; offset < window; ++offset) {
            if (contents[start + offset] != tokens[offset]) {
                matched = false;
                break;
            }
        }
        if (matched) {
            starts.push_back(start);
        }
    }

    return starts;
}

} // namespace

auto normalize_whitespace(std::string_view text) -> std::string {
    std::string normalized;
    normalized.reserve(text.size());

    bool pending_space = false;
    size_t pos = 0;
    while (pos < text.size()) {
        if (auto length = blank_length_at(text, pos)) {
            pending_space = !normalized.empty();
            pos += length;
            continue;
        }
        if (pending_space) {
            normalized += ' ';
            pending_space = false;
        }
        normalized += text[pos];
        ++pos;
    }

    return normalized;
}

auto find_matches(const Document& document, std::span<const std::string> search_tokens,
                  MatchMode mode) -> std::vector<size_t> {
    auto lines = document.lines();

    if (mode == MatchMode::STRICT) {
        auto contents = lines | std::views::transform(&StructuredLine::content);
        return scan_for_block(contents, search_tokens);
    }

    // Normalize each side once instead of per comparison
    std::vector<std::string> normalized_contents;
    normalized_contents.reserve(lines.size());
    for (const auto& line : lines) {
        normalized_contents.push_back(normalize_whitespace(line.content));
    }

    std::vector<std::string> normalized_tokens;
    normalized_tokens.reserve(search_tokens.size());
    for (const auto& token : search_tokens) {
        normalized_tokens.push_back(normalize_whitespace(token));
    }

    return scan_for_block(normalized_contents, normalized_tokens);
}

auto locate_block(const Document& document, std::span<const std::string> search_tokens)
    -> std::optional<MatchResult> {
    for (auto mode : {MatchMode::STRICT, MatchMode::FLOATING}) {
        auto starts = find_matches(document, search_tokens, mode);
        if (!starts.empty()) {
            return MatchResult{
                .span = MatchSpan{.start = starts.front(), .length = search_tokens.size()},
                .mode = mode,
                .candidate_count = starts.size()};
        }
    }
    return std::nullopt;
}

auto match_mode_name(MatchMode mode) -> std::string {
    switch (mode) {
    case MatchMode::STRICT:
        return "Strict";
    case MatchMode::FLOATING:
        return "Floating";
    }
    return "Unknown";
}

} // namespace sturdypatch
