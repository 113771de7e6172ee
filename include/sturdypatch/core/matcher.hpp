#pragma once

#include "sturdypatch/core/document.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sturdypatch {

enum class MatchMode {
    STRICT,   // Exact content equality per line
    FLOATING  // Internal whitespace runs collapsed before comparing
};

// Contiguous run of document lines matched by a search block
struct MatchSpan {
    size_t start{};
    size_t length{};

    auto end() const -> size_t { return start + length; }
    auto operator==(const MatchSpan& other) const -> bool = default;
};

struct MatchResult {
    MatchSpan span;
    MatchMode mode = MatchMode::STRICT;
    size_t candidate_count{};  // Matches found by the winning mode, > 1 means resolved ambiguity

    auto operator==(const MatchResult& other) const -> bool = default;
};

// Collapse every internal blank run to one space and trim both ends
auto normalize_whitespace(std::string_view text) -> std::string;

// Every start index where the tokens match under the given mode, ascending
auto find_matches(const Document& document, std::span<const std::string> search_tokens,
                  MatchMode mode) -> std::vector<size_t>;

// Strict first; Floating only when Strict finds nothing. Earliest index wins.
auto locate_block(const Document& document, std::span<const std::string> search_tokens)
    -> std::optional<MatchResult>;

auto match_mode_name(MatchMode mode) -> std::string;

} // namespace sturdypatch
