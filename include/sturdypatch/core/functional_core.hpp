#pragma once

#include "sturdypatch/core/patch.hpp"
#include "sturdypatch/core/patch_engine.hpp"
#include "sturdypatch/ui/review_model.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sturdypatch::functional_core {

// Hunk filtering and search (pure)
auto filter_hunks(std::span<const Hunk> hunks, std::string_view filter_terms)
    -> std::vector<size_t>;

auto split_by_whitespace(std::string_view text) -> std::vector<std::string>;
auto to_lowercase(std::string_view text) -> std::string;
auto trim(std::string_view text) -> std::string;

// Statistics calculation (pure)
struct PatchStatistics {
    size_t total{};
    size_t applied{};
    size_t strict{};
    size_t floating{};
    size_t failed{};
    size_t ambiguous{};  // Applied, but more than one candidate matched

    auto operator==(const PatchStatistics& other) const -> bool = default;
};

auto patch_statistics(std::span<const HunkOutcome> outcomes) -> PatchStatistics;

// "Applied 2/3 hunks (1 strict, 1 floating), 1 failed."
auto format_statistics(const PatchStatistics& stats) -> std::string;

// Per-hunk run log, bracketed by BEGIN/COMPLETE markers
auto format_patch_log(std::span<const HunkOutcome> outcomes) -> std::vector<std::string>;

// Context building for display (pure)
struct DisplayContext {
    std::vector<std::string> context_lines;
    std::string location;  // "lines 5-6" or "not found"
};

auto build_display_context(const Hunk& hunk, const HunkOutcome& outcome, HunkDecision decision)
    -> DisplayContext;

// UI update functions (pure state transitions)
auto update_navigation(ReviewModel model, InputEvent event) -> ReviewModel;
auto update_decision(ReviewModel model, InputEvent event) -> ReviewModel;
auto update_search_mode(ReviewModel model, const std::string& search_input) -> ReviewModel;

} // namespace sturdypatch::functional_core
