#pragma once

#include "sturdypatch/core/patch.hpp"
#include "sturdypatch/core/patch_engine.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace sturdypatch {

// Input events from terminal
enum class InputEvent {
    ARROW_UP,
    ARROW_DOWN,
    ARROW_LEFT,
    ARROW_RIGHT,
    SAVE_EXIT,
    QUIT,
    SEARCH,
    SHOW_SUMMARY,
    ESCAPE,
    ENTER,
    UNKNOWN
};

// View modes for the UI
enum class ViewMode {
    REVIEWING,
    SEARCHING,
    SUMMARY,
    EXIT
};

enum class HunkDecision {
    ACCEPT,
    SKIP
};

// One decision per hunk, indexed like Patch::hunks
using Decisions = std::vector<HunkDecision>;

// Immutable review state - all UI state in one place
struct ReviewModel {
    // Data state: the patch and the outcomes of its preview run
    Patch patch;
    std::vector<HunkOutcome> outcomes;
    Decisions decisions;

    // Core navigation
    size_t current_index{};
    ViewMode mode = ViewMode::REVIEWING;

    // Search state (when mode == SEARCHING)
    std::string search_input;
    std::vector<size_t> filtered_indices;

    std::unordered_set<size_t> visited_hunks;
    bool show_status_message = false;
    std::string status_message;
    bool quit_confirmation_needed = false;
    bool decisions_changed = false;
    bool cancelled = false;  // Quit without writing

    auto get_active_hunk_count() const -> size_t
    {
        return filtered_indices.empty() ? outcomes.size() : filtered_indices.size();
    }

    auto get_actual_hunk_index() const -> size_t
    {
        return filtered_indices.empty() ? current_index : filtered_indices[current_index];
    }

    auto get_current_decision() const -> HunkDecision
    {
        if (decisions.empty()) return HunkDecision::SKIP;
        return decisions[get_actual_hunk_index()];
    }
};

// Applied hunks start accepted, failed ones skipped
auto create_review_model(Patch patch, std::vector<HunkOutcome> outcomes) -> ReviewModel;

// Indices of accepted hunks in patch order
auto accepted_hunk_indices(const ReviewModel& model) -> std::vector<size_t>;

// The accepted hunks as a patch of their own, order preserved
auto accepted_patch(const ReviewModel& model) -> Patch;

auto decision_display_name(HunkDecision decision) -> std::string;

// Screen structure for declarative rendering
struct Line {
    std::string text;
    bool is_highlighted = false;
    bool is_removal = false;
};

struct Screen {
    std::vector<Line> content;
    std::string status_line;
    std::string control_hints;
};

} // namespace sturdypatch
