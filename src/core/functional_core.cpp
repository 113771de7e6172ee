#include "sturdypatch/core/functional_core.hpp"
#include <algorithm>
#include <cctype>
#include <numeric>
#include <sstream>

namespace sturdypatch::functional_core {

namespace {

auto line_range_text(const HunkOutcome& outcome) -> std::string {
    if (outcome.first_line == outcome.last_line) {
        return "line " + std::to_string(outcome.first_line);
    }
    return "lines " + std::to_string(outcome.first_line) + "-" + std::to_string(outcome.last_line);
}

auto numbered_line(char marker, size_t line_number, const std::string& text) -> std::string {
    auto number = std::to_string(line_number);
    auto padding = number.length() < 6 ? 6 - number.length() : 0;
    return std::string(1, marker) + std::string(padding, ' ') + number + " | " + text;
}

} // namespace

auto filter_hunks(std::span<const Hunk> hunks, std::string_view filter_terms)
    -> std::vector<size_t> {
    if (filter_terms.empty()) {
        std::vector<size_t> all_indices(hunks.size());
        std::iota(all_indices.begin(), all_indices.end(), 0);
        return all_indices;
    }

    auto terms = split_by_whitespace(to_lowercase(trim(filter_terms)));
    std::vector<size_t> filtered_indices;

    for (size_t i = 0; i < hunks.size(); ++i) {
        // Search across description, search block and hunk number
        std::string lower_description = to_lowercase(hunks[i].description);
        std::string lower_search = to_lowercase(hunks[i].search_block);
        std::string hunk_number = std::to_string(i + 1);

        bool all_terms_match = std::ranges::all_of(terms, [&](const std::string& term) {
            return lower_description.find(term) != std::string::npos
                   || lower_search.find(term) != std::string::npos || hunk_number == term;
        });

        if (all_terms_match) {
            filtered_indices.push_back(i);
        }
    }

    return filtered_indices;
}

auto split_by_whitespace(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::istringstream iss{std::string(text)};
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

auto to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

auto patch_statistics(std::span<const HunkOutcome> outcomes) -> PatchStatistics {
    PatchStatistics stats{.total = outcomes.size()};

    for (const auto& outcome : outcomes) {
        if (!outcome.applied()) {
            stats.failed++;
            continue;
        }

        stats.applied++;
        if (outcome.matched_mode == MatchMode::STRICT) {
            stats.strict++;
        } else {
            stats.floating++;
        }
        if (outcome.ambiguous()) {
            stats.ambiguous++;
        }
    }

    return stats;
}

auto format_statistics(const PatchStatistics& stats) -> std::string {
    std::ostringstream oss;
    oss << "Applied " << stats.applied << "/" << stats.total << " hunks (" << stats.strict
        << " strict, " << stats.floating << " floating), " << stats.failed << " failed.";
    return oss.str();
}

auto format_patch_log(std::span<const HunkOutcome> outcomes) -> std::vector<std::string> {
    std::vector<std::string> log;
    log.push_back("--- BEGIN PATCH ---");

    for (const auto& outcome : outcomes) {
        auto number = std::to_string(outcome.index + 1);
        log.push_back("Hunk " + number + ": " + outcome.description);

        if (!outcome.applied()) {
            log.push_back("Hunk " + number + " not found in file.");
            continue;
        }

        auto mode = outcome.matched_mode.value_or(MatchMode::STRICT);
        log.push_back(match_mode_name(mode) + " match at " + line_range_text(outcome));
        if (outcome.ambiguous()) {
            log.push_back(std::to_string(outcome.candidate_count)
                          + " candidate matches, used the first.");
        }
    }

    log.push_back("--- PATCH COMPLETE ---");
    return log;
}

auto build_display_context(const Hunk& hunk, const HunkOutcome& outcome, HunkDecision decision)
    -> DisplayContext {
    DisplayContext context;

    if (!outcome.applied()) {
        context.location = "not found";
        for (const auto& token : tokenize_block(hunk.search_block)) {
            context.context_lines.push_back("?        | " + token);
        }
        return context;
    }

    context.location = line_range_text(outcome);

    // Skipped hunks keep their original lines
    if (decision == HunkDecision::SKIP) {
        for (size_t i = 0; i < outcome.removed_lines.size(); ++i) {
            context.context_lines.push_back(
                numbered_line(' ', outcome.first_line + i, outcome.removed_lines[i]));
        }
        return context;
    }

    for (size_t i = 0; i < outcome.removed_lines.size(); ++i) {
        context.context_lines.push_back(
            numbered_line('-', outcome.first_line + i, outcome.removed_lines[i]));
    }
    for (size_t i = 0; i < outcome.inserted_lines.size(); ++i) {
        context.context_lines.push_back(
            numbered_line('+', outcome.first_line + i, outcome.inserted_lines[i]));
    }

    return context;
}

auto update_navigation(ReviewModel model, InputEvent event) -> ReviewModel {
    size_t active_count = model.get_active_hunk_count();

    switch (event) {
    case InputEvent::ARROW_LEFT:
        if (model.current_index > 0) {
            model.current_index--;
            model.show_status_message = false;
        } else {
            model.show_status_message = true;
            model.status_message = "Already at first hunk.";
        }
        break;

    case InputEvent::ARROW_RIGHT:
        if (active_count > 0 && model.current_index < active_count - 1) {
            model.current_index++;
            model.show_status_message = false;
        } else {
            model.show_status_message = true;
            model.status_message = "Already at last hunk.";
        }
        break;

    default:
        break;
    }

    return model;
}

auto update_decision(ReviewModel model, InputEvent event) -> ReviewModel {
    if (event != InputEvent::ARROW_UP && event != InputEvent::ARROW_DOWN) {
        return model;
    }
    if (model.outcomes.empty() || model.current_index >= model.get_active_hunk_count()) {
        return model;
    }

    size_t actual_index = model.get_actual_hunk_index();
    if (!model.outcomes[actual_index].applied()) {
        model.show_status_message = true;
        model.status_message
            = "Hunk " + std::to_string(actual_index + 1) + " did not match and cannot be accepted.";
        return model;
    }

    // Two states only, so both arrows toggle
    auto& decision = model.decisions[actual_index];
    decision = decision == HunkDecision::ACCEPT ? HunkDecision::SKIP : HunkDecision::ACCEPT;
    model.decisions_changed = true;
    model.show_status_message = false;

    return model;
}

auto update_search_mode(ReviewModel model, const std::string& search_input) -> ReviewModel {
    model.search_input = search_input;
    model.filtered_indices = filter_hunks(model.patch.hunks, search_input);
    model.show_status_message = true;

    auto total = std::to_string(model.outcomes.size());

    if (search_input.empty()) {
        model.filtered_indices.clear();
        model.status_message = "Filter cleared - showing all " + total + " hunks";
    } else if (model.filtered_indices.empty()) {
        model.status_message
            = "No hunks match filter '" + search_input + "' - showing all " + total + " hunks";
    } else {
        model.status_message = "Applied filter: '" + search_input + "' - showing "
                               + std::to_string(model.filtered_indices.size()) + "/" + total
                               + " hunks";
    }

    // Adjust current index if needed
    if (model.current_index >= model.get_active_hunk_count()) {
        auto active_count = model.get_active_hunk_count();
        model.current_index = active_count == 0 ? 0 : active_count - 1;
    }

    return model;
}

} // namespace sturdypatch::functional_core
