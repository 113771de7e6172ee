#include "sturdypatch/core/patch_engine.hpp"
#include "sturdypatch/core/hunk_applier.hpp"
#include <algorithm>

namespace sturdypatch {

auto PatchResult::applied_count() const -> size_t {
    return static_cast<size_t>(std::ranges::count_if(outcomes, &HunkOutcome::applied));
}

auto PatchResult::failed_count() const -> size_t { return outcomes.size() - applied_count(); }

auto apply_hunk(const Document& document, const Hunk& hunk, size_t index)
    -> std::pair<Document, HunkOutcome> {
    HunkOutcome outcome{.index = index, .description = hunk.description};

    auto search_tokens = tokenize_block(hunk.search_block);
    auto replace_tokens = tokenize_block(hunk.replace_block);

    auto match = has_content(search_tokens) ? locate_block(document, search_tokens)
                                            : std::nullopt;
    if (!match) {
        outcome.status = HunkStatus::FAILED;
        outcome.failure = FailureReason::NO_MATCH;
        return {document, std::move(outcome)};
    }

    auto [span, mode, candidate_count] = *match;
    auto patched = apply_replacement(document, span, replace_tokens);

    outcome.status = HunkStatus::APPLIED;
    outcome.matched_mode = mode;
    outcome.first_line = span.start + 1;
    outcome.last_line = span.end();
    outcome.candidate_count = candidate_count;

    for (size_t i = span.start; i < span.end(); ++i) {
        outcome.removed_lines.push_back(visible_text(document[i]));
    }
    for (size_t i = span.start; i < span.start + replace_tokens.size(); ++i) {
        outcome.inserted_lines.push_back(visible_text(patched[i]));
    }

    return {patched, std::move(outcome)};
}

auto apply_patch(const Document& document, const Patch& patch) -> PatchResult {
    validate_patch(patch);

    PatchResult result{.document = document};
    result.outcomes.reserve(patch.hunks.size());

    for (size_t i = 0; i < patch.hunks.size(); ++i) {
        auto [next, outcome] = apply_hunk(result.document, patch.hunks[i], i);
        result.document = std::move(next);
        result.outcomes.push_back(std::move(outcome));
    }

    result.text = render_document(result.document);
    return result;
}

auto apply_patch(std::string_view raw_text, const Patch& patch) -> PatchResult {
    validate_patch(patch);
    return apply_patch(build_document(raw_text), patch);
}

auto status_name(HunkStatus status) -> std::string {
    switch (status) {
    case HunkStatus::APPLIED:
        return "Applied";
    case HunkStatus::FAILED:
        return "Failed";
    }
    return "Unknown";
}

} // namespace sturdypatch
