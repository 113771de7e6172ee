#pragma once

#include "sturdypatch/core/document.hpp"
#include "sturdypatch/core/matcher.hpp"
#include "sturdypatch/core/patch.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sturdypatch {

enum class HunkStatus {
    APPLIED,
    FAILED
};

enum class FailureReason {
    NONE,
    NO_MATCH
};

// Exactly one outcome is produced per hunk
struct HunkOutcome {
    size_t index{};                          // 0-based position in the patch
    std::string description;
    HunkStatus status = HunkStatus::FAILED;
    FailureReason failure = FailureReason::NONE;
    std::optional<MatchMode> matched_mode;   // nullopt when failed

    // Diagnostics, relative to the document as it was when the hunk ran
    size_t first_line{};                     // 1-based, 0 when failed
    size_t last_line{};
    size_t candidate_count{};
    std::vector<std::string> removed_lines;
    std::vector<std::string> inserted_lines;

    auto applied() const -> bool { return status == HunkStatus::APPLIED; }
    auto ambiguous() const -> bool { return candidate_count > 1; }

    auto operator==(const HunkOutcome& other) const -> bool = default;
};

struct PatchResult {
    Document document;
    std::string text;
    std::vector<HunkOutcome> outcomes;

    auto applied_count() const -> size_t;
    auto failed_count() const -> size_t;
    auto all_applied() const -> bool { return failed_count() == 0; }
};

// Locate and apply one hunk. On NoMatch the returned Document is the input one.
auto apply_hunk(const Document& document, const Hunk& hunk, size_t index)
    -> std::pair<Document, HunkOutcome>;

// Validate the whole patch (throws ValidationError before touching anything),
// then apply hunks in order against the evolving Document.
auto apply_patch(const Document& document, const Patch& patch) -> PatchResult;
auto apply_patch(std::string_view raw_text, const Patch& patch) -> PatchResult;

auto status_name(HunkStatus status) -> std::string;

} // namespace sturdypatch
