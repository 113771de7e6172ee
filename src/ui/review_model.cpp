#include "sturdypatch/ui/review_model.hpp"

namespace sturdypatch {

auto create_review_model(Patch patch, std::vector<HunkOutcome> outcomes) -> ReviewModel {
    ReviewModel model;
    model.decisions.reserve(outcomes.size());
    for (const auto& outcome : outcomes) {
        model.decisions.push_back(outcome.applied() ? HunkDecision::ACCEPT : HunkDecision::SKIP);
    }
    model.patch = std::move(patch);
    model.outcomes = std::move(outcomes);
    return model;
}

auto accepted_hunk_indices(const ReviewModel& model) -> std::vector<size_t> {
    std::vector<size_t> indices;
    for (size_t i = 0; i < model.decisions.size() && i < model.patch.hunks.size(); ++i) {
        if (model.decisions[i] == HunkDecision::ACCEPT) {
            indices.push_back(i);
        }
    }
    return indices;
}

auto accepted_patch(const ReviewModel& model) -> Patch {
    Patch patch;
    for (auto index : accepted_hunk_indices(model)) {
        patch.hunks.push_back(model.patch.hunks[index]);
    }
    return patch;
}

auto decision_display_name(HunkDecision decision) -> std::string {
    switch (decision) {
    case HunkDecision::ACCEPT:
        return "Accept";
    case HunkDecision::SKIP:
        return "Skip";
    }
    return "Unknown";
}

} // namespace sturdypatch
