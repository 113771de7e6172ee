#include "sturdypatch/core/functional_core.hpp"
#include <gtest/gtest.h>

namespace sturdypatch::functional_core {

class FunctionalCoreTest : public ::testing::Test {
protected:
    std::vector<Hunk> sample_hunks_{
        Hunk{
            .description = "Fix off-by-one in loop",
            .search_block = "for i in range(n + 1):",
            .replace_block = "for i in range(n):"
        },
        Hunk{
            .description = "Rename helper",
            .search_block = "def helper():",
            .replace_block = "def compute():"
        },
        Hunk{
            .description = "Remove debug print",
            .search_block = "print(debug)",
            .replace_block = ""
        }
    };

    std::vector<HunkOutcome> sample_outcomes_{
        HunkOutcome{
            .index = 0,
            .description = "Fix off-by-one in loop",
            .status = HunkStatus::APPLIED,
            .matched_mode = MatchMode::STRICT,
            .first_line = 12,
            .last_line = 12,
            .candidate_count = 1,
            .removed_lines = {"    for i in range(n + 1):"},
            .inserted_lines = {"    for i in range(n):"}
        },
        HunkOutcome{
            .index = 1,
            .description = "Rename helper",
            .status = HunkStatus::APPLIED,
            .matched_mode = MatchMode::FLOATING,
            .first_line = 3,
            .last_line = 4,
            .candidate_count = 2,
            .removed_lines = {"def helper():", "    pass"},
            .inserted_lines = {"def compute():"}
        },
        HunkOutcome{
            .index = 2,
            .description = "Remove debug print",
            .status = HunkStatus::FAILED,
            .failure = FailureReason::NO_MATCH
        }
    };

    auto sample_model() const -> ReviewModel
    {
        Patch patch{.hunks = sample_hunks_};
        return create_review_model(patch, sample_outcomes_);
    }
};

TEST_F(FunctionalCoreTest, FilterHunksEmpty)
{
    auto indices = filter_hunks(sample_hunks_, "");

    EXPECT_EQ(indices.size(), 3);
    EXPECT_EQ(indices[0], 0);
    EXPECT_EQ(indices[1], 1);
    EXPECT_EQ(indices[2], 2);
}

TEST_F(FunctionalCoreTest, FilterHunksByDescription)
{
    auto indices = filter_hunks(sample_hunks_, "rename");

    ASSERT_EQ(indices.size(), 1);
    EXPECT_EQ(indices[0], 1);
}

TEST_F(FunctionalCoreTest, FilterHunksBySearchBlock)
{
    auto indices = filter_hunks(sample_hunks_, "range");

    ASSERT_EQ(indices.size(), 1);
    EXPECT_EQ(indices[0], 0);
}

TEST_F(FunctionalCoreTest, FilterHunksByNumber)
{
    auto indices = filter_hunks(sample_hunks_, "3");

    ASSERT_EQ(indices.size(), 1);
    EXPECT_EQ(indices[0], 2);
}

TEST_F(FunctionalCoreTest, FilterHunksMultiTermAnd)
{
    auto indices = filter_hunks(sample_hunks_, "remove print");

    ASSERT_EQ(indices.size(), 1);
    EXPECT_EQ(indices[0], 2);

    EXPECT_TRUE(filter_hunks(sample_hunks_, "remove helper").empty());
}

TEST_F(FunctionalCoreTest, FilterHunksCaseInsensitive)
{
    auto indices = filter_hunks(sample_hunks_, "  DEBUG  ");

    ASSERT_EQ(indices.size(), 1);
    EXPECT_EQ(indices[0], 2);
}

TEST_F(FunctionalCoreTest, FilterHunksWithNonAsciiText)
{
    std::vector<Hunk> hunks{
        Hunk{.description = "Caf\xC3\xA9 menu", .search_block = "prix = 3", .replace_block = "x"},
        Hunk{.description = "Plain", .search_block = "na\xC3\xAFve()", .replace_block = "y"}
    };

    auto by_description = filter_hunks(hunks, "CAF\xC3\xA9");
    ASSERT_EQ(by_description.size(), 1);
    EXPECT_EQ(by_description[0], 0);

    auto by_search_block = filter_hunks(hunks, "NA\xC3\xAFVE");
    ASSERT_EQ(by_search_block.size(), 1);
    EXPECT_EQ(by_search_block[0], 1);

    // Bytes outside ASCII pass through unchanged
    EXPECT_EQ(to_lowercase("\xC3\x89T\xC3\x89"), "\xC3\x89t\xC3\x89");
}

TEST_F(FunctionalCoreTest, StringHelpers)
{
    EXPECT_EQ(trim("  \thello world\r\n"), "hello world");
    EXPECT_EQ(trim(" \n "), "");
    EXPECT_EQ(to_lowercase("MiXeD"), "mixed");

    auto tokens = split_by_whitespace(" a  b\tc ");
    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(tokens[2], "c");
}

TEST_F(FunctionalCoreTest, PatchStatistics)
{
    auto stats = patch_statistics(sample_outcomes_);

    EXPECT_EQ(stats, (PatchStatistics{.total = 3,
                                      .applied = 2,
                                      .strict = 1,
                                      .floating = 1,
                                      .failed = 1,
                                      .ambiguous = 1}));
    EXPECT_EQ(format_statistics(stats), "Applied 2/3 hunks (1 strict, 1 floating), 1 failed.");
}

TEST_F(FunctionalCoreTest, PatchLogDescribesEveryHunk)
{
    auto log = format_patch_log(sample_outcomes_);

    std::vector<std::string> expected{
        "--- BEGIN PATCH ---",
        "Hunk 1: Fix off-by-one in loop",
        "Strict match at line 12",
        "Hunk 2: Rename helper",
        "Floating match at lines 3-4",
        "2 candidate matches, used the first.",
        "Hunk 3: Remove debug print",
        "Hunk 3 not found in file.",
        "--- PATCH COMPLETE ---"
    };
    EXPECT_EQ(log, expected);
}

TEST_F(FunctionalCoreTest, DisplayContextForAcceptedHunk)
{
    auto context = build_display_context(sample_hunks_[1], sample_outcomes_[1],
                                         HunkDecision::ACCEPT);

    EXPECT_EQ(context.location, "lines 3-4");
    ASSERT_EQ(context.context_lines.size(), 3);
    EXPECT_EQ(context.context_lines[0], "-     3 | def helper():");
    EXPECT_EQ(context.context_lines[1], "-     4 |     pass");
    EXPECT_EQ(context.context_lines[2], "+     3 | def compute():");
}

TEST_F(FunctionalCoreTest, DisplayContextForSkippedHunk)
{
    auto context = build_display_context(sample_hunks_[0], sample_outcomes_[0],
                                         HunkDecision::SKIP);

    EXPECT_EQ(context.location, "line 12");
    ASSERT_EQ(context.context_lines.size(), 1);
    EXPECT_EQ(context.context_lines[0], "     12 |     for i in range(n + 1):");
}

TEST_F(FunctionalCoreTest, DisplayContextForFailedHunk)
{
    auto context = build_display_context(sample_hunks_[2], sample_outcomes_[2],
                                         HunkDecision::SKIP);

    EXPECT_EQ(context.location, "not found");
    ASSERT_EQ(context.context_lines.size(), 1);
    EXPECT_EQ(context.context_lines[0], "?        | print(debug)");
}

TEST_F(FunctionalCoreTest, UpdateNavigationStopsAtEdges)
{
    auto model = sample_model();

    model = update_navigation(std::move(model), InputEvent::ARROW_LEFT);
    EXPECT_EQ(model.current_index, 0);
    EXPECT_TRUE(model.show_status_message);
    EXPECT_EQ(model.status_message, "Already at first hunk.");

    model = update_navigation(std::move(model), InputEvent::ARROW_RIGHT);
    model = update_navigation(std::move(model), InputEvent::ARROW_RIGHT);
    EXPECT_EQ(model.current_index, 2);
    EXPECT_FALSE(model.show_status_message);

    model = update_navigation(std::move(model), InputEvent::ARROW_RIGHT);
    EXPECT_EQ(model.current_index, 2);
    EXPECT_EQ(model.status_message, "Already at last hunk.");
}

TEST_F(FunctionalCoreTest, UpdateDecisionTogglesAppliedHunk)
{
    auto model = sample_model();
    EXPECT_EQ(model.get_current_decision(), HunkDecision::ACCEPT);

    model = update_decision(std::move(model), InputEvent::ARROW_DOWN);
    EXPECT_EQ(model.get_current_decision(), HunkDecision::SKIP);
    EXPECT_TRUE(model.decisions_changed);

    model = update_decision(std::move(model), InputEvent::ARROW_UP);
    EXPECT_EQ(model.get_current_decision(), HunkDecision::ACCEPT);
}

TEST_F(FunctionalCoreTest, UpdateDecisionRefusesFailedHunk)
{
    auto model = sample_model();
    model.current_index = 2;

    model = update_decision(std::move(model), InputEvent::ARROW_UP);

    EXPECT_EQ(model.get_current_decision(), HunkDecision::SKIP);
    EXPECT_FALSE(model.decisions_changed);
    EXPECT_EQ(model.status_message, "Hunk 3 did not match and cannot be accepted.");
}

TEST_F(FunctionalCoreTest, UpdateDecisionIgnoresOtherEvents)
{
    auto model = sample_model();

    model = update_decision(std::move(model), InputEvent::ARROW_RIGHT);

    EXPECT_EQ(model.get_current_decision(), HunkDecision::ACCEPT);
    EXPECT_FALSE(model.decisions_changed);
}

TEST_F(FunctionalCoreTest, UpdateSearchModeAppliesFilter)
{
    auto model = sample_model();
    model.current_index = 2;

    model = update_search_mode(std::move(model), "helper");

    ASSERT_EQ(model.filtered_indices.size(), 1);
    EXPECT_EQ(model.current_index, 0);
    EXPECT_EQ(model.get_actual_hunk_index(), 1);
    EXPECT_EQ(model.status_message, "Applied filter: 'helper' - showing 1/3 hunks");
}

TEST_F(FunctionalCoreTest, UpdateSearchModeWithoutMatches)
{
    auto model = sample_model();

    model = update_search_mode(std::move(model), "nonexistent");

    EXPECT_TRUE(model.filtered_indices.empty());
    EXPECT_EQ(model.get_active_hunk_count(), 3);
    EXPECT_EQ(model.status_message, "No hunks match filter 'nonexistent' - showing all 3 hunks");
}

TEST_F(FunctionalCoreTest, UpdateSearchModeClearsFilter)
{
    auto model = sample_model();
    model = update_search_mode(std::move(model), "helper");

    model = update_search_mode(std::move(model), "");

    EXPECT_TRUE(model.filtered_indices.empty());
    EXPECT_EQ(model.status_message, "Filter cleared - showing all 3 hunks");
}

} // namespace sturdypatch::functional_core
