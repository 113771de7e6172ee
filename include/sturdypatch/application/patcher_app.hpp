#pragma once

#include "sturdypatch/core/patch_engine.hpp"
#include "sturdypatch/interfaces.hpp"
#include "sturdypatch/ui/review_model.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sturdypatch {

struct Config {
    std::string target_file;                // Document to patch
    std::string patch_file = "-";           // stdin by default
    std::string output_file;                // Empty: versioned sibling of target_file, "-": stdout
    std::string version_suffix;             // Empty: next free _v<major>.<minor>
    bool in_place = false;
    bool interactive = true;
    bool dry_run = false;
    bool verbose = false;                   // Echo the patch log
    std::string log_dir;                    // Save the patch log here when set
};

// Process exit codes
constexpr int exit_success = 0;
constexpr int exit_error = 1;               // Validation or I/O failure, nothing written
constexpr int exit_hunks_failed = 2;        // Run completed, some hunks did not apply

class PatcherApp {
private:
    std::unique_ptr<ITerminal> terminal_;
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IPatchParser> parser_;

public:
    PatcherApp(std::unique_ptr<ITerminal> terminal,
               std::unique_ptr<IFileSystem> filesystem,
               std::unique_ptr<IPatchParser> parser);

    auto run(const Config& config) -> int;

private:
    // Model-View-Update review loop
    auto run_review(ReviewModel initial_model) -> ReviewModel;
    auto run_interactive(ReviewModel model) -> ReviewModel;
    auto update(ReviewModel model, InputEvent event) -> ReviewModel;
    auto render(const ReviewModel& model) -> Screen;

    auto compose_review_screen(const ReviewModel& model) -> Screen;
    auto compose_summary_screen(const ReviewModel& model) -> Screen;
    auto compose_search_screen(const ReviewModel& model) -> Screen;

    // Application logic
    auto load_patch(const Config& config) -> std::optional<Patch>;
    auto apply_accepted(const std::string& original_text, const ReviewModel& model)
        -> PatchResult;
    auto resolve_output_path(const Config& config) -> std::string;
    auto write_output(const std::string& text, const Config& config) -> bool;
    auto save_patch_log(const std::vector<std::string>& log, const Config& config) -> void;
    auto report_outcomes(const PatchResult& result, const Config& config) -> void;

    auto handle_quit_confirmation(ReviewModel& model) -> bool;
};

} // namespace sturdypatch
