#include "sturdypatch/application/patcher_app.hpp"
#include "sturdypatch/core/functional_core.hpp"
#include "sturdypatch/core/output_naming.hpp"
#include "sturdypatch/ui/ftxui_terminal.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace sturdypatch {

namespace {

// Progress goes to stderr when the patched text itself is written to stdout
auto progress(const Config& config) -> std::ostream& {
    return config.output_file == "-" ? std::cerr : std::cout;
}

} // namespace

PatcherApp::PatcherApp(std::unique_ptr<ITerminal> terminal, std::unique_ptr<IFileSystem> filesystem,
                       std::unique_ptr<IPatchParser> parser)
    : terminal_(std::move(terminal)), filesystem_(std::move(filesystem)),
      parser_(std::move(parser)) {}

auto PatcherApp::run(const Config& config) -> int {
    auto patch = load_patch(config);
    if (!patch) {
        return exit_error;
    }

    if (patch->hunks.empty()) {
        progress(config) << "No hunks found.\n";
        return exit_success;
    }

    progress(config) << "Found " << patch->hunks.size() << " hunks.\n";

    auto original_text = filesystem_->read_text(config.target_file);
    if (!original_text) {
        std::cerr << "Error: Could not read " << config.target_file << '\n';
        return exit_error;
    }

    // Preview run over every hunk; also the final result in batch mode
    PatchResult result;
    try {
        result = apply_patch(*original_text, *patch);
    } catch (const ValidationError& e) {
        std::cerr << "Error: Invalid patch: " << e.what() << '\n';
        return exit_error;
    }

    // Failed hunks cannot be accepted, so they never reach the re-run below
    bool preview_failed = !result.all_applied();

    if (config.interactive && terminal_->is_interactive()) {
        if (!terminal_->setup_raw_mode()) {
            std::cerr << "Warning: Failed to setup interactive mode, applying all hunks\n";
        } else {
            auto model = create_review_model(*patch, result.outcomes);
            model.visited_hunks.insert(0);

            auto final_model = run_review(std::move(model));
            terminal_->restore_terminal_state();

            if (final_model.cancelled) {
                progress(config) << "Quit without writing changes.\n";
                return exit_success;
            }

            result = apply_accepted(*original_text, final_model);
        }
    } else {
        progress(config) << "Running in batch mode.\n";
    }

    report_outcomes(result, config);
    save_patch_log(functional_core::format_patch_log(result.outcomes), config);

    if (config.dry_run) {
        progress(config) << "Dry run - no files modified.\n";
    } else if (result.applied_count() == 0) {
        progress(config) << "No hunks applied - nothing written.\n";
    } else if (!write_output(result.text, config)) {
        return exit_error;
    }

    return preview_failed || !result.all_applied() ? exit_hunks_failed : exit_success;
}

auto PatcherApp::run_review(ReviewModel initial_model) -> ReviewModel {
    // Reactive mode when the terminal supports it, polling loop otherwise
    if (auto ftxui_terminal = dynamic_cast<FTXUITerminal*>(terminal_.get())) {
        return ftxui_terminal->run_reactive_session(
            initial_model,
            [this](ReviewModel m, InputEvent e) { return update(std::move(m), e); },
            [this](const ReviewModel& m) { return render(m); });
    }
    return run_interactive(std::move(initial_model));
}

auto PatcherApp::run_interactive(ReviewModel model) -> ReviewModel {
    while (model.mode != ViewMode::EXIT) {
        terminal_->display_screen(render(model));

        if (model.mode == ViewMode::SEARCHING) {
            model.search_input = terminal_->read_line();
            model = update(std::move(model), InputEvent::ENTER);
            continue;
        }

        auto input = terminal_->get_input_event();
        model = update(std::move(model), input);
    }

    return model;
}

auto PatcherApp::update(ReviewModel model, InputEvent event) -> ReviewModel {
    // Reset quit confirmation if user presses any key other than QUIT
    if (event != InputEvent::QUIT && model.quit_confirmation_needed) {
        model.quit_confirmation_needed = false;
        model.show_status_message = false;
        model.status_message = "";
    }

    if (model.mode == ViewMode::SEARCHING) {
        if (event == InputEvent::ENTER) {
            auto search_input = model.search_input;
            model = functional_core::update_search_mode(std::move(model), search_input);
            model.current_index = 0;
            model.mode = ViewMode::REVIEWING;
        } else if (event == InputEvent::ESCAPE) {
            model.mode = ViewMode::REVIEWING;
        }
        return model;
    }

    switch (event) {
    case InputEvent::ARROW_LEFT:
    case InputEvent::ARROW_RIGHT:
        if (model.mode == ViewMode::REVIEWING) {
            model = functional_core::update_navigation(std::move(model), event);
        }
        break;

    case InputEvent::ARROW_UP:
    case InputEvent::ARROW_DOWN:
        if (model.mode == ViewMode::REVIEWING) {
            model = functional_core::update_decision(std::move(model), event);
        }
        break;

    case InputEvent::SEARCH:
        if (model.mode == ViewMode::REVIEWING) {
            model.mode = ViewMode::SEARCHING;
            model.search_input.clear();
        }
        break;

    case InputEvent::SHOW_SUMMARY:
        if (model.mode == ViewMode::REVIEWING) {
            model.mode = ViewMode::SUMMARY;
        } else if (model.mode == ViewMode::SUMMARY) {
            model.mode = ViewMode::REVIEWING;
        }
        break;

    case InputEvent::ESCAPE:
        if (model.mode == ViewMode::SUMMARY) {
            model.mode = ViewMode::REVIEWING;
        }
        break;

    case InputEvent::SAVE_EXIT:
        model.mode = ViewMode::EXIT;
        break;

    case InputEvent::QUIT:
        if (handle_quit_confirmation(model)) {
            model.mode = ViewMode::EXIT;
            model.cancelled = true;
        }
        break;

    default:
        break;
    }

    if (model.mode == ViewMode::REVIEWING && model.current_index < model.get_active_hunk_count()) {
        model.visited_hunks.insert(model.get_actual_hunk_index());
    }

    return model;
}

auto PatcherApp::render(const ReviewModel& model) -> Screen {
    switch (model.mode) {
    case ViewMode::REVIEWING:
        return compose_review_screen(model);
    case ViewMode::SUMMARY:
        return compose_summary_screen(model);
    case ViewMode::SEARCHING:
        return compose_search_screen(model);
    case ViewMode::EXIT:
        return Screen{};
    }
    return Screen{};
}

auto PatcherApp::compose_review_screen(const ReviewModel& model) -> Screen {
    Screen screen;

    if (model.outcomes.empty()) {
        screen.content.push_back(Line{.text = "No hunks to review."});
        screen.status_line = "No hunks found";
        screen.control_hints = "Press 'q' to quit";
        return screen;
    }

    size_t active_count = model.get_active_hunk_count();
    if (model.current_index >= active_count) {
        screen.content.push_back(Line{.text = "Invalid hunk index."});
        return screen;
    }

    size_t actual_index = model.get_actual_hunk_index();
    const auto& outcome = model.outcomes[actual_index];
    const auto& hunk = model.patch.hunks[actual_index];
    auto decision = model.decisions[actual_index];

    screen.content.push_back(Line{.text = "=== Sturdy Patch Review ==="});
    screen.content.push_back(Line{.text = ""});

    auto context = functional_core::build_display_context(hunk, outcome, decision);
    auto mode_name = outcome.matched_mode ? match_mode_name(*outcome.matched_mode) : "None";

    screen.content.push_back(Line{.text = "┌─ Hunk " + std::to_string(actual_index + 1) + "/"
                                          + std::to_string(model.outcomes.size()) + " ─"});
    screen.content.push_back(Line{.text = "│ Description: " + outcome.description});
    screen.content.push_back(Line{.text = "│ Status: " + status_name(outcome.status)});
    screen.content.push_back(Line{.text = "│ Match: " + mode_name + " (" + context.location + ")"});
    if (outcome.ambiguous()) {
        screen.content.push_back(
            Line{.text = "│ Note: " + std::to_string(outcome.candidate_count)
                         + " candidate matches, the first one is used"});
    }
    screen.content.push_back(Line{.text = "│"});

    for (const auto& line : context.context_lines) {
        bool inserted = line.starts_with('+');
        bool removed = line.starts_with('-');
        screen.content.push_back(
            Line{.text = "│ " + line, .is_highlighted = inserted, .is_removal = removed});
    }

    screen.content.push_back(Line{.text = "│"});
    screen.content.push_back(Line{.text = "│ Decision: " + decision_display_name(decision)});
    screen.content.push_back(Line{.text = "└─"});

    size_t accepted_count = accepted_hunk_indices(model).size();

    if (model.quit_confirmation_needed || model.show_status_message) {
        screen.status_line = model.status_message;
    } else if (!model.filtered_indices.empty()) {
        screen.status_line = "Showing " + std::to_string(model.filtered_indices.size()) + "/"
                             + std::to_string(model.outcomes.size()) + " hunks (filtered: '"
                             + model.search_input + "')";
    } else {
        screen.status_line = "Accepted: " + std::to_string(accepted_count) + " | Hunk "
                             + std::to_string(model.current_index + 1) + "/"
                             + std::to_string(active_count);
    }

    screen.control_hints
        = "Navigate [←→] Accept/Skip [↑↓] Save & Exit [x] Quit [q] Search [/] Summary [t]";

    return screen;
}

auto PatcherApp::compose_summary_screen(const ReviewModel& model) -> Screen {
    Screen screen;

    auto stats = functional_core::patch_statistics(model.outcomes);
    size_t accepted_count = accepted_hunk_indices(model).size();

    screen.content.push_back(Line{.text = "=== Patch Summary ==="});
    screen.content.push_back(Line{.text = functional_core::format_statistics(stats)});
    screen.content.push_back(
        Line{.text = "Accepted: " + std::to_string(accepted_count) + " | Ambiguous: "
                     + std::to_string(stats.ambiguous) + " | Reviewed: "
                     + std::to_string(model.visited_hunks.size()) + "/"
                     + std::to_string(stats.total)});
    screen.content.push_back(Line{.text = ""});

    for (size_t i = 0; i < model.outcomes.size(); ++i) {
        const auto& outcome = model.outcomes[i];
        std::string marker = model.visited_hunks.contains(i) ? "   " : " * ";
        std::string line = marker + std::to_string(i + 1) + ". [" + status_name(outcome.status)
                           + "/" + decision_display_name(model.decisions[i]) + "] "
                           + outcome.description;
        screen.content.push_back(Line{.text = line, .is_highlighted = !outcome.applied()});
    }

    screen.status_line = "Summary Mode (* = not reviewed yet)";
    screen.control_hints = "Back [Escape] or [t]";

    return screen;
}

auto PatcherApp::compose_search_screen(const ReviewModel& model) -> Screen {
    Screen screen;

    screen.content.push_back(Line{.text = "=== Search / Filter Hunks ==="});
    screen.content.push_back(Line{.text = ""});
    screen.content.push_back(Line{.text = "Enter search terms (space-separated for AND logic):"});
    screen.content.push_back(
        Line{.text = "Searches across: description, search block, hunk number"});
    screen.content.push_back(Line{.text = ""});
    screen.content.push_back(Line{.text = "Current filter: '" + model.search_input + "'"});

    screen.status_line = "Search Mode - Enter search terms, then press Enter";
    screen.control_hints = "Type search terms, [Enter] to apply, [Escape] to cancel";

    return screen;
}

auto PatcherApp::load_patch(const Config& config) -> std::optional<Patch> {
    std::string payload;

    if (config.patch_file == "-") {
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        payload = oss.str();
    } else {
        auto text = filesystem_->read_text(config.patch_file);
        if (!text) {
            std::cerr << "Error: Could not read patch " << config.patch_file << '\n';
            return std::nullopt;
        }
        payload = std::move(*text);
    }

    if (functional_core::trim(payload).empty()) {
        std::cerr << "Error: Patch payload is empty\n";
        return std::nullopt;
    }

    try {
        return parser_->parse_patch(payload);
    } catch (const ValidationError& e) {
        std::cerr << "Error: Invalid patch: " << e.what() << '\n';
        return std::nullopt;
    }
}

auto PatcherApp::apply_accepted(const std::string& original_text, const ReviewModel& model)
    -> PatchResult {
    auto indices = accepted_hunk_indices(model);
    auto result = apply_patch(original_text, accepted_patch(model));

    // Report against positions in the full patch
    for (size_t i = 0; i < result.outcomes.size(); ++i) {
        result.outcomes[i].index = indices[i];
    }

    return result;
}

auto PatcherApp::resolve_output_path(const Config& config) -> std::string {
    if (!config.output_file.empty()) {
        return config.output_file;
    }
    if (config.in_place) {
        return config.target_file;
    }

    std::filesystem::path target(config.target_file);
    auto suffix = config.version_suffix;
    if (suffix.empty()) {
        auto siblings = filesystem_->list_directory(target.parent_path().string());
        suffix = compute_default_version(target.stem().string(), siblings);
    }

    return versioned_output_path(config.target_file, suffix);
}

auto PatcherApp::write_output(const std::string& text, const Config& config) -> bool {
    auto path = resolve_output_path(config);

    if (path == "-") {
        std::cout << text << std::flush;
        return std::cout.good();
    }

    if (!filesystem_->write_text(text, path)) {
        std::cerr << "Error: Failed to write " << path << '\n';
        return false;
    }

    progress(config) << "Patched file saved as: " << path << '\n';
    return true;
}

auto PatcherApp::save_patch_log(const std::vector<std::string>& log, const Config& config)
    -> void {
    if (config.log_dir.empty()) {
        return;
    }

    if (!filesystem_->create_directories(config.log_dir)) {
        std::cerr << "Warning: Could not create log directory " << config.log_dir << '\n';
        return;
    }

    std::ostringstream oss;
    for (const auto& line : log) {
        oss << line << '\n';
    }

    auto path = (std::filesystem::path(config.log_dir)
                 / log_file_name(std::chrono::system_clock::now()))
                    .string();

    if (filesystem_->write_text(oss.str(), path)) {
        progress(config) << "Patch log saved as: " << path << '\n';
    } else {
        std::cerr << "Warning: Could not save patch log to " << path << '\n';
    }
}

auto PatcherApp::report_outcomes(const PatchResult& result, const Config& config) -> void {
    auto& out = progress(config);

    if (config.verbose) {
        for (const auto& line : functional_core::format_patch_log(result.outcomes)) {
            out << line << '\n';
        }
    }

    for (const auto& outcome : result.outcomes) {
        out << "  [" << status_name(outcome.status) << "] Hunk " << outcome.index + 1;
        if (outcome.applied()) {
            out << " (" << match_mode_name(outcome.matched_mode.value_or(MatchMode::STRICT))
                << ", lines " << outcome.first_line << "-" << outcome.last_line << ")";
        } else {
            out << " (not found)";
        }
        out << ": " << outcome.description << '\n';
    }

    out << functional_core::format_statistics(functional_core::patch_statistics(result.outcomes))
        << '\n';
}

auto PatcherApp::handle_quit_confirmation(ReviewModel& model) -> bool {
    if (!model.decisions_changed) {
        return true;
    }

    if (!model.quit_confirmation_needed) {
        // First time user pressed quit - show confirmation prompt
        model.quit_confirmation_needed = true;
        model.show_status_message = true;
        model.status_message
            = "Quit without writing? Press 'q' again to confirm, any other key to cancel";
        return false;
    }

    // User pressed quit twice - confirm the quit
    return true;
}

} // namespace sturdypatch
