#include "sturdypatch/ui/ftxui_terminal.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <cstdio>
#include <iostream>
#include <unistd.h>

namespace sturdypatch {

FTXUITerminal::FTXUITerminal() = default;

FTXUITerminal::~FTXUITerminal() { restore_terminal_state(); }

auto FTXUITerminal::setup_raw_mode() -> bool {
    // Patch payload may have been piped in; keyboard input comes from the tty
    if (!isatty(STDIN_FILENO)) {
        if (!std::freopen("/dev/tty", "r", stdin)) {
            return false;
        }
    }

    // FTXUI handles raw mode itself inside its loops
    raw_mode_active_ = true;
    return true;
}

auto FTXUITerminal::get_input_event() -> InputEvent {
    using namespace ftxui;

    auto screen = ScreenInteractive::Fullscreen();
    InputEvent captured = InputEvent::UNKNOWN;

    auto component = CatchEvent(
        Renderer([this] { return screen_to_ftxui_element(current_screen_); }),
        [&](Event event) {
            auto mapped = map_ftxui_event_to_input_event(event);
            if (mapped == InputEvent::UNKNOWN) {
                return false;
            }
            captured = mapped;
            screen.ExitLoopClosure()();
            return true;
        });

    screen.Loop(component);
    return captured;
}

auto FTXUITerminal::display_screen(const Screen& screen) -> void {
    current_screen_ = screen;

    auto element = screen_to_ftxui_element(screen);
    auto ftxui_screen = ftxui::Screen::Create(ftxui::Dimension::Full(), ftxui::Dimension::Full());

    ftxui::Render(ftxui_screen, element);
    std::cout << ftxui_screen.ToString() << std::flush;
}

auto FTXUITerminal::read_line() -> std::string {
    using namespace ftxui;

    std::string result;
    auto screen = ScreenInteractive::Fullscreen();
    auto input_component = Input(&result, "Enter search terms...");

    auto container = Container::Vertical({
        Renderer([this] { return screen_to_ftxui_element(current_screen_); }),
        input_component
    });

    auto event_handler = CatchEvent(container, [&](Event event) {
        if (event == Event::Return) {
            screen.ExitLoopClosure()();
            return true;
        }
        if (event == Event::Escape) {
            result.clear();
            screen.ExitLoopClosure()();
            return true;
        }
        return false;
    });

    screen.Loop(event_handler);
    return result;
}

auto FTXUITerminal::is_interactive() -> bool {
    if (!isatty(STDOUT_FILENO)) {
        return false;
    }
    return isatty(STDIN_FILENO) || access("/dev/tty", R_OK) == 0;
}

auto FTXUITerminal::restore_terminal_state() -> void {
    if (raw_mode_active_) {
        // FTXUI restores the terminal when each loop ends
        raw_mode_active_ = false;
    }
}

auto FTXUITerminal::run_reactive_session(const ReviewModel& initial_model,
                                         UpdateFunction update_function,
                                         RenderFunction render_function) -> ReviewModel {
    using namespace ftxui;

    auto current_model = initial_model;
    auto screen = ScreenInteractive::Fullscreen();

    auto component = CatchEvent(
        Renderer([&] { return screen_to_ftxui_element(render_function(current_model)); }),
        [&](Event event) -> bool {
            // Search mode edits the filter text directly
            if (current_model.mode == ViewMode::SEARCHING) {
                if (event == Event::Backspace) {
                    if (!current_model.search_input.empty()) {
                        current_model.search_input.pop_back();
                    }
                    return true;
                }
                if (event.is_character()) {
                    current_model.search_input += event.character();
                    return true;
                }
                if (event == Event::Return) {
                    current_model = update_function(current_model, InputEvent::ENTER);
                    return true;
                }
                if (event == Event::Escape) {
                    current_model = update_function(current_model, InputEvent::ESCAPE);
                    return true;
                }
                return false;
            }

            auto input_event = map_ftxui_event_to_input_event(event);
            if (input_event == InputEvent::UNKNOWN) {
                return false; // Event not handled
            }

            current_model = update_function(current_model, input_event);
            if (current_model.mode == ViewMode::EXIT) {
                screen.ExitLoopClosure()();
            }
            return true;
        });

    screen.Loop(component);
    return current_model;
}

auto FTXUITerminal::map_ftxui_event_to_input_event(const ftxui::Event& event) -> InputEvent {
    if (event == ftxui::Event::ArrowUp) {
        return InputEvent::ARROW_UP;
    }
    if (event == ftxui::Event::ArrowDown) {
        return InputEvent::ARROW_DOWN;
    }
    if (event == ftxui::Event::ArrowLeft) {
        return InputEvent::ARROW_LEFT;
    }
    if (event == ftxui::Event::ArrowRight) {
        return InputEvent::ARROW_RIGHT;
    }
    if (event == ftxui::Event::Escape) {
        return InputEvent::ESCAPE;
    }
    if (event == ftxui::Event::Return) {
        return InputEvent::ENTER;
    }

    // Character input - only single character commands
    if (event.is_character()) {
        std::string chars = event.character();
        if (chars.length() == 1) {
            switch (chars[0]) {
            case 'x':
            case 'X':
                return InputEvent::SAVE_EXIT;
            case 'q':
            case 'Q':
                return InputEvent::QUIT;
            case '/':
                return InputEvent::SEARCH;
            case 't':
            case 'T':
                return InputEvent::SHOW_SUMMARY;
            default:
                return InputEvent::UNKNOWN;
            }
        }
    }

    return InputEvent::UNKNOWN;
}

auto FTXUITerminal::screen_to_ftxui_element(const Screen& screen) -> ftxui::Element {
    using namespace ftxui;

    Elements content_elements;
    for (const auto& line : screen.content) {
        if (line.is_removal) {
            content_elements.push_back(text(line.text) | color(Color::Red));
        } else if (line.is_highlighted) {
            content_elements.push_back(text(line.text) | color(Color::Green));
        } else {
            content_elements.push_back(text(line.text));
        }
    }

    auto status_element = text(screen.status_line) | bold | color(Color::Cyan);
    auto hints_element = text(screen.control_hints) | dim;

    return vbox({
        vbox(std::move(content_elements)) | flex,
        separator(),
        status_element,
        hints_element
    });
}

} // namespace sturdypatch
