#pragma once

#include "sturdypatch/interfaces.hpp"
#include "sturdypatch/ui/review_model.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <functional>

namespace sturdypatch {

class FTXUITerminal : public ITerminal {
public:
    using UpdateFunction = std::function<ReviewModel(ReviewModel, InputEvent)>;
    using RenderFunction = std::function<Screen(const ReviewModel&)>;

    FTXUITerminal();
    ~FTXUITerminal() override;

    // Delete copy operations to ensure single instance
    FTXUITerminal(const FTXUITerminal&) = delete;
    auto operator=(const FTXUITerminal&) -> FTXUITerminal& = delete;

    // ITerminal interface
    auto setup_raw_mode() -> bool override;
    auto get_input_event() -> InputEvent override;
    auto display_screen(const Screen& screen) -> void override;
    auto read_line() -> std::string override;
    auto is_interactive() -> bool override;
    auto restore_terminal_state() -> void override;

    // FTXUI-specific reactive interface
    auto run_reactive_session(const ReviewModel& initial_model, UpdateFunction update_function,
                              RenderFunction render_function) -> ReviewModel;

private:
    bool raw_mode_active_ = false;
    Screen current_screen_;

    auto map_ftxui_event_to_input_event(const ftxui::Event& event) -> InputEvent;
    auto screen_to_ftxui_element(const Screen& screen) -> ftxui::Element;
};

} // namespace sturdypatch
