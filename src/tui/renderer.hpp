#pragma once

#include "core/application.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/component/screen_interactive.hpp"
#include "types.hpp"
#include <string>

namespace chessan::tui {

class Renderer {
public:
    Renderer(ftxui::ScreenInteractive& screen, core::Application& app);

    void start();

private:
    ftxui::Component build_ui();
    ftxui::Element render_header();
    ftxui::Element render_engine_panel();
    ftxui::Element render_position_panel();
    ftxui::Element render_analysis_panel();
    ftxui::Element render_status();

    ftxui::Color get_eval_color(const engine::ScoreValue& score) const;
    ftxui::Color get_status_color(core::StatusKind kind) const;

    ftxui::ScreenInteractive& m_screen;
    core::Application& m_app;

    ftxui::Component m_path_input;
    ftxui::Component m_connect_button;
    ftxui::Component m_fen_input;
    ftxui::Component m_analyze_button;
    ftxui::Component m_quit_button;
};

} // namespace chessan::tui
