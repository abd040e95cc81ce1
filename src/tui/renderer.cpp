#include "tui/renderer.hpp"
#include "ftxui/component/component_base.hpp"
#include "ftxui/component/event.hpp"
#include "ftxui/dom/elements.hpp"

namespace chessan::tui {

using namespace ftxui;

namespace {

constexpr i32 EVAL_HIGHLIGHT_CP = 50;

} // namespace

Renderer::Renderer(ScreenInteractive& screen, core::Application& app)
    : m_screen(screen), m_app(app) {
}

void Renderer::start() {
    auto ui = build_ui();
    m_screen.Loop(ui);
}

Color Renderer::get_eval_color(const engine::ScoreValue& score) const {
    auto cp = engine::to_centipawns(score);
    if (!cp) {
        return Color::GrayLight;
    }
    if (*cp > EVAL_HIGHLIGHT_CP) {
        return Color::GreenLight;
    } else if (*cp < -EVAL_HIGHLIGHT_CP) {
        return Color::RedLight;
    }
    return Color::Default;
}

Color Renderer::get_status_color(core::StatusKind kind) const {
    switch (kind) {
        case core::StatusKind::Success: return Color::GreenLight;
        case core::StatusKind::Warning: return Color::YellowLight;
        case core::StatusKind::Error: return Color::RedLight;
        case core::StatusKind::Info: break;
    }
    return Color::CyanLight;
}

Element Renderer::render_header() {
    auto title = text(" chessan v0.1.0") | bold | color(Color::CyanLight);
    auto hint = text(" Tab: next field | Enter: activate | Esc: quit") | color(Color::GrayDark);
    return hbox({title, text(" |"), hint});
}

Element Renderer::render_engine_panel() {
    const auto& panel = m_app.panel();
    Color status_color = panel.connected ? Color::GreenLight
                         : panel.connect_pending ? Color::YellowLight
                                                 : Color::RedLight;
    return window(text(" Engine ") | bold,
                  vbox({
                      hbox({text("Executable: ") | color(Color::GrayLight),
                            m_path_input->Render() | flex}),
                      m_connect_button->Render(),
                      hbox({text("Status: ") | color(Color::GrayLight),
                            text(panel.connection_text) | color(status_color)}),
                  }));
}

Element Renderer::render_position_panel() {
    auto analyze = m_analyze_button->Render();
    if (!m_app.can_analyze()) {
        analyze = analyze | dim;
    }
    return window(text(" Position (FEN) ") | bold,
                  vbox({
                      m_fen_input->Render(),
                      hbox({analyze | flex, m_quit_button->Render()}),
                  }));
}

Element Renderer::render_analysis_panel() {
    const auto& panel = m_app.panel();
    auto evaluation = text(panel.evaluation) | bold;
    if (panel.score) {
        evaluation = evaluation | color(get_eval_color(*panel.score));
    }
    return window(text(" Analysis ") | bold,
                  vbox({
                      hbox({text("Side to move: ") | color(Color::GrayLight),
                            text(m_app.side_to_move_label()) | bold}),
                      hbox({text("Best move:    ") | color(Color::GrayLight),
                            text(panel.best_move) | bold | color(Color::GreenLight)}),
                      hbox({text("Evaluation:   ") | color(Color::GrayLight), evaluation}),
                  }));
}

Element Renderer::render_status() {
    const auto& panel = m_app.panel();
    return paragraph(panel.status) | color(get_status_color(panel.status_kind));
}

Component Renderer::build_ui() {
    auto& panel = m_app.panel();

    m_path_input = Input(&panel.engine_path, "stockfish or /path/to/engine");
    m_connect_button = Button("Connect", [this] { m_app.request_connect(); });
    m_fen_input = Input(&panel.fen, "FEN");
    m_analyze_button = Button("Analyze Position", [this] { m_app.request_analysis(); });
    m_quit_button = Button("Quit", m_screen.ExitLoopClosure());

    auto main_container = Container::Vertical({
        m_path_input,
        m_connect_button,
        m_fen_input,
        Container::Horizontal({m_analyze_button, m_quit_button}),
    });

    auto layout = ftxui::Renderer(main_container, [this] {
        return vbox({
                   render_header(),
                   separator(),
                   render_engine_panel(),
                   render_position_panel(),
                   render_analysis_panel(),
                   separator(),
                   render_status(),
               }) |
               border;
    });

    auto component = CatchEvent(layout, [this](Event event) {
        if (event == Event::Custom) {
            m_app.drain_events();
            if (m_app.is_shutting_down()) {
                m_screen.ExitLoopClosure()();
            }
            return true;
        } else if (event == Event::Escape) {
            m_screen.ExitLoopClosure()();
            return true;
        }
        return false;
    });

    return component;
}

} // namespace chessan::tui
