#pragma once

#include "core/logger.hpp"
#include "engine/engine_session.hpp"
#include "ftxui/component/screen_interactive.hpp"
#include "types.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chessan::tui {
class Renderer;
}

namespace chessan::core {

struct AppConfig {
    std::string engine_path;
    std::string position_fen{engine::PositionSnapshot::START_FEN};

    f64 movetime_seconds = 2.0;
    f64 handshake_timeout_seconds = 10.0;

    std::filesystem::path log_file = "chessan_engine_log.txt";
    bool enable_logging = true;
    bool show_help = false;
    bool batch = false;

    std::vector<std::string> custom_uci_options;
};

enum class StatusKind { Info, Success, Warning, Error };

// Everything the panel shows; only touched on the UI thread.
struct PanelState {
    std::string engine_path;
    std::string fen;

    bool connected = false;
    bool connect_pending = false;
    bool analysis_pending = false;
    std::string connection_text = "Not connected";

    std::string best_move;
    std::string evaluation;
    std::optional<engine::ScoreValue> score;

    std::string status;
    StatusKind status_kind = StatusKind::Info;
};

class Application {
public:
    Application();
    ~Application();

    i32 run(i32 argc, char* argv[]);
    void shutdown();

    void request_connect();
    void request_analysis();
    void drain_events();
    std::string side_to_move_label() const;

    PanelState& panel();
    bool can_analyze() const;
    bool is_shutting_down() const;

private:
    void setup_signal_handlers();
    void parse_arguments(i32 argc, char* argv[]);
    void print_usage(const char* program_name);
    void print_help();
    engine::SessionConfig session_config() const;
    std::chrono::milliseconds movetime() const;

    i32 run_batch();
    i32 run_interactive();
    void apply_event(const engine::SessionEvent& event);
    void set_status(std::string text, StatusKind kind);

    AppConfig m_config;
    Logger m_logger;
    PanelState m_panel;

    ftxui::ScreenInteractive m_screen = ftxui::ScreenInteractive::Fullscreen();
    std::unique_ptr<tui::Renderer> m_renderer;
    // Declared after the screen so the worker is joined before the screen
    // it posts to goes away.
    std::unique_ptr<engine::EngineSession> m_session;

    std::atomic<bool> m_is_shutting_down{false};
};

} // namespace chessan::core
