#include "core/application.hpp"
#include "process/process.hpp"
#include "tui/renderer.hpp"
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace chessan::core {

namespace {

constexpr std::string_view DEFAULT_ENGINE_COMMAND = "stockfish";
constexpr auto BATCH_EVENT_MARGIN = std::chrono::seconds(5);

Application* g_app_instance = nullptr;

void signal_handler(i32) {
    if (g_app_instance) {
        g_app_instance->shutdown();
    }
}

std::optional<f64> parse_seconds(const char* text) {
    char* end = nullptr;
    f64 value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(value) || value <= 0.0) {
        return std::nullopt;
    }
    return value;
}

std::chrono::milliseconds to_millis(f64 seconds) {
    return std::chrono::milliseconds(static_cast<i64>(std::llround(seconds * 1000.0)));
}

} // namespace

Application::Application() {
    g_app_instance = this;
}

Application::~Application() {
    g_app_instance = nullptr;
    if (m_session) {
        m_session->shutdown();
    }
}

void Application::setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
}

void Application::shutdown() {
    m_is_shutting_down.store(true);
    m_screen.PostEvent(ftxui::Event::Custom);
}

PanelState& Application::panel() {
    return m_panel;
}

bool Application::is_shutting_down() const {
    return m_is_shutting_down.load();
}

bool Application::can_analyze() const {
    return m_panel.connected && !m_panel.analysis_pending && !m_panel.connect_pending;
}

void Application::print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [engine_executable] [options]\n"
              << "Try '" << program_name << " -h' for more information.\n";
}

void Application::print_help() {
    std::cout << R"(
chessan - UCI engine analysis console v0.1.0

USAGE:
    chessan [engine_executable] [OPTIONS]

ARGUMENTS:
    [engine_executable]            Path to a UCI engine, or a command on PATH.
                                   Defaults to 'stockfish' when it is on PATH.

OPTIONS:
    -h, --help                     Show this help message
    --fen <fen>                    Position to analyze (default: start position)
    --movetime <seconds>           Search time per analysis (default: 2.0)
    --handshake-timeout <seconds>  Time allowed for uci/isready (default: 10)
    --uci-option <name>=<value>    Send a UCI option after connecting
                                   Can be specified multiple times
    --log-file <path>              Engine traffic log (default: chessan_engine_log.txt)
    --no-log                       Disable engine traffic logging
    --batch                        Connect, analyze --fen once, print the result and exit

INTERACTIVE CONTROLS:
    Tab / Arrows        Move between fields and buttons
    Enter               Activate the focused button
    Esc                 Quit

EXAMPLES:
    chessan stockfish
    chessan ./engines/stockfish --movetime 0.5 --uci-option Threads=4
    chessan stockfish --batch --fen "r1bqkbnr/pppp1ppp/2n5/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R w KQkq - 2 3"
)";
}

void Application::parse_arguments(i32 argc, char* argv[]) {
    for (i32 i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            m_config.show_help = true;
            return;
        } else if (arg == "--fen" && i + 1 < argc) {
            m_config.position_fen = argv[++i];
        } else if (arg == "--movetime" && i + 1 < argc) {
            const char* value = argv[++i];
            if (auto seconds = parse_seconds(value)) {
                m_config.movetime_seconds = *seconds;
            } else {
                std::cerr << "Warning: Invalid movetime '" << value << "', using default (2.0)\n";
            }
        } else if (arg == "--handshake-timeout" && i + 1 < argc) {
            const char* value = argv[++i];
            if (auto seconds = parse_seconds(value)) {
                m_config.handshake_timeout_seconds = *seconds;
            } else {
                std::cerr << "Warning: Invalid handshake timeout '" << value
                          << "', using default (10)\n";
            }
        } else if (arg == "--uci-option" && i + 1 < argc) {
            m_config.custom_uci_options.push_back(argv[++i]);
        } else if (arg == "--log-file" && i + 1 < argc) {
            m_config.log_file = argv[++i];
        } else if (arg == "--no-log") {
            m_config.enable_logging = false;
        } else if (arg == "--batch") {
            m_config.batch = true;
        } else if (!arg.starts_with("-") && m_config.engine_path.empty()) {
            m_config.engine_path = arg;
        } else {
            std::cerr << "Warning: Unknown argument '" << arg << "'\n";
        }
    }
}

engine::SessionConfig Application::session_config() const {
    engine::SessionConfig config;
    config.handshake_timeout = to_millis(m_config.handshake_timeout_seconds);

    for (const auto& option : m_config.custom_uci_options) {
        auto pos = option.find('=');
        if (pos != std::string::npos) {
            config.uci_options.emplace_back(option.substr(0, pos), option.substr(pos + 1));
        } else {
            std::cerr << "Warning: Ignoring UCI option '" << option << "' (expected name=value)\n";
        }
    }
    return config;
}

std::chrono::milliseconds Application::movetime() const {
    return to_millis(m_config.movetime_seconds);
}

void Application::set_status(std::string text, StatusKind kind) {
    m_logger.write("app", text);
    m_panel.status = std::move(text);
    m_panel.status_kind = kind;
}

std::string Application::side_to_move_label() const {
    try {
        auto snapshot = engine::PositionSnapshot::from_fen(m_panel.fen);
        return std::string(rules::to_string(snapshot.side_to_move()));
    } catch (const engine::FenError&) {
        return "?";
    }
}

void Application::request_connect() {
    if (m_panel.connect_pending) {
        return;
    }
    if (!m_session->connect(m_panel.engine_path)) {
        set_status("Engine session is busy; try again once it answers.", StatusKind::Error);
        return;
    }
    m_panel.connect_pending = true;
    m_panel.connection_text = "Connecting...";
    set_status("Attempting to connect to " + m_panel.engine_path + "...", StatusKind::Warning);
}

void Application::request_analysis() {
    if (!can_analyze()) {
        return;
    }

    std::optional<engine::PositionSnapshot> snapshot;
    try {
        snapshot = engine::PositionSnapshot::from_fen(m_panel.fen);
    } catch (const engine::FenError& e) {
        set_status(std::string("Invalid FEN: ") + e.what(), StatusKind::Error);
        return;
    }

    if (!m_session->analyze(std::move(*snapshot), movetime())) {
        set_status("Engine session is busy; try again once it answers.", StatusKind::Error);
        return;
    }
    m_panel.analysis_pending = true;
    m_panel.best_move = "...";
    m_panel.evaluation = "...";
    m_panel.score.reset();
    set_status("Analyzing position...", StatusKind::Warning);
}

void Application::drain_events() {
    while (auto event = m_session->poll()) {
        apply_event(*event);
    }
}

void Application::apply_event(const engine::SessionEvent& event) {
    if (const auto* ok = std::get_if<engine::ConnectSucceeded>(&event)) {
        m_panel.connect_pending = false;
        m_panel.connected = true;
        m_panel.connection_text = "Connected to " + ok->engine_name;
        set_status(ok->engine_name + " connected. Ready to analyze.", StatusKind::Success);
    } else if (const auto* failed = std::get_if<engine::ConnectFailed>(&event)) {
        m_panel.connect_pending = false;
        m_panel.connected = m_session->is_connected();
        m_panel.connection_text = m_panel.connected ? m_panel.connection_text : "Connection failed";
        set_status("Could not connect: " + failed->reason, StatusKind::Error);
    } else if (const auto* done = std::get_if<engine::AnalysisCompleted>(&event)) {
        const auto& result = done->result;
        m_panel.analysis_pending = false;
        m_panel.best_move = result.best_move.value_or("N/A");
        m_panel.score = result.score;
        m_panel.evaluation = engine::describe(result.score);
        set_status("Analysis complete (" + std::string(rules::to_string(result.perspective)) +
                       " to move).",
                   StatusKind::Success);
    } else if (const auto* error = std::get_if<engine::OperationFailed>(&event)) {
        m_panel.analysis_pending = false;
        m_panel.best_move.clear();
        m_panel.evaluation.clear();
        m_panel.connected = m_session->is_connected();
        if (!m_panel.connected) {
            m_panel.connection_text = "Not connected";
        }
        set_status("Error: " + error->reason, StatusKind::Error);
    }
}

i32 Application::run_batch() {
    if (m_config.engine_path.empty()) {
        std::cerr << "Error: --batch needs an engine executable\n";
        return 1;
    }

    std::optional<engine::PositionSnapshot> snapshot;
    try {
        snapshot = engine::PositionSnapshot::from_fen(m_config.position_fen);
    } catch (const engine::FenError& e) {
        std::cerr << "Error: Invalid FEN: " << e.what() << "\n";
        return 1;
    }

    if (!m_session->connect(m_config.engine_path)) {
        std::cerr << "Error: engine session refused the connection request\n";
        return 1;
    }
    auto connected = m_session->wait_event(to_millis(m_config.handshake_timeout_seconds) +
                                           BATCH_EVENT_MARGIN);
    if (!connected || !std::holds_alternative<engine::ConnectSucceeded>(*connected)) {
        const auto* failed = connected ? std::get_if<engine::ConnectFailed>(&*connected) : nullptr;
        std::cerr << "Error: Could not connect: "
                  << (failed ? failed->reason : std::string("no answer from engine session")) << "\n";
        return 1;
    }

    if (!m_session->analyze(std::move(*snapshot), movetime())) {
        std::cerr << "Error: engine session refused the analysis request\n";
        return 1;
    }
    const auto wait_budget = movetime() * 4 + std::chrono::milliseconds(BATCH_EVENT_MARGIN) * 2;
    auto analyzed = m_session->wait_event(wait_budget);
    if (!analyzed) {
        std::cerr << "Error: no answer from engine session\n";
        return 1;
    }
    if (const auto* error = std::get_if<engine::OperationFailed>(&*analyzed)) {
        std::cerr << "Error: " << error->reason << "\n";
        return 1;
    }

    const auto& result = std::get<engine::AnalysisCompleted>(*analyzed).result;
    std::cout << "side     " << rules::to_string(result.perspective) << "\n"
              << "bestmove " << result.best_move.value_or("(none)") << "\n"
              << "score    " << engine::describe(result.score) << "\n";
    if (!result.pv.empty()) {
        std::cout << "pv      ";
        for (const auto& move : result.pv) {
            std::cout << " " << move;
        }
        std::cout << "\n";
    }
    return 0;
}

i32 Application::run_interactive() {
    m_panel.fen = m_config.position_fen;
    if (!m_config.engine_path.empty()) {
        m_panel.engine_path = m_config.engine_path;
        request_connect();
    } else if (process::resolve_executable(DEFAULT_ENGINE_COMMAND)) {
        m_panel.engine_path = std::string(DEFAULT_ENGINE_COMMAND);
        set_status("Detected Stockfish in PATH. Select 'Connect'.", StatusKind::Info);
    } else {
        set_status("Ready. Provide an engine path (or 'stockfish').", StatusKind::Info);
    }

    m_renderer = std::make_unique<tui::Renderer>(m_screen, *this);
    m_renderer->start();
    return 0;
}

i32 Application::run(i32 argc, char* argv[]) {
    parse_arguments(argc, argv);

    if (m_config.show_help) {
        print_help();
        return 0;
    }
    if (m_config.batch && m_config.engine_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    setup_signal_handlers();

    if (m_config.enable_logging && !m_logger.open(m_config.log_file)) {
        std::cerr << "Warning: Could not open log file '" << m_config.log_file.string() << "'\n";
    }

    try {
        m_session = std::make_unique<engine::EngineSession>(session_config(), &m_logger);
        if (!m_config.batch) {
            m_session->set_notifier([this] { m_screen.PostEvent(ftxui::Event::Custom); });
        }
        m_session->start();

        i32 code = m_config.batch ? run_batch() : run_interactive();

        m_is_shutting_down.store(true);
        m_session->shutdown();
        return code;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace chessan::core
