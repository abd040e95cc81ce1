#include "engine/engine_session.hpp"
#include "core/logger.hpp"
#include "process/process.hpp"
#include "uci/uci_client.hpp"
#include <algorithm>
#include <exception>

namespace chessan::engine {

namespace {

constexpr auto MIN_TIME_BUDGET = std::chrono::milliseconds(1);

AnalysisResult make_result(const PositionSnapshot& position, uci::SearchReport&& report) {
    AnalysisResult result;
    result.perspective = position.side_to_move();
    result.fen = position.fen();
    result.best_move = std::move(report.best.move);
    if (report.last_info) {
        result.score = normalize(report.last_info->score);
        result.pv = std::move(report.last_info->pv);
        result.depth = report.last_info->depth;
    }
    return result;
}

} // namespace

EngineSession::EngineSession(SessionConfig config, core::Logger* logger)
    : m_config(std::move(config)),
      m_logger(logger),
      m_requests(m_config.queue_capacity) {
}

EngineSession::~EngineSession() {
    shutdown();
}

void EngineSession::set_notifier(Notifier notifier) {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (!m_started.load()) {
        m_notifier = std::move(notifier);
    }
}

void EngineSession::start() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_started.load() || m_stopped.load()) {
        return;
    }
    m_worker = std::thread(&EngineSession::worker_loop, this);
    m_started.store(true);
}

bool EngineSession::connect(std::string executable) {
    return submit(ConnectRequest{std::move(executable)});
}

bool EngineSession::analyze(PositionSnapshot position, std::chrono::milliseconds time_budget) {
    return submit(AnalyzeRequest{AnalysisRequest{std::move(position), time_budget}});
}

bool EngineSession::submit(Request&& request) {
    if (!m_started.load() || m_stopped.load()) {
        return false;
    }
    if (m_outstanding.fetch_add(1) >= m_requests.capacity()) {
        m_outstanding.fetch_sub(1);
        return false;
    }
    if (!m_requests.try_push(std::move(request))) {
        m_outstanding.fetch_sub(1);
        return false;
    }
    return true;
}

std::optional<SessionEvent> EngineSession::poll() {
    auto event = m_events.pop();
    if (event) {
        m_outstanding.fetch_sub(1);
    }
    return event;
}

std::optional<SessionEvent> EngineSession::wait_event(std::chrono::milliseconds timeout) {
    auto event = m_events.wait_and_pop(timeout);
    if (event) {
        m_outstanding.fetch_sub(1);
    }
    return event;
}

void EngineSession::shutdown() noexcept {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_stopped.exchange(true)) {
        return;
    }
    if (!m_started.load()) {
        return;
    }

    m_requests.push(ShutdownRequest{});
    m_requests.close();
    try {
        if (m_worker.joinable()) {
            m_worker.join();
        }
    } catch (const std::exception& e) {
        log(std::string("Failed to join engine worker: ") + e.what());
    }
}

SessionState EngineSession::state() const {
    return m_state.load();
}

bool EngineSession::is_connected() const {
    auto state = m_state.load();
    return state == SessionState::Idle || state == SessionState::Analyzing;
}

bool EngineSession::is_running() const {
    return m_started.load() && !m_stopped.load();
}

void EngineSession::worker_loop() {
    log("Worker started");
    while (true) {
        auto request = m_requests.wait_and_pop(m_config.poll_interval);
        if (!request) {
            if (m_requests.is_closed() && m_requests.empty()) {
                break;
            }
            continue;
        }

        if (std::holds_alternative<ShutdownRequest>(*request)) {
            m_shutdown_seen = true;
            disconnect_engine("session shutting down");
            continue;
        }

        SessionEvent event = [&]() -> SessionEvent {
            if (m_shutdown_seen) {
                return reject(*request);
            }
            try {
                if (const auto* connect = std::get_if<ConnectRequest>(&*request)) {
                    return handle(*connect);
                }
                return handle(std::get<AnalyzeRequest>(*request));
            } catch (const std::exception& e) {
                log(std::string("Unexpected failure: ") + e.what());
                set_state(m_client ? SessionState::Idle : SessionState::Disconnected);
                if (std::holds_alternative<ConnectRequest>(*request)) {
                    return ConnectFailed{ErrorKind::ProtocolViolation, e.what()};
                }
                return OperationFailed{ErrorKind::ProtocolViolation, e.what()};
            }
        }();
        publish(std::move(event));
    }

    disconnect_engine("worker exiting");
    log("Worker stopped");
}

SessionEvent EngineSession::reject(const Request& request) const {
    const std::string reason = "Engine session is shutting down";
    if (std::holds_alternative<ConnectRequest>(request)) {
        return ConnectFailed{ErrorKind::NotConnected, reason};
    }
    return OperationFailed{ErrorKind::NotConnected, reason};
}

std::unique_ptr<uci::UciClient> EngineSession::launch(const std::filesystem::path& executable,
                                                      std::string& engine_name) {
    std::unique_ptr<uci::UciClient> client;
    try {
        auto engine_process =
            std::make_unique<process::Process>(executable, std::vector<std::string>{});
        client = std::make_unique<uci::UciClient>(std::move(engine_process), m_logger);
    } catch (const std::runtime_error& e) {
        throw EngineError(ErrorKind::InvalidExecutable, e.what());
    }

    auto id = client->handshake(m_config.handshake_timeout);
    for (const auto& [name, value] : m_config.uci_options) {
        client->set_option(name, value);
    }
    if (!m_config.uci_options.empty()) {
        client->sync(m_config.sync_timeout);
    }
    engine_name = id.name.empty() ? executable.filename().string() : id.name;
    return client;
}

SessionEvent EngineSession::handle(const ConnectRequest& request) {
    auto resolved = process::resolve_executable(request.executable);
    if (!resolved) {
        log("Rejected engine path '" + request.executable + "'");
        return ConnectFailed{ErrorKind::InvalidExecutable,
                             "'" + request.executable +
                                 "' is not an executable file or a command on PATH"};
    }

    disconnect_engine("replaced by a new connection");
    set_state(SessionState::Connecting);

    try {
        std::string engine_name;
        m_client = launch(*resolved, engine_name);
        m_executable = *resolved;
        m_needs_new_game = true;
        set_state(SessionState::Idle);
        log("Connected to " + engine_name + " (pid " + std::to_string(m_client->pid()) + ")");
        return ConnectSucceeded{resolved->string(), engine_name};
    } catch (const EngineError& e) {
        m_client.reset();
        set_state(SessionState::Disconnected);
        log(std::string("Connection failed: ") + e.what());
        return ConnectFailed{e.kind(), e.what()};
    }
}

SessionEvent EngineSession::handle(const AnalyzeRequest& request) {
    if (!m_client) {
        return OperationFailed{ErrorKind::NotConnected, "engine not connected"};
    }

    const auto& analysis = request.analysis;
    const auto budget = std::max(analysis.time_budget, MIN_TIME_BUDGET);
    const auto watchdog = budget * m_config.watchdog_factor + m_config.watchdog_margin;

    set_state(SessionState::Analyzing);
    try {
        if (m_needs_new_game) {
            m_client->new_game(m_config.sync_timeout);
            m_needs_new_game = false;
        }
        m_client->set_position(analysis.position.fen());
        auto report = m_client->search(budget, watchdog);
        set_state(SessionState::Idle);
        return AnalysisCompleted{make_result(analysis.position, std::move(report))};
    } catch (const EngineError& e) {
        log(std::string("Analysis failed: ") + e.what());
        recover_after_failure(e.kind());
        return OperationFailed{e.kind(), std::string("Analysis failed: ") + e.what()};
    }
}

// A dead engine leaves the session disconnected. A live one is kept only once
// its timed out search has delivered a bestmove and it answers isready;
// otherwise it is replaced by a fresh process on the same executable.
void EngineSession::recover_after_failure(ErrorKind failure) {
    if (failure == ErrorKind::ProcessCrashed || !m_client->is_alive()) {
        log("Engine process is gone");
        m_client->quit(m_config.quit_grace);
        m_client.reset();
        set_state(SessionState::Disconnected);
        return;
    }

    try {
        if (m_client->is_searching() && !m_client->await_bestmove(m_config.sync_timeout)) {
            throw EngineError(ErrorKind::SearchTimeout, "search never delivered a bestmove");
        }
        m_client->sync(m_config.sync_timeout);
        set_state(SessionState::Idle);
        return;
    } catch (const EngineError& e) {
        log(std::string("Engine unresponsive after failure: ") + e.what());
        if (e.kind() == ErrorKind::ProcessCrashed) {
            m_client->quit(m_config.quit_grace);
            m_client.reset();
            set_state(SessionState::Disconnected);
            return;
        }
    }

    disconnect_engine("restarting unresponsive engine");
    set_state(SessionState::Connecting);
    try {
        std::string engine_name;
        m_client = launch(m_executable, engine_name);
        m_needs_new_game = true;
        set_state(SessionState::Idle);
        log("Restarted " + engine_name);
    } catch (const EngineError& e) {
        m_client.reset();
        set_state(SessionState::Disconnected);
        log(std::string("Restart failed: ") + e.what());
    }
}

void EngineSession::disconnect_engine(std::string_view reason) {
    if (!m_client) {
        return;
    }
    log("Disconnecting engine: " + std::string(reason));
    m_client->quit(m_config.quit_grace);
    m_client.reset();
    set_state(SessionState::Disconnected);
}

void EngineSession::publish(SessionEvent&& event) {
    m_events.push(std::move(event));
    if (m_notifier) {
        m_notifier();
    }
}

void EngineSession::set_state(SessionState state) {
    auto previous = m_state.exchange(state);
    if (previous != state) {
        log(std::string(to_string(previous)) + " -> " + std::string(to_string(state)));
    }
}

void EngineSession::log(std::string_view text) const {
    if (m_logger) {
        m_logger->write("session", text);
    }
}

} // namespace chessan::engine
