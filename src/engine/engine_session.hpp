#pragma once

#include "concurrent_queue.hpp"
#include "engine/session_types.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace chessan::core {
class Logger;
}

namespace chessan::uci {
class UciClient;
}

namespace chessan::engine {

// Owns one UCI engine process on a dedicated worker thread. Callers submit
// requests and later poll for events; every accepted request yields exactly
// one event, in submission order. The engine process and its pipes are only
// ever touched by the worker.
//
// An in-flight analysis cannot be cancelled: a new request waits behind it.
class EngineSession {
public:
    using Notifier = std::function<void()>;

    explicit EngineSession(SessionConfig config = {}, core::Logger* logger = nullptr);
    ~EngineSession();

    EngineSession(const EngineSession&) = delete;
    EngineSession& operator=(const EngineSession&) = delete;

    // Invoked on the worker thread after each event is queued. Must be set
    // before start().
    void set_notifier(Notifier notifier);
    void start();

    // False when the session is not running or too many events are pending.
    bool connect(std::string executable);
    bool analyze(PositionSnapshot position, std::chrono::milliseconds time_budget);

    std::optional<SessionEvent> poll();
    std::optional<SessionEvent> wait_event(std::chrono::milliseconds timeout);

    // Lets the worker finish what was already accepted, quits the engine and
    // joins. Idempotent and never throws.
    void shutdown() noexcept;

    SessionState state() const;
    bool is_connected() const;
    bool is_running() const;

private:
    bool submit(Request&& request);
    void worker_loop();

    SessionEvent handle(const ConnectRequest& request);
    SessionEvent handle(const AnalyzeRequest& request);
    SessionEvent reject(const Request& request) const;

    std::unique_ptr<uci::UciClient> launch(const std::filesystem::path& executable,
                                           std::string& engine_name);
    void recover_after_failure(ErrorKind failure);
    void disconnect_engine(std::string_view reason);

    void publish(SessionEvent&& event);
    void set_state(SessionState state);
    void log(std::string_view text) const;

    SessionConfig m_config;
    core::Logger* m_logger;

    ConcurrentQueue<Request> m_requests;
    ConcurrentQueue<SessionEvent> m_events;
    std::atomic<u64> m_outstanding{0};
    std::atomic<SessionState> m_state{SessionState::Disconnected};
    std::atomic<bool> m_started{false};
    std::atomic<bool> m_stopped{false};
    std::mutex m_lifecycle_mutex;
    std::thread m_worker;
    Notifier m_notifier;

    // Worker thread only.
    std::unique_ptr<uci::UciClient> m_client;
    std::filesystem::path m_executable;
    bool m_needs_new_game{true};
    bool m_shutdown_seen{false};
};

} // namespace chessan::engine
