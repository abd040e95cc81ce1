#pragma once

#include "process/process.hpp"
#include "uci/uci_data.hpp"
#include "types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace chessan::core {
class Logger;
}

namespace chessan::uci {

// Blocking UCI conversation with one engine process. Not thread-safe: the
// owner is expected to drive it from a single thread. Protocol failures are
// thrown as EngineError.
class UciClient {
public:
    using Clock = std::chrono::steady_clock;

    UciClient(std::unique_ptr<process::Process> engine_process, core::Logger* logger = nullptr);
    ~UciClient();

    UciClient(const UciClient&) = delete;
    UciClient& operator=(const UciClient&) = delete;

    // uci ... uciok, then isready ... readyok, all within `timeout`.
    EngineId handshake(std::chrono::milliseconds timeout);
    void sync(std::chrono::milliseconds timeout);

    void set_option(std::string_view name, std::string_view value);
    void new_game(std::chrono::milliseconds timeout);
    void set_position(std::string_view fen);

    // go movetime, collecting info lines until bestmove. When `watchdog`
    // expires the search is stopped and SearchTimeout is thrown even if the
    // engine answers the stop.
    SearchReport search(std::chrono::milliseconds movetime, std::chrono::milliseconds watchdog);

    // True between 'go' and the matching bestmove. Engines answer isready
    // while searching, so a readyok alone does not end a timed out search.
    bool is_searching() const;

    // Discards output until the pending search's bestmove; false when it does
    // not arrive within `timeout`.
    bool await_bestmove(std::chrono::milliseconds timeout);

    // Best effort; never throws.
    void quit(std::chrono::milliseconds grace) noexcept;

    void send_command(std::string_view command);
    bool is_alive() const;
    i64 pid() const;

private:
    std::optional<std::string> next_line(Clock::time_point deadline, std::string_view context);
    // Clears the pending search on any bestmove line, malformed ones included.
    std::optional<BestMove> take_bestmove(std::string_view line);

    std::unique_ptr<process::Process> m_process;
    core::Logger* m_logger;
    bool m_search_pending{false};
};

} // namespace chessan::uci
