#include "uci/uci_client.hpp"
#include "core/logger.hpp"
#include "uci/uci_error.hpp"
#include "uci/uci_parser.hpp"
#include <exception>

namespace chessan::uci {

namespace {

constexpr auto STOP_GRACE = std::chrono::milliseconds(1000);

std::string millis_text(std::chrono::milliseconds ms) {
    return std::to_string(ms.count()) + " ms";
}

bool is_primary_line(const InfoData& info) {
    return !info.multipv || *info.multipv == 1;
}

void fold_info(std::optional<InfoData>& folded, InfoData&& info) {
    if (!info.score && info.pv.empty()) {
        return;
    }
    if (!folded) {
        folded = std::move(info);
        return;
    }
    auto previous_score = folded->score;
    auto previous_pv = std::move(folded->pv);
    folded = std::move(info);
    if (!folded->score) {
        folded->score = previous_score;
    }
    if (folded->pv.empty()) {
        folded->pv = std::move(previous_pv);
    }
}

} // namespace

UciClient::UciClient(std::unique_ptr<process::Process> engine_process, core::Logger* logger)
    : m_process(std::move(engine_process)), m_logger(logger) {
}

UciClient::~UciClient() = default;

void UciClient::send_command(std::string_view command) {
    if (m_logger) {
        m_logger->write(">", command);
    }
    if (!m_process->write_line(command)) {
        throw EngineError(ErrorKind::ProcessCrashed,
                          "Failed to write '" + std::string(command) + "' to the engine");
    }
}

bool UciClient::is_alive() const {
    return m_process->is_running();
}

i64 UciClient::pid() const {
    return m_process->pid();
}

std::optional<std::string> UciClient::next_line(Clock::time_point deadline,
                                                std::string_view context) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() < 0) {
        remaining = std::chrono::milliseconds(0);
    }
    auto line = m_process->read_line(remaining);
    if (line) {
        if (m_logger) {
            m_logger->write("<", *line);
        }
        return line;
    }
    if (m_process->at_eof()) {
        throw EngineError(ErrorKind::ProcessCrashed,
                          "Engine process exited during " + std::string(context));
    }
    return std::nullopt;
}

EngineId UciClient::handshake(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    EngineId id;

    send_command("uci");
    while (true) {
        auto line = next_line(deadline, "handshake");
        if (!line) {
            throw EngineError(ErrorKind::HandshakeTimeout,
                              "Engine did not answer 'uci' with 'uciok' within " +
                                  millis_text(timeout));
        }
        if (*line == "uciok") {
            break;
        }
        parse_id(*line, id);
    }

    send_command("isready");
    while (true) {
        auto line = next_line(deadline, "handshake");
        if (!line) {
            throw EngineError(ErrorKind::HandshakeTimeout,
                              "Engine did not answer 'isready' with 'readyok' within " +
                                  millis_text(timeout));
        }
        if (*line == "readyok") {
            return id;
        }
    }
}

void UciClient::sync(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    send_command("isready");
    while (true) {
        auto line = next_line(deadline, "synchronisation");
        if (!line) {
            throw EngineError(ErrorKind::SearchTimeout,
                              "Engine did not answer 'isready' within " + millis_text(timeout));
        }
        if (*line == "readyok") {
            return;
        }
    }
}

void UciClient::set_option(std::string_view name, std::string_view value) {
    std::string command = "setoption name " + std::string(name);
    if (!value.empty()) {
        command += " value " + std::string(value);
    }
    send_command(command);
}

void UciClient::new_game(std::chrono::milliseconds timeout) {
    send_command("ucinewgame");
    sync(timeout);
}

void UciClient::set_position(std::string_view fen) {
    send_command("position fen " + std::string(fen));
}

SearchReport UciClient::search(std::chrono::milliseconds movetime,
                               std::chrono::milliseconds watchdog) {
    send_command("go movetime " + std::to_string(movetime.count()));
    m_search_pending = true;

    auto deadline = Clock::now() + watchdog;
    bool stop_sent = false;
    SearchReport report;

    while (true) {
        auto line = next_line(deadline, "search");
        if (!line) {
            if (stop_sent) {
                throw EngineError(ErrorKind::SearchTimeout,
                                  "Engine ignored 'stop' after exceeding the " +
                                      millis_text(watchdog) + " watchdog");
            }
            send_command("stop");
            stop_sent = true;
            deadline = Clock::now() + STOP_GRACE;
            continue;
        }

        if (auto best = take_bestmove(*line)) {
            if (stop_sent) {
                throw EngineError(ErrorKind::SearchTimeout,
                                  "Engine exceeded the " + millis_text(watchdog) +
                                      " watchdog and had to be stopped");
            }
            report.best = std::move(*best);
            return report;
        }

        if (auto info = parse_line(*line); info && is_primary_line(*info)) {
            fold_info(report.last_info, std::move(*info));
        }
    }
}

bool UciClient::is_searching() const {
    return m_search_pending;
}

bool UciClient::await_bestmove(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (m_search_pending) {
        auto line = next_line(deadline, "search drain");
        if (!line) {
            return false;
        }
        try {
            take_bestmove(*line);
        } catch (const EngineError& e) {
            if (m_logger) {
                m_logger->write("session", std::string("Discarding late answer: ") + e.what());
            }
        }
    }
    return true;
}

std::optional<BestMove> UciClient::take_bestmove(std::string_view line) {
    try {
        auto best = parse_bestmove(line);
        if (best) {
            m_search_pending = false;
        }
        return best;
    } catch (const EngineError&) {
        m_search_pending = false;
        throw;
    }
}

void UciClient::quit(std::chrono::milliseconds grace) noexcept {
    try {
        if (m_process->is_running()) {
            if (m_logger) {
                m_logger->write(">", "quit");
            }
            if (!m_process->write_line("quit") || !m_process->wait_for_exit(grace)) {
                if (m_logger) {
                    m_logger->write("session", "Engine did not exit after 'quit', terminating");
                }
            }
        }
        m_process->terminate();
    } catch (const std::exception& e) {
        if (m_logger) {
            m_logger->write("session", std::string("Ignoring failure during quit: ") + e.what());
        }
    }
}

} // namespace chessan::uci
