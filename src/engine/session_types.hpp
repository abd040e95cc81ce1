#pragma once

#include "engine/position_snapshot.hpp"
#include "engine/score.hpp"
#include "uci/uci_error.hpp"
#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace chessan::engine {

using uci::EngineError;
using uci::ErrorKind;

struct AnalysisRequest {
    PositionSnapshot position;
    std::chrono::milliseconds time_budget;
};

struct AnalysisResult {
    // nullopt when the analyzed side has no legal move.
    std::optional<std::string> best_move;
    ScoreValue score;
    Side perspective{Side::White};
    std::string fen;
    std::vector<std::string> pv;
    std::optional<u16> depth;
};

struct ConnectRequest {
    std::string executable;
};

struct AnalyzeRequest {
    AnalysisRequest analysis;
};

struct ShutdownRequest {};

using Request = std::variant<ConnectRequest, AnalyzeRequest, ShutdownRequest>;

struct ConnectSucceeded {
    std::string executable;
    std::string engine_name;
};

struct ConnectFailed {
    ErrorKind kind;
    std::string reason;
};

struct AnalysisCompleted {
    AnalysisResult result;
};

struct OperationFailed {
    ErrorKind kind;
    std::string reason;
};

using SessionEvent = std::variant<ConnectSucceeded, ConnectFailed, AnalysisCompleted, OperationFailed>;

enum class SessionState { Disconnected, Connecting, Idle, Analyzing };

inline std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Idle: return "Idle";
        case SessionState::Analyzing: return "Analyzing";
    }
    return "Unknown";
}

struct SessionConfig {
    u64 queue_capacity = 16;
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds sync_timeout{2000};
    u32 watchdog_factor = 3;
    std::chrono::milliseconds watchdog_margin{5000};
    std::chrono::milliseconds quit_grace{2000};
    std::vector<std::pair<std::string, std::string>> uci_options;
};

} // namespace chessan::engine
