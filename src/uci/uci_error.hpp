#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace chessan::uci {

enum class ErrorKind {
    InvalidExecutable,
    HandshakeTimeout,
    ProtocolViolation,
    ProcessCrashed,
    NotConnected,
    SearchTimeout,
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidExecutable: return "invalid executable";
        case ErrorKind::HandshakeTimeout: return "handshake timeout";
        case ErrorKind::ProtocolViolation: return "protocol violation";
        case ErrorKind::ProcessCrashed: return "process crashed";
        case ErrorKind::NotConnected: return "not connected";
        case ErrorKind::SearchTimeout: return "search timeout";
    }
    return "unknown";
}

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace chessan::uci
