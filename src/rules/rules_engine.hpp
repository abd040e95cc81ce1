#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace chessan::rules {

enum class Side { White, Black };

inline Side opposite(Side side) {
    return side == Side::White ? Side::Black : Side::White;
}

inline std::string_view to_string(Side side) {
    return side == Side::White ? "White" : "Black";
}

class FenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Game-rule collaborator (legal moves, move application, FEN round-trips).
// The analysis core never implements chess rules; it only reads `fen()` and
// `turn()` to freeze a position before handing it to the engine worker.
class RulesEngine {
public:
    virtual ~RulesEngine() = default;

    virtual std::vector<std::string> legal_moves() const = 0;

    // False when `uci_move` is not legal in the current position.
    virtual bool apply_move(std::string_view uci_move) = 0;

    // Throws FenError on malformed input and leaves the position unchanged.
    virtual void set_fen(std::string_view fen) = 0;

    virtual std::string fen() const = 0;
    virtual Side turn() const = 0;
};

} // namespace chessan::rules
