#pragma once

#include "rules/rules_engine.hpp"
#include "uci/uci_data.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace chessan::engine {

using rules::Side;

constexpr i32 MATE_SENTINEL = 10000;
// Centipawn scores within this many of the sentinel are folded mates.
constexpr i32 MAX_MATE_DISTANCE = 100;

// Evaluation from the point of view of one side.
// Mate: value > 0 that side mates in `value` moves, value < 0 it is mated in
// -value moves, 0 it is already checkmated.
struct ScoreValue {
    enum class Kind { Centipawns, Mate, Unavailable };
    Kind kind = Kind::Unavailable;
    i32 value = 0;

    static ScoreValue centipawns(i32 cp) { return {Kind::Centipawns, cp}; }
    static ScoreValue mate_in(i32 moves) { return {Kind::Mate, moves}; }
    static ScoreValue unavailable() { return {}; }

    bool is_mate() const { return kind == Kind::Mate; }
    bool is_available() const { return kind != Kind::Unavailable; }

    bool operator==(const ScoreValue&) const = default;
};

// Engine scores are relative to the side to move of the searched position, so
// the result is already from that side's point of view. Centipawn values in
// the sentinel band are engines folding mate into cp and decode to mates.
ScoreValue normalize(const std::optional<uci::Score>& raw);

ScoreValue flip(const ScoreValue& score);

// Re-expresses `score`, given from `perspective`, from `side`'s point of view.
ScoreValue from_side(const ScoreValue& score, Side perspective, Side side);

// Mate in n becomes +/-(mate_score - |n|); nullopt when unavailable.
std::optional<i32> to_centipawns(const ScoreValue& score, i32 mate_score = MATE_SENTINEL);

std::string describe(const ScoreValue& score);

} // namespace chessan::engine
