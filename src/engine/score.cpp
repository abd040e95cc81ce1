#include "engine/score.hpp"
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace chessan::engine {

ScoreValue normalize(const std::optional<uci::Score>& raw) {
    if (!raw) {
        return ScoreValue::unavailable();
    }
    if (raw->type == uci::Score::Type::Mate) {
        return ScoreValue::mate_in(raw->value);
    }

    const i32 magnitude = std::abs(raw->value);
    if (magnitude > MATE_SENTINEL - MAX_MATE_DISTANCE && magnitude <= MATE_SENTINEL) {
        const i32 distance = std::max(1, MATE_SENTINEL - magnitude);
        return ScoreValue::mate_in(raw->value > 0 ? distance : -distance);
    }
    return ScoreValue::centipawns(raw->value);
}

ScoreValue flip(const ScoreValue& score) {
    switch (score.kind) {
        case ScoreValue::Kind::Centipawns:
            return ScoreValue::centipawns(-score.value);
        case ScoreValue::Kind::Mate:
            // Being mated now (0) flips to delivering mate "in 0", which is
            // not a position that can occur; keep it as the winning side's +1.
            return ScoreValue::mate_in(score.value == 0 ? 1 : -score.value);
        case ScoreValue::Kind::Unavailable:
            break;
    }
    return score;
}

ScoreValue from_side(const ScoreValue& score, Side perspective, Side side) {
    return perspective == side ? score : flip(score);
}

std::optional<i32> to_centipawns(const ScoreValue& score, i32 mate_score) {
    switch (score.kind) {
        case ScoreValue::Kind::Centipawns:
            return score.value;
        case ScoreValue::Kind::Mate:
            if (score.value > 0) {
                return mate_score - score.value;
            }
            return -mate_score - score.value;
        case ScoreValue::Kind::Unavailable:
            break;
    }
    return std::nullopt;
}

std::string describe(const ScoreValue& score) {
    switch (score.kind) {
        case ScoreValue::Kind::Centipawns: {
            std::stringstream ss;
            ss << std::fixed << std::setprecision(2) << std::showpos
               << static_cast<f64>(score.value) / 100.0;
            return ss.str();
        }
        case ScoreValue::Kind::Mate:
            if (score.value > 0) {
                return "Mate in " + std::to_string(score.value);
            }
            if (score.value < 0) {
                return "Mated in " + std::to_string(-score.value);
            }
            return "Mate";
        case ScoreValue::Kind::Unavailable:
            break;
    }
    return "(Not available)";
}

} // namespace chessan::engine
