#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chessan::uci {

// Score as the engine reported it: relative to the side to move.
struct Score {
    enum class Type { Centipawns, Mate };
    enum class Bound { Exact, Lower, Upper };
    Type type;
    i32 value;
    Bound bound = Bound::Exact;
};

struct WDL {
    u32 win;
    u32 draw;
    u32 loss;
};

struct InfoData {
    std::optional<u16> depth;
    std::optional<u16> seldepth;
    std::optional<Score> score;
    std::optional<u64> nodes;
    std::optional<u32> nps;
    std::optional<u32> tbhits;
    std::optional<u16> hashfull;
    std::optional<u64> time;
    std::optional<u16> multipv;
    std::vector<std::string> pv;

    std::optional<WDL> wdl;
    std::string raw_string;
    std::string currmove;
    std::optional<u16> currmovenumber;
};

// `move` is empty when the engine had nothing to play ("(none)" or "0000").
struct BestMove {
    std::optional<std::string> move;
    std::optional<std::string> ponder;
};

struct EngineId {
    std::string name;
    std::string author;
    std::vector<std::string> options;
};

struct SearchReport {
    BestMove best;
    std::optional<InfoData> last_info;
};

} // namespace chessan::uci
