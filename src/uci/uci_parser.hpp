#pragma once

#include "uci_data.hpp"
#include "uci_error.hpp"
#include "types.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chessan::uci {

std::optional<InfoData> parse_line(std::string_view line);
std::optional<BestMove> parse_bestmove(std::string_view line);
bool parse_id(std::string_view line, EngineId& id);
bool is_uci_move(std::string_view token);

namespace detail {

std::optional<InfoData> parse_info_search(std::string_view line);
std::vector<std::string_view> split(std::string_view str, char delimiter);
std::optional<Score> parse_score(std::string_view type, std::string_view value);

template <typename T>
std::optional<T> parse_unsigned(std::string_view sv) {
    T value{};
    auto result = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    return (result.ec == std::errc() && result.ptr == sv.data() + sv.size())
               ? std::optional(value)
               : std::nullopt;
}

template <typename T>
std::optional<T> parse_signed(std::string_view sv) {
    T value{};
    auto result = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    return (result.ec == std::errc() && result.ptr == sv.data() + sv.size())
               ? std::optional(value)
               : std::nullopt;
}

} // namespace detail

inline std::optional<InfoData> parse_line(std::string_view line) {
    if (line.starts_with("info string")) {
        InfoData data;
        data.raw_string = line;
        return data;
    }
    if (line == "info" || line.starts_with("info ")) {
        return detail::parse_info_search(line);
    }
    return std::nullopt;
}

inline bool is_uci_move(std::string_view token) {
    if (token.size() != 4 && token.size() != 5) {
        return false;
    }
    auto is_file = [](char c) { return c >= 'a' && c <= 'h'; };
    auto is_rank = [](char c) { return c >= '1' && c <= '8'; };
    if (!is_file(token[0]) || !is_rank(token[1]) || !is_file(token[2]) || !is_rank(token[3])) {
        return false;
    }
    if (token.size() == 5) {
        char promo = token[4];
        return promo == 'q' || promo == 'r' || promo == 'b' || promo == 'n';
    }
    return true;
}

// nullopt for lines that are not "bestmove" lines at all; a bestmove line
// that carries no usable move is a protocol violation.
inline std::optional<BestMove> parse_bestmove(std::string_view line) {
    if (line != "bestmove" && !line.starts_with("bestmove ")) {
        return std::nullopt;
    }

    auto tokens = detail::split(line, ' ');
    if (tokens.size() < 2) {
        throw EngineError(ErrorKind::ProtocolViolation,
                          "Engine sent 'bestmove' without a move");
    }

    BestMove best;
    const auto move = tokens[1];
    if (move == "(none)" || move == "0000") {
        return best;
    }
    if (!is_uci_move(move)) {
        throw EngineError(ErrorKind::ProtocolViolation,
                          "Engine sent malformed best move '" + std::string(move) + "'");
    }
    best.move = std::string(move);

    if (tokens.size() >= 4 && tokens[2] == "ponder" && is_uci_move(tokens[3])) {
        best.ponder = std::string(tokens[3]);
    }
    return best;
}

inline bool parse_id(std::string_view line, EngineId& id) {
    constexpr std::string_view ID_NAME = "id name ";
    constexpr std::string_view ID_AUTHOR = "id author ";
    constexpr std::string_view OPTION_NAME = "option name ";

    if (line.starts_with(ID_NAME)) {
        id.name = line.substr(ID_NAME.size());
        return true;
    }
    if (line.starts_with(ID_AUTHOR)) {
        id.author = line.substr(ID_AUTHOR.size());
        return true;
    }
    if (line.starts_with(OPTION_NAME)) {
        auto rest = line.substr(OPTION_NAME.size());
        auto type_pos = rest.find(" type ");
        id.options.emplace_back(rest.substr(0, type_pos));
        return true;
    }
    return false;
}

namespace detail {

inline std::optional<InfoData> parse_info_search(std::string_view line) {
    InfoData data;
    data.raw_string = line;
    std::vector<std::string_view> tokens = split(line, ' ');

    for (u64 i = 1; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token == "depth" && i + 1 < tokens.size()) {
            data.depth = parse_unsigned<u16>(tokens[++i]);
        } else if (token == "seldepth" && i + 1 < tokens.size()) {
            data.seldepth = parse_unsigned<u16>(tokens[++i]);
        } else if (token == "score" && i + 2 < tokens.size()) {
            data.score = parse_score(tokens[i + 1], tokens[i + 2]);
            i += 2;
            if (data.score && i + 1 < tokens.size()) {
                if (tokens[i + 1] == "lowerbound") {
                    data.score->bound = Score::Bound::Lower;
                    ++i;
                } else if (tokens[i + 1] == "upperbound") {
                    data.score->bound = Score::Bound::Upper;
                    ++i;
                }
            }
        } else if (token == "nodes" && i + 1 < tokens.size()) {
            data.nodes = parse_unsigned<u64>(tokens[++i]);
        } else if (token == "nps" && i + 1 < tokens.size()) {
            data.nps = parse_unsigned<u32>(tokens[++i]);
        } else if (token == "hashfull" && i + 1 < tokens.size()) {
            data.hashfull = parse_unsigned<u16>(tokens[++i]);
        } else if (token == "tbhits" && i + 1 < tokens.size()) {
            data.tbhits = parse_unsigned<u32>(tokens[++i]);
        } else if (token == "time" && i + 1 < tokens.size()) {
            data.time = parse_unsigned<u64>(tokens[++i]);
        } else if (token == "multipv" && i + 1 < tokens.size()) {
            data.multipv = parse_unsigned<u16>(tokens[++i]);
        } else if (token == "currmove" && i + 1 < tokens.size()) {
            data.currmove = std::string(tokens[++i]);
        } else if (token == "currmovenumber" && i + 1 < tokens.size()) {
            data.currmovenumber = parse_unsigned<u16>(tokens[++i]);
        } else if (token == "wdl" && i + 3 < tokens.size()) {
            auto w = parse_unsigned<u32>(tokens[i + 1]);
            auto d = parse_unsigned<u32>(tokens[i + 2]);
            auto l = parse_unsigned<u32>(tokens[i + 3]);
            if (w && d && l) {
                data.wdl = WDL{*w, *d, *l};
            }
            i += 3;
        } else if (token == "string") {
            break;
        } else if (token == "pv") {
            for (u64 j = i + 1; j < tokens.size(); ++j) {
                data.pv.emplace_back(tokens[j]);
            }
            break;
        }
    }
    return data;
}

// Runs of delimiters collapse; UCI allows arbitrary whitespace between tokens.
inline std::vector<std::string_view> split(std::string_view str, char delimiter) {
    std::vector<std::string_view> result;
    u64 start = 0;
    u64 end = str.find(delimiter);
    while (end != std::string_view::npos) {
        if (end > start) {
            result.push_back(str.substr(start, end - start));
        }
        start = end + 1;
        end = str.find(delimiter, start);
    }
    if (start < str.size()) {
        result.push_back(str.substr(start));
    }
    return result;
}

inline std::optional<Score> parse_score(std::string_view type, std::string_view value) {
    auto parsed = parse_signed<i32>(value);
    if (!parsed) {
        return std::nullopt;
    }
    if (type == "cp") {
        return Score{Score::Type::Centipawns, *parsed};
    }
    if (type == "mate") {
        return Score{Score::Type::Mate, *parsed};
    }
    return std::nullopt;
}

} // namespace detail

} // namespace chessan::uci
