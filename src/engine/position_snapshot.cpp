#include "engine/position_snapshot.hpp"
#include "uci/uci_parser.hpp"
#include <vector>

namespace chessan::engine {

namespace {

constexpr std::string_view PIECE_LETTERS = "pnbrqkPNBRQK";

std::vector<std::string_view> split_fields(std::string_view fen) {
    std::vector<std::string_view> fields;
    u64 pos = 0;
    while (pos < fen.size()) {
        while (pos < fen.size() && (fen[pos] == ' ' || fen[pos] == '\t')) {
            ++pos;
        }
        u64 end = pos;
        while (end < fen.size() && fen[end] != ' ' && fen[end] != '\t') {
            ++end;
        }
        if (end > pos) {
            fields.push_back(fen.substr(pos, end - pos));
        }
        pos = end;
    }
    return fields;
}

u32 parse_counter(std::string_view field, const char* name) {
    auto value = uci::detail::parse_unsigned<u32>(field);
    if (!value) {
        throw FenError(std::string("Invalid ") + name + " '" + std::string(field) + "'");
    }
    return *value;
}

} // namespace

PositionSnapshot PositionSnapshot::from_fen(std::string_view fen) {
    auto fields = split_fields(fen);
    if (fields.size() < 4 || fields.size() > 6) {
        throw FenError("FEN must have 4 to 6 space-separated fields, got " +
                       std::to_string(fields.size()));
    }

    PositionSnapshot snapshot;
    snapshot.m_board.fill('.');

    u8 rank = 7;
    u8 file = 0;
    for (char c : fields[0]) {
        if (c == '/') {
            if (file != 8 || rank == 0) {
                throw FenError("Malformed piece placement '" + std::string(fields[0]) + "'");
            }
            --rank;
            file = 0;
        } else if (c >= '1' && c <= '8') {
            file += static_cast<u8>(c - '0');
            if (file > 8) {
                throw FenError("Rank " + std::to_string(rank + 1) + " covers more than 8 files");
            }
        } else if (PIECE_LETTERS.find(c) != std::string_view::npos) {
            if (file >= 8) {
                throw FenError("Rank " + std::to_string(rank + 1) + " covers more than 8 files");
            }
            snapshot.m_board[rank * 8 + file] = c;
            ++file;
        } else {
            throw FenError(std::string("Unexpected character '") + c + "' in piece placement");
        }
    }
    if (rank != 0 || file != 8) {
        throw FenError("Piece placement must describe exactly 8 ranks of 8 files");
    }

    if (fields[1] == "w") {
        snapshot.m_side_to_move = Side::White;
    } else if (fields[1] == "b") {
        snapshot.m_side_to_move = Side::Black;
    } else {
        throw FenError("Side to move must be 'w' or 'b', got '" + std::string(fields[1]) + "'");
    }

    if (fields[2] != "-") {
        std::string seen;
        for (char c : fields[2]) {
            if (std::string_view("KQkq").find(c) == std::string_view::npos ||
                seen.find(c) != std::string::npos) {
                throw FenError("Invalid castling rights '" + std::string(fields[2]) + "'");
            }
            seen.push_back(c);
        }
    }
    snapshot.m_castling = fields[2];

    if (fields[3] != "-") {
        const auto ep = fields[3];
        const char expected_rank = snapshot.m_side_to_move == Side::White ? '6' : '3';
        if (ep.size() != 2 || ep[0] < 'a' || ep[0] > 'h' || ep[1] != expected_rank) {
            throw FenError("Invalid en passant square '" + std::string(ep) + "'");
        }
        snapshot.m_en_passant = std::string(ep);
    }

    if (fields.size() >= 5) {
        snapshot.m_halfmove_clock = parse_counter(fields[4], "half-move clock");
    }
    if (fields.size() == 6) {
        snapshot.m_fullmove_number = parse_counter(fields[5], "full-move number");
    }

    snapshot.m_fen = std::string(fields[0]) + " " + std::string(fields[1]) + " " +
                     snapshot.m_castling + " " + std::string(fields[3]) + " " +
                     std::to_string(snapshot.m_halfmove_clock) + " " +
                     std::to_string(snapshot.m_fullmove_number);
    return snapshot;
}

PositionSnapshot PositionSnapshot::capture(const rules::RulesEngine& board) {
    return from_fen(board.fen());
}

char PositionSnapshot::piece_at(u8 file, u8 rank) const {
    if (file > 7 || rank > 7) {
        return '.';
    }
    return m_board[rank * 8 + file];
}

} // namespace chessan::engine
