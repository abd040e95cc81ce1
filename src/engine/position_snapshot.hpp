#pragma once

#include "rules/rules_engine.hpp"
#include "types.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace chessan::engine {

using rules::FenError;
using rules::Side;

// Frozen copy of a position as FEN plus its decoded fields. Immutable once
// built; copies share nothing with the board they were taken from.
class PositionSnapshot {
public:
    static constexpr std::string_view START_FEN =
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

    // Throws FenError describing the first malformed field.
    static PositionSnapshot from_fen(std::string_view fen);
    static PositionSnapshot capture(const rules::RulesEngine& board);

    const std::string& fen() const { return m_fen; }
    Side side_to_move() const { return m_side_to_move; }
    const std::string& castling() const { return m_castling; }
    const std::optional<std::string>& en_passant() const { return m_en_passant; }
    u32 halfmove_clock() const { return m_halfmove_clock; }
    u32 fullmove_number() const { return m_fullmove_number; }

    // Piece letter on a square ('.' when empty). Files and ranks are 0-based
    // from a1.
    char piece_at(u8 file, u8 rank) const;

private:
    PositionSnapshot() = default;

    std::string m_fen;
    std::array<char, 64> m_board{};
    Side m_side_to_move{Side::White};
    std::string m_castling;
    std::optional<std::string> m_en_passant;
    u32 m_halfmove_clock{0};
    u32 m_fullmove_number{1};
};

} // namespace chessan::engine
