#include "engine/position_snapshot.hpp"
#include "fake_rules_engine.hpp"
#include <gtest/gtest.h>

using namespace chessan;
using engine::PositionSnapshot;

namespace {

constexpr const char* AFTER_E4 = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1";

} // namespace

TEST(PositionSnapshotTest, ParsesStartPosition) {
    auto snapshot = PositionSnapshot::from_fen(PositionSnapshot::START_FEN);
    EXPECT_EQ(snapshot.fen(), PositionSnapshot::START_FEN);
    EXPECT_EQ(snapshot.side_to_move(), engine::Side::White);
    EXPECT_EQ(snapshot.castling(), "KQkq");
    EXPECT_FALSE(snapshot.en_passant().has_value());
    EXPECT_EQ(snapshot.halfmove_clock(), 0u);
    EXPECT_EQ(snapshot.fullmove_number(), 1u);
    EXPECT_EQ(snapshot.piece_at(4, 0), 'K');
    EXPECT_EQ(snapshot.piece_at(3, 7), 'q');
    EXPECT_EQ(snapshot.piece_at(4, 4), '.');
}

TEST(PositionSnapshotTest, ParsesBlackToMoveWithEnPassant) {
    auto snapshot = PositionSnapshot::from_fen(AFTER_E4);
    EXPECT_EQ(snapshot.side_to_move(), engine::Side::Black);
    EXPECT_EQ(snapshot.en_passant(), "e3");
    EXPECT_EQ(snapshot.piece_at(4, 3), 'P');
}

TEST(PositionSnapshotTest, MissingCountersDefault) {
    auto snapshot = PositionSnapshot::from_fen("8/8/8/8/8/8/8/K6k w - -");
    EXPECT_EQ(snapshot.halfmove_clock(), 0u);
    EXPECT_EQ(snapshot.fullmove_number(), 1u);
    EXPECT_EQ(snapshot.fen(), "8/8/8/8/8/8/8/K6k w - - 0 1");
}

TEST(PositionSnapshotTest, RejectsMalformedFen) {
    const char* invalid[] = {
        "",
        "not a fen",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1",
        "rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
        "rnbqkbnr/ppppxppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkx - 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KKq - 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq e3 0 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - -1 1",
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1 extra",
    };
    for (const char* fen : invalid) {
        EXPECT_THROW(PositionSnapshot::from_fen(fen), engine::FenError) << fen;
    }
}

TEST(PositionSnapshotTest, CaptureDoesNotFollowLaterBoardChanges) {
    test::FakeRulesEngine board{std::string(PositionSnapshot::START_FEN)};
    board.add_transition(std::string(PositionSnapshot::START_FEN), "e2e4", AFTER_E4);

    auto before = PositionSnapshot::capture(board);
    ASSERT_TRUE(board.apply_move("e2e4"));
    auto after = PositionSnapshot::capture(board);

    EXPECT_EQ(before.fen(), PositionSnapshot::START_FEN);
    EXPECT_EQ(before.side_to_move(), engine::Side::White);
    EXPECT_EQ(after.fen(), AFTER_E4);
    EXPECT_EQ(after.side_to_move(), engine::Side::Black);
}

TEST(PositionSnapshotTest, CopiesAreIndependentValues) {
    auto original = PositionSnapshot::from_fen(AFTER_E4);
    auto copy = original;
    original = PositionSnapshot::from_fen(PositionSnapshot::START_FEN);
    EXPECT_EQ(copy.fen(), AFTER_E4);
}
