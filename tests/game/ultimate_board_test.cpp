#include <gtest/gtest.h>
#include <random>
#include <tuple>
#include <vector>
#include <algorithm>
#include "uttt/game/ultimate_board.h"

namespace uttt {
namespace game {

namespace {

struct Move {
    int row;
    int col;
    Cell player;
};

const Cell X = Cell::PLAYER1;
const Cell O = Cell::PLAYER2;
const Cell E = Cell::EMPTY;

// Player 1 wins subgrid 0 at move 9; player 2 later completes its own line there
const std::vector<Move> kWonSubgridGame = {
    {0, 0, X}, {1, 0, O}, {3, 1, X}, {0, 3, O}, {0, 1, X}, {1, 3, O}, {3, 2, X}, {0, 6, O},
    {0, 2, X}, {1, 7, O}, {3, 3, X}, {1, 1, O}, {4, 3, X}, {3, 0, O}, {6, 0, X}, {1, 2, O},
};

// Player 1 fills row 4 of the big grid on the last move
const std::vector<Move> kCellLineGame = {
    {4, 0, X}, {3, 0, O}, {0, 0, X}, {1, 1, O}, {4, 3, X}, {3, 1, O}, {0, 3, X}, {1, 2, O},
    {4, 6, X}, {3, 2, O}, {0, 6, X}, {1, 0, O}, {4, 1, X}, {3, 3, O}, {4, 2, X}, {3, 6, O},
    {4, 4, X}, {3, 4, O}, {0, 4, X}, {1, 5, O}, {4, 7, X}, {3, 5, O}, {0, 7, X}, {1, 4, O},
    {4, 5, X}, {3, 7, O}, {0, 5, X}, {1, 8, O}, {4, 8, X},
};

// Player 1 wins subgrids 1, 0 and 2 in that order
const std::vector<Move> kSubgridLineGame = {
    {1, 3, X}, {3, 1, O}, {1, 5, X}, {3, 7, O}, {1, 4, X}, {3, 3, O}, {0, 2, X}, {0, 6, O},
    {0, 1, X}, {6, 6, O}, {0, 0, X}, {6, 5, O}, {2, 8, X}, {6, 8, O}, {2, 6, X}, {6, 0, O},
    {2, 7, X},
};

void play(UltimateBoard& board, const std::vector<Move>& moves, size_t count) {
    for (size_t i = 0; i < count; i++) {
        board.update_cell(moves[i].row, moves[i].col, moves[i].player);
    }
}

void play(UltimateBoard& board, const std::vector<Move>& moves) {
    play(board, moves, moves.size());
}

core::RuleConfig strictConfig() {
    core::RuleConfig config;
    config.strict_subgrid_gating = true;
    return config;
}

core::RuleConfig subgridLinesConfig(bool strict) {
    core::RuleConfig config;
    config.overall_win_policy = core::OverallWinPolicy::SUBGRID_LINES;
    config.strict_subgrid_gating = strict;
    return config;
}

} // namespace

class UltimateBoardTest : public ::testing::Test {
protected:
    void SetUp() override {
        board = std::make_unique<UltimateBoard>();
    }

    std::unique_ptr<UltimateBoard> board;
};

TEST_F(UltimateBoardTest, InitialState) {
    EXPECT_EQ(board->get_config(), core::RuleConfig());
    EXPECT_EQ(board->count_stones(), 0);
    EXPECT_FALSE(board->is_full());
    EXPECT_EQ(board->get_overall_winner(), Cell::EMPTY);
    EXPECT_FALSE(board->get_next_subgrid().has_value());

    for (int s = 0; s < NUM_SUBGRIDS; s++) {
        EXPECT_EQ(board->get_subgrid_winner(s), Cell::EMPTY);
        EXPECT_FALSE(board->is_subgrid_full(s));
    }

    // Every cell is playable on an empty board
    EXPECT_EQ(board->get_legal_moves().size(), static_cast<size_t>(NUM_CELLS));
    EXPECT_TRUE(board->is_valid_move(0, 0));
    EXPECT_TRUE(board->is_valid_move(8, 8));
}

TEST_F(UltimateBoardTest, FirstMoveForcesSubgrid) {
    board->update_cell(0, Cell::PLAYER1);

    EXPECT_EQ(board->get_cell(0), Cell::PLAYER1);
    EXPECT_EQ(board->get_cell(0, 0), Cell::PLAYER1);
    ASSERT_TRUE(board->get_next_subgrid().has_value());
    EXPECT_EQ(*board->get_next_subgrid(), 0);

    // Only the 8 remaining cells of subgrid 0 are playable
    auto moves = board->get_legal_moves();
    std::vector<int> expected = {1, 2, 9, 10, 11, 18, 19, 20};
    EXPECT_EQ(moves, expected);

    EXPECT_FALSE(board->is_valid_move(4, 4));
    EXPECT_TRUE(board->is_valid_move(1, 1));
}

TEST_F(UltimateBoardTest, CenterMoveForcesCenterSubgrid) {
    board->update_cell(4, 4, Cell::PLAYER1);
    ASSERT_TRUE(board->get_next_subgrid().has_value());
    EXPECT_EQ(*board->get_next_subgrid(), 4);

    // Local position (0, 2) sends the opponent to subgrid 2
    board->update_cell(3, 5, Cell::PLAYER2);
    EXPECT_EQ(*board->get_next_subgrid(), 2);
}

TEST_F(UltimateBoardTest, OutOfRangeIndex) {
    try {
        board->update_cell(85, Cell::PLAYER1);
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::OUT_OF_RANGE);
        EXPECT_EQ(e.getAction(), 85);
    }

    try {
        board->update_cell(-1, Cell::PLAYER1);
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::OUT_OF_RANGE);
    }

    try {
        board->update_cell(9, 0, Cell::PLAYER1);
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::OUT_OF_RANGE);
        EXPECT_EQ(e.getAction(), -1);
    }

    // Nothing changed
    EXPECT_EQ(board->count_stones(), 0);
    EXPECT_FALSE(board->get_next_subgrid().has_value());
}

TEST_F(UltimateBoardTest, InvalidPlayer) {
    try {
        board->update_cell(40, Cell::EMPTY);
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::INVALID_PLAYER);
    }

    EXPECT_THROW(board->update_cell(40, static_cast<Cell>(3)), core::IllegalMoveException);
    EXPECT_EQ(board->count_stones(), 0);
}

TEST_F(UltimateBoardTest, OccupiedCellRejected) {
    board->update_cell(4, 4, Cell::PLAYER1);

    try {
        board->update_cell(4, 4, Cell::PLAYER2);
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::CELL_OCCUPIED_OR_WRONG_SUBGRID);
        EXPECT_EQ(e.getAction(), 40);
    }

    EXPECT_EQ(board->get_cell(4, 4), Cell::PLAYER1);
    EXPECT_EQ(board->count_stones(), 1);
}

TEST_F(UltimateBoardTest, WrongSubgridRejected) {
    board->update_cell(0, Cell::PLAYER1);

    try {
        board->update_cell(40, Cell::PLAYER2);
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::CELL_OCCUPIED_OR_WRONG_SUBGRID);
    }

    // The constraint is untouched by the failed attempt
    EXPECT_EQ(*board->get_next_subgrid(), 0);
    EXPECT_EQ(board->get_cell(40), Cell::EMPTY);
}

TEST_F(UltimateBoardTest, NextSubgridTrace) {
    std::vector<std::optional<int>> expected = {
        0, 3, 1, 0, 1, 3, 2, 0, 2, 4, std::nullopt, 4, 3, std::nullopt, std::nullopt, 5
    };

    for (size_t i = 0; i < kWonSubgridGame.size(); i++) {
        const auto& m = kWonSubgridGame[i];
        board->update_cell(m.row, m.col, m.player);
        EXPECT_EQ(board->get_next_subgrid(), expected[i]) << "after move " << i + 1;
    }
}

TEST_F(UltimateBoardTest, SubgridWinRecorded) {
    play(*board, kWonSubgridGame, 8);
    EXPECT_EQ(board->get_subgrid_winner(0), Cell::EMPTY);

    // Completes the top row of subgrid 0
    board->update_cell(0, 2, Cell::PLAYER1);
    EXPECT_EQ(board->get_subgrid_winner(0), Cell::PLAYER1);
    EXPECT_EQ(board->get_overall_winner(), Cell::EMPTY);

    // Sending a player to a won subgrid frees the next move
    board->update_cell(1, 7, Cell::PLAYER2);
    board->update_cell(3, 3, Cell::PLAYER1);
    EXPECT_FALSE(board->get_next_subgrid().has_value());
}

TEST_F(UltimateBoardTest, MovesIntoWonSubgridAllowedByDefault) {
    play(*board, kWonSubgridGame, 11);
    EXPECT_EQ(board->get_legal_moves().size(), 70u);
    EXPECT_TRUE(board->is_valid_move(1, 1));

    board->update_cell(1, 1, Cell::PLAYER2);
    EXPECT_EQ(board->get_cell(1, 1), Cell::PLAYER2);
    EXPECT_EQ(*board->get_next_subgrid(), 4);
}

TEST_F(UltimateBoardTest, SubgridWinnerIsWriteOnce) {
    play(*board, kWonSubgridGame);

    // Player 2 now holds row 1 of subgrid 0, but the first win stands
    auto sub = board->get_subgrid(0);
    EXPECT_EQ(sub[1][0], Cell::PLAYER2);
    EXPECT_EQ(sub[1][1], Cell::PLAYER2);
    EXPECT_EQ(sub[1][2], Cell::PLAYER2);
    EXPECT_EQ(board->get_subgrid_winner(0), Cell::PLAYER1);

    const auto& winners = board->get_subgrid_winners();
    for (int s = 1; s < NUM_SUBGRIDS; s++) {
        EXPECT_EQ(winners[s], Cell::EMPTY);
    }
}

TEST_F(UltimateBoardTest, StrictGatingRejectsWonSubgrid) {
    UltimateBoard strict(strictConfig());
    EXPECT_EQ(strict.get_config(), strictConfig());
    play(strict, kWonSubgridGame, 11);

    EXPECT_FALSE(strict.is_valid_move(1, 1));
    EXPECT_EQ(strict.get_legal_moves().size(), 65u);

    try {
        strict.update_cell(1, 1, Cell::PLAYER2);
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::CELL_OCCUPIED_OR_WRONG_SUBGRID);
    }
    EXPECT_EQ(strict.get_cell(1, 1), Cell::EMPTY);
}

TEST_F(UltimateBoardTest, CellLineWinsGame) {
    play(*board, kCellLineGame, kCellLineGame.size() - 1);
    EXPECT_EQ(board->get_overall_winner(), Cell::EMPTY);

    board->update_cell(4, 8, Cell::PLAYER1);
    EXPECT_EQ(board->get_overall_winner(), Cell::PLAYER1);

    // Player 2 holds more subgrids, but subgrid count does not decide the game
    SubgridStatuses expected = {O, X, E, O, O, X, E, E, E};
    EXPECT_EQ(board->get_subgrid_winners(), expected);
}

TEST_F(UltimateBoardTest, StrictGatingBlocksCellLineGame) {
    UltimateBoard strict(strictConfig());
    play(strict, kCellLineGame, 12);

    // Subgrid 3 already belongs to player 2
    EXPECT_EQ(strict.get_subgrid_winner(3), Cell::PLAYER2);
    EXPECT_THROW(strict.update_cell(4, 1, Cell::PLAYER1), core::IllegalMoveException);
}

TEST_F(UltimateBoardTest, SubgridLinePolicy) {
    UltimateBoard meta(subgridLinesConfig(false));
    play(meta, kSubgridLineGame, kSubgridLineGame.size() - 1);
    EXPECT_EQ(meta.get_subgrid_winner(0), Cell::PLAYER1);
    EXPECT_EQ(meta.get_subgrid_winner(1), Cell::PLAYER1);
    EXPECT_EQ(meta.get_overall_winner(), Cell::EMPTY);

    meta.update_cell(2, 7, Cell::PLAYER1);
    EXPECT_EQ(meta.get_subgrid_winner(2), Cell::PLAYER1);
    EXPECT_EQ(meta.get_overall_winner(), Cell::PLAYER1);
    EXPECT_EQ(*meta.get_next_subgrid(), 7);

    // The same game under strict gating
    UltimateBoard strictMeta(subgridLinesConfig(true));
    play(strictMeta, kSubgridLineGame);
    EXPECT_EQ(strictMeta.get_overall_winner(), Cell::PLAYER1);

    // Cell lines ignore won subgrids
    play(*board, kSubgridLineGame);
    EXPECT_EQ(board->get_overall_winner(), Cell::EMPTY);
}

TEST_F(UltimateBoardTest, MovesAcceptedAfterOverallWin) {
    play(*board, kCellLineGame);
    ASSERT_EQ(board->get_overall_winner(), Cell::PLAYER1);

    // The board keeps applying moves; the winner does not change
    auto moves = board->get_legal_moves();
    ASSERT_FALSE(moves.empty());
    board->update_cell(moves.front(), Cell::PLAYER2);
    EXPECT_EQ(board->get_cell(moves.front()), Cell::PLAYER2);
    EXPECT_EQ(board->get_overall_winner(), Cell::PLAYER1);
}

TEST_F(UltimateBoardTest, UpdateCellInSubgrid) {
    board->update_cell_in_subgrid(4, 8, Cell::PLAYER1);
    EXPECT_EQ(board->get_cell(5, 5), Cell::PLAYER1);
    EXPECT_EQ(*board->get_next_subgrid(), 8);

    try {
        board->update_cell_in_subgrid(9, 0, Cell::PLAYER2);
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::OUT_OF_RANGE);
    }

    try {
        board->update_cell_in_subgrid(8, 9, Cell::PLAYER2);
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::OUT_OF_RANGE);
    }

    // Same forcing rule as flat indices
    EXPECT_THROW(board->update_cell_in_subgrid(0, 0, Cell::PLAYER2), core::IllegalMoveException);
    board->update_cell_in_subgrid(8, 0, Cell::PLAYER2);
    EXPECT_EQ(board->get_cell(6, 6), Cell::PLAYER2);
}

TEST_F(UltimateBoardTest, SetSubgrid) {
    board->set_subgrid(2, {{X, X, X}, {O, O, E}, {E, E, E}});

    EXPECT_EQ(board->get_cell(0, 6), Cell::PLAYER1);
    EXPECT_EQ(board->get_cell(1, 7), Cell::PLAYER2);
    EXPECT_EQ(board->get_subgrid_winner(2), Cell::PLAYER1);
    EXPECT_EQ(board->count_stones(), 5);

    // Rewriting the same marks and filling empties is allowed
    board->set_subgrid(2, {{X, X, X}, {O, O, O}, {E, E, E}});
    EXPECT_EQ(board->get_cell(1, 8), Cell::PLAYER2);
    EXPECT_EQ(board->get_subgrid_winner(2), Cell::PLAYER1);
}

TEST_F(UltimateBoardTest, SetSubgridErrors) {
    try {
        board->set_subgrid(9, {{E, E, E}, {E, E, E}, {E, E, E}});
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::OUT_OF_RANGE);
    }

    try {
        board->set_subgrid(0, {{E, E, E}, {E, E, E}});
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::INVALID_SUBGRID_SHAPE);
    }

    try {
        board->set_subgrid(0, {{E, E, E}, {E, E}, {E, E, E}});
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::INVALID_SUBGRID_SHAPE);
    }

    try {
        board->set_subgrid(0, {{E, X, E}, {E, static_cast<Cell>(7), E}, {E, E, E}});
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::INVALID_PLAYER);
    }
    // Validation happens before any write
    EXPECT_EQ(board->get_cell(0, 1), Cell::EMPTY);

    board->update_cell(0, 0, Cell::PLAYER1);
    try {
        board->set_subgrid(0, {{O, E, E}, {E, E, E}, {E, E, E}});
        FAIL() << "Expected IllegalMoveException";
    } catch (const core::IllegalMoveException& e) {
        EXPECT_EQ(e.getError(), core::MoveError::CELL_OCCUPIED_OR_WRONG_SUBGRID);
    }
    EXPECT_EQ(board->get_cell(0, 0), Cell::PLAYER1);
}

TEST_F(UltimateBoardTest, FullSubgridFreesNextMove) {
    // Full, with no line for either player
    board->set_subgrid(4, {{X, O, X}, {X, O, O}, {O, X, X}});
    EXPECT_TRUE(board->is_subgrid_full(4));
    EXPECT_EQ(board->get_subgrid_winner(4), Cell::EMPTY);

    // Local centre points at subgrid 4, which has no room
    board->update_cell(1, 1, Cell::PLAYER1);
    EXPECT_FALSE(board->get_next_subgrid().has_value());
    EXPECT_EQ(board->get_legal_moves().size(), static_cast<size_t>(NUM_CELLS - 10));
}

TEST_F(UltimateBoardTest, SetSubgridClosingForcedSubgridFreesNextMove) {
    board->update_cell(4, 4, Cell::PLAYER1);
    ASSERT_EQ(*board->get_next_subgrid(), 4);

    board->set_subgrid(4, {{O, O, O}, {E, X, E}, {E, E, E}});
    EXPECT_EQ(board->get_subgrid_winner(4), Cell::PLAYER2);
    EXPECT_FALSE(board->get_next_subgrid().has_value());
}

TEST_F(UltimateBoardTest, QueryErrors) {
    EXPECT_THROW(board->get_cell(81), std::out_of_range);
    EXPECT_THROW(board->get_cell(-1, 0), std::out_of_range);
    EXPECT_THROW(board->get_subgrid(9), std::out_of_range);
    EXPECT_THROW(board->get_subgrid_winner(-1), std::out_of_range);
    EXPECT_THROW(board->is_subgrid_full(9), std::out_of_range);
}

TEST_F(UltimateBoardTest, RandomPlayoutInvariants) {
    std::mt19937 rng(12345);

    for (int game = 0; game < 20; game++) {
        UltimateBoard b(game % 2 == 0 ? core::RuleConfig() : strictConfig());
        Cell player = Cell::PLAYER1;

        while (true) {
            auto moves = b.get_legal_moves();
            if (moves.empty()) {
                break;
            }

            // Queries do not change anything
            EXPECT_EQ(b.get_legal_moves(), moves);

            // A cell outside the legal list is rejected without side effects
            for (int index = 0; index < NUM_CELLS; index++) {
                if (std::find(moves.begin(), moves.end(), index) == moves.end()) {
                    Grid before = b.get_grid();
                    EXPECT_THROW(b.update_cell(index, player), core::IllegalMoveException);
                    EXPECT_EQ(b.get_grid(), before);
                    break;
                }
            }

            Grid before = b.get_grid();
            SubgridStatuses winnersBefore = b.get_subgrid_winners();
            Cell overallBefore = b.get_overall_winner();

            std::uniform_int_distribution<size_t> pick(0, moves.size() - 1);
            int index = moves[pick(rng)];
            b.update_cell(index, player);

            // Exactly one cell changed, from empty to the mover
            for (int i = 0; i < NUM_CELLS; i++) {
                if (i == index) {
                    EXPECT_EQ(before[i], Cell::EMPTY);
                    EXPECT_EQ(b.get_cell(i), player);
                } else {
                    EXPECT_EQ(b.get_cell(i), before[i]);
                }
            }

            // Recorded winners never change
            for (int s = 0; s < NUM_SUBGRIDS; s++) {
                if (winnersBefore[s] != Cell::EMPTY) {
                    EXPECT_EQ(b.get_subgrid_winner(s), winnersBefore[s]);
                }
            }
            if (overallBefore != Cell::EMPTY) {
                EXPECT_EQ(b.get_overall_winner(), overallBefore);
            }

            // Constraint follows the local position unless that subgrid is closed
            int target = UltimateRules::targetSubgrid(index / BOARD_SIZE, index % BOARD_SIZE);
            bool closed = b.get_subgrid_winner(target) != Cell::EMPTY || b.is_subgrid_full(target);
            if (closed) {
                EXPECT_FALSE(b.get_next_subgrid().has_value());
            } else {
                ASSERT_TRUE(b.get_next_subgrid().has_value());
                EXPECT_EQ(*b.get_next_subgrid(), target);
            }

            player = (player == Cell::PLAYER1) ? Cell::PLAYER2 : Cell::PLAYER1;
        }
    }
}

} // namespace game
} // namespace uttt
