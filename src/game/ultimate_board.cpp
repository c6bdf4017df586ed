// ultimate_board.cpp
#include "uttt/game/ultimate_board.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace uttt {
namespace game {

UltimateBoard::UltimateBoard(const core::RuleConfig& config)
    : overall_winner_(Cell::EMPTY),
      next_subgrid_(std::nullopt),
      config_(config) {
    cells_.fill(Cell::EMPTY);
    subgrid_winners_.fill(Cell::EMPTY);
}

bool UltimateBoard::is_valid_move(int row, int col) const {
    if (!UltimateRules::inBounds(row, col)) {
        return false;
    }

    // Check if move is in the forced subgrid, unless it's a free move
    int subgrid = UltimateRules::subgridOf(row, col);
    if (next_subgrid_ && *next_subgrid_ != subgrid) {
        return false;
    }

    if (config_.strict_subgrid_gating && subgrid_winners_[subgrid] != Cell::EMPTY) {
        return false;
    }

    return cells_[row * BOARD_SIZE + col] == Cell::EMPTY;
}

void UltimateBoard::update_cell(int index, Cell player) {
    if (index < 0 || index >= NUM_CELLS) {
        throw core::IllegalMoveException(
            "Index " + std::to_string(index) + " must be between 0 and 80.",
            index, core::MoveError::OUT_OF_RANGE);
    }

    auto [row, col] = UltimateRules::indexToPosition(index, BOARD_SIZE);
    check_move(row, col, player);
    apply_move(row, col, player);
}

void UltimateBoard::update_cell(int row, int col, Cell player) {
    if (!UltimateRules::inBounds(row, col)) {
        throw core::IllegalMoveException(
            "Cell (" + std::to_string(row) + ", " + std::to_string(col) + ") is outside the board.",
            -1, core::MoveError::OUT_OF_RANGE);
    }

    check_move(row, col, player);
    apply_move(row, col, player);
}

void UltimateBoard::update_cell_in_subgrid(int subgrid_index, int local_index, Cell player) {
    if (subgrid_index < 0 || subgrid_index >= NUM_SUBGRIDS) {
        throw core::IllegalMoveException("Subgrid index must be between 0 and 8.",
                                         -1, core::MoveError::OUT_OF_RANGE);
    }
    if (local_index < 0 || local_index >= NUM_SUBGRIDS) {
        throw core::IllegalMoveException("Subgrid cell index must be between 0 and 8.",
                                         -1, core::MoveError::OUT_OF_RANGE);
    }

    int index = UltimateRules::subgridCellToIndex(subgrid_index, local_index);
    auto [row, col] = UltimateRules::indexToPosition(index, BOARD_SIZE);
    check_move(row, col, player);
    apply_move(row, col, player);
}

void UltimateBoard::set_subgrid(int subgrid_index, const std::vector<std::vector<Cell>>& cells) {
    if (subgrid_index < 0 || subgrid_index >= NUM_SUBGRIDS) {
        throw core::IllegalMoveException("Subgrid index must be between 0 and 8.",
                                         -1, core::MoveError::OUT_OF_RANGE);
    }

    bool shape_ok = cells.size() == static_cast<size_t>(SUBGRID_SIZE) &&
        std::all_of(cells.begin(), cells.end(), [](const std::vector<Cell>& row) {
            return row.size() == static_cast<size_t>(SUBGRID_SIZE);
        });
    if (!shape_ok) {
        throw core::IllegalMoveException("Subgrid must be a 3x3 array.",
                                         -1, core::MoveError::INVALID_SUBGRID_SHAPE);
    }

    int row0 = (subgrid_index / SUBGRID_SIZE) * SUBGRID_SIZE;
    int col0 = (subgrid_index % SUBGRID_SIZE) * SUBGRID_SIZE;

    // Validate everything before writing anything
    for (int r = 0; r < SUBGRID_SIZE; r++) {
        for (int c = 0; c < SUBGRID_SIZE; c++) {
            Cell value = cells[r][c];
            int index = (row0 + r) * BOARD_SIZE + (col0 + c);
            if (value != Cell::EMPTY && !UltimateRules::isPlayer(value)) {
                throw core::IllegalMoveException("Cell value must be EMPTY, PLAYER1 or PLAYER2.",
                                                 index, core::MoveError::INVALID_PLAYER);
            }
            if (cells_[index] != Cell::EMPTY && cells_[index] != value) {
                throw core::IllegalMoveException(
                    "Cell at index " + std::to_string(index) + " is already occupied.",
                    index, core::MoveError::CELL_OCCUPIED_OR_WRONG_SUBGRID);
            }
        }
    }

    for (int r = 0; r < SUBGRID_SIZE; r++) {
        for (int c = 0; c < SUBGRID_SIZE; c++) {
            cells_[(row0 + r) * BOARD_SIZE + (col0 + c)] = cells[r][c];
        }
    }

    refresh_subgrid_winner(subgrid_index);
    refresh_overall_winner(Cell::PLAYER1);
    refresh_overall_winner(Cell::PLAYER2);

    if (next_subgrid_ && *next_subgrid_ == subgrid_index && !is_subgrid_open(subgrid_index)) {
        next_subgrid_ = std::nullopt;
    }
}

Cell UltimateBoard::get_cell(int index) const {
    if (index < 0 || index >= NUM_CELLS) {
        throw std::out_of_range("Index must be between 0 and 80.");
    }
    return cells_[index];
}

Cell UltimateBoard::get_cell(int row, int col) const {
    if (!UltimateRules::inBounds(row, col)) {
        throw std::out_of_range("Row and column must be between 0 and 8.");
    }
    return cells_[row * BOARD_SIZE + col];
}

UltimateBoard::SubgridCells UltimateBoard::get_subgrid(int subgrid_index) const {
    if (subgrid_index < 0 || subgrid_index >= NUM_SUBGRIDS) {
        throw std::out_of_range("Subgrid index must be between 0 and 8.");
    }

    int row0 = (subgrid_index / SUBGRID_SIZE) * SUBGRID_SIZE;
    int col0 = (subgrid_index % SUBGRID_SIZE) * SUBGRID_SIZE;

    SubgridCells result;
    for (int r = 0; r < SUBGRID_SIZE; r++) {
        for (int c = 0; c < SUBGRID_SIZE; c++) {
            result[r][c] = cells_[(row0 + r) * BOARD_SIZE + (col0 + c)];
        }
    }
    return result;
}

Cell UltimateBoard::get_subgrid_winner(int subgrid_index) const {
    if (subgrid_index < 0 || subgrid_index >= NUM_SUBGRIDS) {
        throw std::out_of_range("Subgrid index must be between 0 and 8.");
    }
    return subgrid_winners_[subgrid_index];
}

std::vector<int> UltimateBoard::get_legal_moves() const {
    std::vector<int> moves;
    for (int index = 0; index < NUM_CELLS; index++) {
        if (is_valid_move(index / BOARD_SIZE, index % BOARD_SIZE)) {
            moves.push_back(index);
        }
    }
    return moves;
}

bool UltimateBoard::is_subgrid_full(int subgrid_index) const {
    if (subgrid_index < 0 || subgrid_index >= NUM_SUBGRIDS) {
        throw std::out_of_range("Subgrid index must be between 0 and 8.");
    }
    return rules_.isSubgridFull(cells_, subgrid_index);
}

int UltimateBoard::count_stones() const noexcept {
    return static_cast<int>(std::count_if(cells_.begin(), cells_.end(),
                                          [](Cell c) { return c != Cell::EMPTY; }));
}

bool UltimateBoard::is_full() const noexcept {
    return count_stones() == NUM_CELLS;
}

bool UltimateBoard::board_equal(const UltimateBoard& other) const {
    return cells_ == other.cells_ &&
           subgrid_winners_ == other.subgrid_winners_ &&
           overall_winner_ == other.overall_winner_ &&
           next_subgrid_ == other.next_subgrid_ &&
           config_ == other.get_config();
}

void UltimateBoard::check_move(int row, int col, Cell player) const {
    int index = row * BOARD_SIZE + col;

    if (!UltimateRules::isPlayer(player)) {
        throw core::IllegalMoveException("Cell value must be PLAYER1 or PLAYER2.",
                                         index, core::MoveError::INVALID_PLAYER);
    }

    if (!is_valid_move(row, col)) {
        std::string reason = cells_[index] != Cell::EMPTY
            ? "is already occupied"
            : "is outside the playable subgrids";
        throw core::IllegalMoveException(
            "Invalid move: cell at index " + std::to_string(index) + " " + reason + ".",
            index, core::MoveError::CELL_OCCUPIED_OR_WRONG_SUBGRID);
    }
}

void UltimateBoard::apply_move(int row, int col, Cell player) {
    cells_[row * BOARD_SIZE + col] = player;
    spdlog::debug("UltimateBoard: Player {} played ({}, {})", static_cast<int>(player), row, col);

    refresh_subgrid_winner(UltimateRules::subgridOf(row, col));
    update_next_subgrid(row, col);
    refresh_overall_winner(player);
}

void UltimateBoard::refresh_subgrid_winner(int subgrid_index) {
    // First win is final
    if (subgrid_winners_[subgrid_index] != Cell::EMPTY) {
        return;
    }

    Cell winner = rules_.findSubgridWinner(cells_, subgrid_index);
    if (winner != Cell::EMPTY) {
        subgrid_winners_[subgrid_index] = winner;
        spdlog::info("UltimateBoard: Subgrid {} won by player {}",
                     subgrid_index, static_cast<int>(winner));
    }
}

void UltimateBoard::update_next_subgrid(int row, int col) {
    int target = UltimateRules::targetSubgrid(row, col);
    if (is_subgrid_open(target)) {
        next_subgrid_ = target;
    } else {
        next_subgrid_ = std::nullopt;  // Free play if the target subgrid is full or won
    }
}

void UltimateBoard::refresh_overall_winner(Cell player) {
    if (overall_winner_ != Cell::EMPTY) {
        return;
    }

    bool won = false;
    switch (config_.overall_win_policy) {
        case core::OverallWinPolicy::CELL_LINES:
            won = rules_.hasCellLine(cells_, player);
            break;
        case core::OverallWinPolicy::SUBGRID_LINES:
            won = rules_.hasSubgridLine(subgrid_winners_, player);
            break;
    }

    if (won) {
        overall_winner_ = player;
        spdlog::info("UltimateBoard: Player {} wins the game ({})", static_cast<int>(player),
                     core::overallWinPolicyToString(config_.overall_win_policy));
    }
}

bool UltimateBoard::is_subgrid_open(int subgrid_index) const {
    return subgrid_winners_[subgrid_index] == Cell::EMPTY &&
           !rules_.isSubgridFull(cells_, subgrid_index);
}

} // namespace game
} // namespace uttt
