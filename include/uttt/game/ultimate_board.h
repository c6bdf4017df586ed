// ultimate_board.h
#ifndef UTTT_ULTIMATE_BOARD_H
#define UTTT_ULTIMATE_BOARD_H

#include <array>
#include <vector>
#include <optional>

#include "uttt/core/igamestate.h"
#include "uttt/core/rule_config.h"
#include "uttt/game/ultimate_rules.h"

namespace uttt {
namespace game {

/**
 * @brief Authoritative Ultimate Tic-Tac-Toe board
 *
 * Owns the 9x9 grid, the per-subgrid winners, the overall winner and the
 * subgrid the next move is forced into. All mutation goes through
 * update_cell / update_cell_in_subgrid / set_subgrid; a failed call leaves
 * the board untouched.
 *
 * The board does not track turns and does not stop accepting moves once
 * an overall winner is recorded; that is left to the caller.
 */
class UltimateBoard {
public:
    using SubgridCells = std::array<std::array<Cell, SUBGRID_SIZE>, SUBGRID_SIZE>;

    /**
     * @brief Create an empty, unconstrained board
     *
     * @param config Rule variants to apply
     */
    explicit UltimateBoard(const core::RuleConfig& config = core::RuleConfig());

    /**
     * @brief Check whether a cell may be played under the current constraint
     *
     * Out-of-range coordinates are never valid.
     */
    bool is_valid_move(int row, int col) const;

    /**
     * @brief Place a player's mark using a flat index (0-80)
     *
     * @throws core::IllegalMoveException with OUT_OF_RANGE, INVALID_PLAYER
     *         or CELL_OCCUPIED_OR_WRONG_SUBGRID
     */
    void update_cell(int index, Cell player);

    /**
     * @brief Place a player's mark using row and column (0-8 each)
     */
    void update_cell(int row, int col, Cell player);

    /**
     * @brief Place a player's mark by subgrid index and cell index inside it
     *
     * @param subgrid_index Subgrid (0-8)
     * @param local_index Cell within the subgrid (0-8)
     * @param player PLAYER1 or PLAYER2
     */
    void update_cell_in_subgrid(int subgrid_index, int local_index, Cell player);

    /**
     * @brief Fill one subgrid from 3x3 data
     *
     * Only empty cells may receive a new value. Subgrid and overall winners
     * are re-evaluated; this is not a move and the forced subgrid only
     * changes if it has just become full or won.
     *
     * @throws core::IllegalMoveException with OUT_OF_RANGE,
     *         INVALID_SUBGRID_SHAPE or CELL_OCCUPIED_OR_WRONG_SUBGRID
     */
    void set_subgrid(int subgrid_index, const std::vector<std::vector<Cell>>& cells);

    // Queries

    Cell get_cell(int index) const;
    Cell get_cell(int row, int col) const;
    SubgridCells get_subgrid(int subgrid_index) const;
    const SubgridStatuses& get_subgrid_winners() const { return subgrid_winners_; }
    Cell get_subgrid_winner(int subgrid_index) const;
    Cell get_overall_winner() const { return overall_winner_; }

    /**
     * @brief Subgrid the next move is forced into, or nullopt for free play
     */
    std::optional<int> get_next_subgrid() const { return next_subgrid_; }

    /**
     * @brief All currently legal flat indices, ascending
     */
    std::vector<int> get_legal_moves() const;

    bool is_subgrid_full(int subgrid_index) const;
    int count_stones() const noexcept;
    bool is_full() const noexcept;
    const core::RuleConfig& get_config() const { return config_; }
    const Grid& get_grid() const { return cells_; }

    /**
     * @brief Compare complete board state (grid, winners, constraint, rules)
     */
    bool board_equal(const UltimateBoard& other) const;

private:
    Grid cells_;
    SubgridStatuses subgrid_winners_;
    Cell overall_winner_;
    std::optional<int> next_subgrid_;
    core::RuleConfig config_;
    UltimateRules rules_;

    // Checks shared by both update entry points; row/col already in range
    void check_move(int row, int col, Cell player) const;

    // Apply a validated move
    void apply_move(int row, int col, Cell player);

    // Record the subgrid winner unless one is already recorded
    void refresh_subgrid_winner(int subgrid_index);

    // Derive the forced subgrid from the local position of the last move
    void update_next_subgrid(int row, int col);

    // Record the overall winner for player unless one is already recorded
    void refresh_overall_winner(Cell player);

    bool is_subgrid_open(int subgrid_index) const;
};

} // namespace game
} // namespace uttt

#endif // UTTT_ULTIMATE_BOARD_H
