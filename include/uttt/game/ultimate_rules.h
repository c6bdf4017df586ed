// ultimate_rules.h
#ifndef UTTT_ULTIMATE_RULES_H
#define UTTT_ULTIMATE_RULES_H

#include <array>
#include <utility>

namespace uttt {
namespace game {

// Board geometry
const int BOARD_SIZE = 9;
const int SUBGRID_SIZE = 3;
const int NUM_CELLS = BOARD_SIZE * BOARD_SIZE;
const int NUM_SUBGRIDS = SUBGRID_SIZE * SUBGRID_SIZE;

/**
 * @brief Content of a single cell
 *
 * Also used for subgrid statuses and the overall winner, where EMPTY
 * stands for "undecided" / "no winner".
 */
enum class Cell {
    EMPTY = 0,
    PLAYER1 = 1,
    PLAYER2 = 2
};

using Grid = std::array<Cell, NUM_CELLS>;
using SubgridStatuses = std::array<Cell, NUM_SUBGRIDS>;

/**
 * @brief Line checks for Ultimate Tic-Tac-Toe
 *
 * Stateless: every check reads the grid it is given. Lines are scanned in
 * the order rows, columns, main diagonal, anti-diagonal.
 */
class UltimateRules {
public:
    /**
     * @brief Find the player owning a line in a subgrid
     *
     * PLAYER1 is checked before PLAYER2.
     *
     * @param grid The 9x9 grid
     * @param subgrid Subgrid index (0-8)
     * @return The first qualifying player, or EMPTY
     */
    Cell findSubgridWinner(const Grid& grid, int subgrid) const;

    /**
     * @brief Check whether player owns any line of a subgrid
     */
    bool ownsSubgridLine(const Grid& grid, int subgrid, Cell player) const;

    /**
     * @brief Check the 9x9 grid for a full row, column or long diagonal
     *
     * Reads raw cell values and ignores subgrid statuses.
     */
    bool hasCellLine(const Grid& grid, Cell player) const;

    /**
     * @brief Check the 3x3 meta grid of subgrid statuses for a line
     */
    bool hasSubgridLine(const SubgridStatuses& statuses, Cell player) const;

    /**
     * @brief Check whether a subgrid has no empty cell left
     */
    bool isSubgridFull(const Grid& grid, int subgrid) const;

    // Coordinate helpers
    static bool isPlayer(Cell value) noexcept;
    static bool inBounds(int row, int col) noexcept;
    static int subgridOf(int row, int col) noexcept;
    static int targetSubgrid(int row, int col) noexcept;
    static int subgridCellToIndex(int subgrid, int local) noexcept;
    static std::pair<int, int> indexToPosition(int index, int size) noexcept;

private:
    // `length` cells from (row, col) stepping by (dr, dc), all equal to player
    bool isLine(const Grid& grid, int row, int col, int dr, int dc, int length, Cell player) const;
};

} // namespace game
} // namespace uttt

#endif // UTTT_ULTIMATE_RULES_H
