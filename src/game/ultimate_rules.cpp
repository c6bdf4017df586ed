// ultimate_rules.cpp
#include "uttt/game/ultimate_rules.h"
#include <initializer_list>

namespace uttt {
namespace game {

bool UltimateRules::isLine(const Grid& grid, int row, int col, int dr, int dc,
                           int length, Cell player) const {
    for (int i = 0; i < length; i++) {
        if (grid[(row + i * dr) * BOARD_SIZE + (col + i * dc)] != player) {
            return false;
        }
    }
    return true;
}

Cell UltimateRules::findSubgridWinner(const Grid& grid, int subgrid) const {
    for (Cell p : {Cell::PLAYER1, Cell::PLAYER2}) {
        if (ownsSubgridLine(grid, subgrid, p)) {
            return p;
        }
    }
    return Cell::EMPTY;
}

bool UltimateRules::ownsSubgridLine(const Grid& grid, int subgrid, Cell player) const {
    if (!isPlayer(player)) {
        return false;
    }

    int row0 = (subgrid / SUBGRID_SIZE) * SUBGRID_SIZE;
    int col0 = (subgrid % SUBGRID_SIZE) * SUBGRID_SIZE;

    for (int i = 0; i < SUBGRID_SIZE; i++) {
        if (isLine(grid, row0 + i, col0, 0, 1, SUBGRID_SIZE, player)) {
            return true;
        }
    }
    for (int i = 0; i < SUBGRID_SIZE; i++) {
        if (isLine(grid, row0, col0 + i, 1, 0, SUBGRID_SIZE, player)) {
            return true;
        }
    }

    return isLine(grid, row0, col0, 1, 1, SUBGRID_SIZE, player) ||
           isLine(grid, row0, col0 + SUBGRID_SIZE - 1, 1, -1, SUBGRID_SIZE, player);
}

bool UltimateRules::hasCellLine(const Grid& grid, Cell player) const {
    if (!isPlayer(player)) {
        return false;
    }

    for (int i = 0; i < BOARD_SIZE; i++) {
        if (isLine(grid, i, 0, 0, 1, BOARD_SIZE, player)) {
            return true;
        }
        if (isLine(grid, 0, i, 1, 0, BOARD_SIZE, player)) {
            return true;
        }
    }

    return isLine(grid, 0, 0, 1, 1, BOARD_SIZE, player) ||
           isLine(grid, 0, BOARD_SIZE - 1, 1, -1, BOARD_SIZE, player);
}

bool UltimateRules::hasSubgridLine(const SubgridStatuses& statuses, Cell player) const {
    if (!isPlayer(player)) {
        return false;
    }

    auto owned = [&](int r, int c) {
        return statuses[r * SUBGRID_SIZE + c] == player;
    };

    for (int i = 0; i < SUBGRID_SIZE; i++) {
        if (owned(i, 0) && owned(i, 1) && owned(i, 2)) return true;
        if (owned(0, i) && owned(1, i) && owned(2, i)) return true;
    }

    return (owned(0, 0) && owned(1, 1) && owned(2, 2)) ||
           (owned(0, 2) && owned(1, 1) && owned(2, 0));
}

bool UltimateRules::isSubgridFull(const Grid& grid, int subgrid) const {
    int row0 = (subgrid / SUBGRID_SIZE) * SUBGRID_SIZE;
    int col0 = (subgrid % SUBGRID_SIZE) * SUBGRID_SIZE;

    for (int r = row0; r < row0 + SUBGRID_SIZE; r++) {
        for (int c = col0; c < col0 + SUBGRID_SIZE; c++) {
            if (grid[r * BOARD_SIZE + c] == Cell::EMPTY) {
                return false;
            }
        }
    }
    return true;
}

bool UltimateRules::isPlayer(Cell value) noexcept {
    switch (value) {
        case Cell::PLAYER1:
        case Cell::PLAYER2:
            return true;
        case Cell::EMPTY:
        default:
            return false;
    }
}

bool UltimateRules::inBounds(int row, int col) noexcept {
    return (0 <= row && row < BOARD_SIZE) && (0 <= col && col < BOARD_SIZE);
}

int UltimateRules::subgridOf(int row, int col) noexcept {
    return (row / SUBGRID_SIZE) * SUBGRID_SIZE + (col / SUBGRID_SIZE);
}

int UltimateRules::targetSubgrid(int row, int col) noexcept {
    return (row % SUBGRID_SIZE) * SUBGRID_SIZE + (col % SUBGRID_SIZE);
}

int UltimateRules::subgridCellToIndex(int subgrid, int local) noexcept {
    int row = (subgrid / SUBGRID_SIZE) * SUBGRID_SIZE + local / SUBGRID_SIZE;
    int col = (subgrid % SUBGRID_SIZE) * SUBGRID_SIZE + local % SUBGRID_SIZE;
    return row * BOARD_SIZE + col;
}

std::pair<int, int> UltimateRules::indexToPosition(int index, int size) noexcept {
    return {index / size, index % size};
}

} // namespace game
} // namespace uttt
