// include/uttt/ui/board_view.h
#ifndef UTTT_BOARD_VIEW_H
#define UTTT_BOARD_VIEW_H

#include <string>
#include <memory>

#include "uttt/game/ultimate_board.h"
#include "uttt/ui/renderer.h"

namespace uttt {
namespace ui {

/**
 * @brief Plain text views of a board
 */
class BoardTextView {
public:
    /**
     * @brief Cell values (0/1/2) laid out by subgrid, one band of subgrids
     *        per block, blocks separated by a dashed line
     */
    static std::string formatBoard(const game::UltimateBoard& board);

    /**
     * @brief Winner of every subgrid followed by the overall winner
     */
    static std::string formatWinners(const game::UltimateBoard& board);
};

/**
 * @brief Draws a board through a Renderer
 *
 * Player 1 is drawn as a blue X, player 2 as a red O; every third grid
 * line is drawn thick to outline the subgrids. Won subgrids are tinted
 * with the winner's colour and the forced subgrid is highlighted.
 */
class BoardPainter {
public:
    /**
     * @brief Constructor
     *
     * @param renderer Surface to draw on
     * @param cellSize Edge length of one cell
     */
    explicit BoardPainter(std::shared_ptr<Renderer> renderer, int cellSize = 60);

    /**
     * @brief Draw the board as one complete drawing
     */
    void paint(const game::UltimateBoard& board);

    int getCellSize() const { return cellSize_; }

    // Space reserved above the grid for the title
    static const int TITLE_HEIGHT = 40;

private:
    std::shared_ptr<Renderer> renderer_;
    int cellSize_;
};

} // namespace ui
} // namespace uttt

#endif // UTTT_BOARD_VIEW_H
