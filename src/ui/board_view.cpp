// src/ui/board_view.cpp
#include "uttt/ui/board_view.h"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace uttt {
namespace ui {

using game::BOARD_SIZE;
using game::Cell;
using game::NUM_SUBGRIDS;
using game::SUBGRID_SIZE;

std::string BoardTextView::formatBoard(const game::UltimateBoard& board) {
    std::ostringstream ss;
    ss << "Ultimate Tic-Tac-Toe Board (9x9):\n\n";

    for (int band = 0; band < SUBGRID_SIZE; band++) {
        for (int r = 0; r < SUBGRID_SIZE; r++) {
            int row = band * SUBGRID_SIZE + r;
            for (int sc = 0; sc < SUBGRID_SIZE; sc++) {
                for (int c = 0; c < SUBGRID_SIZE; c++) {
                    if (c > 0) ss << ' ';
                    ss << static_cast<int>(board.get_cell(row, sc * SUBGRID_SIZE + c));
                }
                ss << " | ";
            }
            ss << '\n';
        }
        ss << std::string(20, '-') << '\n';
    }

    return ss.str();
}

std::string BoardTextView::formatWinners(const game::UltimateBoard& board) {
    std::ostringstream ss;
    ss << "Subgrid Winners:\n";
    for (int s = 0; s < NUM_SUBGRIDS; s++) {
        Cell winner = board.get_subgrid_winner(s);
        if (winner == Cell::EMPTY) {
            ss << "Subgrid " << s << ": No winner\n";
        } else {
            ss << "Subgrid " << s << ": Player " << static_cast<int>(winner) << " wins\n";
        }
    }

    Cell overall = board.get_overall_winner();
    if (overall != Cell::EMPTY) {
        ss << "\nOverall Winner: Player " << static_cast<int>(overall) << '\n';
    } else {
        ss << "\nOverall Winner: None\n";
    }

    return ss.str();
}

BoardPainter::BoardPainter(std::shared_ptr<Renderer> renderer, int cellSize)
    : renderer_(std::move(renderer)), cellSize_(cellSize) {
    if (!renderer_) {
        throw std::invalid_argument("BoardPainter requires a renderer");
    }
    if (cellSize_ <= 0) {
        throw std::invalid_argument("Cell size must be positive");
    }
}

void BoardPainter::paint(const game::UltimateBoard& board) {
    const int gridSize = cellSize_ * BOARD_SIZE;
    const int top = TITLE_HEIGHT;
    const int subgridSize = cellSize_ * SUBGRID_SIZE;
    const Stroke noOutline{"none", 0};

    renderer_->begin(gridSize, gridSize + top);

    renderer_->text(gridSize / 2, top / 2, "Ultimate Tic-Tac-Toe Board", TextStyle{20, "black", true});

    // Shade won subgrids in the winner's colour and the forced one in yellow
    auto next = board.get_next_subgrid();
    for (int s = 0; s < NUM_SUBGRIDS; s++) {
        std::string fill;
        switch (board.get_subgrid_winner(s)) {
            case Cell::PLAYER1: fill = "#dce6ff"; break;
            case Cell::PLAYER2: fill = "#ffdcdc"; break;
            case Cell::EMPTY:
            default:
                if (next && *next == s) fill = "#fff4b8";
                break;
        }
        if (!fill.empty()) {
            renderer_->rect((s % SUBGRID_SIZE) * subgridSize, top + (s / SUBGRID_SIZE) * subgridSize,
                            subgridSize, subgridSize, fill, noOutline);
        }
    }

    // Thicker lines for 3x3 subgrid borders
    for (int i = 0; i <= BOARD_SIZE; i++) {
        Stroke stroke{"black", (i % SUBGRID_SIZE == 0) ? 3 : 1};
        int offset = i * cellSize_;
        renderer_->line(0, top + offset, gridSize, top + offset, stroke);
        renderer_->line(offset, top, offset, top + gridSize, stroke);
    }

    const int fontSize = cellSize_ * 2 / 3;
    for (int row = 0; row < BOARD_SIZE; row++) {
        for (int col = 0; col < BOARD_SIZE; col++) {
            int cx = col * cellSize_ + cellSize_ / 2;
            int cy = top + row * cellSize_ + cellSize_ / 2;
            switch (board.get_cell(row, col)) {
                case Cell::PLAYER1:
                    renderer_->text(cx, cy, "X", TextStyle{fontSize, "blue", true});
                    break;
                case Cell::PLAYER2:
                    renderer_->text(cx, cy, "O", TextStyle{fontSize, "red", true});
                    break;
                case Cell::EMPTY:
                default:
                    break;
            }
        }
    }

    renderer_->finish();
}

} // namespace ui
} // namespace uttt
