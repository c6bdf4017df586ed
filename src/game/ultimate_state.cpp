// ultimate_state.cpp
#include "uttt/game/ultimate_state.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>

namespace uttt {
namespace game {

UltimateState::UltimateState(const core::RuleConfig& config)
    : board(config),
      current_player(PLAYER1),
      move_history() {
}

Cell UltimateState::playerToCell(int player) {
    return player == PLAYER1 ? Cell::PLAYER1 : Cell::PLAYER2;
}

std::vector<int> UltimateState::getLegalMoves() const {
    if (isTerminal()) {
        return {};
    }
    return board.get_legal_moves();
}

bool UltimateState::isLegalMove(int action) const {
    if (action < 0 || action >= NUM_CELLS) {
        return false;
    }
    if (board.get_overall_winner() != Cell::EMPTY) {
        return false;
    }
    return board.is_valid_move(action / BOARD_SIZE, action % BOARD_SIZE);
}

void UltimateState::makeMove(int action) {
    if (isTerminal()) {
        throw core::GameStateException("Game is already over; move " +
                                       std::to_string(action) + " rejected.");
    }

    board.update_cell(action, playerToCell(current_player));

    move_history.push_back(action);
    current_player = 3 - current_player;

    if (isTerminal()) {
        spdlog::info("UltimateState: Game over after {} moves", move_history.size());
    }
}

bool UltimateState::isTerminal() const {
    if (board.get_overall_winner() != Cell::EMPTY) {
        return true;
    }
    return board.get_legal_moves().empty();
}

core::GameResult UltimateState::getGameResult() const {
    switch (board.get_overall_winner()) {
        case Cell::PLAYER1:
            return core::GameResult::WIN_PLAYER1;
        case Cell::PLAYER2:
            return core::GameResult::WIN_PLAYER2;
        case Cell::EMPTY:
        default:
            return isTerminal() ? core::GameResult::DRAW : core::GameResult::ONGOING;
    }
}

std::unique_ptr<core::IGameState> UltimateState::clone() const {
    return std::make_unique<UltimateState>(*this);
}

std::string UltimateState::actionToString(int action) const {
    if (action < 0 || action >= NUM_CELLS) {
        return "invalid";
    }

    auto [row, col] = UltimateRules::indexToPosition(action, BOARD_SIZE);
    std::stringstream ss;
    ss << static_cast<char>('A' + col) << (BOARD_SIZE - row);
    return ss.str();
}

std::optional<int> UltimateState::stringToAction(const std::string& moveStr) const {
    if (moveStr.empty() || moveStr.length() > 2) {
        return std::nullopt;
    }

    // Bare flat index
    if (std::all_of(moveStr.begin(), moveStr.end(),
                    [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        int index = std::stoi(moveStr);
        if (index >= NUM_CELLS) {
            return std::nullopt;
        }
        return index;
    }

    if (moveStr.length() != 2) {
        return std::nullopt;
    }

    char colChar = static_cast<char>(std::toupper(static_cast<unsigned char>(moveStr[0])));
    char rowChar = moveStr[1];
    if (colChar < 'A' || colChar >= 'A' + BOARD_SIZE) {
        return std::nullopt;
    }
    if (rowChar < '1' || rowChar > '0' + BOARD_SIZE) {
        return std::nullopt;
    }

    int col = colChar - 'A';
    int row = BOARD_SIZE - (rowChar - '0');
    return row * BOARD_SIZE + col;
}

std::optional<int> UltimateState::subgridMoveToAction(int subgrid_index, int local_index) {
    if (subgrid_index < 0 || subgrid_index >= NUM_SUBGRIDS ||
        local_index < 0 || local_index >= NUM_SUBGRIDS) {
        return std::nullopt;
    }
    return UltimateRules::subgridCellToIndex(subgrid_index, local_index);
}

std::string UltimateState::toString() const {
    std::stringstream ss;

    // Column headers
    ss << "  ";
    for (int col = 0; col < BOARD_SIZE; col++) {
        if (col > 0 && col % SUBGRID_SIZE == 0) ss << "  ";
        ss << " " << static_cast<char>('A' + col);
    }
    ss << std::endl;

    for (int row = 0; row < BOARD_SIZE; row++) {
        if (row > 0 && row % SUBGRID_SIZE == 0) {
            ss << "   ------+-------+------" << std::endl;
        }
        ss << " " << (BOARD_SIZE - row) << " ";
        for (int col = 0; col < BOARD_SIZE; col++) {
            if (col > 0 && col % SUBGRID_SIZE == 0) ss << "| ";
            switch (board.get_cell(row, col)) {
                case Cell::EMPTY: ss << ". "; break;
                case Cell::PLAYER1: ss << "X "; break;
                case Cell::PLAYER2: ss << "O "; break;
                default: ss << "? "; break;
            }
        }
        ss << (BOARD_SIZE - row) << std::endl;
    }

    ss << "Current player: " << (current_player == PLAYER1 ? "Player 1 (X)" : "Player 2 (O)") << std::endl;

    auto next = board.get_next_subgrid();
    ss << "Next subgrid: " << (next ? std::to_string(*next) : std::string("any")) << std::endl;

    return ss.str();
}

bool UltimateState::equals(const core::IGameState& other) const {
    const auto* otherState = dynamic_cast<const UltimateState*>(&other);
    if (otherState == nullptr) {
        return false;
    }
    return current_player == otherState->current_player &&
           board.board_equal(otherState->board);
}

bool UltimateState::validate() const {
    int p1_stones = 0;
    int p2_stones = 0;
    for (int a = 0; a < NUM_CELLS; a++) {
        Cell c = board.get_cell(a);
        if (c == Cell::PLAYER1) p1_stones++;
        if (c == Cell::PLAYER2) p2_stones++;
    }

    // Player 1 moves first
    if (p1_stones < p2_stones || p1_stones > p2_stones + 1) {
        return false;
    }

    if (static_cast<int>(move_history.size()) != p1_stones + p2_stones) {
        return false;
    }

    if (current_player != (move_history.size() % 2 == 0 ? PLAYER1 : PLAYER2)) {
        return false;
    }

    // Every recorded subgrid winner owns a line, and every line has a recorded winner
    UltimateRules rules;
    for (int s = 0; s < NUM_SUBGRIDS; s++) {
        Cell winner = board.get_subgrid_winner(s);
        if (winner == Cell::EMPTY) {
            if (rules.findSubgridWinner(board.get_grid(), s) != Cell::EMPTY) {
                return false;
            }
        } else if (!rules.ownsSubgridLine(board.get_grid(), s, winner)) {
            return false;
        }
    }

    // A recorded overall winner holds a line under the win policy; with none recorded, nobody does
    auto hasOverallLine = [&](Cell player) {
        if (board.get_config().overall_win_policy == core::OverallWinPolicy::SUBGRID_LINES) {
            return rules.hasSubgridLine(board.get_subgrid_winners(), player);
        }
        return rules.hasCellLine(board.get_grid(), player);
    };
    Cell overall = board.get_overall_winner();
    if (overall == Cell::EMPTY) {
        if (hasOverallLine(Cell::PLAYER1) || hasOverallLine(Cell::PLAYER2)) {
            return false;
        }
    } else if (!hasOverallLine(overall)) {
        return false;
    }

    return true;
}

} // namespace game
} // namespace uttt
