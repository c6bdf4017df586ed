// ultimate_state.h
#ifndef UTTT_ULTIMATE_STATE_H
#define UTTT_ULTIMATE_STATE_H

#include <vector>
#include <memory>
#include <optional>
#include <string>

#include "uttt/core/igamestate.h"
#include "uttt/core/rule_config.h"
#include "uttt/game/ultimate_board.h"

namespace uttt {
namespace game {

// Constants
const int PLAYER1 = 1;
const int PLAYER2 = 2;

/**
 * @brief Two-player Ultimate Tic-Tac-Toe session
 *
 * Alternates turns on top of an UltimateBoard, starting with PLAYER1,
 * and stops accepting moves once the game is terminal.
 */
class UltimateState : public core::IGameState {
public:
    /**
     * @brief Constructor
     *
     * @param config Rule variants for the underlying board
     */
    explicit UltimateState(const core::RuleConfig& config = core::RuleConfig());

    // IGameState interface implementation
    std::vector<int> getLegalMoves() const override;
    bool isLegalMove(int action) const override;
    void makeMove(int action) override;
    bool isTerminal() const override;
    core::GameResult getGameResult() const override;
    int getCurrentPlayer() const override { return current_player; }
    int getBoardSize() const override { return BOARD_SIZE; }
    int getActionSpaceSize() const override { return NUM_CELLS; }
    std::unique_ptr<core::IGameState> clone() const override;
    std::string actionToString(int action) const override;
    std::optional<int> stringToAction(const std::string& moveStr) const override;
    std::string toString() const override;
    bool equals(const core::IGameState& other) const override;
    std::vector<int> getMoveHistory() const override { return move_history; }
    bool validate() const override;

    /**
     * @brief Map a subgrid index and a cell index inside it to an action
     *
     * @return Flat index, or nullopt if either index is outside 0-8
     */
    static std::optional<int> subgridMoveToAction(int subgrid_index, int local_index);

    const UltimateBoard& getBoard() const { return board; }

private:
    UltimateBoard board;
    int current_player;        // 1=PLAYER1, 2=PLAYER2
    std::vector<int> move_history;

    static Cell playerToCell(int player);
};

} // namespace game
} // namespace uttt

#endif // UTTT_ULTIMATE_STATE_H
