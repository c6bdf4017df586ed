// igamestate.h
#ifndef UTTT_IGAMESTATE_H
#define UTTT_IGAMESTATE_H

#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <stdexcept>

namespace uttt {
namespace core {

/**
 * @brief Result of a game
 */
enum class GameResult {
    ONGOING,
    DRAW,
    WIN_PLAYER1,
    WIN_PLAYER2
};

/**
 * @brief Reason a move or board update was rejected
 */
enum class MoveError {
    OUT_OF_RANGE,                    // Position outside the board
    INVALID_PLAYER,                  // Mark is not one of the two players
    CELL_OCCUPIED_OR_WRONG_SUBGRID,  // Cell taken or outside the forced subgrid
    INVALID_SUBGRID_SHAPE            // Bulk subgrid data is not 3x3
};

/**
 * @brief Human readable name of a move error
 */
std::string moveErrorToString(MoveError error);

/**
 * @brief Exception for game state errors
 */
class GameStateException : public std::runtime_error {
public:
    explicit GameStateException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception for illegal move attempts
 *
 * Carries the flat board index of the rejected move (-1 when the input
 * could not be mapped to one) and the error kind.
 */
class IllegalMoveException : public GameStateException {
public:
    IllegalMoveException(const std::string& message, int action, MoveError error)
        : GameStateException(message), action_(action), error_(error) {}
    int getAction() const { return action_; }
    MoveError getError() const { return error_; }
private:
    int action_;
    MoveError error_;
};

/**
 * @brief Interface for turn-based game sessions
 *
 * A session tracks whose turn it is and decides when play stops;
 * the rules themselves live in the board it wraps. Actions are flat
 * cell indices in [0, getActionSpaceSize()).
 */
class IGameState {
public:
    virtual ~IGameState() = default;

    /**
     * @brief Actions the player to move may take, in ascending order
     *
     * Empty once the session is terminal.
     */
    virtual std::vector<int> getLegalMoves() const = 0;
    virtual bool isLegalMove(int action) const = 0;

    /**
     * @brief Play action for the player to move and pass the turn
     *
     * @throws IllegalMoveException if the board rejects the action
     * @throws GameStateException if the session is already terminal
     */
    virtual void makeMove(int action) = 0;

    virtual bool isTerminal() const = 0;
    virtual GameResult getGameResult() const = 0;

    // 1 or 2
    virtual int getCurrentPlayer() const = 0;

    virtual int getBoardSize() const = 0;
    virtual int getActionSpaceSize() const = 0;

    virtual std::unique_ptr<IGameState> clone() const = 0;

    /**
     * @brief Human readable coordinate of an action
     */
    virtual std::string actionToString(int action) const = 0;

    /**
     * @brief Parse a coordinate typed by a player
     *
     * @return The action, or empty if moveStr names no cell
     */
    virtual std::optional<int> stringToAction(const std::string& moveStr) const = 0;

    virtual std::string toString() const = 0;

    // Same position, same player to move and same rules
    virtual bool equals(const IGameState& other) const = 0;

    virtual std::vector<int> getMoveHistory() const = 0;

    /**
     * @brief Consistency check of the internal state
     *
     * @return false if stone counts, turn order or recorded results
     *         contradict each other
     */
    virtual bool validate() const = 0;
};

} // namespace core
} // namespace uttt

#endif // UTTT_IGAMESTATE_H
