// include/uttt/cli/command_parser.h
#ifndef UTTT_COMMAND_PARSER_H
#define UTTT_COMMAND_PARSER_H

#include <string>
#include <vector>
#include <optional>

#include "uttt/core/rule_config.h"
#include "uttt/game/ultimate_state.h"

namespace uttt {
namespace cli {

/**
 * @brief Program options of uttt_cli
 *
 * Unset optionals leave the value from the config file (or the default)
 * in place.
 */
struct CliOptions {
    bool show_help = false;
    std::string config_path;
    std::optional<bool> strict;
    std::optional<core::OverallWinPolicy> win_policy;
    std::string svg_path;
    std::string log_level = "info";

    // Apply the command-line overrides on top of a loaded config
    core::RuleConfig applyTo(core::RuleConfig config) const;
};

enum class InputKind {
    EMPTY,
    MOVE,
    LIST_MOVES,
    STATUS,
    HELP,
    QUIT,
    INVALID
};

struct ParsedInput {
    InputKind kind = InputKind::EMPTY;
    int action = -1;  // Flat cell index, only for MOVE
};

/**
 * @brief Parsing of program arguments and interactive input
 */
class CommandParser {
public:
    /**
     * @brief Split a command line into whitespace separated tokens
     */
    static std::vector<std::string> tokenize(const std::string& line);

    /**
     * @brief Parse a whole token as a non-negative decimal integer
     *
     * @return The value, or empty if the token has any non-digit character
     *         or does not fit in an int
     */
    static std::optional<int> parseInt(const std::string& token);

    /**
     * @brief Parse program arguments (without the program name)
     *
     * Value options accept "--name value" and "--name=value"; --strict
     * also accepts "--strict=false".
     *
     * @throws std::invalid_argument for unknown options, positional
     *         arguments, missing values or bad values
     */
    static CliOptions parseOptions(const std::vector<std::string>& args);

    /**
     * @brief Classify one line typed at the game prompt
     *
     * Moves are "E5" or "40" (see UltimateState::stringToAction) or
     * "<subgrid> <cell>". Commands are case-insensitive. A move that is
     * well formed but illegal is still returned as MOVE.
     */
    static ParsedInput parseInput(const std::string& line, const game::UltimateState& state);
};

} // namespace cli
} // namespace uttt

#endif // UTTT_COMMAND_PARSER_H
