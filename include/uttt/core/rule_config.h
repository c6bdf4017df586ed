// rule_config.h
#ifndef UTTT_RULE_CONFIG_H
#define UTTT_RULE_CONFIG_H

#include <string>
#include <optional>

namespace uttt {
namespace core {

/**
 * @brief How the overall winner of the 9x9 board is decided
 */
enum class OverallWinPolicy {
    CELL_LINES,     // Nine equal marks in a row, column or long diagonal of the grid
    SUBGRID_LINES   // Three won subgrids in a row, column or diagonal of the 3x3 meta grid
};

std::string overallWinPolicyToString(OverallWinPolicy policy);
std::optional<OverallWinPolicy> overallWinPolicyFromString(const std::string& name);

/**
 * @brief Rule variants of the Ultimate Tic-Tac-Toe engine
 *
 * The defaults reproduce the reference behaviour: overall wins are read
 * from raw cell lines and legality ignores whether a subgrid is decided.
 */
struct RuleConfig {
    OverallWinPolicy overall_win_policy = OverallWinPolicy::CELL_LINES;

    // Reject moves into subgrids that already have a recorded winner
    bool strict_subgrid_gating = false;

    bool operator==(const RuleConfig& other) const {
        return overall_win_policy == other.overall_win_policy &&
               strict_subgrid_gating == other.strict_subgrid_gating;
    }
    bool operator!=(const RuleConfig& other) const { return !(*this == other); }

    /**
     * @brief Serialize to JSON
     *
     * @return JSON string representation
     */
    std::string toJson() const;

    /**
     * @brief Deserialize from JSON
     *
     * Missing keys keep their default values.
     *
     * @param json JSON string
     * @return Parsed configuration
     * @throws std::runtime_error on malformed JSON
     * @throws std::invalid_argument on an unknown policy name
     */
    static RuleConfig fromJson(const std::string& json);

    /**
     * @brief Load from a JSON file
     *
     * @param filename File to read
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static RuleConfig loadFromFile(const std::string& filename);
};

} // namespace core
} // namespace uttt

#endif // UTTT_RULE_CONFIG_H
