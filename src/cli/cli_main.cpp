// cli_main.cpp
#include <iostream>
#include <fstream>
#include <string>
#include <memory>
#include <vector>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "uttt/cli/command_parser.h"
#include "uttt/core/rule_config.h"
#include "uttt/game/ultimate_state.h"
#include "uttt/ui/board_view.h"
#include "uttt/ui/renderer.h"

using namespace uttt;

// Forward declarations
void playGame(const core::RuleConfig& config, const std::string& svgPath);
bool writeSvg(const game::UltimateBoard& board, const std::string& svgPath);
void showHelp();
void showCommands();

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        options = cli::CommandParser::parseOptions(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        showHelp();
        return 1;
    }

    if (options.show_help) {
        showHelp();
        return 0;
    }

    auto level = spdlog::level::from_str(options.log_level);
    if (level == spdlog::level::off && options.log_level != "off") {
        std::cerr << "Unknown log level: " << options.log_level << std::endl;
        return 1;
    }
    spdlog::set_level(level);

    core::RuleConfig config;
    if (!options.config_path.empty()) {
        try {
            config = core::RuleConfig::loadFromFile(options.config_path);
        } catch (const std::exception& e) {
            spdlog::error("CLI: {}", e.what());
            return 1;
        }
    }

    // Command-line flags override the config file
    config = options.applyTo(config);

    spdlog::debug("CLI: overall_win_policy={}, strict_subgrid_gating={}",
                  core::overallWinPolicyToString(config.overall_win_policy),
                  config.strict_subgrid_gating);

    playGame(config, options.svg_path);
    return 0;
}

void playGame(const core::RuleConfig& config, const std::string& svgPath) {
    std::cout << "Ultimate Tic-Tac-Toe" << std::endl;
    std::cout << "====================" << std::endl;
    showCommands();

    game::UltimateState state(config);
    bool quit = false;

    while (!quit && !state.isTerminal()) {
        const auto& board = state.getBoard();

        std::cout << std::endl;
        std::cout << ui::BoardTextView::formatBoard(board);

        auto next = board.get_next_subgrid();
        std::cout << "Next subgrid: " << (next ? std::to_string(*next) : std::string("any")) << std::endl;
        std::cout << "Player " << state.getCurrentPlayer() << " ("
                  << (state.getCurrentPlayer() == game::PLAYER1 ? "X" : "O") << ") move: ";

        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cout << std::endl;
            break;
        }

        auto input = cli::CommandParser::parseInput(line, state);
        switch (input.kind) {
            case cli::InputKind::EMPTY:
                break;
            case cli::InputKind::QUIT:
                quit = true;
                break;
            case cli::InputKind::HELP:
                showCommands();
                break;
            case cli::InputKind::STATUS:
                std::cout << ui::BoardTextView::formatWinners(board);
                break;
            case cli::InputKind::LIST_MOVES:
                for (int move : state.getLegalMoves()) {
                    std::cout << state.actionToString(move) << " ";
                }
                std::cout << std::endl;
                break;
            case cli::InputKind::MOVE:
                try {
                    state.makeMove(input.action);
                } catch (const core::IllegalMoveException& e) {
                    std::cout << "Illegal move (" << core::moveErrorToString(e.getError()) << "): "
                              << e.what() << std::endl;
                }
                break;
            case cli::InputKind::INVALID:
            default:
                std::cout << "Invalid move format. Type 'help' for the accepted forms." << std::endl;
                break;
        }
    }

    const auto& board = state.getBoard();
    std::cout << std::endl;
    std::cout << ui::BoardTextView::formatBoard(board);
    std::cout << ui::BoardTextView::formatWinners(board);

    switch (state.getGameResult()) {
        case core::GameResult::WIN_PLAYER1:
            std::cout << "Player 1 (X) wins!" << std::endl;
            break;
        case core::GameResult::WIN_PLAYER2:
            std::cout << "Player 2 (O) wins!" << std::endl;
            break;
        case core::GameResult::DRAW:
            std::cout << "Game ended in a draw." << std::endl;
            break;
        case core::GameResult::ONGOING:
        default:
            std::cout << "Game stopped after " << state.getMoveHistory().size() << " moves." << std::endl;
            break;
    }

    if (!svgPath.empty() && !writeSvg(board, svgPath)) {
        std::cerr << "Could not write " << svgPath << std::endl;
    }
}

bool writeSvg(const game::UltimateBoard& board, const std::string& svgPath) {
    std::ofstream file(svgPath);
    if (!file.is_open()) {
        spdlog::error("CLI: Could not open {} for writing", svgPath);
        return false;
    }

    auto renderer = std::make_shared<ui::SvgRenderer>();
    renderer->setOutputCallback([&file](const std::string& svg) {
        file << svg;
    });

    ui::BoardPainter painter(renderer);
    painter.paint(board);

    if (!file) {
        spdlog::error("CLI: Failed while writing {}", svgPath);
        return false;
    }

    spdlog::info("CLI: Board drawing written to {}", svgPath);
    return true;
}

void showCommands() {
    std::cout << "Moves:" << std::endl;
    std::cout << "  E5                 Column letter A-I and row number 9-1" << std::endl;
    std::cout << "  40                 Flat cell index 0-80" << std::endl;
    std::cout << "  4 8                Subgrid index and cell index inside it (0-8 each)" << std::endl;
    std::cout << "Commands: moves, status, help, quit" << std::endl;
}

void showHelp() {
    std::cout << "Usage: uttt_cli [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --help                       Show this help message" << std::endl;
    std::cout << "  --config FILE                Load rule options from a JSON file" << std::endl;
    std::cout << "  --strict[=BOOL]              Forbid moves into subgrids that are already won" << std::endl;
    std::cout << "  --win-policy POLICY          cell_lines (default) or subgrid_lines" << std::endl;
    std::cout << "  --svg FILE                   Write a drawing of the final board" << std::endl;
    std::cout << "  --log-level LEVEL            trace, debug, info, warn, error, critical, off" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  uttt_cli --win-policy subgrid_lines --strict   # Standard tournament rules" << std::endl;
    std::cout << "  uttt_cli --svg final.svg                       # Save the final position" << std::endl;
}
