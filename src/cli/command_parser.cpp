// src/cli/command_parser.cpp
#include "uttt/cli/command_parser.h"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace uttt {
namespace cli {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::optional<bool> parseBool(const std::string& text) {
    std::string value = toLower(text);
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    return std::nullopt;
}

} // namespace

core::RuleConfig CliOptions::applyTo(core::RuleConfig config) const {
    if (strict) {
        config.strict_subgrid_gating = *strict;
    }
    if (win_policy) {
        config.overall_win_policy = *win_policy;
    }
    return config;
}

std::vector<std::string> CommandParser::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream in(line);
    for (std::string word; in >> word;) {
        tokens.push_back(word);
    }
    return tokens;
}

std::optional<int> CommandParser::parseInt(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }

    long long value = 0;
    for (char ch : token) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        value = value * 10 + (ch - '0');
        if (value > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
    }

    return static_cast<int>(value);
}

CliOptions CommandParser::parseOptions(const std::vector<std::string>& args) {
    CliOptions options;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }

        std::string name = arg.substr(2);
        std::optional<std::string> inlineValue;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            inlineValue = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (name == "help") {
            options.show_help = true;
            continue;
        }

        if (name == "strict") {
            if (!inlineValue) {
                options.strict = true;
                continue;
            }
            options.strict = parseBool(*inlineValue);
            if (!options.strict) {
                throw std::invalid_argument("Invalid value for --strict: " + *inlineValue);
            }
            continue;
        }

        if (name != "config" && name != "svg" && name != "win-policy" && name != "log-level") {
            throw std::invalid_argument("Unknown option: --" + name);
        }

        std::string value;
        if (inlineValue) {
            value = *inlineValue;
        } else if (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) {
            value = args[++i];
        }
        if (value.empty()) {
            throw std::invalid_argument("Missing value for --" + name);
        }

        if (name == "config") {
            options.config_path = value;
        } else if (name == "svg") {
            options.svg_path = value;
        } else if (name == "log-level") {
            options.log_level = value;
        } else {
            options.win_policy = core::overallWinPolicyFromString(value);
            if (!options.win_policy) {
                throw std::invalid_argument("Unknown win policy: " + value);
            }
        }
    }

    return options;
}

ParsedInput CommandParser::parseInput(const std::string& line, const game::UltimateState& state) {
    ParsedInput result;
    auto tokens = tokenize(line);
    if (tokens.empty()) {
        return result;
    }

    if (tokens.size() == 1) {
        std::string command = toLower(tokens[0]);
        if (command == "quit" || command == "exit") {
            result.kind = InputKind::QUIT;
        } else if (command == "help") {
            result.kind = InputKind::HELP;
        } else if (command == "status") {
            result.kind = InputKind::STATUS;
        } else if (command == "moves") {
            result.kind = InputKind::LIST_MOVES;
        } else if (auto action = state.stringToAction(tokens[0])) {
            result.kind = InputKind::MOVE;
            result.action = *action;
        } else {
            result.kind = InputKind::INVALID;
        }
        return result;
    }

    result.kind = InputKind::INVALID;
    if (tokens.size() == 2) {
        auto subgrid = parseInt(tokens[0]);
        auto local = parseInt(tokens[1]);
        if (subgrid && local) {
            if (auto action = game::UltimateState::subgridMoveToAction(*subgrid, *local)) {
                result.kind = InputKind::MOVE;
                result.action = *action;
            }
        }
    }
    return result;
}

} // namespace cli
} // namespace uttt
