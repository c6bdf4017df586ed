// rule_config.cpp
#include "uttt/core/rule_config.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace uttt {
namespace core {

using json = nlohmann::json;

std::string overallWinPolicyToString(OverallWinPolicy policy) {
    switch (policy) {
        case OverallWinPolicy::CELL_LINES: return "cell_lines";
        case OverallWinPolicy::SUBGRID_LINES: return "subgrid_lines";
        default: throw std::invalid_argument("Unknown overall win policy");
    }
}

std::optional<OverallWinPolicy> overallWinPolicyFromString(const std::string& name) {
    if (name == "cell_lines") {
        return OverallWinPolicy::CELL_LINES;
    }
    if (name == "subgrid_lines") {
        return OverallWinPolicy::SUBGRID_LINES;
    }
    return std::nullopt;
}

std::string RuleConfig::toJson() const {
    json j;
    j["overall_win_policy"] = overallWinPolicyToString(overall_win_policy);
    j["strict_subgrid_gating"] = strict_subgrid_gating;
    return j.dump(4);
}

RuleConfig RuleConfig::fromJson(const std::string& jsonStr) {
    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }

    if (!j.is_object()) {
        throw std::runtime_error("Rule configuration must be a JSON object");
    }

    RuleConfig config;
    try {
        if (j.contains("overall_win_policy")) {
            std::string name = j["overall_win_policy"].get<std::string>();
            auto policy = overallWinPolicyFromString(name);
            if (!policy) {
                throw std::invalid_argument("Unknown overall win policy: " + name);
            }
            config.overall_win_policy = *policy;
        }
        config.strict_subgrid_gating = j.value("strict_subgrid_gating", config.strict_subgrid_gating);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid rule configuration: " + std::string(e.what()));
    }

    return config;
}

RuleConfig RuleConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    RuleConfig config = fromJson(buffer.str());
    spdlog::info("RuleConfig: Loaded {} (overall_win_policy={}, strict_subgrid_gating={})",
                 filename, overallWinPolicyToString(config.overall_win_policy),
                 config.strict_subgrid_gating);
    return config;
}

} // namespace core
} // namespace uttt
