#pragma once

#include "gitsim_engine/logger.hpp"
#include "gitsim_engine/types.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace gitsim {

// Engine-wide settings. Passed by value into whatever needs them; nothing reads
// configuration from global state.
struct EngineConfig {
    std::string defaultAuthor = "Learner";
    long long baseTimestamp = 1700000000;
    std::string idPrefix = "C";
    std::string defaultBranch = "main";
    std::string initialMessage = "Initial commit";
    std::size_t historyLimit = 50;
    LogLevel logLevel = LogLevel::Warning;
    bool consoleLogging = true;
};

// Missing keys keep their defaults; unknown keys are ignored.
Result<EngineConfig> config_from_json(const nlohmann::json& j);
Result<EngineConfig> load_config(const std::string& path);
nlohmann::json config_to_json(const EngineConfig& config);

// Applies the logging part of the configuration to the process logger.
void apply_logging(const EngineConfig& config);

} // namespace gitsim
