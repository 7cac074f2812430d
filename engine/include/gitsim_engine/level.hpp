#pragma once

#include "gitsim_engine/compare.hpp"
#include "gitsim_engine/config.hpp"
#include "gitsim_engine/session.hpp"
#include "gitsim_engine/snapshot.hpp"
#include "gitsim_engine/types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gitsim {

using LocalizedText = std::map<std::string, std::string>;
using LocalizedParagraphs = std::map<std::string, std::vector<std::string>>;

enum class Difficulty {
    Intro,
    Beginner,
    Intermediate,
    Advanced
};

enum class TutorialStepType {
    Dialog,
    Demonstration,
    Challenge
};

struct TutorialStep {
    TutorialStepType type = TutorialStepType::Dialog;
    std::string id;
    nlohmann::json payload; // the step object as authored
};

struct LevelFlags {
    bool compareOnlyMain = false;
    bool allowAnySolution = false;
    bool disableHints = false;
    std::optional<int> timeLimit; // seconds
};

struct Level {
    std::string id;
    LocalizedText name;
    LocalizedText description;
    Difficulty difficulty = Difficulty::Intro;
    int order = 0;
    Snapshot initialState;
    Snapshot goalState;
    std::vector<TutorialStep> tutorialSteps;
    std::vector<std::string> solutionCommands;
    std::vector<LocalizedParagraphs> hints;
    LevelFlags flags;
};

struct ValidationIssue {
    std::string field;
    std::string message;
};

struct LevelValidation {
    bool valid = false;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
};

// Snapshot JSON: {commits: [{id, parents, message, author?, timestamp?, changes?}],
// branches: [{name, target}], tags?: [{name, target, message?}],
// head: {type: "branch", name} | {type: "detached", commit} | "<name or id>"}.
// Commits may be listed in any order.
Result<Snapshot> snapshot_from_json(const nlohmann::json& j, const EngineConfig& config);
nlohmann::json snapshot_to_json(const Snapshot& s);

// Schema and integrity checks on an authored level, before conversion.
LevelValidation validate_level(const nlohmann::json& j);

Result<Level> level_from_json(const nlohmann::json& j, const EngineConfig& config);
Result<Level> load_level_file(const std::string& path, const EngineConfig& config);

const char* difficulty_name(Difficulty difficulty);
CompareOptions compare_options_for(const Level& level);

struct SolutionRun {
    bool success = false;
    Snapshot finalState;
    std::vector<std::pair<std::string, CommandResult>> commandResults;
};

// Runs every solution command from the initial state, recording each result.
SolutionRun run_solution(const Level& level, const EngineConfig& config);

struct LevelVerification {
    bool valid = false;
    std::vector<Difference> differences;
    SolutionRun run;
};

// Runs the solution and compares the outcome with the goal.
LevelVerification verify_level(const Level& level, const EngineConfig& config);

struct SolutionScore {
    int commandsUsed = 0;
    int optimalCommands = 0;
    int efficiency = 0; // percent
};

struct SolutionValidation {
    bool valid = false;
    std::string message;
    std::vector<Difference> differences;
    std::optional<SolutionScore> score;
};

SolutionValidation validate_solution(const Level& level, const Snapshot& actual, int commandsUsed);

} // namespace gitsim
