#include "gitsim_engine/compare.hpp"
#include "gitsim_engine/config.hpp"
#include "gitsim_engine/level.hpp"
#include "gitsim_engine/logger.hpp"
#include "gitsim_engine/session.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <optional>
#include <string>

using namespace gitsim;

static void print_error(const EngineError& e) {
    std::cerr << "error: " << e.message << " [" << error_code_name(e.code) << "]\n";
}

static void print_result(const CommandResult& r) {
    if (!r.success) {
        if (r.error) print_error(*r.error);
        else std::cerr << "error: " << r.message << "\n";
        return;
    }
    if (!r.message.empty()) std::cout << r.message << "\n";
    for (const auto& a : r.advisories) std::cout << "warning: " << a.message << "\n";
}

static void print_differences(const std::vector<Difference>& diffs) {
    for (const auto& d : diffs) std::cout << "  - " << dimension_name(d.dimension) << ": " << d.description << "\n";
}

static int verify(const Level& level, const EngineConfig& config) {
    LevelVerification v = verify_level(level, config);
    for (const auto& entry : v.run.commandResults) {
        std::cout << "$ " << entry.first << "\n";
        print_result(entry.second);
    }
    if (v.valid) {
        std::cout << "Level " << level.id << ": solution reaches the goal.\n";
        return 0;
    }
    std::cout << "Level " << level.id << ": solution does not reach the goal.\n";
    print_differences(v.differences);
    return 1;
}

static bool skip_line(const std::string& line) {
    size_t start = line.find_first_not_of(" \t\r");
    return start == std::string::npos || line[start] == '#';
}

int main(int argc, char** argv) {
    CLI::App app{"gitsim: in-memory git sandbox. Reads one command per line from stdin."};
    std::string configPath;
    std::string levelPath;
    bool verifyOnly = false;
    bool printJson = false;
    app.add_option("--config", configPath, "Engine configuration (JSON)")->check(CLI::ExistingFile);
    app.add_option("--level", levelPath, "Level file; its initial state seeds the session")->check(CLI::ExistingFile);
    app.add_flag("--verify", verifyOnly, "Run the level's solution and compare with its goal");
    app.add_flag("--json", printJson, "Print the final snapshot as JSON");
    CLI11_PARSE(app, argc, argv);

    EngineConfig config;
    if (!configPath.empty()) {
        auto loaded = load_config(configPath);
        if (!loaded.ok()) {
            print_error(loaded.error());
            return 2;
        }
        config = loaded.value();
    }
    apply_logging(config);

    std::optional<Level> level;
    if (!levelPath.empty()) {
        auto loaded = load_level_file(levelPath, config);
        if (!loaded.ok()) {
            print_error(loaded.error());
            return 2;
        }
        level = loaded.value();
        GITSIM_LOG_INFO("CLI", "Loaded level " + level->id + " (" + difficulty_name(level->difficulty) + ")", levelPath);
    }

    if (verifyOnly) {
        if (!level) {
            std::cerr << "error: --verify needs --level\n";
            return 2;
        }
        return verify(*level, config);
    }

    Session session = level ? Session(config, fork_snapshot(level->initialState)) : Session(config);
    int used = 0;
    bool failed = false;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (skip_line(line)) continue;
        CommandResult r = session.execute(line);
        print_result(r);
        if (r.success) ++used;
        else failed = true;
    }

    if (level) {
        SolutionValidation v = validate_solution(*level, session.snapshot(), used);
        std::cout << v.message << "\n";
        if (v.score) std::cout << "Efficiency: " << v.score->efficiency << "%\n";
        print_differences(v.differences);
        failed = failed || !v.valid;
    }
    if (printJson) std::cout << snapshot_to_json(session.snapshot()).dump(2) << "\n";
    return failed ? 1 : 0;
}
