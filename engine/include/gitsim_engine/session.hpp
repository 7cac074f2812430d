#pragma once

#include "gitsim_engine/config.hpp"
#include "gitsim_engine/engine.hpp"
#include "gitsim_engine/rebase.hpp"
#include "gitsim_engine/snapshot.hpp"
#include "gitsim_engine/types.hpp"
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace gitsim {

struct CommandResult {
    bool success = false;
    std::string message;
    std::optional<EngineError> error;
    std::vector<Advisory> advisories;
};

// Stateful sandbox: owns the current snapshot, bounded undo/redo stacks and
// at most one interactive rebase.
class Session {
public:
    explicit Session(EngineConfig config = EngineConfig());
    Session(EngineConfig config, Snapshot initial);

    CommandResult execute(const std::string& line);
    CommandResult execute(const Command& cmd, const std::string& text = "");
    // Runs lines in order and stops after the first failure.
    std::vector<CommandResult> execute_all(const std::vector<std::string>& lines);

    CommandResult undo();
    CommandResult redo();

    // Interactive rebase entry points for the UI.
    bool rebase_active() const { return rebase_.has_value(); }
    const std::optional<RebaseSession>& rebase() const { return rebase_; }
    CommandResult confirm_rebase(std::vector<RebaseTodoItem> todo);
    CommandResult continue_rebase();
    CommandResult abort_rebase();

    // What the user sees: the working snapshot while a rebase is replaying.
    const Snapshot& snapshot() const;
    const EngineConfig& config() const { return config_; }
    size_t undo_depth() const { return undo_.size(); }
    size_t redo_depth() const { return redo_.size(); }

    // Replaces the state and forgets history and any rebase.
    void reset(Snapshot s);

private:
    struct HistoryEntry {
        Snapshot snapshot;
        std::string command;
    };

    void push_undo(const Snapshot& before, const std::string& command);
    CommandResult fail(const EngineError& error, const std::string& command);
    CommandResult settle_rebase(const RebaseSession& next, const std::string& command);
    CommandResult start_interactive(const Command& cmd, const std::string& text);
    CommandResult execute_during_rebase(const Command& cmd, const std::string& text);

    EngineConfig config_;
    Snapshot current_;
    std::deque<HistoryEntry> undo_;
    std::deque<HistoryEntry> redo_;
    std::optional<RebaseSession> rebase_;
};

} // namespace gitsim
