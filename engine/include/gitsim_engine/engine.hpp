#pragma once

#include "gitsim_engine/snapshot.hpp"
#include "gitsim_engine/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gitsim {

// Commands
enum class CommandType {
    Commit,
    CreateBranch,
    DeleteBranch,
    ListBranches,
    Checkout,
    CheckoutNewBranch,
    Switch,
    SwitchNewBranch,
    Merge,
    CherryPick,
    Reset,
    Revert,
    CreateTag,
    DeleteTag,
    ListTags,
    Rebase,
    RebaseInteractive,
    RebaseContinue,
    RebaseAbort,
    Status,
    Log,
    RemoteAdd,
    ListRemotes,
    Fetch,
    Pull,
    Push,
    Undo,
    Redo
};

enum class ResetMode {
    Soft,
    Mixed,
    Hard
};

struct Command {
    CommandType type = CommandType::Commit;
    // branch, tag or ref named by the command
    std::string target;
    // Additional fields used by specific commands
    std::optional<std::string> startPoint;  // branch/checkout -b/tag
    std::vector<std::string> commits;       // cherry-pick
    std::optional<std::string> message;     // commit/merge/tag
    std::optional<std::vector<std::string>> changes; // commit: tracked fields touched
    std::string url;                        // remote add
    std::optional<std::string> branch;      // fetch/pull/push: branch on the remote
    bool amend = false;
    bool force = false;          // branch -f/-D, checkout -B, switch -C, push -f
    bool noFastForward = false;  // merge --no-ff
    bool firstParent = false;    // log --first-parent
    ResetMode resetMode = ResetMode::Mixed;
    bool verbose = false;        // remote -v
    bool remoteBranches = false; // branch -r
    int maxCount = -1;           // log -n
};

struct CommandOutcome {
    Snapshot snapshot;
    std::string message;
    std::vector<Advisory> advisories;
};

// Engine API
// Applies one command. On failure the input snapshot is untouched and the
// error names the offending ref or commit. Session-level commands (undo,
// redo, interactive rebase controls) fail with InvalidSessionState.
Result<CommandOutcome> apply_command(const Snapshot& s, const Command& cmd);

const char* command_type_name(CommandType type);
const char* reset_mode_name(ResetMode mode);
// status, log and the listing forms of branch/tag/remote
bool is_read_only(CommandType type);

} // namespace gitsim
