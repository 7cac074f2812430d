#pragma once

#include "gitsim_engine/snapshot.hpp"
#include "gitsim_engine/types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gitsim {

enum class RebaseAction {
    Pick,
    Squash,
    Fixup,
    Drop,
    Reword,
    Edit
};

struct RebaseTodoItem {
    RebaseAction action = RebaseAction::Pick;
    CommitId commit;
    std::string message; // original message; the replacement text for reword
    int order = 0;
};

enum class RebaseStatus {
    NotStarted,
    InProgress,
    Completed,
    Aborted
};

// Explicit rebase state. Every operation takes a session by const reference
// and returns the next one; nothing suspends.
struct RebaseSession {
    RebaseStatus status = RebaseStatus::NotStarted;
    Snapshot original; // restored by abort
    CommitId onto;
    std::string ontoRef;
    std::optional<std::string> branch; // moved on completion; nullopt when HEAD was detached
    CommitId originalTip;
    std::vector<RebaseTodoItem> todo;
    size_t cursor = 0;  // next item to process
    Snapshot working;   // original graph plus replayed commits, HEAD detached at the accumulator tip
    std::vector<std::pair<CommitId, CommitId>> rewritten; // original -> replayed
    bool paused = false; // stopped after an edit item
    std::optional<Snapshot> result; // final snapshot once Completed, the original once Aborted
};

const char* rebase_action_name(RebaseAction action);
// Accepts full words and git's one-letter abbreviations.
std::optional<RebaseAction> parse_rebase_action(const std::string& word);
const char* rebase_status_name(RebaseStatus status);

// Commits to replay onto `onto`, oldest first: the first-parent history of
// HEAD down to the first commit `onto` already contains. Merge commits are
// left out, as git does.
Result<std::vector<RebaseTodoItem>> plan_rebase(const Snapshot& s, const CommitId& onto);

// A NotStarted session carrying the default all-pick todo list.
Result<RebaseSession> prepare_rebase(const Snapshot& s, const std::string& ontoRef);

// Validates `todo` against the planned session and starts it. Fails with
// InvalidTodo for a commit outside the rebased history or listed twice,
// InvalidSquashPosition when nothing precedes a squash/fixup.
Result<RebaseSession> start_rebase(const RebaseSession& planned, std::vector<RebaseTodoItem> todo);
Result<RebaseSession> start_rebase(const Snapshot& s, const std::string& ontoRef, std::vector<RebaseTodoItem> todo);

// Processes one todo item. An edit item leaves the session paused; the next
// call resumes. Passing the last item completes the rebase.
Result<RebaseSession> step_rebase(const RebaseSession& session);

// Steps until the session pauses or completes.
Result<RebaseSession> continue_rebase(const RebaseSession& session);

// While paused: replaces the commit just replayed with one carrying `message`
// (empty keeps the message).
Result<RebaseSession> amend_rebase(const RebaseSession& session, const std::string& message);

// Restores the original snapshot. Fails with InvalidSessionState on a session
// that already completed or aborted.
Result<RebaseSession> abort_rebase(const RebaseSession& session);

} // namespace gitsim
