#include "gitsim_engine/engine.hpp"
#include "gitsim_engine/rebase.hpp"
#include "gitsim_engine/state_utils.hpp"
#include <algorithm>
#include <iterator>
#include <unordered_map>
#include <set>
#include <sstream>

namespace gitsim {

static const char* kDefaultCommitMessage = "Quick commit";

static Result<CommitId> require_head(const Snapshot& s) {
    if (auto head = head_commit(s)) return *head;
    return make_error(ErrorCode::UnknownRef, "HEAD", "HEAD does not point at a commit yet");
}

static std::string commit_line(const Snapshot& s, const CommitId& id) {
    const Commit* c = find_commit(s.graph, id);
    return "[" + id + "] " + (c ? first_line(c->message) : std::string());
}

static std::string head_is_now_at(const Snapshot& s, const CommitId& id) {
    const Commit* c = find_commit(s.graph, id);
    return "HEAD is now at " + id + (c ? " " + first_line(c->message) : std::string());
}

static Result<CommitId> new_commit_on_head(Snapshot& s, const std::string& message, const std::string& author,
                                           std::optional<std::vector<std::string>> changes) {
    std::vector<CommitId> parents;
    if (auto head = head_commit(s)) parents.push_back(*head);
    auto id = add_commit(s.graph, parents, message, author, std::move(changes));
    if (!id.ok()) return id.error();
    move_head_to(s, id.value());
    return id;
}

static Result<std::string> do_commit(Snapshot& s, const Command& cmd) {
    if (cmd.amend) {
        auto head = require_head(s);
        if (!head.ok()) return head.error();
        const Commit* old = find_commit(s.graph, head.value());
        auto id = add_commit(s.graph, old->parents, cmd.message.value_or(old->message), old->author,
                             cmd.changes ? cmd.changes : old->changes);
        if (!id.ok()) return id.error();
        move_head_to(s, id.value());
        return commit_line(s, id.value());
    }
    auto id = new_commit_on_head(s, cmd.message.value_or(kDefaultCommitMessage), "", cmd.changes);
    if (!id.ok()) return id.error();
    return commit_line(s, id.value());
}

static Result<CommitId> start_point(const Snapshot& s, const Command& cmd) {
    if (cmd.startPoint) return resolve_ref(s, *cmd.startPoint);
    return require_head(s);
}

static Result<std::string> do_create_branch(Snapshot& s, const Command& cmd) {
    auto start = start_point(s, cmd);
    if (!start.ok()) return start.error();
    bool exists = find_branch(s.refs, cmd.target) != nullptr;
    if (exists && cmd.force && current_branch(s) == cmd.target) {
        return make_error(ErrorCode::BranchCheckedOut, cmd.target, "cannot force update the current branch '" + cmd.target + "'");
    }
    auto created = create_branch(s.refs, cmd.target, start.value(), cmd.force);
    if (!created.ok()) return created.error();
    return std::string(exists ? "Reset branch " : "Created branch ") + cmd.target;
}

static Result<std::string> do_delete_branch(Snapshot& s, const Command& cmd) {
    const Branch* b = find_branch(s.refs, cmd.target);
    if (b == nullptr) return make_error(ErrorCode::UnknownRef, cmd.target, "branch '" + cmd.target + "' not found");
    if (!cmd.force && current_branch(s) != cmd.target) {
        auto head = head_commit(s);
        if (head && !is_ancestor(s.graph, b->target, *head)) {
            return make_error(ErrorCode::NotFullyMerged, cmd.target, "the branch '" + cmd.target + "' is not fully merged");
        }
    }
    auto removed = delete_branch(s.refs, cmd.target);
    if (!removed.ok()) return removed.error();
    return "Deleted branch " + cmd.target + " (was " + removed.value().target + ")";
}

static std::string list_branches(const Snapshot& s, const Command& cmd) {
    std::ostringstream out;
    if (cmd.remoteBranches) {
        for (const auto& name : sorted_tracking_names(s.refs)) out << "  " << name << "\n";
        std::string text = out.str();
        if (!text.empty()) text.pop_back();
        return text;
    }
    const Head& head = s.refs.head;
    if (head.kind == HeadKind::Detached) out << "* (HEAD detached at " << head.commit << ")\n";
    for (const auto& name : sorted_branch_names(s.refs)) {
        bool current = head.kind == HeadKind::Attached && head.branch == name;
        out << (current ? "* " : "  ") << name << "\n";
    }
    std::string text = out.str();
    if (!text.empty()) text.pop_back();
    return text;
}

static Result<std::string> do_checkout(Snapshot& s, const Command& cmd, bool branchesOnly) {
    if (find_branch(s.refs, cmd.target)) {
        if (current_branch(s) == cmd.target) return "Already on '" + cmd.target + "'";
        attach_head(s.refs, cmd.target);
        return "Switched to branch '" + cmd.target + "'";
    }
    if (branchesOnly) {
        return make_error(ErrorCode::UnknownRef, cmd.target, "invalid reference: " + cmd.target);
    }
    auto commit = resolve_ref(s, cmd.target);
    if (!commit.ok()) {
        return make_error(ErrorCode::UnknownRef, cmd.target, "pathspec '" + cmd.target + "' did not match any file(s) known to git");
    }
    detach_head(s.refs, commit.value());
    return head_is_now_at(s, commit.value());
}

static Result<std::string> do_checkout_new_branch(Snapshot& s, const Command& cmd) {
    auto start = start_point(s, cmd);
    if (!start.ok()) return start.error();
    bool exists = find_branch(s.refs, cmd.target) != nullptr;
    auto created = create_branch(s.refs, cmd.target, start.value(), cmd.force);
    if (!created.ok()) return created.error();
    attach_head(s.refs, cmd.target);
    if (exists) return "Switched to and reset branch '" + cmd.target + "'";
    return "Switched to a new branch '" + cmd.target + "'";
}

static std::vector<std::string> sorted_fields(const std::set<std::string>& fields) {
    return std::vector<std::string>(fields.begin(), fields.end());
}

// Collects the tracked fields changed on one side of a merge. Returns false
// when any commit on that side carries no change information.
static bool side_changes(const Snapshot& s, const CommitId& exclude, const CommitId& tip, std::set<std::string>& out) {
    for (const auto& id : commits_between(s.graph, exclude, tip)) {
        const Commit* c = find_commit(s.graph, id);
        if (!c->changes) return false;
        out.insert(c->changes->begin(), c->changes->end());
    }
    return true;
}

static std::vector<Advisory> merge_advisories(const Snapshot& s, const CommitId& ours, const CommitId& theirs, bool& known) {
    std::set<std::string> ourFields, theirFields;
    bool oursKnown = side_changes(s, theirs, ours, ourFields);
    bool theirsKnown = side_changes(s, ours, theirs, theirFields);
    known = oursKnown && theirsKnown;
    if (!known) {
        return {Advisory{AdvisoryCode::ConflictsUnknown, "no change information for the merged commits; conflicts cannot be checked", {}}};
    }
    std::set<std::string> both;
    std::set_intersection(ourFields.begin(), ourFields.end(), theirFields.begin(), theirFields.end(),
                          std::inserter(both, both.begin()));
    if (both.empty()) return {};
    std::string list;
    for (const auto& f : both) list += (list.empty() ? "" : ", ") + f;
    return {Advisory{AdvisoryCode::ConflictsDetected, "both sides changed: " + list, sorted_fields(both)}};
}

static Result<std::string> do_merge(Snapshot& s, const Command& cmd, std::vector<Advisory>& advisories) {
    auto head = require_head(s);
    if (!head.ok()) return head.error();
    auto theirs = resolve_ref(s, cmd.target);
    if (!theirs.ok()) return make_error(ErrorCode::UnknownRef, cmd.target, cmd.target + " - not something we can merge");
    const CommitId ours = head.value();
    const CommitId other = theirs.value();

    if (is_ancestor(s.graph, other, ours)) return std::string("Already up to date.");
    if (!cmd.noFastForward && is_ancestor(s.graph, ours, other)) {
        move_head_to(s, other);
        return "Updating " + ours + ".." + other + "\nFast-forward";
    }
    if (!merge_base(s.graph, ours, other)) {
        return make_error(ErrorCode::UnrelatedHistories, cmd.target, "refusing to merge unrelated histories");
    }

    bool known = false;
    advisories = merge_advisories(s, ours, other, known);
    std::string message = cmd.message.value_or(
        find_branch(s.refs, cmd.target) ? "Merge branch '" + cmd.target + "'" : "Merge commit '" + cmd.target + "'");
    std::optional<std::vector<std::string>> changes;
    if (known) changes = std::vector<std::string>{};
    auto id = add_commit(s.graph, {ours, other}, message, "", changes);
    if (!id.ok()) return id.error();
    move_head_to(s, id.value());
    return "Merge made by the 'ort' strategy.\n" + commit_line(s, id.value());
}

static Result<CommitId> resolve_commit(const Snapshot& s, const std::string& ref) {
    auto id = resolve_ref(s, ref);
    if (!id.ok()) return make_error(ErrorCode::UnknownCommit, ref, "bad revision '" + ref + "'");
    return id;
}

static Result<std::string> do_cherry_pick(Snapshot& s, const Command& cmd) {
    if (cmd.commits.empty()) return make_error(ErrorCode::InvalidArgument, "", "cherry-pick needs at least one commit");
    auto head = require_head(s);
    if (!head.ok()) return head.error();
    std::string lines;
    for (const auto& ref : cmd.commits) {
        auto source = resolve_commit(s, ref);
        if (!source.ok()) return source.error();
        const Commit* c = find_commit(s.graph, source.value());
        if (c->parents.size() > 1) {
            return make_error(ErrorCode::InvalidArgument, c->id, "commit " + c->id + " is a merge but no -m option was given");
        }
        auto id = new_commit_on_head(s, c->message, c->author, c->changes);
        if (!id.ok()) return id.error();
        if (!lines.empty()) lines += "\n";
        lines += commit_line(s, id.value());
    }
    return lines;
}

static Result<std::string> do_reset(Snapshot& s, const Command& cmd) {
    auto target = resolve_ref(s, cmd.target.empty() ? std::string("HEAD") : cmd.target);
    if (!target.ok()) return target.error();
    move_head_to(s, target.value());
    // Only ref movement is modelled; the mode affects the working tree alone.
    if (cmd.resetMode == ResetMode::Hard) return head_is_now_at(s, target.value());
    return head_is_now_at(s, target.value()) + " (" + reset_mode_name(cmd.resetMode) + ")";
}

static Result<std::string> do_revert(Snapshot& s, const Command& cmd) {
    auto head = require_head(s);
    if (!head.ok()) return head.error();
    auto source = resolve_commit(s, cmd.target);
    if (!source.ok()) return source.error();
    const Commit* c = find_commit(s.graph, source.value());
    if (c->parents.size() > 1) {
        return make_error(ErrorCode::InvalidArgument, c->id, "commit " + c->id + " is a merge but no -m option was given");
    }
    auto id = new_commit_on_head(s, "Revert \"" + first_line(c->message) + "\"", "", c->changes);
    if (!id.ok()) return id.error();
    return commit_line(s, id.value());
}

static Result<std::string> do_create_tag(Snapshot& s, const Command& cmd) {
    auto target = start_point(s, cmd);
    if (!target.ok()) return target.error();
    auto tag = create_tag(s.refs, cmd.target, target.value(), cmd.message.value_or(""));
    if (!tag.ok()) return tag.error();
    return "Created tag " + cmd.target;
}

static Result<std::string> do_delete_tag(Snapshot& s, const Command& cmd) {
    auto removed = delete_tag(s.refs, cmd.target);
    if (!removed.ok()) return removed.error();
    return "Deleted tag '" + cmd.target + "' (was " + removed.value().target + ")";
}

static std::string list_tags(const Snapshot& s) {
    std::string out;
    for (const auto& name : sorted_tag_names(s.refs)) {
        if (!out.empty()) out += "\n";
        out += name;
    }
    return out;
}

static Result<std::string> do_rebase(Snapshot& s, const Command& cmd) {
    auto head = require_head(s);
    if (!head.ok()) return head.error();
    auto onto = resolve_ref(s, cmd.target);
    if (!onto.ok()) return make_error(ErrorCode::UnknownRef, cmd.target, "invalid upstream '" + cmd.target + "'");
    auto branch = current_branch(s);
    std::string label = branch ? *branch : std::string("HEAD");

    if (is_ancestor(s.graph, onto.value(), head.value())) return "Current branch " + label + " is up to date.";
    if (is_ancestor(s.graph, head.value(), onto.value())) {
        move_head_to(s, onto.value());
        return "Fast-forwarded " + label + " to " + cmd.target + ".";
    }

    auto todo = plan_rebase(s, onto.value());
    if (!todo.ok()) return todo.error();
    auto started = start_rebase(s, cmd.target, todo.value());
    if (!started.ok()) return started.error();
    auto done = continue_rebase(started.value());
    if (!done.ok()) return done.error();
    if (done.value().status != RebaseStatus::Completed || !done.value().result) {
        return make_error(ErrorCode::InvalidSessionState, cmd.target, "rebase did not complete");
    }
    s = *done.value().result;
    if (branch) return "Successfully rebased and updated refs/heads/" + *branch + ".";
    return std::string("Successfully rebased.");
}

static std::string remote_or_default(const Command& cmd) {
    return cmd.target.empty() ? std::string("origin") : cmd.target;
}

static Result<std::string> branch_or_current(const Snapshot& s, const Command& cmd, const char* verb) {
    if (cmd.branch) return *cmd.branch;
    if (auto b = current_branch(s)) return *b;
    return make_error(ErrorCode::InvalidArgument, "HEAD", std::string("You are not currently on a branch; name the branch to ") + verb);
}

static Result<std::string> do_remote_add(Snapshot& s, const Command& cmd) {
    auto added = add_remote(s.refs, cmd.target, cmd.url);
    if (!added.ok()) return added.error();
    return "Added remote " + cmd.target;
}

static std::string list_remotes(const Snapshot& s, const Command& cmd) {
    std::vector<std::string> names = sorted_remote_names(s.refs);
    if (names.empty()) return "No remotes configured";
    std::string text;
    for (const auto& name : names) {
        if (!text.empty()) text += "\n";
        if (!cmd.verbose) {
            text += name;
            continue;
        }
        const std::string& url = s.refs.remotes.at(name).url;
        text += name + "\t" + url + " (fetch)\n" + name + "\t" + url + " (push)";
    }
    return text;
}

// Refreshes <remote>/* from the remote's heads, one line per moved ref.
static Result<std::string> fetch_remote(Snapshot& s, const std::string& remote) {
    std::unordered_map<std::string, CommitId> before;
    for (const auto& kv : s.refs.tracking) before[kv.first] = kv.second.target;
    auto updated = refresh_tracking(s.refs, remote);
    if (!updated.ok()) return updated.error();

    std::string text = "Fetched from " + remote;
    for (const auto& ref : updated.value()) {
        std::string branch = ref.name.substr(remote.size() + 1);
        auto old = before.find(ref.name);
        if (old == before.end()) {
            text += "\n * [new branch]      " + branch + " -> " + ref.name;
        } else if (old->second != ref.target) {
            text += "\n   " + old->second + ".." + ref.target + "  " + branch + " -> " + ref.name;
        }
    }
    return text;
}

static Result<std::string> do_fetch(Snapshot& s, const Command& cmd) {
    return fetch_remote(s, remote_or_default(cmd));
}

static Result<std::string> do_pull(Snapshot& s, const Command& cmd, std::vector<Advisory>& advisories) {
    const std::string remote = remote_or_default(cmd);
    auto branch = branch_or_current(s, cmd, "pull");
    if (!branch.ok()) return branch.error();
    auto fetched = fetch_remote(s, remote);
    if (!fetched.ok()) return fetched.error();

    const std::string tracking = remote + "/" + branch.value();
    if (!find_tracking(s.refs, tracking)) {
        return make_error(ErrorCode::UnknownRef, tracking, "couldn't find remote ref " + branch.value());
    }
    Command merge;
    merge.type = CommandType::Merge;
    merge.target = tracking;
    merge.message = "Merge branch '" + branch.value() + "' of " + find_remote(s.refs, remote)->url;
    auto merged = do_merge(s, merge, advisories);
    if (!merged.ok()) return merged.error();
    return fetched.value() + "\n" + merged.value();
}

// Refuses to move a remote branch to a commit that does not contain its
// current tip unless forced.
static Result<std::string> do_push(Snapshot& s, const Command& cmd) {
    const std::string remote = remote_or_default(cmd);
    auto branch = branch_or_current(s, cmd, "push");
    if (!branch.ok()) return branch.error();
    const Branch* local = find_branch(s.refs, branch.value());
    if (!local) return make_error(ErrorCode::UnknownRef, branch.value(), "src refspec " + branch.value() + " does not match any");
    const Remote* r = find_remote(s.refs, remote);
    if (!r) return make_error(ErrorCode::UnknownRemote, remote, "'" + remote + "' does not appear to be a git repository");

    const CommitId tip = local->target;
    auto existing = r->branches.find(branch.value());
    if (existing != r->branches.end()) {
        if (existing->second == tip) return std::string("Everything up-to-date");
        if (!cmd.force && !is_ancestor(s.graph, existing->second, tip)) {
            return make_error(ErrorCode::NonFastForward, branch.value(),
                              "Updates were rejected because the tip of your current branch is behind its remote counterpart");
        }
    }
    auto published = publish_branch(s.refs, remote, branch.value(), tip);
    if (!published.ok()) return published.error();
    return "Pushed to " + published.value().name;
}

static std::string status_text(const Snapshot& s) {
    std::string text = describe_head(s);
    if (!head_commit(s)) return text + "\n\nNo commits yet";
    return text + "\nnothing to commit, working tree clean";
}

// One line per commit, newest first, decorated like `git log --oneline --decorate`.
static Result<std::string> log_text(const Snapshot& s, const Command& cmd) {
    auto start = resolve_ref(s, cmd.target.empty() ? std::string("HEAD") : cmd.target);
    if (!start.ok()) return start.error();
    std::vector<CommitId> ids;
    if (cmd.firstParent) {
        auto walk = first_parent_walk(s.graph, start.value());
        if (!walk.ok()) return walk.error();
        ids = walk.value();
    } else {
        ids = history_by_date(s.graph, start.value());
    }
    if (cmd.maxCount >= 0 && ids.size() > static_cast<size_t>(cmd.maxCount)) ids.resize(static_cast<size_t>(cmd.maxCount));

    auto head = head_commit(s);
    std::ostringstream out;
    for (size_t i = 0; i < ids.size(); ++i) {
        const CommitId& id = ids[i];
        std::vector<std::string> decorations;
        if (head && *head == id) {
            auto b = current_branch(s);
            decorations.push_back(b ? "HEAD -> " + *b : std::string("HEAD"));
        }
        for (const auto& name : sorted_branch_names(s.refs)) {
            if (s.refs.branches.at(name).target == id && current_branch(s) != name) decorations.push_back(name);
        }
        for (const auto& name : sorted_tracking_names(s.refs)) {
            if (s.refs.tracking.at(name).target == id) decorations.push_back(name);
        }
        for (const auto& name : sorted_tag_names(s.refs)) {
            if (s.refs.tags.at(name).target == id) decorations.push_back("tag: " + name);
        }
        out << id;
        if (!decorations.empty()) {
            out << " (";
            for (size_t d = 0; d < decorations.size(); ++d) out << (d ? ", " : "") << decorations[d];
            out << ")";
        }
        out << " " << first_line(find_commit(s.graph, id)->message);
        if (i + 1 < ids.size()) out << "\n";
    }
    return out.str();
}

Result<CommandOutcome> apply_command(const Snapshot& s0, const Command& cmd) {
    CommandOutcome outcome;
    outcome.snapshot = s0;
    Snapshot& s = outcome.snapshot;
    Result<std::string> message = std::string();

    switch (cmd.type) {
        case CommandType::Commit:
            message = do_commit(s, cmd);
            break;
        case CommandType::CreateBranch:
            message = do_create_branch(s, cmd);
            break;
        case CommandType::DeleteBranch:
            message = do_delete_branch(s, cmd);
            break;
        case CommandType::ListBranches:
            message = list_branches(s, cmd);
            break;
        case CommandType::Checkout:
            message = do_checkout(s, cmd, false);
            break;
        case CommandType::Switch:
            message = do_checkout(s, cmd, true);
            break;
        case CommandType::CheckoutNewBranch:
        case CommandType::SwitchNewBranch:
            message = do_checkout_new_branch(s, cmd);
            break;
        case CommandType::Merge:
            message = do_merge(s, cmd, outcome.advisories);
            break;
        case CommandType::CherryPick:
            message = do_cherry_pick(s, cmd);
            break;
        case CommandType::Reset:
            message = do_reset(s, cmd);
            break;
        case CommandType::Revert:
            message = do_revert(s, cmd);
            break;
        case CommandType::CreateTag:
            message = do_create_tag(s, cmd);
            break;
        case CommandType::DeleteTag:
            message = do_delete_tag(s, cmd);
            break;
        case CommandType::ListTags:
            message = list_tags(s);
            break;
        case CommandType::Rebase:
            message = do_rebase(s, cmd);
            break;
        case CommandType::Status:
            message = status_text(s);
            break;
        case CommandType::Log:
            message = log_text(s, cmd);
            break;
        case CommandType::RemoteAdd:
            message = do_remote_add(s, cmd);
            break;
        case CommandType::ListRemotes:
            message = list_remotes(s, cmd);
            break;
        case CommandType::Fetch:
            message = do_fetch(s, cmd);
            break;
        case CommandType::Pull:
            message = do_pull(s, cmd, outcome.advisories);
            break;
        case CommandType::Push:
            message = do_push(s, cmd);
            break;
        case CommandType::RebaseInteractive:
        case CommandType::RebaseContinue:
        case CommandType::RebaseAbort:
        case CommandType::Undo:
        case CommandType::Redo:
            return make_error(ErrorCode::InvalidSessionState, command_type_name(cmd.type),
                              std::string("'") + command_type_name(cmd.type) + "' needs a session");
    }
    if (!message.ok()) return message.error();
    outcome.message = std::move(message.value());
    return outcome;
}

const char* command_type_name(CommandType type) {
    switch (type) {
        case CommandType::Commit: return "commit";
        case CommandType::CreateBranch: return "branch";
        case CommandType::DeleteBranch: return "branch -d";
        case CommandType::ListBranches: return "branch --list";
        case CommandType::Checkout: return "checkout";
        case CommandType::CheckoutNewBranch: return "checkout -b";
        case CommandType::Switch: return "switch";
        case CommandType::SwitchNewBranch: return "switch -c";
        case CommandType::Merge: return "merge";
        case CommandType::CherryPick: return "cherry-pick";
        case CommandType::Reset: return "reset";
        case CommandType::Revert: return "revert";
        case CommandType::CreateTag: return "tag";
        case CommandType::DeleteTag: return "tag -d";
        case CommandType::ListTags: return "tag --list";
        case CommandType::Rebase: return "rebase";
        case CommandType::RebaseInteractive: return "rebase -i";
        case CommandType::RebaseContinue: return "rebase --continue";
        case CommandType::RebaseAbort: return "rebase --abort";
        case CommandType::Status: return "status";
        case CommandType::Log: return "log";
        case CommandType::RemoteAdd: return "remote add";
        case CommandType::ListRemotes: return "remote";
        case CommandType::Fetch: return "fetch";
        case CommandType::Pull: return "pull";
        case CommandType::Push: return "push";
        case CommandType::Undo: return "undo";
        case CommandType::Redo: return "redo";
    }
    return "unknown";
}

const char* reset_mode_name(ResetMode mode) {
    switch (mode) {
        case ResetMode::Soft: return "soft";
        case ResetMode::Mixed: return "mixed";
        case ResetMode::Hard: return "hard";
    }
    return "mixed";
}

bool is_read_only(CommandType type) {
    switch (type) {
        case CommandType::ListBranches:
        case CommandType::ListTags:
        case CommandType::ListRemotes:
        case CommandType::Status:
        case CommandType::Log:
            return true;
        default:
            return false;
    }
}

} // namespace gitsim
