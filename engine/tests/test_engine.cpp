#include "gitsim_engine/commit_graph.hpp"
#include "gitsim_engine/engine.hpp"
#include "gitsim_engine/state_utils.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <vector>

using namespace gitsim;
using namespace gitsim_test;

static Snapshot fresh() { return initial_snapshot(EngineConfig()); }

static Snapshot step(const Snapshot& s, const Command& cmd) { return run(s, cmd).snapshot; }

static Command branch_cmd(CommandType type, const std::string& name, bool force = false) {
    Command c = make_cmd(type, name);
    c.force = force;
    return c;
}

static Command commit_with_changes(const std::string& message, std::vector<std::string> changes) {
    Command c = commit_cmd(message);
    c.changes = std::move(changes);
    return c;
}

int main() {
    quiet_logs();

    // 1) Initial state
    {
        Snapshot s = fresh();
        verify_invariants(s);
        assert_eq(head_of(s), "C0", "root id");
        assert_eq(current_branch(s).value_or(""), "main", "attached to main");
        assert_eq(message_at(s, "C0"), "Initial commit", "root message");
    }

    // 2) Commit, default message, amend
    {
        Snapshot s0 = fresh();
        CommandOutcome out = run(s0, commit_cmd("Add file"));
        assert_eq(out.message, "[C1] Add file", "commit output");
        assert_eq(head_of(out.snapshot), "C1", "branch advanced");
        assert_eq(head_of(s0), "C0", "input snapshot untouched");
        assert_eq(commit_at(out.snapshot, "C1").parents.front(), "C0", "parent is previous head");
        verify_invariants(out.snapshot);

        Snapshot s1 = step(out.snapshot, make_cmd(CommandType::Commit));
        assert_eq(message_at(s1, head_of(s1)), "Quick commit", "default message");

        Command amend = commit_cmd("Fix");
        amend.amend = true;
        CommandOutcome amended = run(s1, amend);
        CommitId tip = head_of(amended.snapshot);
        assert_eq(message_at(amended.snapshot, tip), "Fix", "amend replaces message");
        assert_eq(commit_at(amended.snapshot, tip).parents.front(), "C1", "amend keeps parents");
        assert_true(has_commit(amended.snapshot.graph, head_of(s1)), "amended commit stays in the graph");
        verify_invariants(amended.snapshot);
    }

    // 3) Branch create, list, delete
    {
        Snapshot s = step(fresh(), commit_cmd("one"));
        CommandOutcome created = run(s, branch_cmd(CommandType::CreateBranch, "feature"));
        assert_eq(created.message, "Created branch feature", "create output");
        s = created.snapshot;
        assert_eq(find_branch(s.refs, "feature")->target, "C1", "branch at HEAD");
        assert_eq(current_branch(s).value_or(""), "main", "create does not switch");

        expect_error(apply_command(s, branch_cmd(CommandType::CreateBranch, "feature")), ErrorCode::DuplicateBranch, "duplicate");
        expect_error(apply_command(s, branch_cmd(CommandType::CreateBranch, "bad..name")), ErrorCode::InvalidArgument, "bad name");
        Command fromUnknown = branch_cmd(CommandType::CreateBranch, "x");
        fromUnknown.startPoint = "nowhere";
        expect_error(apply_command(s, fromUnknown), ErrorCode::UnknownRef, "unknown start point");
        expect_error(apply_command(s, branch_cmd(CommandType::CreateBranch, "main", true)), ErrorCode::BranchCheckedOut,
                     "force-moving the current branch");

        Command old = branch_cmd(CommandType::CreateBranch, "old");
        old.startPoint = "HEAD~1";
        s = step(s, old);
        assert_eq(find_branch(s.refs, "old")->target, "C0", "start point expression");
        Command moved = branch_cmd(CommandType::CreateBranch, "old", true);
        CommandOutcome reset = run(s, moved);
        assert_eq(reset.message, "Reset branch old", "force output");
        assert_eq(find_branch(reset.snapshot.refs, "old")->target, "C1", "forced to HEAD");

        assert_eq(run(s, make_cmd(CommandType::ListBranches)).message, "  feature\n* main\n  old", "listing");

        CommandOutcome deleted = run(s, make_cmd(CommandType::DeleteBranch, "feature"));
        assert_eq(deleted.message, "Deleted branch feature (was C1)", "delete output");
        assert_true(find_branch(deleted.snapshot.refs, "feature") == nullptr, "branch gone");
        expect_error(apply_command(s, make_cmd(CommandType::DeleteBranch, "main")), ErrorCode::BranchCheckedOut, "delete current");
        expect_error(apply_command(s, make_cmd(CommandType::DeleteBranch, "ghost")), ErrorCode::UnknownRef, "delete unknown");
        verify_invariants(deleted.snapshot);
    }

    // 4) Unmerged branches need force
    {
        Snapshot s = step(fresh(), make_cmd(CommandType::CheckoutNewBranch, "topic"));
        s = step(s, commit_cmd("topic work"));
        s = step(s, make_cmd(CommandType::Checkout, "main"));
        expect_error(apply_command(s, make_cmd(CommandType::DeleteBranch, "topic")), ErrorCode::NotFullyMerged, "unmerged");
        Snapshot forced = step(s, branch_cmd(CommandType::DeleteBranch, "topic", true));
        assert_true(find_branch(forced.refs, "topic") == nullptr, "forced delete");
        assert_true(has_commit(forced.graph, "C1"), "commit survives its branch");
    }

    // 5) Checkout and switch
    {
        Snapshot s = step(fresh(), commit_cmd("one"));
        CommandOutcome detached = run(s, make_cmd(CommandType::Checkout, "C0"));
        assert_eq(detached.message, "HEAD is now at C0 Initial commit", "detach output");
        assert_true(detached.snapshot.refs.head.kind == HeadKind::Detached, "detached");
        assert_eq(head_of(detached.snapshot), "C0", "detached at C0");
        assert_eq(find_branch(detached.snapshot.refs, "main")->target, "C1", "branch untouched");

        expect_error(apply_command(s, make_cmd(CommandType::Checkout, "nope")), ErrorCode::UnknownRef, "checkout unknown");
        expect_error(apply_command(s, make_cmd(CommandType::Switch, "C0")), ErrorCode::UnknownRef, "switch needs a branch");

        CommandOutcome created = run(s, make_cmd(CommandType::CheckoutNewBranch, "topic"));
        assert_eq(created.message, "Switched to a new branch 'topic'", "checkout -b output");
        assert_eq(current_branch(created.snapshot).value_or(""), "topic", "on topic");
        assert_eq(run(created.snapshot, make_cmd(CommandType::Checkout, "topic")).message, "Already on 'topic'", "already on");
        CommandOutcome back = run(created.snapshot, make_cmd(CommandType::Switch, "main"));
        assert_eq(back.message, "Switched to branch 'main'", "switch output");

        Command recreate = branch_cmd(CommandType::SwitchNewBranch, "topic", true);
        recreate.startPoint = "C0";
        CommandOutcome reset = run(back.snapshot, recreate);
        assert_eq(reset.message, "Switched to and reset branch 'topic'", "switch -C output");
        assert_eq(head_of(reset.snapshot), "C0", "topic reset to C0");
        expect_error(apply_command(back.snapshot, make_cmd(CommandType::SwitchNewBranch, "topic")), ErrorCode::DuplicateBranch,
                     "switch -c existing");

        // Committing while detached moves only HEAD.
        Snapshot d = step(detached.snapshot, commit_cmd("floating"));
        assert_true(d.refs.head.kind == HeadKind::Detached, "still detached");
        assert_eq(commit_at(d, head_of(d)).parents.front(), "C0", "built on C0");
        assert_eq(find_branch(d.refs, "main")->target, "C1", "main did not move");
    }

    // 6) Merge: true merge, already up to date, fast-forward
    {
        Snapshot s = step(fresh(), commit_cmd("A"));               // C1
        s = step(s, make_cmd(CommandType::CheckoutNewBranch, "feature"));
        s = step(s, commit_cmd("B"));                              // C2
        s = step(s, make_cmd(CommandType::Checkout, "main"));
        s = step(s, commit_cmd("C"));                              // C3
        CommandOutcome merged = run(s, make_cmd(CommandType::Merge, "feature"));
        assert_eq(merged.message, "Merge made by the 'ort' strategy.\n[C4] Merge branch 'feature'", "merge output");
        const Commit& m = commit_at(merged.snapshot, "C4");
        assert_eq_size(m.parents.size(), 2, "two parents");
        assert_eq(m.parents[0], "C3", "first parent is ours");
        assert_eq(m.parents[1], "C2", "second parent is theirs");
        assert_eq_size(merged.advisories.size(), 1, "one advisory");
        assert_true(merged.advisories[0].code == AdvisoryCode::ConflictsUnknown, "no change data");
        verify_invariants(merged.snapshot);

        assert_eq(run(merged.snapshot, make_cmd(CommandType::Merge, "feature")).message, "Already up to date.", "up to date");

        Snapshot f = step(merged.snapshot, make_cmd(CommandType::Checkout, "feature"));
        CommandOutcome ff = run(f, make_cmd(CommandType::Merge, "main"));
        assert_eq(ff.message, "Updating C2..C4\nFast-forward", "ff output");
        assert_eq(head_of(ff.snapshot), "C4", "fast-forwarded");
        assert_eq_size(ff.snapshot.graph.commits.size(), merged.snapshot.graph.commits.size(), "no new commit");

        expect_error(apply_command(s, make_cmd(CommandType::Merge, "ghost")), ErrorCode::UnknownRef, "merge unknown");
    }

    // 7) Merge --no-ff, custom message, unrelated histories
    {
        Snapshot s = step(fresh(), make_cmd(CommandType::CheckoutNewBranch, "f"));
        s = step(s, commit_cmd("F"));                              // C1
        s = step(s, make_cmd(CommandType::Checkout, "main"));
        Command noff = make_cmd(CommandType::Merge, "f");
        noff.noFastForward = true;
        noff.message = "Bring in f";
        CommandOutcome out = run(s, noff);
        CommitId tip = head_of(out.snapshot);
        assert_eq(message_at(out.snapshot, tip), "Bring in f", "custom merge message");
        assert_eq(commit_at(out.snapshot, tip).parents[0], "C0", "no-ff keeps ours first");
        assert_eq(commit_at(out.snapshot, tip).parents[1], "C1", "no-ff theirs second");

        Snapshot two = parse_snapshot(R"({
            "commits": [{"id": "R1", "parents": [], "message": "root one"},
                        {"id": "X1", "parents": [], "message": "root two"}],
            "branches": [{"name": "main", "target": "R1"}, {"name": "other", "target": "X1"}],
            "head": {"type": "branch", "name": "main"}
        })");
        expect_error(apply_command(two, make_cmd(CommandType::Merge, "other")), ErrorCode::UnrelatedHistories, "unrelated");
    }

    // 8) Merge advisories from tracked changes
    {
        Snapshot s = step(fresh(), make_cmd(CommandType::CheckoutNewBranch, "left"));
        s = step(s, commit_with_changes("left edit", {"title", "body"}));
        s = step(s, make_cmd(CommandType::Checkout, "main"));
        Snapshot clash = step(s, commit_with_changes("main edit", {"title"}));
        CommandOutcome conflicted = run(clash, make_cmd(CommandType::Merge, "left"));
        assert_eq_size(conflicted.advisories.size(), 1, "conflict advisory");
        assert_true(conflicted.advisories[0].code == AdvisoryCode::ConflictsDetected, "conflicts detected");
        assert_eq_size(conflicted.advisories[0].fields.size(), 1, "one overlapping field");
        assert_eq(conflicted.advisories[0].fields[0], "title", "overlap is title");

        Snapshot clean = step(s, commit_with_changes("main edit", {"footer"}));
        CommandOutcome merged = run(clean, make_cmd(CommandType::Merge, "left"));
        assert_true(merged.advisories.empty(), "disjoint changes merge cleanly");
        const Commit& m = commit_at(merged.snapshot, head_of(merged.snapshot));
        assert_true(m.changes.has_value() && m.changes->empty(), "merge commit records no changes of its own");
    }

    // 9) Cherry-pick
    {
        Snapshot s = step(fresh(), make_cmd(CommandType::CheckoutNewBranch, "f"));
        s = step(s, commit_cmd("F1"));                             // C1
        s = step(s, commit_cmd("F2"));                             // C2
        s = step(s, make_cmd(CommandType::Checkout, "main"));
        Command pick = make_cmd(CommandType::CherryPick);
        pick.commits = {"C1", "f"};
        CommandOutcome out = run(s, pick);
        assert_eq(out.message, "[C3] F1\n[C4] F2", "cherry-pick output");
        assert_eq(commit_at(out.snapshot, "C3").parents.front(), "C0", "first pick on main");
        assert_eq(commit_at(out.snapshot, "C4").parents.front(), "C3", "second pick stacks");
        assert_eq(find_branch(out.snapshot.refs, "f")->target, "C2", "source branch untouched");
        verify_invariants(out.snapshot);

        Command bad = make_cmd(CommandType::CherryPick);
        bad.commits = {"C99"};
        expect_error(apply_command(s, bad), ErrorCode::UnknownCommit, "unknown commit");

        Command noff = make_cmd(CommandType::Merge, "f");
        noff.noFastForward = true;
        Snapshot merged = step(s, noff);
        Snapshot other = step(merged, make_cmd(CommandType::Checkout, "f"));
        Command pickMerge = make_cmd(CommandType::CherryPick);
        pickMerge.commits = {"main"};
        expect_error(apply_command(other, pickMerge), ErrorCode::InvalidArgument, "merge commits need -m");
    }

    // 10) Reset and revert
    {
        Snapshot s = step(fresh(), commit_cmd("one"));
        s = step(s, commit_cmd("two"));
        Command hard = make_cmd(CommandType::Reset, "HEAD~2");
        hard.resetMode = ResetMode::Hard;
        CommandOutcome out = run(s, hard);
        assert_eq(out.message, "HEAD is now at C0 Initial commit", "hard reset output");
        assert_eq(find_branch(out.snapshot.refs, "main")->target, "C0", "branch moved back");
        assert_true(has_commit(out.snapshot.graph, "C2"), "commits are kept");
        CommandOutcome mixed = run(s, make_cmd(CommandType::Reset, "C1"));
        assert_eq(mixed.message, "HEAD is now at C1 one (mixed)", "mixed reset output");
        expect_error(apply_command(s, make_cmd(CommandType::Reset, "nowhere")), ErrorCode::UnknownRef, "reset unknown");

        CommandOutcome reverted = run(s, make_cmd(CommandType::Revert, "C1"));
        CommitId tip = head_of(reverted.snapshot);
        assert_eq(message_at(reverted.snapshot, tip), "Revert \"one\"", "revert message");
        assert_eq(commit_at(reverted.snapshot, tip).parents.front(), "C2", "revert on top of HEAD");
        expect_error(apply_command(s, make_cmd(CommandType::Revert, "C42")), ErrorCode::UnknownCommit, "revert unknown");
    }

    // 11) Tags
    {
        Snapshot s = step(fresh(), commit_cmd("one"));
        CommandOutcome tagged = run(s, make_cmd(CommandType::CreateTag, "v1"));
        assert_eq(tagged.message, "Created tag v1", "tag output");
        s = tagged.snapshot;
        assert_eq(find_tag(s.refs, "v1")->target, "C1", "tag at HEAD");
        expect_error(apply_command(s, make_cmd(CommandType::CreateTag, "v1")), ErrorCode::DuplicateTag, "duplicate tag");
        Command old = make_cmd(CommandType::CreateTag, "v0");
        old.startPoint = "C0";
        s = step(s, old);
        assert_eq(run(s, make_cmd(CommandType::ListTags)).message, "v0\nv1", "sorted tags");

        Snapshot moved = step(s, commit_cmd("two"));
        assert_eq(find_tag(moved.refs, "v1")->target, "C1", "tags do not move");
        CommandOutcome deleted = run(s, make_cmd(CommandType::DeleteTag, "v1"));
        assert_eq(deleted.message, "Deleted tag 'v1' (was C1)", "delete tag output");
        expect_error(apply_command(deleted.snapshot, make_cmd(CommandType::DeleteTag, "v1")), ErrorCode::UnknownRef, "delete twice");
        CommandOutcome viaTag = run(s, make_cmd(CommandType::Checkout, "v0"));
        assert_eq(head_of(viaTag.snapshot), "C0", "checkout a tag detaches");
    }

    // 12) Non-interactive rebase
    {
        Snapshot s = step(fresh(), make_cmd(CommandType::CheckoutNewBranch, "feature"));
        s = step(s, commit_cmd("F1"));                             // C1
        s = step(s, commit_cmd("F2"));                             // C2
        s = step(s, make_cmd(CommandType::Checkout, "main"));
        s = step(s, commit_cmd("M1"));                             // C3
        s = step(s, make_cmd(CommandType::Checkout, "feature"));
        CommandOutcome out = run(s, make_cmd(CommandType::Rebase, "main"));
        assert_eq(out.message, "Successfully rebased and updated refs/heads/feature.", "rebase output");
        assert_eq(current_branch(out.snapshot).value_or(""), "feature", "still on feature");
        auto walk = expect_ok(first_parent_walk(out.snapshot.graph, head_of(out.snapshot)), "walk");
        assert_eq_size(walk.size(), 4, "two replayed on top of main");
        assert_eq(message_at(out.snapshot, walk[0]), "F2", "newest replayed");
        assert_eq(message_at(out.snapshot, walk[1]), "F1", "oldest replayed");
        assert_eq(walk[2], "C3", "onto main");
        assert_true(walk[0] != "C2" && walk[1] != "C1", "replayed commits are new");
        assert_true(has_commit(out.snapshot.graph, "C2"), "originals kept");
        verify_invariants(out.snapshot);

        assert_eq(run(out.snapshot, make_cmd(CommandType::Rebase, "main")).message, "Current branch feature is up to date.",
                  "rebase onto ancestor");
        Snapshot behind = step(out.snapshot, make_cmd(CommandType::Checkout, "main"));
        CommandOutcome ff = run(behind, make_cmd(CommandType::Rebase, "feature"));
        assert_eq(ff.message, "Fast-forwarded main to feature.", "rebase fast-forward");
        assert_eq(head_of(ff.snapshot), head_of(out.snapshot), "main at feature");
        expect_error(apply_command(s, make_cmd(CommandType::Rebase, "ghost")), ErrorCode::UnknownRef, "rebase unknown");
    }

    // 13) Status and log
    {
        Snapshot s = fresh();
        assert_eq(run(s, make_cmd(CommandType::Status)).message, "On branch main\nnothing to commit, working tree clean", "status");
        s = step(s, commit_cmd("Second"));
        Command other = make_cmd(CommandType::CreateBranch, "other");
        other.startPoint = "C0";
        s = step(s, other);
        Command tag = make_cmd(CommandType::CreateTag, "v1");
        tag.startPoint = "C0";
        s = step(s, tag);
        assert_eq(run(s, make_cmd(CommandType::Log)).message, "C1 (HEAD -> main) Second\nC0 (other, tag: v1) Initial commit", "log");
        Command one = make_cmd(CommandType::Log);
        one.maxCount = 1;
        assert_eq(run(s, one).message, "C1 (HEAD -> main) Second", "log -n 1");
        Snapshot d = step(s, make_cmd(CommandType::Checkout, "C0"));
        assert_eq(run(d, make_cmd(CommandType::Status)).message, "HEAD detached at C0\nnothing to commit, working tree clean",
                  "detached status");
        assert_eq(run(d, make_cmd(CommandType::ListBranches)).message, "* (HEAD detached at C0)\n  main\n  other", "detached list");
        expect_error(apply_command(s, make_cmd(CommandType::Log, "nowhere")), ErrorCode::UnknownRef, "log unknown start");
    }

    // 14) Session-level commands are rejected by the pure engine
    {
        Snapshot s = fresh();
        expect_error(apply_command(s, make_cmd(CommandType::Undo)), ErrorCode::InvalidSessionState, "undo");
        expect_error(apply_command(s, make_cmd(CommandType::RebaseInteractive, "main")), ErrorCode::InvalidSessionState, "rebase -i");
        assert_true(is_read_only(CommandType::Log) && !is_read_only(CommandType::Commit), "read-only classification");
    }

    // 15) Remotes: add, list, push, fetch, pull
    {
        Snapshot s = fresh();
        assert_eq(run(s, make_cmd(CommandType::ListRemotes)).message, "No remotes configured", "no remotes");
        expect_error(apply_command(s, make_cmd(CommandType::Push, "origin")), ErrorCode::UnknownRemote, "push without a remote");
        expect_error(apply_command(s, make_cmd(CommandType::Fetch)), ErrorCode::UnknownRemote, "fetch defaults to origin");

        Command add = make_cmd(CommandType::RemoteAdd, "origin");
        add.url = "https://example.com/game.git";
        CommandOutcome added = run(s, add);
        assert_eq(added.message, "Added remote origin", "remote add");
        s = added.snapshot;
        expect_error(apply_command(s, add), ErrorCode::DuplicateRemote, "remote add twice");
        Command noUrl = make_cmd(CommandType::RemoteAdd, "mirror");
        expect_error(apply_command(s, noUrl), ErrorCode::InvalidArgument, "remote needs a url");
        Command verbose = make_cmd(CommandType::ListRemotes);
        verbose.verbose = true;
        assert_eq(run(s, verbose).message,
                  "origin\thttps://example.com/game.git (fetch)\norigin\thttps://example.com/game.git (push)", "remote -v");

        CommandOutcome pushed = run(s, make_cmd(CommandType::Push));
        assert_eq(pushed.message, "Pushed to origin/main", "first push");
        s = pushed.snapshot;
        verify_invariants(s);
        assert_eq(expect_ok(resolve_ref(s, "origin/main"), "tracking ref resolves"), "C0", "origin/main at C0");
        assert_eq(run(s, make_cmd(CommandType::Push)).message, "Everything up-to-date", "nothing to push");

        s = step(s, commit_cmd("Local work"));
        assert_eq(run(s, make_cmd(CommandType::Log)).message, "C1 (HEAD -> main) Local work\nC0 (origin/main) Initial commit",
                  "tracking refs decorate the log");
        s = step(s, make_cmd(CommandType::Push));
        assert_eq(find_tracking(s.refs, "origin/main")->target, "C1", "push moves the tracking ref");
        assert_eq(find_remote(s.refs, "origin")->branches.at("main"), "C1", "push moves the remote head");

        // Someone else's commit lands on the remote; local history diverges.
        Snapshot upstream = step(s, commit_cmd("Their work"));
        CommitId theirs = head_of(upstream);
        s.graph = upstream.graph;
        expect_ok(publish_branch(s.refs, "origin", "main", theirs), "publish");
        assert_eq(head_of(s), "C1", "local main still at C1");
        Command track = make_cmd(CommandType::ListBranches);
        track.remoteBranches = true;
        assert_eq(run(s, track).message, "  origin/main", "branch -r");

        s = step(s, commit_cmd("Mine"));
        expect_error(apply_command(s, make_cmd(CommandType::Push)), ErrorCode::NonFastForward, "diverged push rejected");
        Command force = make_cmd(CommandType::Push, "origin");
        force.branch = "main";
        force.force = true;
        Snapshot forced = step(s, force);
        assert_eq(find_remote(forced.refs, "origin")->branches.at("main"), head_of(s), "forced push");

        CommandOutcome pulled = run(s, make_cmd(CommandType::Pull));
        verify_invariants(pulled.snapshot);
        const Commit& merge = commit_at(pulled.snapshot, head_of(pulled.snapshot));
        assert_eq_size(merge.parents.size(), 2, "pull merges");
        assert_eq(merge.parents[1], theirs, "second parent is the remote head");
        assert_eq(merge.message, "Merge branch 'main' of https://example.com/game.git", "pull merge message");
        assert_eq(run(pulled.snapshot, make_cmd(CommandType::Push)).message, "Pushed to origin/main", "push after pull");

        Command pullGhost = make_cmd(CommandType::Pull, "origin");
        pullGhost.branch = "ghost";
        expect_error(apply_command(s, pullGhost), ErrorCode::UnknownRef, "pull of a branch the remote lacks");
        Command pushGhost = make_cmd(CommandType::Push, "origin");
        pushGhost.branch = "ghost";
        expect_error(apply_command(s, pushGhost), ErrorCode::UnknownRef, "push of a missing local branch");
        Snapshot detached = step(s, make_cmd(CommandType::Checkout, "C0"));
        expect_error(apply_command(detached, make_cmd(CommandType::Push)), ErrorCode::InvalidArgument, "push from detached HEAD");
        assert_true(is_read_only(CommandType::ListRemotes) && !is_read_only(CommandType::Fetch), "remote listing is read-only");
    }

    // 16) Fetch reports new and moved tracking refs
    {
        Snapshot s = fresh();
        Command add = make_cmd(CommandType::RemoteAdd, "origin");
        add.url = "/srv/game.git";
        s = step(s, add);
        expect_ok(publish_branch(s.refs, "origin", "main", "C0"), "publish main");
        s.refs.tracking.clear();
        s.refs.trackingOrder.clear();
        CommandOutcome first = run(s, make_cmd(CommandType::Fetch, "origin"));
        assert_eq(first.message, "Fetched from origin\n * [new branch]      main -> origin/main", "new tracking ref");
        s = step(first.snapshot, commit_cmd("Next"));
        Remote& origin = s.refs.remotes.at("origin");
        origin.branches["main"] = "C1";
        CommandOutcome moved = run(s, make_cmd(CommandType::Fetch));
        assert_eq(moved.message, "Fetched from origin\n   C0..C1  main -> origin/main", "moved tracking ref");
        assert_eq(run(moved.snapshot, make_cmd(CommandType::Fetch)).message, "Fetched from origin", "nothing new");
    }

    // 17) Revision suffixes need a name to apply to
    {
        Snapshot s = step(fresh(), commit_cmd("Second"));
        expect_error(resolve_ref(s, "^"), ErrorCode::UnknownRef, "bare caret");
        expect_error(resolve_ref(s, "~1"), ErrorCode::UnknownRef, "bare tilde");
        expect_error(resolve_ref(s, ""), ErrorCode::UnknownRef, "empty name");
        assert_eq(expect_ok(resolve_ref(s, "HEAD~1"), "HEAD~1"), "C0", "suffix on a name");
    }

    // 18) Property-ish fuzz: random commands keep the snapshot consistent
    {
        unsigned seed = static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
        std::mt19937 rng(seed);
        const std::vector<std::string> names = {"main", "a", "b", "c"};
        Snapshot s = fresh();
        size_t applied = 0;
        for (int i = 0; i < 400; ++i) {
            Command cmd;
            const std::string& name = names[rng() % names.size()];
            switch (rng() % 9) {
                case 0:
                case 1:
                    cmd = commit_cmd("work " + std::to_string(i));
                    break;
                case 2:
                    cmd = make_cmd(CommandType::CheckoutNewBranch, name);
                    break;
                case 3:
                    cmd = make_cmd(CommandType::Checkout, name);
                    break;
                case 4:
                    cmd = make_cmd(CommandType::Merge, name);
                    cmd.noFastForward = rng() % 2 == 0;
                    break;
                case 5: {
                    cmd = make_cmd(CommandType::CherryPick);
                    cmd.commits = {s.graph.order[rng() % s.graph.order.size()]};
                    break;
                }
                case 6:
                    cmd = make_cmd(CommandType::Reset, "HEAD~1");
                    break;
                case 7:
                    cmd = make_cmd(CommandType::Rebase, name);
                    break;
                default:
                    cmd = make_cmd(CommandType::CreateTag, "t" + std::to_string(i));
                    break;
            }
            auto out = apply_command(s, cmd);
            if (!out.ok()) continue;
            s = out.value().snapshot;
            ++applied;
            if (check_invariants(s)) {
                std::cerr << "[fuzz] seed=" << seed << " failed after " << command_type_name(cmd.type) << " " << cmd.target << "\n";
                std::abort();
            }
        }
        verify_invariants(s);
        assert_true(applied > 0, "fuzz applied commands");
    }

    std::cout << "All engine tests passed.\n";
    return 0;
}
