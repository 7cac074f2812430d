#include "gitsim_engine/session.hpp"
#include "test_helpers.hpp"
#include <sstream>
#include <vector>

using namespace gitsim;
using namespace gitsim_test;

static const std::vector<std::string> kDiverge = {
    "git checkout -b feature", "git commit -m F1", "git commit -m F2", "git commit -m F3",
    "git checkout main",       "git commit -m M1", "git checkout feature"};

static void expect_success(const CommandResult& r, const char* msg) {
    if (!r.success) {
        std::cerr << "Assertion failed: " << msg << " (" << r.message << ")\n";
        std::abort();
    }
}

static void expect_failure(const CommandResult& r, ErrorCode code, const char* msg) {
    assert_true(!r.success, msg);
    assert_true(r.error.has_value(), msg);
    assert_eq(error_code_name(r.error->code), error_code_name(code), msg);
}

static bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

static RebaseTodoItem item(RebaseAction action, const CommitId& commit) {
    RebaseTodoItem t;
    t.action = action;
    t.commit = commit;
    return t;
}

int main() {
    quiet_logs();

    // 1) Commands update the state and the undo history
    {
        Session session;
        CommandResult r = session.execute("git commit -m one");
        expect_success(r, "commit");
        assert_eq(r.message, "[C1] one", "commit output");
        assert_eq(head_of(session.snapshot()), "C1", "state advanced");
        assert_eq_size(session.undo_depth(), 1, "one undo entry");

        expect_success(session.execute("git status"), "status");
        expect_success(session.execute("git log"), "log");
        expect_success(session.execute("branch"), "branch list");
        assert_eq_size(session.undo_depth(), 1, "read-only commands are not recorded");
    }

    // 2) Failures leave everything untouched
    {
        Session session;
        expect_success(session.execute("commit -m one"), "commit");
        Snapshot before = session.snapshot();
        CommandResult r = session.execute("checkout nope");
        expect_failure(r, ErrorCode::UnknownRef, "checkout unknown");
        assert_true(session.snapshot() == before, "state unchanged");
        assert_eq_size(session.undo_depth(), 1, "failure not recorded");
        expect_failure(session.execute("git clone https://example.com/repo.git"), ErrorCode::UnknownCommand, "unknown command");
        expect_failure(session.execute("commit -m \"open"), ErrorCode::InvalidArgument, "bad quoting");
    }

    // 3) Undo and redo
    {
        Session session;
        expect_failure(session.undo(), ErrorCode::NothingToUndo, "empty undo");
        expect_failure(session.redo(), ErrorCode::NothingToRedo, "empty redo");
        expect_success(session.execute("commit -m one"), "commit one");
        expect_success(session.execute("commit -m two"), "commit two");

        CommandResult undone = session.execute("undo");
        expect_success(undone, "undo");
        assert_eq(undone.message, "Undid: commit -m two", "undo output");
        assert_eq(head_of(session.snapshot()), "C1", "back to C1");
        assert_eq_size(session.redo_depth(), 1, "redo available");

        CommandResult redone = session.redo();
        expect_success(redone, "redo");
        assert_eq(redone.message, "Redid: commit -m two", "redo output");
        assert_eq(head_of(session.snapshot()), "C2", "forward to C2");

        expect_success(session.undo(), "undo again");
        expect_success(session.execute("commit -m three"), "new command");
        assert_eq_size(session.redo_depth(), 0, "new command clears redo");
        assert_true(head_of(session.snapshot()) != "C2", "ids are never reused");
    }

    // 4) History is bounded
    {
        EngineConfig config;
        config.historyLimit = 2;
        Session session(config);
        for (int i = 0; i < 5; ++i) expect_success(session.execute("commit -m c" + std::to_string(i)), "commit");
        assert_eq_size(session.undo_depth(), 2, "bounded history");
        expect_success(session.undo(), "undo 1");
        expect_success(session.undo(), "undo 2");
        expect_failure(session.undo(), ErrorCode::NothingToUndo, "oldest entries dropped");
        assert_eq(message_at(session.snapshot(), head_of(session.snapshot())), "c2", "three commits remain");
    }

    // 5) execute_all stops at the first failure
    {
        Session session;
        auto results = session.execute_all({"commit -m a", "checkout nope", "commit -m b"});
        assert_eq_size(results.size(), 2, "stopped after failure");
        assert_true(results[0].success && !results[1].success, "success then failure");
    }

    // 6) Interactive rebase with an edit stop
    {
        Session session;
        for (const auto& r : session.execute_all(kDiverge)) expect_success(r, "setup");
        CommandResult started = session.execute("git rebase -i main");
        expect_success(started, "rebase -i");
        assert_eq(started.message, "Interactive rebase started. 3 commit(s) to rebase onto C4.", "start output");
        assert_true(session.rebase_active(), "rebase active");
        assert_true(session.rebase()->status == RebaseStatus::NotStarted, "waiting for todo");
        assert_eq(head_of(session.snapshot()), "C3", "nothing replayed yet");

        expect_failure(session.execute("commit -m sneaky"), ErrorCode::RebaseInProgress, "commits blocked");
        expect_failure(session.execute("undo"), ErrorCode::RebaseInProgress, "undo blocked");
        CommandResult status = session.execute("status");
        expect_success(status, "status during rebase");
        assert_true(contains(status.message, "interactive rebase in progress; onto C4"), "status mentions rebase");

        CommandResult paused = session.confirm_rebase({item(RebaseAction::Pick, "C1"), item(RebaseAction::Edit, "C2"),
                                                       item(RebaseAction::Pick, "C3")});
        expect_success(paused, "confirm");
        assert_true(contains(paused.message, "Stopped at C2... F2"), "stop message");
        assert_true(session.rebase()->paused, "paused");
        assert_true(session.snapshot().refs.head.kind == HeadKind::Detached, "working view is detached");
        assert_eq(message_at(session.snapshot(), head_of(session.snapshot())), "F2", "at the edited commit");

        expect_success(session.execute("commit --amend -m \"F2 fixed\""), "amend while stopped");
        CommandResult done = session.execute("rebase --continue");
        expect_success(done, "continue");
        assert_eq(done.message, "Successfully rebased and updated refs/heads/feature.", "done output");
        assert_true(!session.rebase_active(), "rebase finished");
        const Snapshot& s = session.snapshot();
        assert_eq(current_branch(s).value_or("-"), "feature", "back on feature");
        CommitId tip = head_of(s);
        assert_eq(message_at(s, tip), "F3", "tip replayed");
        assert_eq(message_at(s, commit_at(s, tip).parents.front()), "F2 fixed", "amended commit kept");
        verify_invariants(s);

        expect_success(session.undo(), "undo the whole rebase");
        assert_eq(head_of(session.snapshot()), "C3", "pre-rebase state");
    }

    // 7) Aborting and misuse of rebase controls
    {
        Session session;
        for (const auto& r : session.execute_all(kDiverge)) expect_success(r, "setup");
        Snapshot before = session.snapshot();
        expect_failure(session.execute("rebase --continue"), ErrorCode::NoRebaseInProgress, "continue without rebase");
        expect_failure(session.abort_rebase(), ErrorCode::NoRebaseInProgress, "abort without rebase");

        expect_success(session.execute("rebase -i main"), "start");
        expect_failure(session.confirm_rebase({item(RebaseAction::Squash, "C1")}), ErrorCode::InvalidSquashPosition, "bad todo");
        assert_true(session.rebase_active(), "bad todo keeps the plan");
        CommandResult aborted = session.execute("rebase --abort");
        expect_success(aborted, "abort");
        assert_eq(aborted.message, "Rebase aborted", "abort output");
        assert_true(session.snapshot() == before, "original restored");
        assert_true(!session.rebase_active(), "no rebase");

        // Continuing an unconfirmed plan runs the default todo.
        expect_success(session.execute("rebase -i main"), "start again");
        CommandResult done = session.continue_rebase();
        expect_success(done, "continue with default todo");
        assert_eq(message_at(session.snapshot(), head_of(session.snapshot())), "F3", "replayed");
        assert_true(!session.rebase_active(), "completed");
    }

    // 8) Reset forgets history
    {
        Session session;
        expect_success(session.execute("commit -m one"), "commit");
        session.reset(initial_snapshot(EngineConfig()));
        assert_eq_size(session.undo_depth(), 0, "history cleared");
        assert_eq(head_of(session.snapshot()), "C0", "fresh state");
    }

    // 9) Failures are logged as warnings
    {
        std::ostringstream sink;
        Logger::instance().set_sink(&sink);
        Logger::instance().set_level(LogLevel::Warning);
        Session session;
        session.execute("checkout nowhere");
        Logger::instance().set_sink(nullptr);
        quiet_logs();
        assert_true(contains(sink.str(), "[WARNING] [Session]"), "warning logged");
        assert_true(contains(sink.str(), "checkout nowhere"), "command in context");
    }

    std::cout << "All session tests passed.\n";
    return 0;
}
