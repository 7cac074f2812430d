#include "gitsim_engine/session.hpp"
#include "gitsim_engine/command_parser.hpp"
#include "gitsim_engine/logger.hpp"
#include "gitsim_engine/state_utils.hpp"

namespace gitsim {

Session::Session(EngineConfig config) : config_(std::move(config)), current_(initial_snapshot(config_)) {}

Session::Session(EngineConfig config, Snapshot initial) : config_(std::move(config)), current_(std::move(initial)) {}

const Snapshot& Session::snapshot() const {
    if (rebase_ && rebase_->status == RebaseStatus::InProgress) return rebase_->working;
    return current_;
}

void Session::reset(Snapshot s) {
    current_ = std::move(s);
    undo_.clear();
    redo_.clear();
    rebase_.reset();
}

void Session::push_undo(const Snapshot& before, const std::string& command) {
    redo_.clear();
    if (config_.historyLimit == 0) return;
    undo_.push_back(HistoryEntry{before, command});
    while (undo_.size() > config_.historyLimit) undo_.pop_front();
}

CommandResult Session::fail(const EngineError& error, const std::string& command) {
    GITSIM_LOG_WARNING("Session", error.message, command);
    CommandResult r;
    r.success = false;
    r.message = error.message;
    r.error = error;
    return r;
}

static CommandResult ok_result(std::string message, std::vector<Advisory> advisories = {}) {
    CommandResult r;
    r.success = true;
    r.message = std::move(message);
    r.advisories = std::move(advisories);
    return r;
}

CommandResult Session::execute(const std::string& line) {
    auto cmd = parse_command(line);
    if (!cmd.ok()) return fail(cmd.error(), line);
    return execute(cmd.value(), line);
}

CommandResult Session::execute(const Command& cmd, const std::string& text) {
    const std::string label = text.empty() ? std::string(command_type_name(cmd.type)) : text;
    Logger::instance().debug("Session", "execute", label);

    switch (cmd.type) {
        case CommandType::Undo:
            return undo();
        case CommandType::Redo:
            return redo();
        case CommandType::RebaseContinue:
            return continue_rebase();
        case CommandType::RebaseAbort:
            return abort_rebase();
        default:
            break;
    }
    if (rebase_) return execute_during_rebase(cmd, label);
    if (cmd.type == CommandType::RebaseInteractive) return start_interactive(cmd, label);

    auto outcome = apply_command(current_, cmd);
    if (!outcome.ok()) return fail(outcome.error(), label);
    for (const auto& a : outcome.value().advisories) {
        Logger::instance().info("Session", advisory_code_name(a.code), a.message);
    }
    if (!is_read_only(cmd.type)) {
        push_undo(current_, label);
        current_ = std::move(outcome.value().snapshot);
    }
    return ok_result(std::move(outcome.value().message), std::move(outcome.value().advisories));
}

std::vector<CommandResult> Session::execute_all(const std::vector<std::string>& lines) {
    std::vector<CommandResult> results;
    for (const auto& line : lines) {
        results.push_back(execute(line));
        if (!results.back().success) break;
    }
    return results;
}

CommandResult Session::undo() {
    if (rebase_) return fail(make_error(ErrorCode::RebaseInProgress, "undo", "cannot undo while a rebase is in progress"), "undo");
    if (undo_.empty()) return fail(make_error(ErrorCode::NothingToUndo, "undo", "nothing to undo"), "undo");
    HistoryEntry entry = std::move(undo_.back());
    undo_.pop_back();
    redo_.push_back(HistoryEntry{current_, entry.command});
    current_ = std::move(entry.snapshot);
    return ok_result("Undid: " + entry.command);
}

CommandResult Session::redo() {
    if (rebase_) return fail(make_error(ErrorCode::RebaseInProgress, "redo", "cannot redo while a rebase is in progress"), "redo");
    if (redo_.empty()) return fail(make_error(ErrorCode::NothingToRedo, "redo", "nothing to redo"), "redo");
    HistoryEntry entry = std::move(redo_.back());
    redo_.pop_back();
    undo_.push_back(HistoryEntry{current_, entry.command});
    current_ = std::move(entry.snapshot);
    return ok_result("Redid: " + entry.command);
}

CommandResult Session::start_interactive(const Command& cmd, const std::string& text) {
    auto planned = prepare_rebase(current_, cmd.target);
    if (!planned.ok()) return fail(planned.error(), text);
    rebase_ = std::move(planned.value());
    Logger::instance().debug("Session", "interactive rebase planned", text);
    return ok_result("Interactive rebase started. " + std::to_string(rebase_->todo.size()) +
                     " commit(s) to rebase onto " + rebase_->onto + ".");
}

CommandResult Session::execute_during_rebase(const Command& cmd, const std::string& text) {
    switch (cmd.type) {
        case CommandType::Status: {
            std::string status = describe_head(snapshot());
            status += "\ninteractive rebase in progress; onto " + rebase_->onto;
            if (rebase_->status == RebaseStatus::NotStarted) status += "\nwaiting for the todo list to be confirmed";
            else status += "\n" + std::to_string(rebase_->cursor) + " of " + std::to_string(rebase_->todo.size()) + " done";
            return ok_result(status);
        }
        case CommandType::Log:
        case CommandType::ListBranches:
        case CommandType::ListTags:
        case CommandType::ListRemotes: {
            auto outcome = apply_command(snapshot(), cmd);
            if (!outcome.ok()) return fail(outcome.error(), text);
            return ok_result(std::move(outcome.value().message));
        }
        case CommandType::Commit:
            if (cmd.amend && rebase_->paused) {
                auto next = amend_rebase(*rebase_, cmd.message.value_or(""));
                if (!next.ok()) return fail(next.error(), text);
                rebase_ = std::move(next.value());
                CommitId tip = *head_commit(rebase_->working);
                return ok_result("[" + tip + " (detached HEAD)] " + first_line(find_commit(rebase_->working.graph, tip)->message));
            }
            break;
        default:
            break;
    }
    return fail(make_error(ErrorCode::RebaseInProgress, command_type_name(cmd.type),
                           "a rebase is in progress; use 'rebase --continue' or 'rebase --abort'"),
                text);
}

CommandResult Session::settle_rebase(const RebaseSession& next, const std::string& command) {
    if (next.status == RebaseStatus::Completed) {
        Snapshot before = next.original;
        current_ = *next.result;
        rebase_.reset();
        push_undo(before, command);
        auto branch = current_branch(current_);
        if (branch) return ok_result("Successfully rebased and updated refs/heads/" + *branch + ".");
        return ok_result("Successfully rebased.");
    }
    rebase_ = next;
    if (next.paused) {
        const auto& item = next.todo[next.cursor - 1];
        CommitId tip = *head_commit(next.working);
        return ok_result("Stopped at " + item.commit + "... " + first_line(item.message) + "\n" +
                         "You can amend the commit now, then run 'rebase --continue' (now " + tip + ")");
    }
    return ok_result("Rebase step applied.");
}

CommandResult Session::confirm_rebase(std::vector<RebaseTodoItem> todo) {
    if (!rebase_) return fail(make_error(ErrorCode::NoRebaseInProgress, "rebase", "no rebase in progress"), "rebase");
    auto started = start_rebase(*rebase_, std::move(todo));
    if (!started.ok()) return fail(started.error(), "rebase -i");
    auto next = gitsim::continue_rebase(started.value());
    if (!next.ok()) return fail(next.error(), "rebase -i");
    return settle_rebase(next.value(), "rebase -i " + rebase_->ontoRef);
}

CommandResult Session::continue_rebase() {
    if (!rebase_) return fail(make_error(ErrorCode::NoRebaseInProgress, "rebase", "no rebase in progress"), "rebase --continue");
    if (rebase_->status == RebaseStatus::NotStarted) return confirm_rebase(rebase_->todo);
    auto next = gitsim::continue_rebase(*rebase_);
    if (!next.ok()) return fail(next.error(), "rebase --continue");
    return settle_rebase(next.value(), "rebase -i " + rebase_->ontoRef);
}

CommandResult Session::abort_rebase() {
    if (!rebase_) return fail(make_error(ErrorCode::NoRebaseInProgress, "rebase", "no rebase in progress"), "rebase --abort");
    auto aborted = gitsim::abort_rebase(*rebase_);
    if (!aborted.ok()) return fail(aborted.error(), "rebase --abort");
    current_ = *aborted.value().result;
    rebase_.reset();
    return ok_result("Rebase aborted");
}

} // namespace gitsim
