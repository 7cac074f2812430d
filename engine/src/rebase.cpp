#include "gitsim_engine/rebase.hpp"
#include "gitsim_engine/logger.hpp"
#include "gitsim_engine/state_utils.hpp"
#include <algorithm>
#include <unordered_set>

namespace gitsim {

const char* rebase_action_name(RebaseAction action) {
    switch (action) {
        case RebaseAction::Pick: return "pick";
        case RebaseAction::Squash: return "squash";
        case RebaseAction::Fixup: return "fixup";
        case RebaseAction::Drop: return "drop";
        case RebaseAction::Reword: return "reword";
        case RebaseAction::Edit: return "edit";
    }
    return "pick";
}

std::optional<RebaseAction> parse_rebase_action(const std::string& word) {
    if (word == "pick" || word == "p") return RebaseAction::Pick;
    if (word == "squash" || word == "s") return RebaseAction::Squash;
    if (word == "fixup" || word == "f") return RebaseAction::Fixup;
    if (word == "drop" || word == "d") return RebaseAction::Drop;
    if (word == "reword" || word == "r") return RebaseAction::Reword;
    if (word == "edit" || word == "e") return RebaseAction::Edit;
    return std::nullopt;
}

const char* rebase_status_name(RebaseStatus status) {
    switch (status) {
        case RebaseStatus::NotStarted: return "NotStarted";
        case RebaseStatus::InProgress: return "InProgress";
        case RebaseStatus::Completed: return "Completed";
        case RebaseStatus::Aborted: return "Aborted";
    }
    return "NotStarted";
}

static EngineError session_error(const RebaseSession& session, const std::string& what) {
    return make_error(ErrorCode::InvalidSessionState, rebase_status_name(session.status),
                      "cannot " + what + " a rebase that is " + rebase_status_name(session.status));
}

Result<std::vector<RebaseTodoItem>> plan_rebase(const Snapshot& s, const CommitId& onto) {
    auto head = head_commit(s);
    if (!head) return make_error(ErrorCode::UnknownRef, "HEAD", "HEAD does not point at a commit");
    auto walk = first_parent_walk(s.graph, *head);
    if (!walk.ok()) return walk.error();

    auto base = reachable_set(s.graph, onto);
    std::vector<RebaseTodoItem> items;
    for (const auto& id : walk.value()) {
        if (base.count(id)) break;
        const Commit* c = find_commit(s.graph, id);
        if (c->parents.size() > 1) continue;
        items.push_back(RebaseTodoItem{RebaseAction::Pick, id, c->message, 0});
    }
    std::reverse(items.begin(), items.end());
    for (size_t i = 0; i < items.size(); ++i) items[i].order = static_cast<int>(i);
    return items;
}

Result<RebaseSession> prepare_rebase(const Snapshot& s, const std::string& ontoRef) {
    auto onto = resolve_ref(s, ontoRef);
    if (!onto.ok()) return onto.error();
    auto head = head_commit(s);
    if (!head) return make_error(ErrorCode::UnknownRef, "HEAD", "HEAD does not point at a commit");
    auto todo = plan_rebase(s, onto.value());
    if (!todo.ok()) return todo.error();

    RebaseSession session;
    session.original = s;
    session.onto = onto.value();
    session.ontoRef = ontoRef;
    session.branch = current_branch(s);
    session.originalTip = *head;
    session.todo = std::move(todo.value());
    session.working = s;
    return session;
}

static bool is_squash(RebaseAction a) {
    return a == RebaseAction::Squash || a == RebaseAction::Fixup;
}

Result<RebaseSession> start_rebase(const RebaseSession& planned, std::vector<RebaseTodoItem> todo) {
    if (planned.status != RebaseStatus::NotStarted) return session_error(planned, "start");

    auto history = reachable_set(planned.original.graph, planned.originalTip);
    std::unordered_set<CommitId> listed;
    bool accumulated = false;
    for (const auto& item : todo) {
        if (!history.count(item.commit)) {
            return make_error(ErrorCode::InvalidTodo, item.commit, "commit " + item.commit + " is not part of the rebased history");
        }
        if (!listed.insert(item.commit).second) {
            return make_error(ErrorCode::InvalidTodo, item.commit, "commit " + item.commit + " is listed more than once");
        }
        if (is_squash(item.action) && !accumulated) {
            return make_error(ErrorCode::InvalidSquashPosition, item.commit,
                              std::string("cannot '") + rebase_action_name(item.action) + "' without a previous commit");
        }
        if (item.action != RebaseAction::Drop) accumulated = true;
    }

    RebaseSession session = planned;
    session.todo = std::move(todo);
    for (size_t i = 0; i < session.todo.size(); ++i) {
        auto& item = session.todo[i];
        item.order = static_cast<int>(i);
        // Items without a message carry the commit's own; a reword then keeps it.
        if (item.message.empty()) item.message = find_commit(planned.original.graph, item.commit)->message;
    }
    session.status = RebaseStatus::InProgress;
    session.cursor = 0;
    session.paused = false;
    session.rewritten.clear();
    session.result.reset();
    session.working = planned.original;
    detach_head(session.working.refs, session.onto);
    Logger::instance().debug("Rebase", "started with " + std::to_string(session.todo.size()) + " item(s)", "onto " + session.onto);
    return session;
}

Result<RebaseSession> start_rebase(const Snapshot& s, const std::string& ontoRef, std::vector<RebaseTodoItem> todo) {
    auto planned = prepare_rebase(s, ontoRef);
    if (!planned.ok()) return planned.error();
    return start_rebase(planned.value(), std::move(todo));
}

static std::optional<std::vector<std::string>> combine_changes(const std::optional<std::vector<std::string>>& a,
                                                               const std::optional<std::vector<std::string>>& b) {
    if (!a || !b) return std::nullopt;
    std::vector<std::string> out = *a;
    for (const auto& field : *b) {
        if (std::find(out.begin(), out.end(), field) == out.end()) out.push_back(field);
    }
    return out;
}

static std::optional<EngineError> finish(RebaseSession& session) {
    CommitId tip = *head_commit(session.working);
    Snapshot result = session.original;
    auto reach = reachable_set(session.working.graph, tip);
    for (const auto& id : session.working.graph.order) {
        if (reach.count(id) && !has_commit(result.graph, id)) {
            auto adopted = adopt_commit(result.graph, session.working.graph.commits.at(id));
            if (!adopted.ok()) return adopted.error();
        }
    }
    if (session.branch) {
        attach_head(result.refs, *session.branch);
        move_head_to(result, tip);
    } else {
        detach_head(result.refs, tip);
    }
    session.status = RebaseStatus::Completed;
    session.result = std::move(result);
    Logger::instance().info("Rebase", "completed", "new tip " + tip);
    return std::nullopt;
}

Result<RebaseSession> step_rebase(const RebaseSession& session) {
    if (session.status != RebaseStatus::InProgress) return session_error(session, "step");

    RebaseSession next = session;
    next.paused = false;
    if (next.cursor >= next.todo.size()) {
        if (auto err = finish(next)) return *err;
        return next;
    }

    const RebaseTodoItem& item = next.todo[next.cursor];
    CommitGraph& g = next.working.graph;
    const Commit* picked = find_commit(g, item.commit);
    if (picked == nullptr) return make_error(ErrorCode::UnknownCommit, item.commit, "commit " + item.commit + " not found");
    CommitId tip = *head_commit(next.working);
    std::optional<CommitId> replayed;

    switch (item.action) {
        case RebaseAction::Drop:
            break;
        case RebaseAction::Pick:
        case RebaseAction::Edit:
            // A commit already sitting on the tip is reused, as git does.
            if (picked->parents.size() == 1 && picked->parents.front() == tip) {
                replayed = picked->id;
                break;
            }
            [[fallthrough]];
        case RebaseAction::Reword: {
            std::string message = picked->message;
            if (item.action == RebaseAction::Reword && !item.message.empty()) message = item.message;
            auto added = add_commit(g, {tip}, message, picked->author, picked->changes);
            if (!added.ok()) return added.error();
            replayed = added.value();
            break;
        }
        case RebaseAction::Squash:
        case RebaseAction::Fixup: {
            if (next.rewritten.empty()) {
                return make_error(ErrorCode::InvalidSquashPosition, item.commit,
                                  std::string("cannot '") + rebase_action_name(item.action) + "' without a previous commit");
            }
            const Commit* prev = find_commit(g, tip);
            std::string message = prev->message;
            if (item.action == RebaseAction::Squash) message += "\n\n" + picked->message;
            auto added = add_commit(g, prev->parents, message, prev->author, combine_changes(prev->changes, picked->changes));
            if (!added.ok()) return added.error();
            replayed = added.value();
            break;
        }
    }

    if (replayed) {
        detach_head(next.working.refs, *replayed);
        next.rewritten.emplace_back(item.commit, *replayed);
    }
    ++next.cursor;
    Logger::instance().debug("Rebase", std::string(rebase_action_name(item.action)) + " " + item.commit,
                             replayed ? "-> " + *replayed : "dropped");

    if (item.action == RebaseAction::Edit) {
        next.paused = true;
        Logger::instance().info("Rebase", "stopped at " + item.commit, "amend and continue");
        return next;
    }
    if (next.cursor >= next.todo.size()) {
        if (auto err = finish(next)) return *err;
    }
    return next;
}

Result<RebaseSession> continue_rebase(const RebaseSession& session) {
    if (session.status != RebaseStatus::InProgress) return session_error(session, "continue");
    auto cur = step_rebase(session);
    while (cur.ok() && cur.value().status == RebaseStatus::InProgress && !cur.value().paused) {
        cur = step_rebase(cur.value());
    }
    return cur;
}

Result<RebaseSession> amend_rebase(const RebaseSession& session, const std::string& message) {
    if (session.status != RebaseStatus::InProgress || !session.paused) {
        return make_error(ErrorCode::InvalidSessionState, rebase_status_name(session.status),
                          "amending during a rebase is only possible while stopped at an edit");
    }
    RebaseSession next = session;
    CommitId tip = *head_commit(next.working);
    const Commit* c = find_commit(next.working.graph, tip);
    auto added = add_commit(next.working.graph, c->parents, message.empty() ? c->message : message, c->author, c->changes);
    if (!added.ok()) return added.error();
    detach_head(next.working.refs, added.value());
    if (!next.rewritten.empty()) next.rewritten.back().second = added.value();
    return next;
}

Result<RebaseSession> abort_rebase(const RebaseSession& session) {
    if (session.status == RebaseStatus::Completed || session.status == RebaseStatus::Aborted) {
        return session_error(session, "abort");
    }
    RebaseSession next = session;
    next.status = RebaseStatus::Aborted;
    next.paused = false;
    next.result = session.original;
    Logger::instance().info("Rebase", "aborted", "restored " + session.originalTip);
    return next;
}

} // namespace gitsim
