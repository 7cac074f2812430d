#include "gitsim_engine/snapshot.hpp"
#include <unordered_set>

namespace gitsim {

bool operator==(const Commit& a, const Commit& b) {
    return a.id == b.id && a.parents == b.parents && a.message == b.message && a.author == b.author &&
           a.timestamp == b.timestamp && a.changes == b.changes;
}

bool operator==(const Snapshot& a, const Snapshot& b) {
    if (a.refs != b.refs) return false;
    if (a.graph.commits.size() != b.graph.commits.size()) return false;
    for (const auto& kv : a.graph.commits) {
        auto it = b.graph.commits.find(kv.first);
        if (it == b.graph.commits.end()) return false;
        if (kv.second != it->second && !(*kv.second == *it->second)) return false;
    }
    return true;
}

Snapshot empty_snapshot(const EngineConfig& config) {
    Snapshot s;
    s.graph.factory = make_factory(config.idPrefix, config.defaultAuthor, config.baseTimestamp);
    attach_head(s.refs, config.defaultBranch);
    return s;
}

Snapshot fork_snapshot(const Snapshot& s) {
    Snapshot out = s;
    const CommitFactory& src = *s.graph.factory;
    auto f = make_factory(src.prefix, src.author, src.baseTimestamp);
    f->nextId.store(src.nextId.load());
    f->clock.store(src.clock.load());
    out.graph.factory = f;
    return out;
}

Snapshot initial_snapshot(const EngineConfig& config) {
    Snapshot s = empty_snapshot(config);
    CommitId root = add_commit(s.graph, {}, config.initialMessage).value();
    s.refs.branches.emplace(config.defaultBranch, Branch{config.defaultBranch, root});
    s.refs.branchOrder.push_back(config.defaultBranch);
    return s;
}

std::optional<EngineError> check_invariants(const Snapshot& s) {
    const auto& g = s.graph;
    if (g.order.size() != g.commits.size()) {
        return make_error(ErrorCode::InvalidFixture, "", "commit order and commit index disagree");
    }
    // `order` lists parents before children, so a parent seen later means a
    // dangling reference or a cycle.
    std::unordered_set<CommitId> seen;
    for (const auto& id : g.order) {
        const Commit* c = find_commit(g, id);
        if (c == nullptr || !seen.insert(id).second) {
            return make_error(ErrorCode::InvalidFixture, id, "commit order lists '" + id + "' incorrectly");
        }
        for (const auto& p : c->parents) {
            if (!has_commit(g, p)) {
                return make_error(ErrorCode::InvalidParent, p, "commit " + id + " references missing parent " + p);
            }
            if (!seen.count(p)) {
                return make_error(ErrorCode::CycleDetected, id, "commit " + id + " precedes its parent " + p);
            }
        }
    }
    for (const auto& kv : s.refs.branches) {
        if (!has_commit(g, kv.second.target)) {
            return make_error(ErrorCode::UnknownCommit, kv.first, "branch '" + kv.first + "' points at missing commit " + kv.second.target);
        }
    }
    for (const auto& kv : s.refs.tags) {
        if (!has_commit(g, kv.second.target)) {
            return make_error(ErrorCode::UnknownCommit, kv.first, "tag '" + kv.first + "' points at missing commit " + kv.second.target);
        }
    }
    for (const auto& kv : s.refs.remotes) {
        for (const auto& b : kv.second.branches) {
            if (!has_commit(g, b.second)) {
                return make_error(ErrorCode::UnknownCommit, kv.first, "remote '" + kv.first + "' branch " + b.first +
                                                                          " points at missing commit " + b.second);
            }
        }
    }
    for (const auto& kv : s.refs.tracking) {
        if (!has_commit(g, kv.second.target)) {
            return make_error(ErrorCode::UnknownCommit, kv.first, "'" + kv.first + "' points at missing commit " + kv.second.target);
        }
    }
    const Head& head = s.refs.head;
    if (head.kind == HeadKind::Attached && !find_branch(s.refs, head.branch)) {
        // An unborn branch is only legal in an empty repository.
        if (!g.commits.empty() || !s.refs.branches.empty()) {
            return make_error(ErrorCode::UnknownRef, head.branch, "HEAD is attached to missing branch '" + head.branch + "'");
        }
    }
    if (head.kind == HeadKind::Detached && !has_commit(g, head.commit)) {
        return make_error(ErrorCode::UnknownCommit, head.commit, "HEAD is detached at missing commit " + head.commit);
    }
    return std::nullopt;
}

} // namespace gitsim
