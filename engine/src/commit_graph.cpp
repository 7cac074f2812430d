#include "gitsim_engine/commit_graph.hpp"
#include "gitsim_engine/ref_store.hpp"
#include <algorithm>
#include <cctype>
#include <deque>
#include <limits>

namespace gitsim {

std::shared_ptr<CommitFactory> make_factory(const std::string& prefix, const std::string& author, long long baseTimestamp) {
    auto f = std::make_shared<CommitFactory>();
    f->prefix = prefix;
    f->author = author;
    f->baseTimestamp = baseTimestamp;
    return f;
}

static void raise_to(std::atomic<unsigned long long>& counter, unsigned long long value) {
    unsigned long long cur = counter.load();
    while (cur < value && !counter.compare_exchange_weak(cur, value)) {
    }
}

static void raise_to(std::atomic<long long>& counter, long long value) {
    long long cur = counter.load();
    while (cur < value && !counter.compare_exchange_weak(cur, value)) {
    }
}

// Numeric suffix of "<prefix><digits>", if the id has that shape.
static std::optional<unsigned long long> sequence_number(const std::string& prefix, const CommitId& id) {
    if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    unsigned long long n = 0;
    for (size_t i = prefix.size(); i < id.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(id[i]);
        if (!std::isdigit(c)) return std::nullopt;
        if (n > (std::numeric_limits<unsigned long long>::max() - 9) / 10) return std::nullopt;
        n = n * 10 + (c - '0');
    }
    return n;
}

void seed_factory(CommitGraph& g) {
    auto& f = *g.factory;
    for (const auto& kv : g.commits) {
        if (auto n = sequence_number(f.prefix, kv.first)) raise_to(f.nextId, *n + 1);
        raise_to(f.clock, kv.second->timestamp - f.baseTimestamp + 1);
    }
}

const Commit* find_commit(const CommitGraph& g, const CommitId& id) {
    auto it = g.commits.find(id);
    return it == g.commits.end() ? nullptr : it->second.get();
}

bool has_commit(const CommitGraph& g, const CommitId& id) {
    return g.commits.find(id) != g.commits.end();
}

static CommitId next_id(CommitGraph& g) {
    auto& f = *g.factory;
    for (;;) {
        CommitId id = f.prefix + std::to_string(f.nextId.fetch_add(1));
        if (!has_commit(g, id)) return id;
    }
}

// Logical clock: strictly newer than every parent.
static long long next_timestamp(CommitGraph& g, const std::vector<CommitId>& parents) {
    auto& f = *g.factory;
    long long ts = f.baseTimestamp + f.clock.fetch_add(1);
    for (const auto& p : parents) {
        const Commit* c = find_commit(g, p);
        if (c != nullptr && c->timestamp >= ts) ts = c->timestamp + 1;
    }
    raise_to(f.clock, ts - f.baseTimestamp + 1);
    return ts;
}

static std::optional<EngineError> check_parents(const CommitGraph& g, const CommitId& id, const std::vector<CommitId>& parents) {
    for (const auto& p : parents) {
        if (!id.empty() && p == id) {
            return make_error(ErrorCode::CycleDetected, id, "commit " + id + " lists itself as a parent");
        }
        if (!has_commit(g, p)) {
            return make_error(ErrorCode::InvalidParent, p, "parent commit " + p + " does not exist");
        }
    }
    return std::nullopt;
}

Result<CommitId> add_commit(CommitGraph& g, const std::vector<CommitId>& parents, const std::string& message,
                            const std::string& author, std::optional<std::vector<std::string>> changes) {
    if (auto err = check_parents(g, "", parents)) return *err;
    auto c = std::make_shared<Commit>();
    c->id = next_id(g);
    c->parents = parents;
    c->message = message;
    c->author = author.empty() ? g.factory->author : author;
    c->timestamp = next_timestamp(g, parents);
    c->changes = std::move(changes);
    g.commits.emplace(c->id, c);
    g.order.push_back(c->id);
    return c->id;
}

static bool same_content(const Commit& a, const Commit& b) {
    return a.parents == b.parents && a.message == b.message;
}

Result<CommitId> adopt_commit(CommitGraph& g, const CommitPtr& commit) {
    if (auto existing = find_commit(g, commit->id)) {
        if (same_content(*existing, *commit)) return commit->id;
        return make_error(ErrorCode::DuplicateCommit, commit->id, "commit id " + commit->id + " is already used by different content");
    }
    if (auto err = check_parents(g, commit->id, commit->parents)) return *err;
    g.commits.emplace(commit->id, commit);
    g.order.push_back(commit->id);
    return commit->id;
}

Result<CommitId> insert_commit(CommitGraph& g, const Commit& commit) {
    if (commit.id.empty()) return make_error(ErrorCode::InvalidArgument, "", "commit id must not be empty");
    return adopt_commit(g, std::make_shared<const Commit>(commit));
}

Result<CommitGraph> build_graph(const std::vector<Commit>& commits, std::shared_ptr<CommitFactory> factory) {
    CommitGraph g;
    if (factory) g.factory = std::move(factory);

    std::unordered_map<CommitId, size_t> index;
    for (size_t i = 0; i < commits.size(); ++i) {
        const auto& c = commits[i];
        if (c.id.empty()) return make_error(ErrorCode::InvalidArgument, "", "commit id must not be empty");
        auto [it, inserted] = index.emplace(c.id, i);
        if (!inserted && !same_content(commits[it->second], c)) {
            return make_error(ErrorCode::DuplicateCommit, c.id, "commit id " + c.id + " is listed twice with different content");
        }
    }

    // Kahn's algorithm, input order breaks ties so the result is deterministic.
    std::vector<size_t> missing(commits.size(), 0);
    std::unordered_map<CommitId, std::vector<size_t>> children;
    for (size_t i = 0; i < commits.size(); ++i) {
        const auto& c = commits[i];
        if (index[c.id] != i) continue; // duplicate listing of identical content
        for (const auto& p : c.parents) {
            if (p == c.id) return make_error(ErrorCode::CycleDetected, c.id, "commit " + c.id + " lists itself as a parent");
            if (index.find(p) == index.end()) {
                return make_error(ErrorCode::InvalidParent, p, "commit " + c.id + " references missing parent " + p);
            }
            ++missing[i];
            children[p].push_back(i);
        }
    }
    std::deque<size_t> ready;
    for (size_t i = 0; i < commits.size(); ++i) {
        if (index[commits[i].id] == i && missing[i] == 0) ready.push_back(i);
    }
    while (!ready.empty()) {
        size_t i = ready.front();
        ready.pop_front();
        auto added = insert_commit(g, commits[i]);
        if (!added.ok()) return added.error();
        auto it = children.find(commits[i].id);
        if (it == children.end()) continue;
        for (size_t child : it->second) {
            if (--missing[child] == 0) ready.push_back(child);
        }
    }
    for (size_t i = 0; i < commits.size(); ++i) {
        if (index[commits[i].id] == i && !has_commit(g, commits[i].id)) {
            return make_error(ErrorCode::CycleDetected, commits[i].id, "commit " + commits[i].id + " is part of a parent cycle");
        }
    }
    seed_factory(g);
    return g;
}

std::unordered_set<CommitId> reachable_set(const CommitGraph& g, const CommitId& tip) {
    std::unordered_set<CommitId> seen;
    if (!has_commit(g, tip)) return seen;
    std::deque<CommitId> queue{tip};
    seen.insert(tip);
    while (!queue.empty()) {
        CommitId cur = queue.front();
        queue.pop_front();
        for (const auto& p : find_commit(g, cur)->parents) {
            if (seen.insert(p).second) queue.push_back(p);
        }
    }
    return seen;
}

static std::unordered_map<CommitId, size_t> distances_from(const CommitGraph& g, const CommitId& tip) {
    std::unordered_map<CommitId, size_t> dist;
    std::deque<CommitId> queue{tip};
    dist[tip] = 0;
    while (!queue.empty()) {
        CommitId cur = queue.front();
        queue.pop_front();
        size_t d = dist[cur];
        for (const auto& p : find_commit(g, cur)->parents) {
            if (dist.emplace(p, d + 1).second) queue.push_back(p);
        }
    }
    return dist;
}

std::vector<CommitId> merge_bases(const CommitGraph& g, const CommitId& a, const CommitId& b) {
    if (!has_commit(g, a) || !has_commit(g, b)) return {};
    if (a == b) return {a};

    auto distA = distances_from(g, a);

    // Walk from b; stop at the first common commit on each path. Anything
    // behind such a commit is a common ancestor dominated by it.
    std::vector<CommitId> candidates;
    std::unordered_map<CommitId, size_t> distB;
    std::deque<CommitId> queue{b};
    distB[b] = 0;
    while (!queue.empty()) {
        CommitId cur = queue.front();
        queue.pop_front();
        if (distA.count(cur)) {
            candidates.push_back(cur);
            continue;
        }
        size_t d = distB[cur];
        for (const auto& p : find_commit(g, cur)->parents) {
            if (distB.emplace(p, d + 1).second) queue.push_back(p);
        }
    }

    // Drop candidates that are proper ancestors of another candidate.
    std::unordered_set<CommitId> dominated;
    std::deque<CommitId> walk;
    for (const auto& c : candidates) {
        for (const auto& p : find_commit(g, c)->parents) {
            if (dominated.insert(p).second) walk.push_back(p);
        }
    }
    while (!walk.empty()) {
        CommitId cur = walk.front();
        walk.pop_front();
        for (const auto& p : find_commit(g, cur)->parents) {
            if (dominated.insert(p).second) walk.push_back(p);
        }
    }
    std::vector<CommitId> best;
    for (const auto& c : candidates) {
        if (!dominated.count(c)) best.push_back(c);
    }

    std::sort(best.begin(), best.end(), [&](const CommitId& x, const CommitId& y) {
        long long tx = find_commit(g, x)->timestamp;
        long long ty = find_commit(g, y)->timestamp;
        if (tx != ty) return tx > ty;
        size_t dx = distA[x] + distB[x];
        size_t dy = distA[y] + distB[y];
        if (dx != dy) return dx < dy;
        return x < y;
    });
    return best;
}

std::optional<CommitId> merge_base(const CommitGraph& g, const CommitId& a, const CommitId& b) {
    auto all = merge_bases(g, a, b);
    if (all.empty()) return std::nullopt;
    return all.front();
}

Result<std::vector<CommitId>> first_parent_walk(const CommitGraph& g, const CommitId& start) {
    if (!has_commit(g, start)) {
        return make_error(ErrorCode::UnknownStart, start, "unknown start commit '" + start + "'");
    }
    std::vector<CommitId> out;
    const Commit* cur = find_commit(g, start);
    while (cur != nullptr) {
        out.push_back(cur->id);
        if (cur->parents.empty() || out.size() > g.commits.size()) break;
        cur = find_commit(g, cur->parents.front());
    }
    return out;
}

bool is_ancestor(const CommitGraph& g, const CommitId& ancestor, const CommitId& descendant) {
    if (!has_commit(g, ancestor) || !has_commit(g, descendant)) return false;
    if (ancestor == descendant) return true;
    std::unordered_set<CommitId> seen{descendant};
    std::deque<CommitId> queue{descendant};
    while (!queue.empty()) {
        CommitId cur = queue.front();
        queue.pop_front();
        for (const auto& p : find_commit(g, cur)->parents) {
            if (p == ancestor) return true;
            if (seen.insert(p).second) queue.push_back(p);
        }
    }
    return false;
}

std::vector<CommitId> history_by_date(const CommitGraph& g, const CommitId& tip) {
    auto reach = reachable_set(g, tip);
    std::vector<CommitId> out;
    out.reserve(reach.size());
    for (const auto& id : g.order) {
        if (reach.count(id)) out.push_back(id);
    }
    // `out` is in insertion order; a stable sort keeps later insertions first among equal dates.
    std::reverse(out.begin(), out.end());
    std::stable_sort(out.begin(), out.end(), [&](const CommitId& x, const CommitId& y) {
        return find_commit(g, x)->timestamp > find_commit(g, y)->timestamp;
    });
    return out;
}

std::vector<CommitId> commits_between(const CommitGraph& g, const CommitId& exclude, const CommitId& tip) {
    auto excluded = reachable_set(g, exclude);
    std::vector<CommitId> out;
    for (const auto& id : history_by_date(g, tip)) {
        if (!excluded.count(id)) out.push_back(id);
    }
    return out;
}

std::vector<std::string> branches_containing(const CommitGraph& g, const RefStore& refs, const CommitId& commit) {
    std::vector<std::string> out;
    for (const auto& name : refs.branchOrder) {
        const Branch& b = refs.branches.at(name);
        if (is_ancestor(g, commit, b.target)) out.push_back(b.name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace gitsim
