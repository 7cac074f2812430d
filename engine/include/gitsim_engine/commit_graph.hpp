#pragma once

#include "gitsim_engine/types.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gitsim {

struct RefStore;

using CommitPtr = std::shared_ptr<const Commit>;

// Hands out commit ids and logical timestamps. One factory is shared by every
// graph derived from the same origin, so an id is never issued twice even when
// a derived snapshot is later discarded (e.g. an aborted rebase).
struct CommitFactory {
    std::string prefix = "C";
    std::string author = "Learner";
    long long baseTimestamp = 1700000000;
    std::atomic<unsigned long long> nextId{0};
    std::atomic<long long> clock{0};
};

// Append-only DAG. Commits are immutable and shared between graphs by pointer;
// copying a graph copies the index, never the commits.
struct CommitGraph {
    std::unordered_map<CommitId, CommitPtr> commits;
    std::vector<CommitId> order; // insertion order; every commit comes after its parents
    std::shared_ptr<CommitFactory> factory = std::make_shared<CommitFactory>();
};

std::shared_ptr<CommitFactory> make_factory(const std::string& prefix, const std::string& author, long long baseTimestamp);

// Advance the factory past ids/timestamps already present in `g`.
void seed_factory(CommitGraph& g);

const Commit* find_commit(const CommitGraph& g, const CommitId& id);
bool has_commit(const CommitGraph& g, const CommitId& id);

// Creates a new commit with a fresh id from the graph's factory.
// Fails with InvalidParent if a parent is missing.
Result<CommitId> add_commit(CommitGraph& g, const std::vector<CommitId>& parents, const std::string& message,
                            const std::string& author = "",
                            std::optional<std::vector<std::string>> changes = std::nullopt);

// Inserts a commit that already has an id (fixtures, imported repositories).
// Fails with InvalidParent for an absent parent, CycleDetected for a commit
// that names itself or a descendant of itself as parent, DuplicateCommit when
// the id is taken by different content.
Result<CommitId> insert_commit(CommitGraph& g, const Commit& commit);

// Shares an existing commit object into `g` (no copy). Parents must be present.
Result<CommitId> adopt_commit(CommitGraph& g, const CommitPtr& commit);

// Builds a graph from commits listed in any order.
Result<CommitGraph> build_graph(const std::vector<Commit>& commits, std::shared_ptr<CommitFactory> factory);

// Best common ancestor of two tips, or nullopt when the histories are unrelated.
std::optional<CommitId> merge_base(const CommitGraph& g, const CommitId& a, const CommitId& b);
// All best common ancestors (none is an ancestor of another), preferred first.
std::vector<CommitId> merge_bases(const CommitGraph& g, const CommitId& a, const CommitId& b);

// Start-to-root along first parents. Fails with UnknownStart.
Result<std::vector<CommitId>> first_parent_walk(const CommitGraph& g, const CommitId& start);

// True iff `ancestor` is reachable from `descendant` (inclusive).
bool is_ancestor(const CommitGraph& g, const CommitId& ancestor, const CommitId& descendant);

std::unordered_set<CommitId> reachable_set(const CommitGraph& g, const CommitId& tip);

// Commits reachable from `tip` but not from `exclude` (git's exclude..tip), newest first.
std::vector<CommitId> commits_between(const CommitGraph& g, const CommitId& exclude, const CommitId& tip);

// Reachable commits ordered newest first by timestamp (ties: later insertion first).
std::vector<CommitId> history_by_date(const CommitGraph& g, const CommitId& tip);

// Branch names whose target contains `commit`, sorted by name.
std::vector<std::string> branches_containing(const CommitGraph& g, const RefStore& refs, const CommitId& commit);

} // namespace gitsim
