#pragma once

#include "gitsim_engine/commit_graph.hpp"
#include "gitsim_engine/config.hpp"
#include "gitsim_engine/ref_store.hpp"
#include "gitsim_engine/types.hpp"
#include <optional>

namespace gitsim {

// The unit of state. Copying a snapshot copies the ref collections and the
// commit index; commit objects themselves are shared.
struct Snapshot {
    CommitGraph graph;
    RefStore refs;
};

bool operator==(const Commit& a, const Commit& b);
// Same commit ids with the same content, same branches, tags and HEAD.
bool operator==(const Snapshot& a, const Snapshot& b);
inline bool operator!=(const Snapshot& a, const Snapshot& b) { return !(a == b); }

// Root commit on the default branch, HEAD attached to it.
Snapshot initial_snapshot(const EngineConfig& config);

// Copy with its own id and clock sequence, continuing where `s` stands. Work
// done on the copy never advances the original's sequence.
Snapshot fork_snapshot(const Snapshot& s);

// Empty graph whose factory follows `config`; used when loading fixtures.
Snapshot empty_snapshot(const EngineConfig& config);

// Checks the at-rest invariants: parents resolve, the graph is acyclic,
// every ref target (remote ones included) exists, an attached HEAD names a
// branch.
std::optional<EngineError> check_invariants(const Snapshot& s);

} // namespace gitsim
