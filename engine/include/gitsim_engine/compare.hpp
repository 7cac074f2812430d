#pragma once

#include "gitsim_engine/snapshot.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gitsim {

enum class DiffDimension {
    Commits,
    Branches,
    Tags,
    Head
};

struct Difference {
    DiffDimension dimension = DiffDimension::Commits;
    std::string description;
};

struct CompareOptions {
    bool compareTags = true;
    // When set, only these branch names take part in the branch comparison.
    std::optional<std::vector<std::string>> onlyBranches;
};

// Structural diff of `actual` against `goal`. Commits are matched by shape
// (message plus the shapes of their parents), never by id, and only commits
// reachable from a ref or HEAD count. Empty result means equivalent.
std::vector<Difference> compare_snapshots(const Snapshot& actual, const Snapshot& goal,
                                          const CompareOptions& options = CompareOptions());

const char* dimension_name(DiffDimension dimension);

} // namespace gitsim
