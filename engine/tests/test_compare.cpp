#include "gitsim_engine/compare.hpp"
#include "test_helpers.hpp"

using namespace gitsim;
using namespace gitsim_test;

static const char* kGoal = R"({
    "commits": [
        {"id": "C0", "parents": [], "message": "Initial"},
        {"id": "C1", "parents": ["C0"], "message": "A"},
        {"id": "C2", "parents": ["C1"], "message": "B"}
    ],
    "branches": [{"name": "main", "target": "C2"}, {"name": "feature", "target": "C1"}],
    "tags": [{"name": "v1", "target": "C1"}],
    "head": {"type": "branch", "name": "main"}
})";

static std::string describe(const std::vector<Difference>& diffs) {
    std::string out;
    for (const auto& d : diffs) out += std::string(out.empty() ? "" : " | ") + dimension_name(d.dimension) + ": " + d.description;
    return out;
}

int main() {
    quiet_logs();
    Snapshot goal = parse_snapshot(kGoal);

    // 1) Same shape under different ids is equivalent
    {
        Snapshot actual = parse_snapshot(R"({
            "commits": [
                {"id": "X2", "parents": ["X1"], "message": "B", "author": "someone else"},
                {"id": "X0", "parents": [], "message": "Initial"},
                {"id": "X1", "parents": ["X0"], "message": "A", "timestamp": 1800000000}
            ],
            "branches": [{"name": "feature", "target": "X1"}, {"name": "main", "target": "X2"}],
            "tags": [{"name": "v1", "target": "X1"}],
            "head": "main"
        })");
        assert_eq(describe(compare_snapshots(actual, goal)), "", "equivalent histories");
        assert_eq(describe(compare_snapshots(goal, goal)), "", "reflexive");
    }

    // 2) Commit count and content differences
    {
        Snapshot shorter = parse_snapshot(R"({
            "commits": [{"id": "C0", "parents": [], "message": "Initial"}, {"id": "C1", "parents": ["C0"], "message": "A"}],
            "branches": [{"name": "main", "target": "C1"}, {"name": "feature", "target": "C1"}],
            "tags": [{"name": "v1", "target": "C1"}],
            "head": "main"
        })");
        auto diffs = compare_snapshots(shorter, goal);
        assert_eq_size(diffs.size(), 2, "count and branch");
        assert_eq(diffs[0].description, "Expected 3 commit(s), got 2", "count message");
        assert_true(diffs[1].dimension == DiffDimension::Branches, "branch difference");
        assert_eq(diffs[1].description, "Branch main: expected to point to C2 'B', but points to C1 'A'", "branch message");

        Snapshot renamed = parse_snapshot(R"({
            "commits": [
                {"id": "C0", "parents": [], "message": "Initial"},
                {"id": "C1", "parents": ["C0"], "message": "A"},
                {"id": "C2", "parents": ["C1"], "message": "Bee"}
            ],
            "branches": [{"name": "main", "target": "C2"}, {"name": "feature", "target": "C1"}],
            "tags": [{"name": "v1", "target": "C1"}],
            "head": "main"
        })");
        auto renamedDiffs = compare_snapshots(renamed, goal);
        assert_eq_size(renamedDiffs.size(), 2, "history and branch");
        assert_eq(renamedDiffs[0].description, "Commit history differs: missing 'B'; unexpected 'Bee'", "history message");
    }

    // 3) Topology matters, not just messages
    {
        Snapshot flat = parse_snapshot(R"({
            "commits": [
                {"id": "C0", "parents": [], "message": "Initial"},
                {"id": "C1", "parents": ["C0"], "message": "A"},
                {"id": "C2", "parents": ["C0"], "message": "B"}
            ],
            "branches": [{"name": "main", "target": "C2"}, {"name": "feature", "target": "C1"}],
            "tags": [{"name": "v1", "target": "C1"}],
            "head": "main"
        })");
        auto diffs = compare_snapshots(flat, goal);
        assert_true(!diffs.empty(), "different parents differ");
        assert_eq(diffs[0].description, "Commit history differs: missing 'B'; unexpected 'B'", "same message, other parent");
    }

    // 4) Unreachable commits do not count
    {
        Snapshot withGarbage = parse_snapshot(R"({
            "commits": [
                {"id": "C0", "parents": [], "message": "Initial"},
                {"id": "C1", "parents": ["C0"], "message": "A"},
                {"id": "C2", "parents": ["C1"], "message": "B"},
                {"id": "C3", "parents": ["C2"], "message": "orphaned by a reset"}
            ],
            "branches": [{"name": "main", "target": "C2"}, {"name": "feature", "target": "C1"}],
            "tags": [{"name": "v1", "target": "C1"}],
            "head": "main"
        })");
        assert_eq(describe(compare_snapshots(withGarbage, goal)), "", "dangling commit ignored");
    }

    // 5) Branch and tag presence, filtered comparisons
    {
        Snapshot refs = parse_snapshot(R"({
            "commits": [
                {"id": "C0", "parents": [], "message": "Initial"},
                {"id": "C1", "parents": ["C0"], "message": "A"},
                {"id": "C2", "parents": ["C1"], "message": "B"}
            ],
            "branches": [{"name": "main", "target": "C2"}, {"name": "topic", "target": "C1"}],
            "head": "main"
        })");
        auto diffs = compare_snapshots(refs, goal);
        assert_eq(describe(diffs), "branch: Missing branch: feature | branch: Unexpected branch: topic | tag: Missing tag: v1",
                  "ref presence");

        Snapshot extra = goal;
        expect_ok(create_branch(extra.refs, "extra", "C1"), "extra branch");
        auto extraDiffs = compare_snapshots(extra, goal);
        assert_eq_size(extraDiffs.size(), 1, "one difference for one extra branch");
        assert_true(extraDiffs[0].dimension == DiffDimension::Branches, "branch dimension");

        CompareOptions mainOnly;
        mainOnly.onlyBranches = std::vector<std::string>{"main"};
        mainOnly.compareTags = false;
        assert_eq(describe(compare_snapshots(refs, goal, mainOnly)), "", "only main, no tags");
    }

    // 6) HEAD differences
    {
        Snapshot detached = goal;
        detach_head(detached.refs, "C2");
        assert_eq(describe(compare_snapshots(detached, goal)), "head: HEAD type mismatch: expected branch, got detached", "type");

        Snapshot onFeature = goal;
        attach_head(onFeature.refs, "feature");
        assert_eq(describe(compare_snapshots(onFeature, goal)), "head: HEAD branch mismatch: expected main, got feature", "branch");

        Snapshot goalDetached = goal;
        detach_head(goalDetached.refs, "C1");
        assert_eq(describe(compare_snapshots(detached, goalDetached)),
                  "head: HEAD commit mismatch: expected C1 'A', got C2 'B'", "detached commit");

        // HEAD on a branch left out of the comparison still has to land on the right commit.
        CompareOptions mainOnly;
        mainOnly.onlyBranches = std::vector<std::string>{"main"};
        Snapshot goalOnFeature = goal;
        attach_head(goalOnFeature.refs, "feature");
        Snapshot featureMoved = goalOnFeature;
        expect_ok(create_branch(featureMoved.refs, "feature", "C2", true), "move feature");
        assert_eq(describe(compare_snapshots(featureMoved, goalOnFeature, mainOnly)),
                  "head: HEAD commit mismatch: expected C1 'A', got C2 'B'", "uncompared HEAD branch");
        assert_eq(describe(compare_snapshots(goalOnFeature, goalOnFeature, mainOnly)), "", "same HEAD commit");
        assert_eq(describe(compare_snapshots(featureMoved, goalOnFeature)), "branch: Branch feature: expected to point to C1 'A', but points to C2 'B'",
                  "compared HEAD branch reported once");
    }

    std::cout << "All compare tests passed.\n";
    return 0;
}
