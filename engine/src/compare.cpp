#include "gitsim_engine/compare.hpp"
#include "gitsim_engine/state_utils.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <unordered_map>
#include <utility>

namespace gitsim {

// Interns commit shapes; both snapshots share one table so equal shapes get
// equal class numbers.
class ShapeTable {
public:
    int intern(const std::string& message, std::vector<int> parents) {
        auto key = std::make_pair(message, std::move(parents));
        auto it = classes_.find(key);
        if (it != classes_.end()) return it->second;
        int id = static_cast<int>(classes_.size());
        classes_.emplace(std::move(key), id);
        return id;
    }

private:
    std::map<std::pair<std::string, std::vector<int>>, int> classes_;
};

struct ShapedSnapshot {
    std::unordered_map<CommitId, int> classOf;
    std::map<int, int> counts; // class -> multiplicity
    std::map<int, std::string> messageOf;
};

static std::vector<CommitId> ref_tips(const Snapshot& s) {
    std::vector<CommitId> tips;
    for (const auto& kv : s.refs.branches) tips.push_back(kv.second.target);
    for (const auto& kv : s.refs.tags) tips.push_back(kv.second.target);
    if (auto head = head_commit(s)) tips.push_back(*head);
    return tips;
}

static ShapedSnapshot shape(const Snapshot& s, ShapeTable& table) {
    std::unordered_set<CommitId> visible;
    for (const auto& tip : ref_tips(s)) {
        if (visible.count(tip)) continue;
        auto reach = reachable_set(s.graph, tip);
        visible.insert(reach.begin(), reach.end());
    }
    ShapedSnapshot out;
    // `order` lists parents first, so parent classes are always known.
    for (const auto& id : s.graph.order) {
        if (!visible.count(id)) continue;
        const Commit* c = find_commit(s.graph, id);
        std::vector<int> parents;
        for (const auto& p : c->parents) parents.push_back(out.classOf.at(p));
        int cls = table.intern(c->message, std::move(parents));
        out.classOf[id] = cls;
        ++out.counts[cls];
        out.messageOf[cls] = first_line(c->message);
    }
    return out;
}

static int total(const std::map<int, int>& counts) {
    int n = 0;
    for (const auto& kv : counts) n += kv.second;
    return n;
}

static std::string quoted_list(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) out += (out.empty() ? "'" : ", '") + item + "'";
    return out;
}

static void compare_commits(const ShapedSnapshot& actual, const ShapedSnapshot& goal, std::vector<Difference>& out) {
    if (actual.counts == goal.counts) return;
    int have = total(actual.counts);
    int want = total(goal.counts);
    if (have != want) {
        out.push_back({DiffDimension::Commits, "Expected " + std::to_string(want) + " commit(s), got " + std::to_string(have)});
        return;
    }
    std::vector<std::string> missing, unexpected;
    for (const auto& kv : goal.counts) {
        auto it = actual.counts.find(kv.first);
        int have_n = it == actual.counts.end() ? 0 : it->second;
        if (have_n < kv.second) missing.push_back(goal.messageOf.at(kv.first));
    }
    for (const auto& kv : actual.counts) {
        auto it = goal.counts.find(kv.first);
        int want_n = it == goal.counts.end() ? 0 : it->second;
        if (want_n < kv.second) unexpected.push_back(actual.messageOf.at(kv.first));
    }
    out.push_back({DiffDimension::Commits, "Commit history differs: missing " + quoted_list(missing) +
                                               "; unexpected " + quoted_list(unexpected)});
}

static std::string describe_target(const Snapshot& s, const CommitId& id) {
    const Commit* c = find_commit(s.graph, id);
    return id + (c ? " '" + first_line(c->message) + "'" : std::string());
}

template <typename Ref>
static void compare_refs(const char* kind, DiffDimension dimension, const std::set<std::string>& names,
                         const std::unordered_map<std::string, Ref>& actualRefs, const std::unordered_map<std::string, Ref>& goalRefs,
                         const Snapshot& actual, const ShapedSnapshot& actualShape, const Snapshot& goal,
                         const ShapedSnapshot& goalShape, std::vector<Difference>& out) {
    const std::string label = kind;
    for (const auto& name : names) {
        auto a = actualRefs.find(name);
        auto g = goalRefs.find(name);
        if (g != goalRefs.end() && a == actualRefs.end()) {
            out.push_back({dimension, "Missing " + label + ": " + name});
        } else if (g == goalRefs.end() && a != actualRefs.end()) {
            out.push_back({dimension, "Unexpected " + label + ": " + name});
        } else if (g != goalRefs.end() && actualShape.classOf.at(a->second.target) != goalShape.classOf.at(g->second.target)) {
            std::string upper = label;
            upper[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(upper[0])));
            out.push_back({dimension, upper + " " + name + ": expected to point to " + describe_target(goal, g->second.target) +
                                          ", but points to " + describe_target(actual, a->second.target)});
        }
    }
}

template <typename Ref>
static std::set<std::string> union_names(const std::unordered_map<std::string, Ref>& a, const std::unordered_map<std::string, Ref>& b) {
    std::set<std::string> names;
    for (const auto& kv : a) names.insert(kv.first);
    for (const auto& kv : b) names.insert(kv.first);
    return names;
}

// An attached HEAD whose branch is in `comparedBranches` already had its
// target checked with the branches.
static void compare_head(const Snapshot& actual, const ShapedSnapshot& actualShape, const Snapshot& goal,
                         const ShapedSnapshot& goalShape, const std::set<std::string>& comparedBranches, std::vector<Difference>& out) {
    const Head& a = actual.refs.head;
    const Head& g = goal.refs.head;
    auto kind = [](const Head& h) { return h.kind == HeadKind::Attached ? std::string("branch") : std::string("detached"); };
    if (a.kind != g.kind) {
        out.push_back({DiffDimension::Head, "HEAD type mismatch: expected " + kind(g) + ", got " + kind(a)});
        return;
    }
    if (a.kind == HeadKind::Attached && a.branch != g.branch) {
        out.push_back({DiffDimension::Head, "HEAD branch mismatch: expected " + g.branch + ", got " + a.branch});
        return;
    }
    if (a.kind == HeadKind::Attached && comparedBranches.count(a.branch)) return;
    auto actualCommit = head_commit(actual);
    auto goalCommit = head_commit(goal);
    if (!actualCommit && !goalCommit) return;
    if (actualCommit && goalCommit && actualShape.classOf.at(*actualCommit) == goalShape.classOf.at(*goalCommit)) return;
    out.push_back({DiffDimension::Head, "HEAD commit mismatch: expected " + (goalCommit ? describe_target(goal, *goalCommit) : "nothing") +
                                            ", got " + (actualCommit ? describe_target(actual, *actualCommit) : "nothing")});
}

std::vector<Difference> compare_snapshots(const Snapshot& actual, const Snapshot& goal, const CompareOptions& options) {
    ShapeTable table;
    ShapedSnapshot actualShape = shape(actual, table);
    ShapedSnapshot goalShape = shape(goal, table);

    std::vector<Difference> out;
    compare_commits(actualShape, goalShape, out);

    std::set<std::string> branchNames;
    if (options.onlyBranches) {
        branchNames.insert(options.onlyBranches->begin(), options.onlyBranches->end());
    } else {
        branchNames = union_names(actual.refs.branches, goal.refs.branches);
    }
    compare_refs("branch", DiffDimension::Branches, branchNames, actual.refs.branches, goal.refs.branches, actual, actualShape,
                 goal, goalShape, out);
    if (options.compareTags) {
        compare_refs("tag", DiffDimension::Tags, union_names(actual.refs.tags, goal.refs.tags), actual.refs.tags, goal.refs.tags,
                     actual, actualShape, goal, goalShape, out);
    }
    compare_head(actual, actualShape, goal, goalShape, branchNames, out);
    return out;
}

const char* dimension_name(DiffDimension dimension) {
    switch (dimension) {
        case DiffDimension::Commits: return "commit";
        case DiffDimension::Branches: return "branch";
        case DiffDimension::Tags: return "tag";
        case DiffDimension::Head: return "head";
    }
    return "commit";
}

} // namespace gitsim
