#include "gitsim_engine/state_utils.hpp"
#include <cctype>

namespace gitsim {

std::optional<CommitId> head_commit(const Snapshot& s) {
    const Head& head = s.refs.head;
    if (head.kind == HeadKind::Detached) return head.commit;
    if (const Branch* b = find_branch(s.refs, head.branch)) return b->target;
    return std::nullopt;
}

std::optional<std::string> current_branch(const Snapshot& s) {
    if (s.refs.head.kind == HeadKind::Attached) return s.refs.head.branch;
    return std::nullopt;
}

static std::optional<CommitId> resolve_name(const Snapshot& s, const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name == "HEAD" || name == "@") return head_commit(s);
    if (const Branch* b = find_branch(s.refs, name)) return b->target;
    if (const Tag* t = find_tag(s.refs, name)) return t->target;
    if (const Branch* r = find_tracking(s.refs, name)) return r->target;
    if (has_commit(s.graph, name)) return name;
    // Unique prefix of a commit id; ambiguity resolves to nothing.
    std::optional<CommitId> match;
    for (const auto& id : s.graph.order) {
        if (id.size() > name.size() && id.compare(0, name.size(), name) == 0) {
            if (match) return std::nullopt;
            match = id;
        }
    }
    return match;
}

static EngineError unknown_ref(const std::string& ref) {
    return make_error(ErrorCode::UnknownRef, ref, "unknown revision or ref '" + ref + "'");
}

Result<CommitId> resolve_ref(const Snapshot& s, const std::string& ref) {
    if (ref.empty()) return unknown_ref(ref);
    size_t pos = ref.find_first_of("~^");
    auto base = resolve_name(s, ref.substr(0, pos));
    if (!base) return unknown_ref(ref);
    CommitId cur = *base;

    while (pos != std::string::npos && pos < ref.size()) {
        char op = ref[pos++];
        size_t digits = pos;
        while (digits < ref.size() && std::isdigit(static_cast<unsigned char>(ref[digits]))) ++digits;
        int n = 1;
        if (digits > pos) {
            if (digits - pos > 6) return unknown_ref(ref);
            n = std::stoi(ref.substr(pos, digits - pos));
        }
        pos = digits;
        if (pos < ref.size() && ref[pos] != '~' && ref[pos] != '^') return unknown_ref(ref);

        if (op == '~') {
            for (int i = 0; i < n; ++i) {
                const Commit* c = find_commit(s.graph, cur);
                if (c->parents.empty()) return unknown_ref(ref);
                cur = c->parents.front();
            }
        } else if (n > 0) {
            const Commit* c = find_commit(s.graph, cur);
            if (static_cast<size_t>(n) > c->parents.size()) return unknown_ref(ref);
            cur = c->parents[static_cast<size_t>(n - 1)];
        }
    }
    return cur;
}

void move_head_to(Snapshot& s, const CommitId& commit) {
    Head& head = s.refs.head;
    if (head.kind == HeadKind::Detached) {
        head.commit = commit;
        return;
    }
    auto it = s.refs.branches.find(head.branch);
    if (it != s.refs.branches.end()) {
        it->second.target = commit;
        return;
    }
    // First commit on an unborn branch.
    s.refs.branches.emplace(head.branch, Branch{head.branch, commit});
    s.refs.branchOrder.push_back(head.branch);
}

std::string first_line(const std::string& message) {
    return message.substr(0, message.find('\n'));
}

std::string describe_head(const Snapshot& s) {
    if (auto b = current_branch(s)) return "On branch " + *b;
    return "HEAD detached at " + s.refs.head.commit;
}

} // namespace gitsim
