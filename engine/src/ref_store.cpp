#include "gitsim_engine/ref_store.hpp"
#include <algorithm>

namespace gitsim {

bool operator==(const Branch& a, const Branch& b) {
    return a.name == b.name && a.target == b.target;
}

bool operator==(const Tag& a, const Tag& b) {
    return a.name == b.name && a.target == b.target && a.message == b.message;
}

bool operator==(const Head& a, const Head& b) {
    if (a.kind != b.kind) return false;
    if (a.kind == HeadKind::Attached) return a.branch == b.branch;
    return a.commit == b.commit;
}

bool operator==(const Remote& a, const Remote& b) {
    return a.name == b.name && a.url == b.url && a.branches == b.branches;
}

// Order vectors are presentation only; equality is by content.
bool operator==(const RefStore& a, const RefStore& b) {
    return a.branches == b.branches && a.tags == b.tags && a.remotes == b.remotes && a.tracking == b.tracking &&
           a.head == b.head;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_valid_ref_name(const std::string& name) {
    if (name.empty() || name == "HEAD" || name == "@") return false;
    if (name.front() == '-' || name.front() == '/' || name.front() == '.') return false;
    if (name.back() == '/' || name.back() == '.') return false;
    if (ends_with(name, ".lock")) return false;
    if (name.find("..") != std::string::npos || name.find("@{") != std::string::npos) return false;
    if (name.find("//") != std::string::npos || name.find("/.") != std::string::npos) return false;
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f) return false;
        switch (c) {
            case ' ': case '~': case '^': case ':': case '?': case '*': case '[': case '\\':
                return false;
            default:
                break;
        }
    }
    return true;
}

const Branch* find_branch(const RefStore& refs, const std::string& name) {
    auto it = refs.branches.find(name);
    return it == refs.branches.end() ? nullptr : &it->second;
}

const Tag* find_tag(const RefStore& refs, const std::string& name) {
    auto it = refs.tags.find(name);
    return it == refs.tags.end() ? nullptr : &it->second;
}

static void erase_name(std::vector<std::string>& order, const std::string& name) {
    auto it = std::find(order.begin(), order.end(), name);
    if (it != order.end()) order.erase(it);
}

Result<Branch> create_branch(RefStore& refs, const std::string& name, const CommitId& target, bool force) {
    if (!is_valid_ref_name(name)) {
        return make_error(ErrorCode::InvalidArgument, name, "'" + name + "' is not a valid branch name");
    }
    auto it = refs.branches.find(name);
    if (it != refs.branches.end()) {
        if (!force) return make_error(ErrorCode::DuplicateBranch, name, "a branch named '" + name + "' already exists");
        it->second.target = target;
        return it->second;
    }
    Branch b{name, target};
    refs.branches.emplace(name, b);
    refs.branchOrder.push_back(name);
    return b;
}

Result<Branch> delete_branch(RefStore& refs, const std::string& name) {
    auto it = refs.branches.find(name);
    if (it == refs.branches.end()) return make_error(ErrorCode::UnknownRef, name, "branch '" + name + "' not found");
    if (refs.head.kind == HeadKind::Attached && refs.head.branch == name) {
        return make_error(ErrorCode::BranchCheckedOut, name, "cannot delete branch '" + name + "' checked out");
    }
    Branch removed = it->second;
    refs.branches.erase(it);
    erase_name(refs.branchOrder, name);
    return removed;
}

Result<Tag> create_tag(RefStore& refs, const std::string& name, const CommitId& target, const std::string& message) {
    if (!is_valid_ref_name(name)) {
        return make_error(ErrorCode::InvalidArgument, name, "'" + name + "' is not a valid tag name");
    }
    if (refs.tags.count(name)) return make_error(ErrorCode::DuplicateTag, name, "tag '" + name + "' already exists");
    Tag t{name, target, message};
    refs.tags.emplace(name, t);
    refs.tagOrder.push_back(name);
    return t;
}

Result<Tag> delete_tag(RefStore& refs, const std::string& name) {
    auto it = refs.tags.find(name);
    if (it == refs.tags.end()) return make_error(ErrorCode::UnknownRef, name, "tag '" + name + "' not found");
    Tag removed = it->second;
    refs.tags.erase(it);
    erase_name(refs.tagOrder, name);
    return removed;
}

const Remote* find_remote(const RefStore& refs, const std::string& name) {
    auto it = refs.remotes.find(name);
    return it == refs.remotes.end() ? nullptr : &it->second;
}

const Branch* find_tracking(const RefStore& refs, const std::string& name) {
    auto it = refs.tracking.find(name);
    return it == refs.tracking.end() ? nullptr : &it->second;
}

Result<Remote> add_remote(RefStore& refs, const std::string& name, const std::string& url) {
    if (!is_valid_ref_name(name) || name.find('/') != std::string::npos) {
        return make_error(ErrorCode::InvalidArgument, name, "'" + name + "' is not a valid remote name");
    }
    if (url.empty()) return make_error(ErrorCode::InvalidArgument, name, "remote '" + name + "' needs a url");
    if (refs.remotes.count(name)) return make_error(ErrorCode::DuplicateRemote, name, "remote " + name + " already exists.");
    Remote r{name, url, {}};
    refs.remotes.emplace(name, r);
    refs.remoteOrder.push_back(name);
    return r;
}

static Branch& set_tracking(RefStore& refs, const std::string& remote, const std::string& branch, const CommitId& target) {
    std::string name = remote + "/" + branch;
    auto it = refs.tracking.find(name);
    if (it == refs.tracking.end()) {
        it = refs.tracking.emplace(name, Branch{name, target}).first;
        refs.trackingOrder.push_back(name);
    }
    it->second.target = target;
    return it->second;
}

static EngineError unknown_remote(const std::string& remote) {
    return make_error(ErrorCode::UnknownRemote, remote, "'" + remote + "' does not appear to be a git repository");
}

Result<Branch> publish_branch(RefStore& refs, const std::string& remote, const std::string& branch, const CommitId& target) {
    auto it = refs.remotes.find(remote);
    if (it == refs.remotes.end()) return unknown_remote(remote);
    it->second.branches[branch] = target;
    return set_tracking(refs, remote, branch, target);
}

Result<std::vector<Branch>> refresh_tracking(RefStore& refs, const std::string& remote) {
    auto it = refs.remotes.find(remote);
    if (it == refs.remotes.end()) return unknown_remote(remote);
    std::vector<Branch> updated;
    for (const auto& kv : it->second.branches) updated.push_back(set_tracking(refs, remote, kv.first, kv.second));
    return updated;
}

void attach_head(RefStore& refs, const std::string& branch) {
    refs.head.kind = HeadKind::Attached;
    refs.head.branch = branch;
    refs.head.commit.clear();
}

void detach_head(RefStore& refs, const CommitId& commit) {
    refs.head.kind = HeadKind::Detached;
    refs.head.branch.clear();
    refs.head.commit = commit;
}

std::vector<std::string> sorted_branch_names(const RefStore& refs) {
    std::vector<std::string> out = refs.branchOrder;
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> sorted_tag_names(const RefStore& refs) {
    std::vector<std::string> out = refs.tagOrder;
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> sorted_remote_names(const RefStore& refs) {
    std::vector<std::string> out = refs.remoteOrder;
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> sorted_tracking_names(const RefStore& refs) {
    std::vector<std::string> out = refs.trackingOrder;
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace gitsim
