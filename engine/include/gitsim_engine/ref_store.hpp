#pragma once

#include "gitsim_engine/types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace gitsim {

// Branches, tags, remotes and HEAD. Order vectors keep creation order for
// listings and serialization; lookups go through the maps.
struct RefStore {
    std::unordered_map<std::string, Branch> branches;
    std::vector<std::string> branchOrder;
    std::unordered_map<std::string, Tag> tags;
    std::vector<std::string> tagOrder;
    std::unordered_map<std::string, Remote> remotes;
    std::vector<std::string> remoteOrder;
    // Remote-tracking branches keyed by "<remote>/<branch>".
    std::unordered_map<std::string, Branch> tracking;
    std::vector<std::string> trackingOrder;
    Head head;
};

bool operator==(const Branch& a, const Branch& b);
bool operator==(const Tag& a, const Tag& b);
bool operator==(const Head& a, const Head& b);
bool operator==(const Remote& a, const Remote& b);
bool operator==(const RefStore& a, const RefStore& b);
inline bool operator!=(const RefStore& a, const RefStore& b) { return !(a == b); }

// git check-ref-format, reduced to what a tutorial needs.
bool is_valid_ref_name(const std::string& name);

const Branch* find_branch(const RefStore& refs, const std::string& name);
const Tag* find_tag(const RefStore& refs, const std::string& name);

// Fails with InvalidArgument for a malformed name, DuplicateBranch when the
// name is taken and `force` is false. With `force` an existing branch is moved.
Result<Branch> create_branch(RefStore& refs, const std::string& name, const CommitId& target, bool force = false);
// Fails with UnknownRef, or BranchCheckedOut when HEAD is attached to it.
Result<Branch> delete_branch(RefStore& refs, const std::string& name);

Result<Tag> create_tag(RefStore& refs, const std::string& name, const CommitId& target, const std::string& message = "");
Result<Tag> delete_tag(RefStore& refs, const std::string& name);

const Remote* find_remote(const RefStore& refs, const std::string& name);
const Branch* find_tracking(const RefStore& refs, const std::string& name);

// Fails with InvalidArgument for a malformed name or an empty url,
// DuplicateRemote when the name is taken.
Result<Remote> add_remote(RefStore& refs, const std::string& name, const std::string& url);
// Records `branch` on the remote and moves <remote>/<branch> with it.
// Fails with UnknownRemote.
Result<Branch> publish_branch(RefStore& refs, const std::string& remote, const std::string& branch, const CommitId& target);
// Points every <remote>/<branch> at the remote's current heads.
Result<std::vector<Branch>> refresh_tracking(RefStore& refs, const std::string& remote);

void attach_head(RefStore& refs, const std::string& branch);
void detach_head(RefStore& refs, const CommitId& commit);

// Sorted by name, the way `git branch` and `git tag` list them.
std::vector<std::string> sorted_branch_names(const RefStore& refs);
std::vector<std::string> sorted_tag_names(const RefStore& refs);
std::vector<std::string> sorted_remote_names(const RefStore& refs);
std::vector<std::string> sorted_tracking_names(const RefStore& refs);

} // namespace gitsim
