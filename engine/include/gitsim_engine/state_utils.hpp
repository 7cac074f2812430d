#pragma once

#include "gitsim_engine/snapshot.hpp"
#include "gitsim_engine/types.hpp"
#include <optional>
#include <string>

namespace gitsim {

// HEAD and ref helpers
std::optional<CommitId> head_commit(const Snapshot& s);
// Name of the checked-out branch, nullopt when detached.
std::optional<std::string> current_branch(const Snapshot& s);

// Resolves HEAD, a branch, a tag, a remote-tracking branch (origin/main), a
// full commit id, an ancestry expression (HEAD~2, main^, topic^2) or a unique
// id prefix. Fails with UnknownRef.
Result<CommitId> resolve_ref(const Snapshot& s, const std::string& ref);

// Moves the checked-out branch, or the detached HEAD, to `commit`.
void move_head_to(Snapshot& s, const CommitId& commit);

// Message helpers
std::string first_line(const std::string& message);
std::string describe_head(const Snapshot& s);

} // namespace gitsim
