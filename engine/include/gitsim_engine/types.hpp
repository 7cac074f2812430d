#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gitsim {

using CommitId = std::string;

struct Commit {
    CommitId id;
    std::vector<CommitId> parents; // ordered; index 0 is the first parent, empty for a root
    std::string message;
    std::string author;
    long long timestamp = 0;
    // Synthetic fields touched by this commit, as tracked by the tutorial/sandbox.
    // nullopt means the commit carries no such information.
    std::optional<std::vector<std::string>> changes;
};

struct Branch {
    std::string name;
    CommitId target;
};

// Lightweight tag: never moves once created.
struct Tag {
    std::string name;
    CommitId target;
    std::string message;
};

// A configured remote and the branch heads it holds. The remote shares the
// local commit graph; only its refs are its own.
struct Remote {
    std::string name;
    std::string url;
    std::map<std::string, CommitId> branches;
};

enum class HeadKind {
    Attached,
    Detached
};

struct Head {
    HeadKind kind = HeadKind::Attached;
    std::string branch; // when attached
    CommitId commit;    // when detached
};

enum class ErrorCode {
    InvalidParent,
    CycleDetected,
    UnknownRef,
    UnknownStart,
    UnknownCommit,
    DuplicateBranch,
    DuplicateTag,
    DuplicateCommit,
    BranchCheckedOut,
    NotFullyMerged,
    UnrelatedHistories,
    InvalidTodo,
    InvalidSquashPosition,
    InvalidSessionState,
    RebaseInProgress,
    NoRebaseInProgress,
    NothingToUndo,
    NothingToRedo,
    UnknownRemote,
    DuplicateRemote,
    NonFastForward,
    InvalidArgument,
    UnknownCommand,
    InvalidFixture
};

// Carries the offending ref/commit/branch in `subject` so callers can render
// a precise message without re-deriving it.
struct EngineError {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string subject;
    std::string message;
};

EngineError make_error(ErrorCode code, std::string subject, std::string message);
const char* error_code_name(ErrorCode code);

template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(EngineError error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const EngineError& error() const { return *error_; }

private:
    std::optional<T> value_;
    std::optional<EngineError> error_;
};

// Non-fatal notes attached to an otherwise successful command.
enum class AdvisoryCode {
    ConflictsUnknown,
    ConflictsDetected
};

struct Advisory {
    AdvisoryCode code = AdvisoryCode::ConflictsUnknown;
    std::string message;
    std::vector<std::string> fields;
};

const char* advisory_code_name(AdvisoryCode code);

} // namespace gitsim
