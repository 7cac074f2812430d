#include "gitsim_engine/types.hpp"

namespace gitsim {

EngineError make_error(ErrorCode code, std::string subject, std::string message) {
    EngineError e;
    e.code = code;
    e.subject = std::move(subject);
    e.message = std::move(message);
    return e;
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidParent: return "InvalidParent";
        case ErrorCode::CycleDetected: return "CycleDetected";
        case ErrorCode::UnknownRef: return "UnknownRef";
        case ErrorCode::UnknownStart: return "UnknownStart";
        case ErrorCode::UnknownCommit: return "UnknownCommit";
        case ErrorCode::DuplicateBranch: return "DuplicateBranch";
        case ErrorCode::DuplicateTag: return "DuplicateTag";
        case ErrorCode::DuplicateCommit: return "DuplicateCommit";
        case ErrorCode::BranchCheckedOut: return "BranchCheckedOut";
        case ErrorCode::NotFullyMerged: return "NotFullyMerged";
        case ErrorCode::UnrelatedHistories: return "UnrelatedHistories";
        case ErrorCode::InvalidTodo: return "InvalidTodo";
        case ErrorCode::InvalidSquashPosition: return "InvalidSquashPosition";
        case ErrorCode::InvalidSessionState: return "InvalidSessionState";
        case ErrorCode::RebaseInProgress: return "RebaseInProgress";
        case ErrorCode::NoRebaseInProgress: return "NoRebaseInProgress";
        case ErrorCode::NothingToUndo: return "NothingToUndo";
        case ErrorCode::NothingToRedo: return "NothingToRedo";
        case ErrorCode::UnknownRemote: return "UnknownRemote";
        case ErrorCode::DuplicateRemote: return "DuplicateRemote";
        case ErrorCode::NonFastForward: return "NonFastForward";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::UnknownCommand: return "UnknownCommand";
        case ErrorCode::InvalidFixture: return "InvalidFixture";
    }
    return "Unknown";
}

const char* advisory_code_name(AdvisoryCode code) {
    switch (code) {
        case AdvisoryCode::ConflictsUnknown: return "ConflictsUnknown";
        case AdvisoryCode::ConflictsDetected: return "ConflictsDetected";
    }
    return "Unknown";
}

} // namespace gitsim
