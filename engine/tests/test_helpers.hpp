#pragma once

#include "gitsim_engine/engine.hpp"
#include "gitsim_engine/level.hpp"
#include "gitsim_engine/logger.hpp"
#include "gitsim_engine/snapshot.hpp"
#include "gitsim_engine/state_utils.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <unordered_set>

namespace gitsim_test {

using namespace gitsim;

static void assert_eq(const std::string& a, const std::string& b, const char* msg) {
    if (a != b) {
        std::cerr << "Assertion failed: " << msg << " ('" << a << "' != '" << b << "')\n";
        std::abort();
    }
}
static void assert_eq_size(size_t a, size_t b, const char* msg) {
    if (a != b) {
        std::cerr << "Assertion failed: " << msg << " (" << a << " != " << b << ")\n";
        std::abort();
    }
}
static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "Assertion failed: " << msg << "\n";
        std::abort();
    }
}

template <typename T>
static const T& expect_ok(const Result<T>& r, const char* msg) {
    if (!r.ok()) {
        std::cerr << "Assertion failed: " << msg << " (" << error_code_name(r.error().code) << ": " << r.error().message << ")\n";
        std::abort();
    }
    return r.value();
}

template <typename T>
static void expect_error(const Result<T>& r, ErrorCode code, const char* msg) {
    if (r.ok()) {
        std::cerr << "Assertion failed: " << msg << " (expected " << error_code_name(code) << ", got success)\n";
        std::abort();
    }
    assert_eq(error_code_name(r.error().code), error_code_name(code), msg);
}

// Tests run quietly unless something breaks.
static void quiet_logs() {
    Logger::instance().set_level(LogLevel::Error);
}

static Snapshot parse_snapshot(const char* text) {
    auto j = nlohmann::json::parse(text);
    return expect_ok(snapshot_from_json(j, EngineConfig()), "fixture parses");
}

static CommandOutcome run(const Snapshot& s, const Command& cmd) {
    return expect_ok(apply_command(s, cmd), command_type_name(cmd.type));
}

static Command make_cmd(CommandType type, const std::string& target = "") {
    Command c;
    c.type = type;
    c.target = target;
    return c;
}

static Command commit_cmd(const std::string& message) {
    Command c;
    c.type = CommandType::Commit;
    c.message = message;
    return c;
}

static CommitId head_of(const Snapshot& s) {
    auto h = head_commit(s);
    assert_true(h.has_value(), "HEAD resolves");
    return *h;
}

static const Commit& commit_at(const Snapshot& s, const CommitId& id) {
    const Commit* c = find_commit(s.graph, id);
    assert_true(c != nullptr, "commit exists");
    return *c;
}

static const std::string& message_at(const Snapshot& s, const CommitId& id) {
    return commit_at(s, id).message;
}

// At-rest invariants plus a few structural ones the checker leaves implicit.
static void verify_invariants(const Snapshot& s) {
    auto err = check_invariants(s);
    if (err) {
        std::cerr << "Invariant violated: " << err->message << "\n";
        std::abort();
    }
    std::unordered_set<CommitId> ids(s.graph.order.begin(), s.graph.order.end());
    assert_eq_size(ids.size(), s.graph.order.size(), "no duplicate ids in order");
    for (const auto& id : s.graph.order) {
        const Commit& c = commit_at(s, id);
        for (const auto& p : c.parents) {
            assert_true(commit_at(s, p).timestamp < c.timestamp, "parent older than child");
        }
    }
    assert_eq_size(s.refs.branchOrder.size(), s.refs.branches.size(), "branch order matches branches");
    assert_eq_size(s.refs.tagOrder.size(), s.refs.tags.size(), "tag order matches tags");
    assert_eq_size(s.refs.remoteOrder.size(), s.refs.remotes.size(), "remote order matches remotes");
    assert_eq_size(s.refs.trackingOrder.size(), s.refs.tracking.size(), "tracking order matches tracking refs");
}

} // namespace gitsim_test
