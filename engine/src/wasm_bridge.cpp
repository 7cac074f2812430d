#ifdef __EMSCRIPTEN__
#include <emscripten/bind.h>
#include "gitsim_engine/compare.hpp"
#include "gitsim_engine/level.hpp"
#include "gitsim_engine/session.hpp"
#include <nlohmann/json.hpp>

using namespace emscripten;
using namespace gitsim;
using nlohmann::json;

static json result_to_json(const CommandResult& r) {
  json out = {{"success", r.success}, {"message", r.message}};
  if (r.error) {
    out["error"] = {{"code", error_code_name(r.error->code)}, {"subject", r.error->subject}};
  }
  json advisories = json::array();
  for (const auto& a : r.advisories) {
    advisories.push_back({{"code", advisory_code_name(a.code)}, {"message", a.message}, {"fields", a.fields}});
  }
  out["advisories"] = advisories;
  return out;
}

static json error_json(const EngineError& e) {
  return {{"success", false}, {"message", e.message}, {"error", {{"code", error_code_name(e.code)}, {"subject", e.subject}}}};
}

// Owns a sandbox session; everything crosses the boundary as JSON text.
class SessionWasm {
public:
  SessionWasm() : session_(EngineConfig()) {}

  // Replace the state with a snapshot JSON document; history is cleared.
  std::string load(const std::string& snapshotJson) {
    json j = json::parse(snapshotJson, nullptr, false);
    if (j.is_discarded()) return error_json(make_error(ErrorCode::InvalidFixture, "", "invalid JSON")).dump();
    auto s = snapshot_from_json(j, session_.config());
    if (!s.ok()) return error_json(s.error()).dump();
    session_.reset(s.value());
    return json{{"success", true}, {"message", "loaded"}}.dump();
  }

  std::string execute(const std::string& line) { return result_to_json(session_.execute(line)).dump(); }

  std::string snapshot() const { return snapshot_to_json(session_.snapshot()).dump(); }

  // Rebase todo list for the UI, or null when no rebase is active.
  std::string rebaseTodo() const {
    if (!session_.rebase_active()) return "null";
    const auto& r = *session_.rebase();
    json items = json::array();
    for (const auto& item : r.todo) {
      items.push_back({{"action", rebase_action_name(item.action)}, {"commit", item.commit}, {"message", item.message}, {"order", item.order}});
    }
    return json{{"status", rebase_status_name(r.status)}, {"onto", r.onto}, {"cursor", r.cursor}, {"paused", r.paused}, {"todo", items}}.dump();
  }

  std::string confirmRebase(const std::string& todoJson) {
    json j = json::parse(todoJson, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
      return error_json(make_error(ErrorCode::InvalidTodo, "", "todo list must be a JSON array")).dump();
    }
    std::vector<RebaseTodoItem> todo;
    for (const auto& item : j) {
      if (!item.is_object() || !item.contains("commit") || !item["commit"].is_string()) {
        return error_json(make_error(ErrorCode::InvalidTodo, "", "todo item needs a commit")).dump();
      }
      RebaseTodoItem t;
      t.commit = item["commit"].get<std::string>();
      auto action = parse_rebase_action(item.value("action", std::string("pick")));
      if (!action) return error_json(make_error(ErrorCode::InvalidTodo, t.commit, "unknown todo action")).dump();
      t.action = *action;
      t.message = item.value("message", std::string());
      todo.push_back(t);
    }
    return result_to_json(session_.confirm_rebase(std::move(todo))).dump();
  }

  std::string continueRebase() { return result_to_json(session_.continue_rebase()).dump(); }
  std::string abortRebase() { return result_to_json(session_.abort_rebase()).dump(); }

  // Differences between the current state and a goal snapshot JSON document.
  std::string compareWithGoal(const std::string& goalJson) const {
    json j = json::parse(goalJson, nullptr, false);
    if (j.is_discarded()) return error_json(make_error(ErrorCode::InvalidFixture, "", "invalid JSON")).dump();
    auto goal = snapshot_from_json(j, session_.config());
    if (!goal.ok()) return error_json(goal.error()).dump();
    json diffs = json::array();
    for (const auto& d : compare_snapshots(session_.snapshot(), goal.value())) {
      diffs.push_back({{"type", dimension_name(d.dimension)}, {"description", d.description}});
    }
    return diffs.dump();
  }

private:
  Session session_;
};

EMSCRIPTEN_BINDINGS(gitsim_engine_module) {
  class_<SessionWasm>("Session")
      .constructor<>()
      .function("load", &SessionWasm::load)
      .function("execute", &SessionWasm::execute)
      .function("snapshot", &SessionWasm::snapshot)
      .function("rebaseTodo", &SessionWasm::rebaseTodo)
      .function("confirmRebase", &SessionWasm::confirmRebase)
      .function("continueRebase", &SessionWasm::continueRebase)
      .function("abortRebase", &SessionWasm::abortRebase)
      .function("compareWithGoal", &SessionWasm::compareWithGoal);
}

#endif // __EMSCRIPTEN__
