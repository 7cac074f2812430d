#include "gitsim_engine/level.hpp"
#include "gitsim_engine/command_parser.hpp"
#include "gitsim_engine/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <unordered_map>

namespace gitsim {

using nlohmann::json;

static EngineError fixture_error(const std::string& field, const std::string& message) {
    return make_error(ErrorCode::InvalidFixture, field, field.empty() ? message : field + ": " + message);
}

static Result<std::vector<std::string>> string_array(const json& j, const std::string& field) {
    if (!j.is_array()) return fixture_error(field, "must be an array of strings");
    std::vector<std::string> out;
    for (const auto& item : j) {
        if (!item.is_string()) return fixture_error(field, "must be an array of strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

// Latest timestamp a fixture may carry (9999-12-31T23:59:59Z).
static const long long kMaxTimestamp = 253402300799LL;

// Integral JSON number within [lo, hi]; floating point and out-of-range values fail.
static bool integer_in_range(const json& j, long long lo, long long hi) {
    if (!j.is_number_integer()) return false;
    if (j.is_number_unsigned() && j.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        return false;
    }
    long long v = j.get<long long>();
    return v >= lo && v <= hi;
}

static Result<std::string> required_string(const json& obj, const char* key, const std::string& field) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fixture_error(field + "." + key, "must be a string");
    return it->get<std::string>();
}

static Result<Commit> commit_from_json(const json& c, const std::string& field, const EngineConfig& config, bool& hasTimestamp) {
    if (!c.is_object()) return fixture_error(field, "must be an object");
    Commit commit;
    auto id = required_string(c, "id", field);
    if (!id.ok()) return id.error();
    commit.id = id.value();
    auto message = required_string(c, "message", field);
    if (!message.ok()) return message.error();
    commit.message = message.value();

    if (auto it = c.find("parents"); it != c.end()) {
        auto parents = string_array(*it, field + ".parents");
        if (!parents.ok()) return parents.error();
        commit.parents = parents.value();
    }
    commit.author = config.defaultAuthor;
    if (auto it = c.find("author"); it != c.end() && !it->is_null()) {
        if (!it->is_string()) return fixture_error(field + ".author", "must be a string");
        commit.author = it->get<std::string>();
    }
    hasTimestamp = false;
    if (auto it = c.find("timestamp"); it != c.end() && !it->is_null()) {
        if (!integer_in_range(*it, 0, kMaxTimestamp)) return fixture_error(field + ".timestamp", "must be a whole number of seconds");
        commit.timestamp = it->get<long long>();
        hasTimestamp = true;
    }
    if (auto it = c.find("changes"); it != c.end() && !it->is_null()) {
        auto changes = string_array(*it, field + ".changes");
        if (!changes.ok()) return changes.error();
        commit.changes = changes.value();
    }
    return commit;
}

static Result<CommitGraph> graph_from_json(const json& commitsJson, const EngineConfig& config) {
    std::vector<Commit> commits;
    std::vector<bool> timed;
    for (size_t i = 0; i < commitsJson.size(); ++i) {
        bool hasTimestamp = false;
        auto commit = commit_from_json(commitsJson[i], "commits[" + std::to_string(i) + "]", config, hasTimestamp);
        if (!commit.ok()) return commit.error();
        commits.push_back(std::move(commit.value()));
        timed.push_back(hasTimestamp);
    }
    auto graph = build_graph(commits, make_factory(config.idPrefix, config.defaultAuthor, config.baseTimestamp));
    if (!graph.ok()) return graph.error();
    if (std::find(timed.begin(), timed.end(), false) == timed.end()) return graph;

    // Untimed commits take the logical clock in topological order.
    std::unordered_map<CommitId, long long> position;
    const auto& order = graph.value().order;
    for (size_t i = 0; i < order.size(); ++i) position[order[i]] = static_cast<long long>(i);
    for (size_t i = 0; i < commits.size(); ++i) {
        if (!timed[i]) commits[i].timestamp = config.baseTimestamp + position[commits[i].id];
    }
    return build_graph(commits, make_factory(config.idPrefix, config.defaultAuthor, config.baseTimestamp));
}

static Result<CommitId> known_target(const json& obj, const std::string& field, const Snapshot& s) {
    auto target = required_string(obj, "target", field);
    if (!target.ok()) return target.error();
    if (!has_commit(s.graph, target.value())) {
        return make_error(ErrorCode::UnknownRef, field, field + " points at unknown commit " + target.value());
    }
    return target;
}

// remotes: [{name, url, branches?: [{name, target}]}],
// remoteBranches: [{name: "<remote>/<branch>", target}]
static std::optional<EngineError> remotes_from_json(const json& j, Snapshot& s) {
    if (auto remotes = j.find("remotes"); remotes != j.end() && !remotes->is_null()) {
        if (!remotes->is_array()) return fixture_error("remotes", "must be an array");
        for (size_t i = 0; i < remotes->size(); ++i) {
            const json& r = (*remotes)[i];
            std::string field = "remotes[" + std::to_string(i) + "]";
            if (!r.is_object()) return fixture_error(field, "must be an object");
            auto name = required_string(r, "name", field);
            if (!name.ok()) return name.error();
            auto url = required_string(r, "url", field);
            if (!url.ok()) return url.error();
            auto added = add_remote(s.refs, name.value(), url.value());
            if (!added.ok()) return added.error();
            auto branches = r.find("branches");
            if (branches == r.end() || branches->is_null()) continue;
            if (!branches->is_array()) return fixture_error(field + ".branches", "must be an array");
            Remote& remote = s.refs.remotes.at(name.value());
            for (size_t k = 0; k < branches->size(); ++k) {
                const json& b = (*branches)[k];
                std::string at = field + ".branches[" + std::to_string(k) + "]";
                if (!b.is_object()) return fixture_error(at, "must be an object");
                auto branch = required_string(b, "name", at);
                if (!branch.ok()) return branch.error();
                auto target = known_target(b, at, s);
                if (!target.ok()) return target.error();
                remote.branches[branch.value()] = target.value();
            }
        }
    }

    if (auto tracking = j.find("remoteBranches"); tracking != j.end() && !tracking->is_null()) {
        if (!tracking->is_array()) return fixture_error("remoteBranches", "must be an array");
        for (size_t i = 0; i < tracking->size(); ++i) {
            const json& t = (*tracking)[i];
            std::string field = "remoteBranches[" + std::to_string(i) + "]";
            if (!t.is_object()) return fixture_error(field, "must be an object");
            auto name = required_string(t, "name", field);
            if (!name.ok()) return name.error();
            size_t slash = name.value().find('/');
            if (slash == std::string::npos || slash == 0 || slash + 1 == name.value().size() ||
                !find_remote(s.refs, name.value().substr(0, slash))) {
                return fixture_error(field + ".name", "must be <remote>/<branch> for a configured remote");
            }
            auto target = known_target(t, field, s);
            if (!target.ok()) return target.error();
            if (s.refs.tracking.count(name.value())) return fixture_error(field + ".name", "is listed twice");
            s.refs.tracking.emplace(name.value(), Branch{name.value(), target.value()});
            s.refs.trackingOrder.push_back(name.value());
        }
    }
    return std::nullopt;
}

static std::optional<EngineError> refs_from_json(const json& j, Snapshot& s) {
    auto branches = j.find("branches");
    if (branches == j.end() || !branches->is_array()) return fixture_error("branches", "must be an array");
    for (size_t i = 0; i < branches->size(); ++i) {
        const json& b = (*branches)[i];
        std::string field = "branches[" + std::to_string(i) + "]";
        if (!b.is_object()) return fixture_error(field, "must be an object");
        auto name = required_string(b, "name", field);
        if (!name.ok()) return name.error();
        auto target = required_string(b, "target", field);
        if (!target.ok()) return target.error();
        if (!has_commit(s.graph, target.value())) {
            return make_error(ErrorCode::UnknownRef, name.value(), "branch '" + name.value() + "' points at unknown commit " + target.value());
        }
        auto created = create_branch(s.refs, name.value(), target.value());
        if (!created.ok()) return created.error();
    }

    if (auto tags = j.find("tags"); tags != j.end() && !tags->is_null()) {
        if (!tags->is_array()) return fixture_error("tags", "must be an array");
        for (size_t i = 0; i < tags->size(); ++i) {
            const json& t = (*tags)[i];
            std::string field = "tags[" + std::to_string(i) + "]";
            if (!t.is_object()) return fixture_error(field, "must be an object");
            auto name = required_string(t, "name", field);
            if (!name.ok()) return name.error();
            auto target = required_string(t, "target", field);
            if (!target.ok()) return target.error();
            if (!has_commit(s.graph, target.value())) {
                return make_error(ErrorCode::UnknownRef, name.value(), "tag '" + name.value() + "' points at unknown commit " + target.value());
            }
            std::string message;
            if (auto m = t.find("message"); m != t.end() && m->is_string()) message = m->get<std::string>();
            auto created = create_tag(s.refs, name.value(), target.value(), message);
            if (!created.ok()) return created.error();
        }
    }

    if (auto err = remotes_from_json(j, s)) return *err;

    auto head = j.find("head");
    if (head == j.end()) return fixture_error("head", "is required");
    if (head->is_string()) {
        std::string ref = head->get<std::string>();
        if (find_branch(s.refs, ref)) attach_head(s.refs, ref);
        else if (has_commit(s.graph, ref)) detach_head(s.refs, ref);
        else return make_error(ErrorCode::UnknownRef, ref, "HEAD refers to unknown ref '" + ref + "'");
        return std::nullopt;
    }
    if (!head->is_object()) return fixture_error("head", "must be an object or a string");
    auto type = required_string(*head, "type", "head");
    if (!type.ok()) return type.error();
    if (type.value() == "branch") {
        auto name = required_string(*head, "name", "head");
        if (!name.ok()) return name.error();
        attach_head(s.refs, name.value());
    } else if (type.value() == "detached") {
        auto commit = required_string(*head, "commit", "head");
        if (!commit.ok()) return commit.error();
        detach_head(s.refs, commit.value());
    } else {
        return fixture_error("head.type", "must be \"branch\" or \"detached\"");
    }
    return std::nullopt;
}

Result<Snapshot> snapshot_from_json(const json& j, const EngineConfig& config) {
    if (!j.is_object()) return fixture_error("", "snapshot must be an object");
    auto commits = j.find("commits");
    if (commits == j.end() || !commits->is_array()) return fixture_error("commits", "must be an array");

    auto graph = graph_from_json(*commits, config);
    if (!graph.ok()) return graph.error();
    Snapshot s;
    s.graph = std::move(graph.value());
    if (auto err = refs_from_json(j, s)) return *err;
    if (auto err = check_invariants(s)) return *err;
    return s;
}

json snapshot_to_json(const Snapshot& s) {
    json commits = json::array();
    for (const auto& id : s.graph.order) {
        const Commit* c = find_commit(s.graph, id);
        json jc = {{"id", c->id}, {"parents", c->parents}, {"message", c->message}, {"author", c->author}, {"timestamp", c->timestamp}};
        if (c->changes) jc["changes"] = *c->changes;
        commits.push_back(std::move(jc));
    }
    json branches = json::array();
    for (const auto& name : s.refs.branchOrder) {
        branches.push_back({{"name", name}, {"target", s.refs.branches.at(name).target}});
    }
    json tags = json::array();
    for (const auto& name : s.refs.tagOrder) {
        const Tag& t = s.refs.tags.at(name);
        json jt = {{"name", t.name}, {"target", t.target}};
        if (!t.message.empty()) jt["message"] = t.message;
        tags.push_back(std::move(jt));
    }
    json head;
    if (s.refs.head.kind == HeadKind::Attached) head = {{"type", "branch"}, {"name", s.refs.head.branch}};
    else head = {{"type", "detached"}, {"commit", s.refs.head.commit}};
    json out = {{"commits", commits}, {"branches", branches}, {"tags", tags}, {"head", head}};

    if (!s.refs.remoteOrder.empty()) {
        json remotes = json::array();
        for (const auto& name : s.refs.remoteOrder) {
            const Remote& r = s.refs.remotes.at(name);
            json rb = json::array();
            for (const auto& kv : r.branches) rb.push_back({{"name", kv.first}, {"target", kv.second}});
            remotes.push_back({{"name", r.name}, {"url", r.url}, {"branches", rb}});
        }
        out["remotes"] = remotes;
    }
    if (!s.refs.trackingOrder.empty()) {
        json tracking = json::array();
        for (const auto& name : s.refs.trackingOrder) {
            tracking.push_back({{"name", name}, {"target", s.refs.tracking.at(name).target}});
        }
        out["remoteBranches"] = tracking;
    }
    return out;
}

static bool valid_level_id(const std::string& id) {
    if (id.empty()) return false;
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') return false;
    }
    return true;
}

static std::optional<Difficulty> parse_difficulty(const std::string& text) {
    if (text == "intro") return Difficulty::Intro;
    if (text == "beginner") return Difficulty::Beginner;
    if (text == "intermediate") return Difficulty::Intermediate;
    if (text == "advanced") return Difficulty::Advanced;
    return std::nullopt;
}

const char* difficulty_name(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Intro: return "intro";
        case Difficulty::Beginner: return "beginner";
        case Difficulty::Intermediate: return "intermediate";
        case Difficulty::Advanced: return "advanced";
    }
    return "intro";
}

static bool non_empty_object(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_object() && !it->empty();
}

static void validate_state_schema(const json& state, const std::string& name, std::vector<ValidationIssue>& errors) {
    auto error = [&](const std::string& field, const std::string& message) { errors.push_back({name + "." + field, message}); };
    if (!state.is_object()) {
        errors.push_back({name, "State must be an object"});
        return;
    }
    auto commits = state.find("commits");
    if (commits == state.end() || !commits->is_array()) {
        error("commits", "Commits must be an array");
    } else if (commits->empty()) {
        error("commits", "At least one commit is required");
    } else {
        for (size_t i = 0; i < commits->size(); ++i) {
            const json& c = (*commits)[i];
            std::string at = "commits[" + std::to_string(i) + "]";
            if (!c.is_object()) {
                error(at, "Commit must be an object");
                continue;
            }
            if (!c.contains("id") || !c["id"].is_string() || c["id"].get<std::string>().empty()) error(at + ".id", "Commit ID is required");
            if (!c.contains("parents") || !c["parents"].is_array()) error(at + ".parents", "Commit parents must be an array");
            if (!c.contains("message") || !c["message"].is_string() || c["message"].get<std::string>().empty()) {
                error(at + ".message", "Commit message is required");
            }
            if (c.contains("timestamp") && !integer_in_range(c["timestamp"], 0, kMaxTimestamp)) {
                error(at + ".timestamp", "Commit timestamp must be a whole number of seconds");
            }
        }
    }
    auto branches = state.find("branches");
    if (branches == state.end() || !branches->is_array()) {
        error("branches", "Branches must be an array");
    } else if (branches->empty()) {
        error("branches", "At least one branch is required");
    } else {
        for (size_t i = 0; i < branches->size(); ++i) {
            const json& b = (*branches)[i];
            std::string at = "branches[" + std::to_string(i) + "]";
            if (!b.is_object() || !b.contains("name") || !b["name"].is_string()) error(at + ".name", "Branch name is required");
            if (!b.is_object() || !b.contains("target") || !b["target"].is_string()) error(at + ".target", "Branch target is required");
        }
    }
    if (state.contains("tags") && !state["tags"].is_array()) error("tags", "Tags must be an array");
    auto head = state.find("head");
    if (head == state.end() || !(head->is_object() || head->is_string())) {
        error("head", "HEAD state is required");
    } else if (head->is_object()) {
        std::string type = head->contains("type") && (*head)["type"].is_string() ? (*head)["type"].get<std::string>() : "";
        if (type != "branch" && type != "detached") error("head.type", "HEAD type must be \"branch\" or \"detached\"");
        if (type == "branch" && (!head->contains("name") || !(*head)["name"].is_string())) {
            error("head.name", "HEAD name is required for branch type");
        }
        if (type == "detached" && (!head->contains("commit") || !(*head)["commit"].is_string())) {
            error("head.commit", "HEAD commit is required for detached type");
        }
    }
}

static void validate_step(const json& step, size_t index, std::vector<ValidationIssue>& errors) {
    std::string at = "tutorialSteps[" + std::to_string(index) + "]";
    if (!step.is_object()) {
        errors.push_back({at, "Tutorial step must be an object"});
        return;
    }
    std::string type = step.contains("type") && step["type"].is_string() ? step["type"].get<std::string>() : "";
    if (type != "dialog" && type != "demonstration" && type != "challenge") {
        errors.push_back({at + ".type", "Tutorial step type must be \"dialog\", \"demonstration\", or \"challenge\""});
    }
    if (!step.contains("id") || !step["id"].is_string()) errors.push_back({at + ".id", "Tutorial step ID is required"});

    if (type == "dialog") {
        if (!non_empty_object(step, "title")) errors.push_back({at + ".title", "Dialog title is required"});
        if (!non_empty_object(step, "content")) errors.push_back({at + ".content", "Dialog content is required"});
    } else if (type == "demonstration") {
        if (!step.contains("beforeText") || !step["beforeText"].is_object()) {
            errors.push_back({at + ".beforeText", "Demonstration beforeText is required"});
        }
        if (!step.contains("demonstrationCommand") || !step["demonstrationCommand"].is_string()) {
            errors.push_back({at + ".demonstrationCommand", "Demonstration command is required"});
        }
        if (!step.contains("afterText") || !step["afterText"].is_object()) {
            errors.push_back({at + ".afterText", "Demonstration afterText is required"});
        }
        if (!step.contains("setupCommands") || !step["setupCommands"].is_array()) {
            errors.push_back({at + ".setupCommands", "Demonstration setupCommands must be an array"});
        }
    } else if (type == "challenge") {
        if (!step.contains("instructions") || !step["instructions"].is_object()) {
            errors.push_back({at + ".instructions", "Challenge instructions are required"});
        }
        if (!step.contains("hints") || !step["hints"].is_array()) {
            errors.push_back({at + ".hints", "Challenge hints must be an array"});
        }
    }
}

LevelValidation validate_level(const json& j) {
    LevelValidation v;
    auto error = [&](const std::string& field, const std::string& message) { v.errors.push_back({field, message}); };
    auto warning = [&](const std::string& field, const std::string& message) { v.warnings.push_back({field, message}); };
    if (!j.is_object()) {
        error("", "Level must be a JSON object");
        return v;
    }

    std::string id = j.contains("id") && j["id"].is_string() ? j["id"].get<std::string>() : "";
    if (id.empty()) error("id", "Level ID is required and must be a non-empty string");
    else if (!valid_level_id(id)) error("id", "Level ID must contain only alphanumeric characters, hyphens, and underscores");

    for (const char* key : {"name", "description"}) {
        std::string field = key;
        if (!non_empty_object(j, key)) error(field, "Level " + field + " is required and must have at least one locale");
        else if (!j[key].contains("en_US")) warning(field, "Level " + field + " should have an English (en_US) translation");
    }

    std::string difficulty = j.contains("difficulty") && j["difficulty"].is_string() ? j["difficulty"].get<std::string>() : "";
    if (!parse_difficulty(difficulty)) error("difficulty", "Difficulty must be one of: intro, beginner, intermediate, advanced");

    if (!j.contains("order") || !integer_in_range(j["order"], 0, std::numeric_limits<int>::max())) {
        error("order", "Order must be a non-negative integer");
    }

    for (const char* key : {"initialState", "goalState"}) {
        std::string field = key;
        if (!j.contains(key)) {
            error(field, field == "initialState" ? "Initial state is required" : "Goal state is required");
            continue;
        }
        size_t before = v.errors.size();
        validate_state_schema(j[key], field, v.errors);
        if (v.errors.size() != before) continue;
        auto state = snapshot_from_json(j[key], EngineConfig());
        if (!state.ok()) error(field, state.error().message);
    }

    auto steps = j.find("tutorialSteps");
    if (steps == j.end() || !steps->is_array() || steps->empty()) {
        error("tutorialSteps", "At least one tutorial step is required");
    } else {
        for (size_t i = 0; i < steps->size(); ++i) validate_step((*steps)[i], i, v.errors);
    }

    auto solution = j.find("solutionCommands");
    if (solution == j.end() || !solution->is_array() || solution->empty()) {
        warning("solutionCommands", "Solution commands are recommended for proper scoring");
    } else {
        for (size_t i = 0; i < solution->size(); ++i) {
            std::string field = "solutionCommands[" + std::to_string(i) + "]";
            const json& line = (*solution)[i];
            if (!line.is_string()) {
                error(field, "Solution command must be a string");
                continue;
            }
            auto parsed = parse_command(line.get<std::string>());
            if (!parsed.ok()) error(field, parsed.error().message);
        }
    }

    auto hints = j.find("hints");
    if (hints == j.end() || !hints->is_array() || hints->empty()) warning("hints", "Hints are recommended to help users");

    if (auto flags = j.find("flags"); flags != j.end()) {
        if (!flags->is_object()) {
            error("flags", "Flags must be an object");
        } else {
            for (const char* key : {"compareOnlyMain", "allowAnySolution", "disableHints"}) {
                if (flags->contains(key) && !(*flags)[key].is_boolean()) error(std::string("flags.") + key, "Flag must be a boolean");
            }
            auto limit = flags->find("timeLimit");
            if (limit != flags->end() && !integer_in_range(*limit, 1, 86400)) {
                error("flags.timeLimit", "Time limit must be a positive number of seconds");
            }
        }
    }

    v.valid = v.errors.empty();
    return v;
}

static LocalizedText localized_text(const json& j) {
    LocalizedText out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string()) out[it.key()] = it.value().get<std::string>();
    }
    return out;
}

static LocalizedParagraphs localized_paragraphs(const json& j) {
    LocalizedParagraphs out;
    if (!j.is_object()) return out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string()) {
            out[it.key()] = {it.value().get<std::string>()};
        } else if (it.value().is_array()) {
            auto& lines = out[it.key()];
            for (const auto& line : it.value()) {
                if (line.is_string()) lines.push_back(line.get<std::string>());
            }
        }
    }
    return out;
}

static TutorialStepType step_type(const std::string& text) {
    if (text == "demonstration") return TutorialStepType::Demonstration;
    if (text == "challenge") return TutorialStepType::Challenge;
    return TutorialStepType::Dialog;
}

Result<Level> level_from_json(const json& j, const EngineConfig& config) {
    LevelValidation validation = validate_level(j);
    if (!validation.valid) {
        const auto& first = validation.errors.front();
        Logger::instance().warning("Level", "level failed validation", first.field + ": " + first.message);
        return fixture_error(first.field, first.message);
    }
    Level level;
    level.id = j["id"].get<std::string>();
    for (const auto& w : validation.warnings) {
        Logger::instance().warning("Level", w.message, level.id + " " + w.field);
    }
    level.name = localized_text(j["name"]);
    level.description = localized_text(j["description"]);
    level.difficulty = *parse_difficulty(j["difficulty"].get<std::string>());
    level.order = j["order"].get<int>();

    auto initial = snapshot_from_json(j["initialState"], config);
    if (!initial.ok()) return initial.error();
    level.initialState = std::move(initial.value());
    auto goal = snapshot_from_json(j["goalState"], config);
    if (!goal.ok()) return goal.error();
    level.goalState = std::move(goal.value());

    for (const auto& step : j["tutorialSteps"]) {
        level.tutorialSteps.push_back(TutorialStep{step_type(step["type"].get<std::string>()), step["id"].get<std::string>(), step});
    }
    if (auto solution = j.find("solutionCommands"); solution != j.end() && solution->is_array()) {
        for (const auto& line : *solution) level.solutionCommands.push_back(line.get<std::string>());
    }
    if (auto hints = j.find("hints"); hints != j.end() && hints->is_array()) {
        for (const auto& hint : *hints) level.hints.push_back(localized_paragraphs(hint));
    }
    if (auto flags = j.find("flags"); flags != j.end()) {
        level.flags.compareOnlyMain = flags->value("compareOnlyMain", false);
        level.flags.allowAnySolution = flags->value("allowAnySolution", false);
        level.flags.disableHints = flags->value("disableHints", false);
        if (flags->contains("timeLimit")) level.flags.timeLimit = (*flags)["timeLimit"].get<int>();
    }
    return level;
}

Result<Level> load_level_file(const std::string& path, const EngineConfig& config) {
    std::ifstream in(path);
    if (!in) {
        GITSIM_LOG_ERROR("Level", "cannot open level file", path);
        return make_error(ErrorCode::InvalidFixture, path, "cannot open level file '" + path + "'");
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        GITSIM_LOG_ERROR("Level", e.what(), path);
        return make_error(ErrorCode::InvalidFixture, path, std::string("level parse error: ") + e.what());
    }
    auto level = level_from_json(j, config);
    if (!level.ok()) {
        GITSIM_LOG_ERROR("Level", level.error().message, path);
        return level;
    }
    GITSIM_LOG_DEBUG("Level", "loaded " + level.value().id + " (" + difficulty_name(level.value().difficulty) + ")", path);
    return level;
}

CompareOptions compare_options_for(const Level& level) {
    CompareOptions options;
    if (level.flags.compareOnlyMain) options.onlyBranches = std::vector<std::string>{"main"};
    return options;
}

SolutionRun run_solution(const Level& level, const EngineConfig& config) {
    SolutionRun run;
    run.success = true;
    Session session(config, fork_snapshot(level.initialState));
    for (const auto& line : level.solutionCommands) {
        CommandResult result = session.execute(line);
        if (!result.success) run.success = false;
        run.commandResults.emplace_back(line, std::move(result));
    }
    if (session.rebase_active()) {
        run.success = false;
        Logger::instance().warning("Level", "solution leaves a rebase in progress", level.id);
    }
    run.finalState = session.snapshot();
    return run;
}

LevelVerification verify_level(const Level& level, const EngineConfig& config) {
    LevelVerification v;
    v.run = run_solution(level, config);
    v.differences = compare_snapshots(v.run.finalState, level.goalState, compare_options_for(level));
    v.valid = v.run.success && v.differences.empty();
    return v;
}

SolutionValidation validate_solution(const Level& level, const Snapshot& actual, int commandsUsed) {
    SolutionValidation v;
    if (!level.flags.allowAnySolution) {
        v.differences = compare_snapshots(actual, level.goalState, compare_options_for(level));
    }
    if (!v.differences.empty()) {
        v.valid = false;
        v.message = "Solution is not correct yet. Keep trying!";
        return v;
    }
    SolutionScore score;
    score.commandsUsed = commandsUsed;
    score.optimalCommands = static_cast<int>(level.solutionCommands.size());
    score.efficiency = commandsUsed > 0 ? static_cast<int>(std::lround(score.optimalCommands * 100.0 / commandsUsed)) : 100;
    v.valid = true;
    v.message = "Level completed! You used " + std::to_string(commandsUsed) + (commandsUsed == 1 ? " command." : " commands.");
    v.score = score;
    return v;
}

} // namespace gitsim
