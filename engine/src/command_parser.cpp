#include "gitsim_engine/command_parser.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace gitsim {

// Options that consume the following token (`-m msg`, `--onto main`).
static const std::set<std::string> kValueOptions = {"m", "n", "message", "onto", "max-count"};

struct ParsedLine {
    std::string name;
    std::vector<std::string> args;
    std::set<std::string> flags;
    std::map<std::string, std::string> values;

    bool has(const std::string& flag) const { return flags.count(flag) > 0; }
    const std::string* value(const std::string& key) const {
        auto it = values.find(key);
        return it == values.end() ? nullptr : &it->second;
    }
};

static EngineError usage(const std::string& subject, const std::string& message) {
    return make_error(ErrorCode::InvalidArgument, subject, message);
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string canonical_name(const std::string& word) {
    static const std::map<std::string, std::string> aliases = {
        {"co", "checkout"}, {"br", "branch"}, {"ci", "commit"}, {"st", "status"}};
    auto it = aliases.find(word);
    return it == aliases.end() ? word : it->second;
}

static void parse_options(const std::vector<std::string>& tokens, size_t first, ParsedLine& out) {
    for (size_t i = first; i < tokens.size(); ++i) {
        const std::string& tok = tokens[i];
        bool hasNext = i + 1 < tokens.size();
        if (tok.size() > 2 && tok.compare(0, 2, "--") == 0) {
            std::string name = tok.substr(2);
            size_t eq = name.find('=');
            if (eq != std::string::npos) {
                out.values[name.substr(0, eq)] = name.substr(eq + 1);
            } else if (kValueOptions.count(name) && hasNext) {
                out.values[name] = tokens[++i];
            } else {
                out.flags.insert(name);
            }
        } else if (tok.size() > 1 && tok[0] == '-' && tok != "--") {
            std::string bundle = tok.substr(1);
            size_t eq = bundle.find('=');
            if (eq != std::string::npos) {
                out.values[bundle.substr(0, eq)] = bundle.substr(eq + 1);
            } else if (all_digits(bundle)) {
                out.values["n"] = bundle; // log -3
            } else {
                // -fd, -am "msg": the last letter may take the next token.
                for (size_t k = 0; k < bundle.size(); ++k) {
                    std::string flag(1, bundle[k]);
                    if (k + 1 == bundle.size() && kValueOptions.count(flag) && hasNext) {
                        out.values[flag] = tokens[++i];
                    } else {
                        out.flags.insert(flag);
                    }
                }
            }
        } else {
            out.args.push_back(tok);
        }
    }
}

static std::optional<std::string> message_of(const ParsedLine& p) {
    if (auto m = p.value("m")) return *m;
    if (auto m = p.value("message")) return *m;
    return std::nullopt;
}

static Result<Command> build_commit(const ParsedLine& p) {
    if (!p.args.empty()) return usage(p.args.front(), "commit does not take paths in this sandbox");
    if (p.has("m") || p.has("message")) return usage("m", "option 'm' requires a value");
    Command cmd;
    cmd.type = CommandType::Commit;
    cmd.amend = p.has("amend");
    cmd.message = message_of(p);
    return cmd;
}

static Result<Command> build_branch(const ParsedLine& p) {
    Command cmd;
    bool deleting = p.has("d") || p.has("D") || p.has("delete");
    if (deleting) {
        if (p.args.size() != 1) return usage("branch", "branch -d/-D requires exactly one branch name");
        cmd.type = CommandType::DeleteBranch;
        cmd.target = p.args[0];
        cmd.force = p.has("D") || p.has("f") || p.has("force");
        return cmd;
    }
    if (p.args.empty()) {
        cmd.type = CommandType::ListBranches;
        cmd.remoteBranches = p.has("r") || p.has("remotes");
        return cmd;
    }
    if (p.args.size() > 2) return usage(p.args[2], "too many arguments to branch");
    cmd.type = CommandType::CreateBranch;
    cmd.target = p.args[0];
    if (p.args.size() == 2) cmd.startPoint = p.args[1];
    cmd.force = p.has("f") || p.has("force");
    return cmd;
}

static Result<Command> build_checkout(const ParsedLine& p, bool isSwitch) {
    Command cmd;
    const char* create = isSwitch ? "c" : "b";
    const char* reset = isSwitch ? "C" : "B";
    const std::string verb = isSwitch ? "switch" : "checkout";
    if (p.has(create) || p.has(reset) || (isSwitch && (p.has("create") || p.has("force-create")))) {
        if (p.args.empty()) return usage(verb, verb + " -" + create + "/-" + reset + " requires a branch name");
        if (p.args.size() > 2) return usage(p.args[2], "too many arguments to " + verb);
        cmd.type = isSwitch ? CommandType::SwitchNewBranch : CommandType::CheckoutNewBranch;
        cmd.target = p.args[0];
        if (p.args.size() == 2) cmd.startPoint = p.args[1];
        cmd.force = p.has(reset) || p.has("force-create");
        return cmd;
    }
    if (p.args.empty()) {
        return usage(verb, isSwitch ? "switch requires a branch name" : "checkout requires a branch name or commit");
    }
    if (p.args.size() > 1) return usage(p.args[1], "too many arguments to " + verb);
    cmd.type = isSwitch ? CommandType::Switch : CommandType::Checkout;
    cmd.target = p.args[0];
    return cmd;
}

static Result<Command> build_merge(const ParsedLine& p) {
    if (p.args.empty()) return usage("merge", "merge requires a branch name");
    if (p.args.size() > 1) return usage(p.args[1], "octopus merges are not supported");
    Command cmd;
    cmd.type = CommandType::Merge;
    cmd.target = p.args[0];
    cmd.noFastForward = p.has("no-ff");
    cmd.message = message_of(p);
    return cmd;
}

static Result<Command> build_cherry_pick(const ParsedLine& p) {
    if (p.args.empty()) return usage("cherry-pick", "cherry-pick requires at least one commit");
    Command cmd;
    cmd.type = CommandType::CherryPick;
    cmd.commits = p.args;
    return cmd;
}

static Result<Command> build_reset(const ParsedLine& p) {
    if (p.args.size() > 1) return usage(p.args[1], "too many arguments to reset");
    int modes = (p.has("soft") ? 1 : 0) + (p.has("mixed") ? 1 : 0) + (p.has("hard") ? 1 : 0);
    if (modes > 1) return usage("reset", "--soft, --mixed and --hard are mutually exclusive");
    Command cmd;
    cmd.type = CommandType::Reset;
    cmd.target = p.args.empty() ? std::string("HEAD") : p.args[0];
    if (p.has("soft")) cmd.resetMode = ResetMode::Soft;
    if (p.has("hard")) cmd.resetMode = ResetMode::Hard;
    return cmd;
}

static Result<Command> build_revert(const ParsedLine& p) {
    if (p.args.size() != 1) return usage("revert", "revert requires exactly one commit");
    Command cmd;
    cmd.type = CommandType::Revert;
    cmd.target = p.args[0];
    return cmd;
}

static Result<Command> build_tag(const ParsedLine& p) {
    Command cmd;
    if (p.has("d") || p.has("delete")) {
        if (p.args.size() != 1) return usage("tag", "tag -d requires exactly one tag name");
        cmd.type = CommandType::DeleteTag;
        cmd.target = p.args[0];
        return cmd;
    }
    if (p.args.empty() || p.has("l") || p.has("list")) {
        cmd.type = CommandType::ListTags;
        return cmd;
    }
    if (p.args.size() > 2) return usage(p.args[2], "too many arguments to tag");
    cmd.type = CommandType::CreateTag;
    cmd.target = p.args[0];
    if (p.args.size() == 2) cmd.startPoint = p.args[1];
    cmd.message = message_of(p);
    return cmd;
}

static Result<Command> build_rebase(const ParsedLine& p) {
    Command cmd;
    if (p.has("continue")) {
        cmd.type = CommandType::RebaseContinue;
        return cmd;
    }
    if (p.has("abort")) {
        cmd.type = CommandType::RebaseAbort;
        return cmd;
    }
    std::string upstream;
    if (auto onto = p.value("onto")) upstream = *onto;
    else if (!p.args.empty()) upstream = p.args[0];
    if (upstream.empty()) return usage("rebase", "rebase requires an upstream branch or commit");
    cmd.type = (p.has("i") || p.has("interactive")) ? CommandType::RebaseInteractive : CommandType::Rebase;
    cmd.target = upstream;
    return cmd;
}

static Result<Command> build_log(const ParsedLine& p) {
    if (p.args.size() > 1) return usage(p.args[1], "log accepts a single starting revision");
    Command cmd;
    cmd.type = CommandType::Log;
    if (!p.args.empty()) cmd.target = p.args[0];
    cmd.firstParent = p.has("first-parent");
    const std::string* count = p.value("n");
    if (count == nullptr) count = p.value("max-count");
    if (count != nullptr) {
        if (!all_digits(*count) || count->size() > 6) return usage(*count, "'" + *count + "' is not a valid commit count");
        cmd.maxCount = std::stoi(*count);
    }
    return cmd;
}

static Result<Command> build_remote(const ParsedLine& p) {
    Command cmd;
    if (p.args.empty()) {
        cmd.type = CommandType::ListRemotes;
        cmd.verbose = p.has("v") || p.has("verbose");
        return cmd;
    }
    if (p.args[0] != "add") return usage(p.args[0], "unsupported remote subcommand '" + p.args[0] + "'");
    if (p.args.size() != 3) return usage("remote", "remote add requires a name and a url");
    cmd.type = CommandType::RemoteAdd;
    cmd.target = p.args[1];
    cmd.url = p.args[2];
    return cmd;
}

// fetch [<remote>], pull/push [<remote> [<branch>]]
static Result<Command> build_transfer(const ParsedLine& p, CommandType type, size_t maxArgs) {
    if (p.args.size() > maxArgs) return usage(p.args[maxArgs], "too many arguments to " + p.name);
    Command cmd;
    cmd.type = type;
    if (!p.args.empty()) cmd.target = p.args[0];
    if (p.args.size() > 1) cmd.branch = p.args[1];
    cmd.force = type == CommandType::Push && (p.has("f") || p.has("force"));
    return cmd;
}

static Result<Command> build_plain(const ParsedLine& p, CommandType type) {
    if (!p.args.empty() || !p.flags.empty() || !p.values.empty()) {
        return usage(p.name, p.name + " does not take arguments");
    }
    Command cmd;
    cmd.type = type;
    return cmd;
}

Result<std::vector<std::string>> tokenize_command(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool inToken = false;
    char quote = 0;
    for (char c : line) {
        if (quote != 0) {
            if (c == quote) quote = 0;
            else current += c;
        } else if (c == '"' || c == '\'') {
            quote = c;
            inToken = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (inToken) tokens.push_back(current);
            current.clear();
            inToken = false;
        } else {
            current += c;
            inToken = true;
        }
    }
    if (quote != 0) return usage(line, "unterminated quote in command");
    if (inToken) tokens.push_back(current);
    return tokens;
}

Result<Command> parse_command(const std::string& line) {
    auto tokens = tokenize_command(line);
    if (!tokens.ok()) return tokens.error();
    const auto& words = tokens.value();
    size_t first = 0;
    if (!words.empty() && lower(words[0]) == "git") first = 1;
    if (words.size() <= first) return usage(line, "empty command");

    ParsedLine p;
    p.name = canonical_name(lower(words[first]));
    parse_options(words, first + 1, p);

    if (p.name == "commit") return build_commit(p);
    if (p.name == "branch") return build_branch(p);
    if (p.name == "checkout") return build_checkout(p, false);
    if (p.name == "switch") return build_checkout(p, true);
    if (p.name == "merge") return build_merge(p);
    if (p.name == "cherry-pick") return build_cherry_pick(p);
    if (p.name == "reset") return build_reset(p);
    if (p.name == "revert") return build_revert(p);
    if (p.name == "tag") return build_tag(p);
    if (p.name == "rebase") return build_rebase(p);
    if (p.name == "status") return build_plain(p, CommandType::Status);
    if (p.name == "log") return build_log(p);
    if (p.name == "remote") return build_remote(p);
    if (p.name == "fetch") return build_transfer(p, CommandType::Fetch, 1);
    if (p.name == "pull") return build_transfer(p, CommandType::Pull, 2);
    if (p.name == "push") return build_transfer(p, CommandType::Push, 2);
    if (p.name == "undo") return build_plain(p, CommandType::Undo);
    if (p.name == "redo") return build_plain(p, CommandType::Redo);
    return make_error(ErrorCode::UnknownCommand, p.name, "unknown command: '" + p.name + "'");
}

} // namespace gitsim
