#include "gitsim_engine/config.hpp"
#include <cctype>
#include <fstream>

namespace gitsim {

static EngineError config_error(const std::string& key, const std::string& message) {
    return make_error(ErrorCode::InvalidFixture, key, "config: " + message);
}

Result<EngineConfig> config_from_json(const nlohmann::json& j) {
    EngineConfig config;
    if (!j.is_object()) return config_error("", "top-level value must be an object");

    auto read_string = [&](const char* key, std::string& out) -> bool {
        auto it = j.find(key);
        if (it == j.end()) return true;
        if (!it->is_string()) return false;
        out = it->get<std::string>();
        return true;
    };

    if (!read_string("defaultAuthor", config.defaultAuthor)) return config_error("defaultAuthor", "'defaultAuthor' must be a string");
    if (!read_string("idPrefix", config.idPrefix)) return config_error("idPrefix", "'idPrefix' must be a string");
    if (!read_string("defaultBranch", config.defaultBranch)) return config_error("defaultBranch", "'defaultBranch' must be a string");
    if (!read_string("initialMessage", config.initialMessage)) return config_error("initialMessage", "'initialMessage' must be a string");
    if (config.idPrefix.empty()) return config_error("idPrefix", "'idPrefix' must not be empty");
    if (config.defaultBranch.empty()) return config_error("defaultBranch", "'defaultBranch' must not be empty");

    if (auto it = j.find("baseTimestamp"); it != j.end()) {
        if (!it->is_number_integer()) return config_error("baseTimestamp", "'baseTimestamp' must be an integer");
        config.baseTimestamp = it->get<long long>();
    }
    if (auto it = j.find("historyLimit"); it != j.end()) {
        if (!it->is_number_unsigned()) return config_error("historyLimit", "'historyLimit' must be a non-negative integer");
        config.historyLimit = it->get<std::size_t>();
    }
    if (auto it = j.find("logLevel"); it != j.end()) {
        if (!it->is_string() || !Logger::parse_level(it->get<std::string>(), config.logLevel)) {
            return config_error("logLevel", "'logLevel' must be one of debug, info, warning, error, off");
        }
    }
    if (auto it = j.find("consoleLogging"); it != j.end()) {
        if (!it->is_boolean()) return config_error("consoleLogging", "'consoleLogging' must be a boolean");
        config.consoleLogging = it->get<bool>();
    }
    return config;
}

Result<EngineConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) return make_error(ErrorCode::InvalidFixture, path, "cannot open config file '" + path + "'");
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error(ErrorCode::InvalidFixture, path, std::string("config parse error: ") + e.what());
    }
    auto config = config_from_json(j);
    if (config.ok()) {
        Logger::instance().debug("Config", "loaded configuration", path);
    }
    return config;
}

nlohmann::json config_to_json(const EngineConfig& config) {
    std::string level = Logger::level_name(config.logLevel);
    for (auto& c : level) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return nlohmann::json{
        {"defaultAuthor", config.defaultAuthor},
        {"baseTimestamp", config.baseTimestamp},
        {"idPrefix", config.idPrefix},
        {"defaultBranch", config.defaultBranch},
        {"initialMessage", config.initialMessage},
        {"historyLimit", config.historyLimit},
        {"logLevel", level},
        {"consoleLogging", config.consoleLogging},
    };
}

void apply_logging(const EngineConfig& config) {
    Logger::instance().set_level(config.logLevel);
    Logger::instance().set_console(config.consoleLogging);
}

} // namespace gitsim
