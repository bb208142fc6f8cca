// common/config/engine_config.cpp
#include "common/config/engine_config.h"
#include "agentgraph/core/errors.h"
#include "common/utils/yaml_json.h"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace agentgraph {

namespace {

const nlohmann::json* section(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return nullptr;
    }
    if (!j[key].is_object()) {
        throw ConfigError(std::string("config section '") + key + "' must be a mapping");
    }
    return &j[key];
}

void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_string()) {
        throw ConfigError(std::string("config key '") + key + "' must be a string");
    }
    out = j[key].get<std::string>();
}

template <typename Int>
void read_int(const nlohmann::json& j, const char* key, Int& out, long long min_value = 0) {
    if (!j.contains(key)) return;
    if (!j[key].is_number_integer()) {
        throw ConfigError(std::string("config key '") + key + "' must be an integer");
    }
    long long v = j[key].get<long long>();
    if (v < min_value) {
        throw ConfigError(std::string("config key '") + key + "' must be >= " + std::to_string(min_value));
    }
    out = static_cast<Int>(v);
}

void read_float(const nlohmann::json& j, const char* key, float& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_number()) {
        throw ConfigError(std::string("config key '") + key + "' must be a number");
    }
    out = static_cast<float>(j[key].get<double>());
}

void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_boolean()) {
        throw ConfigError(std::string("config key '") + key + "' must be true or false");
    }
    out = j[key].get<bool>();
}

void read_string_list(const nlohmann::json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_array()) {
        throw ConfigError(std::string("config key '") + key + "' must be a list");
    }
    std::vector<std::string> values;
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            throw ConfigError(std::string("config key '") + key + "' must contain strings only");
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

EngineConfig EngineConfig::defaults() {
    EngineConfig config;

    const std::string coder = "qwen2.5-coder:14b";
    const std::string thinker = "qwen3:14b";

    config.models["coding"].roles = {
        {"coder", coder},
        {"tester", coder},
        {"verifier", "qwen3-vl:8b"},
    };
    config.models["proof"].roles = {
        {"theorist", coder},
        {"formalizer", coder},
        {"arbiter", coder},
    };

    auto& deep = config.models["deep_research"];
    deep.roles = {
        {"global_planner", thinker},
        {"planner", thinker},
        {"researcher", thinker},
        {"writer", thinker},
        {"editor", "ministral-3:14b"},
    };
    deep.panels["skeptics"] = {"cogito:14b", thinker};

    auto& quorum = config.models["quorum"];
    quorum.roles = {
        {"drafter", "qwen3-vl:8b"},
        {"skeptic", "qwen3-vl:8b"},
        {"structuralist", "qwen3-vl:8b"},
    };

    config.models["cited_research"].roles = {
        {"planner", "qwen3-vl:8b"},
        {"researcher", "qwen3-vl:8b"},
        {"writer", "qwen3-vl:8b"},
    };
    config.models["web_scout"].roles = {
        {"search", coder},
    };
    return config;
}

EngineConfig EngineConfig::from_json(const nlohmann::json& j) {
    EngineConfig config = defaults();
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        throw ConfigError("config root must be a mapping");
    }

    read_string(j, "backend", config.backend);
    if (config.backend != "ollama" && config.backend != "llama") {
        throw ConfigError("unknown backend '" + config.backend + "' (expected ollama or llama)");
    }
    read_string(j, "default_model", config.default_model);

    if (auto* s = section(j, "ollama")) {
        read_string(*s, "base_url", config.ollama.base_url);
        read_int(*s, "timeout", config.ollama.timeout_sec, 1);
    }
    if (auto* s = section(j, "llama")) {
        read_string(*s, "models_dir", config.llama.models_dir);
        read_int(*s, "n_ctx", config.llama.n_ctx, 1);
        read_int(*s, "n_threads", config.llama.n_threads, 1);
        read_int(*s, "n_predict", config.llama.n_predict, 1);
        read_float(*s, "min_p", config.llama.min_p);
    }

    // models:
    //   coding: { coder: ..., verifier: ..., panels: { skeptics: [..] } }
    if (auto* s = section(j, "models")) {
        for (const auto& [workflow, entry] : s->items()) {
            if (!entry.is_object()) {
                throw ConfigError("models." + workflow + " must be a mapping");
            }
            auto& target = config.models[workflow];
            for (const auto& [role, model] : entry.items()) {
                if (role == "panels") {
                    if (!model.is_object()) {
                        throw ConfigError("models." + workflow + ".panels must be a mapping");
                    }
                    for (const auto& [panel, members] : model.items()) {
                        read_string_list(model, panel.c_str(), target.panels[panel]);
                        if (target.panels[panel].empty()) {
                            throw ConfigError("panel models." + workflow + ".panels." + panel + " is empty");
                        }
                    }
                    continue;
                }
                if (!model.is_string()) {
                    throw ConfigError("models." + workflow + "." + role + " must be a model name");
                }
                target.roles[role] = model.get<std::string>();
            }
        }
    }

    if (auto* s = section(j, "limits")) {
        read_int(*s, "max_retries", config.limits.max_retries);
        read_int(*s, "proof_max_retries", config.limits.proof_max_retries);
        read_int(*s, "section_max_loops", config.limits.section_max_loops);
        read_int(*s, "quorum_max_iterations", config.limits.quorum_max_iterations);
        read_int(*s, "max_search_results", config.limits.max_search_results, 1);
        read_int(*s, "max_read_count", config.limits.max_read_count, 1);
        read_int(*s, "page_max_chars", config.limits.page_max_chars, 1);
        read_int(*s, "process_timeout_sec", config.limits.process_timeout_sec, 1);
    }

    if (auto* s = section(j, "search")) {
        read_string(*s, "brave_api_key", config.search.brave_api_key);
        read_string(*s, "google_api_key", config.search.google_api_key);
        read_string(*s, "google_cse_id", config.search.google_cse_id);
        read_int(*s, "timeout", config.search.timeout_sec, 1);
        read_string_list(*s, "providers", config.search.providers);
        for (const auto& p : config.search.providers) {
            if (p != "brave" && p != "google" && p != "duckduckgo") {
                throw ConfigError("unknown search provider '" + p + "'");
            }
        }
    }

    if (auto* s = section(j, "checkpoint")) {
        read_string(*s, "dir", config.checkpoint.dir);
        if (s->contains("terminal_resume_policy")) {
            std::string policy;
            read_string(*s, "terminal_resume_policy", policy);
            config.checkpoint.terminal_resume_policy = parse_terminal_resume_policy(policy);
        }
    }

    if (auto* s = section(j, "engine")) {
        read_int(*s, "max_steps", config.engine.max_steps, 1);
        read_bool(*s, "parallel_calls", config.engine.parallel_calls);
    }

    if (auto* s = section(j, "workspace")) {
        read_string(*s, "dir", config.workspace.dir);
        read_string(*s, "python", config.workspace.python);
        read_string(*s, "lean", config.workspace.lean);
        read_string_list(*s, "dependency_install", config.workspace.dependency_install);
    }

    if (auto* s = section(j, "log")) {
        read_string(*s, "level", config.log.level);
        read_string(*s, "pattern", config.log.pattern);
    }

    return config;
}

EngineConfig EngineConfig::from_yaml_string(const std::string& yaml) {
    nlohmann::json j;
    try {
        j = parse_yaml(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }
    return from_json(j);
}

EngineConfig EngineConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::debug("config file {} not found, using defaults", path);
        return defaults();
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return from_yaml_string(buffer.str());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

void EngineConfig::apply_env_overrides() {
    if (search.brave_api_key.empty()) {
        search.brave_api_key = env_or_empty("BRAVE_API_KEY");
    }
    if (search.google_api_key.empty()) {
        search.google_api_key = env_or_empty("GOOGLE_API_KEY");
    }
    if (search.google_cse_id.empty()) {
        search.google_cse_id = env_or_empty("GOOGLE_CSE_ID");
    }
}

RoleRoster EngineConfig::roster(const std::string& workflow) const {
    auto it = models.find(workflow);
    if (it == models.end()) {
        return {};
    }
    return it->second.roles;
}

std::vector<std::string> EngineConfig::panel(const std::string& workflow, const std::string& name) const {
    auto it = models.find(workflow);
    if (it != models.end()) {
        auto p = it->second.panels.find(name);
        if (p != it->second.panels.end()) {
            return p->second;
        }
    }
    return {default_model};
}

} // namespace agentgraph
