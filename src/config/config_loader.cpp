#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace agentcore {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        if (val.is_table() && base.contains(key.str()) && base[key.str()].is_table()) {
            merge_tables(*base[key.str()].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key.str()) && base[key.str()].is_array()) {
            auto& base_arr = *base[key.str()].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

/// Non-negative integer; negative values are a load error.
uint64_t toml_count(const toml::table& tbl, std::string_view section, std::string_view key,
                    uint64_t fallback) {
    const int64_t v = tbl[key].value_or(static_cast<int64_t>(fallback));
    if (v < 0) {
        throw std::runtime_error(std::format("{}.{} must not be negative, got {}", section, key, v));
    }
    return static_cast<uint64_t>(v);
}

std::chrono::milliseconds toml_millis(const toml::table& tbl, std::string_view section,
                                      std::string_view key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(
        toml_count(tbl, section, key, static_cast<uint64_t>(fallback.count())));
}

CircuitBreaker::Config extract_breaker(const toml::table& tbl, std::string_view section,
                                       const CircuitBreaker::Config& base) {
    CircuitBreaker::Config cfg = base;
    cfg.failure_threshold = static_cast<uint32_t>(
        toml_count(tbl, section, "failure_threshold", base.failure_threshold));
    cfg.open_duration = toml_millis(tbl, section, "open_duration_ms", base.open_duration);
    cfg.call_timeout = toml_millis(tbl, section, "call_timeout_ms", base.call_timeout);
    return cfg;
}

// ---- Sections ---------------------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* t = root["logging"].as_table();
    if (!t) return cfg;
    cfg.level = (*t)["level"].value_or(std::string{cfg.level});
    return cfg;
}

RegistrySection extract_registry(const toml::table& root) {
    RegistrySection cfg;
    const auto* t = root["registry"].as_table();
    if (!t) return cfg;
    cfg.registry.block_creation_when_minimal =
        (*t)["block_creation_when_minimal"].value_or(bool{cfg.registry.block_creation_when_minimal});
    cfg.monitor_interval = toml_millis(*t, "registry", "monitor_interval_ms", cfg.monitor_interval);
    cfg.enforce_limits_on_monitor =
        (*t)["enforce_limits_on_monitor"].value_or(bool{cfg.enforce_limits_on_monitor});
    cfg.cleanup_idle_on_monitor =
        (*t)["cleanup_idle_on_monitor"].value_or(bool{cfg.cleanup_idle_on_monitor});
    return cfg;
}

AgentLifecycleManager::Config extract_lifecycle(const toml::table& root) {
    AgentLifecycleManager::Config cfg;
    const auto* t = root["lifecycle"].as_table();
    if (!t) return cfg;
    constexpr std::string_view s = "lifecycle";
    cfg.max_agents_per_user = toml_count(*t, s, "max_agents_per_user", cfg.max_agents_per_user);
    cfg.warning_agents_per_user =
        toml_count(*t, s, "warning_agents_per_user", cfg.warning_agents_per_user);
    cfg.max_session_age = std::chrono::hours(
        toml_count(*t, s, "max_session_age_hours", static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::hours>(cfg.max_session_age).count())));
    cfg.max_sessions = toml_count(*t, s, "max_sessions", cfg.max_sessions);
    cfg.max_total_agents = toml_count(*t, s, "max_total_agents", cfg.max_total_agents);
    cfg.estimated_bytes_per_agent =
        toml_count(*t, s, "estimated_bytes_per_agent", cfg.estimated_bytes_per_agent);
    cfg.max_idle = std::chrono::seconds(
        toml_count(*t, s, "max_idle_seconds", static_cast<uint64_t>(cfg.max_idle.count())));
    cfg.warning_fraction = (*t)["warning_fraction"].value_or(double{cfg.warning_fraction});
    return cfg;
}

CircuitBreakerSection extract_circuit_breaker(const toml::table& root) {
    CircuitBreakerSection cfg;
    const auto* t = root["circuit_breaker"].as_table();
    if (!t) return cfg;

    cfg.defaults = extract_breaker(*t, "circuit_breaker", cfg.defaults);

    const auto* deps = (*t)["dependencies"].as_array();
    if (!deps) return cfg;
    for (const auto& node : *deps) {
        const auto* d = node.as_table();
        if (!d) continue;
        DependencyBreakerConfig dep;
        dep.name = (*d)["name"].value_or(std::string{});
        dep.config = extract_breaker(*d, "circuit_breaker.dependencies", cfg.defaults);
        dep.critical = (*d)["critical"].value_or(false);
        cfg.dependencies.push_back(std::move(dep));
    }
    return cfg;
}

DegradationManager::Config extract_degradation(const toml::table& root) {
    DegradationManager::Config cfg;
    const auto* t = root["degradation"].as_table();
    if (!t) return cfg;
    if ((*t)["minimal_set"].as_array()) {
        cfg.minimal_set = toml_string_array(*t, "minimal_set");
    }
    cfg.critical_services = toml_string_array(*t, "critical_services");
    cfg.majority_fraction = (*t)["majority_fraction"].value_or(double{cfg.majority_fraction});
    cfg.majority_min_services =
        toml_count(*t, "degradation", "majority_min_services", cfg.majority_min_services);
    return cfg;
}

EventBridge::Config extract_event_bridge(const toml::table& root) {
    EventBridge::Config cfg;
    const auto* t = root["event_bridge"].as_table();
    if (!t) return cfg;
    cfg.queue_capacity = toml_count(*t, "event_bridge", "queue_capacity", cfg.queue_capacity);
    cfg.send_timeout = toml_millis(*t, "event_bridge", "send_timeout_ms", cfg.send_timeout);
    cfg.transport_service = (*t)["transport_service"].value_or(std::string{cfg.transport_service});
    return cfg;
}

ShutdownSection extract_shutdown(const toml::table& root) {
    ShutdownSection cfg;
    const auto* t = root["shutdown"].as_table();
    if (!t) return cfg;
    cfg.drain_timeout = toml_millis(*t, "shutdown", "drain_timeout_ms", cfg.drain_timeout);
    return cfg;
}

CoreConfig extract_all_sections(const toml::table& tbl) {
    CoreConfig config;
    config.logging = extract_logging(tbl);
    config.registry = extract_registry(tbl);
    config.lifecycle = extract_lifecycle(tbl);
    config.circuit_breaker = extract_circuit_breaker(tbl);
    config.degradation = extract_degradation(tbl);
    config.event_bridge = extract_event_bridge(tbl);
    config.shutdown = extract_shutdown(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(CoreConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

void validate_breaker(const CircuitBreaker::Config& cfg, const std::string& where,
                      std::vector<std::string>& errors) {
    if (cfg.failure_threshold == 0) {
        errors.push_back(std::format("{}.failure_threshold must be > 0", where));
    }
    if (cfg.open_duration.count() <= 0) {
        errors.push_back(std::format("{}.open_duration_ms must be > 0", where));
    }
    if (cfg.call_timeout.count() <= 0) {
        errors.push_back(std::format("{}.call_timeout_ms must be > 0", where));
    }
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::vector<std::string> ConfigLoader::validate_config(const CoreConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug/info/warn/error",
                                     config.logging.level));
    }

    if (config.registry.monitor_interval.count() <= 0) {
        errors.push_back("registry.monitor_interval_ms must be > 0");
    }

    const auto& lc = config.lifecycle;
    if (lc.max_agents_per_user == 0) {
        errors.push_back("lifecycle.max_agents_per_user must be > 0");
    }
    if (lc.warning_agents_per_user > lc.max_agents_per_user) {
        errors.push_back(std::format(
            "lifecycle.warning_agents_per_user ({}) > max_agents_per_user ({})",
            lc.warning_agents_per_user, lc.max_agents_per_user));
    }
    if (lc.max_sessions == 0) {
        errors.push_back("lifecycle.max_sessions must be > 0");
    }
    if (lc.max_total_agents == 0) {
        errors.push_back("lifecycle.max_total_agents must be > 0");
    }
    if (lc.warning_fraction <= 0.0 || lc.warning_fraction > 1.0) {
        errors.push_back("lifecycle.warning_fraction must be in (0, 1]");
    }

    validate_breaker(config.circuit_breaker.defaults, "circuit_breaker", errors);
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.circuit_breaker.dependencies.size(); ++i) {
        const auto& dep = config.circuit_breaker.dependencies[i];
        if (dep.name.empty()) {
            errors.push_back(std::format("circuit_breaker.dependencies[{}].name must not be empty", i));
        } else if (!seen.insert(dep.name).second) {
            errors.push_back(std::format("circuit_breaker.dependencies: duplicate name '{}'", dep.name));
        }
        validate_breaker(dep.config, std::format("circuit_breaker.dependencies[{}]", i), errors);
    }

    const auto& dg = config.degradation;
    if (dg.majority_fraction <= 0.0 || dg.majority_fraction >= 1.0) {
        errors.push_back(std::format("degradation.majority_fraction must be in (0, 1), got {}",
                                     dg.majority_fraction));
    }

    if (config.event_bridge.queue_capacity == 0) {
        errors.push_back("event_bridge.queue_capacity must be > 0");
    }
    if (config.event_bridge.send_timeout.count() <= 0) {
        errors.push_back("event_bridge.send_timeout_ms must be > 0");
    }
    if (config.event_bridge.transport_service.empty()) {
        errors.push_back("event_bridge.transport_service must not be empty");
    }

    if (config.shutdown.drain_timeout.count() <= 0) {
        errors.push_back("shutdown.drain_timeout_ms must be > 0");
    }

    return errors;
}

} // namespace agentcore
