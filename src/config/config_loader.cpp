#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace sqlrunner {

// ============================================================================
// TOML Parsing Helpers (env expansion)
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
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
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
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

uint16_t checked_port(int64_t value, const std::string& where) {
    if (value < 1 || value > 65535) {
        throw std::runtime_error(std::format("{} must be 1-65535, got {}", where, value));
    }
    return static_cast<uint16_t>(value);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

PoolSettings ConfigLoader::extract_pool(const toml::table& root) {
    PoolSettings cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) return cfg;
    const auto& p = *pool;

    cfg.max_connections = static_cast<size_t>(p["max_connections"].value_or(int64_t{10}));
    cfg.idle_timeout = std::chrono::milliseconds(p["idle_timeout_ms"].value_or(int64_t{30000}));
    cfg.acquire_timeout = std::chrono::milliseconds(p["acquire_timeout_ms"].value_or(int64_t{5000}));
    return cfg;
}

StreamingSettings ConfigLoader::extract_streaming(const toml::table& root) {
    StreamingSettings cfg;
    const auto* streaming = root["streaming"].as_table();
    if (!streaming) return cfg;
    const auto& s = *streaming;

    cfg.enabled = s["enabled"].value_or(true);
    const auto batch_size = s["batch_size"].value_or(int64_t{200});
    if (batch_size <= 0) {
        throw std::runtime_error(std::format("streaming.batch_size must be > 0, got {}", batch_size));
    }
    cfg.batch_size = static_cast<size_t>(batch_size);
    cfg.max_rows_before_streaming =
        static_cast<size_t>(s["max_rows_before_streaming"].value_or(int64_t{1000}));
    return cfg;
}

HistorySettings ConfigLoader::extract_history(const toml::table& root) {
    HistorySettings cfg;
    const auto* history = root["history"].as_table();
    if (!history) return cfg;

    cfg.file = (*history)["file"].value_or(""s);
    cfg.max_entries = static_cast<size_t>((*history)["max_entries"].value_or(int64_t{100}));
    return cfg;
}

std::vector<ConnectionProfile> ConfigLoader::extract_profiles(const toml::table& root) {
    std::vector<ConnectionProfile> result;
    const auto* arr = root["profiles"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* p = (*arr)[i].as_table();
        if (!p) continue;

        ConnectionProfile profile;
        profile.id = (*p)["id"].value_or(""s);
        profile.name = (*p)["name"].value_or(""s);
        profile.host = (*p)["host"].value_or("localhost"s);
        profile.port = checked_port((*p)["port"].value_or(int64_t{5432}),
                                    std::format("profiles[{}].port", i));
        profile.username = (*p)["username"].value_or(""s);
        profile.secret_key = (*p)["secret_key"].value_or(""s);
        profile.database = (*p)["database"].value_or(""s);

        const std::string ssl_mode = utils::to_lower((*p)["ssl_mode"].value_or("disable"s));
        const auto mode = parse_ssl_mode(ssl_mode);
        if (!mode) {
            throw std::runtime_error(
                std::format("profiles[{}].ssl_mode '{}' is not a libpq sslmode", i, ssl_mode));
        }
        profile.ssl_mode = *mode;
        profile.ssl_cert_path = (*p)["ssl_cert"].value_or(""s);
        profile.ssl_key_path = (*p)["ssl_key"].value_or(""s);
        profile.ssl_root_cert_path = (*p)["ssl_root_cert"].value_or(""s);

        profile.statement_timeout_ms =
            static_cast<uint32_t>((*p)["statement_timeout_ms"].value_or(int64_t{0}));
        profile.connect_timeout_s =
            static_cast<uint32_t>((*p)["connect_timeout_s"].value_or(int64_t{5}));
        profile.application_name = (*p)["application_name"].value_or("sqlrunner"s);
        profile.options = (*p)["options"].value_or(""s);

        if (const auto* ssh = (*p)["ssh"].as_table()) {
            SshTunnelConfig tunnel;
            tunnel.enabled = (*ssh)["enabled"].value_or(true);
            tunnel.host = (*ssh)["host"].value_or(""s);
            tunnel.port = checked_port((*ssh)["port"].value_or(int64_t{22}),
                                       std::format("profiles[{}].ssh.port", i));
            tunnel.username = (*ssh)["username"].value_or(""s);
            tunnel.private_key_path = (*ssh)["private_key_path"].value_or(""s);
            profile.ssh = std::move(tunnel);
        }

        result.emplace_back(std::move(profile));
    }
    return result;
}

RunnerConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    RunnerConfig config;
    config.logging = extract_logging(tbl);
    config.pool = extract_pool(tbl);
    config.streaming = extract_streaming(tbl);
    config.history = extract_history(tbl);
    config.profiles = extract_profiles(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(RunnerConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

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

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RunnerConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug/info/warn/error",
            config.logging.level));
    }

    if (config.pool.max_connections == 0) {
        errors.push_back("pool.max_connections must be > 0");
    }
    if (config.pool.acquire_timeout.count() <= 0) {
        errors.push_back("pool.acquire_timeout_ms must be > 0");
    }

    if (config.history.max_entries == 0) {
        errors.push_back("history.max_entries must be > 0");
    }

    std::unordered_set<std::string> seen_ids;
    for (size_t i = 0; i < config.profiles.size(); ++i) {
        const auto& profile = config.profiles[i];
        if (profile.id.empty()) {
            errors.push_back(std::format("profiles[{}].id must not be empty", i));
        } else if (profile.id.find(':') != std::string::npos) {
            // ':' separates id and database in connection keys
            errors.push_back(std::format("profiles[{}].id '{}' must not contain ':'", i, profile.id));
        } else if (!seen_ids.insert(profile.id).second) {
            errors.push_back(std::format("profiles[{}].id '{}' is duplicated", i, profile.id));
        }
        if (profile.host.empty()) {
            errors.push_back(std::format("profiles[{}].host must not be empty", i));
        }
        if (profile.ssh && profile.ssh->enabled && profile.ssh->host.empty()) {
            errors.push_back(std::format("profiles[{}].ssh.host required when ssh is enabled", i));
        }
    }

    return errors;
}

} // namespace sqlrunner
