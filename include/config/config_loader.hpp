#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace sqlrunner {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads sqlrunner.toml into a RunnerConfig
 *
 * Recognised sections:
 * - [logging]            level
 * - [pool]               max_connections, idle_timeout_ms, acquire_timeout_ms
 * - [streaming]          enabled, batch_size, max_rows_before_streaming
 * - [history]            file, max_entries
 * - [[profiles]]         one connection profile each, optional [profiles.ssh]
 *
 * Every string value supports ${ENV_VAR} expansion.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RunnerConfig config;

        static LoadResult ok(RunnerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sqlrunner.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on an extracted config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RunnerConfig& config);

private:
    static RunnerConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(RunnerConfig config);

    static LoggingConfig extract_logging(const toml::table& root);
    static PoolSettings extract_pool(const toml::table& root);
    static StreamingSettings extract_streaming(const toml::table& root);
    static HistorySettings extract_history(const toml::table& root);
    static std::vector<ConnectionProfile> extract_profiles(const toml::table& root);
};

} // namespace sqlrunner
