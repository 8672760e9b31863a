#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlrunner {

// ============================================================================
// Connection Profile
// ============================================================================

enum class SslMode {
    DISABLE,
    ALLOW,
    PREFER,
    REQUIRE,
    VERIFY_CA,
    VERIFY_FULL
};

[[nodiscard]] inline const char* ssl_mode_to_string(SslMode mode) {
    switch (mode) {
        case SslMode::DISABLE: return "disable";
        case SslMode::ALLOW: return "allow";
        case SslMode::PREFER: return "prefer";
        case SslMode::REQUIRE: return "require";
        case SslMode::VERIFY_CA: return "verify-ca";
        case SslMode::VERIFY_FULL: return "verify-full";
        default: return "prefer";
    }
}

[[nodiscard]] inline std::optional<SslMode> parse_ssl_mode(const std::string& str) {
    if (str == "disable") return SslMode::DISABLE;
    if (str == "allow") return SslMode::ALLOW;
    if (str == "prefer") return SslMode::PREFER;
    if (str == "require") return SslMode::REQUIRE;
    if (str == "verify-ca") return SslMode::VERIFY_CA;
    if (str == "verify-full") return SslMode::VERIFY_FULL;
    return std::nullopt;
}

/**
 * @brief SSH jump host used to reach the database
 */
struct SshTunnelConfig {
    bool enabled = false;
    std::string host;
    uint16_t port = 22;
    std::string username;
    std::string private_key_path;
};

/**
 * @brief Everything needed to reach one PostgreSQL server
 *
 * Immutable once built. The password is never stored here: it is resolved
 * through ISecretStore using secret_key (or id when secret_key is empty).
 */
struct ConnectionProfile {
    std::string id;
    std::string name;
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string username;
    std::string secret_key;
    std::string database;

    SslMode ssl_mode = SslMode::DISABLE;
    std::string ssl_cert_path;
    std::string ssl_key_path;
    std::string ssl_root_cert_path;

    uint32_t statement_timeout_ms = 0;   // 0 = server default
    uint32_t connect_timeout_s = 5;
    std::string application_name = "sqlrunner";
    std::string options;                 // libpq "options", e.g. "-c search_path=x"

    std::optional<SshTunnelConfig> ssh;

    [[nodiscard]] const std::string& display_name() const {
        return name.empty() ? host : name;
    }

    [[nodiscard]] const std::string& effective_secret_key() const {
        return secret_key.empty() ? id : secret_key;
    }
};

inline constexpr const char* kDefaultDatabase = "postgres";

// ============================================================================
// Engine Settings
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct PoolSettings {
    size_t max_connections = 10;
    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds acquire_timeout{5000};
};

struct StreamingSettings {
    bool enabled = true;
    size_t batch_size = 200;
    size_t max_rows_before_streaming = 1000;
};

struct HistorySettings {
    std::string file;          // Empty = in-memory only
    size_t max_entries = 100;
};

/**
 * @brief Complete parsed configuration
 */
struct RunnerConfig {
    LoggingConfig logging;
    PoolSettings pool;
    StreamingSettings streaming;
    HistorySettings history;
    std::vector<ConnectionProfile> profiles;

    [[nodiscard]] const ConnectionProfile* find_profile(const std::string& id) const {
        for (const auto& p : profiles) {
            if (p.id == id) return &p;
        }
        return nullptr;
    }
};

} // namespace sqlrunner
