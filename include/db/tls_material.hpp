#pragma once

#include "config/config_types.hpp"
#include <string>

namespace sqlrunner {

/**
 * @brief TLS files that passed validation for one profile
 *
 * A path is left empty when it was not configured, could not be read, or
 * did not parse as PEM. libpq then falls back to its defaults for that
 * file instead of refusing to connect.
 */
struct TlsMaterial {
    std::string cert_path;
    std::string key_path;
    std::string root_cert_path;
};

/**
 * @brief Check the profile's TLS files with OpenSSL
 *
 * Problems are logged as warnings and the offending file is dropped.
 * Nothing is checked when ssl_mode is disable.
 */
[[nodiscard]] TlsMaterial resolve_tls_material(const ConnectionProfile& profile);

} // namespace sqlrunner
