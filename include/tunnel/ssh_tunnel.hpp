#pragma once

#include "config/config_types.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace sqlrunner {

/**
 * @brief An open SSH port forward to the database
 *
 * Connections are made to local_host:local_port instead of the database
 * host. The forward stays open for as long as the object lives.
 */
class ISshTunnel {
public:
    virtual ~ISshTunnel() = default;

    [[nodiscard]] virtual std::string local_host() const = 0;
    [[nodiscard]] virtual uint16_t local_port() const = 0;
};

/**
 * @brief Opens SSH tunnels (key handling and transport live behind this seam)
 */
class ISshTunnelFactory {
public:
    virtual ~ISshTunnelFactory() = default;

    /**
     * @brief Forward traffic through the jump host to db_host:db_port
     * @throws std::exception with the underlying cause on failure
     */
    [[nodiscard]] virtual std::shared_ptr<ISshTunnel> open(
        const SshTunnelConfig& ssh, const std::string& db_host, uint16_t db_port) = 0;
};

} // namespace sqlrunner
