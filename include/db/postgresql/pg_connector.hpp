#pragma once

#include "db/connection_multiplexer.hpp"
#include "security/secret_store.hpp"
#include "tunnel/ssh_tunnel.hpp"
#include <memory>

namespace sqlrunner {

/**
 * @brief ConnectorBuilder producing PgConnectionFactory instances
 *
 * For each new ConnectionKey: looks the password up (only when the profile
 * has a username), validates TLS files, and opens the SSH tunnel when the
 * profile enables one. The tunnel lives as long as the factory.
 *
 * @param secrets Password source (required)
 * @param tunnels Tunnel factory (may be null when no profile uses SSH)
 */
[[nodiscard]] ConnectionMultiplexer::ConnectorBuilder make_pg_connector_builder(
    std::shared_ptr<ISecretStore> secrets,
    std::shared_ptr<ISshTunnelFactory> tunnels = nullptr);

} // namespace sqlrunner
