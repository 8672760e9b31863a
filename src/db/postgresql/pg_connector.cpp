#include "db/postgresql/pg_connector.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/tls_material.hpp"

#include <format>

namespace sqlrunner {

ConnectionMultiplexer::ConnectorBuilder make_pg_connector_builder(
    std::shared_ptr<ISecretStore> secrets,
    std::shared_ptr<ISshTunnelFactory> tunnels) {

    return [secrets = std::move(secrets), tunnels = std::move(tunnels)](
               const ConnectionProfile& profile,
               const std::string& database) -> std::shared_ptr<IConnectionFactory> {

        std::optional<std::string> password;
        if (!profile.username.empty() && secrets) {
            password = secrets->get_password(profile.effective_secret_key());
            if (!password) {
                utils::log::debug(std::format(
                    "Profile '{}': no stored password, relying on server auth", profile.id));
            }
        }

        const TlsMaterial tls = resolve_tls_material(profile);

        std::shared_ptr<ISshTunnel> tunnel;
        if (profile.ssh && profile.ssh->enabled) {
            if (!tunnels) {
                throw ConnectionError("SSH connection failed: no tunnel factory configured");
            }
            try {
                tunnel = tunnels->open(*profile.ssh, profile.host, profile.port);
            } catch (const std::exception& e) {
                throw ConnectionError(std::format("SSH connection failed: {}", e.what()));
            }
            if (!tunnel) {
                throw ConnectionError("SSH connection failed: tunnel factory returned no tunnel");
            }
            utils::log::info(std::format("Profile '{}': tunnel via {}@{}:{} on {}:{}",
                profile.id, profile.ssh->username, profile.ssh->host, profile.ssh->port,
                tunnel->local_host(), tunnel->local_port()));
        }

        auto params = PgConnectionParams::from_profile(
            profile, database, password, tls,
            tunnel ? tunnel->local_host() : std::string{},
            tunnel ? tunnel->local_port() : uint16_t{0});

        return std::make_shared<PgConnectionFactory>(std::move(params), std::move(tunnel));
    };
}

} // namespace sqlrunner
