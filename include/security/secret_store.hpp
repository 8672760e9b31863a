#pragma once

#include <optional>
#include <string>

namespace sqlrunner {

/**
 * @brief Password lookup for connection profiles
 *
 * Profiles only carry a secret key; the password itself comes from here
 * each time a connection factory is built.
 */
class ISecretStore {
public:
    virtual ~ISecretStore() = default;

    /**
     * @brief Look up the password for a secret key
     * @return Password, or std::nullopt when none is stored
     */
    [[nodiscard]] virtual std::optional<std::string> get_password(const std::string& secret_key) const = 0;
};

/**
 * @brief Environment variable secret store
 *
 * Reads SQLRUNNER_PASSWORD_<KEY>, where KEY is the secret key upper-cased
 * with every non-alphanumeric character replaced by '_'. Falls back to
 * PGPASSWORD when the specific variable is not set.
 */
class EnvSecretStore : public ISecretStore {
public:
    explicit EnvSecretStore(std::string prefix = "SQLRUNNER_PASSWORD_");

    [[nodiscard]] std::optional<std::string> get_password(const std::string& secret_key) const override;

    /**
     * @brief Variable name consulted for a given secret key
     */
    [[nodiscard]] std::string variable_name(const std::string& secret_key) const;

private:
    std::string prefix_;
};

} // namespace sqlrunner
