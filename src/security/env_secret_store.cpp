#include "security/secret_store.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <cstdlib>
#include <format>

namespace sqlrunner {

EnvSecretStore::EnvSecretStore(std::string prefix)
    : prefix_(std::move(prefix)) {}

std::string EnvSecretStore::variable_name(const std::string& secret_key) const {
    std::string name = prefix_;
    name.reserve(prefix_.size() + secret_key.size());
    for (const char c : secret_key) {
        const auto uc = static_cast<unsigned char>(c);
        name += std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_';
    }
    return name;
}

std::optional<std::string> EnvSecretStore::get_password(const std::string& secret_key) const {
    const std::string var = variable_name(secret_key);
    if (const char* value = std::getenv(var.c_str()); value && *value) {
        return std::string(value);
    }
    if (const char* fallback = std::getenv("PGPASSWORD"); fallback && *fallback) {
        utils::log::debug(std::format("EnvSecretStore: '{}' not set, using PGPASSWORD", var));
        return std::string(fallback);
    }
    return std::nullopt;
}

} // namespace sqlrunner
