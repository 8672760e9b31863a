#include "db/tls_material.hpp"
#include "core/utils.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/crypto.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <format>
#include <memory>
#include <string_view>

namespace sqlrunner {

namespace {

struct BioDeleter { void operator()(BIO* p) const { if (p) BIO_free(p); } };
struct X509Deleter { void operator()(X509* p) const { if (p) X509_free(p); } };

std::string last_ssl_error() {
    const unsigned long code = ERR_get_error();
    if (code == 0) return "unknown error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

enum class PemKind { CERTIFICATE, PRIVATE_KEY };

bool pem_file_is_valid(const std::string& path, PemKind kind, const std::string& what,
                       const std::string& profile_id) {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_file(path.c_str(), "r"));
    if (!bio) {
        utils::log::warn(std::format(
            "Profile '{}': cannot read SSL {} '{}' ({}); continuing without it",
            profile_id, what, path, last_ssl_error()));
        return false;
    }

    bool ok = false;
    if (kind == PemKind::CERTIFICATE) {
        std::unique_ptr<X509, X509Deleter> cert(
            PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        ok = cert != nullptr;
    } else {
        // Framing only: an encrypted key is decrypted by libpq with its passphrase
        char* name = nullptr;
        char* header = nullptr;
        unsigned char* data = nullptr;
        long len = 0;
        if (PEM_read_bio(bio.get(), &name, &header, &data, &len) == 1) {
            ok = std::string_view(name).ends_with("PRIVATE KEY") && len > 0;
        }
        OPENSSL_free(name);
        OPENSSL_free(header);
        OPENSSL_free(data);
    }

    if (!ok) {
        utils::log::warn(std::format(
            "Profile '{}': SSL {} '{}' is not valid PEM ({}); continuing without it",
            profile_id, what, path, last_ssl_error()));
    }
    return ok;
}

} // anonymous namespace

TlsMaterial resolve_tls_material(const ConnectionProfile& profile) {
    TlsMaterial material;
    if (profile.ssl_mode == SslMode::DISABLE) {
        return material;
    }

    if (!profile.ssl_root_cert_path.empty() &&
        pem_file_is_valid(profile.ssl_root_cert_path, PemKind::CERTIFICATE, "CA", profile.id)) {
        material.root_cert_path = profile.ssl_root_cert_path;
    }
    if (!profile.ssl_cert_path.empty() &&
        pem_file_is_valid(profile.ssl_cert_path, PemKind::CERTIFICATE, "certificate", profile.id)) {
        material.cert_path = profile.ssl_cert_path;
    }
    if (!profile.ssl_key_path.empty() &&
        pem_file_is_valid(profile.ssl_key_path, PemKind::PRIVATE_KEY, "key", profile.id)) {
        material.key_path = profile.ssl_key_path;
    }

    // A client cert without its key (or vice versa) is useless to libpq
    if (material.cert_path.empty() != material.key_path.empty()) {
        utils::log::warn(std::format(
            "Profile '{}': client certificate and key must both be usable; ignoring both",
            profile.id));
        material.cert_path.clear();
        material.key_path.clear();
    }

    return material;
}

} // namespace sqlrunner
