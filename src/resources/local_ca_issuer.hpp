#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include <openssl/evp.h>
#include <openssl/x509.h>

#include "resources/credential_issuer.hpp"

namespace agentyard::resources {

// Issues P-256 client certificates signed by a CA kept under `dir`
// (ca.pem / ca.key, created on first use). Key material for a sandbox lives
// in dir/sandboxes/<sandbox id>/ and is only ever readable by the owner.
// revoked.json lists revoked serials until their certificates expire.
class LocalCaCredentialIssuer : public CredentialIssuer {
public:
    LocalCaCredentialIssuer(std::filesystem::path dir, std::chrono::seconds ttl);

    LocalCaCredentialIssuer(const LocalCaCredentialIssuer&) = delete;
    LocalCaCredentialIssuer& operator=(const LocalCaCredentialIssuer&) = delete;

    Credential Issue(const std::string& sandbox_id, std::chrono::seconds max_ttl) override;
    void Revoke(const Credential& credential) override;

    bool IsRevoked(const std::string& serial) const;
    std::filesystem::path CaCertPath() const { return dir_ / "ca.pem"; }

private:
    void EnsureCa();
    void CreateCa();
    void AppendRevoked(const Credential& credential);

    using KeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using CertPtr = std::unique_ptr<X509, decltype(&X509_free)>;

    std::filesystem::path dir_;
    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    KeyPtr ca_key_{nullptr, &EVP_PKEY_free};
    CertPtr ca_cert_{nullptr, &X509_free};
};

}  // namespace agentyard::resources
