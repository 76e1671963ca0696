#include "resources/local_ca_issuer.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <memory>
#include <regex>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include "core/errors.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace agentyard::resources {
namespace {

constexpr long kCaValiditySeconds = 10L * 365 * 24 * 60 * 60;

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

[[noreturn]] void ThrowOpenSsl(const std::string& what) {
    char buffer[256] = {0};
    const auto code = ERR_get_error();
    if (code != 0) {
        ERR_error_string_n(code, buffer, sizeof(buffer));
    }
    ERR_clear_error();
    throw core::ResourceError(core::ResourceKind::kCredential,
                              what + (code != 0 ? std::string(": ") + buffer : std::string()));
}

void AddExtension(X509* issuer, X509* subject, int nid, const char* value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, subject, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
    if (!ext) {
        ThrowOpenSsl("building certificate extension");
    }
    const int added = X509_add_ext(subject, ext, -1);
    X509_EXTENSION_free(ext);
    if (added != 1) {
        ThrowOpenSsl("adding certificate extension");
    }
}

std::string AssignRandomSerial(X509* cert) {
    BignumPtr serial(BN_new(), &BN_free);
    if (!serial || BN_rand(serial.get(), 64, BN_RAND_TOP_ONE, BN_RAND_BOTTOM_ANY) != 1 ||
        !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert))) {
        ThrowOpenSsl("generating serial");
    }
    char* hex = BN_bn2hex(serial.get());
    std::string text = hex ? hex : "";
    OPENSSL_free(hex);
    return text;
}

void SetCommonName(X509* cert, const std::string& common_name) {
    X509_NAME* name = X509_get_subject_name(cert);
    if (X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("agentyard"), -1, -1, 0) != 1 ||
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(common_name.c_str()),
                                   -1, -1, 0) != 1) {
        ThrowOpenSsl("setting subject name");
    }
}

// Private keys are created 0600 before any key byte is written.
void WritePem(const std::filesystem::path& path, EVP_PKEY* key, X509* cert) {
    const mode_t mode = key ? 0600 : 0644;
    const int fd = ::open(path.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0 || (key && ::fchmod(fd, mode) != 0)) {
        if (fd >= 0) {
            ::close(fd);
        }
        throw core::ResourceError(core::ResourceKind::kCredential, "cannot write " + path.string());
    }
    FILE* file = ::fdopen(fd, "w");
    if (!file) {
        ::close(fd);
        throw core::ResourceError(core::ResourceKind::kCredential, "cannot write " + path.string());
    }
    const bool written = key
        ? PEM_write_PrivateKey(file, key, nullptr, nullptr, 0, nullptr, nullptr) == 1
        : PEM_write_X509(file, cert) == 1;
    const bool closed = std::fclose(file) == 0;
    if (!written) {
        ThrowOpenSsl("writing " + path.string());
    }
    if (!closed) {
        throw core::ResourceError(core::ResourceKind::kCredential, "cannot flush " + path.string());
    }
}

long long ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace

LocalCaCredentialIssuer::LocalCaCredentialIssuer(std::filesystem::path dir, std::chrono::seconds ttl)
    : dir_(std::move(dir))
    , ttl_(ttl) {}

Credential LocalCaCredentialIssuer::Issue(const std::string& sandbox_id, std::chrono::seconds max_ttl) {
    static const std::regex kSandboxId("^[A-Za-z0-9_.-]+$");
    if (!std::regex_match(sandbox_id, kSandboxId)) {
        throw core::ResourceError(core::ResourceKind::kCredential, "invalid sandbox id: " + sandbox_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    EnsureCa();

    const auto ttl = std::min(ttl_, max_ttl);
    if (ttl.count() <= 0) {
        throw core::ResourceError(core::ResourceKind::kCredential, "credential ttl must be positive");
    }

    KeyPtr key(EVP_EC_gen("P-256"), &EVP_PKEY_free);
    if (!key) {
        ThrowOpenSsl("generating key");
    }
    CertPtr cert(X509_new(), &X509_free);
    if (!cert || X509_set_version(cert.get(), 2) != 1) {
        ThrowOpenSsl("allocating certificate");
    }

    Credential credential{};
    credential.sandbox_id = sandbox_id;
    credential.common_name = sandbox_id;
    credential.serial = AssignRandomSerial(cert.get());

    const auto now = std::chrono::system_clock::now();
    if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
        !X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(ttl.count()))) {
        ThrowOpenSsl("setting validity");
    }
    credential.expires_at = now + ttl;

    SetCommonName(cert.get(), credential.common_name);
    if (X509_set_issuer_name(cert.get(), X509_get_subject_name(ca_cert_.get())) != 1 ||
        X509_set_pubkey(cert.get(), key.get()) != 1) {
        ThrowOpenSsl("setting issuer");
    }
    AddExtension(ca_cert_.get(), cert.get(), NID_basic_constraints, "critical,CA:FALSE");
    AddExtension(ca_cert_.get(), cert.get(), NID_key_usage, "critical,digitalSignature");
    AddExtension(ca_cert_.get(), cert.get(), NID_ext_key_usage, "clientAuth");
    if (X509_sign(cert.get(), ca_key_.get(), EVP_sha256()) <= 0) {
        ThrowOpenSsl("signing certificate");
    }

    const auto sandbox_dir = dir_ / "sandboxes" / sandbox_id;
    std::error_code ec;
    std::filesystem::create_directories(sandbox_dir, ec);
    if (ec) {
        throw core::ResourceError(core::ResourceKind::kCredential,
                                  "cannot create " + sandbox_dir.string() + ": " + ec.message());
    }
    credential.cert_path = (sandbox_dir / "cert.pem").string();
    credential.key_path = (sandbox_dir / "key.pem").string();
    try {
        WritePem(credential.key_path, key.get(), nullptr);
        WritePem(credential.cert_path, nullptr, cert.get());
    } catch (const core::ResourceError&) {
        std::filesystem::remove_all(sandbox_dir, ec);
        throw;
    }

    utils::LogInfo("credential") << "issued serial=" << credential.serial
                                 << " sandbox=" << sandbox_id
                                 << " ttl=" << ttl.count() << "s";
    return credential;
}

void LocalCaCredentialIssuer::Revoke(const Credential& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    AppendRevoked(credential);

    std::error_code ec;
    const auto sandbox_dir = std::filesystem::path(credential.key_path).parent_path();
    std::filesystem::remove(credential.key_path, ec);
    if (ec) {
        throw core::ResourceError(core::ResourceKind::kCredential,
                                  "cannot delete " + credential.key_path + ": " + ec.message());
    }
    std::filesystem::remove(credential.cert_path, ec);
    std::filesystem::remove(sandbox_dir, ec);
    utils::LogInfo("credential") << "revoked serial=" << credential.serial
                                 << " sandbox=" << credential.sandbox_id;
}

bool LocalCaCredentialIssuer::IsRevoked(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream input(dir_ / "revoked.json");
    if (!input.is_open()) {
        return false;
    }
    const auto json = nlohmann::json::parse(input, nullptr, false);
    if (!json.is_array()) {
        return false;
    }
    return std::any_of(json.begin(), json.end(), [&](const nlohmann::json& entry) {
        return entry.is_object() && entry.value("serial", "") == serial;
    });
}

void LocalCaCredentialIssuer::EnsureCa() {
    if (ca_key_ && ca_cert_) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    const auto cert_path = dir_ / "ca.pem";
    const auto key_path = dir_ / "ca.key";
    if (!std::filesystem::exists(cert_path) || !std::filesystem::exists(key_path)) {
        CreateCa();
        return;
    }

    FILE* cert_file = std::fopen(cert_path.string().c_str(), "r");
    FILE* key_file = std::fopen(key_path.string().c_str(), "r");
    if (cert_file) {
        ca_cert_.reset(PEM_read_X509(cert_file, nullptr, nullptr, nullptr));
        std::fclose(cert_file);
    }
    if (key_file) {
        ca_key_.reset(PEM_read_PrivateKey(key_file, nullptr, nullptr, nullptr));
        std::fclose(key_file);
    }
    if (!ca_cert_ || !ca_key_) {
        ThrowOpenSsl("loading CA from " + dir_.string());
    }
}

void LocalCaCredentialIssuer::CreateCa() {
    KeyPtr key(EVP_EC_gen("P-256"), &EVP_PKEY_free);
    CertPtr cert(X509_new(), &X509_free);
    if (!key || !cert || X509_set_version(cert.get(), 2) != 1) {
        ThrowOpenSsl("creating CA");
    }
    AssignRandomSerial(cert.get());
    if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
        !X509_gmtime_adj(X509_getm_notAfter(cert.get()), kCaValiditySeconds)) {
        ThrowOpenSsl("setting CA validity");
    }
    SetCommonName(cert.get(), "agentyard sandbox CA");
    if (X509_set_issuer_name(cert.get(), X509_get_subject_name(cert.get())) != 1 ||
        X509_set_pubkey(cert.get(), key.get()) != 1) {
        ThrowOpenSsl("setting CA issuer");
    }
    AddExtension(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE,pathlen:0");
    AddExtension(cert.get(), cert.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
        ThrowOpenSsl("self-signing CA");
    }
    WritePem(dir_ / "ca.key", key.get(), nullptr);
    WritePem(dir_ / "ca.pem", nullptr, cert.get());
    ca_key_ = std::move(key);
    ca_cert_ = std::move(cert);
    utils::LogInfo("credential") << "created CA in " << dir_.string();
}

// Rewrites revoked.json with `credential` added. Entries whose certificate
// has expired are dropped: an expired certificate is rejected anyway.
void LocalCaCredentialIssuer::AppendRevoked(const Credential& credential) {
    const auto path = dir_ / "revoked.json";
    nlohmann::json previous = nlohmann::json::array();
    {
        std::ifstream input(path);
        if (input.is_open()) {
            auto parsed = nlohmann::json::parse(input, nullptr, false);
            if (parsed.is_array()) {
                previous = std::move(parsed);
            }
        }
    }

    const auto now_ms = ToEpochMillis(std::chrono::system_clock::now());
    nlohmann::json revoked = nlohmann::json::array();
    for (auto& entry : previous) {
        if (!entry.is_object() || entry.value("serial", "") == credential.serial) {
            continue;
        }
        if (entry.contains("expires_at_ms") && entry["expires_at_ms"].is_number_integer() &&
            entry["expires_at_ms"].get<long long>() <= now_ms) {
            continue;
        }
        revoked.push_back(std::move(entry));
    }
    revoked.push_back({
        {"serial", credential.serial},
        {"revoked_at_ms", now_ms},
        {"expires_at_ms", ToEpochMillis(credential.expires_at)}
    });

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        throw core::ResourceError(core::ResourceKind::kCredential, "cannot write " + path.string());
    }
    output << revoked.dump(2);
}

}  // namespace agentyard::resources
