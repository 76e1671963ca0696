#pragma once

#include <chrono>
#include <string>

#include "resources/resource_handles.hpp"

namespace agentyard::resources {

// Issues TLS client credentials scoped to one sandbox. Failures are reported
// as core::ResourceError with kind kCredential.
class CredentialIssuer {
public:
    virtual ~CredentialIssuer() = default;

    // The returned credential never expires later than now + max_ttl.
    virtual Credential Issue(const std::string& sandbox_id, std::chrono::seconds max_ttl) = 0;
    virtual void Revoke(const Credential& credential) = 0;
};

}  // namespace agentyard::resources
