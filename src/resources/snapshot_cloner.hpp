#pragma once

#include <string>

#include "resources/resource_handles.hpp"

namespace agentyard::resources {

// Produces an isolated writable copy of a template database per sandbox.
// Failures are reported as core::ResourceError with kind kDatabaseClone.
class SnapshotCloner {
public:
    virtual ~SnapshotCloner() = default;

    virtual DatabaseClone Clone(const std::string& template_name, const std::string& sandbox_id) = 0;
    virtual void Destroy(const DatabaseClone& clone) = 0;
};

}  // namespace agentyard::resources
