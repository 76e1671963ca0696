#pragma once

#include <stdexcept>
#include <string>

#include "core/task_types.hpp"

namespace agentyard::core {

// Malformed task descriptor, rejected before any resource is touched.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

class TaskNotFoundError : public std::out_of_range {
public:
    explicit TaskNotFoundError(const std::string& task_id)
        : std::out_of_range("task not found: " + task_id)
        , task_id_(task_id) {}

    const std::string& TaskId() const { return task_id_; }

private:
    std::string task_id_;
};

// Raised by the leaf services when an acquisition or a release fails.
class ResourceError : public std::runtime_error {
public:
    ResourceError(ResourceKind kind, const std::string& message)
        : std::runtime_error(std::string(ToString(kind)) + ": " + message)
        , kind_(kind)
        , cause_(message) {}

    ResourceKind Kind() const { return kind_; }
    const std::string& Cause() const { return cause_; }

private:
    ResourceKind kind_;
    std::string cause_;
};

}  // namespace agentyard::core
