#pragma once
#include <stdexcept>
#include <string>

class WorkerError : public std::runtime_error {
public:
    WorkerError(const std::string& kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    const std::string& kind() const { return kind_; }

private:
    std::string kind_;
};

// Start-up failures of the underlying process or container.
class SpawnError : public WorkerError {
public:
    explicit SpawnError(const std::string& msg) : WorkerError("SpawnError", msg) {}
};

class ContainerStartError : public WorkerError {
public:
    explicit ContainerStartError(const std::string& msg) : WorkerError("ContainerStartError", msg) {}
};

// Raised before any resource is touched; the call had no side effects.
class UsageError : public WorkerError {
public:
    using WorkerError::WorkerError;
};

class UnknownWorkerType : public UsageError {
public:
    explicit UnknownWorkerType(const std::string& type)
        : UsageError("UnknownWorkerType", "Unknown worker type: " + type) {}
};

class WorkerNotFound : public UsageError {
public:
    explicit WorkerNotFound(const std::string& id)
        : UsageError("WorkerNotFound", "Worker not found: " + id) {}
};

class LengthMismatch : public UsageError {
public:
    LengthMismatch(std::size_t ids, std::size_t tasks)
        : UsageError("LengthMismatch", "worker_ids and tasks must have same length (" +
                     std::to_string(ids) + " != " + std::to_string(tasks) + ")") {}
};

class InvalidArgument : public UsageError {
public:
    explicit InvalidArgument(const std::string& msg) : UsageError("InvalidArgument", msg) {}
};

class WorkerBusy : public UsageError {
public:
    explicit WorkerBusy(const std::string& id)
        : UsageError("WorkerBusy", "Worker " + id + " is already executing a task") {}
};

class UnsupportedOperation : public UsageError {
public:
    explicit UnsupportedOperation(const std::string& msg) : UsageError("UnsupportedOperation", msg) {}
};

class WorkerUnavailable : public UsageError {
public:
    WorkerUnavailable(const std::string& id, const std::string& status)
        : UsageError("WorkerUnavailable", "Worker " + id + " is " + status + " and cannot run tasks") {}
};
