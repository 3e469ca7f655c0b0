#pragma once
#include <stdexcept>
#include <string>

namespace queuectl {

class QueueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed job description; nothing was written.
class ValidationError : public QueueError {
public:
    using QueueError::QueueError;
};

class DuplicateJobError : public QueueError {
public:
    explicit DuplicateJobError(const std::string& id)
        : QueueError("A job with ID '" + id + "' already exists.")
        , id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

class StoreError : public QueueError {
public:
    using QueueError::QueueError;
};

// SQLITE_BUSY / SQLITE_LOCKED. Callers polling for work treat this as "no job".
class StoreBusyError : public StoreError {
public:
    using StoreError::StoreError;
};

class StoreConstraintError : public StoreError {
public:
    using StoreError::StoreError;
};

// The command could not be run at all (pipe/fork failure, ...)
class ExecError : public QueueError {
public:
    using QueueError::QueueError;
};

} // namespace queuectl
