#pragma once
#include <stdexcept>
#include <string>

namespace mcpharbor {

// ── Container runtime ──

class DockerError : public std::runtime_error {
public:
    explicit DockerError(const std::string& msg, int status = 0)
        : std::runtime_error(msg), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

// Container (or other object) does not exist. An expected state, not a fault.
class DockerNotFound : public DockerError {
public:
    explicit DockerNotFound(const std::string& msg) : DockerError(msg, 404) {}
};

class DockerApiError : public DockerError {
public:
    using DockerError::DockerError;
};

// Daemon unreachable: socket missing, connection refused, timeout.
class DockerConnectionError : public DockerError {
public:
    explicit DockerConnectionError(const std::string& msg) : DockerError(msg, 0) {}
};

class ImageNotFound : public DockerNotFound {
public:
    using DockerNotFound::DockerNotFound;
};

class ImagePullError : public DockerApiError {
public:
    using DockerApiError::DockerApiError;
};

// ── Store ──

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unique or foreign key constraint rejected a write.
class IntegrityError : public StoreError {
public:
    using StoreError::StoreError;
};

// ── Lifespan ──

class StartupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace mcpharbor
