#pragma once

#include <exception>
#include <string>
#include <system_error>

namespace supervisor_cpp {

/**
 * @brief Error codes for orchestration operations
 */
enum class ErrorCode {
    // Container errors
    CONTAINER_NOT_FOUND = 1000,
    CONTAINER_START_FAILED = 1001,
    CONTAINER_STOP_FAILED = 1002,
    CONTAINER_REMOVE_FAILED = 1003,

    // Image errors
    IMAGE_NOT_FOUND = 2000,
    IMAGE_PULL_FAILED = 2001,
    IMAGE_ARCH_MISMATCH = 2002,

    // Daemon errors
    DAEMON_API_ERROR = 3000,
    DAEMON_REQUEST_ERROR = 3001,
    DOCKER_ERROR = 3002,

    // Content trust errors
    TRUST_UNTRUSTED = 4000,
    TRUST_VERIFICATION_FAILED = 4001,

    // Network errors
    NETWORK_CREATION_FAILED = 5000,
    NETWORK_CONFIG_FAILED = 5001,
    NETWORK_NOT_FOUND = 5002,

    // Job errors
    JOB_CONFLICT = 6000,
    JOB_EXECUTOR_STOPPED = 6001,

    // System errors
    SYSTEM_ERROR = 8000,
    IO_ERROR = 8001,
    NOT_IMPLEMENTED = 8002,

    // Configuration errors
    CONFIG_INVALID = 9000,
    CONFIG_MISSING = 9001,
    INVALID_TYPE = 9002,
    FILE_NOT_FOUND = 9003,

    // Generic error
    UNKNOWN_ERROR = 9999
};

/**
 * @brief Error category for supervisor-cpp error codes
 */
class SupervisorErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "supervisor-cpp";
    }

    std::string message(int ev) const override;
};

/**
 * @brief Get the error category instance
 */
const SupervisorErrorCategory& getSupervisorErrorCategory();

/**
 * @brief Base exception for all orchestration failures
 */
class ContainerError : public std::exception {
public:
    /**
     * @brief Construct an error
     * @param code The error code
     * @param message Context for the failure (image, version, cause)
     */
    ContainerError(ErrorCode code, std::string message);

    ContainerError(const ContainerError& other) = default;
    ContainerError(ContainerError&& other) noexcept = default;
    ContainerError& operator=(const ContainerError& other) = default;
    ContainerError& operator=(ContainerError&& other) noexcept = default;
    ~ContainerError() noexcept override = default;

    const char* what() const noexcept override;

    ErrorCode getErrorCode() const noexcept;

    /**
     * @brief Detail message without the category prefix
     */
    const std::string& getMessage() const noexcept;

    std::error_code code() const noexcept;

private:
    ErrorCode error_code_;
    std::string message_;
    std::string full_message_;
};

/**
 * @brief The engine rejected a request
 *
 * Carries the status code returned by the engine when known (429 for
 * registry rate limiting, 404 for missing objects, 0 when unknown).
 */
class DockerAPIError : public ContainerError {
public:
    explicit DockerAPIError(std::string message, int status_code = 0);

    int getStatusCode() const noexcept
    {
        return status_code_;
    }

private:
    int status_code_;
};

/**
 * @brief The engine could not be reached
 */
class DockerRequestError : public ContainerError {
public:
    explicit DockerRequestError(std::string message);
};

/**
 * @brief A container, image or network required by the operation is absent
 */
class DockerNotFound : public ContainerError {
public:
    DockerNotFound(ErrorCode code, std::string message);
};

/**
 * @brief Content-trust verification failed or reported untrusted content
 */
class DockerTrustError : public ContainerError {
public:
    DockerTrustError(ErrorCode code, std::string message);
};

/**
 * @brief The execution limiter rejected a call
 */
class JobConflictError : public ContainerError {
public:
    JobConflictError(const std::string& job_name, const std::string& group_name);
};

/**
 * @brief True for the not-found family of codes
 */
bool isNotFound(ErrorCode code) noexcept;

/**
 * @brief True for the content-trust family of codes
 */
bool isTrustError(ErrorCode code) noexcept;

/**
 * @brief Create an error from a system error
 * @param code The error code
 * @param sys_error The system error
 * @return Error with system error information
 */
ContainerError makeSystemError(ErrorCode code, const std::system_error& sys_error);

} // namespace supervisor_cpp
