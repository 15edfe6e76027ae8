#include <supervisor-cpp/core/error.hpp>
#include <sstream>

namespace supervisor_cpp {

std::string SupervisorErrorCategory::message(int ev) const
{
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::CONTAINER_NOT_FOUND:
            return "Container not found";
        case ErrorCode::CONTAINER_START_FAILED:
            return "Failed to start container";
        case ErrorCode::CONTAINER_STOP_FAILED:
            return "Failed to stop container";
        case ErrorCode::CONTAINER_REMOVE_FAILED:
            return "Failed to remove container";

        case ErrorCode::IMAGE_NOT_FOUND:
            return "Image not found";
        case ErrorCode::IMAGE_PULL_FAILED:
            return "Failed to pull image";
        case ErrorCode::IMAGE_ARCH_MISMATCH:
            return "Image architecture mismatch";

        case ErrorCode::DAEMON_API_ERROR:
            return "Docker API error";
        case ErrorCode::DAEMON_REQUEST_ERROR:
            return "Docker request error";
        case ErrorCode::DOCKER_ERROR:
            return "Docker error";

        case ErrorCode::TRUST_UNTRUSTED:
            return "Content is untrusted";
        case ErrorCode::TRUST_VERIFICATION_FAILED:
            return "Content-trust verification failed";

        case ErrorCode::NETWORK_CREATION_FAILED:
            return "Failed to create network";
        case ErrorCode::NETWORK_CONFIG_FAILED:
            return "Failed to configure network";
        case ErrorCode::NETWORK_NOT_FOUND:
            return "Network not found";

        case ErrorCode::JOB_CONFLICT:
            return "Job conflict";
        case ErrorCode::JOB_EXECUTOR_STOPPED:
            return "Executor is shut down";

        case ErrorCode::SYSTEM_ERROR:
            return "System error";
        case ErrorCode::IO_ERROR:
            return "I/O error";
        case ErrorCode::NOT_IMPLEMENTED:
            return "Not implemented";

        case ErrorCode::CONFIG_INVALID:
            return "Invalid configuration";
        case ErrorCode::CONFIG_MISSING:
            return "Missing configuration";
        case ErrorCode::INVALID_TYPE:
            return "Invalid type for configuration value";
        case ErrorCode::FILE_NOT_FOUND:
            return "File not found";

        case ErrorCode::UNKNOWN_ERROR:
        default:
            return "Unknown error";
    }
}

const SupervisorErrorCategory& getSupervisorErrorCategory()
{
    static SupervisorErrorCategory category;
    return category;
}

ContainerError::ContainerError(ErrorCode code, std::string message)
    : error_code_(code), message_(std::move(message))
{
    std::ostringstream oss;
    oss << "[" << getSupervisorErrorCategory().name() << " " << static_cast<int>(error_code_)
        << "] " << getSupervisorErrorCategory().message(static_cast<int>(error_code_));

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    full_message_ = oss.str();
}

const char* ContainerError::what() const noexcept
{
    return full_message_.c_str();
}

ErrorCode ContainerError::getErrorCode() const noexcept
{
    return error_code_;
}

const std::string& ContainerError::getMessage() const noexcept
{
    return message_;
}

std::error_code ContainerError::code() const noexcept
{
    return std::error_code(static_cast<int>(error_code_), getSupervisorErrorCategory());
}

DockerAPIError::DockerAPIError(std::string message, int status_code)
    : ContainerError(ErrorCode::DAEMON_API_ERROR, std::move(message)), status_code_(status_code)
{}

DockerRequestError::DockerRequestError(std::string message)
    : ContainerError(ErrorCode::DAEMON_REQUEST_ERROR, std::move(message))
{}

DockerNotFound::DockerNotFound(ErrorCode code, std::string message)
    : ContainerError(code, std::move(message))
{}

DockerTrustError::DockerTrustError(ErrorCode code, std::string message)
    : ContainerError(code, std::move(message))
{}

JobConflictError::JobConflictError(const std::string& job_name, const std::string& group_name)
    : ContainerError(ErrorCode::JOB_CONFLICT,
                     "Job " + job_name + " rejected, " + group_name + " is busy")
{}

bool isNotFound(ErrorCode code) noexcept
{
    return code == ErrorCode::CONTAINER_NOT_FOUND || code == ErrorCode::IMAGE_NOT_FOUND
           || code == ErrorCode::NETWORK_NOT_FOUND;
}

bool isTrustError(ErrorCode code) noexcept
{
    return code == ErrorCode::TRUST_UNTRUSTED || code == ErrorCode::TRUST_VERIFICATION_FAILED;
}

ContainerError makeSystemError(ErrorCode code, const std::system_error& sys_error)
{
    std::ostringstream oss;
    oss << sys_error.what() << " (system error " << sys_error.code().value() << ")";
    return ContainerError(code, oss.str());
}

} // namespace supervisor_cpp
