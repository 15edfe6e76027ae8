#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <supervisor-cpp/core/process_runner.hpp>

namespace supervisor_cpp {

enum class TrustStatus : std::uint8_t {
    OK,
    UNTRUSTED, // content does not match a signed checksum
    ERROR      // verification could not be carried out
};

std::string toString(TrustStatus status);

struct TrustResult {
    TrustStatus status = TrustStatus::OK;
    std::string message;

    bool ok() const
    {
        return status == TrustStatus::OK;
    }
};

/**
 * @brief Content-trust check of a pulled image
 */
class TrustVerifier {
public:
    virtual ~TrustVerifier() = default;

    /**
     * @param checksum Image id digest without the "sha256:" prefix
     */
    virtual TrustResult verify(const std::string& checksum) = 0;
};

/**
 * @brief Accepts every image, used when content trust is switched off
 */
class DisabledTrustVerifier : public TrustVerifier {
public:
    TrustResult verify(const std::string& checksum) override;
};

/**
 * @brief Runs an external verification command with the checksum appended
 *
 * Exit status 0 means trusted, 1 untrusted, anything else is a
 * verification error.
 */
class CommandTrustVerifier : public TrustVerifier {
public:
    CommandTrustVerifier(std::shared_ptr<ProcessRunner> runner, std::vector<std::string> command);

    TrustResult verify(const std::string& checksum) override;

private:
    std::shared_ptr<ProcessRunner> runner_;
    std::vector<std::string> command_;
};

/**
 * @brief Build the verifier for the configured trust mode
 */
std::shared_ptr<TrustVerifier> createTrustVerifier(bool content_trust,
                                                   const std::string& verify_command,
                                                   std::shared_ptr<ProcessRunner> runner);

} // namespace supervisor_cpp
