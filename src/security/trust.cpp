#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/core/process_runner.hpp>
#include <supervisor-cpp/security/trust.hpp>

namespace supervisor_cpp {

namespace {

constexpr int EXIT_UNTRUSTED = 1;
constexpr std::chrono::seconds VERIFY_TIMEOUT{60};

} // namespace

std::string toString(TrustStatus status)
{
    switch (status) {
        case TrustStatus::OK:
            return "ok";
        case TrustStatus::UNTRUSTED:
            return "untrusted";
        case TrustStatus::ERROR:
            return "error";
    }
    return "error";
}

TrustResult DisabledTrustVerifier::verify(const std::string& checksum)
{
    Logger::getInstance("security.trust")->debug("Content trust disabled, skip {}", checksum);
    return TrustResult{TrustStatus::OK, ""};
}

CommandTrustVerifier::CommandTrustVerifier(std::shared_ptr<ProcessRunner> runner,
                                           std::vector<std::string> command)
    : runner_(std::move(runner)), command_(std::move(command))
{
    if (!runner_) {
        throw ContainerError(ErrorCode::CONFIG_INVALID, "Trust verifier needs a process runner");
    }
    if (command_.empty()) {
        throw ContainerError(ErrorCode::CONFIG_MISSING, "Trust verification command is empty");
    }
}

TrustResult CommandTrustVerifier::verify(const std::string& checksum)
{
    auto logger = Logger::getInstance("security.trust");

    if (checksum.empty()) {
        return TrustResult{TrustStatus::ERROR, "Empty checksum"};
    }

    ProcessConfig config;
    config.executable = command_.front();
    config.args.assign(command_.begin() + 1, command_.end());
    config.args.push_back(checksum);
    config.timeout = VERIFY_TIMEOUT;

    ProcessResult result;
    try {
        result = runner_->run(config);
    }
    catch (const ContainerError& e) {
        logger->error("Can't run content trust verification: {}", e.what());
        return TrustResult{TrustStatus::ERROR, e.getMessage()};
    }

    if (result.timed_out) {
        return TrustResult{TrustStatus::ERROR, "Timeout during content trust verification"};
    }

    if (result.exit_code == 0) {
        logger->debug("Checksum {} verified", checksum);
        return TrustResult{TrustStatus::OK, ""};
    }

    std::string detail = trimmed(result.stderr_data);
    if (result.exit_code == EXIT_UNTRUSTED) {
        logger->warning("Checksum {} is not trusted: {}", checksum, detail);
        return TrustResult{TrustStatus::UNTRUSTED, detail};
    }

    logger->error("Content trust verification of {} failed with exit code {}: {}", checksum,
                  result.exit_code, detail);
    return TrustResult{TrustStatus::ERROR, detail};
}

std::shared_ptr<TrustVerifier> createTrustVerifier(bool content_trust,
                                                   const std::string& verify_command,
                                                   std::shared_ptr<ProcessRunner> runner)
{
    if (!content_trust) {
        return std::make_shared<DisabledTrustVerifier>();
    }
    return std::make_shared<CommandTrustVerifier>(std::move(runner),
                                                  splitCommandLine(verify_command));
}

} // namespace supervisor_cpp
