#pragma once

#include <sys/types.h>
#include <chrono>
#include <string>
#include <vector>
#include <supervisor-cpp/core/error.hpp>

namespace supervisor_cpp {

constexpr int CHILD_EXIT_CODE = 127;
constexpr std::chrono::seconds DEFAULT_PROCESS_TIMEOUT{120};

/**
 * @brief Command line of a short-lived helper process
 */
struct ProcessConfig {
    std::string executable; // resolved through PATH
    std::vector<std::string> args;
    std::string stdin_data;
    std::chrono::milliseconds timeout = DEFAULT_PROCESS_TIMEOUT;
};

/**
 * @brief Captured output of a finished process
 */
struct ProcessResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
};

/**
 * @brief Runs helper binaries (the docker CLI, the trust verifier)
 *
 * Abstract so the engine client and the trust verifier can be driven by
 * scripted output in tests.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run to completion and capture stdout/stderr
     * @throws ContainerError SYSTEM_ERROR when the process cannot be started
     */
    virtual ProcessResult run(const ProcessConfig& config) = 0;
};

/**
 * @brief Split a command line into arguments
 *
 * Whitespace separates arguments; single and double quotes group, a
 * backslash escapes the next character outside single quotes.
 * @throws ContainerError CONFIG_INVALID on an unterminated quote
 */
std::vector<std::string> splitCommandLine(const std::string& command_line);

// Captured output without surrounding whitespace and line breaks
std::string trimmed(const std::string& text);

/**
 * @brief fork/exec implementation with pipes for stdin, stdout and stderr
 */
class SubprocessRunner : public ProcessRunner {
public:
    ProcessResult run(const ProcessConfig& config) override;

private:
    static std::vector<char*> createArgv(const ProcessConfig& config);
    static void freeArgv(std::vector<char*>& argv);
    static int waitForExit(pid_t pid);
};

} // namespace supervisor_cpp
