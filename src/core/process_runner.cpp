#include <supervisor-cpp/core/process_runner.hpp>
#include <supervisor-cpp/core/logger.hpp>
#include <sys/wait.h>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace supervisor_cpp {

namespace {

constexpr size_t READ_BUFFER_SIZE = 4096;

class Pipe {
public:
    // Close-on-exec so concurrent children never inherit each other's pipes
    Pipe()
    {
        if (pipe2(fds_, O_CLOEXEC) == -1) {
            throw ContainerError(ErrorCode::SYSTEM_ERROR,
                                 "Failed to create pipe: " + std::string(strerror(errno)));
        }
    }

    ~Pipe()
    {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int readEnd() const
    {
        return fds_[0];
    }
    int writeEnd() const
    {
        return fds_[1];
    }

    void closeRead()
    {
        if (fds_[0] != -1) {
            close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void closeWrite()
    {
        if (fds_[1] != -1) {
            close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

void writeAll(int fd, const std::string& data)
{
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            // Child closed its stdin early
            return;
        }
        written += static_cast<size_t>(n);
    }
}

} // namespace

std::vector<std::string> splitCommandLine(const std::string& command_line)
{
    std::vector<std::string> args;
    std::string current;
    bool in_arg = false;
    char quote = 0;

    for (size_t i = 0; i < command_line.size(); ++i) {
        char c = command_line[i];

        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            }
            else if (c == '\\' && quote == '"' && i + 1 < command_line.size()) {
                current += command_line[++i];
            }
            else {
                current += c;
            }
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            in_arg = true;
        }
        else if (c == '\\' && i + 1 < command_line.size()) {
            current += command_line[++i];
            in_arg = true;
        }
        else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_arg) {
                args.push_back(current);
                current.clear();
                in_arg = false;
            }
        }
        else {
            current += c;
            in_arg = true;
        }
    }

    if (quote != 0) {
        throw ContainerError(ErrorCode::CONFIG_INVALID,
                             "Unterminated quote in command: " + command_line);
    }
    if (in_arg) {
        args.push_back(current);
    }
    return args;
}

std::string trimmed(const std::string& text)
{
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

ProcessResult SubprocessRunner::run(const ProcessConfig& config)
{
    Pipe stdin_pipe;
    Pipe stdout_pipe;
    Pipe stderr_pipe;
    // Closed by a successful exec, carries errno otherwise
    Pipe error_pipe;

    std::vector<char*> argv = createArgv(config);

    pid_t pid = fork();
    if (pid == -1) {
        int fork_errno = errno;
        freeArgv(argv);
        throw ContainerError(ErrorCode::SYSTEM_ERROR,
                             "Failed to fork process: " + std::string(strerror(fork_errno)));
    }

    if (pid == 0) {
        // Child process, only async-signal-safe calls from here on
        dup2(stdin_pipe.readEnd(), STDIN_FILENO);
        dup2(stdout_pipe.writeEnd(), STDOUT_FILENO);
        dup2(stderr_pipe.writeEnd(), STDERR_FILENO);
        close(stdin_pipe.readEnd());
        close(stdin_pipe.writeEnd());
        close(stdout_pipe.readEnd());
        close(stdout_pipe.writeEnd());
        close(stderr_pipe.readEnd());
        close(stderr_pipe.writeEnd());
        close(error_pipe.readEnd());

        execvp(config.executable.c_str(), argv.data());

        int error_code = errno;
        ssize_t ignored = write(error_pipe.writeEnd(), &error_code, sizeof(error_code));
        (void)ignored;
        _exit(CHILD_EXIT_CODE);
    }

    // Parent process
    freeArgv(argv);
    stdin_pipe.closeRead();
    stdout_pipe.closeWrite();
    stderr_pipe.closeWrite();
    error_pipe.closeWrite();

    int child_error = 0;
    ssize_t bytes_read;
    do {
        bytes_read = read(error_pipe.readEnd(), &child_error, sizeof(child_error));
    } while (bytes_read == -1 && errno == EINTR);

    if (bytes_read == sizeof(child_error)) {
        waitForExit(pid);
        throw ContainerError(ErrorCode::SYSTEM_ERROR, "Failed to execute '" + config.executable
                                                          + "': " + strerror(child_error));
    }

    writeAll(stdin_pipe.writeEnd(), config.stdin_data);
    stdin_pipe.closeWrite();

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + config.timeout;

    pollfd fds[2] = {{stdout_pipe.readEnd(), POLLIN, 0}, {stderr_pipe.readEnd(), POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_streams = 2;
    char buffer[READ_BUFFER_SIZE];

    while (open_streams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            kill(pid, SIGKILL);
            break;
        }

        int ready = poll(fds, 2, static_cast<int>(remaining.count()));
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            int poll_errno = errno;
            kill(pid, SIGKILL);
            waitForExit(pid);
            throw ContainerError(ErrorCode::SYSTEM_ERROR,
                                 "Failed to read process output: "
                                     + std::string(strerror(poll_errno)));
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd == -1 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            }
            else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    result.exit_code = waitForExit(pid);
    if (result.timed_out) {
        Logger::getInstance("core.process")
            ->warning("Process '{}' killed after {} ms", config.executable,
                      config.timeout.count());
    }
    return result;
}

std::vector<char*> SubprocessRunner::createArgv(const ProcessConfig& config)
{
    std::vector<char*> argv;
    argv.reserve(config.args.size() + 2);

    argv.push_back(strdup(config.executable.c_str()));
    for (const auto& arg : config.args) {
        argv.push_back(strdup(arg.c_str()));
    }
    argv.push_back(nullptr);

    return argv;
}

void SubprocessRunner::freeArgv(std::vector<char*>& argv)
{
    for (char* arg : argv) {
        free(arg);
    }
    argv.clear();
}

int SubprocessRunner::waitForExit(pid_t pid)
{
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status); // NOLINT(readability-magic-numbers)
    }
    return -1;
}

} // namespace supervisor_cpp
