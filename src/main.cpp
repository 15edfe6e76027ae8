#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <supervisor-cpp/config/config_manager.hpp>
#include <supervisor-cpp/config/supervisor_options.hpp>
#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/core/process_runner.hpp>
#include <supervisor-cpp/docker/cli_daemon_client.hpp>
#include <supervisor-cpp/docker/context.hpp>
#include <supervisor-cpp/docker/roles.hpp>
#include <supervisor-cpp/docker/supervisor.hpp>
#include <supervisor-cpp/security/trust.hpp>

using namespace supervisor_cpp;

namespace {

constexpr int EXIT_USAGE = 2;

const std::vector<std::string> LOGGER_NAMES = {
    "supervisor",     "core.event",     "core.executor",  "core.process",
    "jobs",           "resolution",     "security.trust", "docker.cli",
    "docker.network", "docker.manager", "docker.monitor", "docker.interface",
    "docker.supervisor"};

void printUsage(const char* program)
{
    std::cerr << "Usage: " << program << " <config.json> <command> <role> [version]\n"
              << "\n"
              << "Commands:\n"
              << "  attach <role> [version]  adopt the running container and report its state\n"
              << "  run <role>               start the role container\n"
              << "  stop <role>              stop and remove the role container\n"
              << "  state <role>             print the container state\n"
              << "  update <role> <version>  install a new version and stop the old container\n"
              << "  latest <role>            print the newest local image version\n"
              << "\n"
              << "Roles: audio, homeassistant, supervisor\n";
}

void configureLogging(const SupervisorOptions& options)
{
    Logger::setGlobalLevel(options.log_level);
    for (const auto& name : LOGGER_NAMES) {
        auto* logger = Logger::getInstance(name);
        logger->setPattern(options.log_pattern);
        if (options.log_file) {
            logger->addFileSink(*options.log_file, options.log_level);
        }
    }
}

std::unique_ptr<ContainerInterface> makeContainer(SupervisorContext& context, const std::string& role)
{
    if (role == "audio") {
        return std::make_unique<ContainerInterface>(context, makeAudioRole(context.options()));
    }
    if (role == "homeassistant") {
        return std::make_unique<ContainerInterface>(context,
                                                    makeHomeAssistantRole(context.options()));
    }
    if (role == "supervisor") {
        return std::make_unique<SupervisorContainer>(context, makeSupervisorRole(context.options()));
    }
    return nullptr;
}

Version attachVersion(ContainerInterface& container, const std::vector<std::string>& args)
{
    if (args.size() > 4) {
        return Version(args[4]);
    }
    return container.getLatestVersion();
}

int runCommand(SupervisorContext& context, const std::vector<std::string>& args)
{
    const std::string& command = args[2];
    auto container = makeContainer(context, args[3]);
    if (!container) {
        std::cerr << "Unknown role: " << args[3] << "\n";
        return EXIT_USAGE;
    }

    if (command == "attach") {
        container->attach(attachVersion(*container, args));
        std::cout << container->name() << ": " << container->currentState() << "\n";
    }
    else if (command == "run") {
        container->attach(attachVersion(*container, args), true);
        container->run();
    }
    else if (command == "stop") {
        container->stop();
    }
    else if (command == "state") {
        std::cout << container->name() << ": " << container->currentState() << "\n";
    }
    else if (command == "update") {
        if (args.size() < 5) {
            std::cerr << "update needs a version\n";
            return EXIT_USAGE;
        }
        container->attach(container->getLatestVersion(), true);
        container->update(Version(args[4]));
    }
    else if (command == "latest") {
        std::cout << container->getLatestVersion() << "\n";
    }
    else {
        std::cerr << "Unknown command: " << command << "\n";
        return EXIT_USAGE;
    }

    // Let the state events reach their listeners before shutting down
    context.bus().flush();
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv, argv + argc);
    if (args.size() < 4) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    // A docker child exiting early must not kill us while we feed its stdin
    std::signal(SIGPIPE, SIG_IGN);

    auto logger = Logger::getInstance("supervisor");
    try {
        ConfigManager config;
        config.loadFromJsonFile(args[1]);

        SupervisorOptions options = SupervisorOptions::fromConfig(config.expandEnvironmentVariables());
        configureLogging(options);

        auto runner = std::make_shared<SubprocessRunner>();
        auto client = std::make_shared<DockerCliClient>(runner, options.docker_binary);
        auto verifier = createTrustVerifier(options.content_trust, options.verify_command, runner);

        SupervisorContext context(std::move(options), client, verifier);
        context.bus().subscribe(EVENT_CONTAINER_STATE_CHANGE, [logger](const Event& event) {
            logger->info("Container {} is now {}", event.getMetadata<std::string>("name"),
                         event.getMetadata<std::string>("state"));
        });

        return runCommand(context, args);
    }
    catch (const ContainerError& e) {
        logger->error("{}", e.what());
        return EXIT_FAILURE;
    }
}
