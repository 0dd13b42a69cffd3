/**
 * @file main.cpp
 *
 * This module holds the main() function, which is the entrypoint
 * to the Huddle membership server program.
 *
 * © 2020 by Richard Walters
 */

#include <chrono>
#include <Huddle/NetworkServerTransport.hpp>
#include <Huddle/Server.hpp>
#include <Huddle/TimeKeeper.hpp>
#include <inttypes.h>
#include <Json/Value.hpp>
#include <memory>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/DiagnosticsStreamReporter.hpp>
#include <SystemAbstractions/File.hpp>
#include <thread>
#include <Timekeeping/Scheduler.hpp>

namespace {

    /**
     * This flag indicates whether or not the server should shut down.
     */
    volatile sig_atomic_t shutDown = 0;

    /**
     * This contains variables set through the operating system environment
     * or the command-line arguments.
     */
    struct Environment {
        /**
         * This is the path to the JSON file holding the server
         * configuration, if any.
         */
        std::string configurationFilePath;

        /**
         * This indicates whether or not a port was given on the
         * command line.
         */
        bool portSet = false;

        /**
         * This is the port given on the command line.
         */
        uint16_t port = 0;
    };

    /**
     * This function prints to the standard error stream information
     * about how to use this program.
     */
    void PrintUsageInformation() {
        fprintf(
            stderr,
            (
                "Usage: HuddleServer [-p|--port <port>] [-c|--config <file>]\n"
                "\n"
                "Run the Huddle group membership server.\n"
                "\n"
                "  -p, --port <port>    Port on which to accept members (1024-65535).\n"
                "  -c, --config <file>  JSON file holding the server configuration.\n"
                "                       Settings given on the command line take\n"
                "                       precedence over the file.\n"
            )
        );
    }

    /**
     * Parse the given text as a port number.
     *
     * @param[in] text
     *     This is the text to parse.
     *
     * @param[out] port
     *     This is where to store the port.
     *
     * @return
     *     An indication of whether or not the text holds a port in the
     *     range members may use is returned.
     */
    bool ParsePort(
        const std::string& text,
        uint16_t& port
    ) {
        intmax_t value;
        if (sscanf(text.c_str(), "%" SCNdMAX, &value) != 1) {
            return false;
        }
        if (
            (value < 1024)
            || (value > 65535)
        ) {
            return false;
        }
        port = (uint16_t)value;
        return true;
    }

    /**
     * This function updates the program environment to incorporate
     * any applicable command-line arguments.
     *
     * @param[in] argc
     *     This is the number of command-line arguments given to the program.
     *
     * @param[in] argv
     *     This is the array of command-line arguments given to the program.
     *
     * @param[in,out] environment
     *     This is the environment to update.
     *
     * @return
     *     An indication of whether or not the function succeeded is returned.
     */
    bool ProcessCommandLineArguments(
        int argc,
        char* argv[],
        Environment& environment
    ) {
        enum class State {
            NoContext,
            Port,
            ConfigurationFilePath,
        } state = State::NoContext;
        for (int i = 1; i < argc; ++i) {
            const std::string arg(argv[i]);
            switch (state) {
                case State::NoContext: {
                    if (
                        (arg == "-p")
                        || (arg == "--port")
                    ) {
                        state = State::Port;
                    } else if (
                        (arg == "-c")
                        || (arg == "--config")
                    ) {
                        state = State::ConfigurationFilePath;
                    } else {
                        fprintf(stderr, "unrecognized argument: '%s'\n", arg.c_str());
                        return false;
                    }
                } break;

                case State::Port: {
                    if (!ParsePort(arg, environment.port)) {
                        fprintf(stderr, "port must be a number from 1024 to 65535\n");
                        return false;
                    }
                    environment.portSet = true;
                    state = State::NoContext;
                } break;

                case State::ConfigurationFilePath: {
                    environment.configurationFilePath = arg;
                    state = State::NoContext;
                } break;

                default: break;
            }
        }
        if (state != State::NoContext) {
            fprintf(stderr, "missing value after '%s'\n", argv[argc - 1]);
            return false;
        }
        return true;
    }

    /**
     * Read the server configuration from the given JSON file.
     *
     * @param[in] path
     *     This is the path to the configuration file.
     *
     * @param[out] configuration
     *     This is where to store the configuration read.
     *
     * @param[in] diagnosticsSender
     *     This is used to warn about configuration values which
     *     are rejected.
     *
     * @return
     *     An indication of whether or not the configuration was read
     *     is returned.
     */
    bool ReadConfiguration(
        const std::string& path,
        Huddle::Server::Configuration& configuration,
        SystemAbstractions::DiagnosticsSender& diagnosticsSender
    ) {
        SystemAbstractions::File file(path);
        if (!file.OpenReadOnly()) {
            fprintf(stderr, "unable to open configuration file '%s'\n", path.c_str());
            return false;
        }
        SystemAbstractions::IFile::Buffer buffer(file.GetSize());
        const auto amountRead = file.Read(buffer);
        file.Close();
        if (amountRead != buffer.size()) {
            fprintf(stderr, "unable to read configuration file '%s'\n", path.c_str());
            return false;
        }
        const auto json = Json::Value::FromEncoding(
            std::string(buffer.begin(), buffer.end())
        );
        if (json.GetType() != Json::Value::Type::Object) {
            fprintf(stderr, "configuration file '%s' does not hold a JSON object\n", path.c_str());
            return false;
        }
        configuration = Huddle::Server::Configuration::FromJson(json, &diagnosticsSender);
        return true;
    }

    /**
     * This function is set up to be called when the SIGINT or SIGTERM
     * signal is received by the program.  It just sets the "shutDown"
     * flag and relies on the program to be polling the flag to detect
     * when it's been set.
     *
     * @param[in] sig
     *     This is the signal for which this function was called.
     */
    void InterruptHandler(int) {
        shutDown = 1;
    }

}

/**
 * This function is the entrypoint of the program.
 *
 * @param[in] argc
 *     This is the number of command-line arguments given to the program.
 *
 * @param[in] argv
 *     This is the array of command-line arguments given to the program.
 */
int main(int argc, char* argv[]) {
    Environment environment;
    if (!ProcessCommandLineArguments(argc, argv, environment)) {
        PrintUsageInformation();
        return EXIT_FAILURE;
    }
    const auto diagnosticsPublisher = SystemAbstractions::DiagnosticsStreamReporter(stdout, stderr);
    SystemAbstractions::DiagnosticsSender configurationDiagnosticsSender("HuddleServer");
    const auto configurationDiagnosticsUnsubscribeDelegate = configurationDiagnosticsSender.SubscribeToDiagnostics(diagnosticsPublisher);
    Huddle::Server::Configuration configuration;
    const auto configurationRead = (
        environment.configurationFilePath.empty()
        || ReadConfiguration(
            environment.configurationFilePath,
            configuration,
            configurationDiagnosticsSender
        )
    );
    configurationDiagnosticsUnsubscribeDelegate();
    if (!configurationRead) {
        return EXIT_FAILURE;
    }
    if (environment.portSet) {
        configuration.port = environment.port;
    } else if (configuration.port < 1024) {
        fprintf(stderr, "port must be a number from 1024 to 65535\n");
        PrintUsageInformation();
        return EXIT_FAILURE;
    }
    const auto previousInterruptHandler = signal(SIGINT, InterruptHandler);
    const auto previousTerminateHandler = signal(SIGTERM, InterruptHandler);
    Huddle::Server server;
    const auto diagnosticsUnsubscribeDelegate = server.SubscribeToDiagnostics(diagnosticsPublisher, 2);
    server.SetLastMemberLeftDelegate(
        []{
            printf("The last member has left; the server keeps running (Ctrl+C stops it).\n");
        }
    );
    const auto scheduler = std::make_shared< Timekeeping::Scheduler >();
    scheduler->SetClock(std::make_shared< Huddle::TimeKeeper >());
    const auto serverTransport = std::make_shared< Huddle::NetworkServerTransport >();
    if (!server.Mobilize(serverTransport, scheduler, configuration)) {
        diagnosticsUnsubscribeDelegate();
        (void)signal(SIGTERM, previousTerminateHandler);
        (void)signal(SIGINT, previousInterruptHandler);
        return EXIT_FAILURE;
    }
    while (!shutDown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    printf("Exiting...\n");
    server.Demobilize();
    diagnosticsUnsubscribeDelegate();
    (void)signal(SIGTERM, previousTerminateHandler);
    (void)signal(SIGINT, previousInterruptHandler);
    return EXIT_SUCCESS;
}
