#include <iostream>
#include <memory>

#include "version.hpp"
#include "config.hpp"
#include "sandbox.hpp"
#include "kernel.hpp"
#include "pipeline.hpp"
#include "util/log.hpp"

extern "C" {
#include <stdlib.h>
}

static void Usage() {
    std::cout
        << std::endl
        << "Usage: cocoon [options...] [--] [command [arguments...]]" << std::endl
        << std::endl
        << "Option: " << std::endl
        << "  -h | --help          print this message" << std::endl
        << "  -V | --version       print version" << std::endl
        << "  -c | --config PATH   read configuration from PATH" << std::endl
        << "  -n | --dry-run       log planned actions, change nothing" << std::endl
        << "  --check              validate configuration and exit" << std::endl
        << "  -v | --verbose       verbose logging" << std::endl
        << "  -d | --debug         debug logging" << std::endl
        << "  --log PATH           write log into PATH instead of stderr" << std::endl
        << std::endl
        << "Without command runs configured one or " << COCOON_DEFAULT_COMMAND << std::endl
        << std::endl;
}

int main(int argc, char **argv) {
    TPath configPath, logPath;
    bool dryRun = false;
    bool checkOnly = false;
    TError error;
    int opt = 0;

    while (++opt < argc && argv[opt][0] == '-') {
        std::string arg(argv[opt]);

        if (arg == "--") {
            opt++;
            break;
        }

        if (arg == "-V" || arg == "--version") {
            std::cout << "cocoon " << COCOON_VERSION << std::endl;
            return EXIT_SUCCESS;
        }

        if (arg == "-h" || arg == "--help") {
            Usage();
            return EXIT_SUCCESS;
        }

        if (arg == "-c" || arg == "--config" || arg == "--log") {
            if (opt + 1 >= argc) {
                std::cerr << "Option " << arg << " requires argument" << std::endl;
                return EXIT_CONFIG_ERROR;
            }
            if (arg == "--log")
                logPath = argv[++opt];
            else
                configPath = argv[++opt];
        } else if (arg == "-n" || arg == "--dry-run")
            dryRun = true;
        else if (arg == "--check")
            checkOnly = true;
        else if (arg == "-v" || arg == "--verbose")
            Verbose = true;
        else if (arg == "-d" || arg == "--debug")
            Verbose = Debug = true;
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            Usage();
            return EXIT_CONFIG_ERROR;
        }
    }

    TTuple args;
    for (; opt < argc; opt++)
        args.push_back(argv[opt]);

    OpenLog();

    if (configPath) {
        error = ReadConfig(configPath);
    } else {
        error = ReadConfigs(configPath);
    }
    if (error) {
        L_ERR("{}", error);
        return EXIT_CONFIG_ERROR;
    }

    if (!logPath && config().log().has_path())
        logPath = config().log().path();

    if (logPath) {
        error = OpenLog(logPath);
        if (error) {
            L_ERR("{}", error);
            return EXIT_CONFIG_ERROR;
        }
    }

    TSandboxConfig sandbox;

    error = sandbox.Load(config());
    if (error) {
        L_ERR("Invalid config {}: {}", configPath, error);
        return SandboxExitCode(error);
    }

    std::unique_ptr<const TValidatedConfig> validated;

    error = TValidatedConfig::Create(sandbox, validated);
    if (error) {
        L_ERR("Invalid config {}: {}", configPath, error);
        return SandboxExitCode(error);
    }

    if (checkOnly) {
        std::cout << "ok" << std::endl;
        return EXIT_SUCCESS;
    }

    TTuple command = SandboxCommand(sandbox, args);

    std::unique_ptr<TKernel> kernel;
    if (dryRun)
        kernel = std::unique_ptr<TKernel>(new TDryRunKernel());
    else
        kernel = std::unique_ptr<TKernel>(new THostKernel());

    L_VERBOSE("Start {} namespaces {} mounts {}",
              MergeEscapeStrings(command, ' '),
              FormatNamespaces(sandbox.Namespaces), sandbox.Mounts.size());

    error = RunSandbox(*validated, *kernel, command);
    if (error) {
        L_ERR("{}", error);
        return SandboxExitCode(error);
    }

    L_VERBOSE("Dry run complete");
    return EXIT_SUCCESS;
}
