#include "pipeline.hpp"
#include "util/log.hpp"

extern "C" {
#include <stdlib.h>
#include <errno.h>
}

TError RunSandbox(const TValidatedConfig &config, TKernel &kernel, const TTuple &argv) {
    std::unique_ptr<TPrepared> prepared;
    std::unique_ptr<TUnshared> unshared;
    std::unique_ptr<TMapped> mapped;
    std::unique_ptr<TSpawned> spawned;
    std::unique_ptr<TMounted> mounted;
    std::unique_ptr<TFinalized> finalized;
    std::unique_ptr<TRooted> rooted;
    TError error;

    error = PrepareIdMaps(config, kernel, prepared);
    if (error)
        return error;

    error = UnshareNamespaces(std::move(prepared), unshared);
    if (error)
        return error;

    error = WriteIdMaps(std::move(unshared), mapped);
    if (error)
        return error;

    error = SpawnPidNamespace(std::move(mapped), spawned);
    if (error)
        return error;

    error = ApplyMounts(std::move(spawned), mounted);
    if (error)
        return error;

    error = FinalizeNamespaces(std::move(mounted), finalized);
    if (error)
        return error;

    error = EnterRoot(std::move(finalized), rooted);
    if (error)
        return error;

    return LaunchCommand(std::move(rooted), argv);
}

TError RunSandbox(const TSandboxConfig &config, TKernel &kernel, const TTuple &argv) {
    std::unique_ptr<const TValidatedConfig> validated;

    TError error = TValidatedConfig::Create(config, validated);
    if (error)
        return error;

    return RunSandbox(*validated, kernel, argv);
}

TTuple SandboxCommand(const TSandboxConfig &config, const TTuple &args) {
    if (args.size())
        return args;
    if (config.Command.size())
        return config.Command;
    return TTuple({ COCOON_DEFAULT_COMMAND });
}

int SandboxExitCode(const TError &error) {
    if (!error)
        return EXIT_SUCCESS;
    if (error.IsConfigError())
        return EXIT_CONFIG_ERROR;
    if (error == EError::ExecFailed && error.Errno)
        return error.Errno == ENOENT ? EXIT_EXEC_NOT_FOUND : EXIT_EXEC_FAILED;
    return EXIT_SANDBOX_ERROR;
}
