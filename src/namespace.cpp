#include "stage.hpp"
#include "util/log.hpp"

extern "C" {
#include <sched.h>
}

TError UnshareNamespaces(std::unique_ptr<TPrepared> prepared,
                         std::unique_ptr<TUnshared> &result) {
    TStageContext ctx = prepared->Context();
    uint64_t flags = ctx.Config().Namespaces;

    if (flags) {
        TError error = prepared->Kernel().Unshare(flags);
        if (error)
            return TError(EError::NamespaceUnshareFailed, error, "Cannot unshare {}",
                          FormatNamespaces(flags));
        ctx.Unshared = flags;
    } else {
        L_VERBOSE("No namespaces requested");
    }

    result.reset(new TUnshared(ctx));
    return OK;
}

/*
 * New pid namespace is entered by the first child. Parent stays outside,
 * forwards signals and exits with the child status.
 */
TError SpawnPidNamespace(std::unique_ptr<TMapped> mapped,
                         std::unique_ptr<TSpawned> &result) {
    TStageContext ctx = mapped->Context();
    TKernel &kernel = mapped->Kernel();
    TError error;
    pid_t pid;
    int status;

    if (!(ctx.Unshared & CLONE_NEWPID)) {
        result.reset(new TSpawned(ctx));
        return OK;
    }

    error = kernel.Fork(pid);
    if (error)
        return TError(EError::NamespaceUnshareFailed, error, "Cannot enter pid namespace");

    if (!pid) {
        ctx.PidNamespaceInit = true;
        result.reset(new TSpawned(ctx));
        return OK;
    }

    error = kernel.Wait(pid, status);
    if (error) {
        L_ERR("Cannot wait {}: {}", pid, error);
        kernel.Exit(EXIT_SANDBOX_ERROR);
    } else {
        kernel.Exit(ExitStatusCode(status));
    }

    return TError("Waiter of {} must not continue", pid);
}

TError FinalizeNamespaces(std::unique_ptr<TMounted> mounted,
                          std::unique_ptr<TFinalized> &result) {
    TStageContext ctx = mounted->Context();
    auto &hostname = ctx.Config().Hostname;

    if (!hostname.empty()) {
        if (ctx.Unshared & CLONE_NEWUTS) {
            TError error = mounted->Kernel().SetHostName(hostname);
            if (error)
                return TError(EError::HostnameFailed, error, "Cannot set hostname {}", hostname);
        } else {
            L_WRN("Hostname {} ignored without uts namespace", hostname);
        }
    }

    result.reset(new TFinalized(ctx));
    return OK;
}
