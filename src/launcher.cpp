#include "stage.hpp"
#include "util/log.hpp"

TError LaunchCommand(std::unique_ptr<TRooted> rooted, const TTuple &argv) {
    const TStageContext &ctx = rooted->Context();
    TKernel &kernel = rooted->Kernel();
    auto &cfg = ctx.Config();
    TError error;

    if (argv.empty())
        return TError(EError::ExecFailed, "Empty command");

    if (cfg.HasGid) {
        error = kernel.SetGid(cfg.Gid);
        if (error)
            return TError(EError::PrivilegeDropFailed, error, "Cannot set gid {}", cfg.Gid);
    }

    if ((cfg.HasUid || cfg.HasGid) && ctx.SetgroupsAllowed) {
        std::vector<gid_t> groups;
        if (cfg.HasGid)
            groups.push_back(cfg.Gid);
        error = kernel.SetGroups(groups);
        if (error)
            return TError(EError::PrivilegeDropFailed, error, "Cannot set groups");
    } else if (cfg.HasUid || cfg.HasGid) {
        L_VERBOSE("Supplementary groups are kept");
    }

    if (cfg.HasUid) {
        error = kernel.SetUid(cfg.Uid);
        if (error)
            return TError(EError::PrivilegeDropFailed, error, "Cannot set uid {}", cfg.Uid);
    }

    L("Execute {}", MergeEscapeStrings(argv, ' '));

    error = kernel.Exec(argv);
    if (error)
        return TError(EError::ExecFailed, error, "Cannot execute {}", argv[0]);

    return OK;
}
