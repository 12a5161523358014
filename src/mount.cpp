#include "mount.hpp"
#include "util/log.hpp"

extern "C" {
#include <sched.h>
#include <sys/mount.h>
}

static const std::vector<uint64_t> PropagationOrder = {
    MS_PRIVATE, MS_SLAVE, MS_SHARED, MS_UNBINDABLE,
};

std::string TMountAction::ToString() const {
    switch (Action) {
    case EMountAction::MakeTarget:
        return fmt::format("create {}", Target);
    case EMountAction::Mount:
        return fmt::format("mount {} {} -t {} {}", Source, Target, Type, FormatMountFlags(Flags));
    case EMountAction::Bind:
        return fmt::format("bind {} {} {}", Source, Target, FormatMountFlags(Flags));
    case EMountAction::Remount:
        return fmt::format("remount {} {}", Target, FormatMountFlags(Flags));
    case EMountAction::Propagate:
        return fmt::format("propagation {} {}", Target, FormatMountFlags(Flags));
    case EMountAction::Move:
        return fmt::format("move {} {}", Source, Target);
    }
    return "unknown";
}

static void PlanPropagation(std::vector<TMountAction> &actions,
                            const TPath &target, uint64_t flags, uint64_t rec) {
    for (auto prop: PropagationOrder) {
        if (flags & prop)
            actions.emplace_back(EMountAction::Propagate, "", target, "", prop | rec);
    }
}

std::vector<TMountAction> PlanMount(const TMountSpec &spec) {
    std::vector<TMountAction> actions;
    uint64_t prop = spec.Flags & MS_PROPAGATION_MASK;
    uint64_t rec = spec.Flags & MS_REC;
    uint64_t fs = spec.Flags & ~(uint64_t)(MS_PROPAGATION_MASK | MS_REC | MS_BIND);

    switch (spec.Option) {
    case EMountOption::Mount:
        if (spec.MakeTarget)
            actions.emplace_back(EMountAction::MakeTarget, spec.Source, spec.Target);
        actions.emplace_back(EMountAction::Mount, spec.Source, spec.Target,
                             spec.Type, fs, spec.Data);
        PlanPropagation(actions, spec.Target, prop, rec);
        break;

    case EMountOption::Remount:
        actions.emplace_back(EMountAction::Remount, "", spec.Target, "",
                             MS_REMOUNT | (spec.Flags & MS_BIND) | fs, spec.Data);
        break;

    case EMountOption::Bind:
    case EMountOption::RecursiveBind:
        if (spec.Option == EMountOption::RecursiveBind)
            rec = MS_REC;
        if (spec.MakeTarget)
            actions.emplace_back(EMountAction::MakeTarget, spec.Source, spec.Target);
        actions.emplace_back(EMountAction::Bind, spec.Source, spec.Target, "", MS_BIND | rec);
        /* bind ignores flags, vfsmount remount isn't recursive */
        if (fs & ~(uint64_t)MS_SILENT)
            actions.emplace_back(EMountAction::Remount, "", spec.Target, "",
                                 MS_REMOUNT | MS_BIND | fs);
        PlanPropagation(actions, spec.Target, prop, rec);
        break;

    case EMountOption::Shared:
        actions.emplace_back(EMountAction::Propagate, "", spec.Target, "", MS_SHARED | rec);
        break;
    case EMountOption::Private:
        actions.emplace_back(EMountAction::Propagate, "", spec.Target, "", MS_PRIVATE | rec);
        break;
    case EMountOption::Slave:
        actions.emplace_back(EMountAction::Propagate, "", spec.Target, "", MS_SLAVE | rec);
        break;
    case EMountOption::Unbindable:
        actions.emplace_back(EMountAction::Propagate, "", spec.Target, "", MS_UNBINDABLE | rec);
        break;

    case EMountOption::Relocate:
        if (spec.MakeTarget)
            actions.emplace_back(EMountAction::MakeTarget, spec.Source, spec.Target);
        actions.emplace_back(EMountAction::Move, spec.Source, spec.Target, "", MS_MOVE);
        break;
    }

    return actions;
}

TError ApplyMountAction(TKernel &kernel, const TMountAction &action) {
    switch (action.Action) {
    case EMountAction::MakeTarget:
        return kernel.MakeMountPoint(action.Source, action.Target);
    case EMountAction::Mount:
        return kernel.Mount(action.Source, action.Target, action.Type,
                            action.Flags, action.Data);
    case EMountAction::Bind:
    case EMountAction::Move:
        return kernel.Mount(action.Source, action.Target, "", action.Flags, "");
    case EMountAction::Remount:
        return kernel.Mount("", action.Target, "", action.Flags, action.Data);
    case EMountAction::Propagate:
        return kernel.Mount("", action.Target, "", action.Flags, "");
    }
    return TError("Unknown mount action");
}

TError ApplyMounts(std::unique_ptr<TSpawned> spawned,
                   std::unique_ptr<TMounted> &result) {
    TStageContext ctx = spawned->Context();
    TKernel &kernel = spawned->Kernel();
    auto &cfg = ctx.Config();
    TError error;

    if (!(ctx.Unshared & CLONE_NEWNS)) {
        if (cfg.Mounts.size())
            return TError(EError::MountNamespaceRequired,
                          "Refuse to mount without mount namespace");
        result.reset(new TMounted(ctx));
        return OK;
    }

    if (cfg.RootPropagation) {
        error = kernel.Mount("", "/", "", cfg.RootPropagation | MS_REC, "");
        if (error)
            return TError(EError::MountFailed, error, "Cannot remount / {}",
                          FormatMountFlags(cfg.RootPropagation | MS_REC));
    }

    for (unsigned index = 0; index < cfg.Mounts.size(); index++) {
        auto &spec = cfg.Mounts[index];

        L_VERBOSE("Mount #{} {}", index, spec.ToString());

        for (auto &action: PlanMount(spec)) {
            error = ApplyMountAction(kernel, action);
            if (error)
                return TError(EError::MountFailed, error, "mount #{} {} at {}",
                              index, spec.Target, action.ToString());
        }
    }

    result.reset(new TMounted(ctx));
    return OK;
}
