#include "idmap.hpp"
#include "util/log.hpp"

extern "C" {
#include <sched.h>
}

bool IsSelfMap(const TIdMap &map, uint32_t id) {
    return map.empty() ||
        (map.size() == 1 && map[0].Outside == id && map[0].Count == 1);
}

TTuple IdMapHelperCommand(const TPath &binary, pid_t pid, const TIdMap &map) {
    TTuple cmd = { binary.ToString(), std::to_string(pid) };
    for (auto &entry: map) {
        cmd.push_back(std::to_string(entry.Inside));
        cmd.push_back(std::to_string(entry.Outside));
        cmd.push_back(std::to_string(entry.Count));
    }
    return cmd;
}

static std::string DescribeIdMap(const TIdMap &map) {
    TTuple lines = SplitString(StringTrim(FormatIdMap(map)), '\n');
    return MergeEscapeStrings(lines, ',');
}

/*
 * Process inside new user namespace has no capabilities in the parent one,
 * so only its own single id could be mapped by direct write, and gid_map
 * only after setgroups "deny". Anything else is written by helper forked
 * before unshare: privileged caller writes maps itself, unprivileged runs
 * setuid newuidmap/newgidmap.
 */
TError PrepareIdMaps(const TValidatedConfig &config, TKernel &kernel,
                     std::unique_ptr<TPrepared> &result) {
    TStageContext ctx(config, kernel);
    auto &cfg = ctx.Config();
    TError error;

    if (cfg.HasNamespace(CLONE_NEWUSER) && (cfg.UidMap.size() || cfg.GidMap.size())) {
        bool privileged = !kernel.GetUid();
        bool needHelper = !IsSelfMap(cfg.UidMap, kernel.GetUid()) ||
                          !IsSelfMap(cfg.GidMap, kernel.GetGid());
        bool useHelper = cfg.IdMapHelper == EIdMapHelper::Always ||
            (cfg.IdMapHelper == EIdMapHelper::Auto && needHelper);
        std::vector<THelperTask> tasks;

        if (useHelper) {
            std::vector<std::pair<std::string, const TIdMap *>> maps = {
                { "uid_map", &cfg.UidMap },
                { "gid_map", &cfg.GidMap },
            };

            for (auto &it: maps) {
                THelperTask task;

                if (it.second->empty())
                    continue;

                if (privileged) {
                    task.File = TPath("/proc") / std::to_string(kernel.GetPid()) / it.first;
                    task.Text = FormatIdMap(*it.second);
                    tasks.push_back(task);
                    continue;
                }

                const char *name = it.second == &cfg.UidMap ? NEWUIDMAP_BINARY : NEWGIDMAP_BINARY;
                TPath binary;

                error = kernel.FindExecutable(name, binary);
                if (error) {
                    if (cfg.IdMapHelper == EIdMapHelper::Always)
                        return TError(EError::IdMapRejected, error, "id map helper required");
                    L_WRN("{} not found, writing id maps directly", name);
                    useHelper = false;
                    break;
                }

                task.Command = IdMapHelperCommand(binary, kernel.GetPid(), *it.second);
                tasks.push_back(task);
            }
        }

        if (useHelper) {
            error = kernel.StartHelper(tasks);
            if (error)
                return TError(EError::IdMapRejected, error, "Cannot start id map helper");
        }

        ctx.IdMap.UseHelper = useHelper;
        ctx.IdMap.DenySetgroups = !useHelper && cfg.GidMap.size();

        L_VERBOSE("id maps by {}", useHelper ? "helper" : "direct write");
    }

    result.reset(new TPrepared(ctx));
    return OK;
}

TError WriteIdMaps(std::unique_ptr<TUnshared> unshared,
                   std::unique_ptr<TMapped> &result) {
    TStageContext ctx = unshared->Context();
    TKernel &kernel = unshared->Kernel();
    auto &cfg = ctx.Config();
    TError error;

    if (!(ctx.Unshared & CLONE_NEWUSER)) {
        if (cfg.UidMap.size() || cfg.GidMap.size())
            L_WRN("uid_map and gid_map are ignored without user namespace");
        ctx.SetgroupsAllowed = !kernel.GetUid();
        result.reset(new TMapped(ctx));
        return OK;
    }

    if (ctx.IdMap.UseHelper) {
        error = kernel.FinishHelper();
        if (error)
            return TError(EError::IdMapRejected, error, "uid_map [{}] gid_map [{}]",
                          DescribeIdMap(cfg.UidMap), DescribeIdMap(cfg.GidMap));
    } else {
        if (ctx.IdMap.DenySetgroups) {
            error = kernel.WriteFile("/proc/self/setgroups", "deny");
            if (error)
                return TError(EError::IdMapRejected, error, "setgroups deny");
            ctx.SetgroupsDenied = true;
        }

        if (cfg.UidMap.size()) {
            error = kernel.WriteFile("/proc/self/uid_map", FormatIdMap(cfg.UidMap));
            if (error)
                return TError(EError::IdMapRejected, error, "uid_map [{}]",
                              DescribeIdMap(cfg.UidMap));
        }

        if (cfg.GidMap.size()) {
            error = kernel.WriteFile("/proc/self/gid_map", FormatIdMap(cfg.GidMap));
            if (error)
                return TError(EError::IdMapRejected, error, "gid_map [{}]",
                              DescribeIdMap(cfg.GidMap));
        }
    }

    /* inside user namespace setgroups needs written gid_map and no "deny" */
    ctx.SetgroupsAllowed = cfg.GidMap.size() && !ctx.SetgroupsDenied;

    result.reset(new TMapped(ctx));
    return OK;
}
