#pragma once

#include <memory>

#include "common.hpp"
#include "sandbox.hpp"
#include "kernel.hpp"

struct TIdMapPlan {
    bool UseHelper = false;
    bool DenySetgroups = false;
};

/* State carried from stage to stage, config is read only */
struct TStageContext {
    const TValidatedConfig *Validated = nullptr;
    TKernel *Kernel = nullptr;

    TIdMapPlan IdMap;
    uint64_t Unshared = 0;          /* CLONE_NEW* actually unshared */
    bool SetgroupsDenied = false;
    bool SetgroupsAllowed = false;  /* setgroups(2) would be permitted */
    bool PidNamespaceInit = false;  /* we are pid 1 of new pid namespace */

    TStageContext(const TValidatedConfig &config, TKernel &kernel) :
        Validated(&config), Kernel(&kernel) {}

    const TSandboxConfig &Config() const {
        return Validated->Get();
    }
};

/*
 * Each stage token could be created only by the stage producing it,
 * so stages cannot be reordered or skipped.
 */
class TStageToken : public TNonCopyable {
public:
    const TStageContext &Context() const {
        return Ctx;
    }

    TKernel &Kernel() const {
        return *Ctx.Kernel;
    }

    const TSandboxConfig &Config() const {
        return Ctx.Config();
    }

protected:
    explicit TStageToken(const TStageContext &ctx) : Ctx(ctx) {}

    TStageContext Ctx;
};

class TPrepared;
class TUnshared;
class TMapped;
class TSpawned;
class TMounted;
class TFinalized;
class TRooted;

TError PrepareIdMaps(const TValidatedConfig &config, TKernel &kernel,
                     std::unique_ptr<TPrepared> &result);
TError UnshareNamespaces(std::unique_ptr<TPrepared> prepared,
                         std::unique_ptr<TUnshared> &result);
TError WriteIdMaps(std::unique_ptr<TUnshared> unshared,
                   std::unique_ptr<TMapped> &result);
TError SpawnPidNamespace(std::unique_ptr<TMapped> mapped,
                         std::unique_ptr<TSpawned> &result);
TError ApplyMounts(std::unique_ptr<TSpawned> spawned,
                   std::unique_ptr<TMounted> &result);
TError FinalizeNamespaces(std::unique_ptr<TMounted> mounted,
                          std::unique_ptr<TFinalized> &result);
TError EnterRoot(std::unique_ptr<TFinalized> finalized,
                 std::unique_ptr<TRooted> &result);
TError LaunchCommand(std::unique_ptr<TRooted> rooted, const TTuple &argv);

class TPrepared : public TStageToken {
    explicit TPrepared(const TStageContext &ctx) : TStageToken(ctx) {}
    friend TError PrepareIdMaps(const TValidatedConfig &, TKernel &,
                                std::unique_ptr<TPrepared> &);
};

class TUnshared : public TStageToken {
    explicit TUnshared(const TStageContext &ctx) : TStageToken(ctx) {}
    friend TError UnshareNamespaces(std::unique_ptr<TPrepared>,
                                    std::unique_ptr<TUnshared> &);
};

class TMapped : public TStageToken {
    explicit TMapped(const TStageContext &ctx) : TStageToken(ctx) {}
    friend TError WriteIdMaps(std::unique_ptr<TUnshared>,
                              std::unique_ptr<TMapped> &);
};

class TSpawned : public TStageToken {
    explicit TSpawned(const TStageContext &ctx) : TStageToken(ctx) {}
    friend TError SpawnPidNamespace(std::unique_ptr<TMapped>,
                                    std::unique_ptr<TSpawned> &);
};

class TMounted : public TStageToken {
    explicit TMounted(const TStageContext &ctx) : TStageToken(ctx) {}
    friend TError ApplyMounts(std::unique_ptr<TSpawned>,
                              std::unique_ptr<TMounted> &);
};

class TFinalized : public TStageToken {
    explicit TFinalized(const TStageContext &ctx) : TStageToken(ctx) {}
    friend TError FinalizeNamespaces(std::unique_ptr<TMounted>,
                                     std::unique_ptr<TFinalized> &);
};

class TRooted : public TStageToken {
    explicit TRooted(const TStageContext &ctx) : TStageToken(ctx) {}
    friend TError EnterRoot(std::unique_ptr<TFinalized>,
                            std::unique_ptr<TRooted> &);
};
