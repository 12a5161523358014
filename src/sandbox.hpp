#pragma once

#include <string>
#include <vector>
#include <memory>

#include "common.hpp"
#include "util/path.hpp"
#include "util/string.hpp"

extern "C" {
#include <sys/types.h>
#include <sys/mount.h>
}

namespace cfg {
    class TConfig;
}

#ifndef MS_LAZYTIME
# define MS_LAZYTIME    (1<<25)
#endif

/* inverted flags with lower priority, never passed to mount(2) */
#define MS_ALLOW_WRITE  (1ull << 60)
#define MS_ALLOW_EXEC   (1ull << 61)
#define MS_ALLOW_SUID   (1ull << 62)
#define MS_ALLOW_DEV    (1ull << 63)

#define MS_ALLOW_MASK   (MS_ALLOW_WRITE | MS_ALLOW_EXEC | MS_ALLOW_SUID | MS_ALLOW_DEV)
#define MS_PROPAGATION_MASK (MS_SHARED | MS_PRIVATE | MS_SLAVE | MS_UNBINDABLE)

TError ParseNamespaces(const TTuple &names, uint64_t &clone_flags);
std::string FormatNamespaces(uint64_t clone_flags);

TError ParseMountFlags(const std::string &str, uint64_t &mnt_flags, uint64_t allowed = -1);
std::string FormatMountFlags(uint64_t mnt_flags);

struct TIdMapEntry {
    uint32_t Inside = 0;
    uint32_t Outside = 0;
    uint32_t Count = 0;

    TIdMapEntry() {}
    TIdMapEntry(uint32_t inside, uint32_t outside, uint32_t count) :
        Inside(inside), Outside(outside), Count(count) {}

    uint64_t InsideEnd() const { return (uint64_t)Inside + Count; }
    uint64_t OutsideEnd() const { return (uint64_t)Outside + Count; }

    bool Contains(uint32_t id) const {
        return id >= Inside && id < InsideEnd();
    }

    bool Overlaps(const TIdMapEntry &other) const {
        return Inside < other.InsideEnd() && other.Inside < InsideEnd();
    }

    friend bool operator==(const TIdMapEntry &a, const TIdMapEntry &b) {
        return a.Inside == b.Inside && a.Outside == b.Outside && a.Count == b.Count;
    }
};

typedef std::vector<TIdMapEntry> TIdMap;

bool IdMapContains(const TIdMap &map, uint32_t id);

/* kernel uid_map/gid_map format, one line per entry */
std::string FormatIdMap(const TIdMap &map);

enum class EMountOption {
    Mount,
    Remount,
    Shared,
    Private,
    Slave,
    Unbindable,
    Bind,
    RecursiveBind,
    Relocate,
};

TError ParseMountOption(const std::string &name, EMountOption &option);
std::string MountOptionName(EMountOption option);
uint64_t AllowedMountFlags(EMountOption option);

struct TMountSpec {
    EMountOption Option = EMountOption::Mount;
    TPath Source;
    TPath Target;
    std::string Type;
    uint64_t Flags = 0;
    std::string Data;
    bool MakeTarget = false;

    TMountSpec() {}
    TMountSpec(EMountOption option, const TPath &source, const TPath &target,
               const std::string &type = "", uint64_t flags = 0) :
        Option(option), Source(source), Target(target), Type(type), Flags(flags) {}

    std::string ToString() const;
};

enum class EIdMapHelper {
    Auto,
    Always,
    Never,
};

struct TSandboxConfig {
    uint64_t Namespaces = 0;    /* CLONE_NEW* */

    TPath ChrootDir;
    TPath WorkingDir;
    std::string Hostname;

    bool HasUid = false;
    uid_t Uid = 0;
    bool HasGid = false;
    gid_t Gid = 0;

    TIdMap UidMap;
    TIdMap GidMap;

    std::vector<TMountSpec> Mounts;

    TTuple Command;

    /* applied to "/" recursively after entering mount namespace, 0 - unchanged */
    uint64_t RootPropagation = MS_SLAVE;

    EIdMapHelper IdMapHelper = EIdMapHelper::Auto;

    bool HasNamespace(uint64_t clone_flag) const {
        return (Namespaces & clone_flag) == clone_flag;
    }

    void SetUid(uid_t uid) {
        HasUid = true;
        Uid = uid;
    }

    void SetGid(gid_t gid) {
        HasGid = true;
        Gid = gid;
    }

    TError Load(const cfg::TConfig &cfg);

    /* pure, no kernel calls */
    TError Validate() const;
};

class TValidatedConfig : public TNonCopyable {
public:
    static TError Create(const TSandboxConfig &config,
                         std::unique_ptr<const TValidatedConfig> &result);

    const TSandboxConfig &Get() const {
        return Config;
    }

private:
    explicit TValidatedConfig(const TSandboxConfig &config) : Config(config) {}

    const TSandboxConfig Config;
};
