#include <sstream>

#include "sandbox.hpp"
#include "config.pb.h"

extern "C" {
#include <sched.h>
}

static const TFlagsNames NamespaceFlags = {
    { CLONE_NEWUSER,    "user" },
    { CLONE_NEWNS,      "mount" },
    { CLONE_NEWPID,     "pid" },
    { CLONE_NEWUTS,     "uts" },
    { CLONE_NEWIPC,     "ipc" },
    { CLONE_NEWNET,     "net" },
    { CLONE_NEWCGROUP,  "cgroup" },
};

TError ParseNamespaces(const TTuple &names, uint64_t &clone_flags) {
    clone_flags = 0;
    for (auto &name: names) {
        uint64_t flag;
        TError error = StringParseFlags(name, NamespaceFlags, flag);
        if (error || !flag)
            return TError(EError::InvalidConfig, "Unknown namespace \"{}\"", name);
        clone_flags |= flag;
    }
    return OK;
}

std::string FormatNamespaces(uint64_t clone_flags) {
    return StringFormatFlags(clone_flags, NamespaceFlags);
}

static const TFlagsNames MountFlags = {
    { MS_ALLOW_WRITE,   "rw" },
    { MS_RDONLY,        "ro" },
    { MS_ALLOW_SUID,    "suid" },
    { MS_NOSUID,        "nosuid" },
    { MS_ALLOW_DEV,     "dev" },
    { MS_NODEV,         "nodev" },
    { MS_ALLOW_EXEC,    "exec" },
    { MS_NOEXEC,        "noexec" },
    { MS_SYNCHRONOUS,   "sync" },
    { MS_REMOUNT,       "remount" },
    { MS_MANDLOCK,      "mand" },
    { MS_DIRSYNC,       "dirsync" },
    { MS_NOATIME,       "noatime" },
    { MS_NODIRATIME,    "nodiratime" },
    { MS_BIND,          "bind" },
    { MS_MOVE,          "move" },
    { MS_REC,           "rec" },
    { MS_SILENT,        "silent" },
    { MS_POSIXACL,      "acl" },
    { MS_UNBINDABLE,    "unbindable" },
    { MS_PRIVATE,       "private" },
    { MS_SLAVE,         "slave" },
    { MS_SHARED,        "shared" },
    { MS_RELATIME,      "relatime" },
    { MS_I_VERSION,     "iversion" },
    { MS_STRICTATIME,   "strictatime" },
    { MS_LAZYTIME,      "lazytime" },
};

TError ParseMountFlags(const std::string &str, uint64_t &mnt_flags, uint64_t allowed) {
    TError error = StringParseFlags(str, MountFlags, mnt_flags);
    if (error)
        return error;
    if (mnt_flags & ~allowed)
        return TError(EError::InvalidValue, "Not allowed flags {}", FormatMountFlags(mnt_flags & ~allowed));
    return OK;
}

std::string FormatMountFlags(uint64_t mnt_flags) {
    return StringFormatFlags(mnt_flags, MountFlags);
}

bool IdMapContains(const TIdMap &map, uint32_t id) {
    for (auto &entry: map)
        if (entry.Contains(id))
            return true;
    return false;
}

std::string FormatIdMap(const TIdMap &map) {
    std::string text;
    for (auto &entry: map)
        text += fmt::format("{} {} {}\n", entry.Inside, entry.Outside, entry.Count);
    return text;
}

static const std::vector<std::pair<EMountOption, std::string>> MountOptionNames = {
    { EMountOption::Mount,          "mount" },
    { EMountOption::Remount,        "remount" },
    { EMountOption::Shared,         "shared" },
    { EMountOption::Private,        "private" },
    { EMountOption::Slave,          "slave" },
    { EMountOption::Unbindable,     "unbindable" },
    { EMountOption::Bind,           "bind" },
    { EMountOption::RecursiveBind,  "recursive_bind" },
    { EMountOption::Relocate,       "relocate" },
};

TError ParseMountOption(const std::string &name, EMountOption &option) {
    for (auto &it: MountOptionNames) {
        if (it.second == name) {
            option = it.first;
            return OK;
        }
    }
    return TError(EError::InvalidConfig, "Unknown mount option \"{}\"", name);
}

std::string MountOptionName(EMountOption option) {
    for (auto &it: MountOptionNames)
        if (it.first == option)
            return it.second;
    return "unknown";
}

static constexpr uint64_t FS_MOUNT_FLAGS =
    MS_RDONLY | MS_ALLOW_WRITE | MS_NOSUID | MS_ALLOW_SUID |
    MS_NODEV | MS_ALLOW_DEV | MS_NOEXEC | MS_ALLOW_EXEC |
    MS_SYNCHRONOUS | MS_MANDLOCK | MS_DIRSYNC | MS_NOATIME | MS_NODIRATIME |
    MS_RELATIME | MS_STRICTATIME | MS_LAZYTIME | MS_I_VERSION | MS_POSIXACL |
    MS_SILENT;

uint64_t AllowedMountFlags(EMountOption option) {
    switch (option) {
    case EMountOption::Mount:
    case EMountOption::Bind:
    case EMountOption::RecursiveBind:
        return FS_MOUNT_FLAGS | MS_PROPAGATION_MASK | MS_REC;
    case EMountOption::Remount:
        return FS_MOUNT_FLAGS | MS_BIND;
    case EMountOption::Shared:
    case EMountOption::Private:
    case EMountOption::Slave:
    case EMountOption::Unbindable:
        return MS_REC | MS_SILENT;
    case EMountOption::Relocate:
        return 0;
    }
    return 0;
}

std::string TMountSpec::ToString() const {
    std::stringstream ss;

    ss << MountOptionName(Option);
    if (Source)
        ss << " " << Source;
    ss << " " << Target;
    if (!Type.empty())
        ss << " -t " << Type;
    if (Flags)
        ss << " " << FormatMountFlags(Flags);
    if (!Data.empty())
        ss << " -o " << Data;

    return ss.str();
}

static void LoadIdMap(const google::protobuf::RepeatedPtrField<cfg::TConfig_TIdMapEntry> &cfg,
                      TIdMap &map) {
    map.clear();
    for (auto &entry: cfg)
        map.emplace_back(entry.inside(), entry.outside(), entry.count());
}

TError TSandboxConfig::Load(const cfg::TConfig &cfg) {
    TError error;

    error = ParseNamespaces(TTuple(cfg.namespaces().begin(), cfg.namespaces().end()), Namespaces);
    if (error)
        return error;

    if (cfg.has_chroot_dir())
        ChrootDir = cfg.chroot_dir();
    if (cfg.has_working_dir())
        WorkingDir = cfg.working_dir();
    if (cfg.has_hostname())
        Hostname = cfg.hostname();

    if (cfg.has_uid())
        SetUid(cfg.uid());
    if (cfg.has_gid())
        SetGid(cfg.gid());

    LoadIdMap(cfg.uid_map(), UidMap);
    LoadIdMap(cfg.gid_map(), GidMap);

    Mounts.clear();
    for (auto &mnt: cfg.mount()) {
        TMountSpec spec;

        error = ParseMountOption(mnt.option(), spec.Option);
        if (error)
            return TError(error, "mount #{}", Mounts.size());

        spec.Source = mnt.source();
        spec.Target = mnt.target();
        spec.Type = mnt.filesystem_type();
        spec.Data = mnt.data();
        spec.MakeTarget = mnt.make_target();

        error = ParseMountFlags(mnt.flags(), spec.Flags);
        if (error)
            return TError(error, "mount #{} {}", Mounts.size(), mnt.target());

        Mounts.push_back(spec);
    }

    Command = TTuple(cfg.command().begin(), cfg.command().end());

    if (cfg.has_root_propagation()) {
        auto &prop = cfg.root_propagation();
        if (prop == "slave")
            RootPropagation = MS_SLAVE;
        else if (prop == "private")
            RootPropagation = MS_PRIVATE;
        else if (prop == "unchanged")
            RootPropagation = 0;
        else
            return TError(EError::InvalidConfig, "Unknown root_propagation \"{}\"", prop);
    }

    if (cfg.has_id_map_helper()) {
        auto &helper = cfg.id_map_helper();
        if (helper == "auto")
            IdMapHelper = EIdMapHelper::Auto;
        else if (helper == "always")
            IdMapHelper = EIdMapHelper::Always;
        else if (helper == "never")
            IdMapHelper = EIdMapHelper::Never;
        else
            return TError(EError::InvalidConfig, "Unknown id_map_helper \"{}\"", helper);
    }

    return OK;
}

static TError ValidateIdMap(const std::string &name, const TIdMap &map) {
    for (unsigned i = 0; i < map.size(); i++) {
        auto &entry = map[i];

        if (!entry.Count || entry.InsideEnd() > ID_SPACE_SIZE ||
                entry.OutsideEnd() > ID_SPACE_SIZE)
            return TError(EError::InvalidIdRange, "{} entry #{} {} {} {}",
                          name, i, entry.Inside, entry.Outside, entry.Count);

        for (unsigned j = 0; j < i; j++) {
            if (entry.Overlaps(map[j]))
                return TError(EError::OverlappingIdRange,
                              "{} entry #{} {} {} {} overlaps #{} {} {} {}",
                              name, i, entry.Inside, entry.Outside, entry.Count,
                              j, map[j].Inside, map[j].Outside, map[j].Count);
        }
    }
    return OK;
}

static TError ValidateMount(unsigned index, const TMountSpec &spec) {
    if (spec.Target.IsEmpty())
        return TError(EError::EmptyMountTarget, "mount #{} {}", index, MountOptionName(spec.Option));

    switch (spec.Option) {
    case EMountOption::Mount:
        if (spec.Type.empty())
            return TError(EError::InvalidValue, "mount #{} {}: filesystem_type required",
                          index, spec.Target);
        break;
    case EMountOption::Bind:
    case EMountOption::RecursiveBind:
    case EMountOption::Relocate:
        if (spec.Source.IsEmpty())
            return TError(EError::InvalidValue, "mount #{} {}: source required for {}",
                          index, spec.Target, MountOptionName(spec.Option));
        break;
    default:
        break;
    }

    uint64_t denied = spec.Flags & ~AllowedMountFlags(spec.Option);
    if (denied)
        return TError(EError::InvalidValue, "mount #{} {}: flags {} not allowed for {}",
                      index, spec.Target, FormatMountFlags(denied),
                      MountOptionName(spec.Option));

    return OK;
}

TError TSandboxConfig::Validate() const {
    TError error;

    error = ValidateIdMap("uid_map", UidMap);
    if (error)
        return error;

    error = ValidateIdMap("gid_map", GidMap);
    if (error)
        return error;

    if (ChrootDir && WorkingDir && !WorkingDir.IsAbsolute())
        return TError(EError::RelativeWorkingDirWithChroot,
                      "working_dir {} must be absolute with chroot_dir {}",
                      WorkingDir, ChrootDir);

    for (unsigned i = 0; i < Mounts.size(); i++) {
        error = ValidateMount(i, Mounts[i]);
        if (error)
            return error;
    }

    if (!Mounts.empty() && !HasNamespace(CLONE_NEWNS))
        return TError(EError::MountNamespaceRequired,
                      "{} mounts configured without mount namespace", Mounts.size());

    if (HasNamespace(CLONE_NEWUSER) &&
            (!Mounts.empty() || !Hostname.empty() || ChrootDir) &&
            !IdMapContains(UidMap, 0))
        return TError(EError::MissingRootMapping,
                      "uid_map must map inside uid 0 for mounts, hostname or chroot");

    if (HasNamespace(CLONE_NEWUSER)) {
        if (HasUid && !IdMapContains(UidMap, Uid))
            return TError(EError::UnmappedIdentity, "uid {} is not in uid_map", Uid);
        if (HasGid && !IdMapContains(GidMap, Gid))
            return TError(EError::UnmappedIdentity, "gid {} is not in gid_map", Gid);
    }

    return OK;
}

TError TValidatedConfig::Create(const TSandboxConfig &config,
                                std::unique_ptr<const TValidatedConfig> &result) {
    TError error = config.Validate();
    if (error)
        return error;
    result.reset(new TValidatedConfig(config));
    return OK;
}
