#pragma once

#include <set>
#include <string>
#include <vector>

#include "kernel.hpp"

namespace test {

/* Thrown by TFakeKernel::Exit, which must never return */
struct TFakeExit {
    int Code;
};

/*
 * Records every call as one line of text and never touches the host.
 * Keeps a tiny mount table: remount and propagation change of not
 * mounted target fail with EINVAL as the kernel does.
 */
class TFakeKernel : public TKernel {
public:
    uid_t Uid = 1000;
    gid_t Gid = 1000;
    pid_t Pid = 4242;

    pid_t ForkPid = 0;      /* 0 - continue as child */
    int WaitStatus = 0;

    std::set<std::string> Executables;
    std::set<std::string> Directories;  /* empty - any chroot works */
    std::set<std::string> Mounted = { "/" };

    std::vector<std::string> Calls;

    void FailOn(const std::string &prefix, int error);

    bool Called(const std::string &prefix) const;

    /* index of the first call with prefix, -1 if none */
    int CallIndex(const std::string &prefix) const;

    std::string Dump() const;

    uid_t GetUid() const override { return Uid; }
    gid_t GetGid() const override { return Gid; }
    pid_t GetPid() const override { return Pid; }

    TError FindExecutable(const std::string &name, TPath &path) const override;

    TError StartHelper(const std::vector<THelperTask> &tasks) override;
    TError FinishHelper() override;

    TError Unshare(uint64_t clone_flags) override;
    TError WriteFile(const TPath &path, const std::string &text) override;

    TError Fork(pid_t &pid) override;
    TError Wait(pid_t pid, int &status) override;
    void Exit(int code) override;

    TError MakeMountPoint(const TPath &source, const TPath &target) override;
    TError Mount(const TPath &source, const TPath &target,
                 const std::string &type, uint64_t mnt_flags,
                 const std::string &data) override;

    TError SetHostName(const std::string &name) override;

    TError Chroot(const TPath &root) override;
    TError Chdir(const TPath &path) override;

    TError SetGid(gid_t gid) override;
    TError SetGroups(const std::vector<gid_t> &groups) override;
    TError SetUid(uid_t uid) override;

    TError Exec(const TTuple &argv) override;

private:
    std::vector<std::pair<std::string, int>> Failures;

    TError Record(const std::string &call);
};

}
