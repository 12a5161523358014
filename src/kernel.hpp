#pragma once

#include <string>
#include <vector>

#include "common.hpp"
#include "util/path.hpp"
#include "util/string.hpp"
#include "util/unix.hpp"

extern "C" {
#include <sys/types.h>
}

/* One step of the id map helper: exec Command, or write Text into File */
struct THelperTask {
    TTuple Command;
    TPath File;
    std::string Text;

    std::string ToString() const;
};

/*
 * Every privileged operation of the sandbox goes through this interface.
 * Errors carry errno and EError::Unknown, stages re-tag them.
 */
class TKernel {
public:
    virtual ~TKernel() {}

    /* effective identity of the caller */
    virtual uid_t GetUid() const = 0;
    virtual gid_t GetGid() const = 0;
    virtual pid_t GetPid() const = 0;

    virtual TError FindExecutable(const std::string &name, TPath &path) const = 0;

    /*
     * Helper process forked before unshare stays in the parent user
     * namespace. It runs tasks one by one after FinishHelper().
     */
    virtual TError StartHelper(const std::vector<THelperTask> &tasks) = 0;
    virtual TError FinishHelper() = 0;

    virtual TError Unshare(uint64_t clone_flags) = 0;
    virtual TError WriteFile(const TPath &path, const std::string &text) = 0;

    /* pid 0 in child */
    virtual TError Fork(pid_t &pid) = 0;
    /* forwards termination signals to pid while waiting */
    virtual TError Wait(pid_t pid, int &status) = 0;
    virtual void Exit(int code) = 0;

    virtual TError MakeMountPoint(const TPath &source, const TPath &target) = 0;
    virtual TError Mount(const TPath &source, const TPath &target,
                         const std::string &type, uint64_t mnt_flags,
                         const std::string &data) = 0;

    virtual TError SetHostName(const std::string &name) = 0;

    virtual TError Chroot(const TPath &root) = 0;
    virtual TError Chdir(const TPath &path) = 0;

    virtual TError SetGid(gid_t gid) = 0;
    virtual TError SetGroups(const std::vector<gid_t> &groups) = 0;
    virtual TError SetUid(uid_t uid) = 0;

    /* returns only on failure or when process image is not replaced */
    virtual TError Exec(const TTuple &argv) = 0;
};

class THostKernel : public TKernel {
    pid_t HelperPid = 0;
    TUnixSocket HelperSock;

public:
    THostKernel() {}
    ~THostKernel();

    uid_t GetUid() const override;
    gid_t GetGid() const override;
    pid_t GetPid() const override;

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
};

/* Logs planned actions, changes nothing. Queries go to the host. */
class TDryRunKernel : public THostKernel {
public:
    TError StartHelper(const std::vector<THelperTask> &tasks) override;
    TError FinishHelper() override;

    TError Unshare(uint64_t clone_flags) override;
    TError WriteFile(const TPath &path, const std::string &text) override;

    TError Fork(pid_t &pid) override;

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
};
