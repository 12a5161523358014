#include "kernel.hpp"
#include "sandbox.hpp"
#include "util/log.hpp"
#include "util/signal.hpp"

extern "C" {
#include <unistd.h>
#include <sched.h>
#include <grp.h>
#include <errno.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <sys/mount.h>
#include <sys/statvfs.h>
#include <sys/statfs.h>
}

THostKernel::~THostKernel() {
    if (HelperPid) {
        HelperSock.Close();
        (void)waitpid(HelperPid, nullptr, 0);
    }
}

uid_t THostKernel::GetUid() const {
    return geteuid();
}

gid_t THostKernel::GetGid() const {
    return getegid();
}

pid_t THostKernel::GetPid() const {
    return ::GetPid();
}

TError THostKernel::FindExecutable(const std::string &name, TPath &path) const {
    if (name.find('/') != std::string::npos) {
        path = name;
        if (path.IsRegularFollow() && !access(path.c_str(), X_OK))
            return OK;
        return TError(EError::Unknown, ENOENT, "Executable {} not found", name);
    }

    const char *env = getenv("PATH");
    for (auto &dir: SplitString(env ? env : COCOON_DEFAULT_PATH, ':')) {
        if (dir.empty())
            continue;
        path = TPath(dir) / name;
        if (path.IsRegularFollow() && !access(path.c_str(), X_OK))
            return OK;
    }

    path = TPath();
    return TError(EError::Unknown, ENOENT, "Executable {} not found in PATH", name);
}

std::string THelperTask::ToString() const {
    if (Command.size())
        return MergeEscapeStrings(Command, ' ');
    return fmt::format("write {} {}", File, StringTrim(Text));
}

static int RunHelperTask(const THelperTask &task) {
    if (task.Command.empty()) {
        TError error;
        TFile file;

        error = file.OpenWrite(task.File);
        if (!error && write(file.Fd, task.Text.c_str(), task.Text.size()) != (ssize_t)task.Text.size())
            error = TError::System("write {}", task.File);
        if (error) {
            L_WRN("{}: {}", task.ToString(), error);
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    pid_t pid = fork();
    if (pid < 0)
        return EXIT_FAILURE;

    if (!pid) {
        std::vector<const char *> argv;
        for (auto &arg: task.Command)
            argv.push_back(arg.c_str());
        argv.push_back(nullptr);
        execvp(argv[0], (char *const *)argv.data());
        _exit(EXIT_EXEC_NOT_FOUND);
    }

    int status;
    if (waitpid(pid, &status, 0) != pid)
        return EXIT_FAILURE;

    if (status) {
        L_WRN("{} {}", task.ToString(), FormatExitStatus(status));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

static int RunHelperTasks(const TUnixSocket &sock, const std::vector<THelperTask> &tasks) {
    if (sock.RecvZero())
        return EXIT_FAILURE;

    for (auto &task: tasks) {
        if (RunHelperTask(task))
            return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

TError THostKernel::StartHelper(const std::vector<THelperTask> &tasks) {
    TUnixSocket sock;
    TError error;

    for (auto &task: tasks)
        L_ACT("prepare helper {}", task.ToString());

    error = TUnixSocket::SocketPair(HelperSock, sock);
    if (error)
        return error;

    pid_t pid = fork();
    if (pid < 0)
        return TError::System("fork");

    if (!pid) {
        HelperSock.Close();
        SetDieOnParentExit(SIGKILL);
        _exit(RunHelperTasks(sock, tasks));
    }

    HelperPid = pid;
    return OK;
}

TError THostKernel::FinishHelper() {
    TError error;
    int status;

    if (!HelperPid)
        return TError("Helper is not started");

    L_ACT("run helper {}", HelperPid);

    error = HelperSock.SendZero();
    HelperSock.Close();

    pid_t pid = HelperPid;
    HelperPid = 0;

    if (waitpid(pid, &status, 0) != pid)
        return TError::System("waitpid {}", pid);

    if (error)
        return error;

    if (status)
        return TError(EError::Unknown, EPERM, "helper {}", FormatExitStatus(status));

    return OK;
}

TError THostKernel::Unshare(uint64_t clone_flags) {
    L_ACT("unshare {}", FormatNamespaces(clone_flags));
    if (unshare(clone_flags))
        return TError::System("unshare({})", FormatNamespaces(clone_flags));
    return OK;
}

TError THostKernel::WriteFile(const TPath &path, const std::string &text) {
    TError error;
    TFile file;

    L_ACT("write {} {}", path, StringTrim(text));

    error = file.OpenWrite(path);
    if (error)
        return error;

    /* proc id maps accept exactly one write */
    ssize_t ret = write(file.Fd, text.c_str(), text.size());
    if (ret < 0)
        return TError::System("write {}", path);
    if ((size_t)ret != text.size())
        return TError(EError::Unknown, EIO, "partial write {}", path);

    return OK;
}

TError THostKernel::Fork(pid_t &pid) {
    L_ACT("fork");

    pid = fork();
    if (pid < 0)
        return TError::System("fork");

    if (!pid)
        SetDieOnParentExit(SIGKILL);

    return OK;
}

static volatile pid_t ForwardPid = 0;

static void ForwardSignal(int sig) {
    if (ForwardPid > 0)
        kill(ForwardPid, sig);
}

TError THostKernel::Wait(pid_t pid, int &status) {
    TError error;

    ForwardPid = pid;
    for (int sig: { SIGINT, SIGTERM, SIGQUIT, SIGHUP }) {
        TError err = Signal(sig, ForwardSignal);
        if (err)
            L_WRN("Cannot forward signal {}: {}", sig, err);
    }

    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = TError::System("waitpid {}", pid);
            break;
        }
    }

    ForwardPid = 0;
    for (int sig: { SIGINT, SIGTERM, SIGQUIT, SIGHUP })
        (void)Signal(sig, SIG_DFL);

    if (error)
        return error;

    L("Task {} {}", pid, FormatExitStatus(status));

    return OK;
}

void THostKernel::Exit(int code) {
    _exit(code);
}

TError THostKernel::MakeMountPoint(const TPath &source, const TPath &target) {
    TError error;

    if (target.Exists())
        return OK;

    if (source && source.Exists() && !source.IsDirectoryFollow()) {
        L_ACT("create file {}", target);
        error = target.DirName().MkdirAll(0755);
        if (!error)
            error = target.Mkfile(0644);
    } else {
        L_ACT("create directory {}", target);
        error = target.MkdirAll(0755);
    }

    return error;
}

TError THostKernel::Mount(const TPath &source, const TPath &target,
                          const std::string &type, uint64_t mnt_flags,
                          const std::string &data) {

    /* preserve locked ro,nodev,noexec,nosuid unless allowed explicitly */
    if (mnt_flags & MS_REMOUNT) {
        struct statfs st;
        if (statfs(target.c_str(), &st))
            return TError::System("statfs {}", target);

        if ((st.f_flags & ST_RDONLY) && !(MS_ALLOW_WRITE & mnt_flags))
            mnt_flags |= MS_RDONLY;
        if ((st.f_flags & ST_NODEV) && !(MS_ALLOW_DEV & mnt_flags))
            mnt_flags |= MS_NODEV;
        if ((st.f_flags & ST_NOEXEC) && !(MS_ALLOW_EXEC & mnt_flags))
            mnt_flags |= MS_NOEXEC;
        if ((st.f_flags & ST_NOSUID) && !(MS_ALLOW_SUID & mnt_flags))
            mnt_flags |= MS_NOSUID;
    }

    L_ACT("mount {} {} -t {} -o {} {}", source, target, type, data, FormatMountFlags(mnt_flags));

    if (mount(source ? source.c_str() : NULL, target.c_str(),
              type.empty() ? NULL : type.c_str(),
              (uint32_t)mnt_flags, data.empty() ? NULL : data.c_str()))
        return TError::System("mount({}, {}, {}, {}, {})", source, target, type,
                              FormatMountFlags(mnt_flags), data);

    return OK;
}

TError THostKernel::SetHostName(const std::string &name) {
    L_ACT("sethostname {}", name);
    return ::SetHostName(name);
}

TError THostKernel::Chroot(const TPath &root) {
    TError error;
    TFile dir;

    L_ACT("chroot {}", root);

    error = dir.OpenDir(root);
    if (error)
        return error;

    return dir.Chroot();
}

TError THostKernel::Chdir(const TPath &path) {
    L_ACT("chdir {}", path);
    if (chdir(path.c_str()) < 0)
        return TError::System("chdir {}", path);
    return OK;
}

TError THostKernel::SetGid(gid_t gid) {
    L_ACT("setgid {}", gid);
    if (setgid(gid) < 0)
        return TError::System("setgid({})", gid);
    return OK;
}

TError THostKernel::SetGroups(const std::vector<gid_t> &groups) {
    L_ACT("setgroups {}", groups.size());
    if (setgroups(groups.size(), groups.data()) < 0)
        return TError::System("setgroups()");
    return OK;
}

TError THostKernel::SetUid(uid_t uid) {
    L_ACT("setuid {}", uid);
    if (setuid(uid) < 0)
        return TError::System("setuid({})", uid);
    return OK;
}

TError THostKernel::Exec(const TTuple &argv) {
    std::vector<const char *> args;
    TError error;

    L_ACT("exec {}", MergeEscapeStrings(argv, ' '));

    error = ResetBlockedSignals();
    if (error)
        return error;

    for (auto &arg: argv)
        args.push_back(arg.c_str());
    args.push_back(nullptr);

    execvp(args[0], (char *const *)args.data());

    return TError::System("execvp {}", argv[0]);
}

TError TDryRunKernel::StartHelper(const std::vector<THelperTask> &tasks) {
    for (auto &task: tasks)
        L_ACT("dry-run: prepare helper {}", task.ToString());
    return OK;
}

TError TDryRunKernel::FinishHelper() {
    L_ACT("dry-run: run helper");
    return OK;
}

TError TDryRunKernel::Unshare(uint64_t clone_flags) {
    L_ACT("dry-run: unshare {}", FormatNamespaces(clone_flags));
    return OK;
}

TError TDryRunKernel::WriteFile(const TPath &path, const std::string &text) {
    L_ACT("dry-run: write {} {}", path, StringTrim(text));
    return OK;
}

TError TDryRunKernel::Fork(pid_t &pid) {
    L_ACT("dry-run: fork");
    pid = 0;
    return OK;
}

TError TDryRunKernel::MakeMountPoint(const TPath &source, const TPath &target) {
    if (!target.Exists())
        L_ACT("dry-run: create {}", target);
    return OK;
}

TError TDryRunKernel::Mount(const TPath &source, const TPath &target,
                            const std::string &type, uint64_t mnt_flags,
                            const std::string &data) {
    L_ACT("dry-run: mount {} {} -t {} -o {} {}", source, target, type, data,
          FormatMountFlags(mnt_flags));
    return OK;
}

TError TDryRunKernel::SetHostName(const std::string &name) {
    L_ACT("dry-run: sethostname {}", name);
    return OK;
}

TError TDryRunKernel::Chroot(const TPath &root) {
    L_ACT("dry-run: chroot {}", root);
    if (!root.IsDirectoryFollow())
        return TError(EError::Unknown, ENOTDIR, "Not a directory: {}", root);
    return OK;
}

TError TDryRunKernel::Chdir(const TPath &path) {
    L_ACT("dry-run: chdir {}", path);
    return OK;
}

TError TDryRunKernel::SetGid(gid_t gid) {
    L_ACT("dry-run: setgid {}", gid);
    return OK;
}

TError TDryRunKernel::SetGroups(const std::vector<gid_t> &groups) {
    L_ACT("dry-run: setgroups {}", groups.size());
    return OK;
}

TError TDryRunKernel::SetUid(uid_t uid) {
    L_ACT("dry-run: setuid {}", uid);
    return OK;
}

TError TDryRunKernel::Exec(const TTuple &argv) {
    L_ACT("dry-run: exec {}", MergeEscapeStrings(argv, ' '));
    return OK;
}
