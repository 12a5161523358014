#include "util/unix.hpp"
#include "util/string.hpp"

extern "C" {
#include <unistd.h>
#include <string.h>
#include <time.h>
#include <errno.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>
}

static std::string *processName = nullptr;

pid_t GetPid() {
    return syscall(SYS_getpid);
}

pid_t GetTid() {
    return syscall(SYS_gettid);
}

void SetDieOnParentExit(int sig) {
    (void)prctl(PR_SET_PDEATHSIG, sig, 0, 0, 0);
}

std::string GetTaskName() {
    if (!processName) {
        char name[17];

        memset(name, 0, sizeof(name));

        /* prctl returns 16 bytes string */

        if (prctl(PR_GET_NAME, (void *)name) < 0)
            strncpy(name, program_invocation_short_name, sizeof(name) - 1);

        processName = new std::string(name);
    }

    return *processName;
}

TError SetHostName(const std::string &name) {
    int ret = sethostname(name.c_str(), name.length());
    if (ret < 0)
        return TError::System("sethostname(" + name + ")");

    return OK;
}

std::string FormatExitStatus(int status) {
    if (WIFSIGNALED(status))
        return StringFormat("exit signal: %d (%s)%s", WTERMSIG(status),
                            strsignal(WTERMSIG(status)),
                            WCOREDUMP(status) ? " (Core dumped)": "");
    return StringFormat("exit code: %d", WEXITSTATUS(status));
}

int ExitStatusCode(int status) {
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return WEXITSTATUS(status);
}

std::string FormatTime(time_t t, const char *fmt) {
    struct tm tm;
    char buf[256];

    localtime_r(&t, &tm);
    strftime(buf, sizeof(buf), fmt, &tm);

    return std::string(buf);
}

void TUnixSocket::Close() {
    if (SockFd >= 0)
        close(SockFd);
    SockFd = -1;
}

void TUnixSocket::operator=(int sock) {
    Close();
    SockFd = sock;
}

TError TUnixSocket::SocketPair(TUnixSocket &sock1, TUnixSocket &sock2) {
    int sockfds[2];

    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sockfds))
        return TError::System("socketpair(AF_UNIX)");

    sock1 = sockfds[0];
    sock2 = sockfds[1];
    return OK;
}

TError TUnixSocket::SendInt(int val) const {
    ssize_t ret;

    ret = send(SockFd, &val, sizeof(val), MSG_NOSIGNAL);
    if (ret < 0)
        return TError::System("cannot send int");
    if (ret != sizeof(val))
        return TError("partial write of int: {}", ret);
    return OK;
}

TError TUnixSocket::RecvInt(int &val) const {
    ssize_t ret;

    ret = read(SockFd, &val, sizeof(val));
    if (ret < 0)
        return TError::System("cannot receive int");
    if (ret != sizeof(val))
        return TError("partial read of int: {}", ret);
    return OK;
}
