#include "util/log.hpp"
#include "util/unix.hpp"

extern "C" {
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <time.h>
}

bool Verbose = false;
bool Debug = false;

TFile LogFile;

void OpenLog() {
    if (LogFile.Fd != STDERR_FILENO)
        LogFile.Close();
    LogFile.SetFd = STDERR_FILENO;
}

TError OpenLog(const TPath &path) {
    int fd = open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC |
                                O_NOFOLLOW | O_NOCTTY, 0644);
    if (fd < 0)
        return TError::System("Cannot open log {}", path);

    /* keep stdio free for the sandboxed command */
    if (fd < 3) {
        int dup = fcntl(fd, F_DUPFD_CLOEXEC, 3);
        close(fd);
        if (dup < 0)
            return TError::System("Cannot dup log fd");
        fd = dup;
    }

    if (LogFile.Fd != STDERR_FILENO)
        LogFile.Close();
    LogFile.SetFd = fd;

    return OK;
}

void WriteLog(const char *prefix, const std::string &log_msg) {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    std::string currentTimeMs = fmt::format("{}.{:03}", FormatTime(ts.tv_sec), ts.tv_nsec / 1000000);

    std::string msg = fmt::format("{} {}[{}]: {} {}\n",
            currentTimeMs, GetTaskName(), GetTid(), prefix, log_msg);

    if (!LogFile)
        return;

    /* nowhere to report lost log lines */
    (void)LogFile.WriteAll(msg);
}
