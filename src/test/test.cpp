#include <sstream>

#include "test/test.hpp"

extern "C" {
#include <stdlib.h>
#include <fcntl.h>
#include <unistd.h>
#include <sched.h>
#include <sys/wait.h>
}

namespace test {

std::basic_ostream<char> &Say(std::basic_ostream<char> &stream) {
    return stream << "- ";
}

void ExpectReturn(int ret, int exp, int line, const char *func) {
    if (ret == exp)
        return;
    throw std::string("Got " + std::to_string(ret) + ", but expected " + std::to_string(exp) + " at " + func + ":" + std::to_string(line));
}

void ExpectError(const TError &ret, EError exp, int line, const char *func) {
    std::stringstream ss;

    if (ret == exp)
        return;

    ss << "Got " << ret << ", but expected " << TError::ErrorName(exp) << " at " << func << ":" << line;

    throw ss.str();
}

static bool WriteProc(const std::string &path, const std::string &text) {
    int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0)
        return false;
    bool ok = write(fd, text.c_str(), text.size()) == (ssize_t)text.size();
    close(fd);
    return ok;
}

bool UserNamespacesSupported() {
    std::string uid = std::to_string(geteuid());
    std::string gid = std::to_string(getegid());
    pid_t pid = fork();
    int status;

    if (pid < 0)
        return false;

    if (!pid) {
        if (unshare(CLONE_NEWUSER | CLONE_NEWUTS) ||
                !WriteProc("/proc/self/setgroups", "deny") ||
                !WriteProc("/proc/self/uid_map", "0 " + uid + " 1\n") ||
                !WriteProc("/proc/self/gid_map", "0 " + gid + " 1\n") ||
                sethostname("probe", 5))
            _exit(EXIT_FAILURE);
        _exit(EXIT_SUCCESS);
    }

    if (waitpid(pid, &status, 0) != pid)
        return false;

    return WIFEXITED(status) && !WEXITSTATUS(status);
}

template<typename T>
static inline void ExpectEqTemplate(T ret, T exp, size_t line, const char *func) {
    if (ret != exp) {
        std::stringstream ss;
        ss << "Unexpected " << ret << " != " << exp << " at " << func << ":" << line;
        throw ss.str();
    }
}

template<typename T>
static inline void ExpectNeqTemplate(T ret, T exp, size_t line, const char *func) {
    if (ret == exp) {
        std::stringstream ss;
        ss << "Unexpected " << ret << " == " << exp << " at " << func << ":" << line;
        throw ss.str();
    }
}

void _ExpectEq(size_t ret, size_t exp, size_t line, const char *func) {
    ExpectEqTemplate(ret, exp, line, func);
}

void _ExpectEq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    ExpectEqTemplate(ret, exp, line, func);
}

void _ExpectNeq(size_t ret, size_t exp, size_t line, const char *func) {
    ExpectNeqTemplate(ret, exp, line, func);
}

void _ExpectNeq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    ExpectNeqTemplate(ret, exp, line, func);
}

}
