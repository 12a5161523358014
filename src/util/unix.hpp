#pragma once

#include <string>

#include "common.hpp"
#include "util/error.hpp"

extern "C" {
#include <sys/types.h>
}

std::string FormatTime(time_t t, const char *fmt = "%F %T");

pid_t GetPid();
pid_t GetTid();

void SetDieOnParentExit(int sig);
std::string GetTaskName();
TError SetHostName(const std::string &name);

std::string FormatExitStatus(int status);

/* shell convention: code or 128 + signal */
int ExitStatusCode(int status);

class TUnixSocket : public TNonCopyable {
    int SockFd;
public:
    static TError SocketPair(TUnixSocket &sock1, TUnixSocket &sock2);
    TUnixSocket(int sock = -1) : SockFd(sock) {};
    ~TUnixSocket() { Close(); };
    void operator=(int sock);
    void Close();
    TError SendInt(int val) const;
    TError RecvInt(int &val) const;
    TError SendZero() const { return SendInt(0); }
    TError RecvZero() const { int zero; return RecvInt(zero); }
};
