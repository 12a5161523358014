#pragma once

#include <string>
#include "util/path.hpp"
#include "fmt/format.h"

extern bool Verbose;
extern bool Debug;
extern TFile LogFile;

void OpenLog();
TError OpenLog(const TPath &path);
void WriteLog(const char *prefix, const std::string &log_msg);

template <typename... Args> inline void L_DBG(const char* fmt, const Args&... args) {
    if (Debug)
        WriteLog("DBG", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_VERBOSE(const char* fmt, const Args&... args) {
    if (Verbose)
        WriteLog("   ", fmt::format(fmt, args...));
}

template <typename... Args> inline void L(const char* fmt, const Args&... args) {
    WriteLog("   ", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_WRN(const char* fmt, const Args&... args) {
    WriteLog("WRN", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_ERR(const char* fmt, const Args&... args) {
    WriteLog("ERR", fmt::format(fmt, args...));
}

/* every kernel state change goes through here */
template <typename... Args> inline void L_ACT(const char* fmt, const Args&... args) {
    WriteLog("ACT", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_SYS(const char* fmt, const Args&... args) {
    WriteLog("SYS", fmt::format(fmt, args...));
}
