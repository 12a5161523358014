#pragma once

#include "util/error.hpp"

#define __STDC_LIMIT_MACROS
#include <cstdint>
#undef __STDC_LIMIT_MACROS

class TNonCopyable {
protected:
    TNonCopyable() = default;
    ~TNonCopyable() = default;
private:
    TNonCopyable(TNonCopyable const&) = delete;
    TNonCopyable& operator= (TNonCopyable const&) = delete;
    TNonCopyable(TNonCopyable const&&) = delete;
    TNonCopyable& operator= (TNonCopyable const&&) = delete;
};

constexpr const char *COCOON_DEFAULT_COMMAND = "/bin/sh";
constexpr const char *COCOON_DEFAULT_PATH = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

constexpr const char *NEWUIDMAP_BINARY = "newuidmap";
constexpr const char *NEWGIDMAP_BINARY = "newgidmap";

constexpr uint64_t ID_SPACE_SIZE = 1ull << 32;

/* exit codes of the front end */
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_SANDBOX_ERROR = 1;
constexpr int EXIT_EXEC_NOT_FOUND = 127;
constexpr int EXIT_EXEC_FAILED = 126;
