#pragma once

#include <string>
#include <ostream>
#include "fmt/format.h"
#include "fmt/ostream.h"

#include "error.pb.h"

using ::cocoon::EError;

class TError {
public:
    EError Error;
    int Errno = 0;
    std::string Text;

    TError(): Error(EError::Success) {}

    TError(EError err): Error(err) {}

    TError(const std::string &text): Error(EError::Unknown), Text(text) {}

    TError(EError err, const std::string &text): Error(err), Text(text) {}

    TError(EError err, int eno, const std::string &text): Error(err), Errno(eno), Text(text) {}

    template <typename... Args> TError(EError err,  int eno, const char* fmt, const Args&... args):
        Error(err), Errno(eno), Text(fmt::format(fmt, args...)) {}

    template <typename... Args> TError(EError err, const char* fmt, const Args&... args):
        Error(err), Text(fmt::format(fmt, args...)) {}

    template <typename... Args> TError(const char* fmt, const Args&... args):
        Error(EError::Unknown), Text(fmt::format(fmt, args...)) {}

    template <typename... Args> TError(const TError &other, const char* fmt, const Args&... args) :
        Error(other.Error), Errno(other.Errno),
        Text(fmt::format(fmt, args...) + ": " + other.Text) {}

    /* Re-tag lower level failure with stage error code */
    template <typename... Args> TError(EError err, const TError &other, const char* fmt, const Args&... args) :
        Error(err), Errno(other.Errno),
        Text(fmt::format(fmt, args...) + ": " + other.Text) {}

    TError(const TError &other) = default;
    TError(TError &&other) = default;
    TError &operator=(TError &&other) = default;
    TError &operator=(const TError &other) = default;

    explicit operator bool() const {
        return Error != EError::Success;
    }

    inline bool operator==(const EError error) const {
        return Error == error;
    }

    inline bool operator!=(const EError error) const {
        return Error != error;
    }

    static std::string ErrorName(EError error);

    std::string ToString() const;

    /* configuration errors are reported before any kernel action */
    bool IsConfigError() const;

    static TError System(const std::string &text) {
        return TError(EError::Unknown, errno, text);
    }

    template <typename... Args> static TError System(const char* fmt, const Args&... args) {
        return TError(EError::Unknown, errno, fmt::format(fmt, args...));
    }

    friend std::ostream& operator<<(std::ostream& os, const TError& err);
};

namespace fmt {
template <> struct formatter<TError> : ostream_formatter {};
}

extern const TError OK;
